#pragma once

#include <optional>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "placer/core/SessionConfig.hpp"

struct GLFWwindow;

namespace placer::platform
{
// What GLFW reported since the last TakeEvents(). Sizes are framebuffer pixels.
struct WindowEvents
{
    std::optional<glm::ivec2> framebufferResize;
    float scroll = 0.0F;
    std::vector<std::string> droppedPaths;
};

// GLFW window with an OpenGL 4.5 core context. Callbacks only queue; the frame loop consumes
// them once per frame through TakeEvents().
class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const core::WindowConfig& config, std::string* outError);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;
    [[nodiscard]] WindowEvents TakeEvents();

    [[nodiscard]] bool ShouldClose() const;
    void SetTitle(const std::string& title) const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] glm::ivec2 FramebufferSize() const { return m_framebufferSize; }

private:
    static Window* FromNative(GLFWwindow* window);
    static void OnFramebufferResize(GLFWwindow* window, int width, int height);
    static void OnDrop(GLFWwindow* window, int pathCount, const char** paths);
    static void OnScroll(GLFWwindow* window, double xOffset, double yOffset);

    GLFWwindow* m_window = nullptr;
    glm::ivec2 m_framebufferSize{0, 0};
    WindowEvents m_events;
};
} // namespace placer::platform
