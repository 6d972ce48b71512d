#include "placer/platform/Window.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <GLFW/glfw3.h>

namespace placer::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const core::WindowConfig& config, std::string* outError)
{
    if (m_window != nullptr)
    {
        return true;
    }
    if (glfwInit() != GLFW_TRUE)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to initialize GLFW.";
        }
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_window = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to create a " + std::to_string(config.width) + "x" + std::to_string(config.height) +
                        " window with an OpenGL 4.5 core context.";
        }
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(config.vsync ? 1 : 0);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, OnFramebufferResize);
    glfwSetDropCallback(m_window, OnDrop);
    glfwSetScrollCallback(m_window, OnScroll);
    glfwGetFramebufferSize(m_window, &m_framebufferSize.x, &m_framebufferSize.y);

    std::cout << "[Window] " << config.width << "x" << config.height << " (framebuffer " << m_framebufferSize.x << "x"
              << m_framebufferSize.y << ")\n";
    return true;
}

void Window::Shutdown()
{
    if (m_window == nullptr)
    {
        return;
    }
    glfwDestroyWindow(m_window);
    m_window = nullptr;
    m_events = WindowEvents{};
    glfwTerminate();
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

WindowEvents Window::TakeEvents()
{
    return std::exchange(m_events, WindowEvents{});
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetTitle(const std::string& title) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowTitle(m_window, title.c_str());
    }
}

Window* Window::FromNative(GLFWwindow* window)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

void Window::OnFramebufferResize(GLFWwindow* window, int width, int height)
{
    Window* self = FromNative(window);
    if (self == nullptr)
    {
        return;
    }
    // Minimised windows report 0x0; keep the last usable size.
    const glm::ivec2 size{std::max(width, 0), std::max(height, 0)};
    if (size.x == 0 || size.y == 0)
    {
        return;
    }
    self->m_framebufferSize = size;
    self->m_events.framebufferResize = size;
}

void Window::OnDrop(GLFWwindow* window, int pathCount, const char** paths)
{
    Window* self = FromNative(window);
    if (self == nullptr || paths == nullptr)
    {
        return;
    }
    for (int i = 0; i < pathCount; ++i)
    {
        if (paths[i] != nullptr && paths[i][0] != '\0')
        {
            self->m_events.droppedPaths.emplace_back(paths[i]);
        }
    }
}

void Window::OnScroll(GLFWwindow* window, double /*xOffset*/, double yOffset)
{
    Window* self = FromNative(window);
    if (self != nullptr)
    {
        self->m_events.scroll += static_cast<float>(yOffset);
    }
}
} // namespace placer::platform
