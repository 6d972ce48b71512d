#pragma once

#include <array>
#include <cstddef>

#include <glm/vec2.hpp>

struct GLFWwindow;

namespace placer::platform
{
enum class EditorAction : std::size_t
{
    Cancel = 0,
    DeleteSelected,
    PickUpSelected,
    ToggleGrid,
    GizmoTranslate,
    GizmoRotate,
    GizmoScale,
    RotateLeft,
    RotateRight,
    Grow,
    Shrink,
    Count
};

struct KeyBinding
{
    int primary = -1;
    int secondary = -1;
};

// Editor input sampled once per frame: bound key actions plus a primary-button gesture that is
// either a click or a drag. Pointer positions are framebuffer pixels.
class Input
{
public:
    static constexpr float kClickTolerancePixels = 4.0F;

    Input();

    void ResetBindings();
    void Bind(EditorAction action, const KeyBinding& binding);

    void Update(GLFWwindow* window);

    [[nodiscard]] bool ActionPressed(EditorAction action) const;

    [[nodiscard]] glm::vec2 Pointer() const { return m_pointer; }
    [[nodiscard]] glm::vec2 PointerDelta() const { return m_pointerDelta; }
    [[nodiscard]] bool PointerMoved() const { return m_pointerDelta.x != 0.0F || m_pointerDelta.y != 0.0F; }

    [[nodiscard]] bool PrimaryPressed() const { return m_primaryDown && !m_primaryWasDown; }
    [[nodiscard]] bool PrimaryDown() const { return m_primaryDown; }
    [[nodiscard]] bool PrimaryReleased() const { return !m_primaryDown && m_primaryWasDown; }
    [[nodiscard]] bool PrimaryDragging() const { return m_primaryDown && m_primaryDragged; }
    // Release of a press that stayed within the click tolerance.
    [[nodiscard]] bool PrimaryClicked() const { return PrimaryReleased() && !m_primaryDragged; }
    // The current press can no longer become a click (it was taken by the gizmo or a panel).
    void ClaimPrimaryGesture() { m_primaryDragged = true; }

    [[nodiscard]] bool SecondaryDown() const { return m_secondaryDown; }

private:
    [[nodiscard]] static bool IsKeyHeld(GLFWwindow* window, int key);

    std::array<KeyBinding, static_cast<std::size_t>(EditorAction::Count)> m_bindings{};
    std::array<bool, static_cast<std::size_t>(EditorAction::Count)> m_actionDown{};
    std::array<bool, static_cast<std::size_t>(EditorAction::Count)> m_actionWasDown{};

    glm::vec2 m_pointer{0.0F};
    glm::vec2 m_pointerDelta{0.0F};
    glm::vec2 m_pressPosition{0.0F};
    bool m_firstSample = true;

    bool m_primaryDown = false;
    bool m_primaryWasDown = false;
    bool m_primaryDragged = false;
    bool m_secondaryDown = false;
};
} // namespace placer::platform
