#include "placer/platform/Input.hpp"

#include <GLFW/glfw3.h>
#include <glm/geometric.hpp>

namespace placer::platform
{
Input::Input()
{
    ResetBindings();
}

void Input::ResetBindings()
{
    m_bindings.fill(KeyBinding{});
    Bind(EditorAction::Cancel, {GLFW_KEY_ESCAPE, -1});
    Bind(EditorAction::DeleteSelected, {GLFW_KEY_DELETE, GLFW_KEY_BACKSPACE});
    Bind(EditorAction::PickUpSelected, {GLFW_KEY_P, -1});
    Bind(EditorAction::ToggleGrid, {GLFW_KEY_G, -1});
    Bind(EditorAction::GizmoTranslate, {GLFW_KEY_W, -1});
    Bind(EditorAction::GizmoRotate, {GLFW_KEY_E, -1});
    Bind(EditorAction::GizmoScale, {GLFW_KEY_R, -1});
    Bind(EditorAction::RotateLeft, {GLFW_KEY_LEFT_BRACKET, -1});
    Bind(EditorAction::RotateRight, {GLFW_KEY_RIGHT_BRACKET, -1});
    Bind(EditorAction::Grow, {GLFW_KEY_EQUAL, GLFW_KEY_KP_ADD});
    Bind(EditorAction::Shrink, {GLFW_KEY_MINUS, GLFW_KEY_KP_SUBTRACT});
}

void Input::Bind(EditorAction action, const KeyBinding& binding)
{
    if (action == EditorAction::Count)
    {
        return;
    }
    m_bindings[static_cast<std::size_t>(action)] = binding;
}

bool Input::IsKeyHeld(GLFWwindow* window, int key)
{
    // GLFW rejects key codes below GLFW_KEY_SPACE.
    return key >= GLFW_KEY_SPACE && key <= GLFW_KEY_LAST && glfwGetKey(window, key) == GLFW_PRESS;
}

void Input::Update(GLFWwindow* window)
{
    if (window == nullptr)
    {
        return;
    }

    m_actionWasDown = m_actionDown;
    for (std::size_t i = 0; i < m_bindings.size(); ++i)
    {
        m_actionDown[i] = IsKeyHeld(window, m_bindings[i].primary) || IsKeyHeld(window, m_bindings[i].secondary);
    }

    double cursorX = 0.0;
    double cursorY = 0.0;
    glfwGetCursorPos(window, &cursorX, &cursorY);
    int windowWidth = 0;
    int windowHeight = 0;
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    glfwGetWindowSize(window, &windowWidth, &windowHeight);
    glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);

    // Cursor positions are in screen coordinates; HiDPI framebuffers are larger.
    glm::vec2 ratio{1.0F};
    if (windowWidth > 0 && windowHeight > 0)
    {
        ratio = glm::vec2{
            static_cast<float>(framebufferWidth) / static_cast<float>(windowWidth),
            static_cast<float>(framebufferHeight) / static_cast<float>(windowHeight)};
    }
    const glm::vec2 pointer = glm::vec2{static_cast<float>(cursorX), static_cast<float>(cursorY)} * ratio;
    m_pointerDelta = m_firstSample ? glm::vec2{0.0F} : pointer - m_pointer;
    m_pointer = pointer;
    m_firstSample = false;

    m_primaryWasDown = m_primaryDown;
    m_primaryDown = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
    m_secondaryDown = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_RIGHT) == GLFW_PRESS;

    if (PrimaryPressed())
    {
        m_pressPosition = m_pointer;
        m_primaryDragged = false;
    }
    else if (m_primaryDown && glm::length(m_pointer - m_pressPosition) > kClickTolerancePixels)
    {
        m_primaryDragged = true;
    }
}

bool Input::ActionPressed(EditorAction action) const
{
    if (action == EditorAction::Count)
    {
        return false;
    }
    const std::size_t index = static_cast<std::size_t>(action);
    return m_actionDown[index] && !m_actionWasDown[index];
}
} // namespace placer::platform
