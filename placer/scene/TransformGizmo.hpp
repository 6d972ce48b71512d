#pragma once

#include <functional>
#include <vector>

#include <glm/vec3.hpp>

#include "placer/scene/Math.hpp"
#include "placer/scene/SceneGraph.hpp"

namespace placer::scene
{
enum class GizmoMode
{
    Translate,
    Rotate,
    Scale
};

enum class GizmoAxis
{
    None,
    X,
    Y,
    Z
};

const char* GizmoModeName(GizmoMode mode);

// Axis handles for the selected node. Holds a non-owning handle; the node is owned by whoever created it,
// and a handle that no longer resolves is treated as detached.
class TransformGizmo
{
public:
    explicit TransformGizmo(SceneGraph& scene);

    void Attach(NodeHandle node);
    void Detach();
    [[nodiscard]] NodeHandle Attached() const;
    [[nodiscard]] bool IsAttached() const { return Attached() != kInvalidNode; }

    void SetMode(GizmoMode mode);
    [[nodiscard]] GizmoMode Mode() const { return m_mode; }
    void SetRotationSnapDegrees(float degrees) { m_rotationSnapDegrees = degrees; }

    // Starts a drag when the ray hits one of the axis handles.
    bool BeginDrag(const Ray& ray, const glm::vec3& cameraPosition, const glm::vec3& cameraForward);
    void UpdateDrag(const Ray& ray);
    void EndDrag();
    [[nodiscard]] bool IsDragging() const { return m_dragging; }
    [[nodiscard]] GizmoAxis DragAxis() const { return m_dragAxis; }

    void SetDraggingChangedCallback(std::function<void(bool)> callback) { m_onDraggingChanged = std::move(callback); }
    void SetObjectChangeCallback(std::function<void()> callback) { m_onObjectChange = std::move(callback); }

    void AppendHandleLines(const glm::vec3& cameraPosition, std::vector<LineSegment>* outLines) const;

    void Dispose();

private:
    [[nodiscard]] float AxisLength(const glm::vec3& cameraPosition) const;

    SceneGraph& m_scene;
    NodeHandle m_attached = kInvalidNode;
    GizmoMode m_mode = GizmoMode::Translate;
    float m_rotationSnapDegrees = 15.0F;

    bool m_dragging = false;
    GizmoAxis m_dragAxis = GizmoAxis::None;
    glm::vec3 m_dragPivot{0.0F};
    glm::vec3 m_dragDirection{0.0F};
    glm::vec3 m_dragPlaneNormal{0.0F, 1.0F, 0.0F};
    glm::vec3 m_dragLastVector{1.0F, 0.0F, 0.0F};
    float m_dragStartScalar = 0.0F;
    float m_dragLastScalar = 0.0F;
    float m_dragAxisLength = 1.0F;
    NodeTransform m_dragStartTransform;

    std::function<void(bool)> m_onDraggingChanged;
    std::function<void()> m_onObjectChange;
};
} // namespace placer::scene
