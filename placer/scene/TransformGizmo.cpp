#include "placer/scene/TransformGizmo.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace placer::scene
{
namespace
{
const glm::vec3 kAxisDirections[3] = {
    glm::vec3{1.0F, 0.0F, 0.0F},
    glm::vec3{0.0F, 1.0F, 0.0F},
    glm::vec3{0.0F, 0.0F, 1.0F},
};

const glm::vec3 kAxisColors[3] = {
    glm::vec3{0.95F, 0.25F, 0.25F},
    glm::vec3{0.3F, 0.9F, 0.3F},
    glm::vec3{0.3F, 0.45F, 0.95F},
};

GizmoAxis AxisFromIndex(int index)
{
    return index == 0 ? GizmoAxis::X : (index == 1 ? GizmoAxis::Y : GizmoAxis::Z);
}

int IndexFromAxis(GizmoAxis axis)
{
    return axis == GizmoAxis::X ? 0 : (axis == GizmoAxis::Y ? 1 : 2);
}
} // namespace

const char* GizmoModeName(GizmoMode mode)
{
    switch (mode)
    {
        case GizmoMode::Translate: return "Translate";
        case GizmoMode::Rotate: return "Rotate";
        case GizmoMode::Scale: return "Scale";
    }
    return "Translate";
}

TransformGizmo::TransformGizmo(SceneGraph& scene)
    : m_scene(scene)
{
}

void TransformGizmo::Attach(NodeHandle node)
{
    if (m_attached == node)
    {
        return;
    }
    if (m_dragging)
    {
        EndDrag();
    }
    m_attached = m_scene.Contains(node) ? node : kInvalidNode;
}

void TransformGizmo::Detach()
{
    if (m_dragging)
    {
        EndDrag();
    }
    m_attached = kInvalidNode;
}

NodeHandle TransformGizmo::Attached() const
{
    return m_scene.Contains(m_attached) ? m_attached : kInvalidNode;
}

void TransformGizmo::SetMode(GizmoMode mode)
{
    if (m_dragging)
    {
        return;
    }
    m_mode = mode;
}

float TransformGizmo::AxisLength(const glm::vec3& cameraPosition) const
{
    const float cameraDistance = glm::length(cameraPosition - m_scene.WorldPosition(m_attached));
    return glm::clamp(cameraDistance * 0.18F, 1.0F, 10.0F);
}

bool TransformGizmo::BeginDrag(const Ray& ray, const glm::vec3& cameraPosition, const glm::vec3& cameraForward)
{
    if (!IsAttached() || m_dragging)
    {
        return false;
    }

    const glm::vec3 pivot = m_scene.WorldPosition(m_attached);
    const float axisLength = AxisLength(cameraPosition);
    const float handleHalf = glm::max(0.2F, axisLength * 0.17F);

    float bestT = 1.0e9F;
    int bestIndex = -1;
    for (int axisIndex = 0; axisIndex < 3; ++axisIndex)
    {
        const glm::vec3 tip = pivot + kAxisDirections[axisIndex] * axisLength;
        float t = 0.0F;
        if (!RayIntersectsAabb(ray, tip - glm::vec3{handleHalf}, tip + glm::vec3{handleHalf}, &t))
        {
            continue;
        }
        if (t < bestT)
        {
            bestT = t;
            bestIndex = axisIndex;
        }
    }
    if (bestIndex < 0)
    {
        return false;
    }

    const glm::vec3 direction = kAxisDirections[bestIndex];
    glm::vec3 planeNormal{0.0F};
    if (m_mode == GizmoMode::Rotate)
    {
        planeNormal = direction;
    }
    else
    {
        planeNormal = glm::cross(direction, cameraForward);
        if (glm::length(planeNormal) < 1.0e-4F)
        {
            planeNormal = glm::cross(direction, glm::vec3{0.0F, 1.0F, 0.0F});
        }
        if (glm::length(planeNormal) < 1.0e-4F)
        {
            planeNormal = glm::cross(direction, glm::vec3{1.0F, 0.0F, 0.0F});
        }
        // The drag plane contains the axis and faces the camera as much as possible.
        planeNormal = glm::normalize(glm::cross(glm::normalize(planeNormal), direction));
    }

    glm::vec3 hit{0.0F};
    if (!RayIntersectPlane(ray, pivot, planeNormal, &hit))
    {
        return false;
    }

    if (m_mode == GizmoMode::Rotate)
    {
        glm::vec3 startVector = hit - pivot;
        startVector -= direction * glm::dot(startVector, direction);
        if (glm::length(startVector) < 1.0e-4F)
        {
            return false;
        }
        m_dragLastVector = glm::normalize(startVector);
        m_dragStartScalar = 0.0F;
        m_dragLastScalar = 0.0F;
    }
    else
    {
        m_dragStartScalar = glm::dot(hit - pivot, direction);
        m_dragLastScalar = m_dragStartScalar;
    }

    m_dragging = true;
    m_dragAxis = AxisFromIndex(bestIndex);
    m_dragPivot = pivot;
    m_dragDirection = direction;
    m_dragPlaneNormal = planeNormal;
    m_dragAxisLength = axisLength;
    m_dragStartTransform = m_scene.Transform(m_attached);

    if (m_onDraggingChanged)
    {
        m_onDraggingChanged(true);
    }
    return true;
}

void TransformGizmo::UpdateDrag(const Ray& ray)
{
    if (!m_dragging || !IsAttached())
    {
        return;
    }

    glm::vec3 hit{0.0F};
    if (!RayIntersectPlane(ray, m_dragPivot, m_dragPlaneNormal, &hit))
    {
        return;
    }

    NodeTransform transform = m_scene.Transform(m_attached);
    const int axisIndex = IndexFromAxis(m_dragAxis);

    if (m_mode == GizmoMode::Rotate)
    {
        glm::vec3 currentVector = hit - m_dragPivot;
        currentVector -= m_dragDirection * glm::dot(currentVector, m_dragDirection);
        if (glm::length(currentVector) < 1.0e-4F)
        {
            return;
        }
        currentVector = glm::normalize(currentVector);
        const float sinTerm = glm::dot(m_dragDirection, glm::cross(m_dragLastVector, currentVector));
        const float cosTerm = glm::dot(m_dragLastVector, currentVector);
        const float deltaDegreesRaw = glm::degrees(std::atan2(sinTerm, cosTerm));
        m_dragLastVector = currentVector;

        float appliedDegrees = deltaDegreesRaw;
        if (m_rotationSnapDegrees > 0.0F)
        {
            const float step = std::max(1.0F, m_rotationSnapDegrees);
            const float accumulatedNow = m_dragLastScalar + deltaDegreesRaw;
            const float snappedNow = std::round(accumulatedNow / step) * step;
            const float snappedBefore = std::round(m_dragLastScalar / step) * step;
            appliedDegrees = snappedNow - snappedBefore;
            m_dragLastScalar = accumulatedNow;
        }
        else
        {
            m_dragLastScalar += deltaDegreesRaw;
        }
        if (std::abs(appliedDegrees) < 1.0e-6F)
        {
            return;
        }
        transform.rotation[axisIndex] += glm::radians(appliedDegrees);
    }
    else if (m_mode == GizmoMode::Translate)
    {
        const float scalar = glm::dot(hit - m_dragPivot, m_dragDirection);
        const float delta = scalar - m_dragLastScalar;
        m_dragLastScalar = scalar;
        if (std::abs(delta) < 1.0e-6F)
        {
            return;
        }
        transform.position += m_dragDirection * delta;
    }
    else
    {
        // Uniform scale: any axis handle scales all three axes by the same factor.
        const float scalar = glm::dot(hit - m_dragPivot, m_dragDirection);
        const float factor = glm::max(0.05F, 1.0F + (scalar - m_dragStartScalar) / glm::max(0.1F, m_dragAxisLength));
        m_dragLastScalar = scalar;
        const glm::vec3 uniform = glm::vec3{m_dragStartTransform.scale[axisIndex] * factor};
        if (glm::all(glm::lessThan(glm::abs(uniform - transform.scale), glm::vec3{1.0e-6F})))
        {
            return;
        }
        transform.scale = uniform;
    }

    m_scene.SetTransform(m_attached, transform);
    if (m_onObjectChange)
    {
        m_onObjectChange();
    }
}

void TransformGizmo::EndDrag()
{
    if (!m_dragging)
    {
        return;
    }
    m_dragging = false;
    m_dragAxis = GizmoAxis::None;
    if (m_onDraggingChanged)
    {
        m_onDraggingChanged(false);
    }
}

void TransformGizmo::AppendHandleLines(const glm::vec3& cameraPosition, std::vector<LineSegment>* outLines) const
{
    if (outLines == nullptr || !IsAttached())
    {
        return;
    }

    const glm::vec3 pivot = m_scene.WorldPosition(m_attached);
    const float axisLength = AxisLength(cameraPosition);
    const float handleHalf = glm::max(0.2F, axisLength * 0.17F);
    for (int axisIndex = 0; axisIndex < 3; ++axisIndex)
    {
        const bool active = m_dragging && IndexFromAxis(m_dragAxis) == axisIndex;
        const glm::vec3 color = active ? glm::vec3{1.0F, 0.9F, 0.2F} : kAxisColors[axisIndex];
        const glm::vec3 tip = pivot + kAxisDirections[axisIndex] * axisLength;
        outLines->push_back(LineSegment{pivot, tip, color});

        // Handle cube outline.
        const glm::vec3 mn = tip - glm::vec3{handleHalf};
        const glm::vec3 mx = tip + glm::vec3{handleHalf};
        const glm::vec3 c[8] = {
            {mn.x, mn.y, mn.z}, {mx.x, mn.y, mn.z}, {mx.x, mn.y, mx.z}, {mn.x, mn.y, mx.z},
            {mn.x, mx.y, mn.z}, {mx.x, mx.y, mn.z}, {mx.x, mx.y, mx.z}, {mn.x, mx.y, mx.z},
        };
        for (int i = 0; i < 4; ++i)
        {
            outLines->push_back(LineSegment{c[i], c[(i + 1) % 4], color});
            outLines->push_back(LineSegment{c[i + 4], c[((i + 1) % 4) + 4], color});
            outLines->push_back(LineSegment{c[i], c[i + 4], color});
        }
    }
}

void TransformGizmo::Dispose()
{
    Detach();
    m_onDraggingChanged = nullptr;
    m_onObjectChange = nullptr;
}
} // namespace placer::scene
