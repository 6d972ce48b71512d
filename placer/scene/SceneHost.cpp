#include "placer/scene/SceneHost.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <glm/trigonometric.hpp>

namespace placer::scene
{
namespace
{
constexpr float kCameraFitFactor = 1.2F;
const glm::vec3 kCameraDiagonal{1.0F, 0.7F, 1.0F};
} // namespace

SceneHost::SceneHost(
    core::EventBus& bus,
    std::unique_ptr<render::IRenderSurface> surface,
    const core::CameraConfig& cameraConfig,
    const core::SessionCallbacks& callbacks)
    : m_bus(bus)
    , m_surface(std::move(surface))
    , m_callbacks(callbacks)
    , m_camera(cameraConfig.fovDegrees, cameraConfig.nearPlane, cameraConfig.farPlane)
{
}

SceneHost::~SceneHost()
{
    Unmount();
}

bool SceneHost::Mount(int width, int height)
{
    if (m_mounted)
    {
        return true;
    }

    std::string error;
    if (m_surface == nullptr || !m_surface->Initialize(width, height, &error))
    {
        if (!m_initFailureReported)
        {
            m_initFailureReported = true;
            m_callbacks.ReportError(
                core::ErrorKind::InitializationFailure,
                "Failed to create render surface: " + (error.empty() ? std::string{"no surface"} : error));
        }
        return false;
    }

    m_orbit = std::make_unique<OrbitController>(m_camera);
    m_gizmo = std::make_unique<TransformGizmo>(m_scene);
    m_gizmo->SetDraggingChangedCallback([this](bool dragging) { OnGizmoDraggingChanged(dragging); });
    m_gizmo->SetObjectChangeCallback([this]() { OnGizmoObjectChange(); });

    m_mounted = true;
    Resize(width, height);
    m_orbit->SyncFromCamera();
    std::cout << "[SceneHost] Mounted " << width << "x" << height << "\n";
    return true;
}

void SceneHost::Unmount()
{
    if (!m_mounted)
    {
        return;
    }
    m_mounted = false;

    // Gizmo first: it references scene nodes the surface may still hold GPU state for.
    if (m_gizmo != nullptr)
    {
        m_gizmo->Detach();
        m_gizmo->Dispose();
    }
    if (m_orbit != nullptr)
    {
        m_orbit->Dispose();
    }
    if (m_surface != nullptr)
    {
        m_surface->Shutdown();
    }

    m_gizmo.reset();
    m_orbit.reset();
    m_frameLines.clear();
    m_draggingAssetId.reset();
    std::cout << "[SceneHost] Unmounted\n";
}

void SceneHost::Resize(int width, int height)
{
    const int safeWidth = std::max(1, width);
    const int safeHeight = std::max(1, height);
    m_viewportSize = glm::vec2{static_cast<float>(safeWidth), static_cast<float>(safeHeight)};
    m_camera.SetAspect(m_viewportSize.x / m_viewportSize.y);
    if (m_mounted && m_surface != nullptr)
    {
        m_surface->Resize(safeWidth, safeHeight);
    }
}

void SceneHost::RenderFrame()
{
    if (!m_mounted)
    {
        m_frameLines.clear();
        return;
    }

    m_orbit->Update();
    m_scene.UpdateLods(m_camera.Position());
    m_gizmo->AppendHandleLines(m_camera.Position(), &m_frameLines);
    m_surface->Render(m_scene, m_camera, m_frameLines);
    m_frameLines.clear();
}

void SceneHost::PositionCamera(const glm::vec3& target, const glm::vec3& size)
{
    const float maxDimension = std::max({size.x, size.y, size.z, 1.0F});
    const float halfFov = glm::radians(m_camera.FovDegrees()) * 0.5F;
    const float distance = maxDimension / (2.0F * std::tan(halfFov)) * kCameraFitFactor;

    m_camera.SetPosition(target + kCameraDiagonal * distance);
    m_camera.LookAt(target);
    if (m_orbit != nullptr)
    {
        m_orbit->SetTarget(target);
    }
}

bool SceneHost::BuildPointerRay(const glm::vec2& pointer, Ray* outRay) const
{
    return m_camera.BuildRay(pointer, m_viewportSize, outRay);
}

bool SceneHost::BeginGizmoDrag(const glm::vec2& pointer)
{
    if (m_gizmo == nullptr || !m_gizmo->IsAttached())
    {
        return false;
    }
    Ray ray;
    if (!BuildPointerRay(pointer, &ray))
    {
        return false;
    }
    return m_gizmo->BeginDrag(ray, m_camera.Position(), m_camera.Forward());
}

void SceneHost::UpdateGizmoDrag(const glm::vec2& pointer)
{
    if (m_gizmo == nullptr || !m_gizmo->IsDragging())
    {
        return;
    }
    Ray ray;
    if (BuildPointerRay(pointer, &ray))
    {
        m_gizmo->UpdateDrag(ray);
    }
}

void SceneHost::EndGizmoDrag()
{
    if (m_gizmo != nullptr && m_gizmo->IsDragging())
    {
        m_gizmo->EndDrag();
    }
}

void SceneHost::AddOverlayLines(const std::vector<LineSegment>& lines)
{
    m_frameLines.insert(m_frameLines.end(), lines.begin(), lines.end());
}

std::optional<std::string> SceneHost::AttachedAssetId() const
{
    if (m_gizmo == nullptr || !m_assetIdResolver)
    {
        return std::nullopt;
    }
    const NodeHandle attached = m_gizmo->Attached();
    if (attached == kInvalidNode)
    {
        return std::nullopt;
    }
    return m_assetIdResolver(attached);
}

void SceneHost::OnGizmoDraggingChanged(bool dragging)
{
    if (m_orbit != nullptr)
    {
        m_orbit->SetEnabled(!dragging);
    }

    if (dragging)
    {
        m_draggingAssetId = AttachedAssetId();
        if (m_draggingAssetId.has_value())
        {
            m_bus.Emit(core::topics::kAssetMoveStarted, core::MoveEvent{*m_draggingAssetId, core::MoveSource::Gizmo});
        }
        return;
    }

    const std::optional<std::string> finished = m_draggingAssetId;
    m_draggingAssetId.reset();
    if (finished.has_value())
    {
        m_bus.Emit(core::topics::kAssetMoveFinished, core::MoveEvent{*finished, core::MoveSource::Gizmo});
    }
}

void SceneHost::OnGizmoObjectChange()
{
    if (m_gizmo == nullptr)
    {
        return;
    }
    const std::optional<std::string> assetId = AttachedAssetId();
    if (!assetId.has_value())
    {
        return;
    }
    const NodeTransform transform = m_scene.Transform(m_gizmo->Attached());

    core::MutationEvent event;
    event.kind = core::MutationKind::Updated;
    event.id = *assetId;
    event.position = transform.position;
    event.rotation = transform.rotation;
    event.scale = transform.scale;
    event.fromGizmo = true;
    m_bus.Emit(core::topics::kAssetUpdated, event);
}
} // namespace placer::scene
