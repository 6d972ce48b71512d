#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/core/SessionConfig.hpp"
#include "placer/render/RenderSurface.hpp"
#include "placer/scene/Camera.hpp"
#include "placer/scene/OrbitController.hpp"
#include "placer/scene/SceneGraph.hpp"
#include "placer/scene/TransformGizmo.hpp"

namespace placer::scene
{
// Owns the scene graph, camera, orbit controller, gizmo and render surface of one editing session.
// The scene graph outlives mount/unmount; everything that talks to the GPU lives between the two.
class SceneHost
{
public:
    using AssetIdResolver = std::function<std::optional<std::string>(NodeHandle)>;

    SceneHost(
        core::EventBus& bus,
        std::unique_ptr<render::IRenderSurface> surface,
        const core::CameraConfig& cameraConfig,
        const core::SessionCallbacks& callbacks);
    ~SceneHost();

    SceneHost(const SceneHost&) = delete;
    SceneHost& operator=(const SceneHost&) = delete;

    // Returns false and reports an InitializationFailure once when the surface cannot be created.
    bool Mount(int width, int height);
    void Unmount();
    [[nodiscard]] bool IsMounted() const { return m_mounted; }

    void Resize(int width, int height);
    void RenderFrame();

    // Frames `target` so an object of `size` fills the view, then orbits around it.
    void PositionCamera(const glm::vec3& target, const glm::vec3& size);

    // Pointer in viewport pixels (origin top-left) to a world ray.
    bool BuildPointerRay(const glm::vec2& pointer, Ray* outRay) const;

    bool BeginGizmoDrag(const glm::vec2& pointer);
    void UpdateGizmoDrag(const glm::vec2& pointer);
    void EndGizmoDrag();

    // Maps a gizmo-attached node back to the asset id it represents.
    void SetAssetIdResolver(AssetIdResolver resolver) { m_assetIdResolver = std::move(resolver); }

    void AddOverlayLines(const std::vector<LineSegment>& lines);

    [[nodiscard]] SceneGraph& Scene() { return m_scene; }
    [[nodiscard]] const SceneGraph& Scene() const { return m_scene; }
    [[nodiscard]] Camera& GetCamera() { return m_camera; }
    [[nodiscard]] const Camera& GetCamera() const { return m_camera; }
    [[nodiscard]] OrbitController* Orbit() { return m_orbit.get(); }
    [[nodiscard]] TransformGizmo* Gizmo() { return m_gizmo.get(); }
    [[nodiscard]] const glm::vec2& ViewportSize() const { return m_viewportSize; }

private:
    std::optional<std::string> AttachedAssetId() const;
    void OnGizmoDraggingChanged(bool dragging);
    void OnGizmoObjectChange();

    core::EventBus& m_bus;
    std::unique_ptr<render::IRenderSurface> m_surface;
    const core::SessionCallbacks& m_callbacks;

    SceneGraph m_scene;
    Camera m_camera;
    std::unique_ptr<OrbitController> m_orbit;
    std::unique_ptr<TransformGizmo> m_gizmo;
    AssetIdResolver m_assetIdResolver;
    std::vector<LineSegment> m_frameLines;
    std::optional<std::string> m_draggingAssetId;

    glm::vec2 m_viewportSize{1.0F, 1.0F};
    bool m_mounted = false;
    bool m_initFailureReported = false;
};
} // namespace placer::scene
