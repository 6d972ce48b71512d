#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "placer/assets/ModelSource.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/core/SessionConfig.hpp"
#include "placer/scene/Math.hpp"
#include "placer/scene/SceneGraph.hpp"
#include "placer/terrain/GridMapping.hpp"

namespace placer::scene
{
class SceneHost;
}

namespace placer::terrain
{
enum class TerrainState
{
    Idle,
    Loading,
    Loaded,
    Failed
};

const char* TerrainStateName(TerrainState state);

// Loads the terrain mesh for the active session, owns the grid overlay and answers surface queries.
class TerrainLoader
{
public:
    TerrainLoader(
        core::EventBus& bus,
        scene::SceneHost& host,
        assets::IModelSource& models,
        const core::SessionCallbacks& callbacks,
        const core::TerrainConfig& config);
    ~TerrainLoader();

    TerrainLoader(const TerrainLoader&) = delete;
    TerrainLoader& operator=(const TerrainLoader&) = delete;

    // Empty url: no mesh, a flat extent of `layoutExtent` (or the configured fallback) is used instead.
    void SetTerrain(
        const std::string& terrainId,
        const std::string& url,
        const TerrainMetadata& metadata,
        const std::optional<glm::vec2>& layoutExtent = std::nullopt);
    void SetTerrain(const std::string& terrainId, const std::string& url);

    // User abort of an in-flight load. Reported as a cancellation, not as a load failure.
    void CancelLoad();
    void Unload();

    [[nodiscard]] std::optional<GridCell> CalculateGridPosition(float worldX, float worldZ) const;

    // Height of the supporting surface under X/Z: terrain mesh when loaded, otherwise the ground plane.
    [[nodiscard]] std::optional<float> SurfaceHeightAt(float worldX, float worldZ) const;

    // First hit of the ray on the terrain mesh, falling back to the ground plane.
    [[nodiscard]] std::optional<glm::vec3> RaycastSurface(const scene::Ray& ray) const;

    void SetGridVisible(bool visible);
    [[nodiscard]] bool IsGridVisible() const { return m_gridVisible; }

    [[nodiscard]] TerrainState State() const { return m_state; }
    [[nodiscard]] const std::string& TerrainId() const { return m_terrainId; }
    [[nodiscard]] const std::string& Url() const { return m_url; }
    [[nodiscard]] const scene::Aabb& Bounds() const { return m_bounds; }
    [[nodiscard]] const GridSpec& Grid() const { return m_grid; }
    [[nodiscard]] bool HasTerrainMesh() const { return m_terrainNode != scene::kInvalidNode; }
    [[nodiscard]] scene::NodeHandle TerrainNode() const { return m_terrainNode; }
    [[nodiscard]] scene::NodeHandle GridNode() const { return m_gridNode; }

private:
    void OnModelLoaded(std::uint64_t ticket, const assets::ModelLoadResult& result);
    void InstallTerrain(const assets::ModelData& model);
    void ApplyFallbackExtent(const std::optional<glm::vec2>& layoutExtent);
    void RebuildGrid();
    void DestroyTerrainNode();
    void DestroyGridNode();
    void OnGridToggle(const core::Payload& payload);
    void OnTerrainSelected(const core::Payload& payload);

    core::EventBus& m_bus;
    scene::SceneHost& m_host;
    assets::IModelSource& m_models;
    const core::SessionCallbacks& m_callbacks;
    core::TerrainConfig m_config;

    TerrainState m_state = TerrainState::Idle;
    std::string m_terrainId;
    std::string m_url;
    TerrainMetadata m_metadata;
    scene::Aabb m_bounds;
    GridSpec m_grid;
    bool m_gridVisible = true;

    scene::NodeHandle m_terrainNode = scene::kInvalidNode;
    scene::NodeHandle m_gridNode = scene::kInvalidNode;

    std::uint64_t m_loadTicket = 0;
    core::CancellationToken m_loadToken;

    core::EventBus::HandlerPtr m_gridToggleHandler;
    core::EventBus::HandlerPtr m_terrainSelectedHandler;
};
} // namespace placer::terrain
