#include "placer/terrain/TerrainLoader.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "placer/scene/SceneHost.hpp"

namespace placer::terrain
{
namespace
{
constexpr float kGridLift = 0.02F;
constexpr float kProbeHeightAboveBounds = 10.0F;

TerrainMetadata MetadataFromConfig(const core::TerrainConfig& config)
{
    TerrainMetadata metadata;
    metadata.gridWidth = config.gridWidth;
    metadata.gridHeight = config.gridHeight;
    metadata.gridScale = config.gridScale;
    return metadata;
}
} // namespace

const char* TerrainStateName(TerrainState state)
{
    switch (state)
    {
        case TerrainState::Idle: return "Idle";
        case TerrainState::Loading: return "Loading";
        case TerrainState::Loaded: return "Loaded";
        case TerrainState::Failed: return "Failed";
        default: return "Unknown";
    }
}

TerrainLoader::TerrainLoader(
    core::EventBus& bus,
    scene::SceneHost& host,
    assets::IModelSource& models,
    const core::SessionCallbacks& callbacks,
    const core::TerrainConfig& config)
    : m_bus(bus)
    , m_host(host)
    , m_models(models)
    , m_callbacks(callbacks)
    , m_config(config)
    , m_metadata(MetadataFromConfig(config))
    , m_gridVisible(config.gridVisible)
{
    m_gridToggleHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnGridToggle(payload); });
    m_terrainSelectedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnTerrainSelected(payload); });
    m_bus.On(core::topics::kGridToggle, m_gridToggleHandler);
    m_bus.On(core::topics::kTerrainSelected, m_terrainSelectedHandler);
}

TerrainLoader::~TerrainLoader()
{
    m_bus.Off(core::topics::kGridToggle, m_gridToggleHandler);
    m_bus.Off(core::topics::kTerrainSelected, m_terrainSelectedHandler);
    Unload();
}

void TerrainLoader::SetTerrain(const std::string& terrainId, const std::string& url)
{
    SetTerrain(terrainId, url, MetadataFromConfig(m_config));
}

void TerrainLoader::SetTerrain(
    const std::string& terrainId,
    const std::string& url,
    const TerrainMetadata& metadata,
    const std::optional<glm::vec2>& layoutExtent)
{
    // Drop whatever is still in flight; its completion will not match the new ticket.
    m_loadToken.Cancel();
    m_loadToken = core::CancellationToken{};
    const std::uint64_t ticket = ++m_loadTicket;

    m_terrainId = terrainId;
    m_url = url;
    m_metadata = metadata;

    if (url.empty())
    {
        DestroyTerrainNode();
        ApplyFallbackExtent(layoutExtent);
        m_state = TerrainState::Idle;
        return;
    }

    m_state = TerrainState::Loading;
    std::cout << "[TerrainLoader] Loading terrain '" << terrainId << "' from " << url << "\n";
    m_models.Load(
        url,
        [this, ticket](const assets::ModelLoadResult& result) { OnModelLoaded(ticket, result); },
        m_loadToken);
}

void TerrainLoader::CancelLoad()
{
    if (m_state != TerrainState::Loading)
    {
        return;
    }
    m_loadToken.Cancel();
    ++m_loadTicket;
    m_state = TerrainState::Failed;
    m_callbacks.ReportError(core::ErrorKind::CancellationFailure, "Terrain load cancelled: " + m_terrainId);
}

void TerrainLoader::Unload()
{
    m_loadToken.Cancel();
    ++m_loadTicket;
    DestroyTerrainNode();
    DestroyGridNode();
    m_bounds = scene::Aabb{};
    m_grid = GridSpec{};
    m_state = TerrainState::Idle;
}

void TerrainLoader::OnModelLoaded(std::uint64_t ticket, const assets::ModelLoadResult& result)
{
    if (ticket != m_loadTicket)
    {
        return;
    }

    if (!result.Succeeded())
    {
        m_state = TerrainState::Failed;
        const std::string message = "Failed to load dungeon: " + m_terrainId + ". Details: " + result.error;
        m_callbacks.ReportError(core::ErrorKind::LoadFailure, message);

        core::TerrainEvent event;
        event.terrainId = m_terrainId;
        event.url = m_url;
        event.error = message;
        m_bus.Emit(core::topics::kTerrainError, event);
        return;
    }

    InstallTerrain(*result.model);
    m_state = TerrainState::Loaded;

    core::TerrainEvent event;
    event.terrainId = m_terrainId;
    event.url = m_url;
    event.size = m_bounds.Size();
    event.center = m_bounds.Center();
    m_bus.Emit(core::topics::kTerrainLoaded, event);
    std::cout << "[TerrainLoader] Loaded terrain '" << m_terrainId << "' (" << event.size.x << " x " << event.size.z << ")\n";
}

void TerrainLoader::InstallTerrain(const assets::ModelData& model)
{
    DestroyTerrainNode();

    scene::SceneGraph& graph = m_host.Scene();
    m_terrainNode = graph.CreateGroup("terrain:" + m_terrainId);
    for (const assets::ModelPart& part : model.parts)
    {
        scene::Material material;
        material.color = part.color;
        material.opacity = part.opacity;
        material.transparent = part.opacity < 1.0F;
        const scene::GeometryId geometry = graph.CreateGeometry(part.geometry);
        const scene::MaterialId materialId = graph.CreateMaterial(material);
        const scene::NodeHandle mesh = graph.CreateMesh(geometry, materialId, "terrain-part");
        graph.AddChild(m_terrainNode, mesh);
    }

    scene::NodeTransform transform;
    transform.scale = glm::vec3{m_config.scale > 0.0F ? m_config.scale : 1.0F};
    graph.SetTransform(m_terrainNode, transform);
    graph.AddChild(graph.Root(), m_terrainNode);

    m_bounds = graph.WorldBounds(m_terrainNode);
    m_grid = MakeGridSpec(m_bounds, m_metadata);
    m_host.PositionCamera(m_bounds.Center(), m_bounds.Size());
    RebuildGrid();
}

void TerrainLoader::ApplyFallbackExtent(const std::optional<glm::vec2>& layoutExtent)
{
    const glm::vec2 extent = layoutExtent.value_or(glm::vec2{m_config.fallbackWidth, m_config.fallbackDepth});
    m_bounds = scene::Aabb{};
    m_bounds.Expand(glm::vec3{-extent.x * 0.5F, m_config.groundY, -extent.y * 0.5F});
    m_bounds.Expand(glm::vec3{extent.x * 0.5F, m_config.groundY, extent.y * 0.5F});
    m_grid = MakeGridSpec(m_bounds, m_metadata);
    m_host.PositionCamera(m_bounds.Center(), m_bounds.Size());
    RebuildGrid();
}

void TerrainLoader::RebuildGrid()
{
    DestroyGridNode();
    if (!m_grid.IsValid())
    {
        return;
    }

    const int columns = m_grid.width + 1;
    const int rows = m_grid.height + 1;
    const float stepX = m_grid.StepX();
    const float stepZ = m_grid.StepZ();

    // Vertex heights; unset where the probe misses the terrain.
    std::vector<std::optional<float>> heights(static_cast<std::size_t>(columns * rows));
    for (int j = 0; j < rows; ++j)
    {
        for (int i = 0; i < columns; ++i)
        {
            const float x = m_grid.min.x + static_cast<float>(i) * stepX;
            const float z = m_grid.min.y + static_cast<float>(j) * stepZ;
            std::optional<float>& slot = heights[static_cast<std::size_t>(j * columns + i)];
            if (HasTerrainMesh())
            {
                const std::optional<float> surface = SurfaceHeightAt(x, z);
                if (surface.has_value())
                {
                    slot = *surface + kGridLift;
                }
            }
            else
            {
                slot = m_config.groundY;
            }
        }
    }

    scene::Geometry lines;
    lines.primitive = scene::PrimitiveType::Lines;
    const auto pointAt = [&](int i, int j) {
        return glm::vec3{
            m_grid.min.x + static_cast<float>(i) * stepX,
            *heights[static_cast<std::size_t>(j * columns + i)],
            m_grid.min.y + static_cast<float>(j) * stepZ};
    };
    const auto valid = [&](int i, int j) { return heights[static_cast<std::size_t>(j * columns + i)].has_value(); };
    for (int j = 0; j < rows; ++j)
    {
        for (int i = 0; i < columns; ++i)
        {
            if (!valid(i, j))
            {
                continue;
            }
            if (i + 1 < columns && valid(i + 1, j))
            {
                lines.positions.push_back(pointAt(i, j));
                lines.positions.push_back(pointAt(i + 1, j));
            }
            if (j + 1 < rows && valid(i, j + 1))
            {
                lines.positions.push_back(pointAt(i, j));
                lines.positions.push_back(pointAt(i, j + 1));
            }
        }
    }
    if (lines.positions.empty())
    {
        return;
    }
    lines.ComputeBounds();

    scene::SceneGraph& graph = m_host.Scene();
    scene::Material material;
    material.color = m_config.gridColor;
    material.unlit = true;
    const scene::GeometryId geometry = graph.CreateGeometry(std::move(lines));
    const scene::MaterialId materialId = graph.CreateMaterial(material);
    m_gridNode = graph.CreateMesh(geometry, materialId, "grid-overlay");
    if (scene::Node* node = graph.Find(m_gridNode))
    {
        node->pickable = false;
    }
    graph.AddChild(graph.Root(), m_gridNode);
    graph.SetVisible(m_gridNode, m_gridVisible);
}

void TerrainLoader::DestroyTerrainNode()
{
    if (m_terrainNode != scene::kInvalidNode)
    {
        m_host.Scene().Destroy(m_terrainNode);
        m_terrainNode = scene::kInvalidNode;
    }
}

void TerrainLoader::DestroyGridNode()
{
    if (m_gridNode != scene::kInvalidNode)
    {
        m_host.Scene().Destroy(m_gridNode);
        m_gridNode = scene::kInvalidNode;
    }
}

std::optional<GridCell> TerrainLoader::CalculateGridPosition(float worldX, float worldZ) const
{
    return terrain::CalculateGridPosition(m_grid, worldX, worldZ);
}

std::optional<float> TerrainLoader::SurfaceHeightAt(float worldX, float worldZ) const
{
    if (!HasTerrainMesh())
    {
        return m_config.groundY;
    }

    scene::Ray ray;
    ray.origin = glm::vec3{worldX, m_bounds.max.y + kProbeHeightAboveBounds, worldZ};
    ray.direction = glm::vec3{0.0F, -1.0F, 0.0F};
    const std::optional<scene::RaycastHit> hit = m_host.Scene().Raycast(ray, {m_terrainNode});
    if (!hit.has_value())
    {
        return std::nullopt;
    }
    return hit->point.y;
}

std::optional<glm::vec3> TerrainLoader::RaycastSurface(const scene::Ray& ray) const
{
    if (HasTerrainMesh())
    {
        const std::optional<scene::RaycastHit> hit = m_host.Scene().Raycast(ray, {m_terrainNode});
        if (hit.has_value())
        {
            return hit->point;
        }
    }

    glm::vec3 groundHit{0.0F};
    if (scene::RayIntersectPlane(ray, glm::vec3{0.0F, m_config.groundY, 0.0F}, glm::vec3{0.0F, 1.0F, 0.0F}, &groundHit))
    {
        return groundHit;
    }
    return std::nullopt;
}

void TerrainLoader::SetGridVisible(bool visible)
{
    m_gridVisible = visible;
    if (m_gridNode != scene::kInvalidNode)
    {
        m_host.Scene().SetVisible(m_gridNode, visible);
    }
}

void TerrainLoader::OnGridToggle(const core::Payload& payload)
{
    const core::GridToggleEvent* event = core::PayloadAs<core::GridToggleEvent>(payload);
    if (event != nullptr && event->visible.has_value())
    {
        SetGridVisible(*event->visible);
        return;
    }
    SetGridVisible(!m_gridVisible);
}

void TerrainLoader::OnTerrainSelected(const core::Payload& payload)
{
    const core::TerrainEvent* event = core::PayloadAs<core::TerrainEvent>(payload);
    if (event == nullptr)
    {
        return;
    }
    SetTerrain(event->terrainId, event->url);
}
} // namespace placer::terrain
