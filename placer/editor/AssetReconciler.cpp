#include "placer/editor/AssetReconciler.hpp"

#include <array>
#include <iostream>
#include <utility>

#include "placer/scene/SceneHost.hpp"
#include "placer/terrain/TerrainLoader.hpp"

namespace placer::editor
{
namespace
{
const glm::vec3 kProxyColor{0.8F, 0.8F, 0.8F};

// Closed box of the given size centred on `center`, used as the far-distance proxy.
scene::Geometry MakeBoxGeometry(const glm::vec3& center, const glm::vec3& size)
{
    const glm::vec3 h = size * 0.5F;
    const std::array<glm::vec3, 8> corners = {
        center + glm::vec3{-h.x, -h.y, -h.z},
        center + glm::vec3{h.x, -h.y, -h.z},
        center + glm::vec3{h.x, h.y, -h.z},
        center + glm::vec3{-h.x, h.y, -h.z},
        center + glm::vec3{-h.x, -h.y, h.z},
        center + glm::vec3{h.x, -h.y, h.z},
        center + glm::vec3{h.x, h.y, h.z},
        center + glm::vec3{-h.x, h.y, h.z},
    };
    scene::Geometry box;
    box.positions.assign(corners.begin(), corners.end());
    box.indices = {
        0, 2, 1, 0, 3, 2, // back
        4, 5, 6, 4, 6, 7, // front
        0, 1, 5, 0, 5, 4, // bottom
        3, 7, 6, 3, 6, 2, // top
        0, 4, 7, 0, 7, 3, // left
        1, 2, 6, 1, 6, 5, // right
    };
    box.ComputeBounds();
    return box;
}

scene::NodeTransform TransformFromEvent(const core::MutationEvent& event, const scene::NodeTransform& current)
{
    scene::NodeTransform next = current;
    if (event.position.has_value())
    {
        next.position.x = event.position->x;
        next.position.z = event.position->z;
        if (event.positionHasY)
        {
            next.position.y = event.position->y;
        }
    }
    if (event.rotation.has_value())
    {
        next.rotation = *event.rotation;
    }
    if (event.scale.has_value())
    {
        next.scale = *event.scale;
    }
    return next;
}
} // namespace

AssetReconciler::AssetReconciler(
    core::EventBus& bus,
    scene::SceneHost& host,
    const terrain::TerrainLoader& terrain,
    assets::IModelSource& models,
    const core::SessionCallbacks& callbacks,
    std::string modelBaseUrl)
    : m_bus(bus)
    , m_host(host)
    , m_terrain(terrain)
    , m_models(models)
    , m_callbacks(callbacks)
    , m_modelBaseUrl(std::move(modelBaseUrl))
{
    m_mutationHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnMutation(payload); });
    m_bus.On(core::topics::kAssetAdded, m_mutationHandler);
    m_bus.On(core::topics::kAssetVisualSync, m_mutationHandler);
    m_bus.On(core::topics::kAssetUpdated, m_mutationHandler);
    m_bus.On(core::topics::kAssetDeleted, m_mutationHandler);
}

AssetReconciler::~AssetReconciler()
{
    m_bus.Off(core::topics::kAssetAdded, m_mutationHandler);
    m_bus.Off(core::topics::kAssetVisualSync, m_mutationHandler);
    m_bus.Off(core::topics::kAssetUpdated, m_mutationHandler);
    m_bus.Off(core::topics::kAssetDeleted, m_mutationHandler);
    ClearAll();
}

void AssetReconciler::OnMutation(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event != nullptr)
    {
        Apply(*event);
    }
}

void AssetReconciler::Apply(const core::MutationEvent& event)
{
    if (event.id.empty())
    {
        return;
    }

    if (event.kind == core::MutationKind::Deleted)
    {
        Remove(event.id);
        return;
    }

    const auto it = m_entries.find(event.id);
    if (it != m_entries.end())
    {
        // Gizmo ticks were applied to the node directly by the drag.
        if (!event.fromGizmo)
        {
            MutateInPlace(it->second, event);
        }
        return;
    }

    if (event.kind == core::MutationKind::Updated)
    {
        if (!event.fromGizmo)
        {
            std::cerr << "[AssetReconciler] Update for unknown asset ignored: " << event.id << "\n";
        }
        return;
    }
    Create(event);
}

void AssetReconciler::Create(const core::MutationEvent& event)
{
    scene::SceneGraph& graph = m_host.Scene();

    Entry entry;
    entry.name = event.name.value_or(event.id);
    entry.ticket = m_nextTicket++;
    entry.root = graph.CreateLod("asset:" + event.id);

    scene::NodeTransform initial;
    initial = TransformFromEvent(event, initial);
    graph.SetTransform(entry.root, initial);
    graph.AddChild(graph.Root(), entry.root);

    // Registered before the load resolves so a repeated event finds the id and does not load twice.
    const std::uint64_t ticket = entry.ticket;
    const core::CancellationToken token = entry.token;
    m_idsByNode[entry.root] = event.id;
    m_entries.emplace(event.id, std::move(entry));

    const std::string url = assets::ResolveModelUrl(event.modelUrl.value_or(std::string{}), m_modelBaseUrl);
    if (url.empty())
    {
        assets::ModelLoadResult missing;
        missing.error = "Asset has no model URL";
        OnModelLoaded(event.id, ticket, missing);
        return;
    }
    m_models.Load(
        url,
        [this, id = event.id, ticket](const assets::ModelLoadResult& result) { OnModelLoaded(id, ticket, result); },
        token);
}

void AssetReconciler::MutateInPlace(Entry& entry, const core::MutationEvent& event)
{
    scene::SceneGraph& graph = m_host.Scene();
    graph.SetTransform(entry.root, TransformFromEvent(event, graph.Transform(entry.root)));
    if (event.name.has_value())
    {
        entry.name = *event.name;
    }
}

void AssetReconciler::OnModelLoaded(const std::string& assetId, std::uint64_t ticket, const assets::ModelLoadResult& result)
{
    const auto it = m_entries.find(assetId);
    if (it == m_entries.end() || it->second.ticket != ticket || it->second.loaded)
    {
        // Deleted or replaced while loading.
        return;
    }

    if (!result.Succeeded())
    {
        const std::string name = it->second.name;
        std::cerr << "[AssetReconciler] Failed to load asset " << assetId << ": " << result.error << "\n";
        Remove(assetId);
        m_callbacks.ReportError(core::ErrorKind::LoadFailure, "Failed to load asset: " + name);
        return;
    }

    Entry& entry = it->second;
    BuildDetailLevels(entry.root, *result.model);
    entry.loaded = true;
    SnapToSurface(entry.root);
}

void AssetReconciler::BuildDetailLevels(scene::NodeHandle lod, const assets::ModelData& model)
{
    scene::SceneGraph& graph = m_host.Scene();

    const scene::NodeHandle full = graph.CreateGroup("lod-full");
    const scene::NodeHandle medium = graph.CreateGroup("lod-medium");
    for (const assets::ModelPart& part : model.parts)
    {
        const scene::GeometryId geometry = graph.CreateGeometry(part.geometry);

        scene::Material litMaterial;
        litMaterial.color = part.color;
        litMaterial.opacity = part.opacity;
        litMaterial.transparent = part.opacity < 1.0F;
        graph.AddChild(full, graph.CreateMesh(geometry, graph.CreateMaterial(litMaterial), "part"));

        // Same geometry, no lighting.
        scene::Material flatMaterial = litMaterial;
        flatMaterial.unlit = true;
        graph.AddChild(medium, graph.CreateMesh(geometry, graph.CreateMaterial(flatMaterial), "part-unlit"));
    }

    scene::Material proxyMaterial;
    proxyMaterial.color = kProxyColor;
    proxyMaterial.unlit = true;
    proxyMaterial.wireframe = true;
    const scene::GeometryId proxyGeometry = graph.CreateGeometry(MakeBoxGeometry(model.bounds.Center(), model.bounds.Size()));
    const scene::NodeHandle proxy = graph.CreateMesh(proxyGeometry, graph.CreateMaterial(proxyMaterial), "lod-proxy");

    graph.AddLodLevel(lod, full, 0.0F);
    graph.AddLodLevel(lod, medium, kMediumDetailDistance);
    graph.AddLodLevel(lod, proxy, kLowDetailDistance);
}

void AssetReconciler::SnapToSurface(scene::NodeHandle root)
{
    scene::SceneGraph& graph = m_host.Scene();
    scene::NodeTransform transform = graph.Transform(root);
    const std::optional<std::string> assetId = AssetIdFor(root);
    if (!assetId.has_value())
    {
        return;
    }
    const std::optional<float> snapped = ComputeSnappedY(*assetId, transform);
    if (snapped.has_value())
    {
        transform.position.y = *snapped;
        graph.SetTransform(root, transform);
    }
}

std::optional<float> AssetReconciler::ComputeSnappedY(const std::string& assetId, const scene::NodeTransform& candidate) const
{
    const scene::NodeHandle root = NodeFor(assetId);
    if (root == scene::kInvalidNode)
    {
        return std::nullopt;
    }
    const scene::Aabb bounds = m_host.Scene().WorldBoundsWithTransform(root, candidate);
    if (!bounds.IsValid())
    {
        return std::nullopt;
    }
    const std::optional<float> surfaceY = m_terrain.SurfaceHeightAt(candidate.position.x, candidate.position.z);
    if (!surfaceY.has_value())
    {
        return std::nullopt;
    }
    const float bottomOffset = bounds.min.y - candidate.position.y;
    return *surfaceY - bottomOffset;
}

void AssetReconciler::Remove(const std::string& assetId)
{
    const auto it = m_entries.find(assetId);
    if (it == m_entries.end())
    {
        return;
    }
    const scene::NodeHandle root = it->second.root;
    it->second.token.Cancel();
    // Detaching ends an active gizmo drag, whose listeners must already see the asset as gone.
    m_idsByNode.erase(root);
    m_entries.erase(it);
    DetachGizmoFrom(root);
    m_host.Scene().Destroy(root);
}

void AssetReconciler::ClearAll()
{
    for (auto& [id, entry] : m_entries)
    {
        entry.token.Cancel();
        m_host.Scene().Destroy(entry.root);
    }
    m_entries.clear();
    m_idsByNode.clear();
    if (scene::TransformGizmo* gizmo = m_host.Gizmo())
    {
        gizmo->Detach();
    }
}

void AssetReconciler::DetachGizmoFrom(scene::NodeHandle root)
{
    scene::TransformGizmo* gizmo = m_host.Gizmo();
    if (gizmo != nullptr && gizmo->Attached() == root)
    {
        gizmo->Detach();
    }
}

bool AssetReconciler::IsLoaded(const std::string& assetId) const
{
    const auto it = m_entries.find(assetId);
    return it != m_entries.end() && it->second.loaded;
}

scene::NodeHandle AssetReconciler::NodeFor(const std::string& assetId) const
{
    const auto it = m_entries.find(assetId);
    return it != m_entries.end() ? it->second.root : scene::kInvalidNode;
}

std::optional<std::string> AssetReconciler::AssetIdFor(scene::NodeHandle node) const
{
    const auto it = m_idsByNode.find(node);
    if (it == m_idsByNode.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<scene::NodeHandle> AssetReconciler::InstanceNodes() const
{
    std::vector<scene::NodeHandle> nodes;
    nodes.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries)
    {
        nodes.push_back(entry.root);
    }
    return nodes;
}

std::vector<std::string> AssetReconciler::Ids() const
{
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries)
    {
        ids.push_back(id);
    }
    return ids;
}
} // namespace placer::editor
