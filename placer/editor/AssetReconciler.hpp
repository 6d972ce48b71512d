#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "placer/assets/ModelSource.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/scene/SceneGraph.hpp"

namespace placer::scene
{
class SceneHost;
}

namespace placer::terrain
{
class TerrainLoader;
}

namespace placer::editor
{
// Single writer of asset nodes in the scene graph. Keeps exactly one instance per live asset id,
// driven by asset:added / visualSync / updated / deleted.
class AssetReconciler
{
public:
    static constexpr float kMediumDetailDistance = 12.0F;
    static constexpr float kLowDetailDistance = 25.0F;

    AssetReconciler(
        core::EventBus& bus,
        scene::SceneHost& host,
        const terrain::TerrainLoader& terrain,
        assets::IModelSource& models,
        const core::SessionCallbacks& callbacks,
        std::string modelBaseUrl = {});
    ~AssetReconciler();

    AssetReconciler(const AssetReconciler&) = delete;
    AssetReconciler& operator=(const AssetReconciler&) = delete;

    void Apply(const core::MutationEvent& event);

    // Visual teardown of every instance. Emits nothing.
    void ClearAll();

    [[nodiscard]] bool Contains(const std::string& assetId) const { return m_entries.count(assetId) != 0; }
    [[nodiscard]] bool IsLoaded(const std::string& assetId) const;
    [[nodiscard]] std::size_t Count() const { return m_entries.size(); }
    [[nodiscard]] scene::NodeHandle NodeFor(const std::string& assetId) const;
    [[nodiscard]] std::optional<std::string> AssetIdFor(scene::NodeHandle node) const;
    [[nodiscard]] std::vector<scene::NodeHandle> InstanceNodes() const;
    [[nodiscard]] std::vector<std::string> Ids() const;

    // Y that puts the bottom of the instance on the surface if it had the candidate transform.
    [[nodiscard]] std::optional<float> ComputeSnappedY(const std::string& assetId, const scene::NodeTransform& candidate) const;

private:
    struct Entry
    {
        scene::NodeHandle root = scene::kInvalidNode;
        std::uint64_t ticket = 0;
        bool loaded = false;
        std::string name;
        core::CancellationToken token;
    };

    void OnMutation(const core::Payload& payload);
    void Create(const core::MutationEvent& event);
    void MutateInPlace(Entry& entry, const core::MutationEvent& event);
    void OnModelLoaded(const std::string& assetId, std::uint64_t ticket, const assets::ModelLoadResult& result);
    void BuildDetailLevels(scene::NodeHandle lod, const assets::ModelData& model);
    void SnapToSurface(scene::NodeHandle root);
    void Remove(const std::string& assetId);
    void DetachGizmoFrom(scene::NodeHandle root);

    core::EventBus& m_bus;
    scene::SceneHost& m_host;
    const terrain::TerrainLoader& m_terrain;
    assets::IModelSource& m_models;
    const core::SessionCallbacks& m_callbacks;
    std::string m_modelBaseUrl;

    std::unordered_map<std::string, Entry> m_entries;
    std::unordered_map<scene::NodeHandle, std::string> m_idsByNode;
    std::uint64_t m_nextTicket = 1;

    core::EventBus::HandlerPtr m_mutationHandler;
};
} // namespace placer::editor
