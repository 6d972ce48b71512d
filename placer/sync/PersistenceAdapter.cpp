#include "placer/sync/PersistenceAdapter.hpp"

#include <iostream>
#include <utility>

namespace placer::sync
{
PersistenceAdapter::PersistenceAdapter(core::EventBus& bus, ILayoutBackend& backend, const core::SessionCallbacks& callbacks)
    : m_bus(bus)
    , m_backend(backend)
    , m_callbacks(callbacks)
{
    m_addedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnAdded(payload); });
    m_updatedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnUpdated(payload); });
    m_deletedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnDeleted(payload); });
    m_bus.On(core::topics::kAssetAdded, m_addedHandler);
    m_bus.On(core::topics::kAssetUpdated, m_updatedHandler);
    m_bus.On(core::topics::kAssetDeleted, m_deletedHandler);
}

PersistenceAdapter::~PersistenceAdapter()
{
    *m_alive = false;
    m_bus.Off(core::topics::kAssetAdded, m_addedHandler);
    m_bus.Off(core::topics::kAssetUpdated, m_updatedHandler);
    m_bus.Off(core::topics::kAssetDeleted, m_deletedHandler);
}

bool PersistenceAdapter::ClearAllAssets()
{
    if (m_terrainId.empty())
    {
        return false;
    }
    m_backend.ReplaceLayout(m_terrainId, {}, ReportOnFailure("Failed to clear assets", true));
    return true;
}

void PersistenceAdapter::OnAdded(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || m_terrainId.empty())
    {
        return;
    }

    core::AssetRecord record;
    record.id = event->id;
    record.modelUrl = event->modelUrl.value_or(std::string{});
    record.name = event->name.value_or(event->id);
    record.position = event->position.value_or(glm::vec3{0.0F});
    record.rotation = event->rotation.value_or(glm::vec3{0.0F});
    record.scale = event->scale.value_or(glm::vec3{1.0F});
    m_backend.PlaceAsset(record, m_terrainId, ReportOnFailure("Failed to save asset: " + record.name, false));
}

void PersistenceAdapter::OnUpdated(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    // Gizmo ticks are not commits.
    if (event == nullptr || event->fromGizmo || m_terrainId.empty())
    {
        return;
    }
    m_backend.MoveAsset(
        event->id,
        event->position,
        event->rotation,
        event->scale,
        m_terrainId,
        ReportOnFailure("Failed to update asset", false));
}

void PersistenceAdapter::OnDeleted(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || m_terrainId.empty())
    {
        return;
    }
    m_backend.DeleteAsset(event->id, m_terrainId, ReportOnFailure("Failed to delete asset", false));
}

Completion PersistenceAdapter::ReportOnFailure(std::string message, bool appendDetail)
{
    std::weak_ptr<bool> alive = m_alive;
    return [this, alive, message = std::move(message), appendDetail](bool ok, const std::string& error) {
        if (ok)
        {
            return;
        }
        std::cerr << "[PersistenceAdapter] " << message << ": " << error << "\n";
        const std::shared_ptr<bool> stillAlive = alive.lock();
        if (stillAlive == nullptr || !*stillAlive)
        {
            return;
        }
        m_callbacks.ReportError(
            core::ErrorKind::PersistenceFailure,
            appendDetail ? message + ": " + error : message);
    };
}
} // namespace placer::sync
