#pragma once

#include <memory>
#include <string>
#include <utility>

#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/sync/LayoutBackend.hpp"

namespace placer::sync
{
// Forwards committed mutations to the layout backend of the current terrain. Failures are reported
// through the session callbacks and never retried.
class PersistenceAdapter
{
public:
    PersistenceAdapter(core::EventBus& bus, ILayoutBackend& backend, const core::SessionCallbacks& callbacks);
    ~PersistenceAdapter();

    PersistenceAdapter(const PersistenceAdapter&) = delete;
    PersistenceAdapter& operator=(const PersistenceAdapter&) = delete;

    // Empty id disables persistence.
    void SetTerrainId(std::string terrainId) { m_terrainId = std::move(terrainId); }
    [[nodiscard]] const std::string& TerrainId() const { return m_terrainId; }

    // One bulk "replace with an empty layout" request. Returns false when no terrain is set.
    bool ClearAllAssets();

private:
    void OnAdded(const core::Payload& payload);
    void OnUpdated(const core::Payload& payload);
    void OnDeleted(const core::Payload& payload);
    Completion ReportOnFailure(std::string message, bool appendDetail);

    core::EventBus& m_bus;
    ILayoutBackend& m_backend;
    const core::SessionCallbacks& m_callbacks;
    std::string m_terrainId;
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);

    core::EventBus::HandlerPtr m_addedHandler;
    core::EventBus::HandlerPtr m_updatedHandler;
    core::EventBus::HandlerPtr m_deletedHandler;
};
} // namespace placer::sync
