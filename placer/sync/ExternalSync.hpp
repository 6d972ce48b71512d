#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "placer/core/AssetRecord.hpp"
#include "placer/core/EventBus.hpp"

namespace placer::sync
{
// Turns changes of the owner's record list into mutation events. Records that only reflect what
// was already emitted locally (added, committed update, delete) produce nothing.
class ExternalSync
{
public:
    explicit ExternalSync(core::EventBus& bus);
    ~ExternalSync();

    ExternalSync(const ExternalSync&) = delete;
    ExternalSync& operator=(const ExternalSync&) = delete;

    void Observe(const std::vector<core::AssetRecord>& records);

    // Emits asset:deleted for every tracked id, then forgets everything.
    void ClearAllAssets();
    // Forgets everything without emitting.
    void Reset();

    [[nodiscard]] std::size_t TrackedCount() const { return m_previous.size(); }

private:
    void EmitOwn(const std::string& topic, const core::MutationEvent& event);
    void OnAdded(const core::Payload& payload);
    void OnUpdated(const core::Payload& payload);
    void OnDeleted(const core::Payload& payload);

    core::EventBus& m_bus;
    std::unordered_map<std::string, core::AssetRecord> m_previous;
    std::unordered_set<std::string> m_recentlyAdded;
    std::unordered_map<std::string, core::AssetRecord> m_recentlyUpdated;
    std::unordered_set<std::string> m_recentlyDeleted;
    bool m_emitting = false;

    core::EventBus::HandlerPtr m_addedHandler;
    core::EventBus::HandlerPtr m_updatedHandler;
    core::EventBus::HandlerPtr m_deletedHandler;
};
} // namespace placer::sync
