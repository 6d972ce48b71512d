#include "placer/sync/ExternalSync.hpp"

#include <iostream>

namespace placer::sync
{
namespace
{
core::MutationEvent EventFromRecord(core::MutationKind kind, const core::AssetRecord& record)
{
    core::MutationEvent event;
    event.kind = kind;
    event.id = record.id;
    event.modelUrl = record.modelUrl;
    event.name = record.name;
    event.position = record.position;
    event.rotation = record.rotation;
    event.scale = record.scale;
    return event;
}
} // namespace

ExternalSync::ExternalSync(core::EventBus& bus)
    : m_bus(bus)
{
    m_addedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnAdded(payload); });
    m_updatedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnUpdated(payload); });
    m_deletedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnDeleted(payload); });
    m_bus.On(core::topics::kAssetAdded, m_addedHandler);
    m_bus.On(core::topics::kAssetUpdated, m_updatedHandler);
    m_bus.On(core::topics::kAssetDeleted, m_deletedHandler);
}

ExternalSync::~ExternalSync()
{
    m_bus.Off(core::topics::kAssetAdded, m_addedHandler);
    m_bus.Off(core::topics::kAssetUpdated, m_updatedHandler);
    m_bus.Off(core::topics::kAssetDeleted, m_deletedHandler);
}

void ExternalSync::Observe(const std::vector<core::AssetRecord>& records)
{
    std::unordered_map<std::string, core::AssetRecord> current;
    current.reserve(records.size());
    for (const core::AssetRecord& record : records)
    {
        current.emplace(record.id, record);
    }

    for (const core::AssetRecord& record : records)
    {
        const auto previous = m_previous.find(record.id);
        if (previous == m_previous.end())
        {
            if (m_recentlyAdded.erase(record.id) != 0)
            {
                continue;
            }
            EmitOwn(core::topics::kAssetVisualSync, EventFromRecord(core::MutationKind::VisualSync, record));
            continue;
        }

        if (core::SameTransform(previous->second, record))
        {
            continue;
        }
        const auto local = m_recentlyUpdated.find(record.id);
        if (local != m_recentlyUpdated.end())
        {
            const bool echoed = core::SameTransform(local->second, record);
            m_recentlyUpdated.erase(local);
            if (echoed)
            {
                continue;
            }
        }
        EmitOwn(core::topics::kAssetUpdated, EventFromRecord(core::MutationKind::Updated, record));
    }

    for (const auto& [id, record] : m_previous)
    {
        if (current.count(id) != 0)
        {
            continue;
        }
        if (m_recentlyDeleted.erase(id) != 0)
        {
            continue;
        }
        core::MutationEvent event;
        event.kind = core::MutationKind::Deleted;
        event.id = id;
        EmitOwn(core::topics::kAssetDeleted, event);
    }

    m_previous = std::move(current);
}

void ExternalSync::ClearAllAssets()
{
    std::vector<std::string> ids;
    ids.reserve(m_previous.size());
    for (const auto& [id, record] : m_previous)
    {
        ids.push_back(id);
    }
    Reset();

    for (const std::string& id : ids)
    {
        core::MutationEvent event;
        event.kind = core::MutationKind::Deleted;
        event.id = id;
        EmitOwn(core::topics::kAssetDeleted, event);
    }
    std::cout << "[ExternalSync] Cleared " << ids.size() << " assets\n";
}

void ExternalSync::Reset()
{
    m_previous.clear();
    m_recentlyAdded.clear();
    m_recentlyUpdated.clear();
    m_recentlyDeleted.clear();
}

void ExternalSync::EmitOwn(const std::string& topic, const core::MutationEvent& event)
{
    m_emitting = true;
    m_bus.Emit(topic, event);
    m_emitting = false;
}

void ExternalSync::OnAdded(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || m_emitting)
    {
        return;
    }
    m_recentlyAdded.insert(event->id);
    m_recentlyDeleted.erase(event->id);
}

void ExternalSync::OnUpdated(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || m_emitting || event->fromGizmo)
    {
        return;
    }

    core::AssetRecord expected;
    const auto previous = m_previous.find(event->id);
    if (previous != m_previous.end())
    {
        expected = previous->second;
    }
    expected.id = event->id;
    if (event->position.has_value())
    {
        expected.position = *event->position;
    }
    if (event->rotation.has_value())
    {
        expected.rotation = *event->rotation;
    }
    if (event->scale.has_value())
    {
        expected.scale = *event->scale;
    }
    m_recentlyUpdated[event->id] = expected;
}

void ExternalSync::OnDeleted(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr || m_emitting)
    {
        return;
    }
    m_recentlyAdded.erase(event->id);
    m_recentlyUpdated.erase(event->id);
    if (m_previous.count(event->id) != 0)
    {
        m_recentlyDeleted.insert(event->id);
    }
}
} // namespace placer::sync
