#include "placer/editor/InteractionController.hpp"

#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "placer/core/Time.hpp"
#include "placer/editor/AssetReconciler.hpp"
#include "placer/scene/SceneHost.hpp"
#include "placer/terrain/TerrainLoader.hpp"

namespace placer::editor
{
namespace
{
std::string ToBase36(std::uint64_t value)
{
    constexpr const char* kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string text;
    do
    {
        text.insert(text.begin(), kDigits[value % 36]);
        value /= 36;
    } while (value != 0);
    return text;
}
} // namespace

const char* InteractionModeName(InteractionMode mode)
{
    switch (mode)
    {
        case InteractionMode::Idle: return "Idle";
        case InteractionMode::Selected: return "Selected";
        case InteractionMode::PickedUp: return "PickedUp";
    }
    return "Unknown";
}

const char* PlacementResultName(PlacementResult result)
{
    switch (result)
    {
        case PlacementResult::Accepted: return "Accepted";
        case PlacementResult::RejectedOccupied: return "RejectedOccupied";
        case PlacementResult::RejectedOutOfBounds: return "RejectedOutOfBounds";
        case PlacementResult::RejectedInvalid: return "RejectedInvalid";
    }
    return "Unknown";
}

bool ParseDragPayload(const std::string& text, DragPayload* outPayload, std::string* outError)
{
    if (outPayload == nullptr)
    {
        return false;
    }

    nlohmann::json root;
    try
    {
        root = nlohmann::json::parse(text);
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string("Drag payload is not valid JSON: ") + ex.what();
        }
        return false;
    }

    if (!root.is_object() || !root.contains("id") || !root["id"].is_string() || !root.contains("url") || !root["url"].is_string())
    {
        if (outError != nullptr)
        {
            *outError = "Drag payload needs string 'id' and 'url'.";
        }
        return false;
    }

    DragPayload payload;
    payload.id = root["id"].get<std::string>();
    payload.url = root["url"].get<std::string>();
    payload.name = root.contains("name") && root["name"].is_string() ? root["name"].get<std::string>() : payload.id;
    if (root.contains("rotation"))
    {
        glm::vec3 rotation{0.0F};
        if (core::Vec3FromJson(root["rotation"], &rotation))
        {
            payload.rotation = rotation;
        }
    }
    *outPayload = std::move(payload);
    return true;
}

InteractionController::InteractionController(
    core::EventBus& bus,
    scene::SceneHost& host,
    const terrain::TerrainLoader& terrain,
    const AssetReconciler& reconciler,
    const core::SessionCallbacks& callbacks)
    : m_bus(bus)
    , m_host(host)
    , m_terrain(terrain)
    , m_reconciler(reconciler)
    , m_callbacks(callbacks)
    , m_clock(&core::WallClockMillis)
{
    m_moveStartedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnMoveStarted(payload); });
    m_moveFinishedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnMoveFinished(payload); });
    m_deletedHandler = core::EventBus::MakeHandler([this](const core::Payload& payload) { OnDeleted(payload); });
    m_bus.On(core::topics::kAssetMoveStarted, m_moveStartedHandler);
    m_bus.On(core::topics::kAssetMoveFinished, m_moveFinishedHandler);
    m_bus.On(core::topics::kAssetDeleted, m_deletedHandler);
}

InteractionController::~InteractionController()
{
    m_bus.Off(core::topics::kAssetMoveStarted, m_moveStartedHandler);
    m_bus.Off(core::topics::kAssetMoveFinished, m_moveFinishedHandler);
    m_bus.Off(core::topics::kAssetDeleted, m_deletedHandler);
}

void InteractionController::SetPlacedAssets(const std::vector<core::AssetRecord>& records)
{
    m_records = records;
    for (const core::AssetRecord& record : m_records)
    {
        m_pending.erase(record.id);
    }
}

void InteractionController::SetPlacementTemplate(std::optional<PlacementTemplate> placement)
{
    m_template = std::move(placement);
}

void InteractionController::Click(const glm::vec2& pointer)
{
    scene::Ray ray;
    if (m_host.BuildPointerRay(pointer, &ray))
    {
        Click(ray);
    }
}

void InteractionController::Click(const scene::Ray& ray)
{
    if (m_mode == InteractionMode::PickedUp)
    {
        const PlacementResult result = CommitMove(ray);
        if (result != PlacementResult::Accepted)
        {
            std::cout << "[InteractionController] Move not committed: " << PlacementResultName(result) << "\n";
        }
        return;
    }

    const std::optional<scene::RaycastHit> hit = m_host.Scene().Raycast(ray, m_reconciler.InstanceNodes());
    if (hit.has_value())
    {
        const std::optional<std::string> assetId = m_reconciler.AssetIdFor(hit->target);
        if (assetId.has_value())
        {
            Select(*assetId);
            return;
        }
    }

    if (m_template.has_value())
    {
        PlaceFromTemplate(ray);
        return;
    }
    Deselect();
}

void InteractionController::PointerMove(const glm::vec2& pointer)
{
    scene::Ray ray;
    if (m_host.BuildPointerRay(pointer, &ray))
    {
        PointerMove(ray);
    }
}

void InteractionController::PointerMove(const scene::Ray& ray)
{
    if (m_mode != InteractionMode::PickedUp)
    {
        return;
    }
    UpdateHighlight(ray, m_selectedId);
}

bool InteractionController::DragOver(const glm::vec2& pointer)
{
    scene::Ray ray;
    if (!m_host.BuildPointerRay(pointer, &ray))
    {
        return false;
    }
    return DragOver(ray);
}

bool InteractionController::DragOver(const scene::Ray& ray)
{
    const std::optional<terrain::GridCell> cell = UpdateHighlight(ray, std::nullopt);
    return cell.has_value() && CanDrop(*cell);
}

PlacementResult InteractionController::Drop(const glm::vec2& pointer, const DragPayload& payload)
{
    scene::Ray ray;
    if (!m_host.BuildPointerRay(pointer, &ray))
    {
        return PlacementResult::RejectedInvalid;
    }
    return Drop(ray, payload);
}

PlacementResult InteractionController::Drop(const scene::Ray& ray, const DragPayload& payload)
{
    if (payload.id.empty() || payload.url.empty())
    {
        std::cerr << "[InteractionController] Drop ignored: payload without id or url\n";
        return PlacementResult::RejectedInvalid;
    }

    const std::optional<glm::vec3> point = ResolveWorldPoint(ray);
    if (!point.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    const std::optional<terrain::GridCell> cell = m_terrain.CalculateGridPosition(point->x, point->z);
    if (!cell.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    if (!CanDrop(*cell))
    {
        ClearHighlight();
        return PlacementResult::RejectedOccupied;
    }

    const std::string assetId = "dragdrop-" + payload.id + "-" + std::to_string(m_clock());
    const glm::vec3 position{cell->centerX, point->y, cell->centerZ};
    const glm::vec3 scale{
        cell->stepX * kDropScaleFactor,
        cell->stepX * kDropScaleFactor,
        cell->stepZ * kDropScaleFactor};

    EmitAdded(assetId, payload.url, payload.name.empty() ? payload.id : payload.name, position,
        payload.rotation.value_or(glm::vec3{0.0F}), scale);
    ClearHighlight();
    return PlacementResult::Accepted;
}

void InteractionController::DragLeave()
{
    ClearHighlight();
}

bool InteractionController::CanDrop(const terrain::GridCell& cell) const
{
    return !IsOccupied(cell, std::nullopt);
}

bool InteractionController::PickUpSelected()
{
    if (m_mode != InteractionMode::Selected || !m_selectedId.has_value())
    {
        return false;
    }
    m_mode = InteractionMode::PickedUp;
    m_highlightedCell.reset();
    if (scene::TransformGizmo* gizmo = m_host.Gizmo())
    {
        gizmo->Detach();
    }
    m_bus.Emit(core::topics::kAssetMoveStarted, core::MoveEvent{*m_selectedId, core::MoveSource::PickUp});
    return true;
}

void InteractionController::CancelMove()
{
    if (m_mode != InteractionMode::PickedUp)
    {
        return;
    }
    ResetSelection(false);
}

bool InteractionController::RotateSelected(float yawRadians)
{
    if (!m_selectedId.has_value() || !m_reconciler.Contains(*m_selectedId))
    {
        return false;
    }
    scene::NodeTransform candidate = CurrentTransform(*m_selectedId);
    candidate.rotation = glm::vec3{0.0F, yawRadians, 0.0F};
    if (const std::optional<float> snappedY = m_reconciler.ComputeSnappedY(*m_selectedId, candidate))
    {
        candidate.position.y = *snappedY;
    }
    EmitCommittedUpdate(*m_selectedId, candidate);
    return true;
}

bool InteractionController::ResizeSelected(float uniformScale)
{
    if (!m_selectedId.has_value() || !m_reconciler.Contains(*m_selectedId) || !(uniformScale > 0.0F))
    {
        return false;
    }
    scene::NodeTransform candidate = CurrentTransform(*m_selectedId);
    candidate.scale = glm::vec3{uniformScale};
    if (const std::optional<float> snappedY = m_reconciler.ComputeSnappedY(*m_selectedId, candidate))
    {
        candidate.position.y = *snappedY;
    }
    EmitCommittedUpdate(*m_selectedId, candidate);
    return true;
}

bool InteractionController::DeleteSelected()
{
    if (!m_selectedId.has_value())
    {
        return false;
    }
    const std::string assetId = *m_selectedId;
    if (m_mode == InteractionMode::PickedUp)
    {
        ClearHighlight();
    }
    core::MutationEvent event;
    event.kind = core::MutationKind::Deleted;
    event.id = assetId;
    m_bus.Emit(core::topics::kAssetDeleted, event);
    // OnDeleted normally resets the selection already.
    if (m_selectedId == assetId)
    {
        ResetSelection(true);
    }
    return true;
}

void InteractionController::Deselect()
{
    if (!m_selectedId.has_value() && m_mode == InteractionMode::Idle)
    {
        return;
    }
    if (m_mode == InteractionMode::PickedUp)
    {
        ClearHighlight();
    }
    ResetSelection(true);
}

void InteractionController::Select(const std::string& assetId)
{
    m_selectedId = assetId;
    m_mode = InteractionMode::Selected;
    if (scene::TransformGizmo* gizmo = m_host.Gizmo())
    {
        gizmo->Attach(m_reconciler.NodeFor(assetId));
    }
    m_bus.Emit(core::topics::kAssetSelected, core::SelectionEvent{assetId});
    m_callbacks.NotifySelection(assetId);
}

void InteractionController::ResetSelection(bool notify)
{
    const bool hadSelection = m_selectedId.has_value();
    m_selectedId.reset();
    m_mode = InteractionMode::Idle;
    m_highlightedCell.reset();
    if (scene::TransformGizmo* gizmo = m_host.Gizmo())
    {
        gizmo->Detach();
    }
    if (notify && hadSelection)
    {
        m_bus.Emit(core::topics::kAssetSelected, core::SelectionEvent{std::nullopt});
        m_callbacks.NotifySelection(std::nullopt);
    }
}

PlacementResult InteractionController::CommitMove(const scene::Ray& ray)
{
    if (!m_selectedId.has_value())
    {
        m_mode = InteractionMode::Idle;
        return PlacementResult::RejectedInvalid;
    }

    const std::optional<glm::vec3> point = ResolveWorldPoint(ray);
    if (!point.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    const std::optional<terrain::GridCell> cell = m_terrain.CalculateGridPosition(point->x, point->z);
    if (!cell.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    if (IsOccupied(*cell, m_selectedId))
    {
        return PlacementResult::RejectedOccupied;
    }

    const std::string assetId = *m_selectedId;
    scene::NodeTransform candidate = CurrentTransform(assetId);
    candidate.position = glm::vec3{cell->centerX, point->y, cell->centerZ};
    if (const std::optional<float> snappedY = m_reconciler.ComputeSnappedY(assetId, candidate))
    {
        candidate.position.y = *snappedY;
    }

    EmitCommittedUpdate(assetId, candidate);
    ClearHighlight();
    ResetSelection(true);
    m_bus.Emit(core::topics::kAssetMoveFinished, core::MoveEvent{assetId, core::MoveSource::PickUp});
    return PlacementResult::Accepted;
}

PlacementResult InteractionController::PlaceFromTemplate(const scene::Ray& ray)
{
    const PlacementTemplate& placement = *m_template;
    if (placement.url.empty())
    {
        return PlacementResult::RejectedInvalid;
    }

    const std::optional<glm::vec3> point = ResolveWorldPoint(ray);
    if (!point.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    const std::optional<terrain::GridCell> cell = m_terrain.CalculateGridPosition(point->x, point->z);
    if (!cell.has_value())
    {
        return PlacementResult::RejectedOutOfBounds;
    }
    if (!CanDrop(*cell))
    {
        std::cout << "[InteractionController] Cell " << cell->gridX << "," << cell->gridZ << " is occupied\n";
        return PlacementResult::RejectedOccupied;
    }

    const std::string assetId = "asset-" + std::to_string(m_clock()) + "-" + ToBase36(++m_placementCounter);
    const glm::vec3 scale = placement.scale.value_or(glm::vec3{
        cell->stepX * kDropScaleFactor,
        cell->stepX * kDropScaleFactor,
        cell->stepZ * kDropScaleFactor});
    EmitAdded(assetId, placement.url, placement.name.empty() ? placement.modelId : placement.name,
        glm::vec3{cell->centerX, point->y, cell->centerZ}, placement.rotation, scale);
    return PlacementResult::Accepted;
}

std::optional<glm::vec3> InteractionController::ResolveWorldPoint(const scene::Ray& ray) const
{
    const scene::SceneGraph& graph = m_host.Scene();
    const std::optional<scene::RaycastHit> hit = graph.Raycast(ray, {graph.Root()});
    if (hit.has_value())
    {
        return hit->point;
    }
    return m_terrain.RaycastSurface(ray);
}

std::optional<terrain::GridCell> InteractionController::UpdateHighlight(
    const scene::Ray& ray,
    const std::optional<std::string>& excludeId)
{
    const std::optional<glm::vec3> point = ResolveWorldPoint(ray);
    std::optional<terrain::GridCell> cell;
    if (point.has_value())
    {
        cell = m_terrain.CalculateGridPosition(point->x, point->z);
    }
    if (!cell.has_value())
    {
        ClearHighlight();
        return std::nullopt;
    }

    if (m_highlightedCell.has_value() && m_highlightedCell->SameCell(*cell))
    {
        return cell;
    }
    m_highlightedCell = cell;

    const float surfaceY = m_terrain.SurfaceHeightAt(cell->centerX, cell->centerZ).value_or(point->y);
    core::HighlightEvent highlight;
    highlight.center = glm::vec3{cell->centerX, surfaceY + kHighlightLift, cell->centerZ};
    highlight.sizeX = cell->stepX;
    highlight.sizeZ = cell->stepZ;
    highlight.occupied = IsOccupied(*cell, excludeId);
    m_bus.Emit(core::topics::kGridHighlight, highlight);
    return cell;
}

void InteractionController::ClearHighlight()
{
    if (!m_highlightedCell.has_value())
    {
        return;
    }
    m_highlightedCell.reset();
    m_bus.Emit(core::topics::kGridClearHighlight);
}

bool InteractionController::IsOccupied(const terrain::GridCell& cell, const std::optional<std::string>& excludeId) const
{
    const auto occupies = [&](const std::string& id, float x, float z) {
        if (excludeId.has_value() && *excludeId == id)
        {
            return false;
        }
        const std::optional<terrain::GridCell> other = m_terrain.CalculateGridPosition(x, z);
        return other.has_value() && other->SameCell(cell);
    };

    for (const core::AssetRecord& record : m_records)
    {
        if (occupies(record.id, record.position.x, record.position.z))
        {
            return true;
        }
    }
    for (const auto& [id, occupant] : m_pending)
    {
        if (occupies(id, occupant.x, occupant.z))
        {
            return true;
        }
    }
    return false;
}

const core::AssetRecord* InteractionController::FindRecord(const std::string& assetId) const
{
    for (const core::AssetRecord& record : m_records)
    {
        if (record.id == assetId)
        {
            return &record;
        }
    }
    return nullptr;
}

scene::NodeTransform InteractionController::CurrentTransform(const std::string& assetId) const
{
    const scene::NodeHandle node = m_reconciler.NodeFor(assetId);
    if (node != scene::kInvalidNode)
    {
        return m_host.Scene().Transform(node);
    }
    scene::NodeTransform transform;
    if (const core::AssetRecord* record = FindRecord(assetId))
    {
        transform.position = record->position;
        transform.rotation = record->rotation;
        transform.scale = record->scale;
    }
    return transform;
}

void InteractionController::EmitCommittedUpdate(const std::string& assetId, const scene::NodeTransform& transform)
{
    core::MutationEvent event;
    event.kind = core::MutationKind::Updated;
    event.id = assetId;
    if (const core::AssetRecord* record = FindRecord(assetId))
    {
        event.modelUrl = record->modelUrl;
        event.name = record->name;
    }
    event.position = transform.position;
    event.rotation = transform.rotation;
    event.scale = transform.scale;
    m_bus.Emit(core::topics::kAssetUpdated, event);

    const auto pending = m_pending.find(assetId);
    if (pending != m_pending.end())
    {
        pending->second.x = transform.position.x;
        pending->second.z = transform.position.z;
    }
}

void InteractionController::EmitAdded(const std::string& assetId, const std::string& url, const std::string& name,
    const glm::vec3& position, const glm::vec3& rotation, const glm::vec3& scale)
{
    m_pending[assetId] = Occupant{assetId, position.x, position.z};

    core::MutationEvent event;
    event.kind = core::MutationKind::Added;
    event.id = assetId;
    event.modelUrl = url;
    event.name = name;
    event.position = position;
    event.rotation = rotation;
    event.scale = scale;
    m_bus.Emit(core::topics::kAssetAdded, event);
}

void InteractionController::OnMoveStarted(const core::Payload& payload)
{
    const core::MoveEvent* event = core::PayloadAs<core::MoveEvent>(payload);
    if (event == nullptr || event->source != core::MoveSource::Gizmo)
    {
        return;
    }
    const scene::NodeHandle node = m_reconciler.NodeFor(event->assetId);
    if (node != scene::kInvalidNode)
    {
        m_gizmoStart = m_host.Scene().Transform(node);
    }
}

void InteractionController::OnMoveFinished(const core::Payload& payload)
{
    const core::MoveEvent* event = core::PayloadAs<core::MoveEvent>(payload);
    if (event == nullptr || event->source != core::MoveSource::Gizmo)
    {
        return;
    }
    const std::optional<scene::NodeTransform> start = std::exchange(m_gizmoStart, std::nullopt);
    if (m_deletingId == event->assetId || !m_reconciler.Contains(event->assetId))
    {
        return;
    }

    scene::NodeTransform candidate = CurrentTransform(event->assetId);
    const std::optional<terrain::GridCell> cell = m_terrain.CalculateGridPosition(candidate.position.x, candidate.position.z);
    if (!cell.has_value() || IsOccupied(*cell, event->assetId))
    {
        if (start.has_value())
        {
            std::cout << "[InteractionController] Gizmo move of " << event->assetId << " rejected, restoring\n";
            EmitCommittedUpdate(event->assetId, *start);
        }
        return;
    }

    candidate.position.x = cell->centerX;
    candidate.position.z = cell->centerZ;
    if (const std::optional<float> snappedY = m_reconciler.ComputeSnappedY(event->assetId, candidate))
    {
        candidate.position.y = *snappedY;
    }
    EmitCommittedUpdate(event->assetId, candidate);
}

void InteractionController::OnDeleted(const core::Payload& payload)
{
    const core::MutationEvent* event = core::PayloadAs<core::MutationEvent>(payload);
    if (event == nullptr)
    {
        return;
    }
    m_pending.erase(event->id);
    if (m_selectedId == event->id)
    {
        if (m_mode == InteractionMode::PickedUp)
        {
            ClearHighlight();
        }
        m_deletingId = event->id;
        ResetSelection(true);
        m_deletingId.reset();
    }
}
} // namespace placer::editor
