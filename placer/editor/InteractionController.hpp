#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "placer/core/AssetRecord.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/scene/Math.hpp"
#include "placer/scene/SceneGraph.hpp"
#include "placer/terrain/GridMapping.hpp"

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
class AssetReconciler;

enum class InteractionMode
{
    Idle,
    Selected,
    PickedUp
};

enum class PlacementResult
{
    Accepted,
    RejectedOccupied,
    RejectedOutOfBounds,
    RejectedInvalid
};

const char* InteractionModeName(InteractionMode mode);
const char* PlacementResultName(PlacementResult result);

// What the palette hands over when a model is dragged into the viewport.
struct DragPayload
{
    std::string id;
    std::string url;
    std::string name;
    std::optional<glm::vec3> rotation;
};

bool ParseDragPayload(const std::string& text, DragPayload* outPayload, std::string* outError = nullptr);

// Model used by click-to-place while no asset is hit.
struct PlacementTemplate
{
    std::string modelId;
    std::string url;
    std::string name;
    glm::vec3 rotation{0.0F};
    std::optional<glm::vec3> scale;
};

// Pointer, drag-and-drop and pick-up state machine. Requests every change through mutation events;
// the scene graph is only read for raycasts.
class InteractionController
{
public:
    using Clock = std::function<std::int64_t()>;

    static constexpr float kHighlightLift = 0.01F;
    static constexpr float kDropScaleFactor = 0.9F;

    InteractionController(
        core::EventBus& bus,
        scene::SceneHost& host,
        const terrain::TerrainLoader& terrain,
        const AssetReconciler& reconciler,
        const core::SessionCallbacks& callbacks);
    ~InteractionController();

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    // Milliseconds used to mint placement ids.
    void SetClock(Clock clock) { m_clock = std::move(clock); }

    // Latest declarative record list, used for occupancy and to complete update events.
    void SetPlacedAssets(const std::vector<core::AssetRecord>& records);
    void SetPlacementTemplate(std::optional<PlacementTemplate> placement);

    // Pointer overloads take viewport pixels; ray overloads are what they resolve to.
    void Click(const glm::vec2& pointer);
    void Click(const scene::Ray& ray);
    void PointerMove(const glm::vec2& pointer);
    void PointerMove(const scene::Ray& ray);

    // Highlights the hovered cell and answers whether a drop there would be accepted.
    bool DragOver(const glm::vec2& pointer);
    bool DragOver(const scene::Ray& ray);
    PlacementResult Drop(const glm::vec2& pointer, const DragPayload& payload);
    PlacementResult Drop(const scene::Ray& ray, const DragPayload& payload);
    void DragLeave();

    [[nodiscard]] bool CanDrop(const terrain::GridCell& cell) const;

    bool PickUpSelected();
    // Back to Idle without any event. The caller owns clearing whatever feedback it shows.
    void CancelMove();
    bool RotateSelected(float yawRadians);
    bool ResizeSelected(float uniformScale);
    bool DeleteSelected();
    void Deselect();

    [[nodiscard]] InteractionMode Mode() const { return m_mode; }
    [[nodiscard]] const std::optional<std::string>& SelectedId() const { return m_selectedId; }
    [[nodiscard]] const std::optional<terrain::GridCell>& HighlightedCell() const { return m_highlightedCell; }
    [[nodiscard]] const std::optional<PlacementTemplate>& Template() const { return m_template; }
    [[nodiscard]] std::size_t PendingPlacementCount() const { return m_pending.size(); }

private:
    struct Occupant
    {
        std::string id;
        float x = 0.0F;
        float z = 0.0F;
    };

    void Select(const std::string& assetId);
    void ResetSelection(bool notify);
    PlacementResult CommitMove(const scene::Ray& ray);
    PlacementResult PlaceFromTemplate(const scene::Ray& ray);

    // Point the pointer is over: first scene hit, then terrain or ground plane.
    std::optional<glm::vec3> ResolveWorldPoint(const scene::Ray& ray) const;
    std::optional<terrain::GridCell> UpdateHighlight(const scene::Ray& ray, const std::optional<std::string>& excludeId);
    void ClearHighlight();

    [[nodiscard]] bool IsOccupied(const terrain::GridCell& cell, const std::optional<std::string>& excludeId) const;
    [[nodiscard]] const core::AssetRecord* FindRecord(const std::string& assetId) const;
    [[nodiscard]] scene::NodeTransform CurrentTransform(const std::string& assetId) const;
    void EmitCommittedUpdate(const std::string& assetId, const scene::NodeTransform& transform);
    void EmitAdded(const std::string& assetId, const std::string& url, const std::string& name,
        const glm::vec3& position, const glm::vec3& rotation, const glm::vec3& scale);

    void OnMoveStarted(const core::Payload& payload);
    void OnMoveFinished(const core::Payload& payload);
    void OnDeleted(const core::Payload& payload);

    core::EventBus& m_bus;
    scene::SceneHost& m_host;
    const terrain::TerrainLoader& m_terrain;
    const AssetReconciler& m_reconciler;
    const core::SessionCallbacks& m_callbacks;
    Clock m_clock;

    InteractionMode m_mode = InteractionMode::Idle;
    std::optional<std::string> m_selectedId;
    std::optional<terrain::GridCell> m_highlightedCell;
    std::optional<PlacementTemplate> m_template;

    std::vector<core::AssetRecord> m_records;
    // Local placements not yet reflected in the record list.
    std::unordered_map<std::string, Occupant> m_pending;
    std::optional<scene::NodeTransform> m_gizmoStart;
    // Set while asset:deleted is being handled; a gizmo drag ended by that delete commits nothing.
    std::optional<std::string> m_deletingId;
    std::uint64_t m_placementCounter = 0;

    core::EventBus::HandlerPtr m_moveStartedHandler;
    core::EventBus::HandlerPtr m_moveFinishedHandler;
    core::EventBus::HandlerPtr m_deletedHandler;
};
} // namespace placer::editor
