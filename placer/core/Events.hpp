#pragma once

#include <optional>
#include <string>
#include <variant>

#include <glm/vec3.hpp>

namespace placer::core
{
namespace topics
{
inline constexpr const char* kTerrainSelected = "terrain:selected";
inline constexpr const char* kTerrainLoaded = "terrain:loaded";
inline constexpr const char* kTerrainError = "terrain:error";

inline constexpr const char* kAssetAdded = "asset:added";
inline constexpr const char* kAssetVisualSync = "asset:visualSync";
inline constexpr const char* kAssetUpdated = "asset:updated";
inline constexpr const char* kAssetDeleted = "asset:deleted";
inline constexpr const char* kAssetSelected = "asset:selected";
inline constexpr const char* kAssetMoveStarted = "asset:moveStarted";
inline constexpr const char* kAssetMoveFinished = "asset:moveFinished";

inline constexpr const char* kGridToggle = "grid:toggle";
inline constexpr const char* kGridHighlight = "grid:highlight";
inline constexpr const char* kGridClearHighlight = "grid:clearHighlight";
} // namespace topics

struct TerrainEvent
{
    std::string terrainId;
    std::string url;
    glm::vec3 size{0.0F};
    glm::vec3 center{0.0F};
    std::string error;
};

enum class MutationKind
{
    Added,
    VisualSync,
    Updated,
    Deleted
};

struct MutationEvent
{
    MutationKind kind = MutationKind::Added;
    std::string id;
    std::optional<std::string> modelUrl;
    std::optional<std::string> name;
    std::optional<glm::vec3> position;
    // False when only X/Z of position are meaningful; the receiver keeps its current Y.
    bool positionHasY = true;
    std::optional<glm::vec3> rotation;
    std::optional<glm::vec3> scale;
    // Set for ticks produced while the gizmo drags a node that is already mutated.
    bool fromGizmo = false;
};

struct SelectionEvent
{
    std::optional<std::string> assetId;
};

enum class MoveSource
{
    Gizmo,
    PickUp
};

struct MoveEvent
{
    std::string assetId;
    MoveSource source = MoveSource::PickUp;
};

struct HighlightEvent
{
    glm::vec3 center{0.0F};
    float sizeX = 1.0F;
    float sizeZ = 1.0F;
    bool occupied = false;
};

struct GridToggleEvent
{
    std::optional<bool> visible;
};

using Payload = std::variant<
    std::monostate,
    TerrainEvent,
    MutationEvent,
    SelectionEvent,
    MoveEvent,
    HighlightEvent,
    GridToggleEvent>;
} // namespace placer::core
