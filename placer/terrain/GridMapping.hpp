#pragma once

#include <optional>

#include <glm/vec2.hpp>

#include "placer/scene/Math.hpp"

namespace placer::terrain
{
// Grid hints stored with a terrain. Explicit dimensions win over the cell scale.
struct TerrainMetadata
{
    std::optional<int> gridWidth;
    std::optional<int> gridHeight;
    float gridScale = 1.0F;
};

struct GridSpec
{
    glm::vec2 min{0.0F};   // world X/Z of the extent's minimum corner
    glm::vec2 size{0.0F};  // world X/Z extent
    int width = 0;
    int height = 0;

    [[nodiscard]] bool IsValid() const { return width > 0 && height > 0 && size.x > 0.0F && size.y > 0.0F; }
    [[nodiscard]] float StepX() const { return size.x / static_cast<float>(width); }
    [[nodiscard]] float StepZ() const { return size.y / static_cast<float>(height); }
};

struct GridCell
{
    int gridX = 0;
    int gridZ = 0;
    float centerX = 0.0F;
    float centerZ = 0.0F;
    float stepX = 0.0F;
    float stepZ = 0.0F;

    [[nodiscard]] bool SameCell(const GridCell& other) const { return gridX == other.gridX && gridZ == other.gridZ; }
};

inline constexpr int kMinimumGridDivisions = 10;

GridSpec MakeGridSpec(const scene::Aabb& bounds, const TerrainMetadata& metadata);

// Cell containing the world point, or nullopt outside the extent.
std::optional<GridCell> CalculateGridPosition(const GridSpec& grid, float worldX, float worldZ);
} // namespace placer::terrain
