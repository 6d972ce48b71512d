#include "placer/terrain/GridMapping.hpp"

#include <algorithm>
#include <cmath>

namespace placer::terrain
{
GridSpec MakeGridSpec(const scene::Aabb& bounds, const TerrainMetadata& metadata)
{
    GridSpec grid;
    if (!bounds.IsValid())
    {
        return grid;
    }

    const glm::vec3 size = bounds.Size();
    grid.min = glm::vec2{bounds.min.x, bounds.min.z};
    grid.size = glm::vec2{size.x, size.z};

    if (metadata.gridWidth.has_value() && metadata.gridHeight.has_value() && *metadata.gridWidth > 0 && *metadata.gridHeight > 0)
    {
        grid.width = *metadata.gridWidth;
        grid.height = *metadata.gridHeight;
        return grid;
    }

    const float cellSize = metadata.gridScale > 0.0F ? metadata.gridScale : 1.0F;
    grid.width = std::max(kMinimumGridDivisions, static_cast<int>(std::round(size.x / cellSize)));
    grid.height = std::max(kMinimumGridDivisions, static_cast<int>(std::round(size.z / cellSize)));
    return grid;
}

std::optional<GridCell> CalculateGridPosition(const GridSpec& grid, float worldX, float worldZ)
{
    if (!grid.IsValid() || !std::isfinite(worldX) || !std::isfinite(worldZ))
    {
        return std::nullopt;
    }

    const float stepX = grid.StepX();
    const float stepZ = grid.StepZ();
    const int gridX = static_cast<int>(std::floor((worldX - grid.min.x) / stepX));
    const int gridZ = static_cast<int>(std::floor((worldZ - grid.min.y) / stepZ));
    if (gridX < 0 || gridX >= grid.width || gridZ < 0 || gridZ >= grid.height)
    {
        return std::nullopt;
    }

    GridCell cell;
    cell.gridX = gridX;
    cell.gridZ = gridZ;
    cell.centerX = grid.min.x + (static_cast<float>(gridX) + 0.5F) * stepX;
    cell.centerZ = grid.min.y + (static_cast<float>(gridZ) + 0.5F) * stepZ;
    cell.stepX = stepX;
    cell.stepZ = stepZ;
    return cell;
}
} // namespace placer::terrain
