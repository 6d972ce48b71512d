#include <gtest/gtest.h>

#include <limits>

#include "placer/terrain/GridMapping.hpp"

using placer::scene::Aabb;
using placer::terrain::CalculateGridPosition;
using placer::terrain::GridCell;
using placer::terrain::GridSpec;
using placer::terrain::MakeGridSpec;
using placer::terrain::TerrainMetadata;

namespace
{
Aabb Extent(float minX, float minZ, float maxX, float maxZ)
{
    Aabb bounds;
    bounds.Expand(glm::vec3{minX, 0.0F, minZ});
    bounds.Expand(glm::vec3{maxX, 1.0F, maxZ});
    return bounds;
}
} // namespace

TEST(GridMappingTest, CellScaleDerivesDivisions)
{
    TerrainMetadata metadata;
    metadata.gridScale = 2.0F;
    const GridSpec grid = MakeGridSpec(Extent(-10.0F, -10.0F, 10.0F, 10.0F), metadata);

    EXPECT_EQ(grid.width, 10);
    EXPECT_EQ(grid.height, 10);
    EXPECT_FLOAT_EQ(grid.StepX(), 2.0F);
    EXPECT_FLOAT_EQ(grid.StepZ(), 2.0F);
}

TEST(GridMappingTest, SmallExtentsKeepMinimumDivisions)
{
    TerrainMetadata metadata;
    metadata.gridScale = 4.0F;
    const GridSpec grid = MakeGridSpec(Extent(0.0F, 0.0F, 8.0F, 6.0F), metadata);

    EXPECT_EQ(grid.width, placer::terrain::kMinimumGridDivisions);
    EXPECT_EQ(grid.height, placer::terrain::kMinimumGridDivisions);
}

TEST(GridMappingTest, ExplicitDimensionsWinOverScale)
{
    TerrainMetadata metadata;
    metadata.gridScale = 1.0F;
    metadata.gridWidth = 4;
    metadata.gridHeight = 5;
    const GridSpec grid = MakeGridSpec(Extent(0.0F, 0.0F, 40.0F, 50.0F), metadata);

    EXPECT_EQ(grid.width, 4);
    EXPECT_EQ(grid.height, 5);
    EXPECT_FLOAT_EQ(grid.StepX(), 10.0F);
}

TEST(GridMappingTest, InvalidBoundsGiveInvalidGrid)
{
    const GridSpec grid = MakeGridSpec(Aabb{}, TerrainMetadata{});
    EXPECT_FALSE(grid.IsValid());
    EXPECT_FALSE(CalculateGridPosition(grid, 0.0F, 0.0F).has_value());
}

TEST(GridMappingTest, PointMapsToCellAndCenter)
{
    TerrainMetadata metadata;
    metadata.gridScale = 2.0F;
    const GridSpec grid = MakeGridSpec(Extent(-10.0F, -10.0F, 10.0F, 10.0F), metadata);

    const auto cell = CalculateGridPosition(grid, 3.1F, -4.9F);
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(cell->gridX, 6);
    EXPECT_EQ(cell->gridZ, 2);
    EXPECT_FLOAT_EQ(cell->centerX, 3.0F);
    EXPECT_FLOAT_EQ(cell->centerZ, -5.0F);
}

TEST(GridMappingTest, MinEdgeIsInsideMaxEdgeIsOutside)
{
    TerrainMetadata metadata;
    metadata.gridScale = 2.0F;
    const GridSpec grid = MakeGridSpec(Extent(-10.0F, -10.0F, 10.0F, 10.0F), metadata);

    const auto first = CalculateGridPosition(grid, -10.0F, -10.0F);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->gridX, 0);
    EXPECT_EQ(first->gridZ, 0);

    EXPECT_FALSE(CalculateGridPosition(grid, 10.0F, 0.0F).has_value());
    EXPECT_FALSE(CalculateGridPosition(grid, 0.0F, -10.5F).has_value());
    EXPECT_FALSE(CalculateGridPosition(grid, std::numeric_limits<float>::quiet_NaN(), 0.0F).has_value());
}

TEST(GridMappingTest, SameCellComparesIndicesOnly)
{
    GridCell a;
    a.gridX = 3;
    a.gridZ = 4;
    GridCell b = a;
    b.centerX = 99.0F;
    EXPECT_TRUE(a.SameCell(b));
    b.gridZ = 5;
    EXPECT_FALSE(a.SameCell(b));
}
