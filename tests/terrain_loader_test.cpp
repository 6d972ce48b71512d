#include <gtest/gtest.h>

#include <string>

#include "TestSupport.hpp"
#include "placer/terrain/TerrainLoader.hpp"

using placer::core::ErrorKind;
using placer::core::GridToggleEvent;
using placer::core::TerrainEvent;
using placer::terrain::TerrainState;
using placer::test::DownRay;
using placer::test::EditorSession;
using placer::test::EventRecorder;
using placer::test::MakeSlabModel;

namespace topics = placer::core::topics;

namespace
{
const std::string kCryptUrl = "terrain/crypt.glb";
} // namespace

TEST(TerrainLoaderTest, EmptyUrlUsesFlatFallbackExtent)
{
    EditorSession session;
    const auto& terrain = *session.terrain;

    EXPECT_EQ(terrain.State(), TerrainState::Idle);
    EXPECT_FALSE(terrain.HasTerrainMesh());
    EXPECT_EQ(terrain.Grid().width, 10);
    EXPECT_EQ(terrain.Grid().height, 10);
    EXPECT_FLOAT_EQ(terrain.Bounds().min.x, -10.0F);
    EXPECT_FLOAT_EQ(terrain.Bounds().max.z, 10.0F);
    EXPECT_NE(terrain.GridNode(), placer::scene::kInvalidNode);
    EXPECT_EQ(session.models.PendingCount(), 0U);
    EXPECT_TRUE(session.errors.empty());

    const auto height = terrain.SurfaceHeightAt(3.0F, -5.0F);
    ASSERT_TRUE(height.has_value());
    EXPECT_FLOAT_EQ(*height, 0.0F);
}

TEST(TerrainLoaderTest, LayoutExtentOverridesFallbackSize)
{
    EditorSession session;
    session.terrain->SetTerrain("hall", "", placer::terrain::TerrainMetadata{}, glm::vec2{40.0F, 12.0F});

    EXPECT_FLOAT_EQ(session.terrain->Bounds().Size().x, 40.0F);
    EXPECT_FLOAT_EQ(session.terrain->Bounds().Size().z, 12.0F);
    EXPECT_EQ(session.terrain->Grid().width, 40);
    EXPECT_EQ(session.terrain->Grid().height, 12);
}

TEST(TerrainLoaderTest, LoadedMeshDrivesGridAndSurfaceQueries)
{
    EditorSession session;
    EventRecorder recorder(session.bus, {topics::kTerrainLoaded, topics::kTerrainError});

    session.terrain->SetTerrain("crypt", kCryptUrl);
    EXPECT_EQ(session.terrain->State(), TerrainState::Loading);
    ASSERT_TRUE(session.models.Complete(kCryptUrl, MakeSlabModel(30.0F, 30.0F, 2.0F)));

    EXPECT_EQ(session.terrain->State(), TerrainState::Loaded);
    EXPECT_TRUE(session.terrain->HasTerrainMesh());
    EXPECT_EQ(session.terrain->Grid().width, 15);
    ASSERT_EQ(recorder.Count(topics::kTerrainLoaded), 1U);
    const TerrainEvent* loaded = recorder.Last<TerrainEvent>(topics::kTerrainLoaded);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->terrainId, "crypt");
    EXPECT_FLOAT_EQ(loaded->size.x, 30.0F);
    EXPECT_EQ(recorder.Count(topics::kTerrainError), 0U);

    const auto height = session.terrain->SurfaceHeightAt(1.3F, -2.7F);
    ASSERT_TRUE(height.has_value());
    EXPECT_FLOAT_EQ(*height, 2.0F);

    const auto onMesh = session.terrain->RaycastSurface(DownRay(4.3F, 4.6F));
    ASSERT_TRUE(onMesh.has_value());
    EXPECT_FLOAT_EQ(onMesh->y, 2.0F);

    // Off the mesh the ground plane still answers.
    const auto offMesh = session.terrain->RaycastSurface(DownRay(40.0F, 40.0F));
    ASSERT_TRUE(offMesh.has_value());
    EXPECT_FLOAT_EQ(offMesh->y, 0.0F);
    EXPECT_FALSE(session.terrain->SurfaceHeightAt(40.0F, 40.0F).has_value());
}

TEST(TerrainLoaderTest, FailedLoadReportsAndEmitsError)
{
    EditorSession session;
    EventRecorder recorder(session.bus, {topics::kTerrainError});

    session.terrain->SetTerrain("crypt", kCryptUrl);
    ASSERT_TRUE(session.models.Fail(kCryptUrl, "file not found"));

    EXPECT_EQ(session.terrain->State(), TerrainState::Failed);
    EXPECT_FALSE(session.terrain->HasTerrainMesh());
    ASSERT_EQ(session.errors.size(), 1U);
    EXPECT_EQ(session.errors[0].kind, ErrorKind::LoadFailure);
    EXPECT_EQ(session.errors[0].message, "Failed to load dungeon: crypt. Details: file not found");
    ASSERT_EQ(recorder.Count(topics::kTerrainError), 1U);
    EXPECT_EQ(recorder.Last<TerrainEvent>(topics::kTerrainError)->error, session.errors[0].message);
}

TEST(TerrainLoaderTest, CancelIsReportedAsCancellationAndLateResultIsDropped)
{
    EditorSession session;
    session.terrain->SetTerrain("crypt", kCryptUrl);
    session.terrain->CancelLoad();

    EXPECT_EQ(session.terrain->State(), TerrainState::Failed);
    ASSERT_EQ(session.errors.size(), 1U);
    EXPECT_EQ(session.errors[0].kind, ErrorKind::CancellationFailure);

    session.models.Complete(kCryptUrl, MakeSlabModel(30.0F, 30.0F, 2.0F));
    EXPECT_FALSE(session.terrain->HasTerrainMesh());
    EXPECT_EQ(session.errors.size(), 1U);

    // Nothing in flight: cancelling again does nothing.
    session.terrain->CancelLoad();
    EXPECT_EQ(session.errors.size(), 1U);
}

TEST(TerrainLoaderTest, SwitchingTerrainDropsStaleCompletion)
{
    EditorSession session;
    session.terrain->SetTerrain("crypt", kCryptUrl);
    session.terrain->SetTerrain("catacombs", "terrain/catacombs.glb");

    session.models.Complete(kCryptUrl, MakeSlabModel(30.0F, 30.0F, 2.0F));
    EXPECT_EQ(session.terrain->State(), TerrainState::Loading);
    EXPECT_FALSE(session.terrain->HasTerrainMesh());

    session.models.Complete("terrain/catacombs.glb", MakeSlabModel(50.0F, 10.0F, 0.5F));
    EXPECT_EQ(session.terrain->State(), TerrainState::Loaded);
    EXPECT_EQ(session.terrain->TerrainId(), "catacombs");
    EXPECT_FLOAT_EQ(session.terrain->Bounds().Size().x, 50.0F);
}

TEST(TerrainLoaderTest, GridToggleFlipsOrForcesVisibility)
{
    EditorSession session;
    const auto gridNode = session.terrain->GridNode();
    ASSERT_TRUE(session.terrain->IsGridVisible());

    session.bus.Emit(topics::kGridToggle, GridToggleEvent{});
    EXPECT_FALSE(session.terrain->IsGridVisible());
    EXPECT_FALSE(session.host->Scene().Find(gridNode)->visible);

    session.bus.Emit(topics::kGridToggle, GridToggleEvent{false});
    EXPECT_FALSE(session.terrain->IsGridVisible());

    session.bus.Emit(topics::kGridToggle);
    EXPECT_TRUE(session.terrain->IsGridVisible());
    EXPECT_TRUE(session.host->Scene().Find(gridNode)->visible);
}

TEST(TerrainLoaderTest, GridIsNotPickable)
{
    EditorSession session;
    EXPECT_FALSE(session.host->Scene().Raycast(DownRay(1.3F, 2.2F), {session.host->Scene().Root()}).has_value());
}

TEST(TerrainLoaderTest, TerrainSelectedEventStartsLoad)
{
    EditorSession session;
    TerrainEvent selected;
    selected.terrainId = "crypt";
    selected.url = kCryptUrl;
    session.bus.Emit(topics::kTerrainSelected, selected);

    EXPECT_EQ(session.terrain->State(), TerrainState::Loading);
    EXPECT_EQ(session.terrain->TerrainId(), "crypt");
    EXPECT_EQ(session.models.RequestCount(kCryptUrl), 1U);
}

TEST(TerrainLoaderTest, UnloadRemovesTerrainAndGrid)
{
    EditorSession session;
    session.terrain->SetTerrain("crypt", kCryptUrl);
    session.models.Complete(kCryptUrl, MakeSlabModel(30.0F, 30.0F, 2.0F));
    const std::size_t geometries = session.host->Scene().LiveGeometryCount();
    ASSERT_GT(geometries, 0U);

    session.terrain->Unload();
    EXPECT_FALSE(session.terrain->HasTerrainMesh());
    EXPECT_EQ(session.terrain->GridNode(), placer::scene::kInvalidNode);
    EXPECT_FALSE(session.terrain->Grid().IsValid());
    EXPECT_EQ(session.host->Scene().LiveGeometryCount(), 0U);
}
