#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "placer/sync/JsonLayoutStore.hpp"

namespace fs = std::filesystem;
using placer::core::AssetRecord;
using placer::sync::JsonLayoutStore;
using placer::test::MakeRecord;

namespace
{
struct Outcome
{
    bool called = false;
    bool ok = false;
    std::string error;

    placer::sync::Completion Capture()
    {
        return [this](bool success, const std::string& message) {
            called = true;
            ok = success;
            error = message;
        };
    }
};

fs::path FreshDirectory(const std::string& name)
{
    const fs::path dir = fs::temp_directory_path() / "placer_layout_test" / name;
    fs::remove_all(dir);
    return dir;
}
} // namespace

TEST(JsonLayoutStoreTest, MissingLayoutIsEmpty)
{
    JsonLayoutStore store(FreshDirectory("missing"));
    std::vector<AssetRecord> records{MakeRecord("stale", glm::vec3{0.0F})};
    std::string error;

    ASSERT_TRUE(store.Load("crypt", &records, &error)) << error;
    EXPECT_TRUE(records.empty());
}

TEST(JsonLayoutStoreTest, PlaceMoveDeleteRoundTripThroughFile)
{
    JsonLayoutStore store(FreshDirectory("crud"));

    Outcome placed;
    store.PlaceAsset(MakeRecord("crate-1", glm::vec3{3.0F, 0.0F, -5.0F}), "crypt", placed.Capture());
    ASSERT_TRUE(placed.called);
    ASSERT_TRUE(placed.ok) << placed.error;
    EXPECT_TRUE(fs::exists(store.PathFor("crypt")));

    Outcome moved;
    store.MoveAsset("crate-1", glm::vec3{-7.0F, 0.5F, 7.0F}, std::nullopt, glm::vec3{2.0F}, "crypt", moved.Capture());
    ASSERT_TRUE(moved.ok) << moved.error;

    std::vector<AssetRecord> records;
    ASSERT_TRUE(store.Load("crypt", &records));
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].modelUrl, "models/crate-1.glb");
    EXPECT_FLOAT_EQ(records[0].position.x, -7.0F);
    EXPECT_FLOAT_EQ(records[0].rotation.y, 0.0F);
    EXPECT_FLOAT_EQ(records[0].scale.z, 2.0F);

    Outcome deleted;
    store.DeleteAsset("crate-1", "crypt", deleted.Capture());
    ASSERT_TRUE(deleted.ok) << deleted.error;
    ASSERT_TRUE(store.Load("crypt", &records));
    EXPECT_TRUE(records.empty());
}

TEST(JsonLayoutStoreTest, PlacingExistingIdReplacesIt)
{
    JsonLayoutStore store(FreshDirectory("replace-id"));
    store.PlaceAsset(MakeRecord("crate-1", glm::vec3{3.0F, 0.0F, -5.0F}), "crypt", {});
    store.PlaceAsset(MakeRecord("crate-1", glm::vec3{1.0F, 0.0F, 1.0F}), "crypt", {});

    std::vector<AssetRecord> records;
    ASSERT_TRUE(store.Load("crypt", &records));
    ASSERT_EQ(records.size(), 1U);
    EXPECT_FLOAT_EQ(records[0].position.x, 1.0F);
}

TEST(JsonLayoutStoreTest, UnknownIdsFail)
{
    JsonLayoutStore store(FreshDirectory("unknown"));
    Outcome moved;
    store.MoveAsset("ghost", glm::vec3{0.0F}, std::nullopt, std::nullopt, "crypt", moved.Capture());
    EXPECT_TRUE(moved.called);
    EXPECT_FALSE(moved.ok);
    EXPECT_EQ(moved.error, "Asset not found in layout: ghost");

    Outcome deleted;
    store.DeleteAsset("ghost", "crypt", deleted.Capture());
    EXPECT_FALSE(deleted.ok);
}

TEST(JsonLayoutStoreTest, ReplaceLayoutOverwritesEverything)
{
    JsonLayoutStore store(FreshDirectory("bulk"));
    store.PlaceAsset(MakeRecord("a", glm::vec3{1.0F}), "crypt", {});
    store.PlaceAsset(MakeRecord("b", glm::vec3{2.0F}), "crypt", {});

    Outcome cleared;
    store.ReplaceLayout("crypt", {}, cleared.Capture());
    ASSERT_TRUE(cleared.ok);

    std::vector<AssetRecord> records;
    ASSERT_TRUE(store.Load("crypt", &records));
    EXPECT_TRUE(records.empty());
}

TEST(JsonLayoutStoreTest, LayoutsAreKeptPerTerrain)
{
    JsonLayoutStore store(FreshDirectory("per-terrain"));
    store.PlaceAsset(MakeRecord("a", glm::vec3{1.0F}), "crypt", {});
    store.PlaceAsset(MakeRecord("b", glm::vec3{2.0F}), "catacombs", {});

    std::vector<AssetRecord> crypt;
    std::vector<AssetRecord> catacombs;
    ASSERT_TRUE(store.Load("crypt", &crypt));
    ASSERT_TRUE(store.Load("catacombs", &catacombs));
    ASSERT_EQ(crypt.size(), 1U);
    ASSERT_EQ(catacombs.size(), 1U);
    EXPECT_EQ(crypt[0].id, "a");
    EXPECT_EQ(catacombs[0].id, "b");
}

TEST(JsonLayoutStoreTest, RejectsTerrainIdsThatEscapeTheDirectory)
{
    JsonLayoutStore store(FreshDirectory("unsafe"));
    std::vector<AssetRecord> records;
    std::string error;
    EXPECT_FALSE(store.Load("../etc", &records, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(store.Load("..", &records));
    EXPECT_FALSE(store.Load("", &records));

    Outcome placed;
    store.PlaceAsset(MakeRecord("a", glm::vec3{0.0F}), "a/b", placed.Capture());
    EXPECT_FALSE(placed.ok);
}

TEST(JsonLayoutStoreTest, SkipsMalformedRecordsAndRejectsMalformedDocuments)
{
    const fs::path dir = FreshDirectory("malformed");
    fs::create_directories(dir);
    JsonLayoutStore store(dir);
    {
        std::ofstream stream(store.PathFor("crypt"));
        stream << R"({"placedAssets": [{"id": "good"}, {"name": "no id"}, {"id": "bad", "position": {"x": "left"}}]})";
    }
    std::vector<AssetRecord> records;
    ASSERT_TRUE(store.Load("crypt", &records));
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].id, "good");

    {
        std::ofstream stream(store.PathFor("broken"));
        stream << R"({"assets": []})";
    }
    std::string error;
    EXPECT_FALSE(store.Load("broken", &records, &error));
    EXPECT_FALSE(error.empty());
}
