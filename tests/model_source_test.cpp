#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "placer/assets/FileModelSource.hpp"
#include "placer/assets/ModelSource.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/JobSystem.hpp"
#include "placer/core/MainThreadQueue.hpp"

namespace fs = std::filesystem;
using placer::assets::FileModelSource;
using placer::assets::ModelLoadResult;
using placer::core::CancellationToken;
using placer::core::JobSystem;
using placer::core::MainThreadQueue;

namespace
{
// One triangle: (0,0,0) (1,0,0) (0,1,0), positions in an embedded buffer.
constexpr const char* kTriangleGltf = R"({
  "asset": {"version": "2.0"},
  "scene": 0,
  "scenes": [{"nodes": [0]}],
  "nodes": [{"mesh": 0, "translation": [0.0, 2.0, 0.0]}],
  "meshes": [{"primitives": [{"attributes": {"POSITION": 0}}]}],
  "buffers": [{"byteLength": 36, "uri": "data:application/octet-stream;base64,AAAAAAAAAAAAAAAAAACAPwAAAAAAAAAAAAAAAAAAgD8AAAAA"}],
  "bufferViews": [{"buffer": 0, "byteOffset": 0, "byteLength": 36}],
  "accessors": [{"bufferView": 0, "componentType": 5126, "count": 3, "type": "VEC3", "min": [0, 0, 0], "max": [1, 1, 0]}]
})";

struct ModelSourceFixture
{
    explicit ModelSourceFixture(const std::string& name)
        : root(fs::temp_directory_path() / "placer_model_test" / name)
    {
        fs::remove_all(root);
        fs::create_directories(root / "models");
        jobs.Initialize(2);
        source = std::make_unique<FileModelSource>(jobs, mainThread, root);
    }

    ~ModelSourceFixture()
    {
        source.reset();
        jobs.Shutdown();
    }

    void WriteTriangle(const std::string& relative)
    {
        std::ofstream stream(root / relative);
        stream << kTriangleGltf;
    }

    // Lets workers finish, then runs their posted completions.
    void Settle()
    {
        jobs.WaitForAll();
        mainThread.Drain();
    }

    fs::path root;
    JobSystem jobs;
    MainThreadQueue mainThread;
    std::unique_ptr<FileModelSource> source;
};
} // namespace

TEST(ModelUrlTest, ResolvesRelativeUrlsAgainstBase)
{
    EXPECT_TRUE(placer::assets::IsAbsoluteUrl("https://cdn.example.com/a.glb"));
    EXPECT_TRUE(placer::assets::IsAbsoluteUrl("http://host/a.glb"));
    EXPECT_FALSE(placer::assets::IsAbsoluteUrl("models/a.glb"));

    EXPECT_EQ(placer::assets::ResolveModelUrl("/models/a.glb", "assets"), "assets/models/a.glb");
    EXPECT_EQ(placer::assets::ResolveModelUrl("models/a.glb", "assets/"), "assets/models/a.glb");
    EXPECT_EQ(placer::assets::ResolveModelUrl("models/a.glb", ""), "models/a.glb");
    EXPECT_EQ(placer::assets::ResolveModelUrl("https://cdn/a.glb", "assets"), "https://cdn/a.glb");
}

TEST(FileModelSourceTest, LoadsGltfAndDeliversOnDrain)
{
    ModelSourceFixture fixture("load");
    fixture.WriteTriangle("models/tri.gltf");

    std::optional<ModelLoadResult> result;
    fixture.source->Load("/models/tri.gltf", [&](const ModelLoadResult& r) { result = r; }, CancellationToken{});
    EXPECT_FALSE(result.has_value());

    fixture.jobs.WaitForAll();
    EXPECT_FALSE(result.has_value());
    fixture.mainThread.Drain();

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->Succeeded()) << result->error;
    EXPECT_EQ(result->url, "/models/tri.gltf");
    ASSERT_EQ(result->model->parts.size(), 1U);
    EXPECT_EQ(result->model->parts[0].geometry.positions.size(), 3U);
    EXPECT_FLOAT_EQ(result->model->bounds.min.y, 2.0F);
    EXPECT_FLOAT_EQ(result->model->bounds.max.y, 3.0F);
    EXPECT_EQ(fixture.source->CachedCount(), 1U);
}

TEST(FileModelSourceTest, SecondRequestIsServedFromCache)
{
    ModelSourceFixture fixture("cache");
    fixture.WriteTriangle("models/tri.gltf");

    int delivered = 0;
    fixture.source->Load("models/tri.gltf", [&](const ModelLoadResult&) { ++delivered; }, CancellationToken{});
    fixture.Settle();
    ASSERT_EQ(delivered, 1);

    fs::remove(fixture.root / "models/tri.gltf");
    std::optional<ModelLoadResult> cached;
    fixture.source->Load("models/tri.gltf", [&](const ModelLoadResult& r) { cached = r; }, CancellationToken{});
    EXPECT_FALSE(cached.has_value());
    fixture.Settle();
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->Succeeded());

    // Evicted entries go back to disk, where the file is gone.
    fixture.source->ClearCache();
    EXPECT_EQ(fixture.source->CachedCount(), 0U);
    std::optional<ModelLoadResult> reloaded;
    fixture.source->Load("models/tri.gltf", [&](const ModelLoadResult& r) { reloaded = r; }, CancellationToken{});
    fixture.Settle();
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_FALSE(reloaded->Succeeded());
}

TEST(FileModelSourceTest, MissingFileReportsErrorAfterDrain)
{
    ModelSourceFixture fixture("missing");

    std::optional<ModelLoadResult> result;
    fixture.source->Load("models/absent.glb", [&](const ModelLoadResult& r) { result = r; }, CancellationToken{});
    fixture.jobs.WaitForAll();
    EXPECT_FALSE(result.has_value());
    fixture.mainThread.Drain();

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->Succeeded());
    EXPECT_FALSE(result->error.empty());
    EXPECT_EQ(fixture.source->CachedCount(), 0U);
}

TEST(FileModelSourceTest, UnsupportedExtensionFails)
{
    ModelSourceFixture fixture("extension");
    {
        std::ofstream stream(fixture.root / "models/crate.obj");
        stream << "v 0 0 0\n";
    }

    std::optional<ModelLoadResult> result;
    fixture.source->Load("models/crate.obj", [&](const ModelLoadResult& r) { result = r; }, CancellationToken{});
    fixture.Settle();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->Succeeded());
    EXPECT_NE(result->error.find("not supported"), std::string::npos);
}

TEST(FileModelSourceTest, RemoteUrlsAreRejected)
{
    ModelSourceFixture fixture("remote");

    std::optional<ModelLoadResult> result;
    fixture.source->Load("https://cdn.example.com/crate.glb", [&](const ModelLoadResult& r) { result = r; }, CancellationToken{});
    EXPECT_FALSE(result.has_value());
    fixture.Settle();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->Succeeded());
    EXPECT_EQ(result->error, "Remote model URLs are not supported: https://cdn.example.com/crate.glb");
}

TEST(FileModelSourceTest, CancelledRequestGetsNoCallback)
{
    ModelSourceFixture fixture("cancel");
    fixture.WriteTriangle("models/tri.gltf");

    bool cancelledCalled = false;
    bool keptCalled = false;
    CancellationToken token;
    fixture.source->Load("models/tri.gltf", [&](const ModelLoadResult&) { cancelledCalled = true; }, token);
    fixture.source->Load("models/tri.gltf", [&](const ModelLoadResult&) { keptCalled = true; }, CancellationToken{});
    EXPECT_EQ(fixture.source->InFlightCount(), 1U);
    token.Cancel();

    fixture.Settle();
    EXPECT_FALSE(cancelledCalled);
    EXPECT_TRUE(keptCalled);
}

TEST(FileModelSourceTest, LoadsInlineWithoutWorkers)
{
    const fs::path root = fs::temp_directory_path() / "placer_model_test" / "inline";
    fs::remove_all(root);
    fs::create_directories(root / "models");
    {
        std::ofstream stream(root / "models/tri.gltf");
        stream << kTriangleGltf;
    }

    JobSystem jobs;
    MainThreadQueue mainThread;
    FileModelSource source(jobs, mainThread, root);

    std::optional<ModelLoadResult> result;
    source.Load("models/tri.gltf", [&](const ModelLoadResult& r) { result = r; }, CancellationToken{});
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(mainThread.PendingCount(), 1U);
    mainThread.Drain();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->Succeeded());
}
