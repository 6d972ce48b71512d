#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <glm/vec3.hpp>

#include "placer/assets/ModelData.hpp"
#include "placer/assets/ModelSource.hpp"
#include "placer/core/AssetRecord.hpp"
#include "placer/core/Errors.hpp"
#include "placer/core/EventBus.hpp"
#include "placer/core/SessionConfig.hpp"
#include "placer/editor/AssetReconciler.hpp"
#include "placer/editor/GridHighlighter.hpp"
#include "placer/editor/InteractionController.hpp"
#include "placer/render/RenderSurface.hpp"
#include "placer/scene/SceneHost.hpp"
#include "placer/sync/LayoutBackend.hpp"
#include "placer/terrain/TerrainLoader.hpp"

namespace placer::test
{
class FakeRenderSurface final : public render::IRenderSurface
{
public:
    struct Counters
    {
        int initialized = 0;
        int rendered = 0;
        int shutdown = 0;
    };

    explicit FakeRenderSurface(std::shared_ptr<Counters> counters, bool failInitialize = false)
        : m_counters(std::move(counters))
        , m_failInitialize(failInitialize)
    {
    }

    bool Initialize(int, int, std::string* outError) override
    {
        if (m_failInitialize)
        {
            if (outError != nullptr)
            {
                *outError = "no GL context";
            }
            return false;
        }
        ++m_counters->initialized;
        return true;
    }

    void Resize(int, int) override {}

    void Render(const scene::SceneGraph&, const scene::Camera&, const std::vector<scene::LineSegment>&) override
    {
        ++m_counters->rendered;
    }

    void Shutdown() override { ++m_counters->shutdown; }

private:
    std::shared_ptr<Counters> m_counters;
    bool m_failInitialize = false;
};

// Holds every request until the test completes it, which is how the real source behaves from the
// caller's point of view: nothing resolves inside Load().
class FakeModelSource final : public assets::IModelSource
{
public:
    struct Request
    {
        std::string url;
        assets::ModelLoadCallback callback;
        core::CancellationToken token;
    };

    void Load(const std::string& url, assets::ModelLoadCallback callback, const core::CancellationToken& token) override
    {
        m_requests.push_back(Request{url, std::move(callback), token});
    }

    // Completes the oldest pending request for the url. Returns false when none is pending.
    bool Complete(const std::string& url, const assets::ModelPtr& model)
    {
        assets::ModelLoadResult result;
        result.url = url;
        result.model = model;
        return Resolve(url, result);
    }

    bool Fail(const std::string& url, const std::string& error)
    {
        assets::ModelLoadResult result;
        result.url = url;
        result.error = error;
        return Resolve(url, result);
    }

    [[nodiscard]] std::size_t RequestCount(const std::string& url) const
    {
        std::size_t count = 0;
        for (const Request& request : m_requests)
        {
            count += request.url == url ? 1U : 0U;
        }
        return count + m_completed.count(url);
    }

    [[nodiscard]] std::size_t PendingCount() const { return m_requests.size(); }

private:
    bool Resolve(const std::string& url, const assets::ModelLoadResult& result)
    {
        for (auto it = m_requests.begin(); it != m_requests.end(); ++it)
        {
            if (it->url != url)
            {
                continue;
            }
            Request request = std::move(*it);
            m_requests.erase(it);
            m_completed.insert(url);
            if (!request.token.IsCancelled())
            {
                request.callback(result);
            }
            return true;
        }
        return false;
    }

    std::vector<Request> m_requests;
    std::multiset<std::string> m_completed;
};

inline scene::Geometry MakeBoxGeometry(const glm::vec3& min, const glm::vec3& max)
{
    const std::array<glm::vec3, 8> corners = {
        glm::vec3{min.x, min.y, min.z},
        glm::vec3{max.x, min.y, min.z},
        glm::vec3{max.x, max.y, min.z},
        glm::vec3{min.x, max.y, min.z},
        glm::vec3{min.x, min.y, max.z},
        glm::vec3{max.x, min.y, max.z},
        glm::vec3{max.x, max.y, max.z},
        glm::vec3{min.x, max.y, max.z},
    };
    scene::Geometry box;
    box.positions.assign(corners.begin(), corners.end());
    box.indices = {
        0, 2, 1, 0, 3, 2,
        4, 5, 6, 4, 6, 7,
        0, 1, 5, 0, 5, 4,
        3, 7, 6, 3, 6, 2,
        0, 4, 7, 0, 7, 3,
        1, 2, 6, 1, 6, 5,
    };
    box.ComputeBounds();
    return box;
}

inline assets::ModelPtr MakeBoxModel(const glm::vec3& min, const glm::vec3& max)
{
    auto model = std::make_shared<assets::ModelData>();
    assets::ModelPart part;
    part.geometry = MakeBoxGeometry(min, max);
    part.color = glm::vec3{0.6F, 0.4F, 0.2F};
    model->bounds = part.geometry.bounds;
    model->parts.push_back(std::move(part));
    return model;
}

// Unit cube whose origin sits at its centre, so snapping has to lift it by half its height.
inline assets::ModelPtr MakeUnitCube()
{
    return MakeBoxModel(glm::vec3{-0.5F}, glm::vec3{0.5F});
}

// Flat slab covering [-w/2, w/2] x [-d/2, d/2] with its top face at `top`.
inline assets::ModelPtr MakeSlabModel(float width, float depth, float top)
{
    return MakeBoxModel(glm::vec3{-width * 0.5F, top - 1.0F, -depth * 0.5F}, glm::vec3{width * 0.5F, top, depth * 0.5F});
}

inline scene::Ray DownRay(float x, float z, float height = 50.0F)
{
    scene::Ray ray;
    ray.origin = glm::vec3{x, height, z};
    ray.direction = glm::vec3{0.0F, -1.0F, 0.0F};
    return ray;
}

class RecordingBackend final : public sync::ILayoutBackend
{
public:
    struct Call
    {
        std::string operation;
        std::string assetId;
        std::string terrainId;
        std::optional<core::AssetRecord> record;
        std::optional<glm::vec3> position;
        std::optional<glm::vec3> rotation;
        std::optional<glm::vec3> scale;
        std::size_t recordCount = 0;
    };

    void PlaceAsset(const core::AssetRecord& record, const std::string& terrainId, sync::Completion done) override
    {
        Call call;
        call.operation = "place";
        call.assetId = record.id;
        call.terrainId = terrainId;
        call.record = record;
        Finish(std::move(call), std::move(done));
    }

    void MoveAsset(
        const std::string& assetId,
        const std::optional<glm::vec3>& position,
        const std::optional<glm::vec3>& rotation,
        const std::optional<glm::vec3>& scale,
        const std::string& terrainId,
        sync::Completion done) override
    {
        Call call;
        call.operation = "move";
        call.assetId = assetId;
        call.terrainId = terrainId;
        call.position = position;
        call.rotation = rotation;
        call.scale = scale;
        Finish(std::move(call), std::move(done));
    }

    void DeleteAsset(const std::string& assetId, const std::string& terrainId, sync::Completion done) override
    {
        Call call;
        call.operation = "delete";
        call.assetId = assetId;
        call.terrainId = terrainId;
        Finish(std::move(call), std::move(done));
    }

    void ReplaceLayout(const std::string& terrainId, const std::vector<core::AssetRecord>& records, sync::Completion done) override
    {
        Call call;
        call.operation = "replace";
        call.terrainId = terrainId;
        call.recordCount = records.size();
        Finish(std::move(call), std::move(done));
    }

    // When set, completions are held until RunDeferred() instead of running inline.
    bool deferCompletions = false;
    std::optional<std::string> failWith;
    std::vector<Call> calls;

    void RunDeferred()
    {
        std::vector<std::function<void()>> ready;
        ready.swap(m_deferred);
        for (std::function<void()>& completion : ready)
        {
            completion();
        }
    }

private:
    void Finish(Call call, sync::Completion done)
    {
        calls.push_back(std::move(call));
        const bool ok = !failWith.has_value();
        const std::string error = failWith.value_or(std::string{});
        if (deferCompletions)
        {
            m_deferred.push_back([done = std::move(done), ok, error]() { done(ok, error); });
            return;
        }
        done(ok, error);
    }

    std::vector<std::function<void()>> m_deferred;
};

// Every payload emitted on the given topics, in order.
class EventRecorder
{
public:
    EventRecorder(core::EventBus& bus, std::vector<std::string> topics)
        : m_bus(bus)
        , m_topics(std::move(topics))
    {
        for (const std::string& topic : m_topics)
        {
            core::EventBus::HandlerPtr handler = core::EventBus::MakeHandler([this, topic](const core::Payload& payload) {
                events.emplace_back(topic, payload);
            });
            m_bus.On(topic, handler);
            m_handlers.push_back(handler);
        }
    }

    ~EventRecorder()
    {
        for (std::size_t i = 0; i < m_topics.size(); ++i)
        {
            m_bus.Off(m_topics[i], m_handlers[i]);
        }
    }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    [[nodiscard]] std::size_t Count(const std::string& topic) const
    {
        std::size_t count = 0;
        for (const auto& [name, payload] : events)
        {
            count += name == topic ? 1U : 0U;
        }
        return count;
    }

    template <typename T>
    [[nodiscard]] const T* Last(const std::string& topic) const
    {
        for (auto it = events.rbegin(); it != events.rend(); ++it)
        {
            if (it->first == topic)
            {
                return core::PayloadAs<T>(it->second);
            }
        }
        return nullptr;
    }

    void Reset() { events.clear(); }

    std::vector<std::pair<std::string, core::Payload>> events;

private:
    core::EventBus& m_bus;
    std::vector<std::string> m_topics;
    std::vector<core::EventBus::HandlerPtr> m_handlers;
};

inline core::TerrainConfig TestTerrainConfig()
{
    // 20 x 20 extent split into 10 x 10 cells of 2 units, centred on the origin.
    core::TerrainConfig config;
    config.terrainId = "test-dungeon";
    config.gridScale = 2.0F;
    config.fallbackWidth = 20.0F;
    config.fallbackDepth = 20.0F;
    config.groundY = 0.0F;
    return config;
}

// A mounted editing session without a window: fake surface, fake model source, flat fallback terrain.
struct EditorSession
{
    explicit EditorSession(const core::TerrainConfig& terrainConfig = TestTerrainConfig())
        : surfaceCounters(std::make_shared<FakeRenderSurface::Counters>())
    {
        callbacks.onError = [this](const core::ErrorReport& report) { errors.push_back(report); };
        callbacks.onAssetSelected = [this](const std::optional<std::string>& id) { selections.push_back(id); };

        host = std::make_unique<scene::SceneHost>(
            bus, std::make_unique<FakeRenderSurface>(surfaceCounters), core::CameraConfig{}, callbacks);
        host->Mount(800, 600);
        terrain = std::make_unique<terrain::TerrainLoader>(bus, *host, models, callbacks, terrainConfig);
        reconciler = std::make_unique<editor::AssetReconciler>(bus, *host, *terrain, models, callbacks);
        host->SetAssetIdResolver([this](scene::NodeHandle node) { return reconciler->AssetIdFor(node); });
        highlighter = std::make_unique<editor::GridHighlighter>(bus, host->Scene());
        interaction = std::make_unique<editor::InteractionController>(bus, *host, *terrain, *reconciler, callbacks);
        interaction->SetClock([this]() { return ++clock; });
        terrain->SetTerrain(terrainConfig.terrainId, terrainConfig.url);
    }

    ~EditorSession()
    {
        interaction.reset();
        highlighter.reset();
        reconciler.reset();
        terrain.reset();
        host.reset();
    }

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    // Emits asset:added for a record and resolves its model with a unit cube.
    void AddLoadedAsset(const core::AssetRecord& record)
    {
        core::MutationEvent event;
        event.kind = core::MutationKind::Added;
        event.id = record.id;
        event.modelUrl = record.modelUrl;
        event.name = record.name;
        event.position = record.position;
        event.rotation = record.rotation;
        event.scale = record.scale;
        bus.Emit(core::topics::kAssetAdded, event);
        models.Complete(record.modelUrl, MakeUnitCube());
    }

    [[nodiscard]] glm::vec3 NodePosition(const std::string& assetId) const
    {
        return host->Scene().Transform(reconciler->NodeFor(assetId)).position;
    }

    core::EventBus bus;
    core::SessionCallbacks callbacks;
    std::vector<core::ErrorReport> errors;
    std::vector<std::optional<std::string>> selections;
    std::shared_ptr<FakeRenderSurface::Counters> surfaceCounters;
    FakeModelSource models;
    std::int64_t clock = 1000;

    std::unique_ptr<scene::SceneHost> host;
    std::unique_ptr<terrain::TerrainLoader> terrain;
    std::unique_ptr<editor::AssetReconciler> reconciler;
    std::unique_ptr<editor::GridHighlighter> highlighter;
    std::unique_ptr<editor::InteractionController> interaction;
};

inline core::AssetRecord MakeRecord(const std::string& id, const glm::vec3& position)
{
    core::AssetRecord record;
    record.id = id;
    record.modelUrl = "models/" + id + ".glb";
    record.name = id;
    record.position = position;
    return record;
}
} // namespace placer::test
