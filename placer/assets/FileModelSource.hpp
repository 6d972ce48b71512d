#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "placer/assets/ModelSource.hpp"
#include "placer/core/JobSystem.hpp"
#include "placer/core/MainThreadQueue.hpp"

namespace placer::assets
{
// Loads glTF/GLB from disk under an asset root. Parsing runs on the job system; results are
// cached per resolved path and concurrent requests for the same path share one parse.
class FileModelSource final : public IModelSource
{
public:
    FileModelSource(core::JobSystem& jobs, core::MainThreadQueue& mainThread, std::filesystem::path assetRoot);
    ~FileModelSource() override;

    FileModelSource(const FileModelSource&) = delete;
    FileModelSource& operator=(const FileModelSource&) = delete;

    void Load(const std::string& url, ModelLoadCallback callback, const core::CancellationToken& token) override;

    [[nodiscard]] std::size_t CachedCount() const { return m_cache.size(); }
    [[nodiscard]] std::size_t InFlightCount() const { return m_waiters.size(); }
    // Parsed models stay cached until this is called; the editor drops them on terrain switch.
    // Requests still in flight are unaffected.
    void ClearCache() { m_cache.clear(); }

private:
    struct Waiter
    {
        std::string url;
        ModelLoadCallback callback;
        core::CancellationToken token;
    };

    void PostResult(const std::string& key, ModelPtr model, std::string error);
    void Complete(const std::string& key, const ModelPtr& model, const std::string& error);
    static void Deliver(const Waiter& waiter, const ModelPtr& model, const std::string& error);

    core::JobSystem& m_jobs;
    core::MainThreadQueue& m_mainThread;
    std::filesystem::path m_assetRoot;
    core::JobCounter m_inFlight;

    std::unordered_map<std::string, ModelPtr> m_cache;
    std::unordered_map<std::string, std::vector<Waiter>> m_waiters;
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};
} // namespace placer::assets
