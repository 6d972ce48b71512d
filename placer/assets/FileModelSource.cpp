#include "placer/assets/FileModelSource.hpp"

#include <iostream>

#include "placer/assets/GltfImporter.hpp"

namespace placer::assets
{
FileModelSource::FileModelSource(core::JobSystem& jobs, core::MainThreadQueue& mainThread, std::filesystem::path assetRoot)
    : m_jobs(jobs)
    , m_mainThread(mainThread)
    , m_assetRoot(std::move(assetRoot))
{
}

FileModelSource::~FileModelSource()
{
    // Posted completions check this flag; parses still running must finish before members go away.
    *m_alive = false;
    m_inFlight.Wait();
}

void FileModelSource::Load(const std::string& url, ModelLoadCallback callback, const core::CancellationToken& token)
{
    if (IsAbsoluteUrl(url))
    {
        m_waiters[url].push_back(Waiter{url, std::move(callback), token});
        if (m_waiters[url].size() == 1)
        {
            PostResult(url, nullptr, "Remote model URLs are not supported: " + url);
        }
        return;
    }

    // Site-relative URLs ("/models/a.glb") are relative to the asset root as well.
    const std::string relative = (!url.empty() && url.front() == '/') ? url.substr(1) : url;
    const std::filesystem::path absolutePath = (m_assetRoot / relative).lexically_normal();
    const std::string key = absolutePath.generic_string();

    const auto cached = m_cache.find(key);
    if (cached != m_cache.end())
    {
        m_waiters[key].push_back(Waiter{url, std::move(callback), token});
        if (m_waiters[key].size() == 1)
        {
            PostResult(key, cached->second, {});
        }
        return;
    }

    auto& waiters = m_waiters[key];
    waiters.push_back(Waiter{url, std::move(callback), token});
    if (waiters.size() > 1)
    {
        return;
    }

    const auto parse = [this, key, absolutePath]() {
        auto model = std::make_shared<ModelData>();
        std::string error;
        if (!ImportGltf(absolutePath, model.get(), &error))
        {
            PostResult(key, nullptr, error);
            return;
        }
        PostResult(key, std::move(model), {});
    };

    if (!m_jobs.Submit("load_model " + key, parse, &m_inFlight))
    {
        std::cout << "[ModelSource] Job system unavailable, loading inline: " << key << "\n";
        parse();
    }
}

void FileModelSource::PostResult(const std::string& key, ModelPtr model, std::string error)
{
    std::weak_ptr<bool> alive = m_alive;
    m_mainThread.Post([this, alive, key, model = std::move(model), error = std::move(error)]() {
        const std::shared_ptr<bool> flag = alive.lock();
        if (flag == nullptr || !*flag)
        {
            return;
        }
        Complete(key, model, error);
    });
}

void FileModelSource::Complete(const std::string& key, const ModelPtr& model, const std::string& error)
{
    if (model != nullptr)
    {
        m_cache[key] = model;
    }
    else
    {
        std::cerr << "[ModelSource] " << error << "\n";
    }

    const auto it = m_waiters.find(key);
    if (it == m_waiters.end())
    {
        return;
    }
    std::vector<Waiter> waiters = std::move(it->second);
    m_waiters.erase(it);
    for (const Waiter& waiter : waiters)
    {
        Deliver(waiter, model, error);
    }
}

void FileModelSource::Deliver(const Waiter& waiter, const ModelPtr& model, const std::string& error)
{
    if (waiter.token.IsCancelled() || !waiter.callback)
    {
        return;
    }
    ModelLoadResult result;
    result.url = waiter.url;
    result.model = model;
    result.error = error;
    waiter.callback(result);
}
} // namespace placer::assets
