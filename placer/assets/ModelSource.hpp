#pragma once

#include <functional>
#include <string>

#include "placer/assets/ModelData.hpp"
#include "placer/core/Errors.hpp"

namespace placer::assets
{
struct ModelLoadResult
{
    std::string url;
    ModelPtr model;
    std::string error;

    [[nodiscard]] bool Succeeded() const { return model != nullptr; }
};

using ModelLoadCallback = std::function<void(const ModelLoadResult&)>;

// Asynchronous model provider. Callbacks always run on the main thread, never inside Load(),
// and are dropped when the token is cancelled before completion.
class IModelSource
{
public:
    virtual ~IModelSource() = default;

    virtual void Load(const std::string& url, ModelLoadCallback callback, const core::CancellationToken& token) = 0;
};

[[nodiscard]] bool IsAbsoluteUrl(const std::string& url);

// Absolute URLs pass through. Relative ones lose a leading '/' and are joined to `base`.
[[nodiscard]] std::string ResolveModelUrl(const std::string& url, const std::string& base);
} // namespace placer::assets
