#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "placer/core/AssetRecord.hpp"

namespace placer::sync
{
// Called exactly once per request. `error` is empty on success.
using Completion = std::function<void(bool ok, const std::string& error)>;

// Storage the placed assets of a terrain are persisted to.
class ILayoutBackend
{
public:
    virtual ~ILayoutBackend() = default;

    virtual void PlaceAsset(const core::AssetRecord& record, const std::string& terrainId, Completion done) = 0;
    virtual void MoveAsset(
        const std::string& assetId,
        const std::optional<glm::vec3>& position,
        const std::optional<glm::vec3>& rotation,
        const std::optional<glm::vec3>& scale,
        const std::string& terrainId,
        Completion done) = 0;
    virtual void DeleteAsset(const std::string& assetId, const std::string& terrainId, Completion done) = 0;
    // Bulk replace of a terrain's layout.
    virtual void ReplaceLayout(const std::string& terrainId, const std::vector<core::AssetRecord>& records, Completion done) = 0;
};
} // namespace placer::sync
