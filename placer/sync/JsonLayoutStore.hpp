#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "placer/sync/LayoutBackend.hpp"

namespace placer::sync
{
// Layout backend on local files: one `{ "placedAssets": [...] }` document per terrain id.
// Requests complete before the call returns.
class JsonLayoutStore final : public ILayoutBackend
{
public:
    explicit JsonLayoutStore(std::filesystem::path directory);

    // Missing file is an empty layout.
    bool Load(const std::string& terrainId, std::vector<core::AssetRecord>* outRecords, std::string* outError = nullptr) const;
    bool Save(const std::string& terrainId, const std::vector<core::AssetRecord>& records, std::string* outError = nullptr) const;

    [[nodiscard]] std::filesystem::path PathFor(const std::string& terrainId) const;

    void PlaceAsset(const core::AssetRecord& record, const std::string& terrainId, Completion done) override;
    void MoveAsset(
        const std::string& assetId,
        const std::optional<glm::vec3>& position,
        const std::optional<glm::vec3>& rotation,
        const std::optional<glm::vec3>& scale,
        const std::string& terrainId,
        Completion done) override;
    void DeleteAsset(const std::string& assetId, const std::string& terrainId, Completion done) override;
    void ReplaceLayout(const std::string& terrainId, const std::vector<core::AssetRecord>& records, Completion done) override;

private:
    std::filesystem::path m_directory;
};
} // namespace placer::sync
