#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>
#include <nlohmann/json_fwd.hpp>

namespace placer::assets
{
struct ModelMetadata
{
    std::optional<glm::vec3> scale;
    std::optional<glm::vec3> rotation;
};

struct ModelEntry
{
    std::string id;
    std::string name;
    std::string icon;
    std::string url;
    ModelMetadata metadata;
};

// Palette of placeable models: { "models": [{ id, name, icon?, url?, metadata: { scale?, rotation? } }] }.
class ModelCatalog
{
public:
    bool Load(const std::filesystem::path& path, std::string* outError = nullptr);
    bool LoadFromJson(const nlohmann::json& root, std::string* outError = nullptr);

    [[nodiscard]] const std::vector<ModelEntry>& Entries() const { return m_entries; }
    [[nodiscard]] const ModelEntry* Find(const std::string& id) const;
    [[nodiscard]] bool Empty() const { return m_entries.empty(); }

    [[nodiscard]] static std::string DefaultUrlFor(const std::string& id);

private:
    std::vector<ModelEntry> m_entries;
};
} // namespace placer::assets
