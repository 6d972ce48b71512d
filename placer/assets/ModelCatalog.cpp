#include "placer/assets/ModelCatalog.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "placer/core/AssetRecord.hpp"

namespace placer::assets
{
namespace
{
using json = nlohmann::json;

// Metadata vectors may be written as {x,y,z} or as a single uniform number.
std::optional<glm::vec3> ReadMetadataVector(const json& node, const char* key, const glm::vec3& defaults)
{
    if (!node.contains(key))
    {
        return std::nullopt;
    }
    const json& value = node[key];
    if (value.is_number())
    {
        return glm::vec3{value.get<float>()};
    }
    glm::vec3 parsed = defaults;
    if (core::Vec3FromJson(value, &parsed))
    {
        return parsed;
    }
    return std::nullopt;
}
} // namespace

bool ModelCatalog::Load(const std::filesystem::path& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Model catalog not found: " + path.generic_string();
        }
        m_entries.clear();
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& e)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid model catalog JSON: " + std::string(e.what());
        }
        m_entries.clear();
        return false;
    }
    return LoadFromJson(root, outError);
}

bool ModelCatalog::LoadFromJson(const json& root, std::string* outError)
{
    m_entries.clear();
    if (!root.is_object() || !root.contains("models") || !root["models"].is_array())
    {
        if (outError != nullptr)
        {
            *outError = "Model catalog must contain a 'models' array.";
        }
        return false;
    }

    std::unordered_set<std::string> seen;
    for (const json& item : root["models"])
    {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string())
        {
            std::cerr << "[ModelCatalog] Skipping entry without a string id\n";
            continue;
        }

        ModelEntry entry;
        entry.id = item["id"].get<std::string>();
        if (!seen.insert(entry.id).second)
        {
            std::cerr << "[ModelCatalog] Duplicate model id skipped: " << entry.id << "\n";
            continue;
        }
        entry.name = item.contains("name") && item["name"].is_string() ? item["name"].get<std::string>() : entry.id;
        if (item.contains("icon") && item["icon"].is_string())
        {
            entry.icon = item["icon"].get<std::string>();
        }
        entry.url = item.contains("url") && item["url"].is_string() ? item["url"].get<std::string>() : DefaultUrlFor(entry.id);
        if (item.contains("metadata") && item["metadata"].is_object())
        {
            entry.metadata.scale = ReadMetadataVector(item["metadata"], "scale", glm::vec3{1.0F});
            entry.metadata.rotation = ReadMetadataVector(item["metadata"], "rotation", glm::vec3{0.0F});
        }
        m_entries.push_back(std::move(entry));
    }

    std::cout << "[ModelCatalog] Loaded " << m_entries.size() << " models\n";
    return true;
}

const ModelEntry* ModelCatalog::Find(const std::string& id) const
{
    for (const ModelEntry& entry : m_entries)
    {
        if (entry.id == id)
        {
            return &entry;
        }
    }
    return nullptr;
}

std::string ModelCatalog::DefaultUrlFor(const std::string& id)
{
    return "models/" + id + ".glb";
}
} // namespace placer::assets
