#include "placer/sync/JsonLayoutStore.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

namespace placer::sync
{
namespace
{
using json = nlohmann::json;

void Finish(const Completion& done, bool ok, const std::string& error)
{
    if (done)
    {
        done(ok, error);
    }
}

bool IsSafeTerrainId(const std::string& terrainId)
{
    if (terrainId.empty())
    {
        return false;
    }
    return std::all_of(terrainId.begin(), terrainId.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    }) && terrainId != "." && terrainId != "..";
}
} // namespace

JsonLayoutStore::JsonLayoutStore(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
}

std::filesystem::path JsonLayoutStore::PathFor(const std::string& terrainId) const
{
    return m_directory / (terrainId + ".json");
}

bool JsonLayoutStore::Load(const std::string& terrainId, std::vector<core::AssetRecord>* outRecords, std::string* outError) const
{
    if (outRecords == nullptr)
    {
        return false;
    }
    outRecords->clear();
    if (!IsSafeTerrainId(terrainId))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid terrain id for layout: '" + terrainId + "'";
        }
        return false;
    }

    const std::filesystem::path path = PathFor(terrainId);
    if (!std::filesystem::exists(path))
    {
        return true;
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to open layout: " + path.generic_string();
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid layout JSON in " + path.generic_string() + ": " + ex.what();
        }
        return false;
    }

    if (!root.is_object() || !root.contains("placedAssets") || !root["placedAssets"].is_array())
    {
        if (outError != nullptr)
        {
            *outError = "Layout " + path.generic_string() + " has no placedAssets array.";
        }
        return false;
    }

    for (const json& entry : root["placedAssets"])
    {
        core::AssetRecord record;
        std::string recordError;
        if (!core::RecordFromJson(entry, &record, &recordError))
        {
            std::cerr << "[JsonLayoutStore] Skipping record: " << recordError << "\n";
            continue;
        }
        outRecords->push_back(std::move(record));
    }
    return true;
}

bool JsonLayoutStore::Save(const std::string& terrainId, const std::vector<core::AssetRecord>& records, std::string* outError) const
{
    if (!IsSafeTerrainId(terrainId))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid terrain id for layout: '" + terrainId + "'";
        }
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);

    const std::filesystem::path path = PathFor(terrainId);
    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to write layout: " + path.generic_string();
        }
        return false;
    }

    json root;
    root["placedAssets"] = core::RecordsToJson(records);
    stream << root.dump(2) << "\n";
    return true;
}

void JsonLayoutStore::PlaceAsset(const core::AssetRecord& record, const std::string& terrainId, Completion done)
{
    std::vector<core::AssetRecord> records;
    std::string error;
    if (!Load(terrainId, &records, &error))
    {
        Finish(done, false, error);
        return;
    }

    const auto it = std::find_if(records.begin(), records.end(), [&](const core::AssetRecord& r) { return r.id == record.id; });
    if (it != records.end())
    {
        *it = record;
    }
    else
    {
        records.push_back(record);
    }

    const bool ok = Save(terrainId, records, &error);
    Finish(done, ok, error);
}

void JsonLayoutStore::MoveAsset(
    const std::string& assetId,
    const std::optional<glm::vec3>& position,
    const std::optional<glm::vec3>& rotation,
    const std::optional<glm::vec3>& scale,
    const std::string& terrainId,
    Completion done)
{
    std::vector<core::AssetRecord> records;
    std::string error;
    if (!Load(terrainId, &records, &error))
    {
        Finish(done, false, error);
        return;
    }

    const auto it = std::find_if(records.begin(), records.end(), [&](const core::AssetRecord& r) { return r.id == assetId; });
    if (it == records.end())
    {
        Finish(done, false, "Asset not found in layout: " + assetId);
        return;
    }
    if (position.has_value())
    {
        it->position = *position;
    }
    if (rotation.has_value())
    {
        it->rotation = *rotation;
    }
    if (scale.has_value())
    {
        it->scale = *scale;
    }

    const bool ok = Save(terrainId, records, &error);
    Finish(done, ok, error);
}

void JsonLayoutStore::DeleteAsset(const std::string& assetId, const std::string& terrainId, Completion done)
{
    std::vector<core::AssetRecord> records;
    std::string error;
    if (!Load(terrainId, &records, &error))
    {
        Finish(done, false, error);
        return;
    }

    const auto it = std::remove_if(records.begin(), records.end(), [&](const core::AssetRecord& r) { return r.id == assetId; });
    if (it == records.end())
    {
        Finish(done, false, "Asset not found in layout: " + assetId);
        return;
    }
    records.erase(it, records.end());

    const bool ok = Save(terrainId, records, &error);
    Finish(done, ok, error);
}

void JsonLayoutStore::ReplaceLayout(const std::string& terrainId, const std::vector<core::AssetRecord>& records, Completion done)
{
    std::string error;
    const bool ok = Save(terrainId, records, &error);
    Finish(done, ok, error);
}
} // namespace placer::sync
