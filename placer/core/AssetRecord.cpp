#include "placer/core/AssetRecord.hpp"

#include <nlohmann/json.hpp>

namespace placer::core
{
using json = nlohmann::json;

bool SameTransform(const AssetRecord& a, const AssetRecord& b)
{
    return a.position == b.position && a.rotation == b.rotation && a.scale == b.scale;
}

json Vec3ToJson(const glm::vec3& value)
{
    return json{{"x", value.x}, {"y", value.y}, {"z", value.z}};
}

bool Vec3FromJson(const json& value, glm::vec3* outValue)
{
    if (outValue == nullptr || !value.is_object())
    {
        return false;
    }
    glm::vec3 parsed = *outValue;
    const char* keys[3] = {"x", "y", "z"};
    for (int axis = 0; axis < 3; ++axis)
    {
        if (value.contains(keys[axis]))
        {
            if (!value[keys[axis]].is_number())
            {
                return false;
            }
            parsed[axis] = value[keys[axis]].get<float>();
        }
    }
    *outValue = parsed;
    return true;
}

json RecordToJson(const AssetRecord& record)
{
    json out;
    out["id"] = record.id;
    out["modelUrl"] = record.modelUrl;
    out["name"] = record.name;
    out["position"] = Vec3ToJson(record.position);
    out["rotation"] = Vec3ToJson(record.rotation);
    out["scale"] = Vec3ToJson(record.scale);
    return out;
}

bool RecordFromJson(const json& value, AssetRecord* outRecord, std::string* outError)
{
    if (outRecord == nullptr)
    {
        return false;
    }
    if (!value.is_object() || !value.contains("id") || !value["id"].is_string())
    {
        if (outError != nullptr)
        {
            *outError = "Asset record is missing a string id.";
        }
        return false;
    }

    AssetRecord record;
    record.id = value["id"].get<std::string>();
    if (value.contains("modelUrl") && value["modelUrl"].is_string())
    {
        record.modelUrl = value["modelUrl"].get<std::string>();
    }
    if (value.contains("name") && value["name"].is_string())
    {
        record.name = value["name"].get<std::string>();
    }

    const auto readVec = [&](const char* key, glm::vec3* target) {
        if (!value.contains(key))
        {
            return true;
        }
        return Vec3FromJson(value[key], target);
    };
    if (!readVec("position", &record.position) || !readVec("rotation", &record.rotation) || !readVec("scale", &record.scale))
    {
        if (outError != nullptr)
        {
            *outError = "Asset record " + record.id + " has a malformed transform.";
        }
        return false;
    }

    *outRecord = std::move(record);
    return true;
}

json RecordsToJson(const std::vector<AssetRecord>& records)
{
    json out = json::array();
    for (const AssetRecord& record : records)
    {
        out.push_back(RecordToJson(record));
    }
    return out;
}
} // namespace placer::core
