#pragma once

#include <string>
#include <vector>

#include <glm/vec3.hpp>
#include <nlohmann/json_fwd.hpp>

namespace placer::core
{
// Declarative placement owned by the hosting application. Rotation is Euler XYZ in radians.
struct AssetRecord
{
    std::string id;
    std::string modelUrl;
    std::string name;
    glm::vec3 position{0.0F};
    glm::vec3 rotation{0.0F};
    glm::vec3 scale{1.0F};
};

[[nodiscard]] bool SameTransform(const AssetRecord& a, const AssetRecord& b);

nlohmann::json Vec3ToJson(const glm::vec3& value);
bool Vec3FromJson(const nlohmann::json& value, glm::vec3* outValue);

nlohmann::json RecordToJson(const AssetRecord& record);
bool RecordFromJson(const nlohmann::json& value, AssetRecord* outRecord, std::string* outError = nullptr);

nlohmann::json RecordsToJson(const std::vector<AssetRecord>& records);
} // namespace placer::core
