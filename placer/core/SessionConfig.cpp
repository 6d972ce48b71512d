#include "placer/core/SessionConfig.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "placer/core/AssetRecord.hpp"

namespace placer::core
{
namespace
{
using json = nlohmann::json;

void ReadString(const json& node, const char* key, std::string* target)
{
    if (node.contains(key) && node[key].is_string())
    {
        *target = node[key].get<std::string>();
    }
}

void ReadFloat(const json& node, const char* key, float* target)
{
    if (node.contains(key) && node[key].is_number())
    {
        *target = node[key].get<float>();
    }
}

void ReadInt(const json& node, const char* key, int* target)
{
    if (node.contains(key) && node[key].is_number_integer())
    {
        *target = node[key].get<int>();
    }
}

void ReadBool(const json& node, const char* key, bool* target)
{
    if (node.contains(key) && node[key].is_boolean())
    {
        *target = node[key].get<bool>();
    }
}

void ReadOptionalInt(const json& node, const char* key, std::optional<int>* target)
{
    if (node.contains(key) && node[key].is_number_integer())
    {
        *target = node[key].get<int>();
    }
}

void ApplyJson(const json& root, SessionConfig* config)
{
    if (root.contains("window") && root["window"].is_object())
    {
        const json& window = root["window"];
        ReadInt(window, "width", &config->window.width);
        ReadInt(window, "height", &config->window.height);
        ReadBool(window, "vsync", &config->window.vsync);
        ReadString(window, "title", &config->window.title);
    }
    if (root.contains("assets") && root["assets"].is_object())
    {
        ReadString(root["assets"], "root", &config->assetRoot);
        ReadString(root["assets"], "model_catalog", &config->modelCatalogPath);
    }
    if (root.contains("layouts") && root["layouts"].is_object())
    {
        ReadString(root["layouts"], "directory", &config->layoutDirectory);
    }
    if (root.contains("terrain") && root["terrain"].is_object())
    {
        const json& terrain = root["terrain"];
        ReadString(terrain, "id", &config->terrain.terrainId);
        ReadString(terrain, "url", &config->terrain.url);
        ReadFloat(terrain, "scale", &config->terrain.scale);
        ReadFloat(terrain, "grid_scale", &config->terrain.gridScale);
        ReadOptionalInt(terrain, "grid_width", &config->terrain.gridWidth);
        ReadOptionalInt(terrain, "grid_height", &config->terrain.gridHeight);
        ReadFloat(terrain, "fallback_width", &config->terrain.fallbackWidth);
        ReadFloat(terrain, "fallback_depth", &config->terrain.fallbackDepth);
        ReadFloat(terrain, "ground_y", &config->terrain.groundY);
        ReadBool(terrain, "grid_visible", &config->terrain.gridVisible);
        if (terrain.contains("grid_color"))
        {
            (void)Vec3FromJson(terrain["grid_color"], &config->terrain.gridColor);
        }
    }
    if (root.contains("camera") && root["camera"].is_object())
    {
        ReadFloat(root["camera"], "fov_degrees", &config->camera.fovDegrees);
        ReadFloat(root["camera"], "near", &config->camera.nearPlane);
        ReadFloat(root["camera"], "far", &config->camera.farPlane);
    }
    if (root.contains("jobs") && root["jobs"].is_object())
    {
        ReadInt(root["jobs"], "workers", &config->jobWorkers);
    }

    config->window.width = std::max(640, config->window.width);
    config->window.height = std::max(360, config->window.height);
    config->terrain.scale = std::max(0.001F, config->terrain.scale);
    config->terrain.gridScale = std::max(0.01F, config->terrain.gridScale);
    config->terrain.fallbackWidth = std::max(1.0F, config->terrain.fallbackWidth);
    config->terrain.fallbackDepth = std::max(1.0F, config->terrain.fallbackDepth);
    config->camera.fovDegrees = std::clamp(config->camera.fovDegrees, 10.0F, 150.0F);
    config->camera.nearPlane = std::max(0.001F, config->camera.nearPlane);
    config->camera.farPlane = std::max(config->camera.nearPlane + 1.0F, config->camera.farPlane);
    config->jobWorkers = std::max(0, config->jobWorkers);
}
} // namespace

bool LoadSessionConfig(const std::filesystem::path& path, SessionConfig* outConfig, std::string* outError)
{
    if (outConfig == nullptr)
    {
        return false;
    }
    *outConfig = SessionConfig{};

    if (!std::filesystem::exists(path))
    {
        std::cout << "[SessionConfig] " << path.generic_string() << " not found, writing defaults\n";
        return SaveSessionConfig(path, *outConfig, outError);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to open session config: " + path.generic_string();
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
            *outError = "Invalid session config JSON, using defaults: " + std::string(ex.what());
        }
        return false;
    }

    ApplyJson(root, outConfig);
    return true;
}

bool SaveSessionConfig(const std::filesystem::path& path, const SessionConfig& config, std::string* outError)
{
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    json root;
    root["window"] = {
        {"width", config.window.width},
        {"height", config.window.height},
        {"vsync", config.window.vsync},
        {"title", config.window.title},
    };
    root["assets"] = {
        {"root", config.assetRoot},
        {"model_catalog", config.modelCatalogPath},
    };
    root["layouts"] = {{"directory", config.layoutDirectory}};

    json terrain;
    terrain["id"] = config.terrain.terrainId;
    terrain["url"] = config.terrain.url;
    terrain["scale"] = config.terrain.scale;
    terrain["grid_scale"] = config.terrain.gridScale;
    if (config.terrain.gridWidth.has_value())
    {
        terrain["grid_width"] = *config.terrain.gridWidth;
    }
    if (config.terrain.gridHeight.has_value())
    {
        terrain["grid_height"] = *config.terrain.gridHeight;
    }
    terrain["fallback_width"] = config.terrain.fallbackWidth;
    terrain["fallback_depth"] = config.terrain.fallbackDepth;
    terrain["ground_y"] = config.terrain.groundY;
    terrain["grid_visible"] = config.terrain.gridVisible;
    terrain["grid_color"] = Vec3ToJson(config.terrain.gridColor);
    root["terrain"] = terrain;

    root["camera"] = {
        {"fov_degrees", config.camera.fovDegrees},
        {"near", config.camera.nearPlane},
        {"far", config.camera.farPlane},
    };
    root["jobs"] = {{"workers", config.jobWorkers}};

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to write session config: " + path.generic_string();
        }
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace placer::core
