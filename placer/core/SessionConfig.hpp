#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <glm/vec3.hpp>

namespace placer::core
{
struct WindowConfig
{
    int width = 1600;
    int height = 900;
    bool vsync = true;
    std::string title = "Dungeon Placer";
};

struct TerrainConfig
{
    std::string terrainId;
    std::string url;
    float scale = 1.0F;
    float gridScale = 1.0F;
    std::optional<int> gridWidth;
    std::optional<int> gridHeight;
    float fallbackWidth = 20.0F;
    float fallbackDepth = 20.0F;
    float groundY = 0.0F;
    bool gridVisible = true;
    glm::vec3 gridColor{0.53F, 0.53F, 0.53F};
};

struct CameraConfig
{
    float fovDegrees = 75.0F;
    float nearPlane = 0.1F;
    float farPlane = 2000.0F;
};

struct SessionConfig
{
    WindowConfig window;
    std::string assetRoot = "assets";
    std::string modelCatalogPath = "config/models.json";
    std::string layoutDirectory = "layouts";
    TerrainConfig terrain;
    CameraConfig camera;
    int jobWorkers = 0;
};

// Missing file: defaults are written back. Malformed JSON: defaults are used and outError is set.
bool LoadSessionConfig(const std::filesystem::path& path, SessionConfig* outConfig, std::string* outError = nullptr);
bool SaveSessionConfig(const std::filesystem::path& path, const SessionConfig& config, std::string* outError = nullptr);
} // namespace placer::core
