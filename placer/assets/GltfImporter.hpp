#pragma once

#include <filesystem>
#include <string>

#include "placer/assets/ModelData.hpp"

namespace placer::assets
{
// Reads .gltf/.glb into flat triangle parts. Safe to call from worker threads.
bool ImportGltf(const std::filesystem::path& absolutePath, ModelData* outModel, std::string* outError);
} // namespace placer::assets
