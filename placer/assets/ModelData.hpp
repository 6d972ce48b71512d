#pragma once

#include <memory>
#include <vector>

#include <glm/vec3.hpp>

#include "placer/scene/Math.hpp"
#include "placer/scene/SceneGraph.hpp"

namespace placer::assets
{
// One primitive batch of an imported model, already in model space (node transforms baked in).
struct ModelPart
{
    scene::Geometry geometry;
    glm::vec3 color{1.0F};
    float opacity = 1.0F;
};

struct ModelData
{
    std::vector<ModelPart> parts;
    scene::Aabb bounds;
};

using ModelPtr = std::shared_ptr<const ModelData>;
} // namespace placer::assets
