#pragma once

#include <string>
#include <vector>

#include "placer/scene/Math.hpp"

namespace placer::scene
{
class Camera;
class SceneGraph;
} // namespace placer::scene

namespace placer::render
{
// Output surface a SceneHost draws into. The OpenGL renderer is the production implementation.
class IRenderSurface
{
public:
    virtual ~IRenderSurface() = default;

    virtual bool Initialize(int framebufferWidth, int framebufferHeight, std::string* outError) = 0;
    virtual void Resize(int framebufferWidth, int framebufferHeight) = 0;
    virtual void Render(
        const scene::SceneGraph& scene,
        const scene::Camera& camera,
        const std::vector<scene::LineSegment>& overlayLines) = 0;
    virtual void Shutdown() = 0;
};
} // namespace placer::render
