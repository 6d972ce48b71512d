#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "placer/scene/Math.hpp"

namespace placer::scene
{
class Camera
{
public:
    Camera(float fovDegrees = 75.0F, float nearPlane = 0.1F, float farPlane = 2000.0F);

    void SetAspect(float aspect);
    void SetPosition(const glm::vec3& position) { m_position = position; }
    void LookAt(const glm::vec3& target) { m_target = target; }

    [[nodiscard]] const glm::vec3& Position() const { return m_position; }
    [[nodiscard]] const glm::vec3& Target() const { return m_target; }
    [[nodiscard]] float FovDegrees() const { return m_fovDegrees; }
    [[nodiscard]] float Aspect() const { return m_aspect; }

    [[nodiscard]] glm::mat4 View() const;
    [[nodiscard]] glm::mat4 Projection() const;
    [[nodiscard]] glm::mat4 ViewProjection() const { return Projection() * View(); }
    [[nodiscard]] glm::vec3 Forward() const;

    // Pixel coordinates (origin top-left) to a world-space ray through the view frustum.
    bool BuildRay(const glm::vec2& screenPixels, const glm::vec2& viewportSize, Ray* outRay) const;

private:
    float m_fovDegrees;
    float m_nearPlane;
    float m_farPlane;
    float m_aspect = 16.0F / 9.0F;
    glm::vec3 m_position{10.0F, 10.0F, 10.0F};
    glm::vec3 m_target{0.0F};
};
} // namespace placer::scene
