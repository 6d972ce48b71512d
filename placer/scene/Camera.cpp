#include "placer/scene/Camera.hpp"

#include <cmath>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/vec4.hpp>

namespace placer::scene
{
Camera::Camera(float fovDegrees, float nearPlane, float farPlane)
    : m_fovDegrees(fovDegrees)
    , m_nearPlane(nearPlane)
    , m_farPlane(farPlane)
{
}

void Camera::SetAspect(float aspect)
{
    if (aspect > 0.0F)
    {
        m_aspect = aspect;
    }
}

glm::mat4 Camera::View() const
{
    return glm::lookAt(m_position, m_target, glm::vec3{0.0F, 1.0F, 0.0F});
}

glm::mat4 Camera::Projection() const
{
    return glm::perspective(glm::radians(m_fovDegrees), m_aspect, m_nearPlane, m_farPlane);
}

glm::vec3 Camera::Forward() const
{
    const glm::vec3 direction = m_target - m_position;
    return glm::length(direction) > 1.0e-6F ? glm::normalize(direction) : glm::vec3{0.0F, 0.0F, -1.0F};
}

bool Camera::BuildRay(const glm::vec2& screenPixels, const glm::vec2& viewportSize, Ray* outRay) const
{
    if (viewportSize.x <= 0.0F || viewportSize.y <= 0.0F || outRay == nullptr)
    {
        return false;
    }

    const float x = (2.0F * screenPixels.x) / viewportSize.x - 1.0F;
    const float y = 1.0F - (2.0F * screenPixels.y) / viewportSize.y;
    const glm::mat4 inv = glm::inverse(ViewProjection());

    const glm::vec4 nearClip = inv * glm::vec4{x, y, -1.0F, 1.0F};
    const glm::vec4 farClip = inv * glm::vec4{x, y, 1.0F, 1.0F};
    if (std::abs(nearClip.w) < 1.0e-6F || std::abs(farClip.w) < 1.0e-6F)
    {
        return false;
    }

    const glm::vec3 nearWorld = glm::vec3(nearClip) / nearClip.w;
    const glm::vec3 farWorld = glm::vec3(farClip) / farClip.w;
    const glm::vec3 direction = farWorld - nearWorld;
    if (glm::length(direction) < 1.0e-6F)
    {
        return false;
    }

    outRay->origin = nearWorld;
    outRay->direction = glm::normalize(direction);
    return true;
}
} // namespace placer::scene
