#include "placer/scene/OrbitController.hpp"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>

#include "placer/scene/Camera.hpp"

namespace placer::scene
{
OrbitController::OrbitController(Camera& camera, const OrbitSettings& settings)
    : m_camera(camera)
    , m_settings(settings)
{
    m_target = m_camera.Target();
    SyncFromCamera();
}

void OrbitController::SetEnabled(bool enabled)
{
    m_enabled = enabled;
    if (!enabled)
    {
        m_thetaDelta = 0.0F;
        m_phiDelta = 0.0F;
        m_zoomScale = 1.0F;
        m_panOffset = glm::vec3{0.0F};
    }
}

void OrbitController::SetTarget(const glm::vec3& target)
{
    m_target = target;
    m_camera.LookAt(target);
    SyncFromCamera();
}

void OrbitController::SyncFromCamera()
{
    const glm::vec3 offset = m_camera.Position() - m_target;
    m_radius = std::max(1.0e-3F, glm::length(offset));
    m_theta = std::atan2(offset.x, offset.z);
    m_phi = std::acos(std::clamp(offset.y / m_radius, -1.0F, 1.0F));
}

void OrbitController::Rotate(const glm::vec2& pixelDelta)
{
    if (!m_enabled)
    {
        return;
    }
    m_thetaDelta -= pixelDelta.x * m_settings.rotateSpeed;
    m_phiDelta -= pixelDelta.y * m_settings.rotateSpeed;
}

void OrbitController::Pan(const glm::vec2& pixelDelta)
{
    if (!m_enabled)
    {
        return;
    }
    const glm::vec3 forward = m_camera.Forward();
    glm::vec3 right = glm::cross(forward, glm::vec3{0.0F, 1.0F, 0.0F});
    if (glm::length(right) < 1.0e-6F)
    {
        right = glm::vec3{1.0F, 0.0F, 0.0F};
    }
    right = glm::normalize(right);
    const glm::vec3 up = glm::normalize(glm::cross(right, forward));
    const float scale = m_radius * m_settings.panSpeed;
    m_panOffset += (-right * pixelDelta.x + up * pixelDelta.y) * scale;
}

void OrbitController::Zoom(float wheelSteps)
{
    if (!m_enabled || wheelSteps == 0.0F)
    {
        return;
    }
    m_zoomScale *= std::pow(m_settings.zoomStep, wheelSteps);
}

void OrbitController::Update()
{
    const float damping = std::clamp(m_settings.dampingFactor, 0.0F, 1.0F);

    m_theta += m_thetaDelta * damping;
    m_phi = std::clamp(m_phi + m_phiDelta * damping, 1.0e-3F, m_settings.maxPolarAngle);
    m_radius = std::clamp(m_radius * (1.0F + (m_zoomScale - 1.0F) * damping), m_settings.minDistance, m_settings.maxDistance);
    m_target += m_panOffset * damping;

    m_thetaDelta *= (1.0F - damping);
    m_phiDelta *= (1.0F - damping);
    m_zoomScale = 1.0F + (m_zoomScale - 1.0F) * (1.0F - damping);
    m_panOffset *= (1.0F - damping);

    const float sinPhi = std::sin(m_phi);
    const glm::vec3 offset{
        m_radius * sinPhi * std::sin(m_theta),
        m_radius * std::cos(m_phi),
        m_radius * sinPhi * std::cos(m_theta),
    };
    m_camera.SetPosition(m_target + offset);
    m_camera.LookAt(m_target);
}

void OrbitController::Dispose()
{
    SetEnabled(false);
}
} // namespace placer::scene
