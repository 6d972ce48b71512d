#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace placer::scene
{
class Camera;

struct OrbitSettings
{
    float dampingFactor = 0.1F;
    float minDistance = 1.0F;
    float maxDistance = 500.0F;
    float maxPolarAngle = 1.5207963F; // pi/2 - 0.05, keeps the camera above the ground
    float rotateSpeed = 0.005F;
    float panSpeed = 0.002F;
    float zoomStep = 0.9F;
};

// Damped orbit around a target point. Input accumulates deltas that Update() eases in.
class OrbitController
{
public:
    explicit OrbitController(Camera& camera, const OrbitSettings& settings = OrbitSettings{});

    void SetEnabled(bool enabled);
    [[nodiscard]] bool IsEnabled() const { return m_enabled; }

    void SetTarget(const glm::vec3& target);
    [[nodiscard]] const glm::vec3& Target() const { return m_target; }

    // Re-derives the spherical state from the camera's current position.
    void SyncFromCamera();

    void Rotate(const glm::vec2& pixelDelta);
    void Pan(const glm::vec2& pixelDelta);
    void Zoom(float wheelSteps);

    void Update();
    void Dispose();

    [[nodiscard]] float Distance() const { return m_radius; }

private:
    Camera& m_camera;
    OrbitSettings m_settings;
    bool m_enabled = true;
    glm::vec3 m_target{0.0F};
    float m_radius = 10.0F;
    float m_theta = 0.0F;
    float m_phi = 1.0F;
    float m_thetaDelta = 0.0F;
    float m_phiDelta = 0.0F;
    float m_zoomScale = 1.0F;
    glm::vec3 m_panOffset{0.0F};
};
} // namespace placer::scene
