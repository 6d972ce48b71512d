#pragma once

#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

namespace placer::scene
{
struct Ray
{
    glm::vec3 origin{0.0F};
    glm::vec3 direction{0.0F, 0.0F, -1.0F};
};

struct Aabb
{
    glm::vec3 min{1.0e9F};
    glm::vec3 max{-1.0e9F};

    [[nodiscard]] bool IsValid() const { return min.x <= max.x && min.y <= max.y && min.z <= max.z; }
    [[nodiscard]] glm::vec3 Size() const { return IsValid() ? max - min : glm::vec3{0.0F}; }
    [[nodiscard]] glm::vec3 Center() const { return IsValid() ? (min + max) * 0.5F : glm::vec3{0.0F}; }

    void Expand(const glm::vec3& point);
    void Expand(const Aabb& other);
};

struct LineSegment
{
    glm::vec3 from{0.0F};
    glm::vec3 to{0.0F};
    glm::vec3 color{1.0F};
};

// Euler angles in radians, applied X then Y then Z in the object's local frame (matrix = Rx * Ry * Rz).
glm::mat3 EulerRotationMatrix(const glm::vec3& eulerRadians);
glm::mat4 ComposeTransform(const glm::vec3& position, const glm::vec3& eulerRadians, const glm::vec3& scale);

Aabb TransformAabb(const Aabb& local, const glm::mat4& transform);

bool RayIntersectsAabb(const Ray& ray, const glm::vec3& minBounds, const glm::vec3& maxBounds, float* outT);
bool RayIntersectsTriangle(const Ray& ray, const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, float* outT);
bool RayIntersectPlane(const Ray& ray, const glm::vec3& planePoint, const glm::vec3& planeNormal, glm::vec3* outHit);
} // namespace placer::scene
