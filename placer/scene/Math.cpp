#include "placer/scene/Math.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace placer::scene
{
void Aabb::Expand(const glm::vec3& point)
{
    min = glm::min(min, point);
    max = glm::max(max, point);
}

void Aabb::Expand(const Aabb& other)
{
    if (!other.IsValid())
    {
        return;
    }
    Expand(other.min);
    Expand(other.max);
}

glm::mat3 EulerRotationMatrix(const glm::vec3& eulerRadians)
{
    glm::mat4 transform{1.0F};
    transform = glm::rotate(transform, eulerRadians.x, glm::vec3{1.0F, 0.0F, 0.0F});
    transform = glm::rotate(transform, eulerRadians.y, glm::vec3{0.0F, 1.0F, 0.0F});
    transform = glm::rotate(transform, eulerRadians.z, glm::vec3{0.0F, 0.0F, 1.0F});
    return glm::mat3(transform);
}

glm::mat4 ComposeTransform(const glm::vec3& position, const glm::vec3& eulerRadians, const glm::vec3& scale)
{
    const glm::mat4 identity{1.0F};
    return glm::translate(identity, position) * glm::mat4(EulerRotationMatrix(eulerRadians)) * glm::scale(identity, scale);
}

Aabb TransformAabb(const Aabb& local, const glm::mat4& transform)
{
    Aabb out;
    if (!local.IsValid())
    {
        return out;
    }
    const std::array<glm::vec3, 8> corners{
        glm::vec3{local.min.x, local.min.y, local.min.z},
        glm::vec3{local.max.x, local.min.y, local.min.z},
        glm::vec3{local.min.x, local.max.y, local.min.z},
        glm::vec3{local.max.x, local.max.y, local.min.z},
        glm::vec3{local.min.x, local.min.y, local.max.z},
        glm::vec3{local.max.x, local.min.y, local.max.z},
        glm::vec3{local.min.x, local.max.y, local.max.z},
        glm::vec3{local.max.x, local.max.y, local.max.z},
    };
    for (const glm::vec3& corner : corners)
    {
        out.Expand(glm::vec3(transform * glm::vec4(corner, 1.0F)));
    }
    return out;
}

bool RayIntersectsAabb(const Ray& ray, const glm::vec3& minBounds, const glm::vec3& maxBounds, float* outT)
{
    float tMin = 0.0F;
    float tMax = 1.0e6F;

    for (int axis = 0; axis < 3; ++axis)
    {
        if (std::abs(ray.direction[axis]) < 1.0e-7F)
        {
            if (ray.origin[axis] < minBounds[axis] || ray.origin[axis] > maxBounds[axis])
            {
                return false;
            }
            continue;
        }

        const float invDir = 1.0F / ray.direction[axis];
        float t1 = (minBounds[axis] - ray.origin[axis]) * invDir;
        float t2 = (maxBounds[axis] - ray.origin[axis]) * invDir;
        if (t1 > t2)
        {
            std::swap(t1, t2);
        }
        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax)
        {
            return false;
        }
    }

    if (outT != nullptr)
    {
        *outT = tMin;
    }
    return true;
}

bool RayIntersectsTriangle(const Ray& ray, const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, float* outT)
{
    constexpr float epsilon = 1.0e-7F;
    const glm::vec3 edge1 = b - a;
    const glm::vec3 edge2 = c - a;
    const glm::vec3 pvec = glm::cross(ray.direction, edge2);
    const float det = glm::dot(edge1, pvec);
    if (std::abs(det) < epsilon)
    {
        return false;
    }
    const float invDet = 1.0F / det;
    const glm::vec3 tvec = ray.origin - a;
    const float u = glm::dot(tvec, pvec) * invDet;
    if (u < 0.0F || u > 1.0F)
    {
        return false;
    }
    const glm::vec3 qvec = glm::cross(tvec, edge1);
    const float v = glm::dot(ray.direction, qvec) * invDet;
    if (v < 0.0F || (u + v) > 1.0F)
    {
        return false;
    }
    const float t = glm::dot(edge2, qvec) * invDet;
    if (t < 0.0F)
    {
        return false;
    }
    if (outT != nullptr)
    {
        *outT = t;
    }
    return true;
}

bool RayIntersectPlane(const Ray& ray, const glm::vec3& planePoint, const glm::vec3& planeNormal, glm::vec3* outHit)
{
    const float denom = glm::dot(planeNormal, ray.direction);
    if (std::abs(denom) < 1.0e-6F)
    {
        return false;
    }
    const float t = glm::dot(planePoint - ray.origin, planeNormal) / denom;
    if (t < 0.0F)
    {
        return false;
    }
    if (outHit != nullptr)
    {
        *outHit = ray.origin + ray.direction * t;
    }
    return true;
}
} // namespace placer::scene
