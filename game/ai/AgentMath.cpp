#include "game/ai/AgentMath.hpp"

#include <cmath>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec2.hpp>

namespace game::ai
{
namespace
{
constexpr float kDirectionEpsilon = 1.0e-4F;
}

float DistanceXZ(const glm::vec3& a, const glm::vec3& b)
{
    return glm::length(glm::vec2{a.x - b.x, a.z - b.z});
}

glm::vec3 FlatDirection(const glm::vec3& v, const glm::vec3& fallback)
{
    const glm::vec3 flat{v.x, 0.0F, v.z};
    const float length = glm::length(flat);
    if (length < kDirectionEpsilon)
    {
        return fallback;
    }
    return flat / length;
}

bool IsWithinFieldOfView(const glm::vec3& origin, const glm::vec3& forward, const glm::vec3& target, float fovDegrees)
{
    glm::vec3 toTarget = target - origin;
    toTarget.y = 0.0F;

    const float distance = glm::length(toTarget);
    if (distance < kDirectionEpsilon)
    {
        return true; // standing on the observer
    }

    const glm::vec3 facing = FlatDirection(forward, glm::vec3{0.0F, 0.0F, -1.0F});
    const float cosHalfFov = std::cos(glm::radians(fovDegrees) * 0.5F);
    return glm::dot(facing, toTarget / distance) >= cosHalfFov;
}
} // namespace game::ai
