#pragma once

#include <glm/vec3.hpp>

namespace game::ai
{
[[nodiscard]] float DistanceXZ(const glm::vec3& a, const glm::vec3& b);

/// Unit direction on the ground plane, or fallback when the input has no XZ length.
[[nodiscard]] glm::vec3 FlatDirection(const glm::vec3& v, const glm::vec3& fallback);

/// True when target lies within fovDegrees/2 of forward, measured on the XZ plane.
[[nodiscard]] bool IsWithinFieldOfView(
    const glm::vec3& origin,
    const glm::vec3& forward,
    const glm::vec3& target,
    float fovDegrees
);
} // namespace game::ai
