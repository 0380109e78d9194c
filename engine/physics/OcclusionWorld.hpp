#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

namespace engine::physics
{
using ObstacleId = std::uint32_t;

constexpr ObstacleId kInvalidObstacleId = 0;

/// Axis-aligned box that can stop sight lines.
struct Obstacle
{
    ObstacleId id = kInvalidObstacleId;
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
    bool blocksSight = true;
};

struct RaycastHit
{
    ObstacleId obstacle = kInvalidObstacleId;
    float t = 1.0F;
    glm::vec3 position{0.0F};
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
};

/// Static occluder set for sight tests. Agents and the target are never part
/// of it, so a ray is only ever stopped by level geometry.
class OcclusionWorld
{
public:
    explicit OcclusionWorld(float cellSize = 8.0F);

    void Clear();

    ObstacleId AddObstacle(const glm::vec3& center, const glm::vec3& halfExtents, bool blocksSight = true);
    bool RemoveObstacle(ObstacleId id);
    bool SetBlocksSight(ObstacleId id, bool blocksSight);

    [[nodiscard]] const Obstacle* FindObstacle(ObstacleId id) const;
    [[nodiscard]] const std::vector<Obstacle>& Obstacles() const { return m_obstacles; }
    [[nodiscard]] std::size_t ObstacleCount() const { return m_obstacles.size(); }

    [[nodiscard]] bool HasLineOfSight(const glm::vec3& from, const glm::vec3& to) const;
    [[nodiscard]] std::optional<RaycastHit> RaycastNearest(const glm::vec3& from, const glm::vec3& to) const;

    /// Slab test of segment [from, to] against a box. t is in [0, 1] along the segment.
    static bool SegmentIntersectsBox(
        const glm::vec3& from,
        const glm::vec3& to,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float* outT,
        glm::vec3* outNormal
    );

private:
    struct CellKey
    {
        int x = 0;
        int y = 0;
        int z = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            const std::size_t hz = static_cast<std::size_t>(key.z) * 83492791U;
            return hx ^ hy ^ hz;
        }
    };

    void RebuildCells() const;
    void GatherCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds) const;

    std::vector<Obstacle> m_obstacles;
    ObstacleId m_nextId = 1;
    float m_cellSize;

    mutable std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> m_cells;
    mutable std::vector<std::size_t> m_candidates;
    mutable std::vector<std::uint32_t> m_visitStamp;
    mutable std::uint32_t m_currentStamp = 1;
    mutable bool m_cellsDirty = true;
};
} // namespace engine::physics
