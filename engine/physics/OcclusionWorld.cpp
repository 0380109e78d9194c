#include "engine/physics/OcclusionWorld.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>

namespace engine::physics
{
namespace
{
// Queries spanning more cells than this scan the obstacle list directly.
constexpr long long kMaxQueryCells = 4096;

int CellCoord(float value, float cellSize)
{
    return static_cast<int>(std::floor(value / cellSize));
}
} // namespace

OcclusionWorld::OcclusionWorld(float cellSize)
    : m_cellSize(std::max(0.5F, cellSize))
{
}

void OcclusionWorld::Clear()
{
    m_obstacles.clear();
    m_cells.clear();
    m_candidates.clear();
    m_visitStamp.clear();
    m_currentStamp = 1;
    m_cellsDirty = true;
}

ObstacleId OcclusionWorld::AddObstacle(const glm::vec3& center, const glm::vec3& halfExtents, bool blocksSight)
{
    Obstacle obstacle;
    obstacle.id = m_nextId++;
    obstacle.center = center;
    obstacle.halfExtents = glm::abs(halfExtents);
    obstacle.blocksSight = blocksSight;
    m_obstacles.push_back(obstacle);
    m_cellsDirty = true;
    return obstacle.id;
}

bool OcclusionWorld::RemoveObstacle(ObstacleId id)
{
    const auto it = std::find_if(m_obstacles.begin(), m_obstacles.end(), [id](const Obstacle& obstacle) {
        return obstacle.id == id;
    });
    if (it == m_obstacles.end())
    {
        return false;
    }

    m_obstacles.erase(it);
    m_cellsDirty = true;
    return true;
}

bool OcclusionWorld::SetBlocksSight(ObstacleId id, bool blocksSight)
{
    for (Obstacle& obstacle : m_obstacles)
    {
        if (obstacle.id == id)
        {
            obstacle.blocksSight = blocksSight;
            return true;
        }
    }
    return false;
}

const Obstacle* OcclusionWorld::FindObstacle(ObstacleId id) const
{
    for (const Obstacle& obstacle : m_obstacles)
    {
        if (obstacle.id == id)
        {
            return &obstacle;
        }
    }
    return nullptr;
}

bool OcclusionWorld::HasLineOfSight(const glm::vec3& from, const glm::vec3& to) const
{
    GatherCandidates(glm::min(from, to), glm::max(from, to));

    for (const std::size_t index : m_candidates)
    {
        const Obstacle& obstacle = m_obstacles[index];
        if (!obstacle.blocksSight)
        {
            continue;
        }

        if (SegmentIntersectsBox(from, to, obstacle.center - obstacle.halfExtents, obstacle.center + obstacle.halfExtents, nullptr, nullptr))
        {
            return false;
        }
    }

    return true;
}

std::optional<RaycastHit> OcclusionWorld::RaycastNearest(const glm::vec3& from, const glm::vec3& to) const
{
    std::optional<RaycastHit> best;
    GatherCandidates(glm::min(from, to), glm::max(from, to));

    for (const std::size_t index : m_candidates)
    {
        const Obstacle& obstacle = m_obstacles[index];
        if (!obstacle.blocksSight)
        {
            continue;
        }

        float hitT = 1.0F;
        glm::vec3 hitNormal{0.0F, 1.0F, 0.0F};
        if (!SegmentIntersectsBox(from, to, obstacle.center - obstacle.halfExtents, obstacle.center + obstacle.halfExtents, &hitT, &hitNormal))
        {
            continue;
        }

        if (!best.has_value() || hitT < best->t)
        {
            RaycastHit hit;
            hit.obstacle = obstacle.id;
            hit.t = hitT;
            hit.normal = hitNormal;
            hit.position = from + (to - from) * hitT;
            best = hit;
        }
    }

    return best;
}

bool OcclusionWorld::SegmentIntersectsBox(
    const glm::vec3& from,
    const glm::vec3& to,
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    float* outT,
    glm::vec3* outNormal
)
{
    const glm::vec3 direction = to - from;

    float tEnter = 0.0F;
    float tExit = 1.0F;
    glm::vec3 enterNormal{0.0F, 1.0F, 0.0F};

    for (int axis = 0; axis < 3; ++axis)
    {
        const float origin = from[axis];
        const float delta = direction[axis];

        if (std::abs(delta) < 1.0e-7F)
        {
            // Parallel to this slab: either inside it for the whole segment or never.
            if (origin < minBounds[axis] || origin > maxBounds[axis])
            {
                return false;
            }
            continue;
        }

        const float inverse = 1.0F / delta;
        float tNear = (minBounds[axis] - origin) * inverse;
        float tFar = (maxBounds[axis] - origin) * inverse;
        float normalSign = -1.0F;
        if (tNear > tFar)
        {
            std::swap(tNear, tFar);
            normalSign = 1.0F;
        }

        if (tNear > tEnter)
        {
            tEnter = tNear;
            enterNormal = glm::vec3{0.0F};
            enterNormal[axis] = normalSign;
        }

        tExit = std::min(tExit, tFar);
        if (tEnter > tExit)
        {
            return false;
        }
    }

    if (outT != nullptr)
    {
        *outT = tEnter;
    }
    if (outNormal != nullptr)
    {
        *outNormal = enterNormal;
    }
    return true;
}

void OcclusionWorld::RebuildCells() const
{
    if (!m_cellsDirty)
    {
        return;
    }

    m_cells.clear();
    m_visitStamp.assign(m_obstacles.size(), 0U);
    m_currentStamp = 1;

    for (std::size_t index = 0; index < m_obstacles.size(); ++index)
    {
        const Obstacle& obstacle = m_obstacles[index];
        const glm::vec3 minBounds = obstacle.center - obstacle.halfExtents;
        const glm::vec3 maxBounds = obstacle.center + obstacle.halfExtents;

        for (int z = CellCoord(minBounds.z, m_cellSize); z <= CellCoord(maxBounds.z, m_cellSize); ++z)
        {
            for (int y = CellCoord(minBounds.y, m_cellSize); y <= CellCoord(maxBounds.y, m_cellSize); ++y)
            {
                for (int x = CellCoord(minBounds.x, m_cellSize); x <= CellCoord(maxBounds.x, m_cellSize); ++x)
                {
                    m_cells[CellKey{x, y, z}].push_back(index);
                }
            }
        }
    }

    m_cellsDirty = false;
}

void OcclusionWorld::GatherCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds) const
{
    RebuildCells();
    m_candidates.clear();

    if (m_obstacles.empty())
    {
        return;
    }

    const int minX = CellCoord(minBounds.x, m_cellSize);
    const int minY = CellCoord(minBounds.y, m_cellSize);
    const int minZ = CellCoord(minBounds.z, m_cellSize);
    const int maxX = CellCoord(maxBounds.x, m_cellSize);
    const int maxY = CellCoord(maxBounds.y, m_cellSize);
    const int maxZ = CellCoord(maxBounds.z, m_cellSize);

    const long long cellCount = static_cast<long long>(maxX - minX + 1) *
                                static_cast<long long>(maxY - minY + 1) *
                                static_cast<long long>(maxZ - minZ + 1);
    if (cellCount > kMaxQueryCells)
    {
        m_candidates.reserve(m_obstacles.size());
        for (std::size_t index = 0; index < m_obstacles.size(); ++index)
        {
            m_candidates.push_back(index);
        }
        return;
    }

    ++m_currentStamp;
    if (m_currentStamp == 0)
    {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0U);
        m_currentStamp = 1;
    }

    for (int z = minZ; z <= maxZ; ++z)
    {
        for (int y = minY; y <= maxY; ++y)
        {
            for (int x = minX; x <= maxX; ++x)
            {
                const auto cellIt = m_cells.find(CellKey{x, y, z});
                if (cellIt == m_cells.end())
                {
                    continue;
                }

                for (const std::size_t index : cellIt->second)
                {
                    if (m_visitStamp[index] == m_currentStamp)
                    {
                        continue;
                    }
                    m_visitStamp[index] = m_currentStamp;
                    m_candidates.push_back(index);
                }
            }
        }
    }
}
} // namespace engine::physics
