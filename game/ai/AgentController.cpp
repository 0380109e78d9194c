#include "game/ai/AgentController.hpp"

#include <algorithm>
#include <iostream>

#include <glm/geometric.hpp>

#include "game/ai/AgentMath.hpp"

namespace game::ai
{
namespace
{
constexpr float kChaseArrivalDistance = 0.05F;

bool IsNonNegative(float value)
{
    return value >= 0.0F;
}
} // namespace

bool ValidateAgentTuning(const AgentTuning& tuning, std::string* outError)
{
    const auto fail = [outError](const char* message) {
        if (outError != nullptr)
        {
            *outError = message;
        }
        return false;
    };

    if (!IsNonNegative(tuning.patrolSpeed) || !IsNonNegative(tuning.investigateSpeed) || !IsNonNegative(tuning.chaseSpeed))
    {
        return fail("movement speeds must be non-negative");
    }
    if (!IsNonNegative(tuning.detectionRange))
    {
        return fail("detection range must be non-negative");
    }
    if (tuning.fieldOfViewDegrees <= 0.0F || tuning.fieldOfViewDegrees > 360.0F)
    {
        return fail("field of view must be in (0, 360] degrees");
    }
    if (!IsNonNegative(tuning.waitAtPatrolPoint) || !IsNonNegative(tuning.investigationTime) ||
        !IsNonNegative(tuning.alertCooldown) || !IsNonNegative(tuning.losePlayerTime))
    {
        return fail("timers must be non-negative");
    }
    if (!IsNonNegative(tuning.arrivalRadius) || !IsNonNegative(tuning.investigationRadius) || !IsNonNegative(tuning.captureRadius))
    {
        return fail("arrival and capture radii must be non-negative");
    }
    return true;
}

AgentController::AgentController(AgentId id, std::string name, SceneContext& context, const AgentTuning& tuning)
    : m_id(id)
    , m_name(std::move(name))
    , m_context(context)
    , m_tuning(tuning)
{
    if (m_name.empty())
    {
        m_name = "agent_" + std::to_string(id);
    }
}

bool AgentController::CanTransition(AgentState from, AgentState to)
{
    if (from == to)
    {
        return false;
    }

    switch (from)
    {
        case AgentState::Dead:
            return false;
        case AgentState::Sleeping:
            return to == AgentState::Alert || to == AgentState::Dead;
        case AgentState::Chase:
            return to == AgentState::Investigate || to == AgentState::Dead;
        case AgentState::Idle:
        case AgentState::Patrol:
            return true;
        case AgentState::Investigate:
        case AgentState::Alert:
            return to != AgentState::Sleeping;
        default:
            return false;
    }
}

AgentState AgentController::InitialState() const
{
    return m_route.empty() ? AgentState::Idle : AgentState::Patrol;
}

void AgentController::Init()
{
    if (m_initialized)
    {
        return;
    }

    m_initialized = true;
    m_state = InitialState();
    m_stateEnteredAt = m_context.ElapsedSeconds();
    m_timeInState = 0.0F;
    EnterState(m_state);
}

void AgentController::Tick(float deltaSeconds)
{
    if (!m_initialized)
    {
        Init();
    }

    if (m_state == AgentState::Dead)
    {
        return;
    }

    const float dt = std::max(0.0F, deltaSeconds);
    m_timeInState += dt;

    if (m_state != AgentState::Sleeping)
    {
        Sense(dt);
    }
    UpdateAwareness(dt);

    switch (m_state)
    {
        case AgentState::Idle: UpdateIdle(dt); break;
        case AgentState::Patrol: UpdatePatrol(dt); break;
        case AgentState::Investigate: UpdateInvestigate(dt); break;
        case AgentState::Chase: UpdateChase(dt); break;
        case AgentState::Alert: UpdateAlert(dt); break;
        case AgentState::Dead:
        case AgentState::Sleeping:
        default:
            break;
    }
}

void AgentController::Sense(float deltaSeconds)
{
    const bool detected = CanSeeTarget();
    if (detected)
    {
        m_timeSinceDetection = 0.0F;
        m_lastKnownTargetPosition = m_context.Target().Position();
    }
    else
    {
        m_timeSinceDetection += deltaSeconds;
    }

    const bool risingEdge = detected && !m_isTargetDetected;
    m_isTargetDetected = detected;

    if (risingEdge)
    {
        if (m_onTargetDetected)
        {
            m_onTargetDetected(m_id, m_lastKnownTargetPosition);
        }
        OnTargetDetected();
    }
}

bool AgentController::CanSeeTarget() const
{
    const stealth::StealthTarget& target = m_context.Target();
    if (target.IsHidden())
    {
        return false;
    }

    const glm::vec3& targetPosition = target.Position();
    if (DistanceXZ(m_position, targetPosition) > m_tuning.detectionRange)
    {
        return false;
    }

    if (!IsWithinFieldOfView(m_position, m_facing, targetPosition, m_tuning.fieldOfViewDegrees))
    {
        return false;
    }

    const glm::vec3 eyeOffset{0.0F, m_tuning.eyeHeight, 0.0F};
    return m_context.Occlusion().HasLineOfSight(m_position + eyeOffset, targetPosition + eyeOffset);
}

void AgentController::OnTargetDetected()
{
    ChangeState(AgentState::Chase);
}

void AgentController::UpdateAwareness(float /*deltaSeconds*/)
{
}

void AgentController::OnAlertReceived(const glm::vec3& /*position*/)
{
}

void AgentController::OnEnterState(AgentState /*state*/)
{
}

void AgentController::OnExitState(AgentState /*state*/)
{
}

void AgentController::OnInvestigationComplete()
{
    ReturnToRoutine();
}

void AgentController::OnInvestigationRetargeted()
{
}

bool AgentController::ChangeState(AgentState next)
{
    if (!m_initialized)
    {
        Init();
    }

    if (next == AgentState::Patrol && m_route.empty())
    {
        if (!m_routeWarningLogged)
        {
            std::cout << "Agent '" << m_name << "': WARNING - Patrol requested without a patrol route, staying Idle\n";
            m_routeWarningLogged = true;
        }
        next = AgentState::Idle;
    }

    if (!CanTransition(m_state, next))
    {
        return false;
    }

    const AgentState previous = m_state;
    ExitState(previous);

    m_state = next;
    m_stateEnteredAt = m_context.ElapsedSeconds();
    m_timeInState = 0.0F;
    EnterState(next);

    if (m_onStateChanged)
    {
        m_onStateChanged(m_id, previous, next);
    }
    return true;
}

bool AgentController::RequestState(AgentState next)
{
    return ChangeState(next);
}

void AgentController::EnterState(AgentState state)
{
    switch (state)
    {
        case AgentState::Patrol:
            m_atWaypoint = false;
            m_dwellTimer = 0.0F;
            break;
        case AgentState::Investigate:
            m_investigationArrived = false;
            m_dwellTimer = 0.0F;
            StopMoving();
            break;
        case AgentState::Chase:
            if (!m_isTargetDetected)
            {
                m_timeSinceDetection = 0.0F;
            }
            m_captureReported = false;
            break;
        case AgentState::Dead:
            m_collisionEnabled = false;
            m_isTargetDetected = false;
            break;
        default:
            break;
    }

    if (IsStationaryState(state))
    {
        StopMoving();
    }

    OnEnterState(state);
}

void AgentController::ExitState(AgentState state)
{
    switch (state)
    {
        case AgentState::Investigate:
            m_investigationArrived = false;
            m_dwellTimer = 0.0F;
            break;
        case AgentState::Chase:
            m_captureReported = false;
            break;
        case AgentState::Patrol:
            m_atWaypoint = false;
            m_dwellTimer = 0.0F;
            break;
        default:
            break;
    }

    OnExitState(state);
}

void AgentController::SetPatrolRoute(std::vector<glm::vec3> waypoints)
{
    m_route = std::move(waypoints);
    m_patrolIndex = 0;
    m_atWaypoint = false;
    m_dwellTimer = 0.0F;
    m_routeWarningLogged = false;

    if (m_state == AgentState::Patrol && m_route.empty())
    {
        ChangeState(AgentState::Idle);
    }
}

void AgentController::SetPatrolIndex(std::size_t index)
{
    if (m_route.empty())
    {
        return;
    }
    m_patrolIndex = index % m_route.size();
    m_atWaypoint = false;
    m_dwellTimer = 0.0F;
}

void AgentController::SetFacing(const glm::vec3& facing)
{
    m_facing = FlatDirection(facing, m_facing);
}

void AgentController::Investigate(const glm::vec3& position)
{
    if (m_state == AgentState::Dead || m_state == AgentState::Sleeping || m_state == AgentState::Chase)
    {
        return;
    }
    StartInvestigation(position);
}

void AgentController::StartInvestigation(const glm::vec3& position)
{
    if (m_state == AgentState::Dead || m_state == AgentState::Sleeping)
    {
        return;
    }

    m_investigationTarget = position;
    if (m_state == AgentState::Investigate)
    {
        m_investigationArrived = false;
        m_dwellTimer = 0.0F;
        OnInvestigationRetargeted();
        return;
    }

    ChangeState(AgentState::Investigate);
}

void AgentController::ReceiveAlert(const glm::vec3& position)
{
    if (m_state == AgentState::Dead || m_state == AgentState::Chase)
    {
        return;
    }

    if (m_state == AgentState::Sleeping)
    {
        Wake();
    }

    OnAlertReceived(position);
    StartInvestigation(position);
}

void AgentController::Wake()
{
    if (m_state == AgentState::Sleeping)
    {
        ChangeState(AgentState::Alert);
    }
}

void AgentController::PutToSleep()
{
    ChangeState(AgentState::Sleeping);
}

void AgentController::Kill()
{
    ChangeState(AgentState::Dead);
}

void AgentController::ReturnToRoutine()
{
    ChangeState(m_route.empty() ? AgentState::Idle : AgentState::Patrol);
}

bool AgentController::MoveTowards(const glm::vec3& destination, float speed, float deltaSeconds, float arrivalDistance)
{
    glm::vec3 delta = destination - m_position;
    delta.y = 0.0F;
    const float distance = glm::length(delta);
    if (distance <= arrivalDistance)
    {
        StopMoving();
        return true;
    }

    const glm::vec3 direction = delta / distance;
    const float step = std::min(distance, std::max(0.0F, speed) * deltaSeconds);
    m_position += direction * step;
    m_facing = direction;
    m_velocity = direction * speed;

    return distance - step <= arrivalDistance;
}

void AgentController::UpdateIdle(float /*deltaSeconds*/)
{
    if (!m_route.empty())
    {
        ChangeState(AgentState::Patrol);
    }
}

void AgentController::UpdatePatrol(float deltaSeconds)
{
    if (m_route.empty())
    {
        ChangeState(AgentState::Idle);
        return;
    }

    m_patrolIndex %= m_route.size();
    if (!m_atWaypoint)
    {
        if (MoveTowards(m_route[m_patrolIndex], m_tuning.patrolSpeed, deltaSeconds, m_tuning.arrivalRadius))
        {
            m_atWaypoint = true;
            m_dwellTimer = 0.0F;
            StopMoving();
        }
        return;
    }

    m_dwellTimer += deltaSeconds;
    if (m_dwellTimer >= m_tuning.waitAtPatrolPoint)
    {
        m_patrolIndex = (m_patrolIndex + 1) % m_route.size();
        m_atWaypoint = false;
        m_dwellTimer = 0.0F;
    }
}

void AgentController::UpdateInvestigate(float deltaSeconds)
{
    if (!m_investigationArrived)
    {
        if (MoveTowards(m_investigationTarget, m_tuning.investigateSpeed, deltaSeconds, m_tuning.investigationRadius))
        {
            m_investigationArrived = true;
            m_dwellTimer = 0.0F;
            StopMoving();
        }
        return;
    }

    m_dwellTimer += deltaSeconds;
    if (m_dwellTimer >= m_tuning.investigationTime)
    {
        OnInvestigationComplete();
    }
}

void AgentController::UpdateChase(float deltaSeconds)
{
    if (!m_isTargetDetected && m_timeSinceDetection > m_tuning.losePlayerTime)
    {
        StartInvestigation(m_lastKnownTargetPosition);
        return;
    }

    MoveTowards(m_lastKnownTargetPosition, m_tuning.chaseSpeed, deltaSeconds, kChaseArrivalDistance);

    const glm::vec3& targetPosition = m_context.Target().Position();
    const bool inReach = m_isTargetDetected && DistanceXZ(m_position, targetPosition) < m_tuning.captureRadius;
    if (!inReach)
    {
        m_captureReported = false;
        return;
    }

    if (!m_captureReported)
    {
        m_captureReported = true;
        if (m_onCapture)
        {
            m_onCapture(m_id, targetPosition);
        }
    }
}

void AgentController::UpdateAlert(float /*deltaSeconds*/)
{
    StopMoving();
    if (m_timeInState >= m_tuning.alertCooldown)
    {
        ReturnToRoutine();
    }
}
} // namespace game::ai
