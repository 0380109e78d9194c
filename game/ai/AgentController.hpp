#pragma once

#include <functional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "game/ai/AgentState.hpp"
#include "game/ai/SceneContext.hpp"

namespace game::ai
{
struct AgentTuning
{
    float patrolSpeed = 2.0F;
    float investigateSpeed = 3.0F;
    float chaseSpeed = 4.0F;
    float waitAtPatrolPoint = 2.0F;
    float arrivalRadius = 0.5F;

    float detectionRange = 5.0F;
    float fieldOfViewDegrees = 60.0F;
    float eyeHeight = 1.0F;
    float losePlayerTime = 3.0F;

    float investigationRadius = 2.0F; ///< Counts as arrived within this distance
    float investigationTime = 5.0F;
    float alertCooldown = 10.0F;
    float captureRadius = 0.5F;
};

/// Checks ranges and speeds. Fills outError with the first problem found.
[[nodiscard]] bool ValidateAgentTuning(const AgentTuning& tuning, std::string* outError);

/// State machine driver shared by every agent archetype.
///
/// Each Tick() first runs the detection test (skipped while Dead or Sleeping),
/// then the awareness hook, then the current state's update. Requests for the
/// current state and edges the machine does not allow are ignored; Dead accepts
/// nothing.
class AgentController
{
public:
    using StateChangedCallback = std::function<void(AgentId id, AgentState from, AgentState to)>;
    using TargetDetectedCallback = std::function<void(AgentId id, const glm::vec3& targetPosition)>;
    using CaptureCallback = std::function<void(AgentId id, const glm::vec3& targetPosition)>;

    AgentController(AgentId id, std::string name, SceneContext& context, const AgentTuning& tuning);
    virtual ~AgentController() = default;

    AgentController(const AgentController&) = delete;
    AgentController& operator=(const AgentController&) = delete;

    /// Enters the initial state. Tick() calls it on first use if the owner did not.
    void Init();
    void Tick(float deltaSeconds);

    void SetPatrolRoute(std::vector<glm::vec3> waypoints);
    void Investigate(const glm::vec3& position);
    void ReceiveAlert(const glm::vec3& position);
    void Wake();
    void PutToSleep();
    void Kill();
    bool RequestState(AgentState next);

    void SetPosition(const glm::vec3& position) { m_position = position; }
    void SetFacing(const glm::vec3& facing);

    void SetStateChangedCallback(StateChangedCallback callback) { m_onStateChanged = std::move(callback); }
    void SetTargetDetectedCallback(TargetDetectedCallback callback) { m_onTargetDetected = std::move(callback); }
    void SetCaptureCallback(CaptureCallback callback) { m_onCapture = std::move(callback); }

    [[nodiscard]] AgentId Id() const { return m_id; }
    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] AgentState GetState() const { return m_state; }
    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] bool IsTargetDetected() const { return m_isTargetDetected; }
    [[nodiscard]] bool IsCollisionEnabled() const { return m_collisionEnabled; }
    [[nodiscard]] const glm::vec3& Position() const { return m_position; }
    [[nodiscard]] const glm::vec3& Facing() const { return m_facing; }
    [[nodiscard]] const glm::vec3& Velocity() const { return m_velocity; }
    [[nodiscard]] const std::vector<glm::vec3>& PatrolRoute() const { return m_route; }
    [[nodiscard]] std::size_t PatrolIndex() const { return m_patrolIndex; }
    [[nodiscard]] const glm::vec3& InvestigationTarget() const { return m_investigationTarget; }
    [[nodiscard]] bool HasReachedInvestigationTarget() const { return m_investigationArrived; }
    [[nodiscard]] const glm::vec3& LastKnownTargetPosition() const { return m_lastKnownTargetPosition; }
    [[nodiscard]] float TimeSinceDetection() const { return m_timeSinceDetection; }
    [[nodiscard]] double StateEnteredAt() const { return m_stateEnteredAt; }
    [[nodiscard]] float TimeInState() const { return m_timeInState; }
    [[nodiscard]] const AgentTuning& Tuning() const { return m_tuning; }

    [[nodiscard]] static bool CanTransition(AgentState from, AgentState to);

protected:
    [[nodiscard]] virtual AgentState InitialState() const;

    /// Rising edge of the detection test. Default reaction is to give chase.
    virtual void OnTargetDetected();
    virtual void UpdateAwareness(float deltaSeconds);
    virtual void OnAlertReceived(const glm::vec3& position);
    virtual void OnEnterState(AgentState state);
    virtual void OnExitState(AgentState state);
    virtual void OnInvestigationComplete();
    virtual void OnInvestigationRetargeted();

    virtual void UpdateIdle(float deltaSeconds);
    virtual void UpdatePatrol(float deltaSeconds);
    virtual void UpdateInvestigate(float deltaSeconds);
    virtual void UpdateChase(float deltaSeconds);
    virtual void UpdateAlert(float deltaSeconds);

    bool ChangeState(AgentState next);
    /// Enters (or retargets) Investigate. Unlike Investigate() this is allowed out of Chase.
    void StartInvestigation(const glm::vec3& position);
    /// Patrol when a route exists, Idle otherwise.
    void ReturnToRoutine();
    /// Steps along the ground plane toward destination. True once within arrivalDistance.
    bool MoveTowards(const glm::vec3& destination, float speed, float deltaSeconds, float arrivalDistance);
    void StopMoving() { m_velocity = glm::vec3{0.0F}; }
    void SetPatrolIndex(std::size_t index);

    [[nodiscard]] SceneContext& Context() const { return m_context; }

private:
    void Sense(float deltaSeconds);
    [[nodiscard]] bool CanSeeTarget() const;
    void EnterState(AgentState state);
    void ExitState(AgentState state);

    AgentId m_id;
    std::string m_name;
    SceneContext& m_context;
    AgentTuning m_tuning;

    AgentState m_state = AgentState::Idle;
    double m_stateEnteredAt = 0.0;
    float m_timeInState = 0.0F;
    bool m_initialized = false;

    glm::vec3 m_position{0.0F};
    glm::vec3 m_facing{0.0F, 0.0F, -1.0F};
    glm::vec3 m_velocity{0.0F};
    bool m_collisionEnabled = true;

    std::vector<glm::vec3> m_route;
    std::size_t m_patrolIndex = 0;
    bool m_atWaypoint = false;
    bool m_routeWarningLogged = false;
    float m_dwellTimer = 0.0F;

    glm::vec3 m_investigationTarget{0.0F};
    bool m_investigationArrived = false;

    bool m_isTargetDetected = false;
    bool m_captureReported = false;
    float m_timeSinceDetection = 1.0e9F;
    glm::vec3 m_lastKnownTargetPosition{0.0F};

    StateChangedCallback m_onStateChanged;
    TargetDetectedCallback m_onTargetDetected;
    CaptureCallback m_onCapture;
};
} // namespace game::ai
