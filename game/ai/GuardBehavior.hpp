#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include "game/ai/AgentController.hpp"
#include "game/ai/AlertBus.hpp"
#include "game/ai/ScriptSequencer.hpp"
#include "game/ai/SuspicionMeter.hpp"

namespace game::ai
{
enum class GuardArchetype : std::uint8_t
{
    Patroller = 0,
    Stationary,
    Sleeper,
    Scripted
};

[[nodiscard]] const char* GuardArchetypeToText(GuardArchetype archetype);
[[nodiscard]] std::optional<GuardArchetype> ParseGuardArchetype(const std::string& text);

struct PatrollerArchetype
{
    bool useRandomPatrol = false;
    float chanceToChangeDirection = 0.1F; ///< Per second, while walking between waypoints
};

struct StationaryArchetype
{
    float standGuardTime = 5.0F; ///< Seconds between facing flips while Idle
};

struct SleeperArchetype
{
};

struct ScriptedArchetype
{
    std::vector<ScriptSequence> sequences;
    bool autoStart = true;
    std::size_t startingSequence = 0;
};

using ArchetypeData = std::variant<PatrollerArchetype, StationaryArchetype, SleeperArchetype, ScriptedArchetype>;

[[nodiscard]] GuardArchetype ArchetypeOf(const ArchetypeData& data);
[[nodiscard]] ArchetypeData DefaultArchetypeData(GuardArchetype archetype);

struct GuardTuning
{
    bool detectsNoise = true;
    float noiseRadius = 8.0F;
    float noiseGain = 2.0F;
    float loudMovementSpeed = 0.0F; ///< Above this speed a hidden target is still heard. 0 disables.

    float suspicionThreshold = 3.0F;
    float suspicionDecayRate = 0.5F;
    float maxSuspicion = 10.0F;

    float alertRadius = 10.0F;

    int maxSearchAttempts = 3;
    float searchRadius = 8.0F;
    float timePerSearchLocation = 4.0F;

    std::uint32_t randomSeed = 1337U;
};

[[nodiscard]] bool ValidateGuardTuning(const GuardTuning& tuning, std::string* outError);

/// Guard built on the shared state machine: suspicion from noise, alert
/// propagation to nearby guards, a bounded search after investigating, and
/// per-archetype routines.
class GuardBehavior final : public AgentController, public IAlertListener, public IScriptActor
{
public:
    using AlertBroadcastCallback = std::function<void(AgentId id, const AlertEvent& event)>;
    using ScriptCueCallback = std::function<void(AgentId id, const ScriptCue& cue)>;

    GuardBehavior(
        AgentId id,
        std::string name,
        SceneContext& context,
        const AgentTuning& agentTuning,
        const GuardTuning& guardTuning,
        ArchetypeData archetype
    );

    [[nodiscard]] GuardArchetype Archetype() const { return ArchetypeOf(m_archetype); }
    [[nodiscard]] const ArchetypeData& ArchetypeSettings() const { return m_archetype; }
    [[nodiscard]] const GuardTuning& GuardSettings() const { return m_guardTuning; }

    [[nodiscard]] float SuspicionLevel() const { return m_suspicion.Level(); }
    [[nodiscard]] const SuspicionMeter& Suspicion() const { return m_suspicion; }
    void SetSuspicionLevel(float level);
    [[nodiscard]] bool IsSuspicious() const { return m_suspicion.Level() >= m_guardTuning.suspicionThreshold; }
    [[nodiscard]] bool IsAlertIndicatorActive() const { return m_alertIndicator; }

    [[nodiscard]] bool IsSearching() const { return m_searching; }
    [[nodiscard]] int SearchAttemptsRemaining() const { return m_searchAttemptsRemaining; }
    [[nodiscard]] const glm::vec3& CurrentSearchLocation() const { return m_searchLocation; }

    [[nodiscard]] ScriptSequencer& Sequencer() { return m_sequencer; }
    [[nodiscard]] const ScriptSequencer& Sequencer() const { return m_sequencer; }

    void SetAlertBroadcastCallback(AlertBroadcastCallback callback) { m_onAlertBroadcast = std::move(callback); }
    void SetScriptCueCallback(ScriptCueCallback callback) { m_onScriptCue = std::move(callback); }

    // IAlertListener
    [[nodiscard]] AgentId ListenerId() const override { return Id(); }
    [[nodiscard]] glm::vec3 ListenerPosition() const override { return Position(); }
    [[nodiscard]] bool IsListening() const override { return GetState() != AgentState::Dead; }
    void OnAlert(const AlertEvent& event) override;

    // IScriptActor
    [[nodiscard]] glm::vec3 ScriptPosition() const override { return Position(); }
    void ScriptSetPosition(const glm::vec3& position) override;
    void ScriptChangeState(AgentState state, const glm::vec3& target) override;
    void EmitScriptCue(const ScriptCue& cue) override;

protected:
    [[nodiscard]] AgentState InitialState() const override;
    void OnTargetDetected() override;
    void UpdateAwareness(float deltaSeconds) override;
    void OnAlertReceived(const glm::vec3& position) override;
    void OnEnterState(AgentState state) override;
    void OnExitState(AgentState state) override;
    void OnInvestigationComplete() override;
    void OnInvestigationRetargeted() override;

    void UpdateIdle(float deltaSeconds) override;
    void UpdatePatrol(float deltaSeconds) override;
    void UpdateInvestigate(float deltaSeconds) override;

private:
    void BroadcastAlert();
    void BeginSearch();
    void AbortSearch();
    void PickSearchLocation();
    void FinishSearch();

    GuardTuning m_guardTuning;
    ArchetypeData m_archetype;
    SuspicionMeter m_suspicion;
    AlertSubscription m_alertSubscription;
    ScriptSequencer m_sequencer;
    std::mt19937 m_rng;

    glm::vec3 m_lastStimulusPosition{0.0F};
    bool m_hasStimulus = false;
    bool m_escalationLatched = false;
    bool m_alertIndicator = false;

    bool m_searching = false;
    int m_searchAttemptsRemaining = 0;
    glm::vec3 m_searchCenter{0.0F};
    glm::vec3 m_searchLocation{0.0F};
    float m_searchDwell = 0.0F;
    bool m_atSearchLocation = false;

    float m_standGuardTimer = 0.0F;
    bool m_scriptStarted = false;

    AlertBroadcastCallback m_onAlertBroadcast;
    ScriptCueCallback m_onScriptCue;
};
} // namespace game::ai
