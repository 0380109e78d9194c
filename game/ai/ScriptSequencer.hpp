#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "game/ai/AgentState.hpp"

namespace game::ai
{
enum class ScriptStepType : std::uint8_t
{
    MoveTo = 0,
    Wait,
    PlayAnimation,
    ShowDialogue,
    ChangeState,
    TriggerEvent,
    WaitForTrigger
};

[[nodiscard]] const char* ScriptStepTypeToText(ScriptStepType type);
[[nodiscard]] std::optional<ScriptStepType> ParseScriptStepType(const std::string& text);

struct ScriptStep
{
    ScriptStepType type = ScriptStepType::Wait;
    glm::vec3 targetPosition{0.0F}; ///< MoveTo destination, or investigation point for ChangeState
    float duration = 1.0F;          ///< MoveTo travel time, Wait/animation/dialogue length
    float waitTime = 0.0F;          ///< Pause after the step completes
    std::string text;               ///< Animation, dialogue line, event or trigger name
    AgentState state = AgentState::Idle;
};

struct ScriptSequence
{
    std::string name;
    std::vector<ScriptStep> steps;
    bool loop = false;
    float delayBeforeStart = 0.0F;
};

/// Presentation cue emitted by animation, dialogue and event steps.
struct ScriptCue
{
    ScriptStepType type = ScriptStepType::TriggerEvent;
    std::string text;
    float duration = 0.0F;
};

/// What a sequence acts on.
class IScriptActor
{
public:
    virtual ~IScriptActor() = default;

    [[nodiscard]] virtual glm::vec3 ScriptPosition() const = 0;
    virtual void ScriptSetPosition(const glm::vec3& position) = 0;
    virtual void ScriptChangeState(AgentState state, const glm::vec3& target) = 0;
    virtual void EmitScriptCue(const ScriptCue& cue) = 0;
};

/// Runs timed step lists against an actor. Time only advances through
/// Update(), so a paused owner simply stops calling it.
class ScriptSequencer
{
public:
    static constexpr float kDefaultDialogueSeconds = 3.0F;

    void SetSequences(std::vector<ScriptSequence> sequences);
    [[nodiscard]] const std::vector<ScriptSequence>& Sequences() const { return m_sequences; }

    bool Start(std::size_t index);
    bool StartByName(const std::string& name);
    void Stop();

    /// Releases a WaitForTrigger step with the matching name.
    void Trigger(const std::string& name);

    void Update(float deltaSeconds, IScriptActor& actor);

    [[nodiscard]] bool IsRunning() const { return m_active.has_value(); }
    [[nodiscard]] std::optional<std::size_t> CurrentSequenceIndex() const { return m_active; }
    [[nodiscard]] std::size_t CurrentStepIndex() const { return m_step; }
    [[nodiscard]] bool IsWaitingForTrigger() const;

private:
    enum class Phase
    {
        Delay,
        Step,
        PostWait
    };

    /// Returns false when the actor should get control back before the next step.
    bool EnterStep(IScriptActor& actor);
    [[nodiscard]] static float StepDuration(const ScriptStep& step);
    bool ConsumeTrigger(const std::string& name);

    std::vector<ScriptSequence> m_sequences;
    std::vector<std::string> m_firedTriggers;
    std::optional<std::size_t> m_active;
    std::size_t m_step = 0;
    Phase m_phase = Phase::Delay;
    float m_phaseElapsed = 0.0F;
    glm::vec3 m_moveFrom{0.0F};
};
} // namespace game::ai
