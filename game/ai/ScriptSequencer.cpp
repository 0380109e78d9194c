#include "game/ai/ScriptSequencer.hpp"

#include <algorithm>
#include <iostream>

#include <glm/common.hpp>

namespace game::ai
{
namespace
{
// Caps instant steps (ChangeState, TriggerEvent, zero-length waits) chained in one update.
constexpr int kMaxStepsPerUpdate = 64;
} // namespace

const char* ScriptStepTypeToText(ScriptStepType type)
{
    switch (type)
    {
        case ScriptStepType::MoveTo: return "move_to";
        case ScriptStepType::Wait: return "wait";
        case ScriptStepType::PlayAnimation: return "play_animation";
        case ScriptStepType::ShowDialogue: return "show_dialogue";
        case ScriptStepType::ChangeState: return "change_state";
        case ScriptStepType::TriggerEvent: return "trigger_event";
        case ScriptStepType::WaitForTrigger: return "wait_for_trigger";
        default: return "wait";
    }
}

std::optional<ScriptStepType> ParseScriptStepType(const std::string& text)
{
    if (text == "move_to")
        return ScriptStepType::MoveTo;
    if (text == "wait")
        return ScriptStepType::Wait;
    if (text == "play_animation")
        return ScriptStepType::PlayAnimation;
    if (text == "show_dialogue")
        return ScriptStepType::ShowDialogue;
    if (text == "change_state")
        return ScriptStepType::ChangeState;
    if (text == "trigger_event")
        return ScriptStepType::TriggerEvent;
    if (text == "wait_for_trigger")
        return ScriptStepType::WaitForTrigger;
    return std::nullopt;
}

void ScriptSequencer::SetSequences(std::vector<ScriptSequence> sequences)
{
    Stop();
    m_sequences = std::move(sequences);
}

bool ScriptSequencer::Start(std::size_t index)
{
    if (index >= m_sequences.size())
    {
        std::cout << "ScriptSequencer: WARNING - Invalid sequence index " << index
                  << " (" << m_sequences.size() << " sequences)\n";
        return false;
    }

    m_active = index;
    m_step = 0;
    m_phase = Phase::Delay;
    m_phaseElapsed = 0.0F;
    m_firedTriggers.clear();
    return true;
}

bool ScriptSequencer::StartByName(const std::string& name)
{
    for (std::size_t i = 0; i < m_sequences.size(); ++i)
    {
        if (m_sequences[i].name == name)
        {
            return Start(i);
        }
    }
    std::cout << "ScriptSequencer: WARNING - No sequence named '" << name << "'\n";
    return false;
}

void ScriptSequencer::Stop()
{
    m_active.reset();
    m_step = 0;
    m_phase = Phase::Delay;
    m_phaseElapsed = 0.0F;
    m_firedTriggers.clear();
}

void ScriptSequencer::Trigger(const std::string& name)
{
    if (m_active.has_value())
    {
        m_firedTriggers.push_back(name);
    }
}

bool ScriptSequencer::IsWaitingForTrigger() const
{
    if (!m_active.has_value() || m_phase != Phase::Step)
    {
        return false;
    }
    const ScriptSequence& sequence = m_sequences[*m_active];
    return m_step < sequence.steps.size() && sequence.steps[m_step].type == ScriptStepType::WaitForTrigger;
}

float ScriptSequencer::StepDuration(const ScriptStep& step)
{
    switch (step.type)
    {
        case ScriptStepType::MoveTo:
        case ScriptStepType::Wait:
        case ScriptStepType::PlayAnimation:
            return std::max(0.0F, step.duration);
        case ScriptStepType::ShowDialogue:
            return step.duration > 0.0F ? step.duration : kDefaultDialogueSeconds;
        default:
            return 0.0F;
    }
}

bool ScriptSequencer::ConsumeTrigger(const std::string& name)
{
    const auto it = std::find(m_firedTriggers.begin(), m_firedTriggers.end(), name);
    if (it == m_firedTriggers.end())
    {
        return false;
    }
    m_firedTriggers.erase(it);
    return true;
}

bool ScriptSequencer::EnterStep(IScriptActor& actor)
{
    const ScriptSequence& sequence = m_sequences[*m_active];
    if (m_step >= sequence.steps.size())
    {
        if (!sequence.loop || sequence.steps.empty())
        {
            Stop();
            return false;
        }
        m_step = 0;
    }

    m_phase = Phase::Step;
    m_phaseElapsed = 0.0F;

    const ScriptStep& step = sequence.steps[m_step];
    switch (step.type)
    {
        case ScriptStepType::MoveTo:
            m_moveFrom = actor.ScriptPosition();
            break;
        case ScriptStepType::PlayAnimation:
        case ScriptStepType::ShowDialogue:
        case ScriptStepType::TriggerEvent:
            actor.EmitScriptCue(ScriptCue{step.type, step.text, StepDuration(step)});
            break;
        case ScriptStepType::ChangeState:
            actor.ScriptChangeState(step.state, step.targetPosition);
            return false;
        default:
            break;
    }
    return true;
}

void ScriptSequencer::Update(float deltaSeconds, IScriptActor& actor)
{
    float remaining = std::max(0.0F, deltaSeconds);

    for (int iteration = 0; iteration < kMaxStepsPerUpdate && m_active.has_value(); ++iteration)
    {
        const ScriptSequence& sequence = m_sequences[*m_active];

        if (m_phase == Phase::Delay)
        {
            const float needed = sequence.delayBeforeStart - m_phaseElapsed;
            if (remaining < needed)
            {
                m_phaseElapsed += remaining;
                return;
            }
            remaining -= std::max(0.0F, needed);
            m_step = 0;
            if (!EnterStep(actor))
            {
                return;
            }
            continue;
        }

        const ScriptStep& step = sequence.steps[m_step];

        if (m_phase == Phase::Step)
        {
            if (step.type == ScriptStepType::WaitForTrigger)
            {
                if (!ConsumeTrigger(step.text))
                {
                    return;
                }
            }
            else
            {
                const float duration = StepDuration(step);
                const float needed = duration - m_phaseElapsed;
                if (remaining < needed)
                {
                    m_phaseElapsed += remaining;
                    if (step.type == ScriptStepType::MoveTo)
                    {
                        actor.ScriptSetPosition(glm::mix(m_moveFrom, step.targetPosition, m_phaseElapsed / duration));
                    }
                    return;
                }
                remaining -= std::max(0.0F, needed);
                if (step.type == ScriptStepType::MoveTo)
                {
                    actor.ScriptSetPosition(step.targetPosition);
                }
            }

            m_phase = Phase::PostWait;
            m_phaseElapsed = 0.0F;
            continue;
        }

        const float needed = step.waitTime - m_phaseElapsed;
        if (remaining < needed)
        {
            m_phaseElapsed += remaining;
            return;
        }
        remaining -= std::max(0.0F, needed);
        ++m_step;
        if (!EnterStep(actor))
        {
            return;
        }
    }
}
} // namespace game::ai
