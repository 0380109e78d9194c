#include "game/ai/GuardBehavior.hpp"

#include <cmath>
#include <iostream>

#include "game/ai/AgentMath.hpp"

namespace game::ai
{
namespace
{
constexpr float kTwoPi = 6.28318530718F;
}

const char* GuardArchetypeToText(GuardArchetype archetype)
{
    switch (archetype)
    {
        case GuardArchetype::Patroller: return "patroller";
        case GuardArchetype::Stationary: return "stationary";
        case GuardArchetype::Sleeper: return "sleeper";
        case GuardArchetype::Scripted: return "scripted";
        default: return "patroller";
    }
}

std::optional<GuardArchetype> ParseGuardArchetype(const std::string& text)
{
    if (text == "patroller")
        return GuardArchetype::Patroller;
    if (text == "stationary")
        return GuardArchetype::Stationary;
    if (text == "sleeper")
        return GuardArchetype::Sleeper;
    if (text == "scripted")
        return GuardArchetype::Scripted;
    return std::nullopt;
}

GuardArchetype ArchetypeOf(const ArchetypeData& data)
{
    return static_cast<GuardArchetype>(data.index());
}

ArchetypeData DefaultArchetypeData(GuardArchetype archetype)
{
    switch (archetype)
    {
        case GuardArchetype::Stationary: return StationaryArchetype{};
        case GuardArchetype::Sleeper: return SleeperArchetype{};
        case GuardArchetype::Scripted: return ScriptedArchetype{};
        case GuardArchetype::Patroller:
        default:
            return PatrollerArchetype{};
    }
}

bool ValidateGuardTuning(const GuardTuning& tuning, std::string* outError)
{
    const auto fail = [outError](const char* message) {
        if (outError != nullptr)
        {
            *outError = message;
        }
        return false;
    };

    if (tuning.noiseRadius < 0.0F || tuning.noiseGain < 0.0F || tuning.loudMovementSpeed < 0.0F)
    {
        return fail("noise settings must be non-negative");
    }
    if (tuning.maxSuspicion <= 0.0F || tuning.suspicionDecayRate < 0.0F)
    {
        return fail("max suspicion must be positive and decay non-negative");
    }
    if (tuning.suspicionThreshold <= 0.0F || tuning.suspicionThreshold > tuning.maxSuspicion)
    {
        return fail("suspicion threshold must be in (0, maxSuspicion]");
    }
    if (tuning.alertRadius < 0.0F)
    {
        return fail("alert radius must be non-negative");
    }
    if (tuning.maxSearchAttempts < 0 || tuning.searchRadius < 0.0F || tuning.timePerSearchLocation < 0.0F)
    {
        return fail("search settings must be non-negative");
    }
    return true;
}

GuardBehavior::GuardBehavior(
    AgentId id,
    std::string name,
    SceneContext& context,
    const AgentTuning& agentTuning,
    const GuardTuning& guardTuning,
    ArchetypeData archetype
)
    : AgentController(id, std::move(name), context, agentTuning)
    , m_guardTuning(guardTuning)
    , m_archetype(std::move(archetype))
    , m_suspicion(guardTuning.maxSuspicion, guardTuning.suspicionDecayRate)
    , m_rng(guardTuning.randomSeed + id)
{
    m_alertSubscription = context.Alerts().Subscribe(*this);

    if (const auto* scripted = std::get_if<ScriptedArchetype>(&m_archetype))
    {
        m_sequencer.SetSequences(scripted->sequences);
    }
}

void GuardBehavior::SetSuspicionLevel(float level)
{
    m_suspicion.Set(level);
}

AgentState GuardBehavior::InitialState() const
{
    switch (Archetype())
    {
        case GuardArchetype::Patroller:
            if (PatrolRoute().empty())
            {
                std::cout << "Guard '" << Name() << "': WARNING - Patroller has no patrol route, falling back to Idle\n";
                return AgentState::Idle;
            }
            return AgentState::Patrol;
        case GuardArchetype::Sleeper:
            return AgentState::Sleeping;
        case GuardArchetype::Stationary:
        case GuardArchetype::Scripted:
        default:
            return AgentState::Idle;
    }
}

void GuardBehavior::OnTargetDetected()
{
    if (Archetype() == GuardArchetype::Scripted)
    {
        return;
    }

    m_suspicion.PinToMax();
    m_escalationLatched = true;
    m_alertIndicator = true;
    m_lastStimulusPosition = LastKnownTargetPosition();
    m_hasStimulus = true;

    AgentController::OnTargetDetected();
    BroadcastAlert();
}

void GuardBehavior::BroadcastAlert()
{
    AlertEvent event;
    event.origin = LastKnownTargetPosition();
    event.broadcasterPosition = Position();
    event.radius = m_guardTuning.alertRadius;
    event.timestamp = Context().ElapsedSeconds();
    event.sourceId = Id();

    if (Context().Alerts().Publish(event) && m_onAlertBroadcast)
    {
        m_onAlertBroadcast(Id(), event);
    }
}

void GuardBehavior::UpdateAwareness(float deltaSeconds)
{
    bool stimulus = IsTargetDetected();

    const bool canHear = m_guardTuning.detectsNoise &&
                         Archetype() != GuardArchetype::Scripted &&
                         GetState() != AgentState::Sleeping &&
                         m_guardTuning.noiseRadius > 0.0F;
    if (!IsTargetDetected() && canHear)
    {
        const stealth::StealthTarget& target = Context().Target();
        const bool loud = m_guardTuning.loudMovementSpeed > 0.0F && target.MovementSpeed() > m_guardTuning.loudMovementSpeed;
        const bool audible = target.IsMoving() && (!target.IsHidden() || loud);
        const float distance = DistanceXZ(Position(), target.Position());

        if (audible && distance < m_guardTuning.noiseRadius)
        {
            const float noiseFactor = 1.0F - distance / m_guardTuning.noiseRadius;
            m_suspicion.Add(noiseFactor * deltaSeconds * m_guardTuning.noiseGain);
            m_lastStimulusPosition = target.Position();
            m_hasStimulus = true;
            stimulus = true;
        }
    }

    if (!stimulus)
    {
        m_suspicion.Decay(deltaSeconds);
    }

    if (!IsSuspicious())
    {
        m_escalationLatched = false;
        return;
    }

    const AgentState state = GetState();
    if (m_escalationLatched || (state != AgentState::Idle && state != AgentState::Patrol))
    {
        return;
    }

    m_escalationLatched = true;
    StartInvestigation(m_hasStimulus ? m_lastStimulusPosition : Position());
}

void GuardBehavior::OnAlert(const AlertEvent& event)
{
    ReceiveAlert(event.origin);
}

void GuardBehavior::OnAlertReceived(const glm::vec3& position)
{
    m_suspicion.PinToMax();
    m_escalationLatched = true;
    m_alertIndicator = true;
    m_lastStimulusPosition = position;
    m_hasStimulus = true;
}

void GuardBehavior::OnEnterState(AgentState state)
{
    if (state == AgentState::Dead)
    {
        AbortSearch();
        m_sequencer.Stop();
        m_alertIndicator = false;
        return;
    }

    if (state != AgentState::Idle)
    {
        return;
    }

    m_standGuardTimer = 0.0F;

    if (const auto* scripted = std::get_if<ScriptedArchetype>(&m_archetype))
    {
        if (scripted->autoStart && !m_scriptStarted)
        {
            m_scriptStarted = true;
            m_sequencer.Start(scripted->startingSequence);
        }
    }
}

void GuardBehavior::OnExitState(AgentState state)
{
    if (state == AgentState::Investigate)
    {
        AbortSearch();
    }
}

void GuardBehavior::OnInvestigationComplete()
{
    if (m_guardTuning.maxSearchAttempts > 0 && Archetype() != GuardArchetype::Scripted)
    {
        BeginSearch();
        return;
    }

    m_alertIndicator = false;
    ReturnToRoutine();
}

void GuardBehavior::OnInvestigationRetargeted()
{
    AbortSearch();
}

void GuardBehavior::BeginSearch()
{
    m_searching = true;
    m_searchAttemptsRemaining = m_guardTuning.maxSearchAttempts;
    m_searchCenter = InvestigationTarget();
    PickSearchLocation();
}

void GuardBehavior::AbortSearch()
{
    m_searching = false;
    m_searchAttemptsRemaining = 0;
    m_atSearchLocation = false;
    m_searchDwell = 0.0F;
}

void GuardBehavior::PickSearchLocation()
{
    std::uniform_real_distribution<float> unit(0.0F, 1.0F);
    const float angle = unit(m_rng) * kTwoPi;
    // sqrt keeps the samples uniform over the disk area.
    const float radius = m_guardTuning.searchRadius * std::sqrt(unit(m_rng));

    m_searchLocation = m_searchCenter + glm::vec3{std::cos(angle) * radius, 0.0F, std::sin(angle) * radius};
    m_atSearchLocation = false;
    m_searchDwell = 0.0F;
}

void GuardBehavior::FinishSearch()
{
    AbortSearch();
    m_alertIndicator = false;
    ReturnToRoutine();
}

void GuardBehavior::UpdateInvestigate(float deltaSeconds)
{
    if (!m_searching)
    {
        AgentController::UpdateInvestigate(deltaSeconds);
        return;
    }

    if (!m_atSearchLocation)
    {
        if (MoveTowards(m_searchLocation, Tuning().investigateSpeed, deltaSeconds, Tuning().arrivalRadius))
        {
            m_atSearchLocation = true;
            m_searchDwell = 0.0F;
            StopMoving();
        }
        return;
    }

    m_searchDwell += deltaSeconds;
    if (m_searchDwell < m_guardTuning.timePerSearchLocation)
    {
        return;
    }

    --m_searchAttemptsRemaining;
    if (m_searchAttemptsRemaining > 0)
    {
        PickSearchLocation();
    }
    else
    {
        FinishSearch();
    }
}

void GuardBehavior::UpdateIdle(float deltaSeconds)
{
    switch (Archetype())
    {
        case GuardArchetype::Stationary:
        {
            // Holds position wherever Idle resumes; only the facing changes.
            const auto& stationary = std::get<StationaryArchetype>(m_archetype);
            if (stationary.standGuardTime <= 0.0F)
            {
                return;
            }
            m_standGuardTimer += deltaSeconds;
            if (m_standGuardTimer >= stationary.standGuardTime)
            {
                m_standGuardTimer = 0.0F;
                SetFacing(-Facing());
            }
            return;
        }
        case GuardArchetype::Scripted:
            if (m_sequencer.IsRunning())
            {
                m_sequencer.Update(deltaSeconds, *this);
            }
            return;
        case GuardArchetype::Patroller:
        case GuardArchetype::Sleeper:
        default:
            AgentController::UpdateIdle(deltaSeconds);
            return;
    }
}

void GuardBehavior::UpdatePatrol(float deltaSeconds)
{
    const auto* patroller = std::get_if<PatrollerArchetype>(&m_archetype);
    if (patroller != nullptr && patroller->useRandomPatrol && PatrolRoute().size() > 1)
    {
        std::uniform_real_distribution<float> unit(0.0F, 1.0F);
        if (unit(m_rng) < patroller->chanceToChangeDirection * deltaSeconds)
        {
            const std::size_t count = PatrolRoute().size();
            std::uniform_int_distribution<std::size_t> pick(1, count - 1);
            SetPatrolIndex((PatrolIndex() + pick(m_rng)) % count);
        }
    }

    AgentController::UpdatePatrol(deltaSeconds);
}

void GuardBehavior::ScriptSetPosition(const glm::vec3& position)
{
    SetFacing(position - Position());
    SetPosition(position);
}

void GuardBehavior::ScriptChangeState(AgentState state, const glm::vec3& target)
{
    if (state == AgentState::Investigate)
    {
        StartInvestigation(target);
        return;
    }
    RequestState(state);
}

void GuardBehavior::EmitScriptCue(const ScriptCue& cue)
{
    if (m_onScriptCue)
    {
        m_onScriptCue(Id(), cue);
    }
}
} // namespace game::ai
