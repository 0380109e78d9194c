#include "game/sim/SimulationRunner.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace game::sim
{
namespace
{
constexpr double kMinTickRate = 10.0;
constexpr double kMaxTickRate = 240.0;
} // namespace

SimulationRunner::SimulationRunner(Scenario scenario, const stealth::StealthTuning& tuning)
    : m_scenario(std::move(scenario))
    , m_world(tuning)
{
    double tickRate = static_cast<double>(m_scenario.tickRate);
    if (tickRate < kMinTickRate || tickRate > kMaxTickRate)
    {
        std::cout << "Simulation: WARNING - tick_rate " << tickRate << " clamped to [" << kMinTickRate << ", "
                  << kMaxTickRate << "]\n";
        tickRate = std::clamp(tickRate, kMinTickRate, kMaxTickRate);
    }
    m_clock.SetFixedDeltaSeconds(1.0 / tickRate);
}

bool SimulationRunner::Initialize(std::string* outError)
{
    if (m_initialized)
    {
        return true;
    }

    if (!BuildWorld(m_scenario, m_world, &m_lightIds, outError))
    {
        return false;
    }

    SubscribeEvents();
    m_clock.BeginFrame(m_frameClock);
    m_initialized = true;

    std::cout << "Simulation: Running '" << m_scenario.name << "' for " << m_scenario.durationSeconds << "s at "
              << (1.0 / m_clock.FixedDeltaSeconds()) << " Hz\n";
    return true;
}

void SimulationRunner::SetFrameSeconds(double frameSeconds)
{
    if (frameSeconds <= 0.0)
    {
        std::cout << "Simulation: WARNING - Ignoring non-positive frame time " << frameSeconds << "\n";
        return;
    }
    m_frameSeconds = frameSeconds;
}

bool SimulationRunner::IsFinished() const
{
    return m_clock.SimulatedSeconds() + 1.0e-9 >= static_cast<double>(m_scenario.durationSeconds);
}

bool SimulationRunner::Step()
{
    if (!m_initialized || IsFinished())
    {
        return false;
    }

    m_frameClock += m_frameSeconds;
    m_clock.BeginFrame(m_frameClock);
    while (m_clock.ShouldRunFixedStep() && !IsFinished())
    {
        RunFixedStep(m_clock.SimulatedSeconds(), static_cast<float>(m_clock.FixedDeltaSeconds()));
        m_clock.ConsumeFixedStep();
    }

    ++m_summary.frames;
    m_summary.steps = m_clock.StepIndex();
    m_summary.droppedSteps = m_clock.DroppedSteps();
    m_summary.simulatedSeconds = m_clock.SimulatedSeconds();
    return !IsFinished();
}

SimulationSummary SimulationRunner::Run()
{
    while (Step())
    {
    }
    RefreshGuardReports();
    return m_summary;
}

void SimulationRunner::RunFixedStep(double stepStartSeconds, float deltaSeconds)
{
    ApplyLightEvents(stepStartSeconds);

    if (!m_scenario.targetPath.empty())
    {
        float speed = 0.0F;
        const glm::vec3 position = SampleTargetPath(m_scenario.targetPath, static_cast<float>(stepStartSeconds), &speed);
        m_world.SetTargetState(position, speed);
    }

    m_world.Tick(deltaSeconds);
    m_world.Events().DispatchQueued();
}

void SimulationRunner::ApplyLightEvents(double nowSeconds)
{
    while (m_nextLightEvent < m_scenario.lightEvents.size()
           && static_cast<double>(m_scenario.lightEvents[m_nextLightEvent].time) <= nowSeconds)
    {
        const LightEventSpec& event = m_scenario.lightEvents[m_nextLightEvent++];
        if (event.light >= m_lightIds.size())
        {
            continue;
        }

        const engine::lighting::LightId id = m_lightIds[event.light];
        auto& animator = m_world.LightAnimation();
        const bool applied = event.action == LightAction::Extinguish
                                 ? animator.Extinguish(m_world.Lights(), id, event.fadeSeconds)
                                 : animator.Relight(m_world.Lights(), id);
        if (!applied)
        {
            std::cout << "Simulation: WARNING - Light event at t=" << event.time << " had no effect on light "
                      << event.light << "\n";
            continue;
        }

        std::ostringstream message;
        message << (event.action == LightAction::Extinguish ? "light " : "relight ") << event.light
                << (event.action == LightAction::Extinguish ? " extinguished" : "");
        Log(message.str());
    }
}

void SimulationRunner::SubscribeEvents()
{
    namespace events = stealth::events;
    auto& bus = m_world.Events();

    bus.Subscribe(events::kHiddenChanged, [this](const engine::core::Event& event) {
        ++m_summary.hiddenChanges;
        const bool hidden = !event.args.empty() && event.args[0] == "1";
        Log(hidden ? "target hidden" : "target exposed");
    });

    bus.Subscribe(events::kStateChanged, [this](const engine::core::Event& event) {
        ++m_summary.stateChanges;
        if (event.args.size() >= 3)
        {
            Log(GuardLabel(event.args[0]) + " " + event.args[1] + " -> " + event.args[2]);
        }
    });

    bus.Subscribe(events::kTargetDetected, [this](const engine::core::Event& event) {
        ++m_summary.detections;
        if (!event.args.empty())
        {
            Log(GuardLabel(event.args[0]) + " spotted the target");
        }
    });

    bus.Subscribe(events::kAlertBroadcast, [this](const engine::core::Event& event) {
        ++m_summary.alerts;
        if (event.args.size() >= 4)
        {
            Log(GuardLabel(event.args[0]) + " raised an alert at (" + event.args[1] + ", " + event.args[3] + ")");
        }
    });

    bus.Subscribe(events::kCapture, [this](const engine::core::Event& event) {
        ++m_summary.captures;
        if (!event.args.empty())
        {
            Log(GuardLabel(event.args[0]) + " caught the target");
        }
    });

    bus.Subscribe(events::kScriptCue, [this](const engine::core::Event& event) {
        ++m_summary.scriptCues;
        if (event.args.size() >= 3)
        {
            Log(GuardLabel(event.args[0]) + " cue " + event.args[1] + " '" + event.args[2] + "'");
        }
    });
}

void SimulationRunner::RefreshGuardReports()
{
    m_summary.guards.clear();
    for (const ai::AgentId id : m_world.GuardIds())
    {
        const ai::GuardBehavior* guard = m_world.FindGuard(id);
        if (guard == nullptr)
        {
            continue;
        }
        GuardReport report;
        report.id = id;
        report.name = guard->Name();
        report.state = guard->GetState();
        report.suspicion = guard->SuspicionLevel();
        report.position = guard->Position();
        m_summary.guards.push_back(report);
    }
}

void SimulationRunner::Log(const std::string& message) const
{
    if (!m_verbose)
    {
        return;
    }
    std::cout << "[SIM] t=" << std::fixed << std::setprecision(2) << m_world.ElapsedSeconds()
              << std::defaultfloat << " " << message << "\n";
}

std::string SimulationRunner::GuardLabel(const std::string& idText) const
{
    const auto id = static_cast<ai::AgentId>(std::strtoul(idText.c_str(), nullptr, 10));
    if (const ai::GuardBehavior* guard = m_world.FindGuard(id))
    {
        return "guard '" + guard->Name() + "'";
    }
    return "guard #" + idText;
}

void PrintSummary(const SimulationSummary& summary)
{
    std::cout << "==== Simulation summary ====\n";
    std::cout << "Simulated " << std::fixed << std::setprecision(2) << summary.simulatedSeconds << std::defaultfloat
              << "s in " << summary.steps << " steps over " << summary.frames << " frames";
    if (summary.droppedSteps > 0)
    {
        std::cout << " (" << summary.droppedSteps << " steps dropped)";
    }
    std::cout << "\n";
    std::cout << "Hidden changes: " << summary.hiddenChanges << "  State changes: " << summary.stateChanges << "\n";
    std::cout << "Detections: " << summary.detections << "  Alerts: " << summary.alerts
              << "  Captures: " << summary.captures << "  Script cues: " << summary.scriptCues << "\n";
    for (const GuardReport& guard : summary.guards)
    {
        std::cout << "  " << guard.name << " [" << ai::AgentStateToText(guard.state) << "] suspicion="
                  << std::fixed << std::setprecision(2) << guard.suspicion << " at (" << guard.position.x << ", "
                  << guard.position.z << ")" << std::defaultfloat << "\n";
    }
}
} // namespace game::sim
