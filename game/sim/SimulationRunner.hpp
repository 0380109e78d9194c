#pragma once

#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/core/TickClock.hpp"
#include "game/sim/Scenario.hpp"
#include "game/stealth/StealthWorld.hpp"

namespace game::sim
{
struct GuardReport
{
    ai::AgentId id = ai::kInvalidAgentId;
    std::string name;
    ai::AgentState state = ai::AgentState::Idle;
    float suspicion = 0.0F;
    glm::vec3 position{0.0F};
};

struct SimulationSummary
{
    unsigned long long frames = 0;
    unsigned long long steps = 0;
    unsigned long long droppedSteps = 0;
    double simulatedSeconds = 0.0;
    int hiddenChanges = 0;
    int stateChanges = 0;
    int detections = 0;
    int alerts = 0;
    int captures = 0;
    int scriptCues = 0;
    std::vector<GuardReport> guards;
};

/// Headless host for a StealthWorld. Simulated frame times are fed through a
/// TickClock, so the world sees the same fixed steps an interactive host would.
class SimulationRunner
{
public:
    SimulationRunner(Scenario scenario, const stealth::StealthTuning& tuning);

    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;

    bool Initialize(std::string* outError = nullptr);

    /// Advances one simulated frame. Returns false once the scenario duration is reached.
    bool Step();
    SimulationSummary Run();

    void SetFrameSeconds(double frameSeconds);
    void SetVerbose(bool verbose) { m_verbose = verbose; }

    [[nodiscard]] bool IsFinished() const;
    [[nodiscard]] const SimulationSummary& Summary() const { return m_summary; }
    [[nodiscard]] const Scenario& GetScenario() const { return m_scenario; }
    [[nodiscard]] stealth::StealthWorld& World() { return m_world; }
    [[nodiscard]] const engine::core::TickClock& Clock() const { return m_clock; }

private:
    void SubscribeEvents();
    void RunFixedStep(double stepStartSeconds, float deltaSeconds);
    void ApplyLightEvents(double nowSeconds);
    void RefreshGuardReports();
    void Log(const std::string& message) const;
    [[nodiscard]] std::string GuardLabel(const std::string& idText) const;

    Scenario m_scenario;
    stealth::StealthWorld m_world;
    engine::core::TickClock m_clock;
    std::vector<engine::lighting::LightId> m_lightIds;
    std::size_t m_nextLightEvent = 0;
    double m_frameSeconds = 1.0 / 30.0;
    double m_frameClock = 0.0;
    SimulationSummary m_summary;
    bool m_initialized = false;
    bool m_verbose = true;
};

void PrintSummary(const SimulationSummary& summary);
} // namespace game::sim
