#include <filesystem>
#include <iostream>
#include <string>

#include "game/sim/Scenario.hpp"
#include "game/sim/SimulationRunner.hpp"
#include "game/stealth/StealthTuning.hpp"

namespace
{
constexpr const char* kDefaultScenarioPath = "assets/scenarios/courtyard.json";

void PrintUsage(const char* program)
{
    std::cout << "Usage: " << program << " [scenario.json] [stealth_tuning.json]\n";
}
} // namespace

int main(int argc, char** argv)
{
    if (argc > 3)
    {
        PrintUsage(argv[0]);
        return 1;
    }
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
    {
        PrintUsage(argv[0]);
        return 0;
    }

    const std::string scenarioPath = argc >= 2 ? argv[1] : kDefaultScenarioPath;

    std::string error;
    game::sim::Scenario scenario;
    if (!game::sim::LoadScenario(scenarioPath, scenario, &error))
    {
        std::cerr << "shadowwatch_sim: " << error << "\n";
        return 1;
    }

    std::string tuningPath;
    if (argc >= 3)
    {
        tuningPath = argv[2];
    }
    else if (!scenario.tuningPath.empty())
    {
        tuningPath = (std::filesystem::path(scenarioPath).parent_path() / scenario.tuningPath).string();
    }

    game::stealth::StealthTuning tuning = game::stealth::DefaultStealthTuning();
    if (!tuningPath.empty() && !game::stealth::LoadStealthTuning(tuningPath, tuning, &error))
    {
        std::cerr << "shadowwatch_sim: " << error << "\n";
        return 1;
    }

    game::sim::SimulationRunner runner(std::move(scenario), tuning);
    if (!runner.Initialize(&error))
    {
        std::cerr << "shadowwatch_sim: " << error << "\n";
        return 1;
    }

    const game::sim::SimulationSummary summary = runner.Run();
    game::sim::PrintSummary(summary);
    return 0;
}
