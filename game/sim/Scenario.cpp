#include "game/sim/Scenario.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <glm/geometric.hpp>
#include <nlohmann/json.hpp>

namespace game::sim
{
namespace
{
constexpr int kScenarioAssetVersion = 1;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

glm::vec3 ReadVec3(const nlohmann::json& json, const char* key, const glm::vec3& fallback)
{
    if (!json.contains(key))
    {
        return fallback;
    }
    const auto& value = json[key];
    if (!value.is_array() || value.size() != 3)
    {
        throw std::runtime_error(std::string("'") + key + "' must be an array of 3 numbers");
    }
    return glm::vec3{value[0].get<float>(), value[1].get<float>(), value[2].get<float>()};
}

glm::vec3 ToVec3(const nlohmann::json& value)
{
    if (!value.is_array() || value.size() != 3)
    {
        throw std::runtime_error("expected an array of 3 numbers");
    }
    return glm::vec3{value[0].get<float>(), value[1].get<float>(), value[2].get<float>()};
}

ai::ScriptStep ReadScriptStep(const nlohmann::json& json)
{
    ai::ScriptStep step;
    const std::string typeText = json.value("type", "wait");
    const auto type = ai::ParseScriptStepType(typeText);
    if (!type.has_value())
    {
        throw std::runtime_error("unknown script step type '" + typeText + "'");
    }
    step.type = *type;
    step.targetPosition = ReadVec3(json, "target", step.targetPosition);
    step.duration = json.value("duration", step.duration);
    step.waitTime = json.value("wait_time", step.waitTime);
    step.text = json.value("text", "");

    if (json.contains("state"))
    {
        const std::string stateText = json["state"].get<std::string>();
        const auto state = ai::ParseAgentState(stateText);
        if (!state.has_value())
        {
            throw std::runtime_error("unknown agent state '" + stateText + "'");
        }
        step.state = *state;
    }
    return step;
}

ai::ArchetypeData ReadArchetype(const nlohmann::json& json)
{
    const std::string text = json.value("archetype", "patroller");
    const auto archetype = ai::ParseGuardArchetype(text);
    if (!archetype.has_value())
    {
        throw std::runtime_error("unknown guard archetype '" + text + "'");
    }

    ai::ArchetypeData data = ai::DefaultArchetypeData(*archetype);
    if (auto* patroller = std::get_if<ai::PatrollerArchetype>(&data))
    {
        patroller->useRandomPatrol = json.value("random_patrol", patroller->useRandomPatrol);
        patroller->chanceToChangeDirection = json.value("chance_to_change_direction", patroller->chanceToChangeDirection);
    }
    else if (auto* stationary = std::get_if<ai::StationaryArchetype>(&data))
    {
        stationary->standGuardTime = json.value("stand_guard_time", stationary->standGuardTime);
    }
    else if (auto* scripted = std::get_if<ai::ScriptedArchetype>(&data))
    {
        scripted->autoStart = json.value("auto_start", scripted->autoStart);
        scripted->startingSequence = json.value("starting_sequence", scripted->startingSequence);
        if (json.contains("sequences"))
        {
            for (const auto& sequenceJson : json["sequences"])
            {
                ai::ScriptSequence sequence;
                sequence.name = sequenceJson.value("name", "");
                sequence.loop = sequenceJson.value("loop", false);
                sequence.delayBeforeStart = sequenceJson.value("delay_before_start", 0.0F);
                if (sequenceJson.contains("steps"))
                {
                    for (const auto& stepJson : sequenceJson["steps"])
                    {
                        sequence.steps.push_back(ReadScriptStep(stepJson));
                    }
                }
                scripted->sequences.push_back(std::move(sequence));
            }
        }
    }
    return data;
}
} // namespace

bool ScenarioFromJson(const nlohmann::json& root, Scenario& outScenario, std::string* outError)
{
    if (!root.is_object())
    {
        SetError(outError, "scenario root is not a JSON object");
        return false;
    }

    try
    {
        Scenario scenario;
        scenario.assetVersion = root.value("asset_version", 0);
        if (scenario.assetVersion != kScenarioAssetVersion)
        {
            std::cout << "Scenario: WARNING - Unexpected asset version " << scenario.assetVersion
                      << ", expected " << kScenarioAssetVersion << "\n";
        }

        scenario.name = root.value("name", "unnamed");
        scenario.tickRate = root.value("tick_rate", scenario.tickRate);
        scenario.durationSeconds = root.value("duration_seconds", scenario.durationSeconds);
        scenario.tuningPath = root.value("tuning", "");

        if (scenario.tickRate <= 0.0F || scenario.durationSeconds < 0.0F)
        {
            SetError(outError, "tick_rate must be positive and duration_seconds non-negative");
            return false;
        }

        if (root.contains("lights"))
        {
            for (const auto& lightJson : root["lights"])
            {
                LightSpec light;
                light.position = ReadVec3(lightJson, "position", light.position);
                light.intensity = lightJson.value("intensity", light.intensity);
                light.radius = lightJson.value("radius", light.radius);
                light.flicker = lightJson.value("flicker", "");

                const std::string kindText = lightJson.value("kind", "point");
                const auto kind = engine::lighting::ParseLightKind(kindText);
                if (!kind.has_value())
                {
                    SetError(outError, "unknown light kind '" + kindText + "'");
                    return false;
                }
                light.kind = *kind;
                scenario.lights.push_back(light);
            }
        }

        if (root.contains("obstacles"))
        {
            for (const auto& obstacleJson : root["obstacles"])
            {
                ObstacleSpec obstacle;
                obstacle.center = ReadVec3(obstacleJson, "center", obstacle.center);
                obstacle.halfExtents = ReadVec3(obstacleJson, "half_extents", obstacle.halfExtents);
                obstacle.blocksSight = obstacleJson.value("blocks_sight", obstacle.blocksSight);
                scenario.obstacles.push_back(obstacle);
            }
        }

        if (root.contains("guards"))
        {
            for (const auto& guardJson : root["guards"])
            {
                GuardSpec guard;
                guard.name = guardJson.value("name", "");
                guard.profile = guardJson.value("profile", std::string(stealth::kDefaultGuardProfile));
                guard.position = ReadVec3(guardJson, "position", guard.position);
                guard.facing = ReadVec3(guardJson, "facing", guard.facing);
                if (guardJson.contains("route"))
                {
                    for (const auto& waypoint : guardJson["route"])
                    {
                        guard.route.push_back(ToVec3(waypoint));
                    }
                }
                guard.archetype = ReadArchetype(guardJson);
                scenario.guards.push_back(std::move(guard));
            }
        }

        if (root.contains("target_path"))
        {
            for (const auto& keyJson : root["target_path"])
            {
                TargetKeyframe key;
                key.time = keyJson.value("time", 0.0F);
                key.position = ReadVec3(keyJson, "position", key.position);
                scenario.targetPath.push_back(key);
            }
            std::stable_sort(scenario.targetPath.begin(), scenario.targetPath.end(), [](const TargetKeyframe& a, const TargetKeyframe& b) {
                return a.time < b.time;
            });
        }

        if (root.contains("light_events"))
        {
            for (const auto& eventJson : root["light_events"])
            {
                LightEventSpec event;
                event.time = eventJson.value("time", 0.0F);
                event.light = eventJson.value("light", std::size_t{0});
                event.fadeSeconds = eventJson.value("fade_seconds", event.fadeSeconds);
                const std::string action = eventJson.value("action", "extinguish");
                if (action == "extinguish")
                    event.action = LightAction::Extinguish;
                else if (action == "relight")
                    event.action = LightAction::Relight;
                else
                {
                    SetError(outError, "unknown light action '" + action + "'");
                    return false;
                }

                if (event.light >= scenario.lights.size())
                {
                    SetError(outError, "light event refers to light " + std::to_string(event.light) + " which does not exist");
                    return false;
                }
                scenario.lightEvents.push_back(event);
            }
            std::stable_sort(scenario.lightEvents.begin(), scenario.lightEvents.end(), [](const LightEventSpec& a, const LightEventSpec& b) {
                return a.time < b.time;
            });
        }

        outScenario = std::move(scenario);
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("invalid scenario data: ") + e.what());
        return false;
    }
}

bool LoadScenario(const std::string& path, Scenario& outScenario, std::string* outError)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SetError(outError, "could not open '" + path + "'");
        std::cout << "Scenario: WARNING - Could not open scenario at '" << path << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;
        if (!ScenarioFromJson(root, outScenario, outError))
        {
            std::cout << "Scenario: ERROR - Rejected '" << path << "'\n";
            return false;
        }
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("failed to parse '") + path + "': " + e.what());
        std::cout << "Scenario: ERROR - Failed to load '" << path << "': " << e.what() << "\n";
        return false;
    }

    std::cout << "Scenario: Loaded '" << outScenario.name << "' (" << outScenario.guards.size() << " guards, "
              << outScenario.lights.size() << " lights) from " << path << "\n";
    return true;
}

glm::vec3 SampleTargetPath(const std::vector<TargetKeyframe>& path, float time, float* outSpeed)
{
    if (outSpeed != nullptr)
    {
        *outSpeed = 0.0F;
    }
    if (path.empty())
    {
        return glm::vec3{0.0F};
    }
    if (time <= path.front().time)
    {
        return path.front().position;
    }
    if (time >= path.back().time)
    {
        return path.back().position;
    }

    for (std::size_t i = 1; i < path.size(); ++i)
    {
        const TargetKeyframe& from = path[i - 1];
        const TargetKeyframe& to = path[i];
        if (time > to.time)
        {
            continue;
        }

        const float span = to.time - from.time;
        if (span <= 0.0F)
        {
            return to.position;
        }
        if (outSpeed != nullptr)
        {
            *outSpeed = glm::distance(from.position, to.position) / span;
        }
        return glm::mix(from.position, to.position, (time - from.time) / span);
    }
    return path.back().position;
}

bool BuildWorld(
    const Scenario& scenario,
    stealth::StealthWorld& world,
    std::vector<engine::lighting::LightId>* outLightIds,
    std::string* outError
)
{
    if (world.IsInitialized() || world.GuardCount() > 0)
    {
        SetError(outError, "world must be empty and uninitialised");
        return false;
    }

    for (const LightSpec& light : scenario.lights)
    {
        const engine::lighting::LightId id = world.RegisterLight(light.position, light.intensity, light.radius, light.kind);
        if (outLightIds != nullptr)
        {
            outLightIds->push_back(id);
        }

        if (light.flicker.empty())
        {
            continue;
        }
        const auto profile = engine::lighting::FlickerPresetByName(light.flicker);
        if (!profile.has_value())
        {
            std::cout << "Scenario: WARNING - Unknown flicker preset '" << light.flicker << "', light left steady\n";
            continue;
        }
        world.LightAnimation().AttachFlicker(world.Lights(), id, *profile);
    }

    for (const ObstacleSpec& obstacle : scenario.obstacles)
    {
        world.AddObstacle(obstacle.center, obstacle.halfExtents, obstacle.blocksSight);
    }

    for (const GuardSpec& spec : scenario.guards)
    {
        const stealth::GuardProfile* profile = world.Tuning().FindProfile(spec.profile);
        if (profile == nullptr)
        {
            std::cout << "Scenario: WARNING - Guard '" << spec.name << "' uses unknown profile '" << spec.profile
                      << "', using default\n";
            profile = world.Tuning().FindProfile(stealth::kDefaultGuardProfile);
        }
        if (profile == nullptr)
        {
            SetError(outError, "tuning has no default guard profile");
            return false;
        }

        stealth::GuardSpawn spawn;
        spawn.name = spec.name;
        spawn.position = spec.position;
        spawn.facing = spec.facing;
        spawn.route = spec.route;
        spawn.agent = profile->agent;
        spawn.guard = profile->guard;
        spawn.archetype = spec.archetype;
        world.SpawnGuard(spawn);
    }

    if (!scenario.targetPath.empty())
    {
        world.SetTargetState(scenario.targetPath.front().position, 0.0F);
    }

    return world.Init(outError);
}
} // namespace game::sim
