#pragma once

#include <string>
#include <vector>

#include <glm/vec3.hpp>
#include <nlohmann/json_fwd.hpp>

#include "engine/lighting/LightField.hpp"
#include "game/ai/GuardBehavior.hpp"
#include "game/stealth/StealthWorld.hpp"

namespace game::sim
{
struct LightSpec
{
    glm::vec3 position{0.0F};
    float intensity = 1.0F;
    float radius = 5.0F;
    engine::lighting::LightKind kind = engine::lighting::LightKind::Point;
    std::string flicker; ///< Preset name, empty for a steady light
};

struct ObstacleSpec
{
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
    bool blocksSight = true;
};

struct GuardSpec
{
    std::string name;
    std::string profile = stealth::kDefaultGuardProfile;
    glm::vec3 position{0.0F};
    glm::vec3 facing{0.0F, 0.0F, -1.0F};
    std::vector<glm::vec3> route;
    ai::ArchetypeData archetype = ai::PatrollerArchetype{};
};

struct TargetKeyframe
{
    float time = 0.0F;
    glm::vec3 position{0.0F};
};

enum class LightAction
{
    Extinguish,
    Relight
};

/// Timed change to a scenario light, addressed by its index in Scenario::lights.
struct LightEventSpec
{
    float time = 0.0F;
    std::size_t light = 0;
    LightAction action = LightAction::Extinguish;
    float fadeSeconds = 1.0F;
};

struct Scenario
{
    int assetVersion = 1;
    std::string name;
    float tickRate = 60.0F;
    float durationSeconds = 30.0F;
    std::string tuningPath; ///< Relative to the scenario file, optional
    std::vector<LightSpec> lights;
    std::vector<ObstacleSpec> obstacles;
    std::vector<GuardSpec> guards;
    std::vector<TargetKeyframe> targetPath;
    std::vector<LightEventSpec> lightEvents;
};

bool ScenarioFromJson(const nlohmann::json& root, Scenario& outScenario, std::string* outError = nullptr);
bool LoadScenario(const std::string& path, Scenario& outScenario, std::string* outError = nullptr);

/// Linear interpolation along the keyframes. Clamps outside the path's time range.
[[nodiscard]] glm::vec3 SampleTargetPath(const std::vector<TargetKeyframe>& path, float time, float* outSpeed = nullptr);

/// Populates an empty world. Light ids are returned in scenario order.
bool BuildWorld(
    const Scenario& scenario,
    stealth::StealthWorld& world,
    std::vector<engine::lighting::LightId>* outLightIds,
    std::string* outError = nullptr
);
} // namespace game::sim
