#pragma once

#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

#include "engine/lighting/LightField.hpp"
#include "game/ai/AgentController.hpp"
#include "game/ai/GuardBehavior.hpp"
#include "game/stealth/StealthState.hpp"

namespace game::stealth
{
inline constexpr const char* kDefaultGuardProfile = "default";

struct GuardProfile
{
    std::string id;
    ai::AgentTuning agent;
    ai::GuardTuning guard;
};

/// Scene-wide tuning values, loaded from assets/stealth_tuning.json.
struct StealthTuning
{
    int assetVersion = 1;
    engine::lighting::LightFieldSettings lightField;
    StealthSettings stealth;
    std::unordered_map<std::string, GuardProfile> guardProfiles;

    [[nodiscard]] const GuardProfile* FindProfile(const std::string& id) const;
};

/// Built-in values with a single "default" guard profile.
[[nodiscard]] StealthTuning DefaultStealthTuning();

/// Overlays the fields present in root onto outTuning; absent fields keep their values.
bool StealthTuningFromJson(const nlohmann::json& root, StealthTuning& outTuning, std::string* outError = nullptr);
[[nodiscard]] nlohmann::json StealthTuningToJson(const StealthTuning& tuning);

bool LoadStealthTuning(const std::string& path, StealthTuning& outTuning, std::string* outError = nullptr);
bool SaveStealthTuning(const std::string& path, const StealthTuning& tuning, std::string* outError = nullptr);
} // namespace game::stealth
