#include "game/stealth/StealthTuning.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace game::stealth
{
namespace
{
constexpr int kTuningAssetVersion = 1;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

void ReadAgentTuning(const nlohmann::json& json, ai::AgentTuning& t)
{
    t.patrolSpeed = json.value("patrol_speed", t.patrolSpeed);
    t.investigateSpeed = json.value("investigate_speed", t.investigateSpeed);
    t.chaseSpeed = json.value("chase_speed", t.chaseSpeed);
    t.waitAtPatrolPoint = json.value("wait_at_patrol_point", t.waitAtPatrolPoint);
    t.arrivalRadius = json.value("arrival_radius", t.arrivalRadius);
    t.detectionRange = json.value("detection_range", t.detectionRange);
    t.fieldOfViewDegrees = json.value("field_of_view_degrees", t.fieldOfViewDegrees);
    t.eyeHeight = json.value("eye_height", t.eyeHeight);
    t.losePlayerTime = json.value("lose_player_time", t.losePlayerTime);
    t.investigationRadius = json.value("investigation_radius", t.investigationRadius);
    t.investigationTime = json.value("investigation_time", t.investigationTime);
    t.alertCooldown = json.value("alert_cooldown", t.alertCooldown);
    t.captureRadius = json.value("capture_radius", t.captureRadius);
}

nlohmann::json WriteAgentTuning(const ai::AgentTuning& t)
{
    nlohmann::json json;
    json["patrol_speed"] = t.patrolSpeed;
    json["investigate_speed"] = t.investigateSpeed;
    json["chase_speed"] = t.chaseSpeed;
    json["wait_at_patrol_point"] = t.waitAtPatrolPoint;
    json["arrival_radius"] = t.arrivalRadius;
    json["detection_range"] = t.detectionRange;
    json["field_of_view_degrees"] = t.fieldOfViewDegrees;
    json["eye_height"] = t.eyeHeight;
    json["lose_player_time"] = t.losePlayerTime;
    json["investigation_radius"] = t.investigationRadius;
    json["investigation_time"] = t.investigationTime;
    json["alert_cooldown"] = t.alertCooldown;
    json["capture_radius"] = t.captureRadius;
    return json;
}

void ReadGuardTuning(const nlohmann::json& json, ai::GuardTuning& t)
{
    t.detectsNoise = json.value("detects_noise", t.detectsNoise);
    t.noiseRadius = json.value("noise_radius", t.noiseRadius);
    t.noiseGain = json.value("noise_gain", t.noiseGain);
    t.loudMovementSpeed = json.value("loud_movement_speed", t.loudMovementSpeed);
    t.suspicionThreshold = json.value("suspicion_threshold", t.suspicionThreshold);
    t.suspicionDecayRate = json.value("suspicion_decay_rate", t.suspicionDecayRate);
    t.maxSuspicion = json.value("max_suspicion", t.maxSuspicion);
    t.alertRadius = json.value("alert_radius", t.alertRadius);
    t.maxSearchAttempts = json.value("max_search_attempts", t.maxSearchAttempts);
    t.searchRadius = json.value("search_radius", t.searchRadius);
    t.timePerSearchLocation = json.value("time_per_search_location", t.timePerSearchLocation);
    t.randomSeed = json.value("random_seed", t.randomSeed);
}

nlohmann::json WriteGuardTuning(const ai::GuardTuning& t)
{
    nlohmann::json json;
    json["detects_noise"] = t.detectsNoise;
    json["noise_radius"] = t.noiseRadius;
    json["noise_gain"] = t.noiseGain;
    json["loud_movement_speed"] = t.loudMovementSpeed;
    json["suspicion_threshold"] = t.suspicionThreshold;
    json["suspicion_decay_rate"] = t.suspicionDecayRate;
    json["max_suspicion"] = t.maxSuspicion;
    json["alert_radius"] = t.alertRadius;
    json["max_search_attempts"] = t.maxSearchAttempts;
    json["search_radius"] = t.searchRadius;
    json["time_per_search_location"] = t.timePerSearchLocation;
    json["random_seed"] = t.randomSeed;
    return json;
}
} // namespace

const GuardProfile* StealthTuning::FindProfile(const std::string& id) const
{
    const auto it = guardProfiles.find(id);
    return it == guardProfiles.end() ? nullptr : &it->second;
}

StealthTuning DefaultStealthTuning()
{
    StealthTuning tuning;
    GuardProfile profile;
    profile.id = kDefaultGuardProfile;
    tuning.guardProfiles.emplace(profile.id, profile);
    return tuning;
}

bool StealthTuningFromJson(const nlohmann::json& root, StealthTuning& outTuning, std::string* outError)
{
    if (!root.is_object())
    {
        SetError(outError, "tuning root is not a JSON object");
        return false;
    }

    try
    {
        outTuning.assetVersion = root.value("asset_version", 0);
        if (outTuning.assetVersion != kTuningAssetVersion)
        {
            std::cout << "StealthTuning: WARNING - Unexpected asset version " << outTuning.assetVersion
                      << ", expected " << kTuningAssetVersion << "\n";
        }

        if (root.contains("light_field"))
        {
            const auto& lightJson = root["light_field"];
            engine::lighting::LightFieldSettings& light = outTuning.lightField;
            light.ambientFloor = lightJson.value("ambient_floor", light.ambientFloor);
            light.candidateRefreshInterval = lightJson.value("candidate_refresh_interval", light.candidateRefreshInterval);
            light.candidateQueryMargin = lightJson.value("candidate_query_margin", light.candidateQueryMargin);
        }

        if (root.contains("stealth"))
        {
            const auto& stealthJson = root["stealth"];
            StealthSettings& stealth = outTuning.stealth;
            stealth.hideThreshold = stealthJson.value("hide_threshold", stealth.hideThreshold);
            stealth.movementPenalty = stealthJson.value("movement_penalty", stealth.movementPenalty);
            stealth.sampleInterval = stealthJson.value("sample_interval", stealth.sampleInterval);
            stealth.movementThreshold = stealthJson.value("movement_threshold", stealth.movementThreshold);
        }

        if (root.contains("guard_profiles"))
        {
            for (const auto& profileJson : root["guard_profiles"])
            {
                GuardProfile profile;
                profile.id = profileJson.value("id", "");
                if (profile.id.empty())
                {
                    std::cout << "StealthTuning: WARNING - Skipping guard profile without id\n";
                    continue;
                }

                if (profileJson.contains("agent"))
                {
                    ReadAgentTuning(profileJson["agent"], profile.agent);
                }
                if (profileJson.contains("guard"))
                {
                    ReadGuardTuning(profileJson["guard"], profile.guard);
                }
                outTuning.guardProfiles[profile.id] = profile;
            }
        }

        if (outTuning.FindProfile(kDefaultGuardProfile) == nullptr)
        {
            GuardProfile fallback;
            fallback.id = kDefaultGuardProfile;
            outTuning.guardProfiles.emplace(fallback.id, fallback);
        }
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("invalid tuning data: ") + e.what());
        return false;
    }
}

nlohmann::json StealthTuningToJson(const StealthTuning& tuning)
{
    nlohmann::json root;
    root["asset_version"] = kTuningAssetVersion;

    nlohmann::json lightJson;
    lightJson["ambient_floor"] = tuning.lightField.ambientFloor;
    lightJson["candidate_refresh_interval"] = tuning.lightField.candidateRefreshInterval;
    lightJson["candidate_query_margin"] = tuning.lightField.candidateQueryMargin;
    root["light_field"] = lightJson;

    nlohmann::json stealthJson;
    stealthJson["hide_threshold"] = tuning.stealth.hideThreshold;
    stealthJson["movement_penalty"] = tuning.stealth.movementPenalty;
    stealthJson["sample_interval"] = tuning.stealth.sampleInterval;
    stealthJson["movement_threshold"] = tuning.stealth.movementThreshold;
    root["stealth"] = stealthJson;

    nlohmann::json profiles = nlohmann::json::array();
    for (const auto& [id, profile] : tuning.guardProfiles)
    {
        nlohmann::json profileJson;
        profileJson["id"] = id;
        profileJson["agent"] = WriteAgentTuning(profile.agent);
        profileJson["guard"] = WriteGuardTuning(profile.guard);
        profiles.push_back(profileJson);
    }
    root["guard_profiles"] = profiles;
    return root;
}

bool LoadStealthTuning(const std::string& path, StealthTuning& outTuning, std::string* outError)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SetError(outError, "could not open '" + path + "'");
        std::cout << "StealthTuning: WARNING - Could not open tuning file at '" << path << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        StealthTuning loaded = DefaultStealthTuning();
        if (!StealthTuningFromJson(root, loaded, outError))
        {
            std::cout << "StealthTuning: ERROR - Rejected '" << path << "'\n";
            return false;
        }

        outTuning = std::move(loaded);
        std::cout << "StealthTuning: Loaded " << outTuning.guardProfiles.size() << " guard profiles from " << path << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("failed to parse '") + path + "': " + e.what());
        std::cout << "StealthTuning: ERROR - Failed to load '" << path << "': " << e.what() << "\n";
        return false;
    }
}

bool SaveStealthTuning(const std::string& path, const StealthTuning& tuning, std::string* outError)
{
    try
    {
        const nlohmann::json root = StealthTuningToJson(tuning);

        std::ofstream file(path);
        if (!file.is_open())
        {
            SetError(outError, "could not open '" + path + "' for writing");
            std::cout << "StealthTuning: ERROR - Could not open '" << path << "' for writing\n";
            return false;
        }

        file << root.dump(2);
        std::cout << "StealthTuning: Saved " << tuning.guardProfiles.size() << " guard profiles to " << path << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("failed to save '") + path + "': " + e.what());
        std::cout << "StealthTuning: ERROR - Failed to save '" << path << "': " << e.what() << "\n";
        return false;
    }
}
} // namespace game::stealth
