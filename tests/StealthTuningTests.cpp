#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "game/stealth/StealthTuning.hpp"

using game::stealth::DefaultStealthTuning;
using game::stealth::StealthTuning;
using game::stealth::StealthTuningFromJson;

TEST(StealthTuningTest, DefaultsCarryOneProfile)
{
    const StealthTuning tuning = DefaultStealthTuning();
    EXPECT_EQ(tuning.guardProfiles.size(), 1U);
    ASSERT_NE(tuning.FindProfile("default"), nullptr);
    EXPECT_EQ(tuning.FindProfile("sentry"), nullptr);
    EXPECT_FLOAT_EQ(tuning.stealth.hideThreshold, 0.3F);
    EXPECT_FLOAT_EQ(tuning.lightField.ambientFloor, 0.1F);
}

TEST(StealthTuningTest, OverlaysOnlyPresentFields)
{
    const nlohmann::json root = nlohmann::json::parse(R"({
        "asset_version": 1,
        "stealth": { "hide_threshold": 0.4 },
        "guard_profiles": [
            { "id": "sentry", "agent": { "detection_range": 7.5 }, "guard": { "alert_radius": 15.0 } },
            { "agent": { "chase_speed": 9.0 } }
        ]
    })");

    StealthTuning tuning = DefaultStealthTuning();
    std::string error;
    ASSERT_TRUE(StealthTuningFromJson(root, tuning, &error)) << error;

    EXPECT_FLOAT_EQ(tuning.stealth.hideThreshold, 0.4F);
    EXPECT_FLOAT_EQ(tuning.stealth.movementPenalty, 0.7F);
    EXPECT_FLOAT_EQ(tuning.lightField.ambientFloor, 0.1F);

    ASSERT_EQ(tuning.guardProfiles.size(), 2U);
    const auto* sentry = tuning.FindProfile("sentry");
    ASSERT_NE(sentry, nullptr);
    EXPECT_FLOAT_EQ(sentry->agent.detectionRange, 7.5F);
    EXPECT_FLOAT_EQ(sentry->agent.chaseSpeed, 4.0F);
    EXPECT_FLOAT_EQ(sentry->guard.alertRadius, 15.0F);
    EXPECT_EQ(sentry->guard.maxSearchAttempts, 3);
}

TEST(StealthTuningTest, DefaultProfileIsAlwaysPresent)
{
    const nlohmann::json root = nlohmann::json::parse(R"({
        "asset_version": 1,
        "guard_profiles": [ { "id": "hound" } ]
    })");

    StealthTuning tuning;
    ASSERT_TRUE(StealthTuningFromJson(root, tuning, nullptr));
    EXPECT_NE(tuning.FindProfile("default"), nullptr);
    EXPECT_NE(tuning.FindProfile("hound"), nullptr);
}

TEST(StealthTuningTest, RejectsMalformedData)
{
    StealthTuning tuning = DefaultStealthTuning();
    std::string error;

    EXPECT_FALSE(StealthTuningFromJson(nlohmann::json::array(), tuning, &error));
    EXPECT_FALSE(error.empty());

    error.clear();
    const nlohmann::json badType = nlohmann::json::parse(R"({ "stealth": { "hide_threshold": "dim" } })");
    EXPECT_FALSE(StealthTuningFromJson(badType, tuning, &error));
    EXPECT_NE(error.find("invalid tuning data"), std::string::npos);
}

TEST(StealthTuningTest, JsonRoundTripKeepsValues)
{
    StealthTuning tuning = DefaultStealthTuning();
    tuning.stealth.sampleInterval = 0.25F;
    tuning.guardProfiles["default"].guard.maxSearchAttempts = 5;
    tuning.guardProfiles["default"].agent.fieldOfViewDegrees = 75.0F;

    StealthTuning restored;
    ASSERT_TRUE(StealthTuningFromJson(game::stealth::StealthTuningToJson(tuning), restored, nullptr));
    EXPECT_FLOAT_EQ(restored.stealth.sampleInterval, 0.25F);
    ASSERT_NE(restored.FindProfile("default"), nullptr);
    EXPECT_EQ(restored.FindProfile("default")->guard.maxSearchAttempts, 5);
    EXPECT_FLOAT_EQ(restored.FindProfile("default")->agent.fieldOfViewDegrees, 75.0F);
}

TEST(StealthTuningTest, SaveThenLoadFromDisk)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "shadowwatch_tuning_test.json";

    StealthTuning tuning = DefaultStealthTuning();
    tuning.lightField.ambientFloor = 0.05F;
    ASSERT_TRUE(game::stealth::SaveStealthTuning(path.string(), tuning));

    StealthTuning loaded;
    std::string error;
    ASSERT_TRUE(game::stealth::LoadStealthTuning(path.string(), loaded, &error)) << error;
    EXPECT_FLOAT_EQ(loaded.lightField.ambientFloor, 0.05F);

    std::filesystem::remove(path);
}

TEST(StealthTuningTest, MissingFileLeavesTuningUntouched)
{
    StealthTuning tuning = DefaultStealthTuning();
    tuning.stealth.hideThreshold = 0.9F;

    std::string error;
    EXPECT_FALSE(game::stealth::LoadStealthTuning("does/not/exist.json", tuning, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FLOAT_EQ(tuning.stealth.hideThreshold, 0.9F);
}

TEST(StealthTuningTest, ShippedTuningLoads)
{
    const std::string path = std::string(SHADOWWATCH_SOURCE_DIR) + "/assets/stealth_tuning.json";

    StealthTuning tuning;
    std::string error;
    ASSERT_TRUE(game::stealth::LoadStealthTuning(path, tuning, &error)) << error;
    ASSERT_NE(tuning.FindProfile("hound"), nullptr);
    EXPECT_FLOAT_EQ(tuning.FindProfile("hound")->guard.suspicionThreshold, 2.0F);
    ASSERT_NE(tuning.FindProfile("sentry"), nullptr);
    EXPECT_EQ(tuning.FindProfile("sentry")->guard.maxSearchAttempts, 2);
}
