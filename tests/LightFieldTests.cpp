#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

#include "engine/lighting/LightField.hpp"

using engine::lighting::LightField;
using engine::lighting::LightFieldSettings;
using engine::lighting::LightId;
using engine::lighting::LightKind;
using engine::lighting::LightSampler;

TEST(LightFieldTest, EmptySceneSamplesAmbientFloor)
{
    LightField field;
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{3.0F, 0.0F, -7.0F}), 0.1F);
}

TEST(LightFieldTest, PointLightFallsOffLinearly)
{
    LightField field;
    field.RegisterLight(glm::vec3{0.0F}, 1.0F, 10.0F);

    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{5.0F, 0.0F, 0.0F}), 0.6F);
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{0.0F, 0.0F, 10.0F}), 0.1F);
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{0.0F, 12.0F, 0.0F}), 0.1F);
}

TEST(LightFieldTest, SumIsClampedToOne)
{
    LightField field;
    field.RegisterLight(glm::vec3{0.0F}, 1.0F, 4.0F);
    field.RegisterLight(glm::vec3{0.0F}, 1.0F, 4.0F, LightKind::Area);
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{0.0F}), 1.0F);
}

TEST(LightFieldTest, GlobalLightIgnoresDistance)
{
    LightField field;
    field.RegisterLight(glm::vec3{0.0F}, 0.3F, 0.0F, LightKind::Global);
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{500.0F, 0.0F, -500.0F}), 0.4F);
}

TEST(LightFieldTest, DisabledLightsContributeNothing)
{
    LightField field;
    const LightId id = field.RegisterLight(glm::vec3{0.0F}, 1.0F, 10.0F);
    EXPECT_TRUE(field.SetLightEnabled(id, false));
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{0.0F}), 0.1F);
    EXPECT_FALSE(field.SetLightEnabled(id + 100, false));
}

TEST(LightFieldTest, NegativeInputsAreClamped)
{
    LightFieldSettings settings;
    settings.ambientFloor = -1.0F;
    LightField field(settings);
    const LightId id = field.RegisterLight(glm::vec3{0.0F}, -2.0F, -3.0F);

    const auto* light = field.FindLight(id);
    ASSERT_NE(light, nullptr);
    EXPECT_FLOAT_EQ(light->intensity, 0.0F);
    EXPECT_FLOAT_EQ(light->radius, 0.0F);
    EXPECT_FLOAT_EQ(field.Sample(glm::vec3{0.0F}), 0.0F);
}

TEST(LightFieldTest, IlluminationStaysInUnitRange)
{
    std::mt19937 rng(42U);
    std::uniform_real_distribution<float> coord(-20.0F, 20.0F);
    std::uniform_real_distribution<float> amount(0.0F, 3.0F);

    LightFieldSettings settings;
    settings.ambientFloor = 0.25F;
    LightField field(settings);
    for (int i = 0; i < 12; ++i)
    {
        const LightKind kind = i % 5 == 0 ? LightKind::Global : (i % 2 == 0 ? LightKind::Area : LightKind::Point);
        field.RegisterLight(glm::vec3{coord(rng), coord(rng), coord(rng)}, amount(rng), amount(rng) * 5.0F, kind);
    }

    for (int i = 0; i < 500; ++i)
    {
        const float value = field.Sample(glm::vec3{coord(rng), coord(rng), coord(rng)});
        EXPECT_GE(value, 0.0F);
        EXPECT_LE(value, 1.0F);
    }
}

TEST(LightFieldTest, CandidatesRespectRadiusAndMargin)
{
    LightField field;
    const LightId nearLight = field.RegisterLight(glm::vec3{5.5F, 0.0F, 0.0F}, 1.0F, 5.0F);
    const LightId farLight = field.RegisterLight(glm::vec3{10.0F, 0.0F, 0.0F}, 1.0F, 5.0F);
    const LightId global = field.RegisterLight(glm::vec3{100.0F, 0.0F, 0.0F}, 0.1F, 0.0F, LightKind::Global);

    std::vector<LightId> ids;
    field.CollectCandidates(glm::vec3{0.0F}, ids);
    EXPECT_NE(std::find(ids.begin(), ids.end(), nearLight), ids.end());
    EXPECT_EQ(std::find(ids.begin(), ids.end(), farLight), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), global), ids.end());
}

TEST(LightFieldTest, SampleCandidatesSkipsRemovedLights)
{
    LightField field;
    const LightId id = field.RegisterLight(glm::vec3{0.0F}, 0.5F, 5.0F);
    std::vector<LightId> ids;
    field.CollectCandidates(glm::vec3{0.0F}, ids);
    ASSERT_EQ(ids.size(), 1U);

    EXPECT_TRUE(field.UnregisterLight(id));
    EXPECT_FLOAT_EQ(field.SampleCandidates(glm::vec3{0.0F}, ids), 0.1F);
}

TEST(LightFieldTest, LightIdsAreSorted)
{
    LightField field;
    for (int i = 0; i < 5; ++i)
    {
        field.RegisterLight(glm::vec3{static_cast<float>(i)}, 1.0F, 1.0F);
    }
    field.UnregisterLight(3);
    const auto ids = field.LightIds();
    ASSERT_EQ(ids.size(), 4U);
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST(LightFieldTest, LightKindTextRoundTrip)
{
    EXPECT_EQ(engine::lighting::ParseLightKind("area"), LightKind::Area);
    EXPECT_STREQ(engine::lighting::LightKindToText(LightKind::Global), "global");
    EXPECT_FALSE(engine::lighting::ParseLightKind("laser").has_value());
}

TEST(LightSamplerTest, CachedCandidatesHoldUntilRefreshInterval)
{
    LightField field;
    field.RegisterLight(glm::vec3{10.0F, 0.0F, 0.0F}, 0.5F, 5.0F);

    LightSampler sampler;
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{0.0F}, 0.0F), 0.1F);
    EXPECT_TRUE(sampler.Candidates().empty());

    // Moved next to the light, but the cached set is still the old one.
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{10.0F, 0.0F, 0.0F}, 0.5F), 0.1F);

    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{10.0F, 0.0F, 0.0F}, 1.5F), 0.6F);
    EXPECT_EQ(sampler.Candidates().size(), 1U);
    EXPECT_FLOAT_EQ(sampler.SecondsSinceRefresh(), 0.0F);
}

TEST(LightSamplerTest, NewlyRegisteredLightForcesRefresh)
{
    LightField field;
    LightSampler sampler;
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{0.0F}, 0.0F), 0.1F);

    field.RegisterLight(glm::vec3{0.0F}, 0.5F, 5.0F);
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{0.0F}, 0.1F), 0.6F);
}

TEST(LightSamplerTest, RemovedLightIsSkippedBeforeRefresh)
{
    LightField field;
    const LightId id = field.RegisterLight(glm::vec3{0.0F}, 0.5F, 5.0F);
    LightSampler sampler;
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{0.0F}, 0.0F), 0.6F);

    field.UnregisterLight(id);
    EXPECT_FLOAT_EQ(sampler.Sample(field, glm::vec3{0.0F}, 0.1F), 0.1F);
    EXPECT_EQ(sampler.Candidates().size(), 1U);
}
