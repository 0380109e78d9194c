#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "game/ai/AgentController.hpp"
#include "game/ai/AgentMath.hpp"
#include "TestScene.hpp"

using game::ai::AgentController;
using game::ai::AgentId;
using game::ai::AgentState;
using game::ai::AgentTuning;

namespace
{
struct StateLog
{
    std::vector<std::pair<AgentState, AgentState>> changes;
    std::vector<std::string> order;

    void Attach(AgentController& agent)
    {
        agent.SetStateChangedCallback([this](AgentId, AgentState from, AgentState to) {
            changes.emplace_back(from, to);
            order.push_back(std::string("state:") + game::ai::AgentStateToText(to));
        });
        agent.SetTargetDetectedCallback([this](AgentId, const glm::vec3&) { order.push_back("detected"); });
    }
};

void TickMany(AgentController& agent, int count, float dt)
{
    for (int i = 0; i < count; ++i)
    {
        agent.Tick(dt);
    }
}
} // namespace

TEST(AgentStateTest, TextAndParsing)
{
    EXPECT_STREQ(game::ai::AgentStateToText(AgentState::Investigate), "Investigate");
    EXPECT_EQ(game::ai::ParseAgentState("chase"), AgentState::Chase);
    EXPECT_EQ(game::ai::ParseAgentState("Sleeping"), AgentState::Sleeping);
    EXPECT_FALSE(game::ai::ParseAgentState("dancing").has_value());
    EXPECT_TRUE(game::ai::IsStationaryState(AgentState::Sleeping));
    EXPECT_FALSE(game::ai::IsStationaryState(AgentState::Chase));
}

TEST(AgentMathTest, FieldOfViewIsMeasuredOnGroundPlane)
{
    const glm::vec3 origin{0.0F};
    const glm::vec3 forward{0.0F, 0.0F, -1.0F};
    EXPECT_TRUE(game::ai::IsWithinFieldOfView(origin, forward, glm::vec3{0.0F, 10.0F, -2.0F}, 60.0F));
    EXPECT_TRUE(game::ai::IsWithinFieldOfView(origin, forward, glm::vec3{1.0F, 0.0F, -2.0F}, 60.0F));
    EXPECT_FALSE(game::ai::IsWithinFieldOfView(origin, forward, glm::vec3{2.0F, 0.0F, -1.0F}, 60.0F));
    EXPECT_FALSE(game::ai::IsWithinFieldOfView(origin, forward, glm::vec3{0.0F, 0.0F, 2.0F}, 60.0F));
    EXPECT_TRUE(game::ai::IsWithinFieldOfView(origin, forward, origin, 60.0F));
    EXPECT_FLOAT_EQ(game::ai::DistanceXZ(glm::vec3{0.0F, 5.0F, 0.0F}, glm::vec3{3.0F, -2.0F, 4.0F}), 5.0F);
}

TEST(AgentControllerTest, TransitionTable)
{
    EXPECT_FALSE(AgentController::CanTransition(AgentState::Idle, AgentState::Idle));
    EXPECT_FALSE(AgentController::CanTransition(AgentState::Dead, AgentState::Idle));
    EXPECT_TRUE(AgentController::CanTransition(AgentState::Sleeping, AgentState::Alert));
    EXPECT_TRUE(AgentController::CanTransition(AgentState::Sleeping, AgentState::Dead));
    EXPECT_FALSE(AgentController::CanTransition(AgentState::Sleeping, AgentState::Patrol));
    EXPECT_TRUE(AgentController::CanTransition(AgentState::Chase, AgentState::Investigate));
    EXPECT_FALSE(AgentController::CanTransition(AgentState::Chase, AgentState::Patrol));
    EXPECT_FALSE(AgentController::CanTransition(AgentState::Investigate, AgentState::Sleeping));
    EXPECT_TRUE(AgentController::CanTransition(AgentState::Patrol, AgentState::Sleeping));
    EXPECT_TRUE(AgentController::CanTransition(AgentState::Alert, AgentState::Chase));
}

TEST(AgentControllerTest, InitialStateDependsOnRoute)
{
    test::TestScene scene(test::kDark);
    AgentController idle(1, "", scene.Context(), AgentTuning{});
    idle.Init();
    EXPECT_EQ(idle.GetState(), AgentState::Idle);
    EXPECT_EQ(idle.Name(), "agent_1");

    AgentController walker(2, "walker", scene.Context(), AgentTuning{});
    walker.SetPatrolRoute({glm::vec3{1.0F, 0.0F, 0.0F}});
    walker.Tick(0.0F);
    EXPECT_TRUE(walker.IsInitialized());
    EXPECT_EQ(walker.GetState(), AgentState::Patrol);
}

TEST(AgentControllerTest, PatrolWithoutRouteStaysIdle)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Init();
    EXPECT_FALSE(agent.RequestState(AgentState::Patrol));
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, EmptyingRouteWhilePatrollingFallsBackToIdle)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.SetPatrolRoute({glm::vec3{1.0F, 0.0F, 0.0F}, glm::vec3{2.0F, 0.0F, 0.0F}});
    agent.Init();
    ASSERT_EQ(agent.GetState(), AgentState::Patrol);

    agent.SetPatrolRoute({});
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, PatrolWalksDwellsAndAdvances)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.SetPatrolRoute({glm::vec3{2.0F, 0.0F, 0.0F}, glm::vec3{2.0F, 0.0F, 2.0F}});
    agent.Init();

    agent.Tick(0.5F);
    EXPECT_FLOAT_EQ(agent.Position().x, 1.0F);
    EXPECT_FLOAT_EQ(agent.Facing().x, 1.0F);

    agent.Tick(0.5F);
    EXPECT_FLOAT_EQ(agent.Position().x, 2.0F);

    TickMany(agent, 3, 0.5F);
    EXPECT_EQ(agent.PatrolIndex(), 0U);
    agent.Tick(0.5F);
    EXPECT_EQ(agent.PatrolIndex(), 1U);
}

TEST(AgentControllerTest, SeesVisibleTargetInFrontAndGivesChase)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -3.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    StateLog log;
    log.Attach(agent);
    agent.Init();
    agent.Tick(0.1F);

    EXPECT_TRUE(agent.IsTargetDetected());
    EXPECT_EQ(agent.GetState(), AgentState::Chase);
    EXPECT_FLOAT_EQ(agent.LastKnownTargetPosition().z, -3.0F);
    ASSERT_EQ(log.order.size(), 2U);
    EXPECT_EQ(log.order[0], "detected");
    EXPECT_EQ(log.order[1], "state:Chase");
}

TEST(AgentControllerTest, HiddenTargetIsNotSeen)
{
    test::TestScene scene(test::kDark);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -3.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Tick(0.1F);
    EXPECT_FALSE(agent.IsTargetDetected());
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, TargetBehindOrOutOfRangeIsNotSeen)
{
    test::TestScene scene(test::kBright);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});

    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, 3.0F});
    agent.Tick(0.1F);
    EXPECT_FALSE(agent.IsTargetDetected());

    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -5.5F});
    agent.Tick(0.1F);
    EXPECT_FALSE(agent.IsTargetDetected());
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, ObstacleBlocksSight)
{
    test::TestScene scene(test::kBright);
    scene.Occlusion().AddObstacle(glm::vec3{0.0F, 1.0F, -1.5F}, glm::vec3{2.0F, 2.0F, 0.2F});
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -3.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Tick(0.1F);
    EXPECT_FALSE(agent.IsTargetDetected());
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, LosingTheTargetFallsBackToInvestigateAfterTimeout)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -3.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Tick(0.1F);
    ASSERT_EQ(agent.GetState(), AgentState::Chase);

    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -20.0F});
    TickMany(agent, 6, 0.5F);
    EXPECT_EQ(agent.GetState(), AgentState::Chase);
    EXPECT_FLOAT_EQ(agent.TimeSinceDetection(), 3.0F);

    agent.Tick(0.5F);
    EXPECT_EQ(agent.GetState(), AgentState::Investigate);
    EXPECT_FLOAT_EQ(agent.InvestigationTarget().z, -3.0F);
}

TEST(AgentControllerTest, CaptureIsReportedOncePerContact)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -0.3F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    int captures = 0;
    agent.SetCaptureCallback([&captures](AgentId, const glm::vec3&) { ++captures; });

    agent.Tick(0.1F);
    EXPECT_EQ(agent.GetState(), AgentState::Chase);
    EXPECT_EQ(captures, 1);

    TickMany(agent, 5, 0.1F);
    EXPECT_EQ(captures, 1);
}

TEST(AgentControllerTest, TargetExactlyAtCaptureRadiusIsNotCaptured)
{
    test::TestScene scene(test::kBright);
    AgentTuning tuning;
    tuning.chaseSpeed = 0.0F;
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -tuning.captureRadius});

    AgentController agent(1, "a", scene.Context(), tuning);
    int captures = 0;
    agent.SetCaptureCallback([&captures](AgentId, const glm::vec3&) { ++captures; });

    agent.Tick(0.1F);
    EXPECT_EQ(agent.GetState(), AgentState::Chase);
    EXPECT_EQ(captures, 0);

    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -0.25F});
    agent.Tick(0.1F);
    EXPECT_EQ(captures, 1);
}

TEST(AgentControllerTest, EnteringStationaryStateStopsMovement)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.SetPatrolRoute({glm::vec3{4.0F, 0.0F, 0.0F}});
    agent.Init();

    agent.Tick(0.5F);
    ASSERT_GT(agent.Velocity().x, 0.0F);

    ASSERT_TRUE(agent.RequestState(AgentState::Alert));
    EXPECT_FLOAT_EQ(agent.Velocity().x, 0.0F);

    ASSERT_TRUE(agent.RequestState(AgentState::Patrol));
    agent.Tick(0.5F);
    ASSERT_GT(agent.Velocity().x, 0.0F);

    agent.Kill();
    EXPECT_EQ(agent.GetState(), AgentState::Dead);
    EXPECT_FLOAT_EQ(agent.Velocity().x, 0.0F);
}

TEST(AgentControllerTest, InvestigationArrivesDwellsAndReturns)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Init();

    agent.Investigate(glm::vec3{6.0F, 0.0F, 0.0F});
    ASSERT_EQ(agent.GetState(), AgentState::Investigate);

    TickMany(agent, 3, 0.5F);
    EXPECT_TRUE(agent.HasReachedInvestigationTarget());
    EXPECT_FLOAT_EQ(agent.Position().x, 4.5F);

    TickMany(agent, 9, 0.5F);
    EXPECT_EQ(agent.GetState(), AgentState::Investigate);
    agent.Tick(0.5F);
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, InvestigateRequestIgnoredDuringChase)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -3.0F});
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Tick(0.1F);
    ASSERT_EQ(agent.GetState(), AgentState::Chase);

    agent.Investigate(glm::vec3{10.0F, 0.0F, 10.0F});
    agent.ReceiveAlert(glm::vec3{10.0F, 0.0F, 10.0F});
    EXPECT_EQ(agent.GetState(), AgentState::Chase);
}

TEST(AgentControllerTest, SleepingAgentNeitherSeesNorInvestigatesButWakesOnAlert)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -2.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    StateLog log;
    agent.Init();
    agent.PutToSleep();
    ASSERT_EQ(agent.GetState(), AgentState::Sleeping);
    log.Attach(agent);

    agent.Tick(0.1F);
    EXPECT_FALSE(agent.IsTargetDetected());
    agent.Investigate(glm::vec3{5.0F, 0.0F, 5.0F});
    EXPECT_EQ(agent.GetState(), AgentState::Sleeping);

    agent.ReceiveAlert(glm::vec3{5.0F, 0.0F, 5.0F});
    EXPECT_EQ(agent.GetState(), AgentState::Investigate);
    ASSERT_EQ(log.changes.size(), 2U);
    EXPECT_EQ(log.changes[0].first, AgentState::Sleeping);
    EXPECT_EQ(log.changes[0].second, AgentState::Alert);
    EXPECT_EQ(log.changes[1].second, AgentState::Investigate);
}

TEST(AgentControllerTest, AlertTimesOutToRoutine)
{
    test::TestScene scene(test::kDark);
    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Init();
    agent.PutToSleep();
    agent.Wake();
    ASSERT_EQ(agent.GetState(), AgentState::Alert);

    TickMany(agent, 9, 1.0F);
    EXPECT_EQ(agent.GetState(), AgentState::Alert);
    agent.Tick(1.0F);
    EXPECT_EQ(agent.GetState(), AgentState::Idle);
}

TEST(AgentControllerTest, DeadAgentIgnoresEverything)
{
    test::TestScene scene(test::kBright);
    scene.PlaceTarget(glm::vec3{0.0F, 0.0F, -2.0F});

    AgentController agent(1, "a", scene.Context(), AgentTuning{});
    agent.Init();
    agent.Kill();
    ASSERT_EQ(agent.GetState(), AgentState::Dead);
    EXPECT_FALSE(agent.IsCollisionEnabled());

    StateLog log;
    log.Attach(agent);
    const glm::vec3 before = agent.Position();

    agent.ReceiveAlert(glm::vec3{1.0F, 0.0F, 1.0F});
    agent.Wake();
    agent.Investigate(glm::vec3{1.0F, 0.0F, 1.0F});
    EXPECT_FALSE(agent.RequestState(AgentState::Idle));
    agent.PutToSleep();
    TickMany(agent, 10, 0.5F);

    EXPECT_EQ(agent.GetState(), AgentState::Dead);
    EXPECT_FALSE(agent.IsTargetDetected());
    EXPECT_TRUE(log.order.empty());
    EXPECT_EQ(agent.Position(), before);
}

TEST(AgentControllerTest, TuningValidation)
{
    std::string error;
    EXPECT_TRUE(game::ai::ValidateAgentTuning(AgentTuning{}, &error));

    AgentTuning tuning;
    tuning.fieldOfViewDegrees = 0.0F;
    EXPECT_FALSE(game::ai::ValidateAgentTuning(tuning, &error));
    EXPECT_FALSE(error.empty());

    tuning = AgentTuning{};
    tuning.chaseSpeed = -1.0F;
    EXPECT_FALSE(game::ai::ValidateAgentTuning(tuning, nullptr));
}
