#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "game/ai/ScriptSequencer.hpp"

using game::ai::AgentState;
using game::ai::IScriptActor;
using game::ai::ScriptCue;
using game::ai::ScriptSequence;
using game::ai::ScriptSequencer;
using game::ai::ScriptStep;
using game::ai::ScriptStepType;

namespace
{
class RecordingActor final : public IScriptActor
{
public:
    [[nodiscard]] glm::vec3 ScriptPosition() const override { return position; }
    void ScriptSetPosition(const glm::vec3& value) override { position = value; }
    void ScriptChangeState(AgentState state, const glm::vec3& target) override
    {
        states.emplace_back(state, target);
    }
    void EmitScriptCue(const ScriptCue& cue) override { cues.push_back(cue); }

    glm::vec3 position{0.0F};
    std::vector<std::pair<AgentState, glm::vec3>> states;
    std::vector<ScriptCue> cues;
};

ScriptStep MakeStep(ScriptStepType type, float duration = 1.0F, std::string text = {})
{
    ScriptStep step;
    step.type = type;
    step.duration = duration;
    step.text = std::move(text);
    return step;
}

ScriptSequencer MakeSequencer(ScriptSequence sequence)
{
    ScriptSequencer sequencer;
    std::vector<ScriptSequence> sequences;
    sequences.push_back(std::move(sequence));
    sequencer.SetSequences(std::move(sequences));
    return sequencer;
}
} // namespace

TEST(ScriptSequencerTest, DelayThenMoveInterpolates)
{
    ScriptSequence sequence;
    sequence.delayBeforeStart = 1.0F;
    ScriptStep move = MakeStep(ScriptStepType::MoveTo, 2.0F);
    move.targetPosition = glm::vec3{10.0F, 0.0F, 0.0F};
    sequence.steps.push_back(move);

    ScriptSequencer sequencer = MakeSequencer(sequence);
    RecordingActor actor;
    ASSERT_TRUE(sequencer.Start(0));

    sequencer.Update(0.5F, actor);
    EXPECT_FLOAT_EQ(actor.position.x, 0.0F);
    sequencer.Update(0.5F, actor);
    sequencer.Update(1.0F, actor);
    EXPECT_FLOAT_EQ(actor.position.x, 5.0F);

    sequencer.Update(1.0F, actor);
    EXPECT_FLOAT_EQ(actor.position.x, 10.0F);
    EXPECT_FALSE(sequencer.IsRunning());
}

TEST(ScriptSequencerTest, PresentationStepsEmitCues)
{
    ScriptSequence sequence;
    sequence.steps.push_back(MakeStep(ScriptStepType::PlayAnimation, 1.0F, "wave"));
    sequence.steps.push_back(MakeStep(ScriptStepType::ShowDialogue, 0.0F, "hello"));
    sequence.steps.push_back(MakeStep(ScriptStepType::TriggerEvent, 0.0F, "alarm"));

    ScriptSequencer sequencer = MakeSequencer(sequence);
    RecordingActor actor;
    sequencer.Start(0);

    sequencer.Update(0.0F, actor);
    ASSERT_EQ(actor.cues.size(), 1U);
    EXPECT_EQ(actor.cues[0].text, "wave");

    sequencer.Update(1.0F, actor);
    ASSERT_EQ(actor.cues.size(), 2U);
    EXPECT_EQ(actor.cues[1].type, ScriptStepType::ShowDialogue);
    EXPECT_FLOAT_EQ(actor.cues[1].duration, ScriptSequencer::kDefaultDialogueSeconds);

    sequencer.Update(3.0F, actor);
    ASSERT_EQ(actor.cues.size(), 3U);
    EXPECT_EQ(actor.cues[2].text, "alarm");
    EXPECT_FALSE(sequencer.IsRunning());
}

TEST(ScriptSequencerTest, ChangeStateYieldsToActor)
{
    ScriptSequence sequence;
    ScriptStep change = MakeStep(ScriptStepType::ChangeState, 0.0F);
    change.state = AgentState::Investigate;
    change.targetPosition = glm::vec3{4.0F, 0.0F, 4.0F};
    sequence.steps.push_back(change);
    sequence.steps.push_back(MakeStep(ScriptStepType::Wait, 1.0F));

    ScriptSequencer sequencer = MakeSequencer(sequence);
    RecordingActor actor;
    sequencer.Start(0);

    sequencer.Update(0.0F, actor);
    ASSERT_EQ(actor.states.size(), 1U);
    EXPECT_EQ(actor.states[0].first, AgentState::Investigate);
    EXPECT_FLOAT_EQ(actor.states[0].second.z, 4.0F);
    EXPECT_EQ(sequencer.CurrentStepIndex(), 0U);

    sequencer.Update(0.0F, actor);
    EXPECT_EQ(sequencer.CurrentStepIndex(), 1U);
    EXPECT_EQ(actor.states.size(), 1U);
}

TEST(ScriptSequencerTest, WaitForTriggerHoldsUntilNamedTrigger)
{
    ScriptSequence sequence;
    sequence.steps.push_back(MakeStep(ScriptStepType::WaitForTrigger, 0.0F, "door"));
    sequence.steps.push_back(MakeStep(ScriptStepType::Wait, 1.0F));

    ScriptSequencer sequencer = MakeSequencer(sequence);
    RecordingActor actor;
    sequencer.Start(0);

    sequencer.Update(5.0F, actor);
    EXPECT_TRUE(sequencer.IsWaitingForTrigger());

    sequencer.Trigger("window");
    sequencer.Update(0.1F, actor);
    EXPECT_TRUE(sequencer.IsWaitingForTrigger());

    sequencer.Trigger("door");
    sequencer.Update(0.1F, actor);
    EXPECT_FALSE(sequencer.IsWaitingForTrigger());
    EXPECT_EQ(sequencer.CurrentStepIndex(), 1U);
}

TEST(ScriptSequencerTest, LoopingSequenceWrapsAround)
{
    ScriptSequence sequence;
    sequence.loop = true;
    sequence.steps.push_back(MakeStep(ScriptStepType::Wait, 1.0F));

    ScriptSequencer sequencer = MakeSequencer(sequence);
    RecordingActor actor;
    sequencer.Start(0);

    sequencer.Update(2.5F, actor);
    EXPECT_TRUE(sequencer.IsRunning());
    EXPECT_EQ(sequencer.CurrentStepIndex(), 0U);
}

TEST(ScriptSequencerTest, EmptySequenceStopsImmediately)
{
    ScriptSequencer sequencer = MakeSequencer(ScriptSequence{});
    RecordingActor actor;
    ASSERT_TRUE(sequencer.Start(0));
    sequencer.Update(0.0F, actor);
    EXPECT_FALSE(sequencer.IsRunning());
}

TEST(ScriptSequencerTest, InvalidStartIsRejected)
{
    ScriptSequence sequence;
    sequence.name = "rounds";
    sequence.steps.push_back(MakeStep(ScriptStepType::Wait));
    ScriptSequencer sequencer = MakeSequencer(sequence);

    EXPECT_FALSE(sequencer.Start(3));
    EXPECT_FALSE(sequencer.StartByName("missing"));
    EXPECT_FALSE(sequencer.IsRunning());

    EXPECT_TRUE(sequencer.StartByName("rounds"));
    EXPECT_EQ(sequencer.CurrentSequenceIndex(), std::optional<std::size_t>{0});

    sequencer.SetSequences({});
    EXPECT_FALSE(sequencer.IsRunning());
}

TEST(ScriptSequencerTest, StepTypeNamesRoundTrip)
{
    EXPECT_EQ(game::ai::ParseScriptStepType("wait_for_trigger"), ScriptStepType::WaitForTrigger);
    EXPECT_STREQ(game::ai::ScriptStepTypeToText(ScriptStepType::MoveTo), "move_to");
    EXPECT_FALSE(game::ai::ParseScriptStepType("teleport").has_value());
}
