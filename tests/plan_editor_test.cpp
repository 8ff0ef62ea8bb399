#include "core/constants.hpp"
#include "services/plan_editor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace pitchside;
using namespace pitchside::test;

namespace {

class PlanEditorTest : public ::testing::Test {
protected:
	plan_editor editor{10};
	std::vector<player> squad = small_squad();
	substitution_plan plan{event(1, 120, "a", "x"), event(1, 300, "b", "y"), event(2, 120, "x", "a"), event(2, 300, "y", "b")};

	auto execute_first() -> void { plan[0].executed = true; }
};

} // namespace

TEST_F(PlanEditorTest, EraseRemovesAPendingSubstitution)
{
	auto res = editor.erase(plan, 1);

	ASSERT_TRUE(res);
	ASSERT_EQ(res->size(), 3u);
	EXPECT_EQ((*res)[1], plan[2]);
}

TEST_F(PlanEditorTest, ExecutedSubstitutionsAreImmutable)
{
	execute_first();

	auto erased = editor.erase(plan, 0);
	ASSERT_FALSE(erased);
	EXPECT_EQ(erased.error().what(), constants::text::executed_immutable);

	EXPECT_FALSE(editor.retime(plan, 0, 3, 1));
	EXPECT_FALSE(editor.reassign(plan, squad, 0, "c", "y"));
	EXPECT_FALSE(editor.reorder(plan, 0, 2));
}

TEST_F(PlanEditorTest, OutOfRangeIndexIsRejected)
{
	auto res = editor.erase(plan, 4);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::index_out_of_range);
}

TEST_F(PlanEditorTest, RetimeMovesTheEventAndResorts)
{
	auto res = editor.retime(plan, 0, 7, 1);

	ASSERT_TRUE(res);
	EXPECT_EQ((*res)[0], plan[1]);
	EXPECT_EQ((*res)[1].stamp(), (match_time{.half = 1, .time = 420}));
	EXPECT_EQ((*res)[1].player_out, "a");
}

TEST_F(PlanEditorTest, RetimeValidatesHalfAndMinute)
{
	EXPECT_EQ(editor.retime(plan, 1, 5, 3).error().what(), constants::text::invalid_half);
	EXPECT_EQ(editor.retime(plan, 1, 11, 1).error().what(), constants::text::invalid_minute);
	EXPECT_EQ(editor.retime(plan, 1, -1, 2).error().what(), constants::text::invalid_minute);
	EXPECT_TRUE(editor.retime(plan, 1, 10, 1));
}

TEST_F(PlanEditorTest, RetimeCannotCrossAnExecutedSubstitution)
{
	execute_first();

	auto res = editor.retime(plan, 1, 1, 1);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::crosses_executed);
}

TEST_F(PlanEditorTest, ReassignChangesPlayersAndDropsStaleSwaps)
{
	plan[1].swap = position_swap{.player_id = "c", .from = pitch_position::fwd, .to = pitch_position::mid};

	auto res = editor.reassign(plan, squad, 1, "c", "y");

	ASSERT_TRUE(res);
	EXPECT_EQ((*res)[1].player_out, "c");
	EXPECT_EQ((*res)[1].player_in, "y");
	EXPECT_FALSE((*res)[1].swap);
	EXPECT_EQ((*res)[1].stamp(), plan[1].stamp());
}

TEST_F(PlanEditorTest, ReassignKeepsTheSwapOnlyWhileTheOutPlayerStays)
{
	plan[1].swap = position_swap{.player_id = "c", .from = pitch_position::fwd, .to = pitch_position::mid};

	auto new_substitute = editor.reassign(plan, squad, 1, "b", "x");
	ASSERT_TRUE(new_substitute);
	ASSERT_TRUE((*new_substitute)[1].swap);
	EXPECT_EQ((*new_substitute)[1].swap->player_id, "c");

	auto new_out = editor.reassign(plan, squad, 1, "a", "y");
	ASSERT_TRUE(new_out);
	EXPECT_EQ((*new_out)[1].player_out, "a");
	EXPECT_FALSE((*new_out)[1].swap);
}

TEST_F(PlanEditorTest, ReassignRejectsUnknownOrIdenticalPlayers)
{
	EXPECT_EQ(editor.reassign(plan, squad, 1, "b", "ghost").error().what(), constants::text::player_not_found);
	EXPECT_EQ(editor.reassign(plan, squad, 1, "y", "y").error().what(), constants::text::same_player);
}

TEST_F(PlanEditorTest, InsertUsesWhoIsOnThePitchAtThatMoment)
{
	// By minute 6 a has gone off for x
	auto wrong = editor.insert(plan, squad, 1, 6, "a", "y");
	ASSERT_FALSE(wrong);
	EXPECT_EQ(wrong.error().what(), constants::text::out_not_on_pitch);

	auto res = editor.insert(plan, squad, 1, 6, "x", "a");
	ASSERT_TRUE(res);
	ASSERT_EQ(res->size(), 5u);
	EXPECT_EQ((*res)[2], event(1, 360, "x", "a"));
}

TEST_F(PlanEditorTest, InsertSkipsInjuredSubstitutes)
{
	squad[5].injured = true;

	auto res = editor.insert(plan, squad, 1, 1, "c", "y");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::in_not_on_bench);

	auto avail = editor.candidates_at(plan, squad, 1, 60);
	EXPECT_EQ(avail.on_pitch.size(), 4u);
	ASSERT_EQ(avail.on_bench.size(), 1u);
	EXPECT_EQ(avail.on_bench.front().id, "x");
}

TEST_F(PlanEditorTest, CandidatesExcludeEventsAtTheSameMoment)
{
	auto avail = editor.candidates_at(plan, squad, 1, 120);

	EXPECT_TRUE(std::ranges::contains(avail.on_pitch, std::string{"a"}, &player::id));
	EXPECT_TRUE(std::ranges::contains(avail.on_bench, std::string{"x"}, &player::id));
}

TEST_F(PlanEditorTest, ReorderMovesWithoutRetiming)
{
	auto res = editor.reorder(plan, 3, 1);

	ASSERT_TRUE(res);
	EXPECT_EQ((*res)[1], plan[3]);
	EXPECT_EQ((*res)[2], plan[1]);
	EXPECT_EQ((*res)[3], plan[2]);
	EXPECT_EQ((*res)[1].stamp(), plan[3].stamp());
}

TEST_F(PlanEditorTest, ReorderCannotPassAnExecutedSubstitution)
{
	execute_first();

	EXPECT_EQ(editor.reorder(plan, 2, 0).error().what(), constants::text::crosses_executed);
	EXPECT_EQ(editor.reorder(plan, 1, 9).error().what(), constants::text::index_out_of_range);
	EXPECT_TRUE(editor.reorder(plan, 1, 3));
}

TEST_F(PlanEditorTest, FailedEditLeavesTheInputUntouched)
{
	const auto before = plan;
	(void)editor.retime(plan, 1, 30, 1);
	(void)editor.erase(plan, 7);

	EXPECT_EQ(plan, before);
}
