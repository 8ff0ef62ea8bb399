#include "core/constants.hpp"
#include "services/live_monitor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace pitchside;
using namespace pitchside::test;

namespace {

class LiveMonitorTest : public ::testing::Test {
protected:
	type::timestamp t0 = at(1'700'000'000);

	std::shared_ptr<fake_clock> clock = std::make_shared<fake_clock>();
	std::shared_ptr<memory_store> store = std::make_shared<memory_store>();
	std::shared_ptr<recording_notifier> notifier = std::make_shared<recording_notifier>();
	live_monitor monitor{clock, store, notifier};

	void SetUp() override
	{
		pitch_state st;
		st.team_name = "Rovers";
		st.team_size = 4;
		st.players = small_squad();
		st.starting_players = st.players;
		st.plan = {event(1, 300, "a", "x"), event(1, 600, "b", "y"), event(2, 300, "x", "a")};
		st.plan_active = true;
		store->state = st;
	}

	auto state() const -> const pitch_state & { return *store->state; }
	auto set_clock(int half, int elapsed) -> void { clock->snapshot = running_clock(half, elapsed, t0); }
};

} // namespace

TEST_F(LiveMonitorTest, NothingSurfacesWhileTheClockIsStopped)
{
	clock->snapshot = running_clock(1, 400, t0);
	clock->snapshot->is_running = false;

	EXPECT_FALSE(monitor.poll(t0));
	EXPECT_TRUE(notifier->notices.empty());
}

TEST_F(LiveMonitorTest, UpcomingSubstitutionIsReportedButNotAnnounced)
{
	set_clock(1, 100);

	auto pending = monitor.poll(t0);

	ASSERT_TRUE(pending);
	EXPECT_FALSE(pending->is_due);
	EXPECT_EQ(pending->index, 0u);
	EXPECT_EQ(pending->seconds_until, 200);
	EXPECT_TRUE(notifier->notices.empty());
}

TEST_F(LiveMonitorTest, DueSubstitutionIsAnnouncedOnce)
{
	set_clock(1, 305);

	auto first = monitor.poll(t0);
	auto second = monitor.poll(t0 + std::chrono::seconds{2});

	ASSERT_TRUE(first);
	EXPECT_TRUE(first->is_due);
	ASSERT_TRUE(second);
	EXPECT_EQ(notifier->count(notice_kind::pending), 1u);
	EXPECT_NE(notifier->notices.front().second.find("x on for a at 05:00 (H1)"), std::string::npos);
}

TEST_F(LiveMonitorTest, SubstitutionsSharingAStampFormABatch)
{
	store->state->plan[1].time = 300;
	set_clock(1, 300);

	auto pending = monitor.poll(t0);

	ASSERT_TRUE(pending);
	EXPECT_EQ(pending->batch, (std::vector<std::size_t>{0, 1}));
	ASSERT_EQ(notifier->count(notice_kind::pending), 1u);
	EXPECT_NE(notifier->notices.front().second.find('\n'), std::string::npos);
}

TEST_F(LiveMonitorTest, PausedPlanStaysQuiet)
{
	store->state->plan_paused = true;
	set_clock(1, 400);

	EXPECT_FALSE(monitor.poll(t0));
	EXPECT_FALSE(monitor.current(t0));
}

TEST_F(LiveMonitorTest, SnoozeHidesPromptsForAWhile)
{
	set_clock(1, 300);
	monitor.snooze(t0);

	EXPECT_TRUE(monitor.is_snoozed(t0));
	EXPECT_FALSE(monitor.poll(t0 + std::chrono::seconds{30}));
	EXPECT_TRUE(monitor.current(t0 + std::chrono::seconds{30}));

	EXPECT_TRUE(monitor.poll(t0 + constants::engine::snooze_duration));
	EXPECT_FALSE(monitor.is_snoozed(t0 + constants::engine::snooze_duration));
	EXPECT_EQ(notifier->count(notice_kind::pending), 1u);
}

TEST_F(LiveMonitorTest, MisplacedPlayersRaiseAnInconsistencyNotice)
{
	auto &a = store->state->players[1];
	a.move_to_bench();
	set_clock(1, 300);

	(void)monitor.poll(t0);
	(void)monitor.poll(t0);

	EXPECT_EQ(notifier->count(notice_kind::pending), 1u);
	EXPECT_EQ(notifier->count(notice_kind::inconsistent), 1u);
}

TEST_F(LiveMonitorTest, FullTimeIsAnnouncedOnce)
{
	clock->snapshot = match_clock_snapshot{.current_half = 2, .elapsed_seconds = 1200, .last_update = t0};

	EXPECT_FALSE(monitor.poll(t0));
	EXPECT_FALSE(monitor.poll(t0));
	EXPECT_EQ(notifier->count(notice_kind::finished), 1u);
}

TEST_F(LiveMonitorTest, AcceptMovesPlayersAndCreditsTime)
{
	set_clock(1, 310);

	auto record = monitor.accept(t0, 0);

	ASSERT_TRUE(record);
	EXPECT_EQ(record->outcome, substitution_outcome::executed);
	EXPECT_EQ(record->at_total_seconds, 310);

	const auto &players = state().players;
	EXPECT_TRUE(player_by_id(players, "a").on_bench());
	EXPECT_TRUE(player_by_id(players, "x").on_field());
	EXPECT_EQ(player_by_id(players, "x").current_pitch_position, pitch_position::def);
	EXPECT_EQ(player_by_id(players, "a").seconds_played, 310);
	EXPECT_EQ(player_by_id(players, "x").seconds_played, 0);
	EXPECT_EQ(state().last_timer_seconds, 310);

	// Ten seconds late keeps the schedule
	EXPECT_TRUE(state().plan[0].executed);
	EXPECT_EQ(state().plan[1].stamp(), (match_time{.half = 1, .time = 600}));
	ASSERT_EQ(state().history.size(), 1u);
	EXPECT_EQ(notifier->count(notice_kind::executed), 1u);
}

TEST_F(LiveMonitorTest, LateAcceptSpreadsTheRestOfThePlan)
{
	set_clock(1, 400);

	ASSERT_TRUE(monitor.accept(t0, 0));

	// 2000 seconds left over two pending events
	EXPECT_EQ(state().plan[1].stamp(), (match_time{.half = 1, .time = 1066}));
	EXPECT_EQ(state().plan[2].stamp(), (match_time{.half = 2, .time = 532}));
	EXPECT_TRUE(state().plan_active);
}

TEST_F(LiveMonitorTest, AcceptWithPlayersOutOfPlaceIsRecordedAsInconsistent)
{
	store->state->players[1].move_to_bench();
	const auto before = state().players;
	set_clock(1, 300);

	auto record = monitor.accept(t0, 0);

	ASSERT_TRUE(record);
	EXPECT_EQ(record->outcome, substitution_outcome::inconsistent);
	EXPECT_TRUE(state().plan[0].executed);
	EXPECT_TRUE(player_by_id(state().players, "x").on_bench());
	EXPECT_EQ(player_by_id(state().players, "b").current_pitch_position, player_by_id(before, "b").current_pitch_position);
	EXPECT_EQ(notifier->count(notice_kind::skipped), 1u);
	EXPECT_EQ(notifier->count(notice_kind::executed), 0u);
}

TEST_F(LiveMonitorTest, OperatorOverrideReplacesThePlannedPlayers)
{
	set_clock(1, 300);

	auto record = monitor.accept(t0, 0, substitution_override{.player_out = "c", .player_in = "y"});

	ASSERT_TRUE(record);
	EXPECT_EQ(record->event.player_out, "c");
	EXPECT_EQ(record->event.player_in, "y");
	EXPECT_TRUE(player_by_id(state().players, "c").on_bench());
	EXPECT_TRUE(player_by_id(state().players, "a").on_field());
	EXPECT_EQ(player_by_id(state().players, "y").current_pitch_position, pitch_position::fwd);
}

TEST_F(LiveMonitorTest, SwapPassengerTakesTheVacatedSlot)
{
	auto &ev = store->state->plan[0];
	ev.swap = position_swap{.player_id = "b", .from = pitch_position::mid, .to = pitch_position::def};
	set_clock(1, 300);

	ASSERT_TRUE(monitor.accept(t0, 0));

	EXPECT_EQ(player_by_id(state().players, "b").current_pitch_position, pitch_position::def);
	EXPECT_EQ(player_by_id(state().players, "x").current_pitch_position, pitch_position::mid);
}

TEST_F(LiveMonitorTest, SkipLeavesPlayersAndReschedules)
{
	set_clock(1, 300);

	auto record = monitor.skip(t0, 0);

	ASSERT_TRUE(record);
	EXPECT_EQ(record->outcome, substitution_outcome::skipped);
	EXPECT_TRUE(player_by_id(state().players, "a").on_field());
	EXPECT_TRUE(player_by_id(state().players, "x").on_bench());
	EXPECT_EQ(state().plan[1].stamp(), (match_time{.half = 1, .time = 1000}));
	EXPECT_EQ(state().plan[2].stamp(), (match_time{.half = 2, .time = 500}));
	EXPECT_EQ(notifier->count(notice_kind::skipped), 1u);
}

TEST_F(LiveMonitorTest, ExecutedOrMissingEventsCannotBeActedOn)
{
	set_clock(1, 300);
	ASSERT_TRUE(monitor.accept(t0, 0));

	auto again = monitor.accept(t0, 0);
	ASSERT_FALSE(again);
	EXPECT_EQ(again.error().what(), constants::text::nothing_pending);
	EXPECT_FALSE(monitor.skip(t0, 9));
}

TEST_F(LiveMonitorTest, UpcomingSubstitutionCannotBeAcceptedOrSkipped)
{
	set_clock(1, 100);
	const auto before = state();

	auto pending = monitor.current(t0);
	ASSERT_TRUE(pending);
	EXPECT_FALSE(pending->is_due);

	auto skipped = monitor.skip(t0, pending->index);
	ASSERT_FALSE(skipped);
	EXPECT_EQ(skipped.error().what(), constants::text::not_due_yet);

	auto accepted = monitor.accept(t0, pending->index);
	ASSERT_FALSE(accepted);
	EXPECT_EQ(accepted.error().what(), constants::text::not_due_yet);

	EXPECT_EQ(state().plan, before.plan);
	EXPECT_EQ(state().players, before.players);
	EXPECT_TRUE(state().history.empty());
	EXPECT_TRUE(notifier->notices.empty());
}

TEST_F(LiveMonitorTest, FailedWriteIsReportedAndLeavesTheStoreAlone)
{
	set_clock(1, 300);
	store->fail_writes = true;

	auto record = monitor.accept(t0, 0);

	ASSERT_FALSE(record);
	EXPECT_FALSE(state().plan[0].executed);
	EXPECT_EQ(notifier->count(notice_kind::error), 1u);
}

TEST_F(LiveMonitorTest, LastAcceptClosesThePlan)
{
	store->state->plan = {event(1, 300, "a", "x")};
	set_clock(1, 300);

	ASSERT_TRUE(monitor.accept(t0, 0));
	EXPECT_FALSE(state().plan_active);
	EXPECT_FALSE(monitor.current(t0));
}

TEST_F(LiveMonitorTest, WatchPollsAfterEveryStoreWrite)
{
	clock->snapshot = running_clock(1, 300, util::now());
	monitor.watch();

	auto copy = state();
	ASSERT_TRUE(store->write_pitch_state(copy));

	EXPECT_EQ(notifier->count(notice_kind::pending), 1u);
}

TEST(RebalanceTest, SpreadsPendingEventsEvenlyInOrder)
{
	auto done = event(1, 100, "a", "x");
	done.executed = true;
	substitution_plan plan{done, event(1, 900, "b", "y"), event(1, 300, "c", "a"), event(2, 100, "x", "b")};

	auto out = live_monitor::rebalance(plan, 600, 1200);

	// (2400 - 600) / 4 = 450 between events
	EXPECT_EQ(out[0], done);
	EXPECT_EQ(out[1].stamp(), (match_time{.half = 1, .time = 1050}));
	EXPECT_EQ(out[2].stamp(), (match_time{.half = 2, .time = 300}));
	EXPECT_EQ(out[3].stamp(), (match_time{.half = 2, .time = 750}));
	EXPECT_EQ(out[2].player_out, "c");
}

TEST(RebalanceTest, IsStableWhenRepeatedAtTheSameMoment)
{
	substitution_plan plan{event(1, 300, "a", "x"), event(2, 600, "b", "y")};

	auto once = live_monitor::rebalance(plan, 700, 1200);
	auto twice = live_monitor::rebalance(once, 700, 1200);

	EXPECT_EQ(once, twice);
}

TEST(RebalanceTest, KeepsAMinimumGapAndStopsBeforeFullTime)
{
	substitution_plan plan{event(2, 1000, "a", "x"), event(2, 1100, "b", "y"), event(2, 1150, "c", "z")};

	auto out = live_monitor::rebalance(plan, 2300, 1200);

	EXPECT_EQ(out[0].stamp(), (match_time{.half = 2, .time = 1160}));
	EXPECT_EQ(out[1].stamp(), (match_time{.half = 2, .time = 1199}));
	EXPECT_EQ(out[2].stamp(), (match_time{.half = 2, .time = 1199}));
}
