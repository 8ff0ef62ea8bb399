#include "core/constants.hpp"
#include "models/roster.hpp"
#include "services/pitch_service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace pitchside;
using namespace pitchside::test;

namespace {

class PitchServiceTest : public ::testing::Test {
protected:
	type::timestamp t0 = at(1'700'000'000);

	std::shared_ptr<fake_clock> clock = std::make_shared<fake_clock>();
	std::shared_ptr<memory_store> store = std::make_shared<memory_store>();
	std::shared_ptr<recording_notifier> notifier = std::make_shared<recording_notifier>();
	pitch_service service{store, clock, notifier, 10};

	// Four on the pitch in the first 4-a-side formation, one substitute.
	auto full_lineup() -> void
	{
		ASSERT_TRUE(service.setup(4, "Rovers"));
		for (auto name : {"Ana", "Bea", "Cai", "Dee", "Eli"}) {
			ASSERT_TRUE(service.add_player(name, std::nullopt, {}, false));
		}
		for (int slot = 1; slot <= 4; ++slot) {
			ASSERT_TRUE(service.set_slot(std::format("p{}", slot), slot));
		}
	}
};

} // namespace

TEST_F(PitchServiceTest, SetupRejectsUnsupportedTeamSizes)
{
	auto res = service.setup(5, "Rovers");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::invalid_team_size);
	EXPECT_FALSE(store->state);
}

TEST_F(PitchServiceTest, OperationsNeedASetUpMatch)
{
	auto res = service.add_player("Ana", std::nullopt, {}, false);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::no_pitch_state);
}

TEST_F(PitchServiceTest, AddPlayerAssignsSequentialIds)
{
	ASSERT_TRUE(service.setup(7, "Rovers"));

	auto ana = service.add_player("Ana", 7, {pitch_position::gk}, false);
	auto bea = service.add_player("Bea", std::nullopt, {}, true);

	ASSERT_TRUE(ana);
	ASSERT_TRUE(bea);
	EXPECT_EQ(ana->id, "p1");
	EXPECT_EQ(bea->id, "p2");
	EXPECT_TRUE(bea->fill_in);
	EXPECT_TRUE(ana->on_bench());
	EXPECT_EQ(service.state()->players.size(), 2u);
}

TEST_F(PitchServiceTest, AddPlayerRejectsDuplicatesAndBlankNames)
{
	ASSERT_TRUE(service.setup(7, "Rovers"));
	ASSERT_TRUE(service.add_player("Ana", std::nullopt, {}, false));

	EXPECT_EQ(service.add_player("ana", std::nullopt, {}, false).error().what(), constants::text::player_exists);
	EXPECT_EQ(service.add_player("", std::nullopt, {}, false).error().what(), constants::text::empty_name);
}

TEST_F(PitchServiceTest, SlotsCarryTheirPositionLabel)
{
	full_lineup();

	const auto st = *service.state();
	EXPECT_EQ(player_by_id(st.players, "p1").current_pitch_position, pitch_position::def);
	EXPECT_EQ(player_by_id(st.players, "p2").current_pitch_position, pitch_position::mid);
	EXPECT_EQ(player_by_id(st.players, "p4").current_pitch_position, pitch_position::fwd);
	EXPECT_TRUE(player_by_id(st.players, "p5").on_bench());
	EXPECT_TRUE(roster::validate_lineup(st.players, 4));
}

TEST_F(PitchServiceTest, TakingAnOccupiedSlotSendsTheOccupantToTheMoversPlace)
{
	full_lineup();

	ASSERT_TRUE(service.set_slot("Eli", 1));
	EXPECT_TRUE(player_by_id(service.state()->players, "p1").on_bench());

	ASSERT_TRUE(service.set_slot("Eli", 4));
	const auto st = *service.state();
	EXPECT_EQ(player_by_id(st.players, "p4").current_pitch_position, pitch_position::def);
	EXPECT_EQ(player_by_id(st.players, "p5").current_pitch_position, pitch_position::fwd);
}

TEST_F(PitchServiceTest, SlotOutsideTheFormationIsRejected)
{
	full_lineup();

	EXPECT_EQ(service.set_slot("Eli", 5).error().what(), constants::text::invalid_slot);
	EXPECT_EQ(service.set_slot("Zed", 1).error().what(), constants::text::player_not_found);
}

TEST_F(PitchServiceTest, DraftNeedsAFullLineup)
{
	ASSERT_TRUE(service.setup(4, "Rovers"));
	ASSERT_TRUE(service.add_player("Ana", std::nullopt, {}, false));

	EXPECT_FALSE(service.draft_plan({}));
}

TEST_F(PitchServiceTest, DraftNeedsAnAvailableSubstitute)
{
	full_lineup();
	ASSERT_TRUE(service.set_injured("Eli", true));

	EXPECT_EQ(service.draft_plan({}).error().what(), constants::text::not_enough_players);
}

TEST_F(PitchServiceTest, StartedPlanRecordsTheKickoffLineup)
{
	full_lineup();

	auto draft = service.draft_plan({});
	ASSERT_TRUE(draft);
	ASSERT_FALSE(draft->empty());

	auto started = service.start_plan(*draft, t0);

	ASSERT_TRUE(started);
	EXPECT_TRUE(started->plan_active);
	EXPECT_FALSE(started->plan_paused);
	EXPECT_EQ(started->starting_players, started->players);
	EXPECT_EQ(started->plan, *draft);
}

TEST_F(PitchServiceTest, StalePlanIsRejected)
{
	full_lineup();

	auto res = service.start_plan({event(1, 300, "p1", "p2")}, t0);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::plan_stale);
	EXPECT_TRUE(service.state()->plan.empty());
}

TEST_F(PitchServiceTest, PlayersInThePendingPlanCannotBeRemoved)
{
	full_lineup();
	ASSERT_TRUE(service.start_plan({event(1, 300, "p1", "p5")}, t0));

	EXPECT_EQ(service.remove_player("Eli").error().what(), constants::text::player_in_plan);
	ASSERT_TRUE(service.add_player("Fay", std::nullopt, {}, false));
	EXPECT_TRUE(service.remove_player("Fay"));
}

TEST_F(PitchServiceTest, EditsGoThroughTheEditor)
{
	full_lineup();
	ASSERT_TRUE(service.start_plan({event(1, 300, "p1", "p5"), event(2, 300, "p5", "p1")}, t0));

	auto res = service.edit_plan([](const pitch_state &st, const plan_editor &editor) { return editor.retime(st.plan, 0, 8, 1); });

	ASSERT_TRUE(res);
	EXPECT_EQ(res->plan[0].stamp(), (match_time{.half = 1, .time = 480}));

	auto bad = service.edit_plan([](const pitch_state &st, const plan_editor &editor) { return editor.erase(st.plan, 5); });
	ASSERT_FALSE(bad);
	EXPECT_EQ(service.state()->plan.size(), 2u);
}

TEST_F(PitchServiceTest, PauseTogglesOnlyOnce)
{
	full_lineup();
	EXPECT_EQ(service.set_paused(true).error().what(), constants::text::no_plan);

	ASSERT_TRUE(service.start_plan({event(1, 300, "p1", "p5")}, t0));
	ASSERT_TRUE(service.set_paused(true));
	EXPECT_EQ(service.set_paused(true).error().what(), constants::text::plan_paused);
	ASSERT_TRUE(service.set_paused(false));
	EXPECT_EQ(service.set_paused(false).error().what(), constants::text::plan_not_paused);
}

TEST_F(PitchServiceTest, ReplanSchedulesTheRestFromNow)
{
	full_lineup();
	ASSERT_TRUE(service.start_plan({event(1, 120, "p1", "p5"), event(1, 500, "p2", "p1")}, t0));
	clock->snapshot = running_clock(1, 300, t0, 10);

	auto res = service.replan({}, t0);

	ASSERT_TRUE(res);
	EXPECT_TRUE(res->plan_active);
	ASSERT_EQ(res->plan.size(), 1u);
	EXPECT_EQ(res->plan[0].stamp(), (match_time{.half = 2, .time = 150}));
	EXPECT_EQ(player_by_id(res->players, "p1").seconds_played, 300);
	EXPECT_EQ(notifier->count(notice_kind::replanned), 1u);
}
