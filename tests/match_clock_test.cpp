#include "core/constants.hpp"
#include "services/match_clock.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace pitchside;
using namespace pitchside::test;
using namespace std::chrono_literals;

namespace {

class MatchClockTest : public ::testing::Test {
protected:
	temp_dir dir;
	std::shared_ptr<persistence_service> persistence = std::make_shared<persistence_service>(dir.path());
	match_clock clock{persistence, 20};
	type::timestamp t0 = at(1'700'000'000);
};

} // namespace

TEST_F(MatchClockTest, StartCreatesARunningClockAtKickoff)
{
	auto started = clock.start(t0);

	ASSERT_TRUE(started);
	EXPECT_TRUE(started->is_running);
	EXPECT_EQ(started->current_half, 1);
	EXPECT_EQ(started->minutes_per_half, 20);
	EXPECT_EQ(clock.snapshot()->current_total_seconds(t0 + 75s), 75);
}

TEST_F(MatchClockTest, PauseFreezesElapsedTime)
{
	ASSERT_TRUE(clock.start(t0));

	auto paused = clock.pause(t0 + 90s);

	ASSERT_TRUE(paused);
	EXPECT_FALSE(paused->is_running);
	EXPECT_EQ(paused->elapsed_seconds, 90);
	EXPECT_EQ(clock.snapshot()->half_seconds(t0 + 600s), 90);

	auto again = clock.pause(t0 + 100s);
	ASSERT_FALSE(again);
	EXPECT_EQ(again.error().what(), constants::text::clock_not_running);
}

TEST_F(MatchClockTest, ResumeContinuesFromThePausedTime)
{
	ASSERT_TRUE(clock.start(t0));
	ASSERT_TRUE(clock.pause(t0 + 90s));
	ASSERT_TRUE(clock.start(t0 + 300s));

	EXPECT_EQ(clock.snapshot()->current_total_seconds(t0 + 310s), 100);
}

TEST_F(MatchClockTest, PauseWithoutAClockIsAnError)
{
	auto res = clock.pause(t0);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::no_clock);
}

TEST_F(MatchClockTest, SecondHalfStartsFromZeroAndCountsAfterTheFirst)
{
	ASSERT_TRUE(clock.start(t0));
	auto second = clock.start_second_half(t0 + 1300s);

	ASSERT_TRUE(second);
	EXPECT_EQ(second->current_half, 2);
	EXPECT_EQ(second->elapsed_seconds, 0);
	EXPECT_TRUE(second->is_running);
	EXPECT_EQ(clock.snapshot()->current_total_seconds(t0 + 1360s), 1260);

	EXPECT_FALSE(clock.start_second_half(t0 + 1400s));
}

TEST_F(MatchClockTest, ElapsedTimeStopsAtTheEndOfTheHalf)
{
	ASSERT_TRUE(clock.start(t0));

	EXPECT_EQ(clock.snapshot()->half_seconds(t0 + 5000s), 1200);
	EXPECT_FALSE(clock.snapshot()->is_finished(t0 + 5000s));
}

TEST_F(MatchClockTest, FinishedMatchCannotRestart)
{
	ASSERT_TRUE(persistence->write_clock({.current_half = 2, .elapsed_seconds = 1200, .last_update = t0}));

	auto res = clock.start(t0 + 10s);
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error().what(), constants::text::match_over);
}

TEST_F(MatchClockTest, ResetReturnsToKickoffKeepingTheHalfLength)
{
	ASSERT_TRUE(clock.reset(t0, 25));
	ASSERT_TRUE(clock.start(t0));
	ASSERT_TRUE(clock.start_second_half(t0 + 100s));

	auto reset = clock.reset(t0 + 200s);

	ASSERT_TRUE(reset);
	EXPECT_EQ(reset->minutes_per_half, 25);
	EXPECT_EQ(reset->current_half, 1);
	EXPECT_EQ(reset->elapsed_seconds, 0);
	EXPECT_FALSE(reset->is_running);
	EXPECT_EQ(clock.reset(t0, 0).error().what(), constants::text::invalid_minutes);
}
