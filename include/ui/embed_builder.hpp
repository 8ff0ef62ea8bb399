#pragma once

#include "models/match_state.hpp"
#include "services/time_forecaster.hpp"
#include <dpp/dpp.h>

#include <span>
#include <string_view>

namespace pitchside::ui {

class embed_builder {
public:
	[[nodiscard]] static auto build_help() -> dpp::embed;

	// Pitch and bench, with minutes played so far
	[[nodiscard]] static auto build_roster(const pitch_state &state) -> dpp::embed;

	[[nodiscard]] static auto build_plan(std::string_view title, std::span<const substitution_event> plan, std::span<const player> players,
																			 std::string_view status) -> dpp::embed;

	[[nodiscard]] static auto build_forecast(std::span<const player_forecast> forecasts, int minutes_per_half) -> dpp::embed;

	[[nodiscard]] static auto build_clock(const match_clock_snapshot &clock, type::timestamp now) -> dpp::embed;

	[[nodiscard]] static auto plan_status(const pitch_state &state) -> std::string_view;

private:
	[[nodiscard]] static auto format_event(const substitution_event &ev, std::span<const player> players) -> std::string;
	[[nodiscard]] static auto format_player(const player &p) -> std::string;
};

} // namespace pitchside::ui
