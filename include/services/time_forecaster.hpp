#pragma once

#include "models/match_state.hpp"
#include "models/player.hpp"
#include "models/substitution.hpp"

#include <span>
#include <vector>

namespace pitchside {

struct player_forecast {
	player who;
	int predicted_seconds{};
	int predicted_minutes{};
	int percentage_of_game{};
	bool starts_on_pitch{};
};

class time_forecaster {
public:
	// Replays the plan over the starting lineup; sorted by predicted time, most first.
	[[nodiscard]] static auto forecast(std::span<const player> roster, std::span<const substitution_event> plan, int minutes_per_half) -> std::vector<player_forecast>;

	// Forecast for a match in progress: replays from the starting lineup, dropping executed
	// events that were skipped rather than carried out.
	[[nodiscard]] static auto forecast_live(const pitch_state &state, int minutes_per_half) -> std::vector<player_forecast>;

	// Max minus min predicted minutes across players the generator rotates.
	[[nodiscard]] static auto fairness_spread(std::span<const player_forecast> forecasts) -> int;
};

} // namespace pitchside
