#include "services/time_forecaster.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>
#include <unordered_map>
#include <unordered_set>

namespace pitchside {

auto time_forecaster::forecast(std::span<const player> roster, std::span<const substitution_event> plan, int minutes_per_half) -> std::vector<player_forecast>
{
	const int half_length = minutes_per_half * 60;
	const double total_game_minutes = minutes_per_half * 2.0;

	std::unordered_map<std::string, int> time_on_pitch;
	std::unordered_set<std::string> current_on_pitch;

	for (const auto &p : roster) {
		time_on_pitch[p.id] = 0;
		if (p.on_field()) {
			current_on_pitch.insert(p.id);
		}
	}

	for (int half = 1; half <= 2; ++half) {
		auto half_subs = plan | std::views::filter([half](const substitution_event &e) { return e.half == half; }) |
										 std::ranges::to<std::vector<substitution_event>>();
		std::ranges::stable_sort(half_subs, {}, &substitution_event::time);

		int last_time = 0;
		for (const auto &sub : half_subs) {
			const int elapsed = sub.time - last_time;
			for (const auto &id : current_on_pitch) {
				time_on_pitch[id] += elapsed;
			}

			current_on_pitch.erase(sub.player_out);
			current_on_pitch.insert(sub.player_in);
			last_time = sub.time;
		}

		const int remaining = half_length - last_time;
		for (const auto &id : current_on_pitch) {
			time_on_pitch[id] += remaining;
		}
	}

	std::vector<player_forecast> out;
	out.reserve(roster.size());
	for (const auto &p : roster) {
		const int seconds = time_on_pitch[p.id];
		const double minutes = seconds / 60.0;
		out.push_back({.who = p,
									 .predicted_seconds = seconds,
									 .predicted_minutes = static_cast<int>(std::round(minutes)),
									 .percentage_of_game = total_game_minutes > 0 ? static_cast<int>(std::round(minutes / total_game_minutes * 100.0)) : 0,
									 .starts_on_pitch = p.on_field()});
	}

	std::ranges::stable_sort(out, std::greater{}, &player_forecast::predicted_seconds);
	return out;
}

auto time_forecaster::forecast_live(const pitch_state &state, int minutes_per_half) -> std::vector<player_forecast>
{
	const bool started = std::ranges::any_of(state.plan, &substitution_event::executed);
	if (!started || state.starting_players.empty()) {
		return forecast(state.players, state.plan, minutes_per_half);
	}

	auto carried_out = [&](const substitution_event &e) {
		return std::ranges::any_of(state.history, [&](const substitution_record &r) { return r.outcome == substitution_outcome::executed && r.event == e; });
	};
	auto effective = state.plan | std::views::filter([&](const substitution_event &e) { return !e.executed || carried_out(e); }) |
									 std::ranges::to<std::vector<substitution_event>>();

	// Current details (injuries, eligibility) with the kickoff positions
	auto roster = state.starting_players;
	for (auto &p : roster) {
		if (auto it = std::ranges::find(state.players, p.id, &player::id); it != state.players.end()) {
			auto kickoff = p.position;
			auto label = p.current_pitch_position;
			p = *it;
			p.position = kickoff;
			p.current_pitch_position = label;
		}
	}
	return forecast(roster, effective, minutes_per_half);
}

auto time_forecaster::fairness_spread(std::span<const player_forecast> forecasts) -> int
{
	auto rotated = forecasts | std::views::filter([](const player_forecast &f) {
									 return !f.who.goalkeeper_only() && f.who.current_pitch_position != pitch_position::gk && !(f.who.injured && f.who.on_bench());
								 }) |
								 std::views::transform(&player_forecast::predicted_minutes);

	if (std::ranges::empty(rotated)) {
		return 0;
	}
	auto [min_it, max_it] = std::ranges::minmax_element(rotated);
	return *max_it - *min_it;
}

} // namespace pitchside
