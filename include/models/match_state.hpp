#pragma once

#include "core/utils.hpp"
#include "models/player.hpp"
#include "models/substitution.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace pitchside {

// Read-only view of the match timer.
class match_clock_snapshot {
public:
	int minutes_per_half{20};
	int current_half{1};
	int elapsed_seconds{}; // within the current half, as of last_update
	bool is_running{};
	type::timestamp last_update{};

	[[nodiscard]] auto half_length(this const auto &self) -> int { return self.minutes_per_half * 60; }

	[[nodiscard]] auto half_seconds(this const auto &self, type::timestamp now) -> int
	{
		auto elapsed = self.elapsed_seconds;
		if (self.is_running) {
			auto passed = std::chrono::duration_cast<std::chrono::seconds>(now - self.last_update).count();
			elapsed += static_cast<int>(std::max<std::int64_t>(0, passed));
		}
		return std::min(elapsed, self.half_length());
	}

	[[nodiscard]] auto current_total_seconds(this const auto &self, type::timestamp now) -> int
	{
		return to_total_seconds(self.current_half, self.half_seconds(now), self.half_length());
	}

	[[nodiscard]] auto is_finished(this const auto &self, type::timestamp now) -> bool
	{
		return self.current_half == 2 && self.half_seconds(now) >= self.half_length();
	}

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"minutes_per_half", self.minutes_per_half},
						{"current_half", self.current_half},
						{"elapsed_seconds", self.elapsed_seconds},
						{"is_running", self.is_running},
						{"last_update", std::chrono::duration_cast<std::chrono::seconds>(self.last_update.time_since_epoch()).count()}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> match_clock_snapshot
	{
		return {.minutes_per_half = j.at("minutes_per_half").get<int>(),
						.current_half = j.value("current_half", 1),
						.elapsed_seconds = j.value("elapsed_seconds", 0),
						.is_running = j.value("is_running", false),
						.last_update = type::timestamp{std::chrono::seconds{j.value("last_update", std::int64_t{0})}}};
	}
};

enum class substitution_outcome { executed, skipped, inconsistent };

[[nodiscard]] constexpr auto to_string(substitution_outcome o) -> std::string_view
{
	switch (o) {
	case substitution_outcome::executed:
		return "executed";
	case substitution_outcome::skipped:
		return "skipped";
	case substitution_outcome::inconsistent:
		return "inconsistent";
	}
	return "?";
}

// What actually happened to a plan event during the match.
struct substitution_record {
	substitution_event event;
	int at_total_seconds{};
	substitution_outcome outcome{substitution_outcome::executed};

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		return {{"event", self.event.to_json()}, {"at", self.at_total_seconds}, {"outcome", std::string(to_string(self.outcome))}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> substitution_record
	{
		auto outcome = j.value("outcome", std::string{"executed"});
		return {.event = substitution_event::from_json(j.at("event")),
						.at_total_seconds = j.value("at", 0),
						.outcome = outcome == "skipped"				 ? substitution_outcome::skipped
											 : outcome == "inconsistent" ? substitution_outcome::inconsistent
																									 : substitution_outcome::executed};
	}
};

// Shared snapshot the monitor reads before acting and writes after.
class pitch_state {
public:
	std::string team_name;
	int team_size{7};
	std::vector<player> players;
	substitution_plan plan;
	bool plan_active{};
	bool plan_paused{};
	std::vector<player> starting_players;
	std::vector<substitution_record> history;
	int last_timer_seconds{};
	type::timestamp last_update{};

	[[nodiscard]] auto has_pending(this const auto &self) -> bool
	{
		return std::ranges::any_of(self.plan, [](const substitution_event &e) { return !e.executed; });
	}

	// Credits on-field players with the match time since the last accrual.
	auto accrue(this auto &self, int current_total) -> void
	{
		if (current_total > self.last_timer_seconds) {
			const int delta = current_total - self.last_timer_seconds;
			for (auto &p : self.players) {
				if (p.on_field()) {
					p.seconds_played += delta;
				}
			}
		}
		self.last_timer_seconds = current_total;
	}

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		auto dump = [](const auto &items) {
			auto arr = nlohmann::json::array();
			for (const auto &item : items) {
				arr.push_back(item.to_json());
			}
			return arr;
		};

		return {{"team_name", self.team_name},
						{"team_size", self.team_size},
						{"players", dump(self.players)},
						{"plan", dump(self.plan)},
						{"plan_active", self.plan_active},
						{"plan_paused", self.plan_paused},
						{"starting_players", dump(self.starting_players)},
						{"history", dump(self.history)},
						{"last_timer_seconds", self.last_timer_seconds},
						{"last_update", std::chrono::duration_cast<std::chrono::seconds>(self.last_update.time_since_epoch()).count()}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> pitch_state
	{
		pitch_state st;
		st.team_name = j.value("team_name", std::string{});
		st.team_size = j.at("team_size").get<int>();
		st.plan_active = j.value("plan_active", false);
		st.plan_paused = j.value("plan_paused", false);
		st.last_timer_seconds = j.value("last_timer_seconds", 0);
		st.last_update = type::timestamp{std::chrono::seconds{j.value("last_update", std::int64_t{0})}};

		for (const auto &pj : j.at("players")) {
			st.players.push_back(player::from_json(pj));
		}
		if (j.contains("plan")) {
			for (const auto &ej : j.at("plan")) {
				st.plan.push_back(substitution_event::from_json(ej));
			}
		}
		if (j.contains("starting_players")) {
			for (const auto &pj : j.at("starting_players")) {
				st.starting_players.push_back(player::from_json(pj));
			}
		}
		if (j.contains("history")) {
			for (const auto &hj : j.at("history")) {
				st.history.push_back(substitution_record::from_json(hj));
			}
		}
		return st;
	}
};

} // namespace pitchside
