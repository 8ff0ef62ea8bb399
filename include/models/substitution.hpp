#pragma once

#include "models/player.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pitchside {

struct position_swap {
	std::string player_id;
	pitch_position from{};
	pitch_position to{};

	[[nodiscard]] auto operator==(const position_swap &) const -> bool = default;
};

struct match_time {
	int half{1};
	int time{}; // seconds into the half

	[[nodiscard]] auto operator<=>(const match_time &) const = default;
};

// Seconds since kickoff; half 2 is offset by one full half.
[[nodiscard]] constexpr auto to_total_seconds(int half, int time, int half_length) noexcept -> int { return half == 1 ? time : half_length + time; }

// Totals at or past one half's length belong to half 2.
[[nodiscard]] constexpr auto from_total_seconds(int total, int half_length) noexcept -> match_time
{
	if (total < half_length) {
		return {.half = 1, .time = total};
	}
	return {.half = 2, .time = total - half_length};
}

class substitution_event {
public:
	int half{1};
	int time{};
	std::string player_out;
	std::string player_in;
	std::optional<position_swap> swap{};
	bool executed{};

	[[nodiscard]] auto operator==(const substitution_event &) const -> bool = default;

	[[nodiscard]] auto stamp(this const auto &self) -> match_time { return {.half = self.half, .time = self.time}; }

	[[nodiscard]] auto total_seconds(this const auto &self, int half_length) -> int { return to_total_seconds(self.half, self.time, half_length); }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json j{{"half", self.half}, {"time", self.time}, {"player_out", self.player_out}, {"player_in", self.player_in}, {"executed", self.executed}};
		if (self.swap) {
			j["position_swap"] = {{"player", self.swap->player_id}, {"from", std::string(to_string(self.swap->from))}, {"to", std::string(to_string(self.swap->to))}};
		}
		else {
			j["position_swap"] = nullptr;
		}
		return j;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> substitution_event
	{
		substitution_event ev{.half = j.at("half").get<int>(),
													.time = j.at("time").get<int>(),
													.player_out = j.at("player_out").get<std::string>(),
													.player_in = j.at("player_in").get<std::string>(),
													.executed = j.value("executed", false)};

		if (auto it = j.find("position_swap"); it != j.end() && !it->is_null()) {
			auto from = parse_position(it->at("from").get<std::string>());
			auto to = parse_position(it->at("to").get<std::string>());
			if (from && to) {
				ev.swap = position_swap{.player_id = it->at("player").get<std::string>(), .from = *from, .to = *to};
			}
		}
		return ev;
	}
};

using substitution_plan = std::vector<substitution_event>;

// Stable: events sharing a stamp keep their relative order.
inline auto sort_by_stamp(substitution_plan &plan) -> void { std::ranges::stable_sort(plan, {}, [](const substitution_event &e) { return e.stamp(); }); }

} // namespace pitchside
