#pragma once

#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace pitchside {

enum class pitch_position { gk, def, mid, fwd };

inline constexpr std::array all_positions{pitch_position::gk, pitch_position::def, pitch_position::mid, pitch_position::fwd};

[[nodiscard]] constexpr auto to_string(pitch_position pos) -> std::string_view
{
	switch (pos) {
	case pitch_position::gk:
		return "GK";
	case pitch_position::def:
		return "DEF";
	case pitch_position::mid:
		return "MID";
	case pitch_position::fwd:
		return "FWD";
	}
	return "?";
}

[[nodiscard]] inline auto parse_position(std::string_view s) -> std::optional<pitch_position>
{
	for (auto pos : all_positions) {
		auto label = to_string(pos);
		if (std::ranges::equal(s, label, [](char a, char b) { return std::toupper(static_cast<unsigned char>(a)) == b; })) {
			return pos;
		}
	}
	return std::nullopt;
}

struct coordinate {
	double x{};
	double y{};

	[[nodiscard]] auto operator<=>(const coordinate &) const = default;
};

class player {
public:
	std::string id;
	std::string name;
	std::optional<int> number{};
	std::optional<coordinate> position{}; // nullopt = on the bench
	std::vector<pitch_position> eligible_positions{};
	std::optional<pitch_position> current_pitch_position{};
	int seconds_played{};
	bool injured{};
	bool fill_in{};

	[[nodiscard]] auto operator==(const player &) const -> bool = default;

	[[nodiscard]] auto on_field(this const auto &self) -> bool { return self.position.has_value(); }

	[[nodiscard]] auto on_bench(this const auto &self) -> bool { return !self.position.has_value(); }

	// Empty eligibility means any position; an unknown slot only suits unrestricted players.
	[[nodiscard]] auto can_play(this const auto &self, std::optional<pitch_position> pos) -> bool
	{
		if (self.eligible_positions.empty()) {
			return true;
		}
		return pos && std::ranges::contains(self.eligible_positions, *pos);
	}

	[[nodiscard]] auto goalkeeper_only(this const auto &self) -> bool
	{
		return self.eligible_positions.size() == 1 && self.eligible_positions.front() == pitch_position::gk;
	}

	[[nodiscard]] auto display_name(this const auto &self) -> std::string
	{
		if (!self.name.empty()) {
			return self.name;
		}
		return self.number ? std::format("#{}", *self.number) : self.id;
	}

	auto move_to_bench(this auto &self) -> void
	{
		self.position.reset();
		self.current_pitch_position.reset();
	}

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json j{{"id", self.id}, {"name", self.name}, {"seconds_played", self.seconds_played}, {"injured", self.injured}, {"fill_in", self.fill_in}};
		j["number"] = self.number ? nlohmann::json(*self.number) : nlohmann::json(nullptr);
		j["position"] = self.position ? nlohmann::json{{"x", self.position->x}, {"y", self.position->y}} : nlohmann::json(nullptr);
		j["eligible_positions"] = nlohmann::json::array();
		for (auto pos : self.eligible_positions) {
			j["eligible_positions"].push_back(std::string(to_string(pos)));
		}
		j["current_pitch_position"] = self.current_pitch_position ? nlohmann::json(std::string(to_string(*self.current_pitch_position))) : nlohmann::json(nullptr);
		return j;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> player
	{
		player p{.id = j.at("id").get<std::string>(),
						 .name = j.value("name", std::string{}),
						 .seconds_played = j.value("seconds_played", 0),
						 .injured = j.value("injured", false),
						 .fill_in = j.value("fill_in", false)};

		if (auto it = j.find("number"); it != j.end() && !it->is_null()) {
			p.number = it->get<int>();
		}
		if (auto it = j.find("position"); it != j.end() && !it->is_null()) {
			p.position = coordinate{.x = it->at("x").get<double>(), .y = it->at("y").get<double>()};
		}
		if (auto it = j.find("eligible_positions"); it != j.end()) {
			for (const auto &label : *it) {
				if (auto pos = parse_position(label.get<std::string>())) {
					p.eligible_positions.push_back(*pos);
				}
			}
		}
		if (auto it = j.find("current_pitch_position"); it != j.end() && !it->is_null()) {
			p.current_pitch_position = parse_position(it->get<std::string>());
		}
		return p;
	}
};

} // namespace pitchside
