#pragma once

#include "models/player.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace pitchside {

struct formation {
	std::string_view name;
	std::vector<coordinate> slots;
};

// Formations the pitch board offers per team size; slot 0 is the keeper where one exists.
[[nodiscard]] auto formations_for(int team_size) -> std::span<const formation>;

[[nodiscard]] constexpr auto is_supported_team_size(int team_size) noexcept -> bool
{
	return team_size == 4 || team_size == 7 || team_size == 9 || team_size == 11;
}

// Label implied by depth on the pitch diagram. 4-a-side has no keeper.
[[nodiscard]] constexpr auto position_from_coords(double y, int team_size) noexcept -> pitch_position
{
	if (team_size == 4) {
		if (y > 70) {
			return pitch_position::def;
		}
		return y > 40 ? pitch_position::mid : pitch_position::fwd;
	}
	if (y > 80) {
		return pitch_position::gk;
	}
	if (y > 60) {
		return pitch_position::def;
	}
	return y > 30 ? pitch_position::mid : pitch_position::fwd;
}

} // namespace pitchside
