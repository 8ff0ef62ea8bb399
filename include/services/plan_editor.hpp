#pragma once

#include "core/utils.hpp"
#include "models/player.hpp"
#include "models/substitution.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace pitchside {

// Manual edits to a plan. Every operation returns a new plan; an error leaves the input untouched.
class plan_editor {
public:
	struct availability {
		std::vector<player> on_pitch;
		std::vector<player> on_bench; // injured players excluded
	};

	explicit plan_editor(int minutes_per_half) : half_length_{minutes_per_half * 60} {}

	[[nodiscard]] auto erase(std::span<const substitution_event> plan, std::size_t index) const -> type::result<substitution_plan>;

	[[nodiscard]] auto retime(std::span<const substitution_event> plan, std::size_t index, int minute, int half) const -> type::result<substitution_plan>;

	[[nodiscard]] auto reassign(std::span<const substitution_event> plan, std::span<const player> roster, std::size_t index, std::string_view player_out,
															std::string_view player_in) const -> type::result<substitution_plan>;

	[[nodiscard]] auto insert(std::span<const substitution_event> plan, std::span<const player> roster, int half, int minute, std::string_view player_out,
														std::string_view player_in) const -> type::result<substitution_plan>;

	// Moves an event without touching its stamp; the resulting order may disagree with the times.
	[[nodiscard]] auto reorder(std::span<const substitution_event> plan, std::size_t from, std::size_t to) const -> type::result<substitution_plan>;

	// Who is on the pitch and the bench just before (half, time), replaying pending events stamped earlier.
	[[nodiscard]] auto candidates_at(std::span<const substitution_event> plan, std::span<const player> roster, int half, int time) const -> availability;

private:
	int half_length_;

	[[nodiscard]] auto check_editable(std::span<const substitution_event> plan, std::size_t index) const -> type::result<type::ok_t>;
	[[nodiscard]] auto check_stamp(int minute, int half) const -> type::result<type::ok_t>;
	auto sort(substitution_plan &plan) const -> void;
};

} // namespace pitchside
