#pragma once

#include "core/utils.hpp"
#include "models/player.hpp"
#include "models/substitution.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace pitchside::roster {

[[nodiscard]] auto count_on_field(std::span<const player> players) -> std::size_t;
[[nodiscard]] auto on_field(std::span<const player> players) -> std::vector<player>;
[[nodiscard]] auto on_bench(std::span<const player> players) -> std::vector<player>;

[[nodiscard]] auto find_player(std::span<const player> players, std::string_view id) -> std::optional<std::reference_wrapper<const player>>;
[[nodiscard]] auto find_player_mut(std::vector<player> &players, std::string_view id) -> std::optional<std::reference_wrapper<player>>;

// Resolves an operator reference: id, then case-insensitive name, then jersey number.
[[nodiscard]] auto resolve_player(std::span<const player> players, std::string_view ref) -> std::optional<std::reference_wrapper<const player>>;

// Display name for an id, falling back to the id itself.
[[nodiscard]] auto name_of(std::span<const player> players, std::string_view id) -> std::string;

[[nodiscard]] auto validate_lineup(std::span<const player> players, int team_size) -> type::result<type::ok_t>;

// Replays the unexecuted events in stamp order over the current partition and checks every
// transition is possible: out on field, in on bench, on-field count unchanged.
[[nodiscard]] auto is_realizable(std::span<const player> players, std::span<const substitution_event> plan, int team_size) -> bool;

[[nodiscard]] auto is_time_ordered(std::span<const substitution_event> plan) -> bool;

} // namespace pitchside::roster
