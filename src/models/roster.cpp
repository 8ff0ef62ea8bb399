#include "models/roster.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>
#include <unordered_set>

namespace pitchside::roster {

auto count_on_field(std::span<const player> players) -> std::size_t
{
	return util::narrow<std::size_t>(std::ranges::count_if(players, [](const player &p) { return p.on_field(); }));
}

auto on_field(std::span<const player> players) -> std::vector<player>
{
	return players | std::views::filter([](const player &p) { return p.on_field(); }) | std::ranges::to<std::vector<player>>();
}

auto on_bench(std::span<const player> players) -> std::vector<player>
{
	return players | std::views::filter([](const player &p) { return p.on_bench(); }) | std::ranges::to<std::vector<player>>();
}

auto find_player(std::span<const player> players, std::string_view id) -> std::optional<std::reference_wrapper<const player>>
{
	auto it = std::ranges::find(players, id, &player::id);
	return it == players.end() ? std::nullopt : std::optional{std::cref(*it)};
}

auto find_player_mut(std::vector<player> &players, std::string_view id) -> std::optional<std::reference_wrapper<player>>
{
	auto it = std::ranges::find(players, id, &player::id);
	return it == players.end() ? std::nullopt : std::optional{std::ref(*it)};
}

auto resolve_player(std::span<const player> players, std::string_view ref) -> std::optional<std::reference_wrapper<const player>>
{
	if (auto p = find_player(players, ref)) {
		return p;
	}

	auto iequals = [](std::string_view a, std::string_view b) {
		return std::ranges::equal(a, b, [](char x, char y) { return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y)); });
	};
	if (auto it = std::ranges::find_if(players, [&](const player &p) { return iequals(p.name, ref); }); it != players.end()) {
		return std::cref(*it);
	}

	auto digits = ref.starts_with('#') ? ref.substr(1) : ref;
	int number = 0;
	auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
	if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
		return std::nullopt;
	}

	auto it = std::ranges::find_if(players, [number](const player &p) { return p.number == number; });
	return it == players.end() ? std::nullopt : std::optional{std::cref(*it)};
}

auto name_of(std::span<const player> players, std::string_view id) -> std::string
{
	if (auto p = find_player(players, id)) {
		return p->get().display_name();
	}
	return std::string{id};
}

auto validate_lineup(std::span<const player> players, int team_size) -> type::result<type::ok_t>
{
	auto count = count_on_field(players);
	if (team_size <= 0 || count != static_cast<std::size_t>(team_size)) {
		return std::unexpected(type::error{std::format("{} players on the pitch, the team plays {}-a-side", count, team_size)});
	}
	return type::ok_t{};
}

auto is_realizable(std::span<const player> players, std::span<const substitution_event> plan, int team_size) -> bool
{
	if (!validate_lineup(players, team_size)) {
		return false;
	}

	std::unordered_set<std::string> field;
	std::unordered_set<std::string> known;
	for (const auto &p : players) {
		known.insert(p.id);
		if (p.on_field()) {
			field.insert(p.id);
		}
	}

	auto pending = plan | std::views::filter([](const substitution_event &e) { return !e.executed; }) | std::ranges::to<std::vector<substitution_event>>();
	sort_by_stamp(pending);

	for (const auto &ev : pending) {
		if (!known.contains(ev.player_in) || !field.contains(ev.player_out) || field.contains(ev.player_in)) {
			return false;
		}
		field.erase(ev.player_out);
		field.insert(ev.player_in);

		if (ev.swap && !field.contains(ev.swap->player_id)) {
			return false;
		}
		if (field.size() != static_cast<std::size_t>(team_size)) {
			return false;
		}
	}
	return true;
}

auto is_time_ordered(std::span<const substitution_event> plan) -> bool
{
	return std::ranges::is_sorted(plan, {}, [](const substitution_event &e) { return e.stamp(); });
}

} // namespace pitchside::roster
