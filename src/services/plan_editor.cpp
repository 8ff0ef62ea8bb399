#include "core/constants.hpp"
#include "models/roster.hpp"
#include "services/plan_editor.hpp"

#include <algorithm>
#include <ranges>
#include <unordered_set>

namespace pitchside {

namespace {

// Latest stamp among executed events; edits may not land before it.
auto latest_executed(std::span<const substitution_event> plan) -> std::optional<match_time>
{
	std::optional<match_time> latest;
	for (const auto &e : plan) {
		if (e.executed && (!latest || e.stamp() > *latest)) {
			latest = e.stamp();
		}
	}
	return latest;
}

} // namespace

auto plan_editor::check_editable(std::span<const substitution_event> plan, std::size_t index) const -> type::result<type::ok_t>
{
	if (index >= plan.size()) {
		return std::unexpected(type::error{constants::text::index_out_of_range});
	}
	if (plan[index].executed) {
		return std::unexpected(type::error{constants::text::executed_immutable});
	}
	return type::ok_t{};
}

auto plan_editor::check_stamp(int minute, int half) const -> type::result<type::ok_t>
{
	if (half != 1 && half != 2) {
		return std::unexpected(type::error{constants::text::invalid_half});
	}
	if (minute < 0 || minute * 60 > half_length_) {
		return std::unexpected(type::error{constants::text::invalid_minute});
	}
	return type::ok_t{};
}

auto plan_editor::sort(substitution_plan &plan) const -> void { sort_by_stamp(plan); }

auto plan_editor::erase(std::span<const substitution_event> plan, std::size_t index) const -> type::result<substitution_plan>
{
	if (auto ok = check_editable(plan, index); !ok) {
		return std::unexpected(ok.error());
	}

	substitution_plan out(plan.begin(), plan.end());
	out.erase(out.begin() + static_cast<std::ptrdiff_t>(index));
	return out;
}

auto plan_editor::retime(std::span<const substitution_event> plan, std::size_t index, int minute, int half) const -> type::result<substitution_plan>
{
	if (auto ok = check_editable(plan, index); !ok) {
		return std::unexpected(ok.error());
	}
	if (auto ok = check_stamp(minute, half); !ok) {
		return std::unexpected(ok.error());
	}

	const match_time stamp{.half = half, .time = minute * 60};
	if (auto latest = latest_executed(plan); latest && stamp < *latest) {
		return std::unexpected(type::error{constants::text::crosses_executed});
	}

	substitution_plan out(plan.begin(), plan.end());
	out[index].half = stamp.half;
	out[index].time = stamp.time;
	sort(out);
	return out;
}

auto plan_editor::reassign(std::span<const substitution_event> plan, std::span<const player> roster, std::size_t index, std::string_view player_out,
													 std::string_view player_in) const -> type::result<substitution_plan>
{
	if (auto ok = check_editable(plan, index); !ok) {
		return std::unexpected(ok.error());
	}
	if (!roster::find_player(roster, player_out) || !roster::find_player(roster, player_in)) {
		return std::unexpected(type::error{constants::text::player_not_found});
	}
	if (player_out == player_in) {
		return std::unexpected(type::error{constants::text::same_player});
	}

	substitution_plan out(plan.begin(), plan.end());
	auto &ev = out[index];
	// The teammate move was planned around the old out-player's slot
	if (ev.swap && (ev.player_out != player_out || ev.swap->player_id == player_in)) {
		ev.swap.reset();
	}
	ev.player_out = std::string{player_out};
	ev.player_in = std::string{player_in};
	return out;
}

auto plan_editor::insert(std::span<const substitution_event> plan, std::span<const player> roster, int half, int minute, std::string_view player_out,
												 std::string_view player_in) const -> type::result<substitution_plan>
{
	if (auto ok = check_stamp(minute, half); !ok) {
		return std::unexpected(ok.error());
	}
	if (player_out == player_in) {
		return std::unexpected(type::error{constants::text::same_player});
	}

	const match_time stamp{.half = half, .time = minute * 60};
	if (auto latest = latest_executed(plan); latest && stamp < *latest) {
		return std::unexpected(type::error{constants::text::crosses_executed});
	}

	auto avail = candidates_at(plan, roster, stamp.half, stamp.time);
	if (!std::ranges::contains(avail.on_pitch, player_out, &player::id)) {
		return std::unexpected(type::error{constants::text::out_not_on_pitch});
	}
	if (!std::ranges::contains(avail.on_bench, player_in, &player::id)) {
		return std::unexpected(type::error{constants::text::in_not_on_bench});
	}

	substitution_plan out(plan.begin(), plan.end());
	out.push_back({.half = stamp.half, .time = stamp.time, .player_out = std::string{player_out}, .player_in = std::string{player_in}});
	sort(out);
	return out;
}

auto plan_editor::reorder(std::span<const substitution_event> plan, std::size_t from, std::size_t to) const -> type::result<substitution_plan>
{
	if (auto ok = check_editable(plan, from); !ok) {
		return std::unexpected(ok.error());
	}
	if (to >= plan.size()) {
		return std::unexpected(type::error{constants::text::index_out_of_range});
	}
	if (from == to) {
		return substitution_plan(plan.begin(), plan.end());
	}

	const auto lo = std::min(from, to);
	const auto hi = std::max(from, to);
	if (std::ranges::any_of(plan.subspan(lo, hi - lo + 1), &substitution_event::executed)) {
		return std::unexpected(type::error{constants::text::crosses_executed});
	}

	substitution_plan out(plan.begin(), plan.end());
	auto first = out.begin();
	if (from < to) {
		std::rotate(first + static_cast<std::ptrdiff_t>(from), first + static_cast<std::ptrdiff_t>(from) + 1, first + static_cast<std::ptrdiff_t>(to) + 1);
	}
	else {
		std::rotate(first + static_cast<std::ptrdiff_t>(to), first + static_cast<std::ptrdiff_t>(from), first + static_cast<std::ptrdiff_t>(from) + 1);
	}
	return out;
}

auto plan_editor::candidates_at(std::span<const substitution_event> plan, std::span<const player> roster, int half, int time) const -> availability
{
	std::unordered_set<std::string> on_pitch;
	for (const auto &p : roster) {
		if (p.on_field()) {
			on_pitch.insert(p.id);
		}
	}

	const int check_total = to_total_seconds(half, time, half_length_);

	auto pending = plan | std::views::filter([](const substitution_event &e) { return !e.executed; }) | std::ranges::to<std::vector<substitution_event>>();
	sort_by_stamp(pending);

	for (const auto &sub : pending) {
		if (sub.total_seconds(half_length_) >= check_total) {
			break;
		}
		on_pitch.erase(sub.player_out);
		on_pitch.insert(sub.player_in);
	}

	availability out;
	for (const auto &p : roster) {
		if (on_pitch.contains(p.id)) {
			out.on_pitch.push_back(p);
		}
		else if (!p.injured) {
			out.on_bench.push_back(p);
		}
	}
	return out;
}

} // namespace pitchside
