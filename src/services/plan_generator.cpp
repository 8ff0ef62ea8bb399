#include "core/constants.hpp"
#include "services/plan_generator.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>

namespace pitchside {

auto plan_generator::lineup::contains(std::string_view id) const -> bool { return std::ranges::contains(slots_, id, &slot::first); }

auto plan_generator::lineup::position_of(std::string_view id) const -> std::optional<pitch_position>
{
	auto it = std::ranges::find(slots_, id, &slot::first);
	return it == slots_.end() ? std::nullopt : it->second;
}

auto plan_generator::lineup::erase(std::string_view id) -> void
{
	if (auto it = std::ranges::find(slots_, id, &slot::first); it != slots_.end()) {
		slots_.erase(it);
	}
}

auto plan_generator::lineup::assign(std::string_view id, std::optional<pitch_position> pos) -> void
{
	if (auto it = std::ranges::find(slots_, id, &slot::first); it != slots_.end()) {
		it->second = pos;
		return;
	}
	slots_.emplace_back(std::string{id}, pos);
}

auto plan_generator::split(std::span<const player> roster) -> roster_split
{
	roster_split s;

	for (const auto &p : roster) {
		const bool available_bench = p.on_bench() && !p.injured;

		if (p.on_field() && p.current_pitch_position == pitch_position::gk) {
			if (!s.keeper_on_field) {
				s.keeper_on_field = &p;
			}
			continue;
		}
		if (p.goalkeeper_only()) {
			if (available_bench && !s.keeper_on_bench) {
				s.keeper_on_bench = &p;
			}
			continue;
		}
		if (p.on_field()) {
			s.outfield.push_back(&p);
			s.outfield_on_field.push_back(&p);
		}
		else if (available_bench) {
			s.outfield.push_back(&p);
			s.outfield_on_bench.push_back(&p);
		}
	}

	return s;
}

auto plan_generator::keeper_swap(const roster_split &s) -> std::optional<substitution_event>
{
	if (!s.keeper_on_field || !s.keeper_on_bench) {
		return std::nullopt;
	}
	return substitution_event{.half = 2, .time = 0, .player_out = s.keeper_on_field->id, .player_in = s.keeper_on_bench->id};
}

auto plan_generator::ideal_seconds_per_player(std::span<const player> roster, int team_size, int half_duration_seconds) -> int
{
	auto s = split(roster);
	if (s.outfield.empty() || team_size <= 1) {
		return 0;
	}

	const auto total_field_seconds = 2 * half_duration_seconds * (team_size - 1);
	return total_field_seconds / static_cast<int>(s.outfield.size());
}

auto plan_generator::generate(std::span<const player> roster, generation_config config) -> substitution_plan
{
	substitution_plan plan;

	if (roster.empty() || config.team_size <= 0 || config.half_duration_seconds <= 0) {
		return plan;
	}

	auto s = split(roster);

	if (s.outfield_on_bench.empty()) {
		// Only a keeper waiting, or nobody at all
		if (auto gk = keeper_swap(s)) {
			plan.push_back(std::move(*gk));
		}
		return plan;
	}

	window_context ctx{.config = config};
	for (const auto *p : s.outfield) {
		ctx.outfield.emplace(p->id, p);
		ctx.outfield_order.push_back(p->id);
		ctx.playing_time.emplace(p->id, 0);
	}
	for (const auto *p : s.outfield_on_field) {
		ctx.on_pitch.assign(p->id, p->current_pitch_position);
	}

	const auto total_outfield = static_cast<int>(s.outfield.size());
	const auto bench_size = static_cast<int>(s.outfield_on_bench.size());
	const int min_subs_needed = std::max(bench_size, (total_outfield + 1) / 2);

	const int subs = ctx.subs_at_once(s.outfield_on_bench.size());
	// Windows sit at half/(windows+1) intervals, so this keeps them min_window_gap_seconds apart
	const int max_windows = std::max(0, config.half_duration_seconds / constants::engine::min_window_gap_seconds - 1);
	const int windows = std::min(ctx.windows_per_half(min_subs_needed, subs), max_windows);
	const auto times = window_context::window_times(config.half_duration_seconds, windows);

	for (int half = 1; half <= 2; ++half) {
		ctx.run_half(half, times, subs, plan);
	}

	if (auto gk = keeper_swap(s)) {
		plan.push_back(std::move(*gk));
	}

	sort_by_stamp(plan);
	return plan;
}

auto plan_generator::window_context::subs_at_once(std::size_t bench_size) const -> int
{
	if (config.disable_batch_subs || bench_size < 2) {
		return 1;
	}

	const auto bench = static_cast<int>(bench_size);
	switch (config.speed) {
	case rotation_speed::medium:
		return std::min(2, bench);
	case rotation_speed::fast:
		return std::min(3, bench);
	case rotation_speed::slow:
	default:
		return 1;
	}
}

auto plan_generator::window_context::windows_per_half(int min_subs_needed, int subs) const -> int
{
	const double needed = min_subs_needed;
	switch (config.speed) {
	case rotation_speed::slow:
		return std::max(2, static_cast<int>(std::ceil(needed / subs)));
	case rotation_speed::fast:
		return std::max(4, static_cast<int>(std::ceil(needed * 1.5 / subs)));
	case rotation_speed::medium:
	default:
		return std::max(3, static_cast<int>(std::ceil(needed * 1.2 / subs)));
	}
}

auto plan_generator::window_context::window_times(int half_duration, int windows) -> std::vector<int>
{
	std::vector<int> times;
	if (windows <= 0) {
		return times;
	}

	const double interval = static_cast<double>(half_duration) / (windows + 1);
	for (int i = 1; i <= windows; ++i) {
		times.push_back(static_cast<int>(std::floor(i * interval)));
	}
	return times;
}

auto plan_generator::window_context::ranked_on_pitch() const -> std::vector<ranked_player>
{
	std::vector<ranked_player> out;
	for (const auto &[id, pos] : on_pitch.slots()) {
		if (outfield.contains(id)) {
			out.push_back({.id = id, .seconds = playing_time.at(id)});
		}
	}
	std::ranges::stable_sort(out, std::greater{}, &ranked_player::seconds);
	return out;
}

auto plan_generator::window_context::ranked_bench() const -> std::vector<ranked_player>
{
	std::vector<ranked_player> out;
	for (const auto &id : outfield_order) {
		if (!on_pitch.contains(id)) {
			out.push_back({.id = id, .seconds = playing_time.at(id)});
		}
	}
	std::ranges::stable_sort(out, std::less{}, &ranked_player::seconds);
	return out;
}

auto plan_generator::window_context::run_half(int half, std::span<const int> times, int subs, substitution_plan &plan) -> void
{
	int last_event_time = 0;

	for (int sub_time : times) {
		const int elapsed = sub_time - last_event_time;
		for (const auto &[id, pos] : on_pitch.slots()) {
			playing_time[id] += elapsed;
		}
		last_event_time = sub_time;

		const auto on_pitch_sorted = ranked_on_pitch();
		const auto bench_sorted = ranked_bench();
		if (on_pitch_sorted.empty() || bench_sorted.empty()) {
			continue;
		}

		const auto subs_this_window = std::min({static_cast<std::size_t>(subs), bench_sorted.size(), on_pitch_sorted.size()});

		std::unordered_set<std::string> used_out;
		std::unordered_set<std::string> used_in;

		for (std::size_t sub_idx = 0; sub_idx < subs_this_window; ++sub_idx) {
			auto most_played = std::ranges::find_if(on_pitch_sorted, [&](const ranked_player &r) { return !used_out.contains(r.id); });
			auto least_played = std::ranges::find_if(bench_sorted, [&](const ranked_player &r) { return !used_in.contains(r.id); });
			if (most_played == on_pitch_sorted.end() || least_played == bench_sorted.end()) {
				break;
			}

			// Later picks in a batch window rotate players together, so only the first needs a gain
			if (sub_idx == 0 && most_played->seconds <= least_played->seconds) {
				break;
			}

			auto best = best_candidate(on_pitch_sorted, bench_sorted, used_out, used_in);
			if (!best) {
				break;
			}

			plan.push_back({.half = half, .time = sub_time, .player_out = best->player_out, .player_in = best->player_in, .swap = best->swap});
			used_out.insert(best->player_out);
			used_in.insert(best->player_in);
			apply(*best);
		}
	}

	const int remaining = config.half_duration_seconds - last_event_time;
	for (const auto &[id, pos] : on_pitch.slots()) {
		playing_time[id] += remaining;
	}
}

auto plan_generator::window_context::best_candidate(std::span<const ranked_player> on_pitch_sorted, std::span<const ranked_player> bench_sorted,
																										 const std::unordered_set<std::string> &used_out, const std::unordered_set<std::string> &used_in) const
		-> std::optional<candidate>
{
	std::vector<candidate> candidates;

	for (const auto &bench_entry : bench_sorted) {
		if (used_in.contains(bench_entry.id)) {
			continue;
		}
		const auto &incoming = *outfield.at(bench_entry.id);

		for (const auto &pitch_entry : on_pitch_sorted) {
			if (used_out.contains(pitch_entry.id)) {
				continue;
			}

			const auto pitch_pos = on_pitch.position_of(pitch_entry.id);
			const int advantage = pitch_entry.seconds - bench_entry.seconds;
			if (advantage <= 0) {
				continue;
			}

			if (incoming.can_play(pitch_pos)) {
				candidates.push_back({.player_out = pitch_entry.id, .player_in = bench_entry.id, .score = static_cast<double>(advantage), .position_valid = true});
			}

			// Chained: the incoming player takes a teammate's slot and the teammate fills the vacated one
			if (!config.disable_position_swaps && pitch_pos) {
				for (const auto &[swap_id, swap_pos] : on_pitch.slots()) {
					if (swap_id == pitch_entry.id || used_out.contains(swap_id) || !swap_pos) {
						continue;
					}
					auto swap_it = outfield.find(swap_id);
					if (swap_it == outfield.end()) {
						continue;
					}

					if (swap_it->second->can_play(pitch_pos) && incoming.can_play(swap_pos)) {
						candidates.push_back({.player_out = pitch_entry.id,
																	.player_in = bench_entry.id,
																	.swap = position_swap{.player_id = swap_id, .from = *swap_pos, .to = *pitch_pos},
																	.score = static_cast<double>(advantage),
																	.position_valid = true});
					}
				}
			}

			const bool has_legal = std::ranges::any_of(candidates, [&](const candidate &c) {
				return c.position_valid && c.player_out == pitch_entry.id && c.player_in == bench_entry.id;
			});
			if (!has_legal) {
				candidates.push_back({.player_out = pitch_entry.id, .player_in = bench_entry.id, .score = advantage * 0.5, .position_valid = false});
			}
		}
	}

	if (candidates.empty()) {
		return std::nullopt;
	}

	std::ranges::stable_sort(candidates, [](const candidate &a, const candidate &b) {
		if (a.position_valid != b.position_valid) {
			return a.position_valid;
		}
		return a.score > b.score;
	});
	return candidates.front();
}

auto plan_generator::window_context::apply(const candidate &c) -> void
{
	const auto incoming_position = c.swap ? std::optional{c.swap->from} : on_pitch.position_of(c.player_out);

	on_pitch.erase(c.player_out);
	on_pitch.assign(c.player_in, incoming_position);
	if (c.swap) {
		on_pitch.assign(c.swap->player_id, c.swap->to);
	}
}

auto plan_generator::replan(std::span<const player> roster, generation_config config, replan_point at) -> substitution_plan
{
	substitution_plan plan;

	if (roster.empty() || config.team_size <= 0 || config.half_duration_seconds <= 0) {
		return plan;
	}

	auto s = split(roster);
	const bool keeper_swap_due = at.current_half == 1;

	if (s.outfield_on_bench.empty()) {
		if (auto gk = keeper_swap(s); gk && keeper_swap_due) {
			plan.push_back(std::move(*gk));
		}
		return plan;
	}

	const int half = config.half_duration_seconds;
	const int remaining_in_current = half - std::clamp(at.elapsed_seconds, 0, half);
	const int remaining_in_second = at.current_half == 1 ? half : 0;
	const int total_remaining = remaining_in_current + remaining_in_second;

	const int subs_needed = std::min(static_cast<int>(s.outfield_on_bench.size()), total_remaining / constants::engine::replan_spacing_seconds);

	lineup on_pitch;
	for (const auto *p : s.outfield_on_field) {
		on_pitch.assign(p->id, p->current_pitch_position);
	}

	auto lookup = [&](std::string_view id) -> const player * {
		auto it = std::ranges::find(s.outfield, id, &player::id);
		return it == s.outfield.end() ? nullptr : *it;
	};

	const double interval = subs_needed > 0 ? static_cast<double>(total_remaining) / (subs_needed + 1) : 0.0;
	double accumulated = 0;

	for (int i = 1; i <= subs_needed; ++i) {
		accumulated += interval;

		match_time stamp{};
		if (at.current_half == 1 && accumulated + at.elapsed_seconds <= half) {
			stamp = {.half = 1, .time = static_cast<int>(std::floor(at.elapsed_seconds + accumulated))};
		}
		else if (at.current_half == 1) {
			stamp = {.half = 2, .time = static_cast<int>(std::floor(accumulated - remaining_in_current))};
		}
		else {
			stamp = {.half = 2, .time = static_cast<int>(std::floor(at.elapsed_seconds + accumulated))};
		}

		std::vector<const player *> pitch_sorted;
		for (const auto &[id, pos] : on_pitch.slots()) {
			if (const auto *p = lookup(id)) {
				pitch_sorted.push_back(p);
			}
		}
		std::vector<const player *> bench_sorted;
		for (const auto *p : s.outfield) {
			if (!on_pitch.contains(p->id)) {
				bench_sorted.push_back(p);
			}
		}
		if (pitch_sorted.empty() || bench_sorted.empty()) {
			continue;
		}
		std::ranges::stable_sort(pitch_sorted, std::greater{}, &player::seconds_played);
		std::ranges::stable_sort(bench_sorted, std::less{}, &player::seconds_played);

		std::optional<candidate> pick;
		for (const auto *incoming : bench_sorted) {
			for (const auto *outgoing : pitch_sorted) {
				const auto pitch_pos = on_pitch.position_of(outgoing->id);
				if (incoming->can_play(pitch_pos)) {
					pick = candidate{.player_out = outgoing->id, .player_in = incoming->id, .position_valid = true};
					break;
				}

				// Only explicit eligibility on both sides justifies moving a teammate
				for (const auto &[swap_id, swap_pos] : on_pitch.slots()) {
					const auto *mate = swap_id == outgoing->id ? nullptr : lookup(swap_id);
					if (!mate || !pitch_pos || !swap_pos || mate->eligible_positions.empty() || incoming->eligible_positions.empty()) {
						continue;
					}
					if (mate->can_play(pitch_pos) && incoming->can_play(swap_pos)) {
						pick = candidate{.player_out = outgoing->id,
														 .player_in = incoming->id,
														 .swap = position_swap{.player_id = swap_id, .from = *swap_pos, .to = *pitch_pos},
														 .position_valid = true};
						break;
					}
				}
				if (pick) {
					break;
				}
			}
			if (pick) {
				break;
			}
		}

		if (!pick) {
			pick = candidate{.player_out = pitch_sorted.front()->id, .player_in = bench_sorted.front()->id};
		}

		plan.push_back({.half = stamp.half, .time = stamp.time, .player_out = pick->player_out, .player_in = pick->player_in, .swap = pick->swap});

		const auto incoming_position = pick->swap ? std::optional{pick->swap->from} : on_pitch.position_of(pick->player_out);
		on_pitch.erase(pick->player_out);
		on_pitch.assign(pick->player_in, incoming_position);
		if (pick->swap) {
			on_pitch.assign(pick->swap->player_id, pick->swap->to);
		}
	}

	if (auto gk = keeper_swap(s); gk && keeper_swap_due) {
		plan.push_back(std::move(*gk));
	}

	sort_by_stamp(plan);
	return plan;
}

} // namespace pitchside
