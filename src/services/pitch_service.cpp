#include "core/constants.hpp"
#include "models/formation.hpp"
#include "models/roster.hpp"
#include "services/pitch_service.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

namespace pitchside {

pitch_service::pitch_service(std::shared_ptr<pitch_state_store> store, std::shared_ptr<clock_source> clock, std::shared_ptr<operator_notifier> notifier,
														 int default_minutes_per_half, type::log_sink log)
		: store_{std::move(store)}, clock_{std::move(clock)}, notifier_{std::move(notifier)}, default_minutes_per_half_{default_minutes_per_half},
			log_{std::move(log)}
{
}

auto pitch_service::state() const -> std::optional<pitch_state> { return store_->read_pitch_state(); }

auto pitch_service::minutes_per_half() const -> int
{
	if (auto clock = clock_->read_clock()) {
		return clock->minutes_per_half;
	}
	return default_minutes_per_half_;
}

auto pitch_service::current_total(type::timestamp now) const -> int
{
	if (auto clock = clock_->read_clock()) {
		return clock->current_total_seconds(now);
	}
	return 0;
}

auto pitch_service::next_player_id(std::span<const player> players) -> std::string
{
	int highest = 0;
	for (const auto &p : players) {
		if (!p.id.starts_with('p')) {
			continue;
		}
		int n = 0;
		auto [ptr, ec] = std::from_chars(p.id.data() + 1, p.id.data() + p.id.size(), n);
		if (ec == std::errc{} && ptr == p.id.data() + p.id.size()) {
			highest = std::max(highest, n);
		}
	}
	return std::format("p{}", highest + 1);
}

auto pitch_service::mutate(const std::function<type::result<type::ok_t>(pitch_state &)> &change) -> type::result<pitch_state>
{
	std::scoped_lock lock{mutex_};

	auto st = store_->read_pitch_state();
	if (!st) {
		return std::unexpected(type::error{constants::text::no_pitch_state});
	}
	if (auto res = change(*st); !res) {
		return std::unexpected(res.error());
	}

	st->last_update = util::now();
	if (auto res = store_->write_pitch_state(*st); !res) {
		util::log(log_, dpp::ll_error, std::format("Cannot store pitch state: {}", res.error().what()));
		return std::unexpected(res.error());
	}
	return *st;
}

auto pitch_service::setup(int team_size, std::string team_name) -> type::result<pitch_state>
{
	if (!is_supported_team_size(team_size)) {
		return std::unexpected(type::error{constants::text::invalid_team_size});
	}

	std::scoped_lock lock{mutex_};

	auto st = store_->read_pitch_state().value_or(pitch_state{});
	st.team_name = std::move(team_name);
	st.team_size = team_size;
	for (auto &p : st.players) {
		p.move_to_bench();
		p.seconds_played = 0;
	}
	st.plan.clear();
	st.plan_active = false;
	st.plan_paused = false;
	st.starting_players.clear();
	st.history.clear();
	st.last_timer_seconds = 0;
	st.last_update = util::now();

	if (auto res = store_->write_pitch_state(st); !res) {
		return std::unexpected(res.error());
	}
	util::log(log_, dpp::ll_info, std::format("Match set up: {} ({}-a-side)", st.team_name, team_size));
	return st;
}

auto pitch_service::add_player(std::string name, std::optional<int> number, std::vector<pitch_position> eligible, bool fill_in) -> type::result<player>
{
	if (name.empty()) {
		return std::unexpected(type::error{constants::text::empty_name});
	}

	player added;
	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		if (roster::resolve_player(st.players, name)) {
			return std::unexpected(type::error{constants::text::player_exists});
		}

		added = player{.id = next_player_id(st.players), .name = std::move(name), .number = number, .eligible_positions = std::move(eligible), .fill_in = fill_in};
		st.players.push_back(added);
		return type::ok_t{};
	});

	if (!res) {
		return std::unexpected(res.error());
	}
	return added;
}

auto pitch_service::remove_player(std::string_view ref) -> type::result<player>
{
	player removed;
	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		auto found = roster::resolve_player(st.players, ref);
		if (!found) {
			return std::unexpected(type::error{constants::text::player_not_found});
		}

		const auto id = found->get().id;
		auto referenced = std::ranges::any_of(st.plan, [&](const substitution_event &e) {
			return !e.executed && (e.player_out == id || e.player_in == id || (e.swap && e.swap->player_id == id));
		});
		if (referenced) {
			return std::unexpected(type::error{constants::text::player_in_plan});
		}

		removed = found->get();
		std::erase_if(st.players, [&](const player &p) { return p.id == id; });
		return type::ok_t{};
	});

	if (!res) {
		return std::unexpected(res.error());
	}
	return removed;
}

auto pitch_service::set_slot(std::string_view ref, int slot) -> type::result<player>
{
	player moved;
	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		auto found = roster::resolve_player(st.players, ref);
		if (!found) {
			return std::unexpected(type::error{constants::text::player_not_found});
		}
		auto &p = roster::find_player_mut(st.players, found->get().id)->get();

		if (slot == 0) {
			p.move_to_bench();
			moved = p;
			return type::ok_t{};
		}

		auto formations = formations_for(st.team_size);
		if (formations.empty()) {
			return std::unexpected(type::error{constants::text::invalid_team_size});
		}
		const auto &slots = formations.front().slots;
		if (slot < 0 || static_cast<std::size_t>(slot) > slots.size()) {
			return std::unexpected(type::error{constants::text::invalid_slot});
		}

		const auto target = slots[static_cast<std::size_t>(slot - 1)];
		const auto old_position = p.position;
		const auto old_label = p.current_pitch_position;

		// Whoever holds the slot takes the mover's old place, or the bench.
		auto occupant = std::ranges::find_if(st.players, [&](const player &other) { return other.id != p.id && other.position == target; });
		if (occupant != st.players.end()) {
			occupant->position = old_position;
			occupant->current_pitch_position = old_position ? old_label : std::nullopt;
		}

		p.position = target;
		p.current_pitch_position = position_from_coords(target.y, st.team_size);
		moved = p;
		return type::ok_t{};
	});

	if (!res) {
		return std::unexpected(res.error());
	}
	return moved;
}

auto pitch_service::set_injured(std::string_view ref, bool injured) -> type::result<player>
{
	player changed;
	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		auto found = roster::resolve_player(st.players, ref);
		if (!found) {
			return std::unexpected(type::error{constants::text::player_not_found});
		}

		auto &p = roster::find_player_mut(st.players, found->get().id)->get();
		p.injured = injured;
		changed = p;
		return type::ok_t{};
	});

	if (!res) {
		return std::unexpected(res.error());
	}
	return changed;
}

auto pitch_service::draft_plan(plan_generator::generation_config config) const -> type::result<substitution_plan>
{
	auto st = state();
	if (!st) {
		return std::unexpected(type::error{constants::text::no_pitch_state});
	}
	if (auto ok = roster::validate_lineup(st->players, st->team_size); !ok) {
		return std::unexpected(ok.error());
	}
	if (std::ranges::none_of(st->players, [](const player &p) { return p.on_bench() && !p.injured; })) {
		return std::unexpected(type::error{constants::text::not_enough_players});
	}

	config.team_size = st->team_size;
	config.half_duration_seconds = minutes_per_half() * 60;
	return plan_generator::generate(st->players, config);
}

auto pitch_service::start_plan(substitution_plan plan, type::timestamp now) -> type::result<pitch_state>
{
	const int total = current_total(now);
	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		if (auto ok = roster::validate_lineup(st.players, st.team_size); !ok) {
			return std::unexpected(ok.error());
		}
		if (!roster::is_realizable(st.players, plan, st.team_size)) {
			return std::unexpected(type::error{constants::text::plan_stale});
		}

		st.plan = std::move(plan);
		st.plan_active = st.has_pending();
		st.plan_paused = false;
		st.starting_players = st.players;
		st.history.clear();
		st.last_timer_seconds = total;
		return type::ok_t{};
	});

	if (res) {
		util::log(log_, dpp::ll_info, std::format("Plan started with {} substitutions", res->plan.size()));
	}
	return res;
}

auto pitch_service::edit_plan(const plan_edit &edit) -> type::result<pitch_state>
{
	const plan_editor editor{minutes_per_half()};
	return mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		if (st.plan.empty()) {
			return std::unexpected(type::error{constants::text::no_plan});
		}

		auto edited = edit(st, editor);
		if (!edited) {
			return std::unexpected(edited.error());
		}

		st.plan = std::move(*edited);
		st.plan_active = st.plan_active && st.has_pending();
		return type::ok_t{};
	});
}

auto pitch_service::replan(plan_generator::generation_config config, type::timestamp now) -> type::result<pitch_state>
{
	const auto clock = clock_->read_clock();
	const int total = clock ? clock->current_total_seconds(now) : 0;
	const plan_generator::replan_point at{.current_half = clock ? clock->current_half : 1, .elapsed_seconds = clock ? clock->half_seconds(now) : 0};

	config.half_duration_seconds = minutes_per_half() * 60;

	auto res = mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		if (auto ok = roster::validate_lineup(st.players, st.team_size); !ok) {
			return std::unexpected(ok.error());
		}

		st.accrue(total);
		config.team_size = st.team_size;

		auto remaining = plan_generator::replan(st.players, config, at);
		auto kept = st.plan | std::views::filter(&substitution_event::executed) | std::ranges::to<std::vector<substitution_event>>();
		kept.insert(kept.end(), remaining.begin(), remaining.end());

		st.plan = std::move(kept);
		st.plan_active = st.has_pending();
		st.plan_paused = false;
		if (st.starting_players.empty()) {
			st.starting_players = st.players;
		}
		return type::ok_t{};
	});

	if (res) {
		auto pending = std::ranges::count_if(res->plan, [](const substitution_event &e) { return !e.executed; });
		notifier_->notify(notice_kind::replanned, std::format("{} substitutions rescheduled from {} (H{})", pending, util::format_clock(at.elapsed_seconds), at.current_half));
	}
	return res;
}

auto pitch_service::set_paused(bool paused) -> type::result<pitch_state>
{
	return mutate([&](pitch_state &st) -> type::result<type::ok_t> {
		if (st.plan.empty()) {
			return std::unexpected(type::error{constants::text::no_plan});
		}
		if (st.plan_paused == paused) {
			return std::unexpected(type::error{paused ? constants::text::plan_paused : constants::text::plan_not_paused});
		}

		st.plan_paused = paused;
		return type::ok_t{};
	});
}

} // namespace pitchside
