#include "models/roster.hpp"
#include "services/live_monitor.hpp"

#include <algorithm>
#include <ranges>

namespace pitchside {

live_monitor::live_monitor(std::shared_ptr<clock_source> clock, std::shared_ptr<pitch_state_store> store, std::shared_ptr<operator_notifier> notifier,
													 type::log_sink log, std::chrono::seconds snooze_duration)
		: clock_{std::move(clock)}, store_{std::move(store)}, notifier_{std::move(notifier)}, log_{std::move(log)}, snooze_duration_{snooze_duration}
{
}

auto live_monitor::poll(type::timestamp now) -> std::optional<pending_substitution>
{
	std::scoped_lock lock{mutex_};

	auto clock = clock_->read_clock();
	auto state = store_->read_pitch_state();
	if (!clock || !state) {
		return std::nullopt;
	}

	if (clock->is_finished(now)) {
		if (!finished_notified_ && !state->plan.empty()) {
			finished_notified_ = true;
			notifier_->notify(notice_kind::finished, constants::text::full_time);
		}
		return std::nullopt;
	}
	finished_notified_ = false;

	if (!clock->is_running || !state->plan_active || state->plan_paused || is_snoozed(now)) {
		return std::nullopt;
	}

	auto found = classify(*clock, *state, now);
	if (!found || !found->is_due) {
		return found;
	}

	auto &pending = *found;
	const auto &plan = state->plan;

	const notice_key key{pending.event.half, pending.event.time, pending.batch.size()};
	if (last_pending_ != key) {
		last_pending_ = key;

		std::string lines;
		for (auto i : pending.batch) {
			if (!lines.empty()) {
				lines += '\n';
			}
			lines += describe(*state, plan[i]);
		}
		util::log(log_, dpp::ll_info, std::format("Substitution due at {} (H{}), {} in batch", util::format_clock(pending.event.time), pending.event.half,
																						 pending.batch.size()));
		notifier_->notify(notice_kind::pending, lines);
	}

	if (!can_execute(*state, pending.event.player_out, pending.event.player_in) && last_inconsistent_ != key) {
		last_inconsistent_ = key;
		notifier_->notify(notice_kind::inconsistent, std::format("Players are not where the plan expects: {}", describe(*state, pending.event)));
	}

	return found;
}

auto live_monitor::current(type::timestamp now) -> std::optional<pending_substitution>
{
	std::scoped_lock lock{mutex_};

	auto clock = clock_->read_clock();
	auto state = store_->read_pitch_state();
	if (!clock || !state || !state->plan_active || state->plan_paused) {
		return std::nullopt;
	}
	return classify(*clock, *state, now);
}

auto live_monitor::classify(const match_clock_snapshot &clock, const pitch_state &state, type::timestamp now) -> std::optional<pending_substitution>
{
	const auto &plan = state.plan;
	const int half_length = clock.half_length();
	const int current_total = clock.current_total_seconds(now);

	auto order = std::views::iota(std::size_t{0}, plan.size()) | std::views::filter([&](std::size_t i) { return !plan[i].executed; }) |
							 std::ranges::to<std::vector<std::size_t>>();
	if (order.empty()) {
		return std::nullopt;
	}
	std::ranges::stable_sort(order, {}, [&](std::size_t i) { return plan[i].stamp(); });

	// Earliest unexecuted event: due once its stamp has passed, otherwise upcoming.
	const auto primary = order.front();
	const int scheduled = plan[primary].total_seconds(half_length);

	pending_substitution pending{.index = primary,
															 .event = plan[primary],
															 .is_due = scheduled <= current_total,
															 .seconds_until = std::max(0, scheduled - current_total)};
	for (auto i : order) {
		if (plan[i].stamp() != plan[primary].stamp()) {
			break;
		}
		pending.batch.push_back(i);
	}

	return pending;
}

auto live_monitor::load(type::timestamp now, std::size_t index) -> type::result<live_context>
{
	auto state = store_->read_pitch_state();
	if (!state) {
		return std::unexpected(type::error{constants::text::no_pitch_state});
	}
	auto clock = clock_->read_clock();
	if (!clock) {
		return std::unexpected(type::error{constants::text::no_clock});
	}
	if (index >= state->plan.size() || state->plan[index].executed) {
		return std::unexpected(type::error{constants::text::nothing_pending});
	}

	const int current_total = clock->current_total_seconds(now);
	if (state->plan[index].total_seconds(clock->half_length()) > current_total) {
		return std::unexpected(type::error{constants::text::not_due_yet});
	}
	return live_context{.state = std::move(*state), .clock = *clock, .current_total = current_total};
}

auto live_monitor::commit(const pitch_state &state) -> type::result<type::ok_t>
{
	auto res = store_->write_pitch_state(state);
	if (!res) {
		util::log(log_, dpp::ll_error, std::format("Cannot store pitch state: {}", res.error().what()));
		notifier_->notify(notice_kind::error, res.error().what());
	}
	return res;
}

auto live_monitor::accept(type::timestamp now, std::size_t index, std::optional<substitution_override> override_players) -> type::result<substitution_record>
{
	std::scoped_lock lock{mutex_};

	auto ctx = load(now, index);
	if (!ctx) {
		return std::unexpected(ctx.error());
	}

	auto &state = ctx->state;
	const int half_length = ctx->clock.half_length();
	const int current_total = ctx->current_total;
	auto &ev = state.plan[index];
	const int scheduled = ev.total_seconds(half_length);

	state.accrue(current_total);
	state.last_update = now;

	if (override_players && (override_players->player_out != ev.player_out || override_players->player_in != ev.player_in)) {
		ev.player_out = override_players->player_out;
		ev.player_in = override_players->player_in;
		ev.swap.reset();
	}

	if (!can_execute(state, ev.player_out, ev.player_in)) {
		ev.executed = true;
		substitution_record record{.event = ev, .at_total_seconds = current_total, .outcome = substitution_outcome::inconsistent};
		state.history.push_back(record);
		state.plan_active = state.has_pending();

		if (auto res = commit(state); !res) {
			return std::unexpected(res.error());
		}
		util::log(log_, dpp::ll_warning, std::format("Skipped inconsistent substitution: {}", describe(state, record.event)));
		notifier_->notify(notice_kind::skipped, std::format("Substitution skipped, players are not in expected positions: {}", describe(state, record.event)));
		return record;
	}

	move_players(state, ev);
	ev.executed = true;
	substitution_record record{.event = ev, .at_total_seconds = current_total, .outcome = substitution_outcome::executed};
	state.history.push_back(record);

	if (current_total - scheduled > constants::engine::late_threshold_seconds) {
		state.plan = rebalance(state.plan, current_total, half_length);
		util::log(log_, dpp::ll_info, std::format("Substitution made {}s late, remaining plan rescheduled", current_total - scheduled));
	}
	state.plan_active = state.has_pending();

	if (auto res = commit(state); !res) {
		return std::unexpected(res.error());
	}
	notifier_->notify(notice_kind::executed, describe(state, record.event));
	return record;
}

auto live_monitor::skip(type::timestamp now, std::size_t index) -> type::result<substitution_record>
{
	std::scoped_lock lock{mutex_};

	auto ctx = load(now, index);
	if (!ctx) {
		return std::unexpected(ctx.error());
	}

	auto &state = ctx->state;
	const int current_total = ctx->current_total;

	state.accrue(current_total);
	state.last_update = now;

	state.plan[index].executed = true;
	substitution_record record{.event = state.plan[index], .at_total_seconds = current_total, .outcome = substitution_outcome::skipped};
	state.history.push_back(record);

	state.plan = rebalance(state.plan, current_total, ctx->clock.half_length());
	state.plan_active = state.has_pending();

	if (auto res = commit(state); !res) {
		return std::unexpected(res.error());
	}
	notifier_->notify(notice_kind::skipped, std::format("Skipped {}, remaining substitutions rescheduled", describe(state, record.event)));
	return record;
}

auto live_monitor::snooze(type::timestamp now) -> void
{
	std::scoped_lock lock{mutex_};
	snoozed_until_ = now + snooze_duration_;
}

auto live_monitor::is_snoozed(type::timestamp now) -> bool
{
	std::scoped_lock lock{mutex_};
	if (snoozed_until_ && now >= *snoozed_until_) {
		snoozed_until_.reset();
	}
	return snoozed_until_.has_value();
}

auto live_monitor::watch() -> void
{
	// The monitor outlives the store's listeners for the life of the bot.
	store_->on_external_change([this] { (void)poll(util::now()); });
}

auto live_monitor::rebalance(std::span<const substitution_event> plan, int current_total, int half_length) -> substitution_plan
{
	substitution_plan out(plan.begin(), plan.end());

	const auto remaining = util::narrow<int>(std::ranges::count_if(out, [](const substitution_event &e) { return !e.executed; }));
	if (remaining == 0) {
		return out;
	}

	const int full_time = half_length * 2;
	const int interval = std::max(constants::engine::min_rebalance_interval_seconds, (full_time - current_total) / (remaining + 1));

	int next = current_total + interval;
	for (auto &e : out) {
		if (e.executed) {
			continue;
		}

		auto stamp = from_total_seconds(std::min(next, full_time - 1), half_length);
		e.half = stamp.half;
		e.time = stamp.time;
		next += interval;
	}
	return out;
}

auto live_monitor::can_execute(const pitch_state &state, std::string_view out, std::string_view in) -> bool
{
	if (out == in) {
		return false;
	}
	auto p_out = roster::find_player(state.players, out);
	auto p_in = roster::find_player(state.players, in);
	return p_out && p_out->get().on_field() && p_in && p_in->get().on_bench();
}

auto live_monitor::move_players(pitch_state &state, const substitution_event &ev) -> void
{
	auto out = roster::find_player_mut(state.players, ev.player_out);
	auto in = roster::find_player_mut(state.players, ev.player_in);
	if (!out || !in) {
		return;
	}

	auto &leaving = out->get();
	auto &incoming = in->get();
	const auto slot = leaving.position;
	const auto label = leaving.current_pitch_position;

	leaving.move_to_bench();
	incoming.position = slot;
	incoming.current_pitch_position = label;

	if (!ev.swap) {
		return;
	}

	// The passenger drops into the vacated slot; the incoming player takes the passenger's.
	auto passenger = roster::find_player_mut(state.players, ev.swap->player_id);
	if (passenger && passenger->get().on_field() && passenger->get().id != incoming.id) {
		auto &moving = passenger->get();
		incoming.position = moving.position;
		incoming.current_pitch_position = ev.swap->from;
		moving.position = slot;
		moving.current_pitch_position = ev.swap->to;
	}
}

auto live_monitor::describe(const pitch_state &state, const substitution_event &ev) const -> std::string
{
	auto text = std::format("{} on for {} at {} (H{})", roster::name_of(state.players, ev.player_in), roster::name_of(state.players, ev.player_out),
													util::format_clock(ev.time), ev.half);
	if (ev.swap) {
		text += std::format(", {} moves {} to {}", roster::name_of(state.players, ev.swap->player_id), to_string(ev.swap->from), to_string(ev.swap->to));
	}
	return text;
}

} // namespace pitchside
