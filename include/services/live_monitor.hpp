#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/match_state.hpp"
#include "services/match_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace pitchside {

struct pending_substitution {
	std::size_t index{};
	substitution_event event;
	bool is_due{};
	int seconds_until{};
	std::vector<std::size_t> batch; // events sharing the primary's stamp, primary first
};

// Operator correction applied at acceptance time only.
struct substitution_override {
	std::string player_out;
	std::string player_in;
};

// Reconciles the stored plan against the running match clock.
class live_monitor {
public:
	live_monitor(std::shared_ptr<clock_source> clock, std::shared_ptr<pitch_state_store> store, std::shared_ptr<operator_notifier> notifier,
							 type::log_sink log = {}, std::chrono::seconds snooze_duration = constants::engine::snooze_duration);

	// Next event to surface, or nullopt when nothing should be shown right now.
	[[nodiscard]] auto poll(type::timestamp now) -> std::optional<pending_substitution>;

	// Classification for operator commands: ignores snooze and the running flag, sends nothing.
	[[nodiscard]] auto current(type::timestamp now) -> std::optional<pending_substitution>;

	[[nodiscard]] auto accept(type::timestamp now, std::size_t index, std::optional<substitution_override> override_players = std::nullopt)
			-> type::result<substitution_record>;
	[[nodiscard]] auto skip(type::timestamp now, std::size_t index) -> type::result<substitution_record>;

	// Visibility only; the plan is untouched.
	auto snooze(type::timestamp now) -> void;
	[[nodiscard]] auto is_snoozed(type::timestamp now) -> bool;

	// Re-polls whenever the store reports a write.
	auto watch() -> void;

	// Spreads the unexecuted events evenly over what is left of the match, keeping their order.
	[[nodiscard]] static auto rebalance(std::span<const substitution_event> plan, int current_total, int half_length) -> substitution_plan;

private:
	using notice_key = std::tuple<int, int, std::size_t>;

	std::shared_ptr<clock_source> clock_;
	std::shared_ptr<pitch_state_store> store_;
	std::shared_ptr<operator_notifier> notifier_;
	type::log_sink log_;
	std::chrono::seconds snooze_duration_;

	std::recursive_mutex mutex_;
	std::optional<type::timestamp> snoozed_until_;
	std::optional<notice_key> last_pending_;
	std::optional<notice_key> last_inconsistent_;
	bool finished_notified_{false};

	struct live_context {
		pitch_state state;
		match_clock_snapshot clock;
		int current_total{};
	};

	[[nodiscard]] static auto classify(const match_clock_snapshot &clock, const pitch_state &state, type::timestamp now) -> std::optional<pending_substitution>;
	[[nodiscard]] auto load(type::timestamp now, std::size_t index) -> type::result<live_context>;
	[[nodiscard]] auto commit(const pitch_state &state) -> type::result<type::ok_t>;
	[[nodiscard]] auto describe(const pitch_state &state, const substitution_event &ev) const -> std::string;

	[[nodiscard]] static auto can_execute(const pitch_state &state, std::string_view out, std::string_view in) -> bool;
	static auto move_players(pitch_state &state, const substitution_event &ev) -> void;
};

} // namespace pitchside
