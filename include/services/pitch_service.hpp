#pragma once

#include "core/utils.hpp"
#include "models/match_state.hpp"
#include "services/match_store.hpp"
#include "services/plan_editor.hpp"
#include "services/plan_generator.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pitchside {

// Operator-side changes to the stored pitch state: roster, lineup and the plan itself.
// Each call is one read-modify-write against the store.
class pitch_service {
public:
	using plan_edit = std::function<type::result<substitution_plan>(const pitch_state &, const plan_editor &)>;

	pitch_service(std::shared_ptr<pitch_state_store> store, std::shared_ptr<clock_source> clock, std::shared_ptr<operator_notifier> notifier,
								int default_minutes_per_half = 20, type::log_sink log = {});

	[[nodiscard]] auto state() const -> std::optional<pitch_state>;
	[[nodiscard]] auto minutes_per_half() const -> int;

	// Match setup; keeps the roster, benches everyone and drops any plan.
	[[nodiscard]] auto setup(int team_size, std::string team_name) -> type::result<pitch_state>;

	// Roster
	[[nodiscard]] auto add_player(std::string name, std::optional<int> number, std::vector<pitch_position> eligible, bool fill_in) -> type::result<player>;
	[[nodiscard]] auto remove_player(std::string_view ref) -> type::result<player>;
	[[nodiscard]] auto set_slot(std::string_view ref, int slot) -> type::result<player>; // slot 0 = bench
	[[nodiscard]] auto set_injured(std::string_view ref, bool injured) -> type::result<player>;

	// Plan
	[[nodiscard]] auto draft_plan(plan_generator::generation_config config) const -> type::result<substitution_plan>;
	[[nodiscard]] auto start_plan(substitution_plan plan, type::timestamp now) -> type::result<pitch_state>;
	[[nodiscard]] auto edit_plan(const plan_edit &edit) -> type::result<pitch_state>;
	[[nodiscard]] auto replan(plan_generator::generation_config config, type::timestamp now) -> type::result<pitch_state>;
	[[nodiscard]] auto set_paused(bool paused) -> type::result<pitch_state>;

private:
	std::shared_ptr<pitch_state_store> store_;
	std::shared_ptr<clock_source> clock_;
	std::shared_ptr<operator_notifier> notifier_;
	int default_minutes_per_half_;
	type::log_sink log_;
	std::mutex mutex_;

	[[nodiscard]] auto mutate(const std::function<type::result<type::ok_t>(pitch_state &)> &change) -> type::result<pitch_state>;
	[[nodiscard]] auto current_total(type::timestamp now) const -> int;
	[[nodiscard]] static auto next_player_id(std::span<const player> players) -> std::string;
};

} // namespace pitchside
