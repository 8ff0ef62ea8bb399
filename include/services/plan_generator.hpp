#pragma once

#include "models/player.hpp"
#include "models/substitution.hpp"

#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pitchside {

enum class rotation_speed { slow = 1, medium = 2, fast = 3 };

class plan_generator {
public:
	struct generation_config {
		int team_size{7};
		int half_duration_seconds{20 * 60};
		rotation_speed speed{rotation_speed::medium};
		bool disable_position_swaps{false};
		bool disable_batch_subs{false}; // If true, one substitution per window
	};

	// Where a running match stands when the rest of the plan is rebuilt.
	struct replan_point {
		int current_half{1};
		int elapsed_seconds{}; // within current_half
	};

	// Empty plan means nothing to schedule (no bench, bad sizes), not an error.
	[[nodiscard]] static auto generate(std::span<const player> roster, generation_config config) -> substitution_plan;

	// Rebuilds the remaining plan from the live lineup, weighting by seconds already played.
	[[nodiscard]] static auto replan(std::span<const player> roster, generation_config config, replan_point at) -> substitution_plan;

	[[nodiscard]] static auto ideal_seconds_per_player(std::span<const player> roster, int team_size, int half_duration_seconds) -> int;

private:
	// Ordered id -> slot map; new entries go to the back, updates keep their place.
	class lineup {
	public:
		using slot = std::pair<std::string, std::optional<pitch_position>>;

		[[nodiscard]] auto contains(std::string_view id) const -> bool;
		[[nodiscard]] auto position_of(std::string_view id) const -> std::optional<pitch_position>;
		[[nodiscard]] auto slots() const -> const std::vector<slot> & { return slots_; }
		[[nodiscard]] auto empty() const -> bool { return slots_.empty(); }

		auto erase(std::string_view id) -> void;
		auto assign(std::string_view id, std::optional<pitch_position> pos) -> void;

	private:
		std::vector<slot> slots_;
	};

	struct ranked_player {
		std::string id;
		int seconds{};
	};

	struct candidate {
		std::string player_out;
		std::string player_in;
		std::optional<position_swap> swap;
		double score{};
		bool position_valid{};
	};

	struct roster_split {
		std::vector<const player *> outfield;
		std::vector<const player *> outfield_on_field;
		std::vector<const player *> outfield_on_bench;
		const player *keeper_on_field{nullptr};
		const player *keeper_on_bench{nullptr};
	};

	// Greedy window simulation
	struct window_context {
		generation_config config;
		std::unordered_map<std::string, const player *> outfield;
		std::vector<std::string> outfield_order;
		std::unordered_map<std::string, int> playing_time;
		lineup on_pitch;

		[[nodiscard]] auto subs_at_once(std::size_t bench_size) const -> int;
		[[nodiscard]] auto windows_per_half(int min_subs_needed, int subs) const -> int;
		[[nodiscard]] static auto window_times(int half_duration, int windows) -> std::vector<int>;

		auto run_half(int half, std::span<const int> times, int subs, substitution_plan &plan) -> void;

	private:
		[[nodiscard]] auto ranked_on_pitch() const -> std::vector<ranked_player>;
		[[nodiscard]] auto ranked_bench() const -> std::vector<ranked_player>;
		[[nodiscard]] auto best_candidate(std::span<const ranked_player> on_pitch_sorted, std::span<const ranked_player> bench_sorted,
																			const std::unordered_set<std::string> &used_out, const std::unordered_set<std::string> &used_in) const
				-> std::optional<candidate>;
		auto apply(const candidate &c) -> void;
	};

	[[nodiscard]] static auto split(std::span<const player> roster) -> roster_split;
	[[nodiscard]] static auto keeper_swap(const roster_split &s) -> std::optional<substitution_event>;
};

} // namespace pitchside
