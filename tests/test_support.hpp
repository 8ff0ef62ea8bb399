#pragma once

#include "models/match_state.hpp"
#include "models/player.hpp"
#include "services/match_store.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace pitchside::test {

inline auto on_pitch(std::string id, pitch_position pos, std::vector<pitch_position> eligible = {}) -> player
{
	return player{.id = id,
								.name = id,
								.position = coordinate{.x = 50, .y = 50},
								.eligible_positions = std::move(eligible),
								.current_pitch_position = pos};
}

inline auto on_bench(std::string id, std::vector<pitch_position> eligible = {}) -> player
{
	return player{.id = id, .name = id, .eligible_positions = std::move(eligible)};
}

inline auto event(int half, int time, std::string out, std::string in) -> substitution_event
{
	return substitution_event{.half = half, .time = time, .player_out = std::move(out), .player_in = std::move(in)};
}

inline auto at(std::int64_t seconds) -> type::timestamp { return type::timestamp{std::chrono::seconds{seconds}}; }

// Clock running since `now`, already `elapsed` seconds into `half`.
inline auto running_clock(int half, int elapsed, type::timestamp now, int minutes_per_half = 20) -> match_clock_snapshot
{
	return match_clock_snapshot{.minutes_per_half = minutes_per_half, .current_half = half, .elapsed_seconds = elapsed, .is_running = true, .last_update = now};
}

// 4-a-side: keeper plus three outfielders on the pitch, two on the bench.
inline auto small_squad() -> std::vector<player>
{
	return {on_pitch("gk", pitch_position::gk, {pitch_position::gk}),
					on_pitch("a", pitch_position::def),
					on_pitch("b", pitch_position::mid),
					on_pitch("c", pitch_position::fwd),
					on_bench("x"),
					on_bench("y")};
}

inline auto player_by_id(const std::vector<player> &players, std::string_view id) -> const player &
{
	return *std::ranges::find(players, id, &player::id);
}

class fake_clock : public clock_source {
public:
	std::optional<match_clock_snapshot> snapshot;

	auto read_clock() -> std::optional<match_clock_snapshot> override { return snapshot; }
};

class memory_store : public pitch_state_store {
public:
	std::optional<pitch_state> state;
	bool fail_writes{};
	int writes{};

	auto read_pitch_state() -> std::optional<pitch_state> override { return state; }

	auto write_pitch_state(const pitch_state &st) -> type::result<type::ok_t> override
	{
		if (fail_writes) {
			return std::unexpected(type::error{"disk full"});
		}
		state = st;
		++writes;
		for (const auto &listener : listeners_) {
			listener();
		}
		return type::ok_t{};
	}

	auto on_external_change(change_listener listener) -> void override { listeners_.push_back(std::move(listener)); }

private:
	std::vector<change_listener> listeners_;
};

class recording_notifier : public operator_notifier {
public:
	std::vector<std::pair<notice_kind, std::string>> notices;

	auto notify(notice_kind kind, std::string_view detail) -> void override { notices.emplace_back(kind, std::string{detail}); }

	[[nodiscard]] auto count(notice_kind kind) const -> std::size_t
	{
		return static_cast<std::size_t>(std::ranges::count(notices, kind, &std::pair<notice_kind, std::string>::first));
	}
};

// Scratch directory removed on destruction.
class temp_dir {
public:
	temp_dir()
	{
		std::random_device rd;
		path_ = std::filesystem::temp_directory_path() / std::format("pitchside-test-{:x}", rd());
		std::filesystem::create_directories(path_);
	}

	~temp_dir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	temp_dir(const temp_dir &) = delete;
	auto operator=(const temp_dir &) -> temp_dir & = delete;

	[[nodiscard]] auto path() const -> const std::filesystem::path & { return path_; }

private:
	std::filesystem::path path_;
};

} // namespace pitchside::test
