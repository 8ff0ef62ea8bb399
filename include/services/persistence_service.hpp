#pragma once

#include "core/utils.hpp"
#include "models/match_state.hpp"
#include "services/match_store.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

namespace pitchside {

// JSON files in the data directory. Reads fail closed: a missing or malformed file reads as nothing.
class persistence_service : public clock_source, public pitch_state_store {
public:
	explicit persistence_service(std::filesystem::path data_dir = ".", type::log_sink log = {}) : data_dir_{std::move(data_dir)}, log_{std::move(log)} {}

	// Pitch state
	[[nodiscard]] auto read_pitch_state() -> std::optional<pitch_state> override;
	[[nodiscard]] auto write_pitch_state(const pitch_state &state) -> type::result<type::ok_t> override;
	auto on_external_change(change_listener listener) -> void override;

	// Match clock
	[[nodiscard]] auto read_clock() -> std::optional<match_clock_snapshot> override;
	[[nodiscard]] auto write_clock(const match_clock_snapshot &clock) -> type::result<type::ok_t>;

	[[nodiscard]] auto data_dir() const -> const std::filesystem::path & { return data_dir_; }

private:
	std::filesystem::path data_dir_;
	type::log_sink log_;
	std::mutex listeners_mutex_;
	std::vector<change_listener> listeners_;

	[[nodiscard]] auto pitch_state_path() const -> std::filesystem::path;
	[[nodiscard]] auto clock_path() const -> std::filesystem::path;

	[[nodiscard]] auto read_json(const std::filesystem::path &path) -> std::optional<nlohmann::json>;
	[[nodiscard]] auto write_json(const std::filesystem::path &path, const nlohmann::json &j) -> type::result<type::ok_t>;
	auto fire_listeners() -> void;
};

} // namespace pitchside
