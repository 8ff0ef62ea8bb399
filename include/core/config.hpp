#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "services/plan_generator.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace pitchside {

struct app_config {
	dpp::snowflake guild_id{};
	dpp::snowflake match_channel_id{};
	std::filesystem::path data_dir{"."};
	std::chrono::seconds poll_interval{constants::engine::poll_interval};
	std::chrono::seconds snooze_duration{constants::engine::snooze_duration};
	int minutes_per_half{constants::engine::default_minutes_per_half};
	plan_generator::generation_config plan_defaults{};

	// Missing file gives the defaults; a malformed one is an error.
	[[nodiscard]] static auto load(const std::filesystem::path &path) -> type::result<app_config>;
};

[[nodiscard]] auto parse_speed(std::string_view s) -> std::optional<rotation_speed>;
[[nodiscard]] auto to_string(rotation_speed speed) -> std::string_view;

} // namespace pitchside
