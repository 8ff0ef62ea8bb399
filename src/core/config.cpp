#include "core/config.hpp"
#include <nlohmann/json.hpp>

#include <fstream>

namespace pitchside {

auto parse_speed(std::string_view s) -> std::optional<rotation_speed>
{
	if (s == "slow") {
		return rotation_speed::slow;
	}
	if (s == "medium") {
		return rotation_speed::medium;
	}
	if (s == "fast") {
		return rotation_speed::fast;
	}
	return std::nullopt;
}

auto to_string(rotation_speed speed) -> std::string_view
{
	switch (speed) {
	case rotation_speed::slow:
		return "slow";
	case rotation_speed::medium:
		return "medium";
	case rotation_speed::fast:
		return "fast";
	}
	return "?";
}

auto app_config::load(const std::filesystem::path &path) -> type::result<app_config>
{
	app_config cfg;
	cfg.plan_defaults.half_duration_seconds = cfg.minutes_per_half * 60;

	if (!std::filesystem::exists(path)) {
		return cfg;
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(path);
		nlohmann::json j;
		file >> j;

		cfg.guild_id = j.value("guild_id", std::uint64_t{0});
		cfg.match_channel_id = j.value("match_channel_id", std::uint64_t{0});
		cfg.data_dir = j.value("data_dir", std::string{"."});
		cfg.poll_interval = std::chrono::seconds{j.value("poll_interval_seconds", constants::engine::poll_interval.count())};
		cfg.snooze_duration = std::chrono::seconds{j.value("snooze_seconds", constants::engine::snooze_duration.count())};
		cfg.minutes_per_half = j.value("minutes_per_half", constants::engine::default_minutes_per_half);

		if (auto it = j.find("plan"); it != j.end()) {
			auto speed = it->value("speed", std::string{"medium"});
			auto parsed = parse_speed(speed);
			if (!parsed) {
				return std::unexpected(type::error{std::format("Unknown rotation speed '{}' in {}", speed, path.string())});
			}

			cfg.plan_defaults.speed = *parsed;
			cfg.plan_defaults.team_size = it->value("team_size", constants::engine::default_team_size);
			cfg.plan_defaults.disable_position_swaps = it->value("disable_position_swaps", false);
			cfg.plan_defaults.disable_batch_subs = it->value("disable_batch_subs", false);
		}
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot load {}: {}", path.string(), e.what())});
	}

	if (cfg.poll_interval.count() <= 0 || cfg.minutes_per_half <= 0) {
		return std::unexpected(type::error{std::format("Poll interval and minutes per half in {} must be positive", path.string())});
	}
	cfg.plan_defaults.half_duration_seconds = cfg.minutes_per_half * 60;
	return cfg;
}

} // namespace pitchside
