#include "core/constants.hpp"
#include "services/persistence_service.hpp"
#include <nlohmann/json.hpp>

#include <fstream>

namespace pitchside {

auto persistence_service::pitch_state_path() const -> std::filesystem::path { return data_dir_ / constants::files::pitch_state_file; }

auto persistence_service::clock_path() const -> std::filesystem::path { return data_dir_ / constants::files::clock_file; }

auto persistence_service::read_json(const std::filesystem::path &path) -> std::optional<nlohmann::json>
{
	if (!std::filesystem::exists(path)) {
		return std::nullopt;
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(path);
		nlohmann::json j;
		file >> j;
		return j;
	} catch (const std::exception &e) {
		util::log(log_, dpp::ll_warning, std::format("Cannot read {}: {}", path.string(), e.what()));
		return std::nullopt;
	}
}

auto persistence_service::write_json(const std::filesystem::path &path, const nlohmann::json &j) -> type::result<type::ok_t>
{
	try { // The try block is for nlohmann::json
		std::filesystem::create_directories(data_dir_);

		std::ofstream file(path);
		file << j.dump(2);
		if (!file) {
			return std::unexpected(type::error{std::format("Cannot write {}", path.string())});
		}

		return type::ok_t{};
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::format("Cannot write {}: {}", path.string(), e.what())});
	}
}

auto persistence_service::read_pitch_state() -> std::optional<pitch_state>
{
	auto j = read_json(pitch_state_path());
	if (!j) {
		return std::nullopt;
	}

	try {
		return pitch_state::from_json(*j);
	} catch (const std::exception &e) {
		util::log(log_, dpp::ll_warning, std::format("Malformed pitch state: {}", e.what()));
		return std::nullopt;
	}
}

auto persistence_service::write_pitch_state(const pitch_state &state) -> type::result<type::ok_t>
{
	auto res = write_json(pitch_state_path(), state.to_json());
	if (res) {
		fire_listeners();
	}
	return res;
}

auto persistence_service::read_clock() -> std::optional<match_clock_snapshot>
{
	auto j = read_json(clock_path());
	if (!j) {
		return std::nullopt;
	}

	try {
		return match_clock_snapshot::from_json(*j);
	} catch (const std::exception &e) {
		util::log(log_, dpp::ll_warning, std::format("Malformed match clock: {}", e.what()));
		return std::nullopt;
	}
}

auto persistence_service::write_clock(const match_clock_snapshot &clock) -> type::result<type::ok_t>
{
	auto res = write_json(clock_path(), clock.to_json());
	if (res) {
		fire_listeners();
	}
	return res;
}

auto persistence_service::on_external_change(change_listener listener) -> void
{
	std::scoped_lock lock{listeners_mutex_};
	listeners_.push_back(std::move(listener));
}

auto persistence_service::fire_listeners() -> void
{
	std::vector<change_listener> copy;
	{
		std::scoped_lock lock{listeners_mutex_};
		copy = listeners_;
	}

	for (const auto &listener : copy) {
		listener();
	}
}

} // namespace pitchside
