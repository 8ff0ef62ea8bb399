#include "core/constants.hpp"
#include "services/match_clock.hpp"

namespace pitchside {

match_clock::match_clock(std::shared_ptr<persistence_service> persistence, int default_minutes_per_half)
		: persistence_{std::move(persistence)}, default_minutes_per_half_{default_minutes_per_half}
{
}

auto match_clock::snapshot() const -> std::optional<match_clock_snapshot> { return persistence_->read_clock(); }

auto match_clock::store(match_clock_snapshot clock) -> type::result<match_clock_snapshot>
{
	if (auto res = persistence_->write_clock(clock); !res) {
		return std::unexpected(res.error());
	}
	return clock;
}

auto match_clock::start(type::timestamp now) -> type::result<match_clock_snapshot>
{
	auto clock = snapshot().value_or(match_clock_snapshot{.minutes_per_half = default_minutes_per_half_, .last_update = now});

	if (clock.is_finished(now)) {
		return std::unexpected(type::error{constants::text::match_over});
	}
	if (clock.is_running) {
		return clock;
	}

	clock.is_running = true;
	clock.last_update = now;
	return store(clock);
}

auto match_clock::pause(type::timestamp now) -> type::result<match_clock_snapshot>
{
	auto clock = snapshot();
	if (!clock) {
		return std::unexpected(type::error{constants::text::no_clock});
	}
	if (!clock->is_running) {
		return std::unexpected(type::error{constants::text::clock_not_running});
	}

	clock->elapsed_seconds = clock->half_seconds(now);
	clock->is_running = false;
	clock->last_update = now;
	return store(*clock);
}

auto match_clock::start_second_half(type::timestamp now) -> type::result<match_clock_snapshot>
{
	auto clock = snapshot();
	if (!clock) {
		return std::unexpected(type::error{constants::text::no_clock});
	}
	if (clock->current_half == 2) {
		return std::unexpected(type::error{constants::text::invalid_half});
	}

	clock->current_half = 2;
	clock->elapsed_seconds = 0;
	clock->is_running = true;
	clock->last_update = now;
	return store(*clock);
}

auto match_clock::reset(type::timestamp now, std::optional<int> minutes_per_half) -> type::result<match_clock_snapshot>
{
	if (minutes_per_half && *minutes_per_half <= 0) {
		return std::unexpected(type::error{constants::text::invalid_minutes});
	}

	auto minutes = default_minutes_per_half_;
	if (minutes_per_half) {
		minutes = *minutes_per_half;
	}
	else if (auto current = snapshot()) {
		minutes = current->minutes_per_half;
	}
	return store(match_clock_snapshot{.minutes_per_half = minutes, .last_update = now});
}

} // namespace pitchside
