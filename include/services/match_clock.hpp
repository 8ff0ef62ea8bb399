#pragma once

#include "core/utils.hpp"
#include "models/match_state.hpp"
#include "services/persistence_service.hpp"

#include <memory>

namespace pitchside {

// Operator controls for the match timer. The running clock is never ticked; readers
// derive the current time from elapsed_seconds and last_update.
class match_clock {
public:
	explicit match_clock(std::shared_ptr<persistence_service> persistence, int default_minutes_per_half = 20);

	[[nodiscard]] auto snapshot() const -> std::optional<match_clock_snapshot>;

	[[nodiscard]] auto start(type::timestamp now) -> type::result<match_clock_snapshot>;
	[[nodiscard]] auto pause(type::timestamp now) -> type::result<match_clock_snapshot>;
	[[nodiscard]] auto start_second_half(type::timestamp now) -> type::result<match_clock_snapshot>;

	// Back to kickoff, stopped. Keeps the current half length unless one is given.
	[[nodiscard]] auto reset(type::timestamp now, std::optional<int> minutes_per_half = std::nullopt) -> type::result<match_clock_snapshot>;

private:
	std::shared_ptr<persistence_service> persistence_;
	int default_minutes_per_half_;

	[[nodiscard]] auto store(match_clock_snapshot clock) -> type::result<match_clock_snapshot>;
};

} // namespace pitchside
