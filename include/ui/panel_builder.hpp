#pragma once

#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "models/player.hpp"
#include <dpp/dpp.h>

#include <span>

namespace pitchside {

class panel_builder {
public:
	// Draft plan with its forecast, plus Start / Regenerate / Close
	[[nodiscard]] auto build_preview_panel(const preview_session &sess, std::span<const player> roster, int minutes_per_half) const -> dpp::message;

	// Accept / Skip / Snooze row attached to due-substitution notices
	[[nodiscard]] auto build_sub_controls() const -> dpp::component;

private:
	[[nodiscard]] auto create_button(std::string_view label, dpp::component_style style, std::string id) const -> dpp::component;
};

} // namespace pitchside
