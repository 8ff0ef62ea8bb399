#pragma once

#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "services/live_monitor.hpp"
#include "services/pitch_service.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <memory>
#include <optional>
#include <string>

namespace pitchside {

class interaction_handler {
public:
	explicit interaction_handler(std::shared_ptr<pitch_service> pitch_svc, std::shared_ptr<live_monitor> monitor, std::shared_ptr<session_manager> session_mgr,
															 std::shared_ptr<panel_builder> panel_bld);

	auto on_button(const dpp::button_click_t &ev) -> void;

private:
	std::shared_ptr<pitch_service> pitch_svc_;
	std::shared_ptr<live_monitor> monitor_;
	std::shared_ptr<session_manager> session_mgr_;
	std::shared_ptr<panel_builder> panel_bld_;

	// "panel:<panel_id>:<action>"
	struct panel_action {
		std::string panel_id;
		std::string action;
	};

	[[nodiscard]] static auto parse_custom_id(std::string_view custom_id) -> std::optional<panel_action>;

	auto handle_start(const dpp::button_click_t &ev, const preview_session &sess) -> void;
	auto handle_regen(const dpp::button_click_t &ev, const preview_session &sess) -> void;

	// Due-substitution notices: "sub:<accept|skip|snooze>"
	auto handle_sub(const dpp::button_click_t &ev, std::string_view action) -> void;
};

} // namespace pitchside
