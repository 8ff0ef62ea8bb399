#pragma once

#include "core/config.hpp"
#include "core/utils.hpp"
#include "handlers/session_manager.hpp"
#include "services/live_monitor.hpp"
#include "services/match_clock.hpp"
#include "services/pitch_service.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <memory>

namespace pitchside {

class command_handler {
public:
	explicit command_handler(std::shared_ptr<pitch_service> pitch_svc, std::shared_ptr<match_clock> clock, std::shared_ptr<live_monitor> monitor,
													 std::shared_ptr<session_manager> session_mgr, std::shared_ptr<panel_builder> panel_bld, app_config config);

	// Command dispatch
	auto on_slash(const dpp::slashcommand_t &ev) -> void;

	// Get command definitions for registration
	[[nodiscard]] static auto commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>;

private:
	std::shared_ptr<pitch_service> pitch_svc_;
	std::shared_ptr<match_clock> clock_;
	std::shared_ptr<live_monitor> monitor_;
	std::shared_ptr<session_manager> session_mgr_;
	std::shared_ptr<panel_builder> panel_bld_;
	app_config config_;

	// Roster
	auto cmd_help(const dpp::slashcommand_t &ev) -> void;
	auto cmd_addplayer(const dpp::slashcommand_t &ev) -> void;
	auto cmd_removeplayer(const dpp::slashcommand_t &ev) -> void;
	auto cmd_lineup(const dpp::slashcommand_t &ev) -> void;
	auto cmd_injured(const dpp::slashcommand_t &ev) -> void;
	auto cmd_roster(const dpp::slashcommand_t &ev) -> void;

	// Match
	auto cmd_setup(const dpp::slashcommand_t &ev) -> void;
	auto cmd_clock(const dpp::slashcommand_t &ev) -> void;

	// Plan
	auto cmd_generateplan(const dpp::slashcommand_t &ev) -> void;
	auto cmd_showplan(const dpp::slashcommand_t &ev) -> void;
	auto cmd_forecast(const dpp::slashcommand_t &ev) -> void;
	auto cmd_replan(const dpp::slashcommand_t &ev) -> void;
	auto cmd_pauseplan(const dpp::slashcommand_t &ev, bool paused) -> void;
	auto cmd_acceptsub(const dpp::slashcommand_t &ev) -> void;
	auto cmd_skipsub(const dpp::slashcommand_t &ev) -> void;

	// Editor
	auto cmd_deletesub(const dpp::slashcommand_t &ev) -> void;
	auto cmd_retimesub(const dpp::slashcommand_t &ev) -> void;
	auto cmd_reassignsub(const dpp::slashcommand_t &ev) -> void;
	auto cmd_insertsub(const dpp::slashcommand_t &ev) -> void;
	auto cmd_movesub(const dpp::slashcommand_t &ev) -> void;

	auto reply_plan(const dpp::slashcommand_t &ev, const type::result<pitch_state> &res, std::string_view ok) -> void;
	auto reply_roster(const dpp::slashcommand_t &ev, const type::result<player> &res, std::string_view ok) -> void;
};

} // namespace pitchside
