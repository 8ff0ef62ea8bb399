#include "core/config.hpp"
#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "handlers/interaction_handler.hpp"
#include "handlers/session_manager.hpp"
#include "services/live_monitor.hpp"
#include "services/match_clock.hpp"
#include "services/persistence_service.hpp"
#include "services/pitch_service.hpp"
#include "ui/channel_notifier.hpp"
#include "ui/message_builder.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <fstream>
#include <iostream>
#include <memory>

using namespace pitchside;

int main()
{
	// Read bot token
	std::string token;
	if (!(std::ifstream(std::string{constants::files::bot_token_file}) >> token)) {
		std::cerr << "Cannot read " << constants::files::bot_token_file << "\n";
		return 1;
	}

	auto config = app_config::load(std::string{constants::files::config_file});
	if (!config) {
		std::cerr << config.error().what() << "\n";
		return 1;
	}

	// Create bot
	dpp::cluster bot(token);
	bot.on_log(dpp::utility::cout_logger());

	type::log_sink log = [&bot](dpp::loglevel level, std::string_view msg) { bot.log(level, std::string{msg}); };

	// Initialize services
	auto persistence = std::make_shared<persistence_service>(config->data_dir, log);
	auto panel_bld = std::make_shared<panel_builder>();
	auto notifier = std::make_shared<ui::channel_notifier>(bot, config->match_channel_id, panel_bld);
	auto clock = std::make_shared<match_clock>(persistence, config->minutes_per_half);
	auto pitch_svc = std::make_shared<pitch_service>(persistence, persistence, notifier, config->minutes_per_half, log);
	auto monitor = std::make_shared<live_monitor>(persistence, persistence, notifier, log, config->snooze_duration);
	auto session_mgr = std::make_shared<session_manager>();

	// Create handlers
	auto cmd_handler = std::make_shared<command_handler>(pitch_svc, clock, monitor, session_mgr, panel_bld, *config);
	auto int_handler = std::make_shared<interaction_handler>(pitch_svc, monitor, session_mgr, panel_bld);

	// Wire events
	bot.on_slashcommand([cmd_handler](const dpp::slashcommand_t &ev) {
		try {
			cmd_handler->on_slash(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_button_click([int_handler](const dpp::button_click_t &ev) {
		try {
			int_handler->on_button(ev);
		} catch (const std::exception &e) {
			ui::message_builder::reply_error(ev, e.what());
		}
	});

	bot.on_ready([&](const dpp::ready_t &) {
		if (dpp::run_once<struct register_bot_commands>()) {
			// Clear global commands
			bot.global_bulk_command_create({});

			// Register guild commands
			auto cmds = command_handler::commands(bot.me.id);
			bot.guild_bulk_command_create(cmds, config->guild_id);

			// Poll the plan against the match clock
			monitor->watch();
			bot.start_timer(
					[monitor, &bot](dpp::timer) {
						try {
							(void)monitor->poll(util::now());
						} catch (const std::exception &e) {
							bot.log(dpp::ll_error, std::format("Substitution poll failed: {}", e.what()));
						}
					},
					static_cast<uint64_t>(config->poll_interval.count()));
		}
	});

	// Start bot
	bot.start(dpp::st_wait);

	return 0;
}
