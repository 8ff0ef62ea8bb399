#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "models/roster.hpp"
#include "services/time_forecaster.hpp"
#include "ui/embed_builder.hpp"
#include "ui/message_builder.hpp"

#include <format>
#include <ranges>

namespace pitchside {

namespace {

auto string_param(const dpp::slashcommand_t &ev, const std::string &name) -> std::optional<std::string>
{
	if (auto p = ev.get_parameter(name); std::holds_alternative<std::string>(p)) {
		return std::get<std::string>(p);
	}
	return std::nullopt;
}

auto int_param(const dpp::slashcommand_t &ev, const std::string &name) -> std::optional<int>
{
	if (auto p = ev.get_parameter(name); std::holds_alternative<int64_t>(p)) {
		return static_cast<int>(std::get<int64_t>(p));
	}
	return std::nullopt;
}

auto bool_param(const dpp::slashcommand_t &ev, const std::string &name) -> std::optional<bool>
{
	if (auto p = ev.get_parameter(name); std::holds_alternative<bool>(p)) {
		return std::get<bool>(p);
	}
	return std::nullopt;
}

// Plan indexes are shown 1-based.
auto index_param(const dpp::slashcommand_t &ev, const std::string &name) -> std::optional<std::size_t>
{
	auto value = int_param(ev, name);
	if (!value || *value < 1) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(*value - 1);
}

auto parse_positions(std::string_view text) -> type::result<std::vector<pitch_position>>
{
	std::vector<pitch_position> out;
	for (auto part : text | std::views::split(std::string_view{","})) {
		std::string_view token{part.begin(), part.end()};
		while (!token.empty() && (token.front() == ' ' || token.front() == '/')) {
			token.remove_prefix(1);
		}
		while (!token.empty() && token.back() == ' ') {
			token.remove_suffix(1);
		}
		if (token.empty()) {
			continue;
		}

		auto pos = parse_position(token);
		if (!pos) {
			return std::unexpected(type::error{std::format("Unknown position '{}', use GK, DEF, MID or FWD", token)});
		}
		if (!std::ranges::contains(out, *pos)) {
			out.push_back(*pos);
		}
	}
	return out;
}

auto player_option(std::string name, std::string description, bool required = true) -> dpp::command_option
{
	return dpp::command_option(dpp::co_string, std::move(name), std::move(description), required);
}

auto index_option(std::string name, std::string description) -> dpp::command_option
{
	return dpp::command_option(dpp::co_integer, std::move(name), std::move(description), true).set_min_value(int64_t{1});
}

auto half_option() -> dpp::command_option
{
	return dpp::command_option(dpp::co_integer, "half", "Half (1 or 2)", true)
			.add_choice(dpp::command_option_choice("First half", int64_t{1}))
			.add_choice(dpp::command_option_choice("Second half", int64_t{2}));
}

} // namespace

command_handler::command_handler(std::shared_ptr<pitch_service> pitch_svc, std::shared_ptr<match_clock> clock, std::shared_ptr<live_monitor> monitor,
																 std::shared_ptr<session_manager> session_mgr, std::shared_ptr<panel_builder> panel_bld, app_config config)
		: pitch_svc_(std::move(pitch_svc)), clock_(std::move(clock)), monitor_(std::move(monitor)), session_mgr_(std::move(session_mgr)),
			panel_bld_(std::move(panel_bld)), config_(std::move(config))
{
}

auto command_handler::on_slash(const dpp::slashcommand_t &ev) -> void
{
	auto name = ev.command.get_command_name();

	if (name == "help")
		return cmd_help(ev);
	if (name == "addplayer")
		return cmd_addplayer(ev);
	if (name == "removeplayer")
		return cmd_removeplayer(ev);
	if (name == "lineup")
		return cmd_lineup(ev);
	if (name == "injured")
		return cmd_injured(ev);
	if (name == "roster")
		return cmd_roster(ev);
	if (name == "setup")
		return cmd_setup(ev);
	if (name == "clock")
		return cmd_clock(ev);
	if (name == "generateplan")
		return cmd_generateplan(ev);
	if (name == "showplan")
		return cmd_showplan(ev);
	if (name == "forecast")
		return cmd_forecast(ev);
	if (name == "replan")
		return cmd_replan(ev);
	if (name == "pauseplan")
		return cmd_pauseplan(ev, true);
	if (name == "resumeplan")
		return cmd_pauseplan(ev, false);
	if (name == "acceptsub")
		return cmd_acceptsub(ev);
	if (name == "skipsub")
		return cmd_skipsub(ev);
	if (name == "deletesub")
		return cmd_deletesub(ev);
	if (name == "retimesub")
		return cmd_retimesub(ev);
	if (name == "reassignsub")
		return cmd_reassignsub(ev);
	if (name == "insertsub")
		return cmd_insertsub(ev);
	if (name == "movesub")
		return cmd_movesub(ev);

	return ui::message_builder::reply_error(ev, constants::text::unknown_command);
}

auto command_handler::commands(dpp::snowflake bot_id) -> std::vector<dpp::slashcommand>
{
	std::vector<dpp::slashcommand> cmds;

	cmds.emplace_back("help", "Show the command list", bot_id);

	// Roster
	cmds.emplace_back("addplayer", "Add a player to the roster", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "name", "Player name", true))
			.add_option(dpp::command_option(dpp::co_integer, "number", "Jersey number", false))
			.add_option(dpp::command_option(dpp::co_string, "positions", "Eligible positions, e.g. DEF,MID (empty = any)", false))
			.add_option(dpp::command_option(dpp::co_boolean, "fillin", "Guest or fill-in player", false));

	cmds.emplace_back("removeplayer", "Remove a player from the roster", bot_id).add_option(player_option("player", "Player id, name or number"));

	cmds.emplace_back("lineup", "Put a player in a formation slot or on the bench", bot_id)
			.add_option(player_option("player", "Player id, name or number"))
			.add_option(dpp::command_option(dpp::co_integer, "slot", "Formation slot (1 = keeper), 0 for the bench", true).set_min_value(int64_t{0}));

	cmds.emplace_back("injured", "Mark or clear an injury", bot_id)
			.add_option(player_option("player", "Player id, name or number"))
			.add_option(dpp::command_option(dpp::co_boolean, "state", "Injured?", true));

	cmds.emplace_back("roster", "Show pitch and bench", bot_id);

	// Match
	cmds.emplace_back("setup", "Set up a new match", bot_id)
			.add_option(dpp::command_option(dpp::co_integer, "team_size", "Players per side", true)
											.add_choice(dpp::command_option_choice("4-a-side", int64_t{4}))
											.add_choice(dpp::command_option_choice("7-a-side", int64_t{7}))
											.add_choice(dpp::command_option_choice("9-a-side", int64_t{9}))
											.add_choice(dpp::command_option_choice("11-a-side", int64_t{11})))
			.add_option(dpp::command_option(dpp::co_integer, "minutes_per_half", "Minutes per half", true).set_min_value(int64_t{1}))
			.add_option(dpp::command_option(dpp::co_string, "team_name", "Team name", false));

	cmds.emplace_back("clock", "Control the match clock", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "action", "Clock action", true)
											.add_choice(dpp::command_option_choice("start", std::string("start")))
											.add_choice(dpp::command_option_choice("pause", std::string("pause")))
											.add_choice(dpp::command_option_choice("second half", std::string("secondhalf")))
											.add_choice(dpp::command_option_choice("reset", std::string("reset"))))
			.add_option(dpp::command_option(dpp::co_integer, "minutes", "New minutes per half (reset only)", false).set_min_value(int64_t{1}));

	// Plan
	cmds.emplace_back("generateplan", "Preview a fair substitution plan", bot_id)
			.add_option(dpp::command_option(dpp::co_string, "speed", "Rotation speed", false)
											.add_choice(dpp::command_option_choice("slow", std::string("slow")))
											.add_choice(dpp::command_option_choice("medium", std::string("medium")))
											.add_choice(dpp::command_option_choice("fast", std::string("fast"))))
			.add_option(dpp::command_option(dpp::co_boolean, "noswaps", "Never move players between positions", false))
			.add_option(dpp::command_option(dpp::co_boolean, "nobatch", "One substitution per window", false));

	cmds.emplace_back("showplan", "Show the substitution plan", bot_id);
	cmds.emplace_back("forecast", "Show predicted playing time", bot_id);
	cmds.emplace_back("replan", "Rebuild the rest of the plan from the current lineup", bot_id);
	cmds.emplace_back("pauseplan", "Stop substitution prompts", bot_id);
	cmds.emplace_back("resumeplan", "Restart substitution prompts", bot_id);

	cmds.emplace_back("acceptsub", "Make the next substitution, optionally with other players", bot_id)
			.add_option(player_option("out", "Player coming off instead", false))
			.add_option(player_option("in", "Player coming on instead", false));
	cmds.emplace_back("skipsub", "Skip the next substitution", bot_id);

	// Editor
	cmds.emplace_back("deletesub", "Delete a planned substitution", bot_id).add_option(index_option("index", "Plan line"));

	cmds.emplace_back("retimesub", "Move a substitution to another time", bot_id)
			.add_option(index_option("index", "Plan line"))
			.add_option(half_option())
			.add_option(dpp::command_option(dpp::co_integer, "minute", "Minute within the half", true).set_min_value(int64_t{0}));

	cmds.emplace_back("reassignsub", "Change who goes off and on", bot_id)
			.add_option(index_option("index", "Plan line"))
			.add_option(player_option("out", "Player coming off"))
			.add_option(player_option("in", "Player coming on"));

	cmds.emplace_back("insertsub", "Add a substitution", bot_id)
			.add_option(half_option())
			.add_option(dpp::command_option(dpp::co_integer, "minute", "Minute within the half", true).set_min_value(int64_t{0}))
			.add_option(player_option("out", "Player coming off"))
			.add_option(player_option("in", "Player coming on"));

	cmds.emplace_back("movesub", "Reorder a substitution without changing its time", bot_id)
			.add_option(index_option("from", "Plan line to move"))
			.add_option(index_option("to", "New plan line"));

	return cmds;
}

auto command_handler::reply_plan(const dpp::slashcommand_t &ev, const type::result<pitch_state> &res, std::string_view ok) -> void
{
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}
	return ui::message_builder::reply_success(ev, ok, ui::embed_builder::build_plan("Substitution plan", res->plan, res->players, ui::embed_builder::plan_status(*res)));
}

auto command_handler::reply_roster(const dpp::slashcommand_t &ev, const type::result<player> &res, std::string_view ok) -> void
{
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	auto line = std::format("{} {}", ok, res->display_name());
	auto state = pitch_svc_->state();
	if (!state) {
		return ev.reply(ui::message_builder::success(line));
	}
	return ui::message_builder::reply_success(ev, line, ui::embed_builder::build_roster(*state));
}

auto command_handler::cmd_help(const dpp::slashcommand_t &ev) -> void
{
	auto embed = ui::embed_builder::build_help();
	ev.reply(dpp::message().add_embed(embed));
}

auto command_handler::cmd_addplayer(const dpp::slashcommand_t &ev) -> void
{
	auto name = std::get<std::string>(ev.get_parameter("name"));

	std::vector<pitch_position> eligible;
	if (auto text = string_param(ev, "positions")) {
		auto parsed = parse_positions(*text);
		if (!parsed) {
			return ui::message_builder::reply_error(ev, parsed.error().what());
		}
		eligible = std::move(*parsed);
	}

	auto res = pitch_svc_->add_player(std::move(name), int_param(ev, "number"), std::move(eligible), bool_param(ev, "fillin").value_or(false));
	return reply_roster(ev, res, "Added");
}

auto command_handler::cmd_removeplayer(const dpp::slashcommand_t &ev) -> void
{
	auto ref = std::get<std::string>(ev.get_parameter("player"));
	return reply_roster(ev, pitch_svc_->remove_player(ref), "🗑️ Removed");
}

auto command_handler::cmd_lineup(const dpp::slashcommand_t &ev) -> void
{
	auto ref = std::get<std::string>(ev.get_parameter("player"));
	auto slot = int_param(ev, "slot").value_or(0);
	return reply_roster(ev, pitch_svc_->set_slot(ref, slot), slot == 0 ? "Benched" : "Placed");
}

auto command_handler::cmd_injured(const dpp::slashcommand_t &ev) -> void
{
	auto ref = std::get<std::string>(ev.get_parameter("player"));
	auto injured = bool_param(ev, "state").value_or(true);
	return reply_roster(ev, pitch_svc_->set_injured(ref, injured), injured ? "🤕 Injured:" : "Fit again:");
}

auto command_handler::cmd_roster(const dpp::slashcommand_t &ev) -> void
{
	auto state = pitch_svc_->state();
	if (!state) {
		return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
	}
	if (state->players.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_players);
	}
	return ev.reply(dpp::message().add_embed(ui::embed_builder::build_roster(*state)));
}

auto command_handler::cmd_setup(const dpp::slashcommand_t &ev) -> void
{
	auto team_size = int_param(ev, "team_size").value_or(constants::engine::default_team_size);
	auto minutes = int_param(ev, "minutes_per_half").value_or(config_.minutes_per_half);
	auto team_name = string_param(ev, "team_name").value_or("");

	if (minutes <= 0) {
		return ui::message_builder::reply_error(ev, constants::text::invalid_minutes);
	}

	auto state = pitch_svc_->setup(team_size, team_name);
	if (!state) {
		return ui::message_builder::reply_error(ev, state.error().what());
	}

	auto clock = clock_->reset(util::now(), minutes);
	if (!clock) {
		return ui::message_builder::reply_error(ev, clock.error().what());
	}

	auto line = std::format("Match set up: {}-a-side, {} minutes per half. Everyone starts on the bench, use `/lineup` to pick the team.", team_size, minutes);
	return ui::message_builder::reply_success(ev, line, ui::embed_builder::build_roster(*state));
}

auto command_handler::cmd_clock(const dpp::slashcommand_t &ev) -> void
{
	auto action = string_param(ev, "action").value_or("");
	auto now = util::now();

	type::result<match_clock_snapshot> res = std::unexpected(type::error{constants::text::unknown_command});
	if (action == "start") {
		res = clock_->start(now);
	}
	else if (action == "pause") {
		res = clock_->pause(now);
	}
	else if (action == "secondhalf") {
		res = clock_->start_second_half(now);
	}
	else if (action == "reset") {
		res = clock_->reset(now, int_param(ev, "minutes"));
	}

	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}
	return ui::message_builder::reply_success(ev, std::format("Clock: {}", action), ui::embed_builder::build_clock(*res, now));
}

auto command_handler::cmd_generateplan(const dpp::slashcommand_t &ev) -> void
{
	auto config = config_.plan_defaults;
	if (auto speed = string_param(ev, "speed")) {
		auto parsed = parse_speed(*speed);
		if (!parsed) {
			return ui::message_builder::reply_error(ev, std::format("Unknown speed '{}'", *speed));
		}
		config.speed = *parsed;
	}
	config.disable_position_swaps = bool_param(ev, "noswaps").value_or(config.disable_position_swaps);
	config.disable_batch_subs = bool_param(ev, "nobatch").value_or(config.disable_batch_subs);

	auto state = pitch_svc_->state();
	if (!state) {
		return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
	}
	const int minutes = pitch_svc_->minutes_per_half();
	config.team_size = state->team_size;
	config.half_duration_seconds = minutes * 60;

	auto draft = pitch_svc_->draft_plan(config);
	if (!draft) {
		return ui::message_builder::reply_error(ev, draft.error().what());
	}

	auto sess = session_mgr_->open({.guild_id = ev.command.guild_id,
																	.channel_id = ev.command.channel_id,
																	.owner_id = ev.command.usr.id,
																	.config = config,
																	.draft = std::move(*draft)});

	auto msg = panel_bld_->build_preview_panel(sess, state->players, minutes);
	msg.set_content(std::format("📋 Plan preview for {}, only they can start it", util::mention(sess.owner_id)));
	return ev.reply(msg);
}

auto command_handler::cmd_showplan(const dpp::slashcommand_t &ev) -> void
{
	auto state = pitch_svc_->state();
	if (!state) {
		return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
	}
	if (state->plan.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_plan);
	}

	auto msg = dpp::message().add_embed(ui::embed_builder::build_plan("Substitution plan", state->plan, state->players, ui::embed_builder::plan_status(*state)));
	if (auto pending = monitor_->current(util::now())) {
		msg.set_content(pending->is_due ? std::format("Due now: line {}", pending->index + 1)
																		: std::format("Next: line {} in {}", pending->index + 1, util::format_clock(pending->seconds_until)));
	}
	return ev.reply(msg);
}

auto command_handler::cmd_forecast(const dpp::slashcommand_t &ev) -> void
{
	auto state = pitch_svc_->state();
	if (!state) {
		return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
	}
	if (state->players.empty()) {
		return ui::message_builder::reply_error(ev, constants::text::no_players);
	}

	const int minutes = pitch_svc_->minutes_per_half();
	auto forecasts = time_forecaster::forecast_live(*state, minutes);
	return ev.reply(dpp::message().add_embed(ui::embed_builder::build_forecast(forecasts, minutes)));
}

auto command_handler::cmd_replan(const dpp::slashcommand_t &ev) -> void
{
	auto res = pitch_svc_->replan(config_.plan_defaults, util::now());
	return reply_plan(ev, res, "Remaining plan rebuilt from the current lineup");
}

auto command_handler::cmd_pauseplan(const dpp::slashcommand_t &ev, bool paused) -> void
{
	auto res = pitch_svc_->set_paused(paused);
	return reply_plan(ev, res, paused ? "Substitution prompts paused" : "Substitution prompts resumed");
}

auto command_handler::cmd_acceptsub(const dpp::slashcommand_t &ev) -> void
{
	auto now = util::now();
	auto pending = monitor_->current(now);
	if (!pending || !pending->is_due) {
		return ui::message_builder::reply_error(ev, constants::text::nothing_pending);
	}

	std::optional<substitution_override> override_players;
	auto out_ref = string_param(ev, "out");
	auto in_ref = string_param(ev, "in");
	if (out_ref || in_ref) {
		auto state = pitch_svc_->state();
		if (!state) {
			return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
		}

		substitution_override chosen{.player_out = pending->event.player_out, .player_in = pending->event.player_in};
		if (out_ref) {
			auto p = roster::resolve_player(state->players, *out_ref);
			if (!p) {
				return ui::message_builder::reply_error(ev, constants::text::player_not_found);
			}
			chosen.player_out = p->get().id;
		}
		if (in_ref) {
			auto p = roster::resolve_player(state->players, *in_ref);
			if (!p) {
				return ui::message_builder::reply_error(ev, constants::text::player_not_found);
			}
			chosen.player_in = p->get().id;
		}
		override_players = std::move(chosen);
	}

	auto res = monitor_->accept(now, pending->index, override_players);
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}
	return ev.reply(ui::message_builder::success(std::format("Substitution {}", to_string(res->outcome))));
}

auto command_handler::cmd_skipsub(const dpp::slashcommand_t &ev) -> void
{
	auto now = util::now();
	auto pending = monitor_->current(now);
	if (!pending || !pending->is_due) {
		return ui::message_builder::reply_error(ev, constants::text::nothing_pending);
	}

	if (auto res = monitor_->skip(now, pending->index); !res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}
	return ev.reply(ui::message_builder::success("Substitution skipped, remaining plan rescheduled"));
}

auto command_handler::cmd_deletesub(const dpp::slashcommand_t &ev) -> void
{
	auto index = index_param(ev, "index");
	if (!index) {
		return ui::message_builder::reply_error(ev, constants::text::index_out_of_range);
	}

	auto res = pitch_svc_->edit_plan([&](const pitch_state &st, const plan_editor &editor) { return editor.erase(st.plan, *index); });
	return reply_plan(ev, res, std::format("Deleted line {}", *index + 1));
}

auto command_handler::cmd_retimesub(const dpp::slashcommand_t &ev) -> void
{
	auto index = index_param(ev, "index");
	if (!index) {
		return ui::message_builder::reply_error(ev, constants::text::index_out_of_range);
	}
	auto half = int_param(ev, "half").value_or(1);
	auto minute = int_param(ev, "minute").value_or(0);

	auto res = pitch_svc_->edit_plan([&](const pitch_state &st, const plan_editor &editor) { return editor.retime(st.plan, *index, minute, half); });
	return reply_plan(ev, res, std::format("Line {} moved to H{} {}'", *index + 1, half, minute));
}

auto command_handler::cmd_reassignsub(const dpp::slashcommand_t &ev) -> void
{
	auto index = index_param(ev, "index");
	if (!index) {
		return ui::message_builder::reply_error(ev, constants::text::index_out_of_range);
	}
	auto out_ref = std::get<std::string>(ev.get_parameter("out"));
	auto in_ref = std::get<std::string>(ev.get_parameter("in"));

	auto res = pitch_svc_->edit_plan([&](const pitch_state &st, const plan_editor &editor) -> type::result<substitution_plan> {
		auto out = roster::resolve_player(st.players, out_ref);
		auto in = roster::resolve_player(st.players, in_ref);
		if (!out || !in) {
			return std::unexpected(type::error{constants::text::player_not_found});
		}
		return editor.reassign(st.plan, st.players, *index, out->get().id, in->get().id);
	});
	return reply_plan(ev, res, std::format("Line {} reassigned", *index + 1));
}

auto command_handler::cmd_insertsub(const dpp::slashcommand_t &ev) -> void
{
	auto half = int_param(ev, "half").value_or(1);
	auto minute = int_param(ev, "minute").value_or(0);
	auto out_ref = std::get<std::string>(ev.get_parameter("out"));
	auto in_ref = std::get<std::string>(ev.get_parameter("in"));

	auto res = pitch_svc_->edit_plan([&](const pitch_state &st, const plan_editor &editor) -> type::result<substitution_plan> {
		auto out = roster::resolve_player(st.players, out_ref);
		auto in = roster::resolve_player(st.players, in_ref);
		if (!out || !in) {
			return std::unexpected(type::error{constants::text::player_not_found});
		}
		return editor.insert(st.plan, st.players, half, minute, out->get().id, in->get().id);
	});
	return reply_plan(ev, res, std::format("Substitution added at H{} {}'", half, minute));
}

auto command_handler::cmd_movesub(const dpp::slashcommand_t &ev) -> void
{
	auto from = index_param(ev, "from");
	auto to = index_param(ev, "to");
	if (!from || !to) {
		return ui::message_builder::reply_error(ev, constants::text::index_out_of_range);
	}

	auto res = pitch_svc_->edit_plan([&](const pitch_state &st, const plan_editor &editor) { return editor.reorder(st.plan, *from, *to); });
	return reply_plan(ev, res, std::format("Line {} moved to line {}", *from + 1, *to + 1));
}

} // namespace pitchside
