#include "core/constants.hpp"
#include "models/roster.hpp"
#include "ui/embed_builder.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace pitchside::ui {

auto embed_builder::build_help() -> dpp::embed
{
	dpp::embed e;
	e.set_title("Commands / Help");

	e.add_field("Roster",
							"• `/addplayer <name> [number] [positions] [fillin]` add a player (positions like `DEF,MID`)\n"
							"• `/removeplayer <player>` remove a player\n"
							"• `/lineup <player> <slot>` put a player in a formation slot, `0` for the bench\n"
							"• `/injured <player> <state>` mark or clear an injury\n"
							"• `/roster` show pitch and bench",
							false);

	e.add_field("Match",
							"• `/setup <team_size> <minutes_per_half> [team_name]` start a new match\n"
							"• `/clock <start|pause|secondhalf|reset>` control the match clock",
							false);

	e.add_field("Substitution plan",
							"• `/generateplan [speed] [noswaps] [nobatch]` open a preview, then press **Start**\n"
							"• `/showplan` and `/forecast` show the plan and predicted minutes\n"
							"• `/replan` rebuild the rest of the plan from the current lineup\n"
							"• `/pauseplan` and `/resumeplan` stop or restart substitution prompts\n"
							"• `/acceptsub [out] [in]` and `/skipsub` act on the due substitution",
							false);

	e.add_field("Editing",
							"• `/deletesub <index>`\n"
							"• `/retimesub <index> <half> <minute>`\n"
							"• `/reassignsub <index> <out> <in>`\n"
							"• `/insertsub <half> <minute> <out> <in>`\n"
							"• `/movesub <from> <to>`",
							false);

	e.set_footer(dpp::embed_footer().set_text("Players can be named by id, name or jersey number"));
	return e;
}

auto embed_builder::format_player(const player &p) -> std::string
{
	auto text = p.number ? std::format("**{}** #{}", p.display_name(), *p.number) : std::format("**{}**", p.display_name());

	if (!p.eligible_positions.empty()) {
		auto labels = p.eligible_positions | std::views::transform([](pitch_position pos) { return std::string(to_string(pos)); });
		std::string joined;
		for (const auto &label : labels) {
			joined += joined.empty() ? label : "/" + label;
		}
		text += std::format(" [{}]", joined);
	}
	if (p.fill_in) {
		text += " (fill-in)";
	}
	if (p.injured) {
		text += " 🤕";
	}
	text += std::format(" · {} played", util::format_clock(p.seconds_played));
	return text;
}

auto embed_builder::build_roster(const pitch_state &state) -> dpp::embed
{
	dpp::embed e;
	e.set_title(state.team_name.empty() ? std::format("{}-a-side", state.team_size) : std::format("{} ({}-a-side)", state.team_name, state.team_size));

	auto pitch = roster::on_field(state.players);
	std::ranges::stable_sort(pitch, {}, &player::current_pitch_position);

	std::string on_pitch;
	for (const auto &p : pitch) {
		auto label = p.current_pitch_position ? to_string(*p.current_pitch_position) : std::string_view{"?"};
		on_pitch += std::format("`{:<3}` {}\n", label, format_player(p));
	}

	std::string bench;
	for (const auto &p : roster::on_bench(state.players)) {
		bench += std::format("• {}\n", format_player(p));
	}

	e.add_field(std::format("On the pitch ({}/{})", pitch.size(), state.team_size), on_pitch.empty() ? "*nobody*" : on_pitch, false);
	e.add_field("Bench", bench.empty() ? "*nobody*" : bench, false);
	return e;
}

auto embed_builder::format_event(const substitution_event &ev, std::span<const player> players) -> std::string
{
	auto text = std::format("H{} {} {} on, {} off", ev.half, util::format_clock(ev.time), roster::name_of(players, ev.player_in), roster::name_of(players, ev.player_out));
	if (ev.swap) {
		text += std::format(" ({} {}→{})", roster::name_of(players, ev.swap->player_id), to_string(ev.swap->from), to_string(ev.swap->to));
	}
	return ev.executed ? std::format("~~{}~~ ✓", text) : text;
}

auto embed_builder::build_plan(std::string_view title, std::span<const substitution_event> plan, std::span<const player> players, std::string_view status)
		-> dpp::embed
{
	dpp::embed e;
	e.set_title(std::string{title});

	std::string desc = std::format("Status: **{}**\n\n", status);
	if (plan.empty()) {
		desc += "*No substitutions needed*";
	}

	for (std::size_t i = 0; i < plan.size(); ++i) {
		if (i == constants::limits::max_embed_lines) {
			desc += std::format("… and {} more\n", plan.size() - i);
			break;
		}
		desc += std::format("`{:>2}` {}{}\n", i + 1, constants::text::sub_icon, format_event(plan[i], players));
	}

	e.set_description(desc);
	return e;
}

auto embed_builder::build_forecast(std::span<const player_forecast> forecasts, int minutes_per_half) -> dpp::embed
{
	dpp::embed e;
	e.set_title(std::format("Predicted playing time ({} min match)", minutes_per_half * 2));

	std::string desc;
	for (const auto &f : forecasts) {
		desc += std::format("{} **{}**: {} min ({}%)\n", f.starts_on_pitch ? "🟢" : "⚪", f.who.display_name(), f.predicted_minutes, f.percentage_of_game);
	}
	e.set_description(desc.empty() ? std::string{constants::text::no_players} : desc);

	e.set_footer(dpp::embed_footer().set_text(std::format("Outfield spread: {} min", time_forecaster::fairness_spread(forecasts))));
	return e;
}

auto embed_builder::build_clock(const match_clock_snapshot &clock, type::timestamp now) -> dpp::embed
{
	dpp::embed e;
	e.set_title("Match clock");

	std::string_view state = clock.is_finished(now) ? "Full time" : clock.is_running ? "Running" : "Paused";
	e.set_description(std::format("**H{}** {} / {}:00 · {}", clock.current_half, util::format_clock(clock.half_seconds(now)), clock.minutes_per_half, state));
	return e;
}

auto embed_builder::plan_status(const pitch_state &state) -> std::string_view
{
	if (state.plan.empty()) {
		return "no plan";
	}
	if (!state.has_pending()) {
		return "complete";
	}
	if (state.plan_paused) {
		return "paused";
	}
	return state.plan_active ? "active" : "inactive";
}

} // namespace pitchside::ui
