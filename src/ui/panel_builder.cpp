#include "core/config.hpp"
#include "core/constants.hpp"
#include "services/time_forecaster.hpp"
#include "ui/embed_builder.hpp"
#include "ui/panel_builder.hpp"

#include <format>

namespace pitchside {

auto panel_builder::create_button(std::string_view label, dpp::component_style style, std::string id) const -> dpp::component
{
	return dpp::component().set_type(dpp::cot_button).set_style(style).set_label(std::string{label}).set_id(std::move(id));
}

auto panel_builder::build_preview_panel(const preview_session &sess, std::span<const player> roster, int minutes_per_half) const -> dpp::message
{
	dpp::message msg;

	auto options = std::format("{} rotation{}{}", to_string(sess.config.speed), sess.config.disable_position_swaps ? ", no position swaps" : "",
														 sess.config.disable_batch_subs ? ", one sub per window" : "");
	msg.add_embed(ui::embed_builder::build_plan("Substitution plan preview", sess.draft, roster, options));

	auto forecasts = time_forecaster::forecast(roster, sess.draft, minutes_per_half);
	auto ideal = plan_generator::ideal_seconds_per_player(roster, sess.config.team_size, sess.config.half_duration_seconds);
	auto forecast = ui::embed_builder::build_forecast(forecasts, minutes_per_half);
	forecast.set_description(std::format("Ideal share: **{}** per player\n\n{}", util::format_clock(ideal), forecast.description));
	msg.add_embed(forecast);

	dpp::component row;
	row.add_component(create_button("Start", dpp::cos_success, std::format("panel:{}:start", sess.panel_id)).set_disabled(sess.draft.empty()));
	row.add_component(create_button("Regenerate", dpp::cos_primary, std::format("panel:{}:regen", sess.panel_id)));
	row.add_component(create_button("Close", dpp::cos_danger, std::format("panel:{}:close", sess.panel_id)));
	msg.add_component(row);

	return msg;
}

auto panel_builder::build_sub_controls() const -> dpp::component
{
	dpp::component row;
	row.add_component(create_button("Accept", dpp::cos_success, "sub:accept"));
	row.add_component(create_button("Skip", dpp::cos_secondary, "sub:skip"));
	row.add_component(create_button("Snooze", dpp::cos_secondary, "sub:snooze"));
	return row;
}

} // namespace pitchside
