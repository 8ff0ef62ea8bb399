#include "core/constants.hpp"
#include "handlers/interaction_handler.hpp"
#include "ui/embed_builder.hpp"
#include "ui/message_builder.hpp"

#include <format>

namespace pitchside {

interaction_handler::interaction_handler(std::shared_ptr<pitch_service> pitch_svc, std::shared_ptr<live_monitor> monitor,
																				 std::shared_ptr<session_manager> session_mgr, std::shared_ptr<panel_builder> panel_bld)
		: pitch_svc_(std::move(pitch_svc)), monitor_(std::move(monitor)), session_mgr_(std::move(session_mgr)), panel_bld_(std::move(panel_bld))
{
}

auto interaction_handler::parse_custom_id(std::string_view custom_id) -> std::optional<panel_action>
{
	constexpr std::string_view prefix = "panel:";
	if (!custom_id.starts_with(prefix)) {
		return std::nullopt;
	}

	auto rest = custom_id.substr(prefix.size());
	auto colon = rest.rfind(':');
	if (colon == std::string_view::npos || colon == 0) {
		return std::nullopt;
	}
	return panel_action{.panel_id = std::string{rest.substr(0, colon)}, .action = std::string{rest.substr(colon + 1)}};
}

auto interaction_handler::on_button(const dpp::button_click_t &ev) -> void
{
	std::string_view custom_id = ev.custom_id;
	if (custom_id.starts_with("sub:")) {
		return handle_sub(ev, custom_id.substr(4));
	}

	auto parsed = parse_custom_id(custom_id);
	if (!parsed) {
		return ui::message_builder::reply_error(ev, constants::text::unsupported_button);
	}

	auto sess = session_mgr_->claim(parsed->panel_id, ev.command.usr.id);
	if (!sess) {
		return ui::message_builder::reply_error(ev, sess.error().what());
	}

	if (parsed->action == "start") {
		return handle_start(ev, *sess);
	}
	if (parsed->action == "regen") {
		return handle_regen(ev, *sess);
	}
	if (parsed->action == "close") {
		session_mgr_->close(sess->panel_id);
		return ev.reply(dpp::ir_update_message, dpp::message("Plan preview closed"));
	}
	ui::message_builder::reply_error(ev, constants::text::unsupported_button);
}

auto interaction_handler::handle_start(const dpp::button_click_t &ev, const preview_session &sess) -> void
{
	auto res = pitch_svc_->start_plan(sess.draft, util::now());
	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}
	session_mgr_->close(sess.panel_id);

	auto msg = dpp::message().add_embed(ui::embed_builder::build_plan("Substitution plan", res->plan, res->players, ui::embed_builder::plan_status(*res)));
	msg.set_content(std::format("{}{} by {}", constants::text::ok_prefix, constants::text::plan_started, util::mention(ev.command.usr.id)));
	return ev.reply(dpp::ir_update_message, msg);
}

auto interaction_handler::handle_regen(const dpp::button_click_t &ev, const preview_session &sess) -> void
{
	auto state = pitch_svc_->state();
	if (!state) {
		return ui::message_builder::reply_error(ev, constants::text::no_pitch_state);
	}

	auto draft = pitch_svc_->draft_plan(sess.config);
	if (!draft) {
		return ui::message_builder::reply_error(ev, draft.error().what());
	}

	auto updated = session_mgr_->replace_draft(sess.panel_id, std::move(*draft));
	if (!updated) {
		return ui::message_builder::reply_error(ev, updated.error().what());
	}

	auto msg = panel_bld_->build_preview_panel(*updated, state->players, pitch_svc_->minutes_per_half());
	msg.set_content(std::format("📋 Plan preview for {}, regenerated from the current lineup", util::mention(updated->owner_id)));
	return ev.reply(dpp::ir_update_message, msg);
}

auto interaction_handler::handle_sub(const dpp::button_click_t &ev, std::string_view action) -> void
{
	auto now = util::now();

	if (action == "snooze") {
		monitor_->snooze(now);
		return ev.reply(ui::message_builder::success("Substitution prompts snoozed").set_flags(dpp::m_ephemeral));
	}

	auto pending = monitor_->current(now);
	if (!pending || !pending->is_due) {
		return ui::message_builder::reply_error(ev, constants::text::nothing_pending);
	}

	type::result<substitution_record> res = std::unexpected(type::error{constants::text::unsupported_button});
	if (action == "accept") {
		res = monitor_->accept(now, pending->index);
	}
	else if (action == "skip") {
		res = monitor_->skip(now, pending->index);
	}

	if (!res) {
		return ui::message_builder::reply_error(ev, res.error().what());
	}

	// Drop the buttons so the notice cannot be acted on twice.
	auto msg = dpp::message(std::format("{}\n{}Substitution {} by {}", ev.command.msg.content, constants::text::sub_icon, to_string(res->outcome),
																			util::mention(ev.command.usr.id)));
	return ev.reply(dpp::ir_update_message, msg);
}

} // namespace pitchside
