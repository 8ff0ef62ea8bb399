#include "core/constants.hpp"
#include "ui/channel_notifier.hpp"

#include <format>

namespace pitchside::ui {

channel_notifier::channel_notifier(dpp::cluster &bot, dpp::snowflake channel_id, std::shared_ptr<panel_builder> panel_bld)
		: bot_{bot}, channel_id_{channel_id}, panel_bld_{std::move(panel_bld)}
{
}

auto channel_notifier::headline(notice_kind kind) -> std::string_view
{
	switch (kind) {
	case notice_kind::pending:
		return "🔔 **Substitution due**";
	case notice_kind::executed:
		return "🔄 **Substitution made**";
	case notice_kind::skipped:
		return "⏭️ **Substitution skipped**";
	case notice_kind::inconsistent:
		return "⚠️ **Lineup mismatch**";
	case notice_kind::replanned:
		return "🗓️ **Plan rebuilt**";
	case notice_kind::finished:
		return "🏁 **Full time**";
	case notice_kind::error:
		return "❌ **Error**";
	}
	return "";
}

auto channel_notifier::notify(notice_kind kind, std::string_view detail) -> void
{
	bot_.log(kind == notice_kind::error ? dpp::ll_error : dpp::ll_info, std::format("[{}] {}", to_string(kind), detail));

	if (util::id_to_u64(channel_id_) == 0) {
		return;
	}

	dpp::message msg{channel_id_, std::format("{}\n{}", headline(kind), detail)};
	if (kind == notice_kind::pending) {
		msg.add_component(panel_bld_->build_sub_controls());
	}

	bot_.message_create(msg, [this](const dpp::confirmation_callback_t &cb) {
		if (cb.is_error()) {
			bot_.log(dpp::ll_error, std::format("Cannot post notice: {}", cb.get_error().message));
		}
	});
}

} // namespace pitchside::ui
