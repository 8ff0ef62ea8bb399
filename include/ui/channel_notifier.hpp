#pragma once

#include "services/match_store.hpp"
#include "ui/panel_builder.hpp"
#include <dpp/dpp.h>

#include <memory>

namespace pitchside::ui {

// Posts monitor notices to the match channel. Without a channel they only reach the log.
class channel_notifier : public operator_notifier {
public:
	channel_notifier(dpp::cluster &bot, dpp::snowflake channel_id, std::shared_ptr<panel_builder> panel_bld);

	auto notify(notice_kind kind, std::string_view detail) -> void override;

private:
	dpp::cluster &bot_;
	dpp::snowflake channel_id_;
	std::shared_ptr<panel_builder> panel_bld_;

	[[nodiscard]] static auto headline(notice_kind kind) -> std::string_view;
};

} // namespace pitchside::ui
