#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/substitution.hpp"
#include "services/plan_generator.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pitchside {

// A plan preview waiting for its owner to start, regenerate or close it.
struct preview_session {
	std::string panel_id{};
	dpp::snowflake guild_id{};
	dpp::snowflake channel_id{};
	dpp::snowflake owner_id{};

	plan_generator::generation_config config{};
	substitution_plan draft{};

	std::chrono::steady_clock::time_point last_used{std::chrono::steady_clock::now()};
};

// Open previews keyed by panel id. Callers get copies; changes go back through replace_draft.
class session_manager {
public:
	explicit session_manager(std::size_t capacity = constants::limits::max_recent_sessions) : capacity_{capacity} {}

	// Stores the preview under a fresh panel id and returns it with the id filled in.
	[[nodiscard]] auto open(preview_session session) -> preview_session;

	[[nodiscard]] auto find(std::string_view id) -> std::optional<preview_session>;

	// The preview, if it still exists and belongs to `user`.
	[[nodiscard]] auto claim(std::string_view id, dpp::snowflake user) -> type::result<preview_session>;

	[[nodiscard]] auto replace_draft(std::string_view id, substitution_plan draft) -> type::result<preview_session>;

	auto close(std::string_view id) -> void;

	[[nodiscard]] auto size() -> std::size_t;

private:
	std::size_t capacity_;
	std::mutex mutex_;
	std::unordered_map<std::string, preview_session> sessions_;

	[[nodiscard]] static auto generate_token() -> std::string;

	// Drops the least recently used previews beyond capacity; caller holds the lock.
	auto evict() -> void;
};

} // namespace pitchside
