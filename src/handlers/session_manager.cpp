#include "handlers/session_manager.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <vector>

namespace pitchside {

auto session_manager::generate_token() -> std::string
{
	static std::mt19937_64 rng{std::random_device{}()};
	std::uniform_int_distribution<uint64_t> dist;
	return std::format("{:016x}", dist(rng));
}

auto session_manager::open(preview_session session) -> preview_session
{
	std::scoped_lock lock{mutex_};

	do {
		session.panel_id = generate_token();
	} while (sessions_.contains(session.panel_id));
	session.last_used = std::chrono::steady_clock::now();

	sessions_.insert_or_assign(session.panel_id, session);
	evict();
	return session;
}

auto session_manager::find(std::string_view id) -> std::optional<preview_session>
{
	std::scoped_lock lock{mutex_};

	auto it = sessions_.find(std::string{id});
	if (it == sessions_.end()) {
		return std::nullopt;
	}
	it->second.last_used = std::chrono::steady_clock::now();
	return it->second;
}

auto session_manager::claim(std::string_view id, dpp::snowflake user) -> type::result<preview_session>
{
	auto sess = find(id);
	if (!sess) {
		return std::unexpected(type::error{constants::text::panel_expired});
	}
	if (sess->owner_id != user) {
		return std::unexpected(type::error{constants::text::panel_owner_only});
	}
	return *sess;
}

auto session_manager::replace_draft(std::string_view id, substitution_plan draft) -> type::result<preview_session>
{
	std::scoped_lock lock{mutex_};

	auto it = sessions_.find(std::string{id});
	if (it == sessions_.end()) {
		return std::unexpected(type::error{constants::text::panel_expired});
	}
	it->second.draft = std::move(draft);
	it->second.last_used = std::chrono::steady_clock::now();
	return it->second;
}

auto session_manager::close(std::string_view id) -> void
{
	std::scoped_lock lock{mutex_};
	sessions_.erase(std::string{id});
}

auto session_manager::size() -> std::size_t
{
	std::scoped_lock lock{mutex_};
	return sessions_.size();
}

auto session_manager::evict() -> void
{
	while (sessions_.size() > capacity_) {
		auto oldest = std::ranges::min_element(sessions_, {}, [](const auto &entry) { return entry.second.last_used; });
		sessions_.erase(oldest);
	}
}

} // namespace pitchside
