#pragma once

#include "core/utils.hpp"
#include "models/match_state.hpp"

#include <functional>
#include <optional>
#include <string_view>

namespace pitchside {

class clock_source {
public:
	virtual ~clock_source() = default;

	// nullopt when no match clock exists yet.
	[[nodiscard]] virtual auto read_clock() -> std::optional<match_clock_snapshot> = 0;
};

class pitch_state_store {
public:
	using change_listener = std::function<void()>;

	virtual ~pitch_state_store() = default;

	[[nodiscard]] virtual auto read_pitch_state() -> std::optional<pitch_state> = 0;
	[[nodiscard]] virtual auto write_pitch_state(const pitch_state &state) -> type::result<type::ok_t> = 0;

	// Fired after every successful write, whoever wrote.
	virtual auto on_external_change(change_listener listener) -> void = 0;
};

enum class notice_kind { pending, executed, skipped, inconsistent, replanned, finished, error };

[[nodiscard]] constexpr auto to_string(notice_kind k) -> std::string_view
{
	switch (k) {
	case notice_kind::pending:
		return "pending";
	case notice_kind::executed:
		return "executed";
	case notice_kind::skipped:
		return "skipped";
	case notice_kind::inconsistent:
		return "inconsistent";
	case notice_kind::replanned:
		return "replanned";
	case notice_kind::finished:
		return "finished";
	case notice_kind::error:
		return "error";
	}
	return "?";
}

class operator_notifier {
public:
	virtual ~operator_notifier() = default;

	virtual auto notify(notice_kind kind, std::string_view detail) -> void = 0;
};

} // namespace pitchside
