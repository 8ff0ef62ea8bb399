#pragma once

#include <dpp/dpp.h>

#include <cassert>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pitchside {

namespace type {
// Wall clock instants as stored in the clock and substitution records.
using timestamp = std::chrono::sys_seconds;

// A user-facing failure; the message is shown verbatim in replies and notices.
struct error {
	std::string message;

	constexpr error() = default;
	constexpr error(std::string_view sv) : message(sv) {}

	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};

using ok_t = std::monostate;

template <typename T>
using result = std::expected<T, error>;

// Engine log hook; main wires it to dpp::cluster::log.
using log_sink = std::function<void(dpp::loglevel, std::string_view)>;
} // namespace type

namespace util {
[[nodiscard]] constexpr auto id_to_u64(const dpp::snowflake &id) noexcept -> std::uint64_t
{
	return static_cast<std::uint64_t>(id);
}

[[nodiscard]] inline auto mention(const dpp::snowflake &id) -> std::string { return std::format("<@{}>", id_to_u64(id)); }

// Current wall clock truncated to the resolution the clock snapshots use.
[[nodiscard]] inline auto now() -> type::timestamp { return std::chrono::time_point_cast<type::timestamp::duration>(std::chrono::system_clock::now()); }

// "mm:ss" for a number of seconds.
[[nodiscard]] inline auto format_clock(int seconds) -> std::string
{
	if (seconds < 0) {
		seconds = 0;
	}
	return std::format("{:02}:{:02}", seconds / 60, seconds % 60);
}

// Logs through the sink if one is set.
inline auto log(const type::log_sink &sink, dpp::loglevel level, std::string_view msg) -> void
{
	if (sink) {
		sink(level, msg);
	}
}

// Narrowing for counts that are bounded by the roster size; asserts in debug builds.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow(From v)
{
	if (!std::in_range<To>(v)) {
		assert(!"narrow(): value out of range");
	}

	return static_cast<To>(v);
}

} // namespace util

} // namespace pitchside
