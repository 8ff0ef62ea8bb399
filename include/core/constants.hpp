#pragma once

#include <chrono>
#include <string_view>

namespace pitchside::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "Unknown command";
inline constexpr std::string_view unsupported_button = "Unsupported button";
inline constexpr std::string_view panel_expired = "This panel has expired";
inline constexpr std::string_view panel_owner_only = "Only the panel owner can use this panel";
inline constexpr std::string_view player_not_found = "Player not found";
inline constexpr std::string_view player_exists = "A player with that id already exists";
inline constexpr std::string_view no_players = "No players on the roster yet";
inline constexpr std::string_view no_pitch_state = "No match set up yet, use `/setup` first";
inline constexpr std::string_view no_plan = "No substitution plan, use `/generateplan` first";
inline constexpr std::string_view not_enough_players = "You need a full team on the pitch and at least one player on the bench";
inline constexpr std::string_view index_out_of_range = "Substitution index out of range";
inline constexpr std::string_view executed_immutable = "Executed substitutions cannot be edited";
inline constexpr std::string_view crosses_executed = "Cannot move a substitution across an executed one";
inline constexpr std::string_view invalid_half = "Half must be 1 or 2";
inline constexpr std::string_view invalid_minute = "Minute is outside the half";
inline constexpr std::string_view same_player = "Player out and player in must differ";
inline constexpr std::string_view out_not_on_pitch = "That player is not on the pitch at that time";
inline constexpr std::string_view in_not_on_bench = "That player is not available on the bench at that time";
inline constexpr std::string_view invalid_team_size = "Team size must be 4, 7, 9 or 11";
inline constexpr std::string_view invalid_minutes = "Minutes per half must be positive";
inline constexpr std::string_view invalid_slot = "Slot is outside the formation";
inline constexpr std::string_view no_clock = "The match clock has not been set up";
inline constexpr std::string_view nothing_pending = "That substitution is no longer pending";
inline constexpr std::string_view not_due_yet = "That substitution is not due yet";
inline constexpr std::string_view match_over = "The match is over, reset the clock first";
inline constexpr std::string_view clock_not_running = "The match clock is not running";
inline constexpr std::string_view plan_paused = "The substitution plan is paused";
inline constexpr std::string_view plan_not_paused = "The substitution plan is not paused";
inline constexpr std::string_view plan_started = "Substitution plan started";
inline constexpr std::string_view player_in_plan = "That player is part of the pending substitution plan";
inline constexpr std::string_view empty_name = "Player name cannot be empty";
inline constexpr std::string_view plan_stale = "The plan no longer matches the lineup, generate a new one";
inline constexpr std::string_view full_time = "Full time, the substitution plan is complete";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
inline constexpr std::string_view sub_icon = "🔄 ";
inline constexpr std::string_view whistle = "🏁 ";
} // namespace text

// File paths
namespace files {
inline constexpr std::string_view bot_token_file = ".bot_token";
inline constexpr std::string_view config_file = "pitchside.json";
inline constexpr std::string_view pitch_state_file = "pitch_state.json";
inline constexpr std::string_view clock_file = "match_clock.json";
} // namespace files

// Engine tuning
namespace engine {
inline constexpr int min_window_gap_seconds = 45;
inline constexpr int late_threshold_seconds = 30;
inline constexpr int min_rebalance_interval_seconds = 60;
inline constexpr int replan_spacing_seconds = 120;
inline constexpr int default_minutes_per_half = 20;
inline constexpr int default_team_size = 7;
inline constexpr std::chrono::seconds snooze_duration{60};
inline constexpr std::chrono::seconds poll_interval{2};
} // namespace engine

// Limits
namespace limits {
inline constexpr std::size_t max_embed_lines = 40;
inline constexpr std::size_t max_recent_sessions = 8;
} // namespace limits

} // namespace pitchside::constants
