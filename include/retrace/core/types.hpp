#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace retrace::core {

using Json = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Identifiers are opaque strings; ids that end up as directory names are
// checked with checkpoint::is_valid_id before they touch the filesystem
using SessionId = std::string;
using ProjectId = std::string;
using CheckpointId = std::string;
using ContentHash = std::string;  // lowercase hex SHA-256

// Author of a transcript line
enum class Role { System, User, Assistant, Tool, Unknown };

inline Role role_from_string(std::string_view name) {
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    if (name == "system") return Role::System;
    return Role::Unknown;
}

// Persisted timestamps are whole milliseconds since the Unix epoch
inline int64_t to_epoch_ms(TimePoint at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace retrace::core
