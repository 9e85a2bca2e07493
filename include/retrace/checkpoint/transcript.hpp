#pragma once

#include "retrace/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;

// A tool invocation requested by the assistant
struct ToolUse {
    std::string id;
    std::string name;
    std::vector<std::string> file_paths;  // paths named in the tool input
    bool mutating = false;
};

// A tool result reported back in a later message
struct ToolResultRef {
    std::string tool_use_id;
    bool is_error = false;
};

// One parsed transcript line.
//
// Accepts the JSONL records written by the coding agent
// ({"type": "...", "message": {"role", "content", "model", "usage"}}) as well
// as flat messages ({"role", "content", "tool_calls", "tool_call_id"}).
// Lines that are not JSON objects yield parsed == false.
struct TranscriptEntry {
    bool parsed = false;
    Role role = Role::Unknown;
    bool is_meta = false;
    std::string text;
    std::vector<ToolUse> tool_uses;
    std::vector<ToolResultRef> tool_results;
    std::optional<std::string> model;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;

    // A prompt typed by the user, as opposed to a tool result echoed back
    bool is_user_prompt() const {
        return parsed && role == Role::User && !is_meta && tool_results.empty();
    }

    bool has_mutating_tool_use() const;
    int64_t total_tokens() const { return input_tokens + output_tokens; }
};

TranscriptEntry parse_transcript_line(std::string_view line);

// Write, Edit, MultiEdit, NotebookEdit, Bash and their snake_case aliases
bool is_mutating_tool(std::string_view name);

}  // namespace retrace::checkpoint
