#include "retrace/checkpoint/transcript.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace retrace::checkpoint {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> extract_paths(const Json& input) {
    std::vector<std::string> paths;
    if (!input.is_object()) {
        return paths;
    }
    for (const char* key : {"file_path", "notebook_path", "path"}) {
        auto it = input.find(key);
        if (it != input.end() && it->is_string()) {
            std::string p = it->get<std::string>();
            if (!p.empty() && std::find(paths.begin(), paths.end(), p) == paths.end()) {
                paths.push_back(std::move(p));
            }
        }
    }
    return paths;
}

ToolUse make_tool_use(std::string id, std::string name, const Json& input) {
    ToolUse use;
    use.id = std::move(id);
    use.name = std::move(name);
    use.mutating = is_mutating_tool(use.name);
    if (use.mutating) {
        use.file_paths = extract_paths(input);
    }
    return use;
}

void read_content(const Json& content, TranscriptEntry& entry) {
    if (content.is_string()) {
        entry.text = content.get<std::string>();
        return;
    }
    if (!content.is_array()) {
        return;
    }

    for (const auto& block : content) {
        if (!block.is_object()) continue;
        std::string type = block.value("type", "");

        if (type == "text") {
            if (!entry.text.empty()) entry.text += "\n";
            entry.text += block.value("text", "");
        } else if (type == "tool_use") {
            entry.tool_uses.push_back(make_tool_use(
                block.value("id", ""),
                block.value("name", ""),
                block.value("input", Json::object())));
        } else if (type == "tool_result") {
            entry.tool_results.push_back(ToolResultRef{
                block.value("tool_use_id", ""),
                block.value("is_error", false)
            });
        }
    }
}

void read_usage(const Json& usage, TranscriptEntry& entry) {
    if (!usage.is_object()) return;
    entry.input_tokens += usage.value("input_tokens", int64_t{0});
    entry.output_tokens += usage.value("output_tokens", int64_t{0});
}

}  // namespace

bool is_mutating_tool(std::string_view name) {
    static constexpr std::array<std::string_view, 7> mutating = {
        "write", "edit", "multiedit", "notebookedit", "bash", "file_write", "file_edit"
    };
    std::string lowered = to_lower(name);
    return std::find(mutating.begin(), mutating.end(), lowered) != mutating.end();
}

bool TranscriptEntry::has_mutating_tool_use() const {
    return std::any_of(tool_uses.begin(), tool_uses.end(),
        [](const ToolUse& u) { return u.mutating; });
}

TranscriptEntry parse_transcript_line(std::string_view line) {
    TranscriptEntry entry;

    Json j = Json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return entry;
    }
    entry.parsed = true;
    entry.is_meta = j.value("isMeta", false);

    const Json* message = &j;
    auto msg_it = j.find("message");
    if (msg_it != j.end() && msg_it->is_object()) {
        message = &*msg_it;
    }

    if (message->contains("role") && (*message)["role"].is_string()) {
        entry.role = role_from_string((*message)["role"].get<std::string>());
    } else if (j.contains("type") && j["type"].is_string()) {
        entry.role = role_from_string(j["type"].get<std::string>());
    }

    if (message->contains("content")) {
        read_content((*message)["content"], entry);
    }

    if (message->contains("model") && (*message)["model"].is_string()) {
        entry.model = (*message)["model"].get<std::string>();
    }

    if (message->contains("usage")) {
        read_usage((*message)["usage"], entry);
    } else if (message != &j && j.contains("usage")) {
        read_usage(j["usage"], entry);
    }

    // Flat message format: tool_calls on assistant, tool_call_id on results
    if (message->contains("tool_calls") && (*message)["tool_calls"].is_array()) {
        for (const auto& tc : (*message)["tool_calls"]) {
            if (!tc.is_object()) continue;
            entry.tool_uses.push_back(make_tool_use(
                tc.value("id", ""),
                tc.value("name", ""),
                tc.value("arguments", Json::object())));
        }
    }
    if (message->contains("tool_call_id") && (*message)["tool_call_id"].is_string()) {
        bool failed = message->contains("success") && (*message)["success"].is_boolean() &&
                      !(*message)["success"].get<bool>();
        entry.tool_results.push_back(ToolResultRef{
            (*message)["tool_call_id"].get<std::string>(),
            failed
        });
    }

    return entry;
}

}  // namespace retrace::checkpoint
