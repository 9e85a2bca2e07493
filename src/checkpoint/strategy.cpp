#include "retrace/checkpoint/strategy.hpp"

#include <algorithm>

namespace retrace::checkpoint {

std::string_view strategy_to_string(CheckpointStrategy strategy) {
    switch (strategy) {
        case CheckpointStrategy::Manual: return "manual";
        case CheckpointStrategy::PerPrompt: return "per_prompt";
        case CheckpointStrategy::PerToolUse: return "per_tool_use";
        case CheckpointStrategy::Smart: return "smart";
    }
    return "manual";
}

Result<CheckpointStrategy, Error> strategy_from_string(std::string_view str) {
    if (str == "manual") return Result<CheckpointStrategy, Error>::ok(CheckpointStrategy::Manual);
    if (str == "per_prompt") return Result<CheckpointStrategy, Error>::ok(CheckpointStrategy::PerPrompt);
    if (str == "per_tool_use") return Result<CheckpointStrategy, Error>::ok(CheckpointStrategy::PerToolUse);
    if (str == "smart") return Result<CheckpointStrategy, Error>::ok(CheckpointStrategy::Smart);

    return Result<CheckpointStrategy, Error>::err(
        ErrorCode::InvalidArgument,
        "Invalid checkpoint strategy",
        std::string(str)
    );
}

std::string_view trigger_reason_to_string(TriggerReason reason) {
    switch (reason) {
        case TriggerReason::None: return "none";
        case TriggerReason::UserPrompt: return "user_prompt";
        case TriggerReason::ToolCompleted: return "tool_completed";
        case TriggerReason::MessageCount: return "message_count";
        case TriggerReason::FileCount: return "file_count";
        case TriggerReason::Elapsed: return "elapsed";
    }
    return "none";
}

namespace {

// A successful result for a mutating tool, tracked earlier or requested in
// the same line
bool completes_mutation(const TranscriptEntry& candidate, const TriggerContext& ctx) {
    for (const auto& result : candidate.tool_results) {
        if (result.is_error) continue;

        if (ctx.pending_mutations && ctx.pending_mutations->count(result.tool_use_id)) {
            return true;
        }
        bool same_line = std::any_of(candidate.tool_uses.begin(), candidate.tool_uses.end(),
            [&](const ToolUse& u) { return u.mutating && u.id == result.tool_use_id; });
        if (same_line) {
            return true;
        }
    }
    return false;
}

size_t touched_files(const TranscriptEntry& candidate, const TriggerContext& ctx) {
    std::set<std::string> files;
    if (ctx.files_modified) {
        files = *ctx.files_modified;
    }
    for (const auto& use : candidate.tool_uses) {
        if (!use.mutating) continue;
        files.insert(use.file_paths.begin(), use.file_paths.end());
    }
    return files.size();
}

}  // namespace

TriggerReason evaluate_trigger(CheckpointStrategy strategy,
                               const TranscriptEntry& candidate,
                               const TriggerContext& ctx,
                               const SmartThresholds& thresholds) {
    switch (strategy) {
        case CheckpointStrategy::Manual:
            return TriggerReason::None;

        case CheckpointStrategy::PerPrompt:
            if (candidate.is_user_prompt() && ctx.buffered_messages > 0) {
                return TriggerReason::UserPrompt;
            }
            return TriggerReason::None;

        case CheckpointStrategy::PerToolUse:
            return completes_mutation(candidate, ctx) ? TriggerReason::ToolCompleted
                                                      : TriggerReason::None;

        case CheckpointStrategy::Smart:
            if (ctx.buffered_messages >= thresholds.message_count) {
                return TriggerReason::MessageCount;
            }
            if (touched_files(candidate, ctx) > thresholds.file_count) {
                return TriggerReason::FileCount;
            }
            if (ctx.now - ctx.last_checkpoint_at > thresholds.interval) {
                return TriggerReason::Elapsed;
            }
            return TriggerReason::None;
    }
    return TriggerReason::None;
}

}  // namespace retrace::checkpoint
