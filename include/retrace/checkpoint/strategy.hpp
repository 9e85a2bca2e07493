#pragma once

#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"
#include "transcript.hpp"

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace retrace::checkpoint {

using namespace retrace::core;

// When a checkpoint is taken without an explicit request
enum class CheckpointStrategy {
    Manual,
    PerPrompt,
    PerToolUse,
    Smart
};

std::string_view strategy_to_string(CheckpointStrategy strategy);
Result<CheckpointStrategy, Error> strategy_from_string(std::string_view str);

struct SmartThresholds {
    size_t message_count = 20;
    size_t file_count = 5;
    std::chrono::minutes interval{30};
};

// What the manager knows about the session since the last checkpoint
struct TriggerContext {
    size_t buffered_messages = 0;
    const std::set<std::string>* files_modified = nullptr;
    const std::set<std::string>* pending_mutations = nullptr;  // mutating tool-use ids awaiting a result
    TimePoint last_checkpoint_at{};
    TimePoint now{};
};

// Why a checkpoint should be taken, or None
enum class TriggerReason {
    None,
    UserPrompt,
    ToolCompleted,
    MessageCount,
    FileCount,
    Elapsed
};

std::string_view trigger_reason_to_string(TriggerReason reason);

// The single decision point for all strategies
TriggerReason evaluate_trigger(CheckpointStrategy strategy,
                               const TranscriptEntry& candidate,
                               const TriggerContext& ctx,
                               const SmartThresholds& thresholds);

}  // namespace retrace::checkpoint
