#pragma once

#include "retrace/core/types.hpp"
#include "strategy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;

// One file captured at a checkpoint
struct FileSnapshot {
    CheckpointId checkpoint_id;
    std::string file_path;  // relative to the project root, '/' separated
    std::string content;
    ContentHash hash;
    uint64_t size = 0;
    std::optional<uint32_t> permissions;

    // Manifest entry: everything but the content
    Json to_json() const;
    static FileSnapshot from_json(const Json& j);
};

struct CheckpointMetadata {
    int64_t total_tokens = 0;
    std::string model_used;
    std::string user_prompt;
    size_t file_count = 0;
    size_t file_changes = 0;
    uint64_t snapshot_size = 0;

    Json to_json() const;
    static CheckpointMetadata from_json(const Json& j);
};

// Immutable once written
struct Checkpoint {
    CheckpointId id;
    SessionId session_id;
    ProjectId project_id;
    std::optional<CheckpointId> parent_id;
    std::optional<SessionId> parent_session_id;  // set when the parent lives in another session
    TimePoint created_at;
    std::optional<std::string> description;
    size_t message_index = 0;
    CheckpointMetadata metadata;

    Json to_json() const;
    static Checkpoint from_json(const Json& j);
};

struct TimelineNode {
    Checkpoint checkpoint;
    std::vector<TimelineNode> children;

    Json to_json() const;
};

// Read projection of a session's timeline
struct SessionTimeline {
    SessionId session_id;
    ProjectId project_id;
    std::optional<CheckpointId> current_checkpoint_id;
    size_t total_checkpoints = 0;
    bool auto_checkpoint_enabled = false;
    CheckpointStrategy checkpoint_strategy = CheckpointStrategy::Manual;
    std::vector<TimelineNode> roots;

    Json to_json() const;
};

struct FileDiff {
    std::string path;
    size_t additions = 0;
    size_t deletions = 0;

    Json to_json() const;
};

struct CheckpointDiff {
    CheckpointId from_id;
    CheckpointId to_id;
    std::vector<FileDiff> modified_files;
    std::vector<std::string> added_files;
    std::vector<std::string> deleted_files;
    int64_t token_delta = 0;

    Json to_json() const;
};

struct CheckpointResult {
    Checkpoint checkpoint;
    size_t files_processed = 0;
    std::vector<std::string> warnings;
    std::string transcript;  // captured transcript bytes, filled by restore and fork

    Json to_json() const;
};

// A checkpoint with its files and transcript resolved from storage
struct LoadedCheckpoint {
    Checkpoint checkpoint;
    std::vector<FileSnapshot> files;
    std::string transcript;
};

}  // namespace retrace::checkpoint
