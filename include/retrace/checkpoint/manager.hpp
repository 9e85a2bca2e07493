#pragma once

#include "retrace/core/config.hpp"
#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"
#include "storage.hpp"
#include "strategy.hpp"
#include "timeline.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;
namespace fs = std::filesystem;

enum class ManagerState {
    Idle,          // nothing buffered since the last checkpoint
    Accumulating   // messages buffered since the last checkpoint
};

// Orchestrates checkpoints for one (session, project) pair.
//
// Buffers transcript lines, decides auto-checkpoint triggers, snapshots the
// working tree on create, writes it back on restore and fork, and keeps the
// session timeline persisted. Every public operation holds the manager's
// mutex, so operations on one session never interleave.
class CheckpointManager {
public:
    // Loads the persisted timeline, or starts an empty one with the
    // configured strategy when the session is new.
    static Result<std::shared_ptr<CheckpointManager>, Error> open(
        SessionId session_id,
        ProjectId project_id,
        fs::path project_path,
        std::shared_ptr<CheckpointStorage> storage,
        const Config& config);

    CheckpointManager(const CheckpointManager&) = delete;
    CheckpointManager& operator=(const CheckpointManager&) = delete;

    const SessionId& session_id() const { return session_id_; }
    const ProjectId& project_id() const { return project_id_; }
    const fs::path& project_path() const { return project_path_; }

    // Message tracking. A line with an embedded newline is refused with
    // TranscriptCaptureFailed and leaves the buffer unchanged.
    Result<void, Error> track_message(const std::string& line);
    bool should_auto_checkpoint(const std::string& candidate_line) const;

    // Checkpoint operations
    Result<CheckpointResult, Error> create_checkpoint(
        std::optional<std::string> description = std::nullopt,
        std::optional<CheckpointId> parent_override = std::nullopt);

    Result<CheckpointResult, Error> restore_checkpoint(const CheckpointId& checkpoint_id);

    // Root this (empty) session at a checkpoint loaded from another session
    Result<CheckpointResult, Error> fork_from_checkpoint(
        const LoadedCheckpoint& source,
        std::optional<std::string> description = std::nullopt);

    Result<LoadedCheckpoint, Error> load_checkpoint(const CheckpointId& checkpoint_id) const;
    Result<CheckpointDiff, Error> diff_checkpoints(const CheckpointId& from_id,
                                                   const CheckpointId& to_id) const;

    Result<size_t, Error> cleanup_old_checkpoints(size_t keep_count);

    // Timeline queries
    std::vector<Checkpoint> list_checkpoints() const;
    SessionTimeline get_timeline() const;
    Result<void, Error> update_settings(bool auto_checkpoint_enabled, CheckpointStrategy strategy);

    // Modification bookkeeping from tracked messages
    std::vector<std::string> get_files_modified_since(TimePoint since) const;
    std::optional<TimePoint> get_last_modification_time() const;

    ManagerState state() const;
    size_t buffered_count() const;

private:
    CheckpointManager(SessionId session_id,
                      ProjectId project_id,
                      fs::path project_path,
                      std::shared_ptr<CheckpointStorage> storage,
                      const Config& config);

    SessionId session_id_;
    ProjectId project_id_;
    fs::path project_path_;
    std::shared_ptr<CheckpointStorage> storage_;

    CheckpointConfig config_;
    uint64_t max_file_size_ = 0;
    SmartThresholds thresholds_;

    mutable std::mutex mutex_;
    Timeline timeline_;

    // Full transcript; lines past baseline_ are buffered since the last checkpoint
    std::vector<std::string> transcript_;
    size_t baseline_ = 0;

    std::map<std::string, TimePoint> file_times_;
    std::set<std::string> modified_since_checkpoint_;
    std::set<std::string> pending_mutations_;
    int64_t total_tokens_ = 0;
    std::optional<std::string> last_model_;
    std::string last_user_prompt_;
    TimePoint last_checkpoint_at_;

    struct Snapshot {
        std::vector<FileSnapshot> files;
        std::vector<std::string> warnings;
    };

    void record_entry(const TranscriptEntry& entry, TimePoint at);
    void reset_transcript(const std::string& transcript);
    Result<std::string, Error> capture_transcript() const;
    size_t last_message_index() const;

    std::vector<fs::path> list_tree_files() const;
    Snapshot snapshot_tree() const;
    bool is_ignored_dir(const fs::path& dir) const;
    std::string relative_path(const std::string& path) const;
    Result<void, Error> write_tree(const std::vector<FileSnapshot>& files,
                                   std::vector<std::string>& warnings);

    // Save the record, append it to the timeline and persist the timeline
    Result<Checkpoint, Error> commit(Checkpoint checkpoint,
                                     std::vector<FileSnapshot> files,
                                     const std::string& transcript);

    // Session holding checkpoint_id if it is in this session or one of its
    // cross-session ancestors
    Result<SessionId, Error> locate(const CheckpointId& checkpoint_id) const;
    Result<LoadedCheckpoint, Error> load_located(const CheckpointId& checkpoint_id) const;
    Result<void, Error> reload_timeline();
    Error lineage_error(const CheckpointId& checkpoint_id) const;

    Error in_session(Error e) const;
};

}  // namespace retrace::checkpoint
