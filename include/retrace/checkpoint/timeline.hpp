#pragma once

#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"
#include "strategy.hpp"
#include "types.hpp"

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;

// Per-session checkpoint history.
//
// Checkpoints are kept in a flat table in creation order and linked only by
// parent ids, so branches never form pointer cycles and the whole timeline
// serializes as one JSON document. A parent id that is not in the table
// (another session's checkpoint after a fork, or one removed by retention)
// makes that checkpoint a root of the tree projection.
class Timeline {
public:
    Timeline() = default;
    Timeline(SessionId session_id, ProjectId project_id);

    const SessionId& session_id() const { return session_id_; }
    const ProjectId& project_id() const { return project_id_; }

    // Read projection including the branch tree
    SessionTimeline get_timeline() const;

    void update_settings(bool auto_checkpoint_enabled, CheckpointStrategy strategy);
    bool auto_checkpoint_enabled() const { return auto_checkpoint_enabled_; }
    CheckpointStrategy strategy() const { return strategy_; }

    // Add a new checkpoint and make it current
    Result<void, Error> append(Checkpoint checkpoint);

    // Move the current pointer to an existing checkpoint
    Result<void, Error> move_to(const CheckpointId& id);

    const std::optional<CheckpointId>& current() const { return current_; }
    bool contains(const CheckpointId& id) const { return index_.count(id) > 0; }
    const Checkpoint* find(const CheckpointId& id) const;

    // Creation order
    const std::vector<Checkpoint>& checkpoints() const { return checkpoints_; }
    size_t size() const { return checkpoints_.size(); }
    bool empty() const { return checkpoints_.empty(); }

    // Ancestor chain starting at id (inclusive), stopping at the first parent
    // outside this table
    std::vector<CheckpointId> lineage(const CheckpointId& id) const;

    std::vector<CheckpointId> children(const CheckpointId& id) const;

    // Drop all but the keep_count most recently created checkpoints, except
    // those in pinned, which always survive. Returns the removed ids;
    // repoints current to the newest survivor.
    std::vector<CheckpointId> retain_most_recent(size_t keep_count,
                                                 const std::set<CheckpointId>& pinned = {});

    Json to_json() const;
    static Timeline from_json(const Json& j);

private:
    SessionId session_id_;
    ProjectId project_id_;
    std::optional<CheckpointId> current_;
    bool auto_checkpoint_enabled_ = false;
    CheckpointStrategy strategy_ = CheckpointStrategy::Manual;

    std::vector<Checkpoint> checkpoints_;
    std::unordered_map<CheckpointId, size_t> index_;

    void rebuild_index();
    TimelineNode build_node(size_t idx,
                            const std::unordered_map<CheckpointId, std::vector<size_t>>& kids) const;
};

}  // namespace retrace::checkpoint
