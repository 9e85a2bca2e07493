#include "retrace/checkpoint/timeline.hpp"

#include <algorithm>
#include <unordered_set>

namespace retrace::checkpoint {

Timeline::Timeline(SessionId session_id, ProjectId project_id)
    : session_id_(std::move(session_id))
    , project_id_(std::move(project_id))
{
}

void Timeline::update_settings(bool auto_checkpoint_enabled, CheckpointStrategy strategy) {
    auto_checkpoint_enabled_ = auto_checkpoint_enabled;
    strategy_ = strategy;
}

Result<void, Error> Timeline::append(Checkpoint checkpoint) {
    if (checkpoint.id.empty()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Checkpoint id is empty"
        );
    }
    if (contains(checkpoint.id)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Checkpoint already in timeline",
            checkpoint.id
        );
    }

    current_ = checkpoint.id;
    index_[checkpoint.id] = checkpoints_.size();
    checkpoints_.push_back(std::move(checkpoint));
    return Result<void, Error>::ok();
}

Result<void, Error> Timeline::move_to(const CheckpointId& id) {
    if (!contains(id)) {
        return Result<void, Error>::err(
            ErrorCode::CheckpointNotFound,
            "Checkpoint not in timeline",
            id
        );
    }
    current_ = id;
    return Result<void, Error>::ok();
}

const Checkpoint* Timeline::find(const CheckpointId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &checkpoints_[it->second];
}

std::vector<CheckpointId> Timeline::lineage(const CheckpointId& id) const {
    std::vector<CheckpointId> chain;
    std::unordered_set<CheckpointId> seen;

    const Checkpoint* cp = find(id);
    while (cp && seen.insert(cp->id).second) {
        chain.push_back(cp->id);
        cp = cp->parent_id ? find(*cp->parent_id) : nullptr;
    }
    return chain;
}

std::vector<CheckpointId> Timeline::children(const CheckpointId& id) const {
    std::vector<CheckpointId> result;
    for (const auto& cp : checkpoints_) {
        if (cp.parent_id && *cp.parent_id == id) {
            result.push_back(cp.id);
        }
    }
    return result;
}

std::vector<CheckpointId> Timeline::retain_most_recent(size_t keep_count,
                                                       const std::set<CheckpointId>& pinned) {
    std::vector<CheckpointId> removed;
    if (keep_count >= checkpoints_.size()) {
        return removed;
    }

    size_t cutoff = checkpoints_.size() - keep_count;
    std::vector<Checkpoint> kept;
    kept.reserve(checkpoints_.size());
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        if (i < cutoff && !pinned.count(checkpoints_[i].id)) {
            removed.push_back(checkpoints_[i].id);
        } else {
            kept.push_back(std::move(checkpoints_[i]));
        }
    }
    checkpoints_ = std::move(kept);
    rebuild_index();

    if (current_ && !contains(*current_)) {
        current_ = checkpoints_.empty() ? std::nullopt
                                        : std::make_optional(checkpoints_.back().id);
    }
    return removed;
}

void Timeline::rebuild_index() {
    index_.clear();
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        index_[checkpoints_[i].id] = i;
    }
}

TimelineNode Timeline::build_node(
    size_t idx,
    const std::unordered_map<CheckpointId, std::vector<size_t>>& kids) const
{
    TimelineNode node;
    node.checkpoint = checkpoints_[idx];

    auto it = kids.find(checkpoints_[idx].id);
    if (it != kids.end()) {
        for (size_t child : it->second) {
            node.children.push_back(build_node(child, kids));
        }
    }
    return node;
}

SessionTimeline Timeline::get_timeline() const {
    SessionTimeline view;
    view.session_id = session_id_;
    view.project_id = project_id_;
    view.current_checkpoint_id = current_;
    view.total_checkpoints = checkpoints_.size();
    view.auto_checkpoint_enabled = auto_checkpoint_enabled_;
    view.checkpoint_strategy = strategy_;

    std::unordered_map<CheckpointId, std::vector<size_t>> kids;
    std::vector<size_t> roots;
    for (size_t i = 0; i < checkpoints_.size(); ++i) {
        const auto& cp = checkpoints_[i];
        if (cp.parent_id && contains(*cp.parent_id)) {
            kids[*cp.parent_id].push_back(i);
        } else {
            roots.push_back(i);
        }
    }

    for (size_t r : roots) {
        view.roots.push_back(build_node(r, kids));
    }
    return view;
}

Json Timeline::to_json() const {
    Json list = Json::array();
    for (const auto& cp : checkpoints_) {
        list.push_back(cp.to_json());
    }

    Json j{
        {"session_id", session_id_},
        {"project_id", project_id_},
        {"auto_checkpoint_enabled", auto_checkpoint_enabled_},
        {"checkpoint_strategy", std::string(strategy_to_string(strategy_))},
        {"checkpoints", list}
    };
    if (current_) {
        j["current_checkpoint_id"] = *current_;
    }
    return j;
}

Timeline Timeline::from_json(const Json& j) {
    Timeline t(j.value("session_id", ""), j.value("project_id", ""));
    t.auto_checkpoint_enabled_ = j.value("auto_checkpoint_enabled", false);
    t.strategy_ = strategy_from_string(j.value("checkpoint_strategy", "manual"))
                      .unwrap_or(CheckpointStrategy::Manual);

    if (j.contains("checkpoints")) {
        for (const auto& item : j["checkpoints"]) {
            t.checkpoints_.push_back(Checkpoint::from_json(item));
        }
    }
    t.rebuild_index();

    if (j.contains("current_checkpoint_id")) {
        CheckpointId current = j["current_checkpoint_id"].get<std::string>();
        if (t.contains(current)) {
            t.current_ = std::move(current);
        }
    }
    return t;
}

}  // namespace retrace::checkpoint
