#include "retrace/checkpoint/types.hpp"

namespace retrace::checkpoint {

// FileSnapshot
Json FileSnapshot::to_json() const {
    Json j{
        {"path", file_path},
        {"hash", hash},
        {"size", size}
    };
    if (permissions) {
        j["permissions"] = *permissions;
    }
    return j;
}

FileSnapshot FileSnapshot::from_json(const Json& j) {
    FileSnapshot snap;
    snap.file_path = j.value("path", "");
    snap.hash = j.value("hash", "");
    snap.size = j.value("size", uint64_t{0});
    if (j.contains("permissions")) {
        snap.permissions = j["permissions"].get<uint32_t>();
    }
    return snap;
}

// CheckpointMetadata
Json CheckpointMetadata::to_json() const {
    return Json{
        {"total_tokens", total_tokens},
        {"model_used", model_used},
        {"user_prompt", user_prompt},
        {"file_count", file_count},
        {"file_changes", file_changes},
        {"snapshot_size", snapshot_size}
    };
}

CheckpointMetadata CheckpointMetadata::from_json(const Json& j) {
    CheckpointMetadata meta;
    meta.total_tokens = j.value("total_tokens", int64_t{0});
    meta.model_used = j.value("model_used", "");
    meta.user_prompt = j.value("user_prompt", "");
    meta.file_count = j.value("file_count", size_t{0});
    meta.file_changes = j.value("file_changes", size_t{0});
    meta.snapshot_size = j.value("snapshot_size", uint64_t{0});
    return meta;
}

// Checkpoint
Json Checkpoint::to_json() const {
    Json j{
        {"id", id},
        {"session_id", session_id},
        {"project_id", project_id},
        {"created_at", to_epoch_ms(created_at)},
        {"message_index", message_index},
        {"metadata", metadata.to_json()}
    };

    if (parent_id) {
        j["parent_id"] = *parent_id;
    }
    if (parent_session_id) {
        j["parent_session_id"] = *parent_session_id;
    }
    if (description) {
        j["description"] = *description;
    }

    return j;
}

Checkpoint Checkpoint::from_json(const Json& j) {
    Checkpoint cp;
    cp.id = j.value("id", "");
    cp.session_id = j.value("session_id", "");
    cp.project_id = j.value("project_id", "");
    cp.message_index = j.value("message_index", size_t{0});

    if (j.contains("created_at")) {
        cp.created_at = from_epoch_ms(j["created_at"].get<int64_t>());
    }
    if (j.contains("parent_id")) {
        cp.parent_id = j["parent_id"].get<std::string>();
    }
    if (j.contains("parent_session_id")) {
        cp.parent_session_id = j["parent_session_id"].get<std::string>();
    }
    if (j.contains("description")) {
        cp.description = j["description"].get<std::string>();
    }
    if (j.contains("metadata")) {
        cp.metadata = CheckpointMetadata::from_json(j["metadata"]);
    }

    return cp;
}

// TimelineNode
Json TimelineNode::to_json() const {
    Json children_json = Json::array();
    for (const auto& child : children) {
        children_json.push_back(child.to_json());
    }
    return Json{
        {"checkpoint", checkpoint.to_json()},
        {"children", children_json}
    };
}

// SessionTimeline
Json SessionTimeline::to_json() const {
    Json roots_json = Json::array();
    for (const auto& root : roots) {
        roots_json.push_back(root.to_json());
    }

    Json j{
        {"session_id", session_id},
        {"project_id", project_id},
        {"total_checkpoints", total_checkpoints},
        {"auto_checkpoint_enabled", auto_checkpoint_enabled},
        {"checkpoint_strategy", std::string(strategy_to_string(checkpoint_strategy))},
        {"roots", roots_json}
    };
    j["current_checkpoint_id"] = current_checkpoint_id ? Json(*current_checkpoint_id) : Json(nullptr);
    return j;
}

// FileDiff
Json FileDiff::to_json() const {
    return Json{
        {"path", path},
        {"additions", additions},
        {"deletions", deletions}
    };
}

// CheckpointDiff
Json CheckpointDiff::to_json() const {
    Json modified = Json::array();
    for (const auto& f : modified_files) {
        modified.push_back(f.to_json());
    }
    return Json{
        {"from_checkpoint_id", from_id},
        {"to_checkpoint_id", to_id},
        {"modified_files", modified},
        {"added_files", added_files},
        {"deleted_files", deleted_files},
        {"token_delta", token_delta}
    };
}

// CheckpointResult
Json CheckpointResult::to_json() const {
    return Json{
        {"checkpoint", checkpoint.to_json()},
        {"files_processed", files_processed},
        {"warnings", warnings}
    };
}

}  // namespace retrace::checkpoint
