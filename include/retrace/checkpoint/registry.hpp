#pragma once

#include "retrace/core/config.hpp"
#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"
#include "manager.hpp"
#include "storage.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;
namespace fs = std::filesystem;

// Owns the live checkpoint managers, one per session id.
//
// Managers are created lazily and dropped only when a caller ends the
// session. All managers of a project share one CheckpointStorage so blob
// cleanup in one session cannot race a save in another.
class ManagerRegistry {
public:
    // The config is validated when each manager opens
    explicit ManagerRegistry(Config config);

    // Idempotent per session id. Asking for a known session with a different
    // project id or path is an error, never a silent rebind.
    Result<std::shared_ptr<CheckpointManager>, Error> get_or_create_manager(
        const SessionId& session_id,
        const ProjectId& project_id,
        const fs::path& project_path);

    std::shared_ptr<CheckpointManager> find_manager(const SessionId& session_id) const;

    // Returns false if the session had no manager
    bool remove_manager(const SessionId& session_id);

    // Sorted
    std::vector<SessionId> list_active_sessions() const;
    size_t active_count() const;

    // Load checkpoint_id from the source session and root new_session_id
    // there. The new session belongs to the source's project and works in
    // new_project_path, which receives the checkpoint's files. Give it its
    // own directory to keep the branch's tree independent of the source's.
    Result<CheckpointResult, Error> fork_from_checkpoint(
        const SessionId& source_session_id,
        const CheckpointId& checkpoint_id,
        const SessionId& new_session_id,
        const fs::path& new_project_path,
        std::optional<std::string> description = std::nullopt);

    std::shared_ptr<CheckpointStorage> storage_for(const ProjectId& project_id);

    const Config& config() const { return config_; }

private:
    Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<CheckpointManager>> managers_;
    std::unordered_map<ProjectId, std::shared_ptr<CheckpointStorage>> storages_;

    std::shared_ptr<CheckpointStorage> storage_locked(const ProjectId& project_id);
};

}  // namespace retrace::checkpoint
