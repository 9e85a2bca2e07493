#include "retrace/checkpoint/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace retrace::checkpoint {

ManagerRegistry::ManagerRegistry(Config config)
    : config_(std::move(config))
{
    config_.expand_paths();
}

std::shared_ptr<CheckpointStorage> ManagerRegistry::storage_locked(const ProjectId& project_id) {
    auto it = storages_.find(project_id);
    if (it != storages_.end()) {
        return it->second;
    }
    auto storage = std::make_shared<CheckpointStorage>(config_.storage.root);
    storages_[project_id] = storage;
    return storage;
}

std::shared_ptr<CheckpointStorage> ManagerRegistry::storage_for(const ProjectId& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_locked(project_id);
}

namespace {

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    fs::path out = fs::weakly_canonical(path, ec);
    return ec ? fs::absolute(path) : out;
}

// A known session may only be asked for with the project it was opened with
Result<std::shared_ptr<CheckpointManager>, Error> check_binding(
    const std::shared_ptr<CheckpointManager>& existing,
    const ProjectId& project_id,
    const fs::path& project_path)
{
    using R = Result<std::shared_ptr<CheckpointManager>, Error>;
    if (existing->project_id() != project_id) {
        return R::err(ErrorCode::InvalidArgument,
                      "Session is bound to project " + existing->project_id(),
                      existing->session_id());
    }
    if (normalized(project_path) != existing->project_path()) {
        return R::err(ErrorCode::InvalidArgument,
                      "Session is bound to path " + existing->project_path().string(),
                      existing->session_id());
    }
    return R::ok(existing);
}

}  // namespace

Result<std::shared_ptr<CheckpointManager>, Error> ManagerRegistry::get_or_create_manager(
    const SessionId& session_id,
    const ProjectId& project_id,
    const fs::path& project_path)
{
    std::shared_ptr<CheckpointStorage> storage;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = managers_.find(session_id);
        if (it != managers_.end()) {
            return check_binding(it->second, project_id, project_path);
        }
        storage = storage_locked(project_id);
    }

    // Opening reads the timeline and the current checkpoint; keep the map unlocked
    auto opened = CheckpointManager::open(session_id, project_id, project_path,
                                          std::move(storage), config_);
    if (opened.is_err()) {
        return opened;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = managers_.emplace(session_id, opened.value());
    if (!inserted) {
        // Another caller opened the session first; theirs wins
        return check_binding(it->second, project_id, project_path);
    }

    spdlog::info("Registered checkpoint manager for session {} (project {})",
                 session_id, project_id);
    return opened;
}

std::shared_ptr<CheckpointManager> ManagerRegistry::find_manager(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = managers_.find(session_id);
    return it != managers_.end() ? it->second : nullptr;
}

bool ManagerRegistry::remove_manager(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = managers_.erase(session_id) > 0;
    if (removed) {
        spdlog::debug("Removed checkpoint manager for session {}", session_id);
    }
    return removed;
}

std::vector<SessionId> ManagerRegistry::list_active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionId> sessions;
    sessions.reserve(managers_.size());
    for (const auto& [id, _] : managers_) {
        sessions.push_back(id);
    }
    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

size_t ManagerRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return managers_.size();
}

Result<CheckpointResult, Error> ManagerRegistry::fork_from_checkpoint(
    const SessionId& source_session_id,
    const CheckpointId& checkpoint_id,
    const SessionId& new_session_id,
    const fs::path& new_project_path,
    std::optional<std::string> description)
{
    if (source_session_id == new_session_id) {
        return Result<CheckpointResult, Error>::err(
            ErrorCode::InvalidArgument,
            "Fork needs a new session id",
            new_session_id
        );
    }

    auto source = find_manager(source_session_id);
    if (!source) {
        return Result<CheckpointResult, Error>::err(
            ErrorCode::SessionNotFound,
            "No active manager for session",
            source_session_id
        );
    }

    auto loaded = source->load_checkpoint(checkpoint_id);
    if (loaded.is_err()) {
        return Result<CheckpointResult, Error>::err(std::move(loaded).error());
    }

    auto target = get_or_create_manager(new_session_id, source->project_id(), new_project_path);
    if (target.is_err()) {
        return Result<CheckpointResult, Error>::err(std::move(target).error());
    }

    return target.value()->fork_from_checkpoint(loaded.value(), std::move(description));
}

}  // namespace retrace::checkpoint
