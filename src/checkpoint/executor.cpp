#include "retrace/checkpoint/executor.hpp"

#include <spdlog/spdlog.h>

namespace retrace::checkpoint {

namespace {

Error no_manager(const SessionId& session_id) {
    return Error{ErrorCode::SessionNotFound, "No active manager for session", session_id};
}

}  // namespace

CheckpointExecutor::CheckpointExecutor(ManagerRegistry& registry, const ConcurrencyConfig& config)
    : registry_(registry)
    , pool_(config.thread_pool_size > 0 ? static_cast<size_t>(config.thread_pool_size) : 1)
{
}

CheckpointExecutor::~CheckpointExecutor() {
    shutdown();
}

void CheckpointExecutor::shutdown() {
    pool_.shutdown();
}

template<typename T, typename F>
std::future<Result<T, Error>> CheckpointExecutor::dispatch(F&& task) {
    try {
        return pool_.submit(std::forward<F>(task));
    } catch (const PoolStopped& e) {
        // Report through the future like any other failure
        spdlog::warn("Checkpoint task rejected: {}", e.what());
        std::promise<Result<T, Error>> rejected;
        rejected.set_value(Result<T, Error>::err(ErrorCode::InvalidState, e.what()));
        return rejected.get_future();
    }
}

std::future<Result<CheckpointResult, Error>> CheckpointExecutor::create_async(
    SessionId session_id,
    std::optional<std::string> description)
{
    return dispatch<CheckpointResult>(
        [this, session_id = std::move(session_id), description = std::move(description)]()
            -> Result<CheckpointResult, Error> {
            auto manager = registry_.find_manager(session_id);
            if (!manager) {
                return Result<CheckpointResult, Error>::err(no_manager(session_id));
            }
            return manager->create_checkpoint(description);
        });
}

std::future<Result<CheckpointResult, Error>> CheckpointExecutor::restore_async(
    SessionId session_id,
    CheckpointId checkpoint_id)
{
    return dispatch<CheckpointResult>(
        [this, session_id = std::move(session_id), checkpoint_id = std::move(checkpoint_id)]()
            -> Result<CheckpointResult, Error> {
            auto manager = registry_.find_manager(session_id);
            if (!manager) {
                return Result<CheckpointResult, Error>::err(no_manager(session_id));
            }
            return manager->restore_checkpoint(checkpoint_id);
        });
}

std::future<Result<CheckpointResult, Error>> CheckpointExecutor::fork_async(
    SessionId source_session_id,
    CheckpointId checkpoint_id,
    SessionId new_session_id,
    fs::path new_project_path,
    std::optional<std::string> description)
{
    return dispatch<CheckpointResult>(
        [this,
         source_session_id = std::move(source_session_id),
         checkpoint_id = std::move(checkpoint_id),
         new_session_id = std::move(new_session_id),
         new_project_path = std::move(new_project_path),
         description = std::move(description)]() -> Result<CheckpointResult, Error> {
            return registry_.fork_from_checkpoint(source_session_id, checkpoint_id,
                                                  new_session_id, new_project_path, description);
        });
}

std::future<Result<CheckpointDiff, Error>> CheckpointExecutor::diff_async(
    SessionId session_id,
    CheckpointId from_id,
    CheckpointId to_id)
{
    return dispatch<CheckpointDiff>(
        [this, session_id = std::move(session_id),
         from_id = std::move(from_id), to_id = std::move(to_id)]()
            -> Result<CheckpointDiff, Error> {
            auto manager = registry_.find_manager(session_id);
            if (!manager) {
                return Result<CheckpointDiff, Error>::err(no_manager(session_id));
            }
            return manager->diff_checkpoints(from_id, to_id);
        });
}

}  // namespace retrace::checkpoint
