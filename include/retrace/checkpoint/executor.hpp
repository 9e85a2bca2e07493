#pragma once

#include "retrace/core/config.hpp"
#include "retrace/core/result.hpp"
#include "retrace/core/thread_pool.hpp"
#include "registry.hpp"
#include "types.hpp"

#include <filesystem>
#include <future>
#include <optional>
#include <string>

namespace retrace::checkpoint {

using namespace retrace::core;

// Runs checkpoint operations on a worker pool.
//
// Operations on one session serialize on that manager's mutex; different
// sessions run in parallel. A session without an active manager yields
// SessionNotFound.
class CheckpointExecutor {
public:
    CheckpointExecutor(ManagerRegistry& registry, const ConcurrencyConfig& config);
    ~CheckpointExecutor();

    CheckpointExecutor(const CheckpointExecutor&) = delete;
    CheckpointExecutor& operator=(const CheckpointExecutor&) = delete;

    std::future<Result<CheckpointResult, Error>> create_async(
        SessionId session_id,
        std::optional<std::string> description = std::nullopt);

    std::future<Result<CheckpointResult, Error>> restore_async(
        SessionId session_id,
        CheckpointId checkpoint_id);

    std::future<Result<CheckpointResult, Error>> fork_async(
        SessionId source_session_id,
        CheckpointId checkpoint_id,
        SessionId new_session_id,
        fs::path new_project_path,
        std::optional<std::string> description = std::nullopt);

    std::future<Result<CheckpointDiff, Error>> diff_async(
        SessionId session_id,
        CheckpointId from_id,
        CheckpointId to_id);

    void shutdown();

private:
    ManagerRegistry& registry_;
    ThreadPool pool_;

    template<typename T, typename F>
    std::future<Result<T, Error>> dispatch(F&& task);
};

}  // namespace retrace::checkpoint
