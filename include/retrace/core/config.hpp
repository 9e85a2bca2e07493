#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace retrace::core {

namespace fs = std::filesystem;

// Where checkpoints and content blobs live
struct StorageConfig {
    fs::path root = "~/.retrace";
    int max_file_size_mb = 10;  // larger files are skipped during snapshot
};

// Checkpoint policy
struct CheckpointConfig {
    bool auto_checkpoint_enabled = false;
    std::string strategy = "manual";  // manual | per_prompt | per_tool_use | smart

    // Smart strategy thresholds
    int smart_message_threshold = 20;
    int smart_file_threshold = 5;
    int smart_interval_minutes = 30;

    int max_checkpoints = 0;  // 0 = keep everything
    bool restore_removes_untracked = false;

    std::vector<std::string> ignore_dirs;

    CheckpointConfig() {
        ignore_dirs = {".git", "node_modules", "target", "dist", "build", ".next",
                       "__pycache__", ".venv", "venv", ".idea", ".vscode"};
    }
};

// Worker pool behind CheckpointExecutor
struct ConcurrencyConfig {
    int thread_pool_size = 4;
};

// spdlog sinks
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_path;               // empty = console only
};

// Top-level YAML document; one section per struct above
struct Config {
    StorageConfig storage;
    CheckpointConfig checkpoint;
    ConcurrencyConfig concurrency;
    ObservabilityConfig observability;

    // Missing file: ConfigNotFound. Bad YAML: ConfigParseFailed.
    // Out-of-range values: ConfigValidationFailed.
    static Result<Config, Error> load(const fs::path& path);

    // Defaults when the file is missing; other load failures are logged
    static Config load_or_default(const fs::path& path);

    Result<void, Error> save(const fs::path& path) const;

    // ~/.retrace/config.yaml
    static fs::path default_path();

    void expand_paths();

    Result<void, Error> validate() const;
};

// Leading ~ becomes $HOME; ${NAME} becomes the variable's value or nothing
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace retrace::core
