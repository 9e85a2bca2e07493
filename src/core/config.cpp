#include "retrace/core/config.hpp"
#include "retrace/core/file_io.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

namespace retrace::core {

namespace {

// Overwrite field only when the key is present
template<typename T>
void read_key(const YAML::Node& section, const char* key, T& field) {
    if (const YAML::Node node = section[key]) {
        field = node.as<T>();
    }
}

void read_key(const YAML::Node& section, const char* key, fs::path& field) {
    if (const YAML::Node node = section[key]) {
        field = node.as<std::string>();
    }
}

bool one_of(const std::string& value, std::initializer_list<std::string_view> allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

Result<void, Error> invalid(std::string message) {
    return Result<void, Error>::err(ErrorCode::ConfigValidationFailed, std::move(message));
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());

    size_t i = 0;
    if (!path.empty() && path[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            out = home;
            i = 1;
        }
    }

    // ${NAME} expands to the variable's value, or nothing when unset
    while (i < path.size()) {
        if (path.compare(i, 2, "${") == 0) {
            size_t close = path.find('}', i + 2);
            if (close != std::string::npos) {
                std::string name = path.substr(i + 2, close - i - 2);
                if (const char* value = std::getenv(name.c_str())) {
                    out += value;
                }
                i = close + 1;
                continue;
            }
        }
        out += path[i++];
    }
    return out;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return expand_path(fs::path("~/.retrace/config.yaml"));
}

void Config::expand_paths() {
    storage.root = expand_path(storage.root);
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path(observability.log_path);
    }
}

Result<void, Error> Config::validate() const {
    if (storage.root.empty()) {
        return invalid("storage.root must not be empty");
    }
    if (storage.max_file_size_mb <= 0) {
        return invalid("storage.max_file_size_mb must be positive");
    }
    if (!one_of(checkpoint.strategy, {"manual", "per_prompt", "per_tool_use", "smart"})) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "checkpoint.strategy must be manual, per_prompt, per_tool_use or smart",
            checkpoint.strategy);
    }
    if (checkpoint.smart_message_threshold < 1 || checkpoint.smart_file_threshold < 0 ||
        checkpoint.smart_interval_minutes < 1) {
        return invalid("checkpoint smart thresholds are out of range");
    }
    if (checkpoint.max_checkpoints < 0) {
        return invalid("checkpoint.max_checkpoints must not be negative");
    }
    if (concurrency.thread_pool_size < 1) {
        return invalid("concurrency.thread_pool_size must be at least 1");
    }
    if (!one_of(observability.log_level, {"trace", "debug", "info", "warn", "error", "critical", "off"})) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "observability.log_level is not a known level",
            observability.log_level);
    }
    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    const fs::path file = expand_path(path);
    if (!fs::exists(file)) {
        return Result<Config, Error>::err(ErrorCode::ConfigNotFound, "No configuration file", file.string());
    }

    Config config;
    try {
        const YAML::Node root = YAML::LoadFile(file.string());

        if (const YAML::Node s = root["storage"]) {
            read_key(s, "root", config.storage.root);
            read_key(s, "max_file_size_mb", config.storage.max_file_size_mb);
        }

        if (const YAML::Node c = root["checkpoint"]) {
            read_key(c, "auto_checkpoint_enabled", config.checkpoint.auto_checkpoint_enabled);
            read_key(c, "strategy", config.checkpoint.strategy);
            read_key(c, "smart_message_threshold", config.checkpoint.smart_message_threshold);
            read_key(c, "smart_file_threshold", config.checkpoint.smart_file_threshold);
            read_key(c, "smart_interval_minutes", config.checkpoint.smart_interval_minutes);
            read_key(c, "max_checkpoints", config.checkpoint.max_checkpoints);
            read_key(c, "restore_removes_untracked", config.checkpoint.restore_removes_untracked);
            read_key(c, "ignore_dirs", config.checkpoint.ignore_dirs);
        }

        if (const YAML::Node c = root["concurrency"]) {
            read_key(c, "thread_pool_size", config.concurrency.thread_pool_size);
        }

        if (const YAML::Node o = root["observability"]) {
            read_key(o, "log_level", config.observability.log_level);
            read_key(o, "log_path", config.observability.log_path);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            file.string());
    }

    config.expand_paths();
    RETRACE_TRY_VOID(config.validate());
    return Result<Config, Error>::ok(std::move(config));
}

Config Config::load_or_default(const fs::path& path) {
    auto loaded = load(path);
    if (loaded.is_ok()) {
        return std::move(loaded).value();
    }
    if (loaded.error().code != ErrorCode::ConfigNotFound) {
        spdlog::warn("Ignoring configuration: {}", loaded.error().to_string());
    }

    Config config;
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap
        << YAML::Key << "root" << YAML::Value << storage.root.string()
        << YAML::Key << "max_file_size_mb" << YAML::Value << storage.max_file_size_mb
        << YAML::EndMap;

    out << YAML::Key << "checkpoint" << YAML::Value << YAML::BeginMap
        << YAML::Key << "auto_checkpoint_enabled" << YAML::Value << checkpoint.auto_checkpoint_enabled
        << YAML::Key << "strategy" << YAML::Value << checkpoint.strategy
        << YAML::Key << "smart_message_threshold" << YAML::Value << checkpoint.smart_message_threshold
        << YAML::Key << "smart_file_threshold" << YAML::Value << checkpoint.smart_file_threshold
        << YAML::Key << "smart_interval_minutes" << YAML::Value << checkpoint.smart_interval_minutes
        << YAML::Key << "max_checkpoints" << YAML::Value << checkpoint.max_checkpoints
        << YAML::Key << "restore_removes_untracked" << YAML::Value << checkpoint.restore_removes_untracked
        << YAML::Key << "ignore_dirs" << YAML::Value << YAML::Flow << checkpoint.ignore_dirs
        << YAML::EndMap;

    out << YAML::Key << "concurrency" << YAML::Value << YAML::BeginMap
        << YAML::Key << "thread_pool_size" << YAML::Value << concurrency.thread_pool_size
        << YAML::EndMap;

    out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap
        << YAML::Key << "log_level" << YAML::Value << observability.log_level
        << YAML::Key << "log_path" << YAML::Value << observability.log_path.string()
        << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good()) {
        return Result<void, Error>::err(ErrorCode::InternalError, out.GetLastError(), path.string());
    }
    return write_file_atomic(expand_path(path), std::string(out.c_str()) + "\n");
}

}  // namespace retrace::core
