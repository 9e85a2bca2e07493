#include <catch2/catch_test_macros.hpp>
#include "retrace/core/config.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace retrace::core;
using retrace::test::TempDir;
using retrace::test::write_text;

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.storage.max_file_size_mb == 10);
    REQUIRE(config.checkpoint.strategy == "manual");
    REQUIRE_FALSE(config.checkpoint.auto_checkpoint_enabled);
    REQUIRE_FALSE(config.checkpoint.restore_removes_untracked);
    REQUIRE(config.checkpoint.max_checkpoints == 0);
    REQUIRE(config.concurrency.thread_pool_size == 4);
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config smart thresholds", "[config]") {
    CheckpointConfig cp;

    REQUIRE(cp.smart_message_threshold == 20);
    REQUIRE(cp.smart_file_threshold == 5);
    REQUIRE(cp.smart_interval_minutes == 30);
}

TEST_CASE("Config ignores conventional build directories", "[config]") {
    CheckpointConfig cp;
    auto has = [&](const std::string& dir) {
        return std::find(cp.ignore_dirs.begin(), cp.ignore_dirs.end(), dir) != cp.ignore_dirs.end();
    };

    REQUIRE(has(".git"));
    REQUIRE(has("node_modules"));
    REQUIRE(has("target"));
    REQUIRE_FALSE(has("src"));
}

TEST_CASE("Config loads from YAML", "[config]") {
    TempDir dir;
    write_text(dir / "config.yaml",
        "storage:\n"
        "  root: /tmp/retrace-store\n"
        "checkpoint:\n"
        "  auto_checkpoint_enabled: true\n"
        "  strategy: smart\n"
        "  smart_message_threshold: 3\n"
        "  ignore_dirs: [vendor]\n"
        "concurrency:\n"
        "  thread_pool_size: 2\n");

    auto result = Config::load(dir / "config.yaml");
    REQUIRE(result.is_ok());

    const Config& config = result.value();
    REQUIRE(config.storage.root.string() == "/tmp/retrace-store");
    REQUIRE(config.checkpoint.auto_checkpoint_enabled);
    REQUIRE(config.checkpoint.strategy == "smart");
    REQUIRE(config.checkpoint.smart_message_threshold == 3);
    REQUIRE(config.checkpoint.smart_file_threshold == 5);
    REQUIRE(config.checkpoint.ignore_dirs == std::vector<std::string>{"vendor"});
    REQUIRE(config.concurrency.thread_pool_size == 2);
}

TEST_CASE("Config save and load agree", "[config]") {
    TempDir dir;
    Config config;
    config.storage.root = dir.path() / "store";
    config.checkpoint.strategy = "per_tool_use";
    config.checkpoint.max_checkpoints = 12;
    config.checkpoint.restore_removes_untracked = true;

    REQUIRE(config.save(dir / "out.yaml").is_ok());

    auto loaded = Config::load(dir / "out.yaml");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().storage.root == config.storage.root);
    REQUIRE(loaded.value().checkpoint.strategy == "per_tool_use");
    REQUIRE(loaded.value().checkpoint.max_checkpoints == 12);
    REQUIRE(loaded.value().checkpoint.restore_removes_untracked);
}

TEST_CASE("Config rejects unknown strategy", "[config]") {
    TempDir dir;
    write_text(dir / "config.yaml", "checkpoint:\n  strategy: hourly\n");

    auto result = Config::load(dir / "config.yaml");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
}

TEST_CASE("Config reports missing and malformed files", "[config]") {
    TempDir dir;
    REQUIRE(Config::load(dir / "absent.yaml").error().code == ErrorCode::ConfigNotFound);

    write_text(dir / "bad.yaml", "storage: [unclosed\n");
    REQUIRE(Config::load(dir / "bad.yaml").error().code == ErrorCode::ConfigParseFailed);

    Config fallback = Config::load_or_default(dir / "absent.yaml");
    REQUIRE(fallback.checkpoint.strategy == "manual");
}

TEST_CASE("Path expansion", "[config]") {
    REQUIRE(expand_path(std::string("/abs/path")) == "/abs/path");
    REQUIRE(expand_path(std::string("/a/${RETRACE_TEST_SURELY_UNSET}/b")) == "/a//b");
}
