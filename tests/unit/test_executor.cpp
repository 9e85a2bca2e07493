#include <catch2/catch_test_macros.hpp>
#include "retrace/checkpoint/executor.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace retrace::checkpoint;
using retrace::test::TempDir;
using retrace::test::read_text;
using retrace::test::write_text;

TEST_CASE("Executor runs operations off the calling thread", "[executor]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    write_text(tmp / "project" / "a.txt", "v1");

    Config config;
    config.storage.root = tmp / "store";
    ManagerRegistry registry(config);
    REQUIRE(registry.get_or_create_manager("s1", "p1", tmp / "project").is_ok());

    CheckpointExecutor executor(registry, config.concurrency);

    auto first = executor.create_async("s1", std::string("first")).get();
    REQUIRE(first.is_ok());

    write_text(tmp / "project" / "a.txt", "v2");
    auto second = executor.create_async("s1").get();
    REQUIRE(second.is_ok());

    auto diff = executor.diff_async("s1", first.value().checkpoint.id,
                                    second.value().checkpoint.id).get();
    REQUIRE(diff.is_ok());
    REQUIRE(diff.value().modified_files.size() == 1);

    auto restored = executor.restore_async("s1", first.value().checkpoint.id).get();
    REQUIRE(restored.is_ok());
    REQUIRE(read_text(tmp / "project" / "a.txt") == "v1");

    fs::create_directories(tmp / "branch");
    auto forked = executor.fork_async("s1", second.value().checkpoint.id, "s2", tmp / "branch").get();
    REQUIRE(forked.is_ok());
    REQUIRE(read_text(tmp / "branch" / "a.txt") == "v2");
    REQUIRE(read_text(tmp / "project" / "a.txt") == "v1");
}

TEST_CASE("Executor reports unknown sessions", "[executor]") {
    TempDir tmp;
    Config config;
    config.storage.root = tmp / "store";
    ManagerRegistry registry(config);
    CheckpointExecutor executor(registry, config.concurrency);

    REQUIRE(executor.create_async("ghost").get().error().code == ErrorCode::SessionNotFound);
    REQUIRE(executor.restore_async("ghost", "c1").get().error().code == ErrorCode::SessionNotFound);
    REQUIRE(executor.diff_async("ghost", "a", "b").get().error().code == ErrorCode::SessionNotFound);
}

TEST_CASE("Sessions in one project checkpoint in parallel", "[executor]") {
    TempDir tmp;
    Config config;
    config.storage.root = tmp / "store";
    config.concurrency.thread_pool_size = 4;
    ManagerRegistry registry(config);

    const int sessions = 4;
    for (int i = 0; i < sessions; ++i) {
        fs::path project = tmp / ("project" + std::to_string(i));
        write_text(project / "shared.txt", "same bytes everywhere");
        write_text(project / "own.txt", "session " + std::to_string(i));
        REQUIRE(registry.get_or_create_manager("s" + std::to_string(i), "p1", project).is_ok());
    }

    CheckpointExecutor executor(registry, config.concurrency);

    std::vector<std::future<Result<CheckpointResult, Error>>> pending;
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < sessions; ++i) {
            pending.push_back(executor.create_async("s" + std::to_string(i)));
        }
    }
    for (auto& f : pending) {
        REQUIRE(f.get().is_ok());
    }

    for (int i = 0; i < sessions; ++i) {
        auto manager = registry.find_manager("s" + std::to_string(i));
        REQUIRE(manager->list_checkpoints().size() == 3);
    }

    // Cleanup in one session while others keep saving must not lose shared blobs
    auto cleaner = registry.find_manager("s0");
    std::vector<std::future<Result<CheckpointResult, Error>>> more;
    for (int i = 1; i < sessions; ++i) {
        more.push_back(executor.create_async("s" + std::to_string(i)));
    }
    REQUIRE(cleaner->cleanup_old_checkpoints(1).is_ok());
    for (auto& f : more) {
        REQUIRE(f.get().is_ok());
    }

    for (int i = 1; i < sessions; ++i) {
        auto manager = registry.find_manager("s" + std::to_string(i));
        for (const auto& cp : manager->list_checkpoints()) {
            REQUIRE(manager->load_checkpoint(cp.id).is_ok());
        }
    }
}

TEST_CASE("Executor rejects work after shutdown", "[executor]") {
    TempDir tmp;
    Config config;
    config.storage.root = tmp / "store";
    ManagerRegistry registry(config);
    CheckpointExecutor executor(registry, config.concurrency);

    executor.shutdown();
    auto rejected = executor.create_async("s1").get();
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.error().code == ErrorCode::InvalidState);
}
