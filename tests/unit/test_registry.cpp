#include <catch2/catch_test_macros.hpp>
#include "retrace/checkpoint/registry.hpp"
#include "test_helpers.hpp"

#include <thread>
#include <vector>

using namespace retrace::checkpoint;
using retrace::test::TempDir;
using retrace::test::read_text;
using retrace::test::write_text;

namespace {

Config test_config(const TempDir& tmp) {
    Config config;
    config.storage.root = tmp / "store";
    return config;
}

}  // namespace

TEST_CASE("Registry creates managers lazily and idempotently", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    ManagerRegistry registry(test_config(tmp));

    REQUIRE(registry.active_count() == 0);
    REQUIRE(registry.find_manager("s1") == nullptr);

    auto first = registry.get_or_create_manager("s1", "p1", tmp / "project");
    auto again = registry.get_or_create_manager("s1", "p1", tmp / "project");
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == again.value());
    REQUIRE(registry.active_count() == 1);
    REQUIRE(registry.find_manager("s1") == first.value());
}

TEST_CASE("Registry refuses to rebind a session", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    fs::create_directories(tmp / "elsewhere");
    ManagerRegistry registry(test_config(tmp));

    REQUIRE(registry.get_or_create_manager("s1", "p1", tmp / "project").is_ok());

    auto other_project = registry.get_or_create_manager("s1", "p2", tmp / "project");
    REQUIRE(other_project.error().code == ErrorCode::InvalidArgument);

    auto other_path = registry.get_or_create_manager("s1", "p1", tmp / "elsewhere");
    REQUIRE(other_path.error().code == ErrorCode::InvalidArgument);

    REQUIRE(registry.active_count() == 1);
}

TEST_CASE("Registry rejects a missing project path", "[registry]") {
    TempDir tmp;
    ManagerRegistry registry(test_config(tmp));

    auto result = registry.get_or_create_manager("s1", "p1", tmp / "missing");
    REQUIRE(result.error().code == ErrorCode::FileNotFound);
    REQUIRE(registry.active_count() == 0);
}

TEST_CASE("Registry lists and removes sessions", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    ManagerRegistry registry(test_config(tmp));

    for (const char* id : {"s3", "s1", "s2"}) {
        REQUIRE(registry.get_or_create_manager(id, "p1", tmp / "project").is_ok());
    }
    REQUIRE(registry.list_active_sessions() == std::vector<SessionId>{"s1", "s2", "s3"});

    REQUIRE(registry.remove_manager("s2"));
    REQUIRE_FALSE(registry.remove_manager("s2"));
    REQUIRE(registry.list_active_sessions() == std::vector<SessionId>{"s1", "s3"});
}

TEST_CASE("Managers of one project share storage", "[registry]") {
    TempDir tmp;
    ManagerRegistry registry(test_config(tmp));

    REQUIRE(registry.storage_for("p1") == registry.storage_for("p1"));
    REQUIRE(registry.storage_for("p1") != registry.storage_for("p2"));
}

TEST_CASE("Removed session resumes from storage", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    write_text(tmp / "project" / "a.txt", "v1");
    ManagerRegistry registry(test_config(tmp));

    auto manager = registry.get_or_create_manager("s1", "p1", tmp / "project").value();
    auto cp = manager->create_checkpoint().value().checkpoint;
    REQUIRE(registry.remove_manager("s1"));

    auto revived = registry.get_or_create_manager("s1", "p1", tmp / "project").value();
    REQUIRE(revived != manager);
    REQUIRE(revived->get_timeline().current_checkpoint_id == cp.id);
}

TEST_CASE("Registry forks into a new session", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    fs::create_directories(tmp / "branch");
    write_text(tmp / "project" / "a.txt", "base");
    ManagerRegistry registry(test_config(tmp));

    auto source = registry.get_or_create_manager("s1", "p1", tmp / "project").value();
    auto base = source->create_checkpoint().value().checkpoint;
    write_text(tmp / "project" / "a.txt", "later");

    auto forked = registry.fork_from_checkpoint("s1", base.id, "s2", tmp / "branch",
                                                std::string("try again"));
    REQUIRE(forked.is_ok());
    REQUIRE(forked.value().checkpoint.description == "try again");
    REQUIRE(forked.value().checkpoint.parent_id == base.id);
    REQUIRE(read_text(tmp / "branch" / "a.txt") == "base");
    REQUIRE(read_text(tmp / "project" / "a.txt") == "later");
    REQUIRE(registry.active_count() == 2);
    REQUIRE(registry.find_manager("s2")->project_id() == "p1");

    REQUIRE(registry.fork_from_checkpoint("s1", base.id, "s1", tmp / "branch").error().code
            == ErrorCode::InvalidArgument);
    REQUIRE(registry.fork_from_checkpoint("nobody", base.id, "s3", tmp / "branch").error().code
            == ErrorCode::SessionNotFound);
    REQUIRE(registry.fork_from_checkpoint("s1", "missing", "s4", tmp / "branch").error().code
            == ErrorCode::CheckpointNotFound);
}

TEST_CASE("Forked session is independent of its source", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    fs::create_directories(tmp / "branch");
    write_text(tmp / "project" / "a.txt", "base");
    ManagerRegistry registry(test_config(tmp));

    auto source = registry.get_or_create_manager("s1", "p1", tmp / "project").value();
    auto a = source->create_checkpoint().value().checkpoint;
    write_text(tmp / "project" / "a.txt", "v2");
    auto b = source->create_checkpoint().value().checkpoint;

    auto forked = registry.fork_from_checkpoint("s1", a.id, "s2", tmp / "branch");
    REQUIRE(forked.is_ok());
    auto branch = registry.find_manager("s2");
    REQUIRE(branch->project_path() != source->project_path());

    // Moving the source around does not touch the branch
    REQUIRE(source->restore_checkpoint(b.id).is_ok());
    REQUIRE(read_text(tmp / "project" / "a.txt") == "v2");
    REQUIRE(read_text(tmp / "branch" / "a.txt") == "base");
    REQUIRE(source->restore_checkpoint(a.id).is_ok());
    REQUIRE(read_text(tmp / "branch" / "a.txt") == "base");

    write_text(tmp / "project" / "a.txt", "v3");
    REQUIRE(source->create_checkpoint().is_ok());
    REQUIRE(branch->list_checkpoints().size() == 1);
    REQUIRE(branch->get_timeline().current_checkpoint_id == forked.value().checkpoint.id);

    // Branch history stays out of the source
    write_text(tmp / "branch" / "a.txt", "branch edit");
    REQUIRE(branch->create_checkpoint().is_ok());
    REQUIRE(source->list_checkpoints().size() == 3);
    REQUIRE(read_text(tmp / "project" / "a.txt") == "v3");
}

TEST_CASE("Cleanup keeps checkpoints other sessions forked from", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    fs::create_directories(tmp / "branch");
    write_text(tmp / "project" / "a.txt", "base");
    ManagerRegistry registry(test_config(tmp));

    auto source = registry.get_or_create_manager("s1", "p1", tmp / "project").value();
    auto a = source->create_checkpoint().value().checkpoint;
    write_text(tmp / "project" / "a.txt", "v2");
    auto b = source->create_checkpoint().value().checkpoint;
    write_text(tmp / "project" / "a.txt", "v3");
    auto c = source->create_checkpoint().value().checkpoint;

    auto root = registry.fork_from_checkpoint("s1", a.id, "s2", tmp / "branch").value().checkpoint;

    // Only b is free to go: a roots the branch and c is the newest
    REQUIRE(source->cleanup_old_checkpoints(1).value() == 1);
    auto kept = source->list_checkpoints();
    REQUIRE(kept.size() == 2);
    REQUIRE(kept[0].id == a.id);
    REQUIRE(kept[1].id == c.id);
    REQUIRE(source->get_timeline().current_checkpoint_id == c.id);

    auto branch = registry.find_manager("s2");
    auto diff = branch->diff_checkpoints(a.id, root.id);
    REQUIRE(diff.is_ok());
    REQUIRE(diff.value().modified_files.empty());
    REQUIRE(branch->load_checkpoint(a.id).value().files.size() == 1);
}

TEST_CASE("Concurrent opens of one session share a manager", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    write_text(tmp / "project" / "a.txt", "v1");
    ManagerRegistry registry(test_config(tmp));

    std::vector<std::shared_ptr<CheckpointManager>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] {
            auto opened = registry.get_or_create_manager("s1", "p1", tmp / "project");
            if (opened.is_ok()) {
                seen[i] = opened.value();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(registry.active_count() == 1);
    for (const auto& manager : seen) {
        REQUIRE(manager == registry.find_manager("s1"));
    }
}

TEST_CASE("Registry surfaces an invalid configuration", "[registry]") {
    TempDir tmp;
    fs::create_directories(tmp / "project");
    Config config = test_config(tmp);
    config.checkpoint.smart_message_threshold = -3;
    ManagerRegistry registry(config);

    auto opened = registry.get_or_create_manager("s1", "p1", tmp / "project");
    REQUIRE(opened.error().code == ErrorCode::ConfigValidationFailed);
    REQUIRE(registry.active_count() == 0);
}
