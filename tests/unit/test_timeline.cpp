#include <catch2/catch_test_macros.hpp>
#include "retrace/checkpoint/timeline.hpp"

using namespace retrace::checkpoint;

namespace {

Checkpoint make_checkpoint(const std::string& id, std::optional<std::string> parent = std::nullopt) {
    Checkpoint cp;
    cp.id = id;
    cp.session_id = "s1";
    cp.project_id = "p1";
    cp.parent_id = std::move(parent);
    cp.created_at = from_epoch_ms(1700000000000);
    return cp;
}

}  // namespace

TEST_CASE("New timeline is empty and manual", "[timeline]") {
    Timeline timeline("s1", "p1");

    auto view = timeline.get_timeline();
    REQUIRE(view.total_checkpoints == 0);
    REQUIRE_FALSE(view.current_checkpoint_id);
    REQUIRE_FALSE(view.auto_checkpoint_enabled);
    REQUIRE(view.checkpoint_strategy == CheckpointStrategy::Manual);
    REQUIRE(view.roots.empty());
}

TEST_CASE("Append advances current", "[timeline]") {
    Timeline timeline("s1", "p1");

    REQUIRE(timeline.append(make_checkpoint("a")).is_ok());
    REQUIRE(timeline.append(make_checkpoint("b", "a")).is_ok());
    REQUIRE(timeline.current() == "b");

    REQUIRE(timeline.append(make_checkpoint("b", "a")).error().code == ErrorCode::AlreadyExists);
    REQUIRE(timeline.append(make_checkpoint("")).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Branches form a tree", "[timeline]") {
    Timeline timeline("s1", "p1");
    timeline.append(make_checkpoint("a"));
    timeline.append(make_checkpoint("b", "a"));
    REQUIRE(timeline.move_to("a").is_ok());
    timeline.append(make_checkpoint("c", "a"));

    auto view = timeline.get_timeline();
    REQUIRE(view.roots.size() == 1);
    REQUIRE(view.roots[0].checkpoint.id == "a");
    REQUIRE(view.roots[0].children.size() == 2);
    REQUIRE(timeline.children("a") == std::vector<CheckpointId>{"b", "c"});
    REQUIRE(timeline.lineage("c") == std::vector<CheckpointId>{"c", "a"});
}

TEST_CASE("Move to unknown checkpoint fails", "[timeline]") {
    Timeline timeline("s1", "p1");
    timeline.append(make_checkpoint("a"));

    REQUIRE(timeline.move_to("zzz").error().code == ErrorCode::CheckpointNotFound);
    REQUIRE(timeline.current() == "a");
}

TEST_CASE("Foreign parent makes a root", "[timeline]") {
    Timeline timeline("s2", "p1");
    auto cp = make_checkpoint("f", "other-session-cp");
    cp.parent_session_id = "s1";
    timeline.append(cp);

    auto view = timeline.get_timeline();
    REQUIRE(view.roots.size() == 1);
    REQUIRE(view.roots[0].checkpoint.parent_id == "other-session-cp");
}

TEST_CASE("Retention keeps the most recent", "[timeline]") {
    Timeline timeline("s1", "p1");
    timeline.append(make_checkpoint("a"));
    timeline.append(make_checkpoint("b", "a"));
    timeline.append(make_checkpoint("c", "b"));
    timeline.move_to("a");

    auto removed = timeline.retain_most_recent(2);
    REQUIRE(removed == std::vector<CheckpointId>{"a"});
    REQUIRE(timeline.size() == 2);
    REQUIRE(timeline.current() == "c");

    // "b" lost its parent and is now a root
    auto view = timeline.get_timeline();
    REQUIRE(view.roots.size() == 1);
    REQUIRE(view.roots[0].checkpoint.id == "b");

    REQUIRE(timeline.retain_most_recent(5).empty());
}

TEST_CASE("Retention skips pinned checkpoints", "[timeline]") {
    Timeline timeline("s1", "p1");
    timeline.append(make_checkpoint("a"));
    timeline.append(make_checkpoint("b", "a"));
    timeline.append(make_checkpoint("c", "b"));
    timeline.append(make_checkpoint("d", "c"));

    auto removed = timeline.retain_most_recent(1, {"a", "c"});
    REQUIRE(removed == std::vector<CheckpointId>{"b"});
    REQUIRE(timeline.size() == 3);
    REQUIRE(timeline.contains("a"));
    REQUIRE(timeline.contains("c"));
    REQUIRE(timeline.current() == "d");
}

TEST_CASE("Timeline JSON round trip", "[timeline]") {
    Timeline timeline("s1", "p1");
    timeline.update_settings(true, CheckpointStrategy::Smart);
    timeline.append(make_checkpoint("a"));
    timeline.append(make_checkpoint("b", "a"));
    timeline.move_to("a");

    Timeline copy = Timeline::from_json(timeline.to_json());
    REQUIRE(copy.session_id() == "s1");
    REQUIRE(copy.project_id() == "p1");
    REQUIRE(copy.auto_checkpoint_enabled());
    REQUIRE(copy.strategy() == CheckpointStrategy::Smart);
    REQUIRE(copy.current() == "a");
    REQUIRE(copy.size() == 2);
    REQUIRE(copy.find("b")->parent_id == "a");
    REQUIRE(copy.find("b")->created_at == from_epoch_ms(1700000000000));
}
