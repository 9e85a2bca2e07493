#include <catch2/catch_test_macros.hpp>
#include "retrace/checkpoint/content_store.hpp"
#include "test_helpers.hpp"

using namespace retrace::checkpoint;
using retrace::test::TempDir;

TEST_CASE("Content hash is stable SHA-256", "[content_store]") {
    REQUIRE(content_hash("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(content_hash("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(content_hash("abc") == content_hash("abc"));
    REQUIRE(content_hash("abc") != content_hash("abd"));
}

TEST_CASE("Put is idempotent and get returns the bytes", "[content_store]") {
    TempDir dir;
    ContentStore store(dir.path());

    auto first = store.put("hello\n");
    auto second = store.put("hello\n");
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == second.value());
    REQUIRE(store.list().size() == 1);

    auto data = store.get(first.value());
    REQUIRE(data.is_ok());
    REQUIRE(data.value() == "hello\n");

    // Sharded by the first two hex characters
    REQUIRE(fs::exists(dir.path() / first.value().substr(0, 2) / first.value()));
}

TEST_CASE("Missing and malformed hashes", "[content_store]") {
    TempDir dir;
    ContentStore store(dir.path());

    auto missing = store.get(content_hash("never stored"));
    REQUIRE(missing.error().code == ErrorCode::BlobNotFound);

    auto malformed = store.get("../../etc/passwd");
    REQUIRE(malformed.error().code == ErrorCode::InvalidArgument);
    REQUIRE_FALSE(store.contains("xyz"));
}

TEST_CASE("Corrupted blob is detected", "[content_store]") {
    TempDir dir;
    ContentStore store(dir.path());

    auto hash = store.put("original").value();
    retrace::test::write_text(dir.path() / hash.substr(0, 2) / hash, "tampered");

    REQUIRE(store.get(hash).error().code == ErrorCode::ContentCorrupted);
}

TEST_CASE("Putting the same bytes repairs a damaged blob", "[content_store]") {
    TempDir dir;
    ContentStore store(dir.path());

    auto hash = store.put("original").value();
    const fs::path blob = dir.path() / hash.substr(0, 2) / hash;

    // Same length, different bytes
    retrace::test::write_text(blob, "0riginal");
    REQUIRE(store.get(hash).error().code == ErrorCode::ContentCorrupted);
    REQUIRE(store.put("original").value() == hash);
    REQUIRE(store.get(hash).value() == "original");

    fs::resize_file(blob, 0);
    REQUIRE(store.put("original").is_ok());
    REQUIRE(store.get(hash).value() == "original");
}

TEST_CASE("Sweep keeps referenced blobs", "[content_store]") {
    TempDir dir;
    ContentStore store(dir.path());

    auto keep = store.put("keep").value();
    auto drop1 = store.put("drop one").value();
    auto drop2 = store.put("drop two").value();

    auto swept = store.sweep({keep});
    REQUIRE(swept.value() == 2);
    REQUIRE(store.contains(keep));
    REQUIRE_FALSE(store.contains(drop1));
    REQUIRE_FALSE(store.contains(drop2));
    REQUIRE(store.list() == std::vector<ContentHash>{keep});
}
