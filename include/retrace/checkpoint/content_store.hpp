#pragma once

#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;
namespace fs = std::filesystem;

// Lower-case hex SHA-256 of the bytes
ContentHash content_hash(std::string_view content);

// Content-addressed blob store.
//
// Blobs are keyed by the SHA-256 of their bytes and laid out as
// <root>/<first two hex chars>/<hash>. Storing the same bytes twice keeps one
// copy. Not internally locked: callers that sweep must exclude concurrent puts.
class ContentStore {
public:
    explicit ContentStore(const fs::path& root);

    Result<ContentHash, Error> put(const std::string& content);
    Result<std::string, Error> get(const ContentHash& hash) const;

    bool contains(const ContentHash& hash) const;
    Result<void, Error> remove(const ContentHash& hash);

    // Every stored hash, sorted
    std::vector<ContentHash> list() const;

    // Remove every blob not in `referenced`; returns how many were removed
    Result<size_t, Error> sweep(const std::set<ContentHash>& referenced);

    const fs::path& root() const { return root_; }

private:
    fs::path root_;

    fs::path blob_path(const ContentHash& hash) const;
};

}  // namespace retrace::checkpoint
