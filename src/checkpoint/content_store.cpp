#include "retrace/checkpoint/content_store.hpp"
#include "retrace/core/file_io.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace retrace::checkpoint {

namespace {

bool valid_hash(const ContentHash& h) {
    if (h.size() != SHA256_DIGEST_LENGTH * 2) return false;
    return std::all_of(h.begin(), h.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// Existing blob has the expected size and digest. A damaged blob is
// overwritten by the next put of the same content.
bool intact(const fs::path& path, const ContentHash& hash, uintmax_t size) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;
    if (fs::file_size(path, ec) != size || ec) {
        spdlog::warn("Replacing damaged blob {}", hash);
        return false;
    }
    auto data = read_file(path);
    if (data.is_err() || content_hash(data.value()) != hash) {
        spdlog::warn("Replacing damaged blob {}", hash);
        return false;
    }
    return true;
}

}  // namespace

ContentHash content_hash(std::string_view content) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), digest);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned char c : digest) {
        out << std::setw(2) << static_cast<int>(c);
    }
    return out.str();
}

ContentStore::ContentStore(const fs::path& root)
    : root_(root)
{
}

fs::path ContentStore::blob_path(const ContentHash& hash) const {
    return root_ / hash.substr(0, 2) / hash;
}

Result<ContentHash, Error> ContentStore::put(const std::string& content) {
    ContentHash hash = content_hash(content);
    fs::path path = blob_path(hash);

    if (intact(path, hash, content.size())) {
        return Result<ContentHash, Error>::ok(std::move(hash));
    }

    auto written = write_file_atomic(path, content);
    if (written.is_err()) {
        Error e = std::move(written).error();
        e.code = ErrorCode::StorageIO;
        return Result<ContentHash, Error>::err(std::move(e));
    }

    return Result<ContentHash, Error>::ok(std::move(hash));
}

Result<std::string, Error> ContentStore::get(const ContentHash& hash) const {
    if (!valid_hash(hash)) {
        return Result<std::string, Error>::err(
            ErrorCode::InvalidArgument,
            "Malformed content hash",
            hash
        );
    }

    fs::path path = blob_path(hash);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string, Error>::err(
            ErrorCode::BlobNotFound,
            "Content blob not found",
            hash
        );
    }

    auto data = read_file(path);
    if (data.is_err()) {
        Error e = std::move(data).error();
        e.code = ErrorCode::StorageIO;
        return Result<std::string, Error>::err(std::move(e));
    }

    if (content_hash(data.value()) != hash) {
        return Result<std::string, Error>::err(
            ErrorCode::ContentCorrupted,
            "Stored blob does not match its hash",
            hash
        );
    }

    return data;
}

bool ContentStore::contains(const ContentHash& hash) const {
    if (!valid_hash(hash)) return false;
    std::error_code ec;
    return fs::exists(blob_path(hash), ec);
}

Result<void, Error> ContentStore::remove(const ContentHash& hash) {
    if (!valid_hash(hash)) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Malformed content hash",
            hash
        );
    }

    std::error_code ec;
    fs::path path = blob_path(hash);
    fs::remove(path, ec);
    if (ec) {
        return Result<void, Error>::err(
            ErrorCode::StorageIO,
            "Failed to remove blob: " + ec.message(),
            path.string()
        );
    }

    // Drop the shard directory once it is empty
    fs::path shard = path.parent_path();
    if (fs::is_empty(shard, ec) && !ec) {
        fs::remove(shard, ec);
    }

    return Result<void, Error>::ok();
}

std::vector<ContentHash> ContentStore::list() const {
    std::vector<ContentHash> hashes;

    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return hashes;
    }

    for (const auto& shard : fs::directory_iterator(root_, ec)) {
        if (!shard.is_directory()) continue;
        std::error_code inner;
        for (const auto& entry : fs::directory_iterator(shard.path(), inner)) {
            std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && valid_hash(name)) {
                hashes.push_back(std::move(name));
            }
        }
    }

    std::sort(hashes.begin(), hashes.end());
    return hashes;
}

Result<size_t, Error> ContentStore::sweep(const std::set<ContentHash>& referenced) {
    size_t removed = 0;

    for (const auto& hash : list()) {
        if (referenced.count(hash)) continue;

        auto result = remove(hash);
        if (result.is_err()) {
            return Result<size_t, Error>::err(std::move(result).error());
        }
        ++removed;
    }

    if (removed > 0) {
        spdlog::debug("Swept {} unreferenced blobs from {}", removed, root_.string());
    }
    return Result<size_t, Error>::ok(removed);
}

}  // namespace retrace::checkpoint
