#include "retrace/core/file_io.hpp"

#include <fstream>
#include <iterator>
#include <random>

namespace retrace::core {

fs::path temp_sibling(const fs::path& target) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    return target.parent_path() /
           (".tmp_" + target.filename().string() + "_" + std::to_string(dist(rng)));
}

Result<std::string, Error> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string, Error>::err(
            ErrorCode::FileNotFound,
            "File not found",
            path.string()
        );
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string, Error>::err(
            ErrorCode::FileReadFailed,
            "Failed to open file for reading",
            path.string()
        );
    }

    std::string data((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string, Error>::err(
            ErrorCode::FileReadFailed,
            "Failed while reading file",
            path.string()
        );
    }

    return Result<std::string, Error>::ok(std::move(data));
}

Result<void, Error> write_file_atomic(const fs::path& target, const std::string& data) {
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to create directory: " + ec.message(),
                target.parent_path().string()
            );
        }
    }

    const fs::path tmp = temp_sibling(target);
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open file for writing",
                target.string()
            );
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(tmp, ec);
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to write file",
                target.string()
            );
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "Failed to move file into place: " + ec.message(),
            target.string()
        );
    }

    return Result<void, Error>::ok();
}

}  // namespace retrace::core
