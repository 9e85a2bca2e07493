#pragma once

#include "result.hpp"

#include <filesystem>
#include <string>

namespace retrace::core {

namespace fs = std::filesystem;

// Read a whole file as bytes
Result<std::string, Error> read_file(const fs::path& path);

// Write to a temp sibling, then rename over the target.
// rename() within one directory is atomic on POSIX.
Result<void, Error> write_file_atomic(const fs::path& target, const std::string& data);

// Unique hidden temp name in the target's directory
fs::path temp_sibling(const fs::path& target);

}  // namespace retrace::core
