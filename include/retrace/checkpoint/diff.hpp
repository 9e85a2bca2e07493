#pragma once

#include "types.hpp"

#include <string_view>

namespace retrace::checkpoint {

// Number of lines in the text; a trailing fragment without '\n' counts
size_t count_lines(std::string_view text);

// Compare two loaded checkpoints by path.
// A path in both with different hashes is modified; its additions are the
// line count of the new content and its deletions the line count of the old.
// Outputs are sorted by path.
CheckpointDiff compute_diff(const LoadedCheckpoint& from, const LoadedCheckpoint& to);

}  // namespace retrace::checkpoint
