#include "retrace/checkpoint/diff.hpp"

#include <algorithm>
#include <map>

namespace retrace::checkpoint {

size_t count_lines(std::string_view text) {
    if (text.empty()) return 0;
    size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') {
        ++lines;
    }
    return lines;
}

CheckpointDiff compute_diff(const LoadedCheckpoint& from, const LoadedCheckpoint& to) {
    CheckpointDiff diff;
    diff.from_id = from.checkpoint.id;
    diff.to_id = to.checkpoint.id;
    diff.token_delta = to.checkpoint.metadata.total_tokens - from.checkpoint.metadata.total_tokens;

    std::map<std::string, const FileSnapshot*> before;
    for (const auto& f : from.files) {
        before[f.file_path] = &f;
    }
    std::map<std::string, const FileSnapshot*> after;
    for (const auto& f : to.files) {
        after[f.file_path] = &f;
    }

    for (const auto& [path, snap] : after) {
        auto it = before.find(path);
        if (it == before.end()) {
            diff.added_files.push_back(path);
        } else if (it->second->hash != snap->hash) {
            FileDiff fd;
            fd.path = path;
            fd.additions = count_lines(snap->content);
            fd.deletions = count_lines(it->second->content);
            diff.modified_files.push_back(std::move(fd));
        }
    }

    for (const auto& [path, snap] : before) {
        if (!after.count(path)) {
            diff.deleted_files.push_back(path);
        }
    }

    return diff;
}

}  // namespace retrace::checkpoint
