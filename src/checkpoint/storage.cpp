#include "retrace/checkpoint/storage.hpp"
#include "retrace/core/file_io.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <sstream>

namespace retrace::checkpoint {

namespace {

constexpr const char* kMetadataFile = "metadata.json";
constexpr const char* kFilesFile = "files.json";
constexpr const char* kMessagesFile = "messages.jsonl";
constexpr const char* kTimelineFile = "timeline.json";
constexpr const char* kStagingPrefix = ".staging-";

Error invalid_id(const std::string& what, const std::string& id) {
    return Error{ErrorCode::InvalidArgument, "Invalid " + what + " id", id};
}

Result<Json, Error> read_json(const fs::path& path) {
    auto data = read_file(path);
    if (data.is_err()) {
        return Result<Json, Error>::err(std::move(data).error());
    }

    try {
        return Result<Json, Error>::ok(Json::parse(data.value()));
    } catch (const Json::parse_error& e) {
        return Result<Json, Error>::err(
            ErrorCode::ContentCorrupted,
            std::string("Malformed JSON: ") + e.what(),
            path.string()
        );
    }
}

}  // namespace

bool is_valid_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    if (id.rfind(kStagingPrefix, 0) == 0) return false;
    return std::none_of(id.begin(), id.end(), [](char c) {
        return c == '/' || c == '\\' || c == '\0';
    });
}

CheckpointStorage::CheckpointStorage(const fs::path& root)
    : root_(root)
{
}

fs::path CheckpointStorage::project_path(const ProjectId& project_id) const {
    return root_ / "projects" / project_id;
}

fs::path CheckpointStorage::session_path(const ProjectId& project_id,
                                         const SessionId& session_id) const {
    return project_path(project_id) / "sessions" / session_id;
}

fs::path CheckpointStorage::checkpoints_path(const ProjectId& project_id,
                                             const SessionId& session_id) const {
    return session_path(project_id, session_id) / "checkpoints";
}

fs::path CheckpointStorage::checkpoint_path(const ProjectId& project_id,
                                            const SessionId& session_id,
                                            const CheckpointId& checkpoint_id) const {
    return checkpoints_path(project_id, session_id) / checkpoint_id;
}

fs::path CheckpointStorage::timeline_path(const ProjectId& project_id,
                                          const SessionId& session_id) const {
    return session_path(project_id, session_id) / kTimelineFile;
}

ContentStore CheckpointStorage::content_store(const ProjectId& project_id) const {
    return ContentStore(project_path(project_id) / "content_pool");
}

Result<Checkpoint, Error> CheckpointStorage::save_checkpoint(
    Checkpoint checkpoint,
    std::vector<FileSnapshot> files,
    const std::string& transcript)
{
    if (!is_valid_id(checkpoint.project_id)) {
        return Result<Checkpoint, Error>::err(invalid_id("project", checkpoint.project_id));
    }
    if (!is_valid_id(checkpoint.session_id)) {
        return Result<Checkpoint, Error>::err(invalid_id("session", checkpoint.session_id));
    }
    if (!is_valid_id(checkpoint.id)) {
        return Result<Checkpoint, Error>::err(invalid_id("checkpoint", checkpoint.id));
    }

    std::shared_lock lock(gc_mutex_);

    fs::path final_dir = checkpoint_path(checkpoint.project_id, checkpoint.session_id, checkpoint.id);
    std::error_code ec;
    if (fs::exists(final_dir, ec)) {
        return Result<Checkpoint, Error>::err(
            ErrorCode::AlreadyExists,
            "Checkpoint record already exists",
            checkpoint.id
        );
    }

    // Blobs first: a record must never name content that is not durable
    ContentStore store = content_store(checkpoint.project_id);
    Json manifest = Json::array();
    uint64_t total_size = 0;

    for (auto& file : files) {
        auto hash = store.put(file.content);
        if (hash.is_err()) {
            return Result<Checkpoint, Error>::err(
                std::move(hash).error().with_source(file.file_path));
        }
        file.checkpoint_id = checkpoint.id;
        file.hash = std::move(hash).value();
        file.size = file.content.size();
        total_size += file.size;
        manifest.push_back(file.to_json());
    }

    checkpoint.metadata.file_count = files.size();
    checkpoint.metadata.snapshot_size = total_size;

    fs::path staging = checkpoints_path(checkpoint.project_id, checkpoint.session_id)
                       / (std::string(kStagingPrefix) + checkpoint.id);

    try {
        fs::remove_all(staging);
        fs::create_directories(staging);

        auto write_all = [&]() -> Result<void, Error> {
            RETRACE_TRY_VOID(write_file_atomic(staging / kMetadataFile, checkpoint.to_json().dump(2)));
            RETRACE_TRY_VOID(write_file_atomic(staging / kFilesFile, manifest.dump(2)));
            RETRACE_TRY_VOID(write_file_atomic(staging / kMessagesFile, transcript));
            return Result<void, Error>::ok();
        };

        auto written = write_all();
        if (written.is_err()) {
            fs::remove_all(staging, ec);
            Error e = std::move(written).error();
            e.code = ErrorCode::StorageIO;
            return Result<Checkpoint, Error>::err(std::move(e));
        }

        fs::rename(staging, final_dir);
    } catch (const fs::filesystem_error& e) {
        fs::remove_all(staging, ec);
        return Result<Checkpoint, Error>::err(
            ErrorCode::StorageIO,
            std::string("Failed to write checkpoint record: ") + e.what(),
            checkpoint.id
        );
    }

    spdlog::debug("Saved checkpoint {} ({} files, {} bytes)",
                  checkpoint.id, files.size(), total_size);
    return Result<Checkpoint, Error>::ok(std::move(checkpoint));
}

Result<Checkpoint, Error> CheckpointStorage::load_record(
    const ProjectId& project_id,
    const SessionId& session_id,
    const CheckpointId& checkpoint_id) const
{
    if (!is_valid_id(project_id) || !is_valid_id(session_id) || !is_valid_id(checkpoint_id)) {
        return Result<Checkpoint, Error>::err(invalid_id("checkpoint", checkpoint_id));
    }

    fs::path dir = checkpoint_path(project_id, session_id, checkpoint_id);
    std::error_code ec;
    if (!fs::exists(dir / kMetadataFile, ec)) {
        return Result<Checkpoint, Error>::err(
            ErrorCode::CheckpointNotFound,
            "Checkpoint not found",
            checkpoint_id
        );
    }

    return read_record(dir);
}

Result<Checkpoint, Error> CheckpointStorage::read_record(const fs::path& dir) const {
    auto json = read_json(dir / kMetadataFile);
    if (json.is_err()) {
        return Result<Checkpoint, Error>::err(std::move(json).error());
    }

    try {
        return Result<Checkpoint, Error>::ok(Checkpoint::from_json(json.value()));
    } catch (const Json::exception& e) {
        return Result<Checkpoint, Error>::err(
            ErrorCode::ContentCorrupted,
            std::string("Malformed checkpoint metadata: ") + e.what(),
            dir.filename().string()
        );
    }
}

Result<std::vector<FileSnapshot>, Error> CheckpointStorage::load_manifest(const fs::path& dir) const {
    auto json = read_json(dir / kFilesFile);
    if (json.is_err()) {
        return Result<std::vector<FileSnapshot>, Error>::err(std::move(json).error());
    }

    std::vector<FileSnapshot> files;
    try {
        for (const auto& item : json.value()) {
            files.push_back(FileSnapshot::from_json(item));
        }
    } catch (const Json::exception& e) {
        return Result<std::vector<FileSnapshot>, Error>::err(
            ErrorCode::ContentCorrupted,
            std::string("Malformed file manifest: ") + e.what(),
            dir.string()
        );
    }
    return Result<std::vector<FileSnapshot>, Error>::ok(std::move(files));
}

Result<LoadedCheckpoint, Error> CheckpointStorage::load_checkpoint(
    const ProjectId& project_id,
    const SessionId& session_id,
    const CheckpointId& checkpoint_id) const
{
    auto record = load_record(project_id, session_id, checkpoint_id);
    if (record.is_err()) {
        return Result<LoadedCheckpoint, Error>::err(std::move(record).error());
    }

    fs::path dir = checkpoint_path(project_id, session_id, checkpoint_id);
    auto manifest = load_manifest(dir);
    if (manifest.is_err()) {
        return Result<LoadedCheckpoint, Error>::err(std::move(manifest).error());
    }

    LoadedCheckpoint loaded;
    loaded.checkpoint = std::move(record).value();

    ContentStore store = content_store(project_id);
    for (auto& file : manifest.value()) {
        auto content = store.get(file.hash);
        if (content.is_err()) {
            return Result<LoadedCheckpoint, Error>::err(
                std::move(content).error().with_source(file.file_path));
        }
        file.checkpoint_id = checkpoint_id;
        file.content = std::move(content).value();
        loaded.files.push_back(std::move(file));
    }

    std::error_code ec;
    if (fs::exists(dir / kMessagesFile, ec)) {
        auto transcript = read_file(dir / kMessagesFile);
        if (transcript.is_err()) {
            return Result<LoadedCheckpoint, Error>::err(std::move(transcript).error());
        }
        loaded.transcript = std::move(transcript).value();
    }

    return Result<LoadedCheckpoint, Error>::ok(std::move(loaded));
}

Result<std::vector<Checkpoint>, Error> CheckpointStorage::list_checkpoints(
    const ProjectId& project_id,
    const SessionId& session_id) const
{
    auto timeline = load_timeline(project_id, session_id);
    if (timeline.is_err()) {
        return Result<std::vector<Checkpoint>, Error>::err(std::move(timeline).error());
    }
    if (!timeline.value()) {
        return Result<std::vector<Checkpoint>, Error>::ok({});
    }
    return Result<std::vector<Checkpoint>, Error>::ok(timeline.value()->checkpoints());
}

Result<std::optional<Timeline>, Error> CheckpointStorage::load_timeline(
    const ProjectId& project_id,
    const SessionId& session_id) const
{
    if (!is_valid_id(project_id) || !is_valid_id(session_id)) {
        return Result<std::optional<Timeline>, Error>::err(invalid_id("session", session_id));
    }

    fs::path path = timeline_path(project_id, session_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<Timeline>, Error>::ok(std::nullopt);
    }

    auto json = read_json(path);
    if (json.is_err()) {
        return Result<std::optional<Timeline>, Error>::err(std::move(json).error());
    }

    try {
        return Result<std::optional<Timeline>, Error>::ok(Timeline::from_json(json.value()));
    } catch (const Json::exception& e) {
        return Result<std::optional<Timeline>, Error>::err(
            ErrorCode::ContentCorrupted,
            std::string("Malformed timeline: ") + e.what(),
            path.string()
        );
    }
}

Result<void, Error> CheckpointStorage::save_timeline(const Timeline& timeline) {
    if (!is_valid_id(timeline.project_id()) || !is_valid_id(timeline.session_id())) {
        return Result<void, Error>::err(invalid_id("session", timeline.session_id()));
    }

    auto written = write_file_atomic(timeline_path(timeline.project_id(), timeline.session_id()),
                                     timeline.to_json().dump(2));
    if (written.is_err()) {
        Error e = std::move(written).error();
        e.code = ErrorCode::StorageIO;
        return Result<void, Error>::err(std::move(e));
    }
    return Result<void, Error>::ok();
}

bool CheckpointStorage::checkpoint_exists(const ProjectId& project_id,
                                          const SessionId& session_id,
                                          const CheckpointId& checkpoint_id) const {
    if (!is_valid_id(project_id) || !is_valid_id(session_id) || !is_valid_id(checkpoint_id)) {
        return false;
    }
    std::error_code ec;
    return fs::exists(checkpoint_path(project_id, session_id, checkpoint_id) / kMetadataFile, ec);
}

std::vector<SessionId> CheckpointStorage::list_sessions(const ProjectId& project_id) const {
    std::vector<SessionId> sessions;
    if (!is_valid_id(project_id)) return sessions;

    fs::path dir = project_path(project_id) / "sessions";
    std::error_code ec;
    if (!fs::exists(dir, ec)) return sessions;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_directory()) {
            sessions.push_back(entry.path().filename().string());
        }
    }
    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

std::optional<SessionId> CheckpointStorage::find_checkpoint_session(
    const ProjectId& project_id,
    const CheckpointId& checkpoint_id) const
{
    for (const auto& session : list_sessions(project_id)) {
        if (checkpoint_exists(project_id, session, checkpoint_id)) {
            return session;
        }
    }
    return std::nullopt;
}

Result<void, Error> CheckpointStorage::remove_record_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return Result<void, Error>::err(
            ErrorCode::StorageIO,
            "Failed to remove checkpoint record: " + ec.message(),
            dir.string()
        );
    }
    return Result<void, Error>::ok();
}

Result<void, Error> CheckpointStorage::delete_checkpoint(const ProjectId& project_id,
                                                         const SessionId& session_id,
                                                         const CheckpointId& checkpoint_id) {
    if (!checkpoint_exists(project_id, session_id, checkpoint_id)) {
        return Result<void, Error>::err(
            ErrorCode::CheckpointNotFound,
            "Checkpoint not found",
            checkpoint_id
        );
    }
    std::unique_lock lock(gc_mutex_);
    return remove_record_dir(checkpoint_path(project_id, session_id, checkpoint_id));
}

Result<std::set<ContentHash>, Error> CheckpointStorage::referenced_hashes(
    const ProjectId& project_id) const
{
    std::set<ContentHash> hashes;

    for (const auto& session : list_sessions(project_id)) {
        fs::path dir = checkpoints_path(project_id, session);
        std::error_code ec;
        if (!fs::exists(dir, ec)) continue;

        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_directory()) continue;

            // A staging dir still counts: its blobs may be mid-commit
            auto manifest = load_manifest(entry.path());
            if (manifest.is_err()) {
                if (manifest.error().is_not_found()) continue;
                return Result<std::set<ContentHash>, Error>::err(std::move(manifest).error());
            }
            for (const auto& file : manifest.value()) {
                hashes.insert(file.hash);
            }
        }
    }

    return Result<std::set<ContentHash>, Error>::ok(std::move(hashes));
}

Result<std::set<CheckpointId>, Error> CheckpointStorage::branch_points(
    const ProjectId& project_id,
    const SessionId& session_id) const
{
    std::set<CheckpointId> pinned;

    for (const auto& other : list_sessions(project_id)) {
        if (other == session_id) continue;

        fs::path dir = checkpoints_path(project_id, other);
        std::error_code ec;
        if (!fs::exists(dir, ec)) continue;

        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_directory()) continue;
            if (!fs::exists(entry.path() / kMetadataFile, ec)) continue;

            // Staging records count too: a fork may be between save and commit
            auto record = read_record(entry.path());
            if (record.is_err()) {
                return Result<std::set<CheckpointId>, Error>::err(std::move(record).error());
            }
            const Checkpoint& cp = record.value();
            if (cp.parent_id && cp.parent_session_id == session_id) {
                pinned.insert(*cp.parent_id);
            }
        }
    }

    return Result<std::set<CheckpointId>, Error>::ok(std::move(pinned));
}

Result<size_t, Error> CheckpointStorage::cleanup_old_checkpoints(const ProjectId& project_id,
                                                                 const SessionId& session_id,
                                                                 size_t keep_count) {
    auto loaded = load_timeline(project_id, session_id);
    if (loaded.is_err()) {
        return Result<size_t, Error>::err(std::move(loaded).error());
    }
    if (!loaded.value()) {
        return Result<size_t, Error>::err(
            ErrorCode::SessionNotFound,
            "Session has no timeline",
            session_id
        );
    }

    std::unique_lock lock(gc_mutex_);

    auto pinned = branch_points(project_id, session_id);
    if (pinned.is_err()) {
        return Result<size_t, Error>::err(std::move(pinned).error());
    }

    Timeline timeline = std::move(*loaded.value());
    std::vector<CheckpointId> removed = timeline.retain_most_recent(keep_count, pinned.value());

    // Timeline first so a crash past this point leaves only orphan records
    if (!removed.empty()) {
        RETRACE_TRY_VOID(save_timeline(timeline));
    }

    size_t deleted = 0;
    fs::path dir = checkpoints_path(project_id, session_id);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        std::vector<fs::path> doomed;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_directory()) continue;
            std::string name = entry.path().filename().string();
            // No save is in flight under the exclusive lock: any staging dir is a crash leftover
            if (name.rfind(kStagingPrefix, 0) == 0 || !timeline.contains(name)) {
                doomed.push_back(entry.path());
            }
        }

        for (const auto& path : doomed) {
            RETRACE_TRY_VOID(remove_record_dir(path));
            if (path.filename().string().rfind(kStagingPrefix, 0) != 0) {
                ++deleted;
            }
        }
    }

    auto referenced = referenced_hashes(project_id);
    if (referenced.is_err()) {
        return Result<size_t, Error>::err(std::move(referenced).error());
    }

    ContentStore store = content_store(project_id);
    auto swept = store.sweep(referenced.value());
    if (swept.is_err()) {
        return Result<size_t, Error>::err(std::move(swept).error());
    }

    spdlog::info("Cleaned up session {}: removed {} checkpoints, {} blobs",
                 session_id, deleted, swept.value());
    return Result<size_t, Error>::ok(deleted);
}

}  // namespace retrace::checkpoint
