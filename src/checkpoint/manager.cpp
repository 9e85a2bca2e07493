#include "retrace/checkpoint/manager.hpp"
#include "retrace/checkpoint/diff.hpp"
#include "retrace/core/file_io.hpp"
#include "retrace/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace retrace::checkpoint {

namespace {

// Persisted timestamps carry millisecond precision
TimePoint now_ms() {
    return from_epoch_ms(to_epoch_ms(Clock::now()));
}

bool escapes_root(const fs::path& rel) {
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return true;
    return std::any_of(rel.begin(), rel.end(), [](const fs::path& part) {
        return part == "..";
    });
}

}  // namespace

Result<std::shared_ptr<CheckpointManager>, Error> CheckpointManager::open(
    SessionId session_id,
    ProjectId project_id,
    fs::path project_path,
    std::shared_ptr<CheckpointStorage> storage,
    const Config& config)
{
    using R = Result<std::shared_ptr<CheckpointManager>, Error>;

    if (!is_valid_id(session_id)) {
        return R::err(ErrorCode::InvalidArgument, "Invalid session id", session_id);
    }
    if (!is_valid_id(project_id)) {
        return R::err(ErrorCode::InvalidArgument, "Invalid project id", project_id);
    }
    if (!storage) {
        return R::err(ErrorCode::InvalidArgument, "No checkpoint storage", project_id);
    }
    auto valid = config.validate();
    if (valid.is_err()) {
        return R::err(std::move(valid).error());
    }

    std::error_code ec;
    if (!fs::is_directory(project_path, ec)) {
        return R::err(ErrorCode::FileNotFound, "Project path is not a directory",
                      project_path.string());
    }
    fs::path root = fs::weakly_canonical(project_path, ec);
    if (ec) {
        root = fs::absolute(project_path);
    }

    auto loaded = storage->load_timeline(project_id, session_id);
    if (loaded.is_err()) {
        return R::err(std::move(loaded).error().with_source("session " + session_id));
    }

    std::shared_ptr<CheckpointManager> manager(
        new CheckpointManager(session_id, project_id, root, std::move(storage), config));

    if (loaded.value()) {
        Timeline& timeline = *loaded.value();
        if (timeline.project_id() != project_id) {
            return R::err(ErrorCode::InvalidArgument,
                          "Session belongs to project " + timeline.project_id(),
                          session_id);
        }
        manager->timeline_ = std::move(timeline);
    } else {
        manager->timeline_ = Timeline(session_id, project_id);
        manager->timeline_.update_settings(
            config.checkpoint.auto_checkpoint_enabled,
            strategy_from_string(config.checkpoint.strategy).unwrap_or(CheckpointStrategy::Manual));
    }

    // Resume the transcript from the current checkpoint
    if (const auto& current = manager->timeline_.current()) {
        const Checkpoint* cp = manager->timeline_.find(*current);
        manager->last_checkpoint_at_ = cp->created_at;

        auto restored = manager->storage_->load_checkpoint(project_id, session_id, *current);
        if (restored.is_ok()) {
            manager->reset_transcript(restored.value().transcript);
            manager->last_checkpoint_at_ = cp->created_at;
        } else {
            spdlog::warn("Session {}: could not resume transcript from {}: {}",
                         session_id, *current, restored.error().full_message());
        }
    }

    spdlog::debug("Opened checkpoint manager for session {} ({} checkpoints)",
                  session_id, manager->timeline_.size());
    return R::ok(std::move(manager));
}

CheckpointManager::CheckpointManager(SessionId session_id,
                                     ProjectId project_id,
                                     fs::path project_path,
                                     std::shared_ptr<CheckpointStorage> storage,
                                     const Config& config)
    : session_id_(std::move(session_id))
    , project_id_(std::move(project_id))
    , project_path_(std::move(project_path))
    , storage_(std::move(storage))
    , config_(config.checkpoint)
    , max_file_size_(static_cast<uint64_t>(config.storage.max_file_size_mb) * 1024 * 1024)
    , last_checkpoint_at_(Clock::now())
{
    thresholds_.message_count = static_cast<size_t>(config.checkpoint.smart_message_threshold);
    thresholds_.file_count = static_cast<size_t>(config.checkpoint.smart_file_threshold);
    thresholds_.interval = std::chrono::minutes{config.checkpoint.smart_interval_minutes};
}

Error CheckpointManager::in_session(Error e) const {
    return e.with_source("session " + session_id_);
}

// ---------------------------------------------------------------------------
// Message tracking

Result<void, Error> CheckpointManager::track_message(const std::string& line) {
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    if (trimmed.empty()) {
        return Result<void, Error>::ok();
    }

    // A JSONL transcript cannot hold a line that spans lines
    if (trimmed.find('\n') != std::string::npos) {
        spdlog::warn("Session {}: refused multi-line transcript entry", session_id_);
        return Result<void, Error>::err(in_session(Error{
            ErrorCode::TranscriptCaptureFailed,
            "Transcript line contains an embedded newline"
        }));
    }

    TranscriptEntry entry = parse_transcript_line(trimmed);

    std::lock_guard<std::mutex> lock(mutex_);
    transcript_.push_back(std::move(trimmed));
    if (entry.parsed) {
        record_entry(entry, Clock::now());
    }
    return Result<void, Error>::ok();
}

void CheckpointManager::record_entry(const TranscriptEntry& entry, TimePoint at) {
    total_tokens_ += entry.total_tokens();
    if (entry.model) {
        last_model_ = entry.model;
    }
    if (entry.is_user_prompt() && !entry.text.empty()) {
        last_user_prompt_ = entry.text;
    }

    for (const auto& use : entry.tool_uses) {
        if (!use.mutating) continue;
        if (!use.id.empty()) {
            pending_mutations_.insert(use.id);
        }
        for (const auto& path : use.file_paths) {
            std::string rel = relative_path(path);
            file_times_[rel] = at;
            modified_since_checkpoint_.insert(rel);
        }
    }

    for (const auto& result : entry.tool_results) {
        pending_mutations_.erase(result.tool_use_id);
    }
}

std::string CheckpointManager::relative_path(const std::string& path) const {
    fs::path p = fs::path(path).lexically_normal();
    if (p.is_absolute()) {
        fs::path rel = p.lexically_relative(project_path_);
        if (!rel.empty() && !escapes_root(rel)) {
            return rel.generic_string();
        }
    }
    return p.generic_string();
}

bool CheckpointManager::should_auto_checkpoint(const std::string& candidate_line) const {
    TranscriptEntry candidate = parse_transcript_line(candidate_line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!timeline_.auto_checkpoint_enabled()) {
        return false;
    }

    for (auto& use : candidate.tool_uses) {
        for (auto& path : use.file_paths) {
            path = relative_path(path);
        }
    }

    TriggerContext ctx;
    ctx.buffered_messages = transcript_.size() - baseline_;
    ctx.files_modified = &modified_since_checkpoint_;
    ctx.pending_mutations = &pending_mutations_;
    ctx.last_checkpoint_at = last_checkpoint_at_;
    ctx.now = Clock::now();

    TriggerReason reason = evaluate_trigger(timeline_.strategy(), candidate, ctx, thresholds_);
    if (reason == TriggerReason::None) {
        return false;
    }

    spdlog::info("Auto-checkpoint due for session {} ({}: {})",
                 session_id_, strategy_to_string(timeline_.strategy()),
                 trigger_reason_to_string(reason));
    return true;
}

// ---------------------------------------------------------------------------
// Transcript

Result<std::string, Error> CheckpointManager::capture_transcript() const {
    std::string out;
    for (size_t i = 0; i < transcript_.size(); ++i) {
        const auto& line = transcript_[i];
        if (line.find('\n') != std::string::npos) {
            return Result<std::string, Error>::err(
                ErrorCode::TranscriptCaptureFailed,
                "Transcript line contains an embedded newline",
                "line " + std::to_string(i)
            );
        }
        out += line;
        out += '\n';
    }
    return Result<std::string, Error>::ok(std::move(out));
}

void CheckpointManager::reset_transcript(const std::string& transcript) {
    transcript_.clear();
    total_tokens_ = 0;
    last_model_.reset();
    last_user_prompt_.clear();

    size_t start = 0;
    while (start < transcript.size()) {
        size_t end = transcript.find('\n', start);
        if (end == std::string::npos) end = transcript.size();
        std::string line = transcript.substr(start, end - start);
        start = end + 1;
        if (line.empty()) continue;

        TranscriptEntry entry = parse_transcript_line(line);
        if (entry.parsed) {
            total_tokens_ += entry.total_tokens();
            if (entry.model) last_model_ = entry.model;
            if (entry.is_user_prompt() && !entry.text.empty()) last_user_prompt_ = entry.text;
        }
        transcript_.push_back(std::move(line));
    }

    baseline_ = transcript_.size();
    modified_since_checkpoint_.clear();
    pending_mutations_.clear();
    last_checkpoint_at_ = Clock::now();
}

size_t CheckpointManager::last_message_index() const {
    return transcript_.empty() ? 0 : transcript_.size() - 1;
}

// ---------------------------------------------------------------------------
// Working tree

bool CheckpointManager::is_ignored_dir(const fs::path& dir) const {
    std::string name = dir.filename().string();
    if (std::find(config_.ignore_dirs.begin(), config_.ignore_dirs.end(), name)
            != config_.ignore_dirs.end()) {
        return true;
    }
    // Never snapshot our own storage when it lives inside the project
    std::error_code ec;
    return fs::equivalent(dir, storage_->root(), ec);
}

std::vector<fs::path> CheckpointManager::list_tree_files() const {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(
        project_path_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot walk {}: {}", project_path_.string(), ec.message());
        return files;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Stopped walking {}: {}", project_path_.string(), ec.message());
            break;
        }

        std::error_code sec;
        fs::file_status st = it->symlink_status(sec);
        if (sec) continue;

        if (fs::is_directory(st)) {
            if (is_ignored_dir(it->path())) {
                it.disable_recursion_pending();
            }
        } else if (fs::is_regular_file(st)) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

CheckpointManager::Snapshot CheckpointManager::snapshot_tree() const {
    Snapshot snap;

    auto warn = [&](ErrorCode code, const std::string& what, const std::string& path) {
        std::string text = Error{code, what, path}.to_string();
        spdlog::warn("Session {}: {}", session_id_, text);
        snap.warnings.push_back(std::move(text));
    };

    for (const auto& path : list_tree_files()) {
        std::string rel = path.lexically_relative(project_path_).generic_string();

        std::error_code ec;
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            warn(ErrorCode::SnapshotPartial, "Cannot stat file: " + ec.message(), rel);
            continue;
        }
        if (max_file_size_ > 0 && size > max_file_size_) {
            warn(ErrorCode::SnapshotPartial, "File exceeds size limit, skipped", rel);
            continue;
        }

        auto data = read_file(path);
        if (data.is_err()) {
            warn(ErrorCode::SnapshotPartial, "Unreadable file: " + data.error().message, rel);
            continue;
        }

        FileSnapshot file;
        file.file_path = std::move(rel);
        file.content = std::move(data).value();
        file.size = file.content.size();

        fs::file_status st = fs::status(path, ec);
        if (!ec) {
            file.permissions = static_cast<uint32_t>(st.permissions() & fs::perms::mask);
        }

        snap.files.push_back(std::move(file));
    }

    return snap;
}

Result<void, Error> CheckpointManager::write_tree(const std::vector<FileSnapshot>& files,
                                                  std::vector<std::string>& warnings) {
    // Stage everything first so a failure leaves the tree as it was
    std::vector<std::pair<fs::path, fs::path>> staged;  // temp, target
    auto discard = [&staged](size_t from) {
        std::error_code ec;
        for (size_t i = from; i < staged.size(); ++i) {
            fs::remove(staged[i].first, ec);
        }
    };
    auto fail = [&](const std::string& what, const std::string& path) {
        discard(0);
        return Result<void, Error>::err(ErrorCode::RestoreWritePartial, what, path);
    };

    for (const auto& file : files) {
        fs::path rel(file.file_path);
        if (escapes_root(rel)) {
            return fail("Snapshot path escapes the project root", file.file_path);
        }

        fs::path target = project_path_ / rel;
        std::error_code ec;
        if (fs::is_directory(target, ec)) {
            return fail("A directory occupies the restore target", file.file_path);
        }
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return fail("Cannot create directory: " + ec.message(), file.file_path);
        }

        fs::path tmp = temp_sibling(target);
        staged.emplace_back(tmp, target);

        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
            out.flush();
        }
        if (!out) {
            return fail("Failed to stage file", file.file_path);
        }
    }

    for (size_t i = 0; i < staged.size(); ++i) {
        std::error_code ec;
        fs::rename(staged[i].first, staged[i].second, ec);
        if (ec) {
            discard(i);
            return Result<void, Error>::err(
                ErrorCode::RestoreWritePartial,
                "Failed to move restored file into place: " + ec.message(),
                staged[i].second.string()
            );
        }
    }

    std::set<std::string> restored;
    for (const auto& file : files) {
        fs::path rel(file.file_path);
        restored.insert(rel.lexically_normal().generic_string());
        if (!file.permissions) continue;

        std::error_code ec;
        fs::permissions(project_path_ / rel,
                        static_cast<fs::perms>(*file.permissions) & fs::perms::mask, ec);
        if (ec) {
            warnings.push_back(Error{ErrorCode::PermissionDenied,
                                     "Cannot restore permissions: " + ec.message(),
                                     file.file_path}.to_string());
        }
    }

    if (config_.restore_removes_untracked) {
        size_t removed = 0;
        for (const auto& path : list_tree_files()) {
            std::string rel = path.lexically_relative(project_path_).generic_string();
            if (restored.count(rel)) continue;

            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                warnings.push_back(Error{ErrorCode::FileWriteFailed,
                                         "Cannot remove untracked file: " + ec.message(),
                                         rel}.to_string());
            } else {
                ++removed;
            }
        }
        if (removed > 0) {
            spdlog::info("Session {}: removed {} untracked files", session_id_, removed);
        }
    }

    return Result<void, Error>::ok();
}

// ---------------------------------------------------------------------------
// Checkpoint operations

Result<Checkpoint, Error> CheckpointManager::commit(Checkpoint checkpoint,
                                                    std::vector<FileSnapshot> files,
                                                    const std::string& transcript) {
    auto saved = storage_->save_checkpoint(std::move(checkpoint), std::move(files), transcript);
    if (saved.is_err()) {
        return Result<Checkpoint, Error>::err(in_session(std::move(saved).error()));
    }

    // The timeline file is the commit point; until it is written the record is an orphan
    Timeline next = timeline_;
    auto appended = next.append(saved.value());
    if (appended.is_err()) {
        return Result<Checkpoint, Error>::err(in_session(std::move(appended).error()));
    }
    auto persisted = storage_->save_timeline(next);
    if (persisted.is_err()) {
        return Result<Checkpoint, Error>::err(in_session(std::move(persisted).error()));
    }

    timeline_ = std::move(next);
    return saved;
}

Result<CheckpointResult, Error> CheckpointManager::create_checkpoint(
    std::optional<std::string> description,
    std::optional<CheckpointId> parent_override)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (parent_override && !timeline_.contains(*parent_override)) {
        return Result<CheckpointResult, Error>::err(in_session(lineage_error(*parent_override)));
    }

    auto transcript = capture_transcript();
    if (transcript.is_err()) {
        return Result<CheckpointResult, Error>::err(in_session(std::move(transcript).error()));
    }

    Snapshot snap = snapshot_tree();

    Checkpoint cp;
    cp.id = generate_checkpoint_id();
    cp.session_id = session_id_;
    cp.project_id = project_id_;
    cp.parent_id = parent_override ? parent_override : timeline_.current();
    cp.created_at = now_ms();
    cp.description = std::move(description);
    cp.message_index = last_message_index();
    cp.metadata.total_tokens = total_tokens_;
    cp.metadata.model_used = last_model_.value_or("");
    cp.metadata.user_prompt = last_user_prompt_;
    cp.metadata.file_changes = modified_since_checkpoint_.size();

    auto committed = commit(std::move(cp), std::move(snap.files), transcript.value());
    if (committed.is_err()) {
        return Result<CheckpointResult, Error>::err(std::move(committed).error());
    }

    baseline_ = transcript_.size();
    modified_since_checkpoint_.clear();
    last_checkpoint_at_ = committed.value().created_at;

    CheckpointResult result;
    result.checkpoint = std::move(committed).value();
    result.files_processed = result.checkpoint.metadata.file_count;
    result.warnings = std::move(snap.warnings);

    spdlog::info("Created checkpoint {} for session {} ({} files, {} warnings)",
                 result.checkpoint.id, session_id_, result.files_processed,
                 result.warnings.size());

    if (config_.max_checkpoints > 0 &&
        timeline_.size() > static_cast<size_t>(config_.max_checkpoints)) {
        auto cleaned = storage_->cleanup_old_checkpoints(
            project_id_, session_id_, static_cast<size_t>(config_.max_checkpoints));
        auto reloaded = cleaned.is_ok() ? reload_timeline() : Result<void, Error>::ok();
        if (cleaned.is_err() || reloaded.is_err()) {
            const Error& e = cleaned.is_err() ? cleaned.error() : reloaded.error();
            spdlog::warn("Session {}: retention cleanup failed: {}", session_id_, e.full_message());
            result.warnings.push_back(e.to_string());
        }
    }

    return Result<CheckpointResult, Error>::ok(std::move(result));
}

Result<CheckpointResult, Error> CheckpointManager::restore_checkpoint(const CheckpointId& checkpoint_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!timeline_.contains(checkpoint_id)) {
        return Result<CheckpointResult, Error>::err(in_session(lineage_error(checkpoint_id)));
    }

    auto loaded = storage_->load_checkpoint(project_id_, session_id_, checkpoint_id);
    if (loaded.is_err()) {
        return Result<CheckpointResult, Error>::err(in_session(std::move(loaded).error()));
    }
    LoadedCheckpoint cp = std::move(loaded).value();

    CheckpointResult result;
    auto written = write_tree(cp.files, result.warnings);
    if (written.is_err()) {
        spdlog::error("Session {}: restore of {} aborted: {}",
                      session_id_, checkpoint_id, written.error().full_message());
        return Result<CheckpointResult, Error>::err(in_session(std::move(written).error()));
    }

    Timeline next = timeline_;
    auto moved = next.move_to(checkpoint_id);
    if (moved.is_err()) {
        return Result<CheckpointResult, Error>::err(in_session(std::move(moved).error()));
    }
    auto persisted = storage_->save_timeline(next);
    if (persisted.is_err()) {
        return Result<CheckpointResult, Error>::err(in_session(std::move(persisted).error()));
    }
    timeline_ = std::move(next);

    reset_transcript(cp.transcript);

    result.checkpoint = std::move(cp.checkpoint);
    result.files_processed = cp.files.size();
    result.transcript = std::move(cp.transcript);

    spdlog::info("Restored checkpoint {} for session {} ({} files)",
                 checkpoint_id, session_id_, result.files_processed);
    return Result<CheckpointResult, Error>::ok(std::move(result));
}

Result<CheckpointResult, Error> CheckpointManager::fork_from_checkpoint(
    const LoadedCheckpoint& source,
    std::optional<std::string> description)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (!timeline_.empty()) {
        return Result<CheckpointResult, Error>::err(in_session(Error{
            ErrorCode::InvalidState,
            "Fork target session already has checkpoints",
            session_id_
        }));
    }
    if (source.checkpoint.project_id != project_id_) {
        return Result<CheckpointResult, Error>::err(in_session(Error{
            ErrorCode::InvalidArgument,
            "Cannot fork a checkpoint from another project",
            source.checkpoint.project_id
        }));
    }

    CheckpointResult result;
    auto written = write_tree(source.files, result.warnings);
    if (written.is_err()) {
        return Result<CheckpointResult, Error>::err(in_session(std::move(written).error()));
    }

    Checkpoint cp;
    cp.id = generate_checkpoint_id();
    cp.session_id = session_id_;
    cp.project_id = project_id_;
    cp.parent_id = source.checkpoint.id;
    cp.parent_session_id = source.checkpoint.session_id;
    cp.created_at = now_ms();
    cp.description = description ? std::move(description)
                                 : std::make_optional("Fork from " + source.checkpoint.id);
    cp.message_index = source.checkpoint.message_index;
    cp.metadata = source.checkpoint.metadata;
    cp.metadata.file_changes = 0;

    auto committed = commit(std::move(cp), source.files, source.transcript);
    if (committed.is_err()) {
        return Result<CheckpointResult, Error>::err(std::move(committed).error());
    }
    reset_transcript(source.transcript);
    last_checkpoint_at_ = committed.value().created_at;

    result.checkpoint = std::move(committed).value();
    result.files_processed = source.files.size();
    result.transcript = source.transcript;

    spdlog::info("Forked session {} from checkpoint {} of session {}",
                 session_id_, source.checkpoint.id, source.checkpoint.session_id);
    return Result<CheckpointResult, Error>::ok(std::move(result));
}

// ---------------------------------------------------------------------------
// Lookup

Error CheckpointManager::lineage_error(const CheckpointId& checkpoint_id) const {
    if (storage_->find_checkpoint_session(project_id_, checkpoint_id)) {
        return Error{ErrorCode::InvalidLineage,
                     "Checkpoint is not in this session's lineage",
                     checkpoint_id};
    }
    return Error{ErrorCode::CheckpointNotFound, "Checkpoint not found", checkpoint_id};
}

Result<SessionId, Error> CheckpointManager::locate(const CheckpointId& checkpoint_id) const {
    if (timeline_.contains(checkpoint_id)) {
        return Result<SessionId, Error>::ok(session_id_);
    }

    // Walk up from every checkpoint whose parent lives outside this table
    std::set<std::pair<SessionId, CheckpointId>> seen;
    for (const auto& cp : timeline_.checkpoints()) {
        if (!cp.parent_id || timeline_.contains(*cp.parent_id)) continue;

        SessionId session = cp.parent_session_id.value_or(session_id_);
        std::optional<CheckpointId> cursor = cp.parent_id;

        while (cursor && seen.insert({session, *cursor}).second) {
            if (*cursor == checkpoint_id) {
                if (storage_->checkpoint_exists(project_id_, session, checkpoint_id)) {
                    return Result<SessionId, Error>::ok(session);
                }
                break;
            }
            auto record = storage_->load_record(project_id_, session, *cursor);
            if (record.is_err()) break;
            cursor = record.value().parent_id;
            session = record.value().parent_session_id.value_or(session);
        }
    }

    return Result<SessionId, Error>::err(lineage_error(checkpoint_id));
}

Result<LoadedCheckpoint, Error> CheckpointManager::load_located(const CheckpointId& checkpoint_id) const {
    auto session = locate(checkpoint_id);
    if (session.is_err()) {
        return Result<LoadedCheckpoint, Error>::err(in_session(std::move(session).error()));
    }
    auto loaded = storage_->load_checkpoint(project_id_, session.value(), checkpoint_id);
    if (loaded.is_err()) {
        return Result<LoadedCheckpoint, Error>::err(in_session(std::move(loaded).error()));
    }
    return loaded;
}

Result<LoadedCheckpoint, Error> CheckpointManager::load_checkpoint(const CheckpointId& checkpoint_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_located(checkpoint_id);
}

Result<CheckpointDiff, Error> CheckpointManager::diff_checkpoints(const CheckpointId& from_id,
                                                                  const CheckpointId& to_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto from = load_located(from_id);
    if (from.is_err()) {
        return Result<CheckpointDiff, Error>::err(std::move(from).error());
    }
    auto to = load_located(to_id);
    if (to.is_err()) {
        return Result<CheckpointDiff, Error>::err(std::move(to).error());
    }

    return Result<CheckpointDiff, Error>::ok(compute_diff(from.value(), to.value()));
}

// ---------------------------------------------------------------------------
// Timeline

Result<void, Error> CheckpointManager::reload_timeline() {
    auto loaded = storage_->load_timeline(project_id_, session_id_);
    if (loaded.is_err()) {
        return Result<void, Error>::err(in_session(std::move(loaded).error()));
    }
    if (loaded.value()) {
        timeline_ = std::move(*loaded.value());
    }
    return Result<void, Error>::ok();
}

Result<size_t, Error> CheckpointManager::cleanup_old_checkpoints(size_t keep_count) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (timeline_.empty()) {
        return Result<size_t, Error>::ok(0);
    }

    auto cleaned = storage_->cleanup_old_checkpoints(project_id_, session_id_, keep_count);
    if (cleaned.is_err()) {
        return Result<size_t, Error>::err(in_session(std::move(cleaned).error()));
    }

    RETRACE_TRY_VOID(reload_timeline());
    return cleaned;
}

std::vector<Checkpoint> CheckpointManager::list_checkpoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.checkpoints();
}

SessionTimeline CheckpointManager::get_timeline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeline_.get_timeline();
}

Result<void, Error> CheckpointManager::update_settings(bool auto_checkpoint_enabled,
                                                       CheckpointStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);

    Timeline next = timeline_;
    next.update_settings(auto_checkpoint_enabled, strategy);
    auto persisted = storage_->save_timeline(next);
    if (persisted.is_err()) {
        return Result<void, Error>::err(in_session(std::move(persisted).error()));
    }
    timeline_ = std::move(next);

    spdlog::debug("Session {}: auto_checkpoint={}, strategy={}",
                  session_id_, auto_checkpoint_enabled, strategy_to_string(strategy));
    return Result<void, Error>::ok();
}

// ---------------------------------------------------------------------------
// Bookkeeping

std::vector<std::string> CheckpointManager::get_files_modified_since(TimePoint since) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> files;
    for (const auto& [path, at] : file_times_) {
        if (at > since) {
            files.push_back(path);
        }
    }
    return files;
}

std::optional<TimePoint> CheckpointManager::get_last_modification_time() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<TimePoint> latest;
    for (const auto& [path, at] : file_times_) {
        if (!latest || at > *latest) {
            latest = at;
        }
    }
    return latest;
}

ManagerState CheckpointManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_.size() > baseline_ ? ManagerState::Accumulating : ManagerState::Idle;
}

size_t CheckpointManager::buffered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_.size() - baseline_;
}

}  // namespace retrace::checkpoint
