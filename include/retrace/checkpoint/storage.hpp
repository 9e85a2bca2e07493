#pragma once

#include "retrace/core/result.hpp"
#include "retrace/core/types.hpp"
#include "content_store.hpp"
#include "timeline.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace retrace::checkpoint {

using namespace retrace::core;
namespace fs = std::filesystem;

// Persists checkpoint records, file manifests, transcripts and timelines.
//
// Layout under the storage root:
//   projects/<project>/content_pool/<hh>/<hash>
//   projects/<project>/sessions/<session>/timeline.json
//   projects/<project>/sessions/<session>/checkpoints/<id>/{metadata.json,files.json,messages.jsonl}
//
// A record is written into a staging directory and renamed into place only
// after all of its blobs are durable, so a record never names a missing
// blob. The timeline file is the commit point: records it does not list are
// orphans and are removed by the next cleanup of their session.
//
// One instance is shared by every manager of a project. Saves take a shared
// lock and cleanup an exclusive one, so the blob sweep never races a save.
class CheckpointStorage {
public:
    explicit CheckpointStorage(const fs::path& root);

    // Hash and store the files, then write the record. Fills in file_count
    // and snapshot_size and returns the record as persisted.
    Result<Checkpoint, Error> save_checkpoint(Checkpoint checkpoint,
                                              std::vector<FileSnapshot> files,
                                              const std::string& transcript);

    Result<LoadedCheckpoint, Error> load_checkpoint(const ProjectId& project_id,
                                                    const SessionId& session_id,
                                                    const CheckpointId& checkpoint_id) const;

    // Record only, without resolving files or transcript
    Result<Checkpoint, Error> load_record(const ProjectId& project_id,
                                          const SessionId& session_id,
                                          const CheckpointId& checkpoint_id) const;

    // Committed checkpoints in creation order
    Result<std::vector<Checkpoint>, Error> list_checkpoints(const ProjectId& project_id,
                                                            const SessionId& session_id) const;

    // nullopt when the session has never been persisted
    Result<std::optional<Timeline>, Error> load_timeline(const ProjectId& project_id,
                                                         const SessionId& session_id) const;
    Result<void, Error> save_timeline(const Timeline& timeline);

    bool checkpoint_exists(const ProjectId& project_id,
                           const SessionId& session_id,
                           const CheckpointId& checkpoint_id) const;

    // Which session of the project holds a record with this id
    std::optional<SessionId> find_checkpoint_session(const ProjectId& project_id,
                                                     const CheckpointId& checkpoint_id) const;

    std::vector<SessionId> list_sessions(const ProjectId& project_id) const;

    Result<void, Error> delete_checkpoint(const ProjectId& project_id,
                                          const SessionId& session_id,
                                          const CheckpointId& checkpoint_id);

    // Keep the keep_count most recent checkpoints of the session, delete the
    // rest and any orphan records, then sweep blobs no record references.
    // Checkpoints that another session was forked from are always kept.
    Result<size_t, Error> cleanup_old_checkpoints(const ProjectId& project_id,
                                                  const SessionId& session_id,
                                                  size_t keep_count);

    // Checkpoints of session_id that records of other sessions name as parent
    Result<std::set<CheckpointId>, Error> branch_points(const ProjectId& project_id,
                                                        const SessionId& session_id) const;

    // Union of blob hashes named by every record of the project
    Result<std::set<ContentHash>, Error> referenced_hashes(const ProjectId& project_id) const;

    ContentStore content_store(const ProjectId& project_id) const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    mutable std::shared_mutex gc_mutex_;

    fs::path project_path(const ProjectId& project_id) const;
    fs::path session_path(const ProjectId& project_id, const SessionId& session_id) const;
    fs::path checkpoints_path(const ProjectId& project_id, const SessionId& session_id) const;
    fs::path checkpoint_path(const ProjectId& project_id,
                             const SessionId& session_id,
                             const CheckpointId& checkpoint_id) const;
    fs::path timeline_path(const ProjectId& project_id, const SessionId& session_id) const;

    Result<Checkpoint, Error> read_record(const fs::path& dir) const;
    Result<std::vector<FileSnapshot>, Error> load_manifest(const fs::path& dir) const;
    Result<void, Error> remove_record_dir(const fs::path& dir);
};

// Ids become path components; reject anything that could escape the tree
bool is_valid_id(const std::string& id);

}  // namespace retrace::checkpoint
