#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace retrace::core {

// Numbered in bands so a logged code tells which layer failed
enum class ErrorCode {
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    PermissionDenied = 5,
    InternalError = 9,
    InvalidState = 10,

    // Checkpoint engine
    CheckpointNotFound = 100,
    SessionNotFound = 101,
    BlobNotFound = 102,
    StorageIO = 103,
    ContentCorrupted = 104,
    SnapshotPartial = 105,
    RestoreWritePartial = 106,
    InvalidLineage = 107,
    TranscriptCaptureFailed = 108,

    // Configuration
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // Filesystem
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Stable snake_case name, used as the tag in log lines and warnings
inline std::string_view code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown:                 return "unknown";
        case ErrorCode::InvalidArgument:         return "invalid_argument";
        case ErrorCode::NotFound:                return "not_found";
        case ErrorCode::AlreadyExists:           return "already_exists";
        case ErrorCode::PermissionDenied:        return "permission_denied";
        case ErrorCode::InternalError:           return "internal_error";
        case ErrorCode::InvalidState:            return "invalid_state";
        case ErrorCode::CheckpointNotFound:      return "checkpoint_not_found";
        case ErrorCode::SessionNotFound:         return "session_not_found";
        case ErrorCode::BlobNotFound:            return "blob_not_found";
        case ErrorCode::StorageIO:               return "storage_io";
        case ErrorCode::ContentCorrupted:        return "content_corrupted";
        case ErrorCode::SnapshotPartial:         return "snapshot_partial";
        case ErrorCode::RestoreWritePartial:     return "restore_write_partial";
        case ErrorCode::InvalidLineage:          return "invalid_lineage";
        case ErrorCode::TranscriptCaptureFailed: return "transcript_capture_failed";
        case ErrorCode::ConfigNotFound:          return "config_not_found";
        case ErrorCode::ConfigParseFailed:       return "config_parse_failed";
        case ErrorCode::ConfigValidationFailed:  return "config_validation_failed";
        case ErrorCode::FileNotFound:            return "file_not_found";
        case ErrorCode::FileReadFailed:          return "file_read_failed";
        case ErrorCode::FileWriteFailed:         return "file_write_failed";
    }
    return "unknown";
}

// Default message when the caller has nothing more specific
inline std::string_view describe(ErrorCode code) {
    switch (code) {
        case ErrorCode::CheckpointNotFound:      return "No such checkpoint";
        case ErrorCode::SessionNotFound:         return "No such session";
        case ErrorCode::BlobNotFound:            return "Content blob missing from the pool";
        case ErrorCode::StorageIO:               return "Checkpoint storage I/O failure";
        case ErrorCode::ContentCorrupted:        return "Stored content does not match its hash";
        case ErrorCode::SnapshotPartial:         return "Some files were left out of the snapshot";
        case ErrorCode::RestoreWritePartial:     return "Some files could not be restored";
        case ErrorCode::InvalidLineage:          return "Checkpoint is outside the session lineage";
        case ErrorCode::TranscriptCaptureFailed: return "Transcript could not be captured";
        case ErrorCode::ConfigNotFound:          return "Configuration file missing";
        case ErrorCode::ConfigParseFailed:       return "Configuration is not valid YAML";
        case ErrorCode::ConfigValidationFailed:  return "Configuration value out of range";
        case ErrorCode::FileNotFound:            return "No such file or directory";
        case ErrorCode::FileReadFailed:          return "Read failed";
        case ErrorCode::FileWriteFailed:         return "Write failed";
        default:                                 return code_name(code);
    }
}

// The requested object does not exist
inline bool is_not_found(ErrorCode code) {
    return code == ErrorCode::NotFound
        || code == ErrorCode::CheckpointNotFound
        || code == ErrorCode::SessionNotFound
        || code == ErrorCode::BlobNotFound
        || code == ErrorCode::FileNotFound;
}

// Retrying cannot help: stored data or config is bad, or the tree is half written
inline bool is_fatal(ErrorCode code) {
    return code == ErrorCode::ContentCorrupted
        || code == ErrorCode::RestoreWritePartial
        || code == ErrorCode::ConfigParseFailed
        || code == ErrorCode::ConfigValidationFailed;
}

struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::optional<std::string> context;  // path, checkpoint id, blob hash
    std::optional<std::string> source;   // session or component that surfaced it

    Error() = default;

    Error(ErrorCode c) : code(c), message(describe(c)) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    // Outermost component first: "session s2 / storage"
    Error with_source(std::string src) const {
        Error out = *this;
        out.source = source ? src + " / " + *source : std::move(src);
        return out;
    }

    bool is_not_found() const { return retrace::core::is_not_found(code); }
    bool is_fatal() const { return retrace::core::is_fatal(code); }

    std::string full_message() const {
        std::string out = message;
        if (context) out += " [" + *context + "]";
        if (source) out += " at " + *source;
        return out;
    }

    // "[checkpoint_not_found] No such checkpoint [cp-1] at session s1"
    std::string to_string() const {
        std::string out = "[";
        out += code_name(code);
        out += "] ";
        out += full_message();
        return out;
    }
};

}  // namespace retrace::core
