#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class SortColumn {Name, Extension, Size, Modified};

enum class SortOrder {Ascending, Descending};

struct TraversalOrder {
    SortColumn column{SortColumn::Name};
    SortOrder order{SortOrder::Ascending};
};

enum class ConflictPolicy {Stop, Skip, Overwrite};

enum class ConflictDecision {
    OverwriteThis,
    SkipThis,
    OverwriteRemaining,
    SkipRemaining,
    Abort
};

enum class TransferKind {Copy, Move};

enum class TransferPhase {Scanning, Copying, Deleting, RollingBack};

enum class ScanStatus {Running, Complete, Error, Cancelled};

enum class OperationKind {Scan, Copy, Move};

inline std::string to_string(SortColumn column) {
    switch (column) {
        case SortColumn::Name: return "name";
        case SortColumn::Extension: return "extension";
        case SortColumn::Size: return "size";
        case SortColumn::Modified: return "modified";
        default: return "unknown";
    }
}

inline std::string to_string(SortOrder order) {
    return order == SortOrder::Descending ? "descending" : "ascending";
}

inline std::string to_string(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::Stop: return "stop";
        case ConflictPolicy::Skip: return "skip";
        case ConflictPolicy::Overwrite: return "overwrite";
        default: return "unknown";
    }
}

inline std::string to_string(ConflictDecision decision) {
    switch (decision) {
        case ConflictDecision::OverwriteThis: return "overwrite-this";
        case ConflictDecision::SkipThis: return "skip-this";
        case ConflictDecision::OverwriteRemaining: return "overwrite-remaining";
        case ConflictDecision::SkipRemaining: return "skip-remaining";
        case ConflictDecision::Abort: return "abort";
        default: return "unknown";
    }
}

inline std::string to_string(TransferKind kind) {
    return kind == TransferKind::Move ? "move" : "copy";
}

inline std::string to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Scanning: return "scanning";
        case TransferPhase::Copying: return "copying";
        case TransferPhase::Deleting: return "deleting";
        case TransferPhase::RollingBack: return "rolling_back";
        default: return "unknown";
    }
}

inline std::string to_string(ScanStatus status) {
    switch (status) {
        case ScanStatus::Running: return "running";
        case ScanStatus::Complete: return "complete";
        case ScanStatus::Error: return "error";
        case ScanStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

inline std::string to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Scan: return "scan";
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
        default: return "unknown";
    }
}

std::optional<SortColumn> sort_column_from_string(const std::string& value);
std::optional<SortOrder> sort_order_from_string(const std::string& value);
std::optional<ConflictPolicy> conflict_policy_from_string(const std::string& value);
std::optional<ConflictDecision> conflict_decision_from_string(const std::string& value);

/**
 * @brief Metadata of a single filesystem entry, read without following symlinks.
 */
struct EntryInfo {
    std::uintmax_t size{0};
    std::time_t modified_at{0};
    bool is_directory{false};
    bool is_symlink{false};
    bool is_regular{false};
    bool symlink_loop{false}; ///< Set when resolving the link chain hits ELOOP.
    std::uint64_t device{0};
    std::uint64_t inode{0};
};

/**
 * @brief A resolved source item of a scan manifest.
 *
 * `source_root` is the parent of the top-level source the item was found under;
 * the destination of the item is `destination / path.lexically_relative(source_root)`.
 */
struct ManifestEntry {
    std::filesystem::path path;
    std::filesystem::path source_root;
    std::uintmax_t size{0};
    std::time_t modified_at{0};
    bool is_symlink{false};

    std::filesystem::path relative_path() const {
        return path.lexically_relative(source_root);
    }
};

struct ScanManifest {
    std::vector<ManifestEntry> files;
    std::vector<ManifestEntry> directories; ///< Pre-order, parents before children.
    std::uintmax_t bytes_total{0};
    std::size_t skipped_entries{0};

    std::size_t files_total() const { return files.size(); }
    std::size_t dirs_total() const { return directories.size(); }
};

struct ConflictCandidate {
    std::string name;
    std::uintmax_t size{0};
    std::time_t modified_at{0};
    std::string source_path;
    bool is_directory{false};
};

struct ConflictRecord {
    std::string name;
    std::string source_path;
    std::string destination_path;
    std::uintmax_t source_size{0};
    std::time_t source_modified_at{0};
    std::uintmax_t existing_size{0};
    std::time_t existing_modified_at{0};
    bool is_directory{false};

    bool destination_is_newer() const { return existing_modified_at > source_modified_at; }
    std::int64_t size_difference() const {
        return static_cast<std::int64_t>(existing_size) - static_cast<std::int64_t>(source_size);
    }
};

struct ConflictReport {
    std::vector<ConflictRecord> conflicts;
    std::size_t conflicts_total{0}; ///< Every conflict found, including those past the cap.
    bool sampled{false};            ///< `conflicts` holds only the first `max_results`.
};

/**
 * @brief Read-only status copy of a registered operation.
 */
struct OperationSnapshot {
    std::string id;
    OperationKind kind{OperationKind::Scan};
    std::string phase;
    bool running{true};
    std::string current_file;
    std::size_t files_done{0};
    std::size_t files_total{0};
    std::uintmax_t bytes_done{0};
    std::uintmax_t bytes_total{0};
    std::int64_t started_at_ms{0};

    int percent_complete() const {
        if (bytes_total > 0) {
            return static_cast<int>((bytes_done * 100) / bytes_total);
        }
        if (files_total > 0) {
            return static_cast<int>((files_done * 100) / files_total);
        }
        return running ? 0 : 100;
    }
};

#endif
