#ifndef EVENTS_HPP
#define EVENTS_HPP

#include "TransferError.hpp"
#include "Types.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

enum class EventKind {
    ScanProgress,
    ScanComplete,
    ScanError,
    ScanCancelled,
    TransferProgress,
    TransferComplete,
    TransferError,
    TransferCancelled,
    TransferConflict
};

/// Wire name of the kind, e.g. "transfer-progress".
std::string to_string(EventKind kind);
bool is_terminal(EventKind kind);
std::vector<EventKind> scan_event_kinds();
std::vector<EventKind> transfer_event_kinds();

/**
 * @brief One published event. The payload is a copy and carries `id` as well.
 */
struct EngineEvent {
    EventKind kind;
    std::string operation_id;
    Json::Value payload;

    bool terminal() const { return is_terminal(kind); }
};

struct ScanProgressEvent {
    static constexpr EventKind kind = EventKind::ScanProgress;
    std::string id;
    std::size_t files_found{0};
    std::size_t dirs_found{0};
    std::uintmax_t bytes_found{0};
    std::string current_path;

    Json::Value to_json() const;
};

struct ScanCompleteEvent {
    static constexpr EventKind kind = EventKind::ScanComplete;
    std::string id;
    std::size_t files_total{0};
    std::size_t dirs_total{0};
    std::uintmax_t bytes_total{0};
    std::size_t skipped_entries{0};

    Json::Value to_json() const;
};

struct ScanErrorEvent {
    static constexpr EventKind kind = EventKind::ScanError;
    std::string id;
    std::string message;

    Json::Value to_json() const;
};

struct ScanCancelledEvent {
    static constexpr EventKind kind = EventKind::ScanCancelled;
    std::string id;

    Json::Value to_json() const;
};

struct TransferProgressEvent {
    static constexpr EventKind kind = EventKind::TransferProgress;
    std::string id;
    TransferPhase phase{TransferPhase::Scanning};
    std::string current_file;
    std::size_t files_done{0};
    std::size_t files_total{0};
    std::uintmax_t bytes_done{0};
    std::uintmax_t bytes_total{0};

    Json::Value to_json() const;
};

struct TransferCompleteEvent {
    static constexpr EventKind kind = EventKind::TransferComplete;
    std::string id;
    std::size_t files_processed{0};
    std::uintmax_t bytes_processed{0};

    Json::Value to_json() const;
};

struct TransferErrorEvent {
    static constexpr EventKind kind = EventKind::TransferError;
    std::string id;
    ::TransferError error;

    Json::Value to_json() const;
};

struct TransferCancelledEvent {
    static constexpr EventKind kind = EventKind::TransferCancelled;
    std::string id;
    std::size_t files_processed{0};
    bool rolled_back{false};

    Json::Value to_json() const;
};

struct TransferConflictEvent {
    static constexpr EventKind kind = EventKind::TransferConflict;
    std::string id;
    std::uint64_t token{0};
    ConflictRecord conflict;

    Json::Value to_json() const;
};

Json::Value conflict_record_to_json(const ConflictRecord& record);

#endif
