#include "Events.hpp"

std::string to_string(EventKind kind)
{
    switch (kind) {
        case EventKind::ScanProgress: return "scan-progress";
        case EventKind::ScanComplete: return "scan-complete";
        case EventKind::ScanError: return "scan-error";
        case EventKind::ScanCancelled: return "scan-cancelled";
        case EventKind::TransferProgress: return "transfer-progress";
        case EventKind::TransferComplete: return "transfer-complete";
        case EventKind::TransferError: return "transfer-error";
        case EventKind::TransferCancelled: return "transfer-cancelled";
        case EventKind::TransferConflict: return "transfer-conflict";
    }
    return "unknown";
}

bool is_terminal(EventKind kind)
{
    switch (kind) {
        case EventKind::ScanComplete:
        case EventKind::ScanError:
        case EventKind::ScanCancelled:
        case EventKind::TransferComplete:
        case EventKind::TransferError:
        case EventKind::TransferCancelled:
            return true;
        default:
            return false;
    }
}

std::vector<EventKind> scan_event_kinds()
{
    return {EventKind::ScanProgress, EventKind::ScanComplete,
            EventKind::ScanError, EventKind::ScanCancelled};
}

std::vector<EventKind> transfer_event_kinds()
{
    return {EventKind::TransferProgress, EventKind::TransferComplete,
            EventKind::TransferError, EventKind::TransferCancelled,
            EventKind::TransferConflict};
}

Json::Value ScanProgressEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["filesFound"] = Json::UInt64(files_found);
    value["dirsFound"] = Json::UInt64(dirs_found);
    value["bytesFound"] = Json::UInt64(bytes_found);
    value["currentPath"] = current_path.empty() ? Json::Value(Json::nullValue) : Json::Value(current_path);
    return value;
}

Json::Value ScanCompleteEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["filesTotal"] = Json::UInt64(files_total);
    value["dirsTotal"] = Json::UInt64(dirs_total);
    value["bytesTotal"] = Json::UInt64(bytes_total);
    value["skippedEntries"] = Json::UInt64(skipped_entries);
    return value;
}

Json::Value ScanErrorEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["message"] = message;
    return value;
}

Json::Value ScanCancelledEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    return value;
}

Json::Value TransferProgressEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["phase"] = to_string(phase);
    value["currentFile"] = current_file.empty() ? Json::Value(Json::nullValue) : Json::Value(current_file);
    value["filesDone"] = Json::UInt64(files_done);
    value["filesTotal"] = Json::UInt64(files_total);
    value["bytesDone"] = Json::UInt64(bytes_done);
    value["bytesTotal"] = Json::UInt64(bytes_total);
    return value;
}

Json::Value TransferCompleteEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["filesProcessed"] = Json::UInt64(files_processed);
    value["bytesProcessed"] = Json::UInt64(bytes_processed);
    return value;
}

Json::Value TransferErrorEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["error"] = error.to_json();
    return value;
}

Json::Value TransferCancelledEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["filesProcessed"] = Json::UInt64(files_processed);
    value["rolledBack"] = rolled_back;
    return value;
}

Json::Value conflict_record_to_json(const ConflictRecord& record)
{
    Json::Value value(Json::objectValue);
    value["name"] = record.name;
    value["sourcePath"] = record.source_path;
    value["destinationPath"] = record.destination_path;
    value["sourceSize"] = Json::UInt64(record.source_size);
    value["sourceModifiedAt"] = Json::Int64(record.source_modified_at);
    value["existingSize"] = Json::UInt64(record.existing_size);
    value["existingModifiedAt"] = Json::Int64(record.existing_modified_at);
    value["isDirectory"] = record.is_directory;
    value["destinationIsNewer"] = record.destination_is_newer();
    value["sizeDifference"] = Json::Int64(record.size_difference());
    return value;
}

Json::Value TransferConflictEvent::to_json() const
{
    Json::Value value(Json::objectValue);
    value["id"] = id;
    value["token"] = Json::UInt64(token);
    value["conflict"] = conflict_record_to_json(conflict);
    return value;
}
