#include "ConflictDetector.hpp"
#include "Logger.hpp"
#include "TimedFileSystem.hpp"
#include "Utils.hpp"

ConflictDetector::ConflictDetector(IFileSystem& file_system)
    : file_system_(file_system)
{
}

ConflictCandidate ConflictDetector::candidate_for(const ManifestEntry& entry, bool is_directory)
{
    ConflictCandidate candidate;
    candidate.name = Utils::path_to_utf8(entry.path.filename());
    candidate.size = entry.size;
    candidate.modified_at = entry.modified_at;
    candidate.source_path = Utils::path_to_utf8(entry.path);
    candidate.is_directory = is_directory;
    return candidate;
}

std::optional<ConflictRecord> ConflictDetector::check_one(const ConflictCandidate& candidate,
                                                          const std::filesystem::path& destination_path) const
{
    auto existing = file_system_.stat_entry(destination_path);
    if (!existing) {
        return std::nullopt;
    }

    ConflictRecord record;
    record.name = candidate.name;
    record.source_path = candidate.source_path;
    record.destination_path = Utils::path_to_utf8(destination_path);
    record.source_size = candidate.size;
    record.source_modified_at = candidate.modified_at;
    record.existing_size = existing->is_directory ? 0 : existing->size;
    record.existing_modified_at = existing->modified_at;
    record.is_directory = existing->is_directory;
    return record;
}

ConflictReport ConflictDetector::detect_conflicts(const std::vector<ConflictCandidate>& candidates,
                                                  const std::filesystem::path& destination,
                                                  std::size_t max_results) const
{
    ConflictReport report;
    auto logger = Logger::get_logger("core_logger");

    for (const auto& candidate : candidates) {
        if (candidate.name.empty()) {
            continue;
        }
        std::optional<ConflictRecord> record;
        try {
            record = check_one(candidate, destination / Utils::utf8_to_path(candidate.name));
        } catch (const FileSystemTimeout& ex) {
            if (logger) {
                logger->warn("Conflict check for '{}' skipped: {}", candidate.name, ex.what());
            }
            continue;
        } catch (const std::filesystem::filesystem_error& ex) {
            if (logger) {
                logger->warn("Conflict check for '{}' skipped: {}", candidate.name, ex.code().message());
            }
            continue;
        }
        if (!record) {
            continue;
        }
        ++report.conflicts_total;
        if (report.conflicts.size() < max_results) {
            report.conflicts.push_back(std::move(*record));
        } else {
            report.sampled = true;
        }
    }

    if (logger) {
        logger->debug("{} conflict(s) in '{}' for {} candidate(s){}", report.conflicts_total,
                      Utils::path_to_utf8(destination), candidates.size(),
                      report.sampled ? " (sampled)" : "");
    }
    return report;
}
