#ifndef CONFLICT_DETECTOR_HPP
#define CONFLICT_DETECTOR_HPP

#include "IFileSystem.hpp"
#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

/**
 * @brief Finds candidates whose name already exists directly below a destination.
 *
 * Read-only. The cap only limits how many records are returned; a transfer re-checks
 * every item at write time regardless of what was reported here.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(IFileSystem& file_system);

    ConflictReport detect_conflicts(const std::vector<ConflictCandidate>& candidates,
                                    const std::filesystem::path& destination,
                                    std::size_t max_results) const;

    /**
     * @brief Builds the record for one destination entry, or nullopt when it is absent.
     */
    std::optional<ConflictRecord> check_one(const ConflictCandidate& candidate,
                                            const std::filesystem::path& destination_path) const;

    static ConflictCandidate candidate_for(const ManifestEntry& entry, bool is_directory = false);

private:
    IFileSystem& file_system_;
};

#endif
