#ifndef SCAN_ENGINE_HPP
#define SCAN_ENGINE_HPP

#include "CancellationToken.hpp"
#include "EventChannel.hpp"
#include "IFileSystem.hpp"
#include "OperationRegistry.hpp"
#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ScanTally {
    std::size_t files_found{0};
    std::size_t dirs_found{0};
    std::uintmax_t bytes_found{0};
    std::size_t skipped_entries{0};
    std::string current_path;
};

using ScanProgressCallback = std::function<void(const ScanTally&)>;

/**
 * @brief Walks source trees, counts what a transfer would move and builds its manifest.
 *
 * Asynchronous scans publish scan-* events and keep their completed manifest until
 * a transfer takes it over or the registry no longer holds the scan. Transfers that were not handed a preview run the same
 * traversal synchronously through scan_sources().
 */
class ScanEngine {
public:
    ScanEngine(std::shared_ptr<IFileSystem> file_system,
               EventChannel& channel,
               OperationRegistry& registry);

    std::string start_scan(const std::vector<std::string>& sources,
                           TraversalOrder order,
                           std::chrono::milliseconds progress_interval);

    /**
     * @brief Requests cancellation and drops any cached result of the scan.
     * @return false when the id is unknown.
     */
    bool cancel_scan(const std::string& id);

    /**
     * @brief Synchronous traversal shared with the transfer engine.
     *
     * `on_progress` is invoked at most once per `progress_interval`.
     * Throws TransferFailure for fatal problems with a source root and for cancellation.
     */
    ScanManifest scan_sources(const std::vector<std::filesystem::path>& sources,
                              TraversalOrder order,
                              const CancellationToken& cancel,
                              std::chrono::milliseconds progress_interval,
                              const ScanProgressCallback& on_progress,
                              const std::string& operation_id = {}) const;

    /**
     * @brief Removes and returns the manifest of a completed scan of exactly `sources`.
     */
    std::optional<ScanManifest> take_completed(const std::string& scan_id,
                                               const std::vector<std::filesystem::path>& sources);

    std::optional<ScanStatus> status_of(const std::string& scan_id) const;

    static void sort_files(std::vector<ManifestEntry>& files, TraversalOrder order);

private:
#ifdef TWINPANE_TEST_BUILD
    friend class ScanEngineTestAccess;
#endif
    struct ScanRecord {
        ScanStatus status{ScanStatus::Running};
        std::vector<std::filesystem::path> sources;
        std::optional<ScanManifest> manifest;
    };

    void run_scan(OperationContext& context,
                  std::vector<std::filesystem::path> sources,
                  TraversalOrder order,
                  std::chrono::milliseconds progress_interval);
    void set_status(const std::string& id, ScanStatus status, std::optional<ScanManifest> manifest = std::nullopt);
    void release_unregistered_records();

    std::shared_ptr<IFileSystem> file_system_;
    EventChannel& channel_;
    OperationRegistry& registry_;

    mutable std::mutex records_mutex_;
    std::unordered_map<std::string, ScanRecord> records_;
};

#endif
