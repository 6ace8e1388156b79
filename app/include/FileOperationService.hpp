#ifndef FILE_OPERATION_SERVICE_HPP
#define FILE_OPERATION_SERVICE_HPP

#include "ConflictDetector.hpp"
#include "EngineSettings.hpp"
#include "EventChannel.hpp"
#include "IFileSystem.hpp"
#include "OperationRegistry.hpp"
#include "ScanEngine.hpp"
#include "TransferEngine.hpp"
#include "Types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Command surface used by the UI and the CLI.
 *
 * Every start call returns immediately with an operation id; results arrive on
 * subscriptions. Subscribe before starting so no event of the operation is missed.
 */
class FileOperationService {
public:
    /**
     * @brief Builds the engines over `file_system`, or over a time-bounded local
     * filesystem when it is null.
     */
    explicit FileOperationService(const EngineSettings& settings,
                                  std::shared_ptr<IFileSystem> file_system = nullptr);
    ~FileOperationService();

    FileOperationService(const FileOperationService&) = delete;
    FileOperationService& operator=(const FileOperationService&) = delete;

    EventChannel::SubscriptionHandle subscribe(std::vector<EventKind> kinds);
    void unsubscribe(const EventChannel::SubscriptionHandle& handle);

    std::string start_scan(const std::vector<std::string>& sources,
                           std::optional<TraversalOrder> order = std::nullopt,
                           std::optional<std::chrono::milliseconds> progress_interval = std::nullopt);
    bool cancel_scan(const std::string& id);

    std::string start_transfer(TransferKind kind,
                               const std::vector<std::string>& sources,
                               const std::string& destination,
                               std::optional<ConflictPolicy> policy = std::nullopt,
                               std::optional<std::string> reused_scan_id = std::nullopt,
                               std::optional<TraversalOrder> order = std::nullopt,
                               std::optional<std::chrono::milliseconds> progress_interval = std::nullopt);
    bool cancel_transfer(const std::string& id, bool rollback);
    bool resolve_conflict(const std::string& id, std::uint64_t token, ConflictDecision decision);

    ConflictReport detect_conflicts(const std::vector<ConflictCandidate>& candidates,
                                    const std::string& destination,
                                    std::optional<std::size_t> max_results = std::nullopt) const;

    std::optional<OperationSnapshot> get_status(const std::string& id) const;
    std::vector<OperationSnapshot> list_active() const;
    bool acknowledge(const std::string& id);

private:
    std::chrono::milliseconds progress_interval_;
    ConflictPolicy default_policy_;
    std::size_t max_conflicts_;
    TraversalOrder default_order_;

    std::shared_ptr<IFileSystem> file_system_;
    EventChannel channel_;
    std::unique_ptr<ScanEngine> scans_;
    std::unique_ptr<TransferEngine> transfers_;
    std::unique_ptr<OperationRegistry> registry_;
};

#endif
