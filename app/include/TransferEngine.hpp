#ifndef TRANSFER_ENGINE_HPP
#define TRANSFER_ENGINE_HPP

#include "EngineSettings.hpp"
#include "EventChannel.hpp"
#include "IFileSystem.hpp"
#include "OperationRegistry.hpp"
#include "RollbackCoordinator.hpp"
#include "ScanEngine.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct TransferRequest {
    TransferKind kind{TransferKind::Copy};
    std::vector<std::string> sources;
    std::string destination;
    ConflictPolicy conflict_policy{ConflictPolicy::Stop};
    std::optional<std::string> reused_scan_id;
    TraversalOrder order;
    std::chrono::milliseconds progress_interval{EngineSettings::kDefaultProgressIntervalMs};
};

struct TransferTuning {
    std::size_t copy_chunk_bytes{EngineSettings::kDefaultCopyChunkBytes};
    std::uintmax_t large_file_bytes{EngineSettings::kDefaultLargeFileBytes};
    std::chrono::milliseconds conflict_wait{std::chrono::seconds(EngineSettings::kDefaultConflictWaitSeconds)};

    static TransferTuning from_settings(const EngineSettings& settings);
};

/**
 * @brief Runs copy and move operations on worker threads.
 *
 * Every started transfer ends with exactly one transfer-complete, transfer-error
 * or transfer-cancelled event. Validation failures are reported the same way, so
 * start_transfer() itself never fails for a bad request.
 */
class TransferEngine {
public:
    TransferEngine(std::shared_ptr<IFileSystem> file_system,
                   EventChannel& channel,
                   OperationRegistry& registry,
                   ScanEngine& scans,
                   TransferTuning tuning);

    std::string start_transfer(TransferRequest request);

    /**
     * @brief Requests cancellation; returns as soon as the request is recorded.
     */
    bool cancel_transfer(const std::string& id, bool rollback);

    /**
     * @return false when the operation is unknown or the token is not the current one.
     */
    bool resolve_conflict(const std::string& id, std::uint64_t token, ConflictDecision decision);

    static constexpr std::size_t kMaxNameBytes = 255;
    static constexpr std::size_t kMaxPathBytes = 4096;

private:
    std::shared_ptr<IFileSystem> file_system_;
    EventChannel& channel_;
    OperationRegistry& registry_;
    ScanEngine& scans_;
    TransferTuning tuning_;
    RollbackCoordinator rollback_;
};

#endif
