#include "FileOperationService.hpp"
#include "LocalFileSystem.hpp"
#include "Logger.hpp"
#include "TimedFileSystem.hpp"
#include "Utils.hpp"

FileOperationService::FileOperationService(const EngineSettings& settings,
                                           std::shared_ptr<IFileSystem> file_system)
    : progress_interval_(settings.get_progress_interval()),
      default_policy_(settings.get_default_conflict_policy()),
      max_conflicts_(settings.get_max_conflicts_to_show()),
      default_order_(settings.get_default_order()),
      file_system_(std::move(file_system))
{
    if (!file_system_) {
        file_system_ = std::make_shared<TimedFileSystem>(std::make_shared<LocalFileSystem>(),
                                                         settings.get_stat_timeout());
    }
    registry_ = std::make_unique<OperationRegistry>(settings.get_operation_retention());
    scans_ = std::make_unique<ScanEngine>(file_system_, channel_, *registry_);
    transfers_ = std::make_unique<TransferEngine>(file_system_, channel_, *registry_, *scans_,
                                                  TransferTuning::from_settings(settings));

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("File operation service ready (progress every {} ms, default policy {})",
                      progress_interval_.count(), to_string(default_policy_));
    }
}

FileOperationService::~FileOperationService()
{
    registry_->cancel_all(false);
    registry_->join_all();
}

EventChannel::SubscriptionHandle FileOperationService::subscribe(std::vector<EventKind> kinds)
{
    return channel_.subscribe(std::move(kinds));
}

void FileOperationService::unsubscribe(const EventChannel::SubscriptionHandle& handle)
{
    channel_.unsubscribe(handle);
}

std::string FileOperationService::start_scan(const std::vector<std::string>& sources,
                                             std::optional<TraversalOrder> order,
                                             std::optional<std::chrono::milliseconds> progress_interval)
{
    return scans_->start_scan(sources, order.value_or(default_order_),
                              progress_interval.value_or(progress_interval_));
}

bool FileOperationService::cancel_scan(const std::string& id)
{
    return scans_->cancel_scan(id);
}

std::string FileOperationService::start_transfer(TransferKind kind,
                                                 const std::vector<std::string>& sources,
                                                 const std::string& destination,
                                                 std::optional<ConflictPolicy> policy,
                                                 std::optional<std::string> reused_scan_id,
                                                 std::optional<TraversalOrder> order,
                                                 std::optional<std::chrono::milliseconds> progress_interval)
{
    TransferRequest request;
    request.kind = kind;
    request.sources = sources;
    request.destination = destination;
    request.conflict_policy = policy.value_or(default_policy_);
    request.reused_scan_id = std::move(reused_scan_id);
    request.order = order.value_or(default_order_);
    request.progress_interval = progress_interval.value_or(progress_interval_);
    return transfers_->start_transfer(std::move(request));
}

bool FileOperationService::cancel_transfer(const std::string& id, bool rollback)
{
    return transfers_->cancel_transfer(id, rollback);
}

bool FileOperationService::resolve_conflict(const std::string& id,
                                            std::uint64_t token,
                                            ConflictDecision decision)
{
    return transfers_->resolve_conflict(id, token, decision);
}

ConflictReport FileOperationService::detect_conflicts(const std::vector<ConflictCandidate>& candidates,
                                                      const std::string& destination,
                                                      std::optional<std::size_t> max_results) const
{
    const ConflictDetector detector(*file_system_);
    return detector.detect_conflicts(candidates, Utils::utf8_to_path(destination),
                                     max_results.value_or(max_conflicts_));
}

std::optional<OperationSnapshot> FileOperationService::get_status(const std::string& id) const
{
    return registry_->get_status(id);
}

std::vector<OperationSnapshot> FileOperationService::list_active() const
{
    return registry_->list_active();
}

bool FileOperationService::acknowledge(const std::string& id)
{
    return registry_->acknowledge(id);
}
