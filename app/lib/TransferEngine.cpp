#include "TransferEngine.hpp"
#include "ConflictDetector.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "TimedFileSystem.hpp"
#include "TransferError.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{100};

TestHooks::TransferItemProbe& item_probe_slot() {
    static TestHooks::TransferItemProbe probe;
    return probe;
}

TestHooks::CopyChunkProbe& chunk_probe_slot() {
    static TestHooks::CopyChunkProbe probe;
    return probe;
}

fs::path normalize_path(const fs::path& path)
{
    fs::path normalized = path.lexically_normal();
    if (!normalized.has_filename() && normalized.has_parent_path() && normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

fs::path canonical_or_lexical(const fs::path& path)
{
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    return ec ? normalize_path(path) : normalize_path(resolved);
}

// Resolves the containing directory only; a symlink entry keeps its own name.
fs::path resolve_entry_location(const fs::path& path)
{
    if (!path.has_filename() || !path.has_parent_path()) {
        return canonical_or_lexical(path);
    }
    return canonical_or_lexical(path.parent_path()) / path.filename();
}

TransferError errno_failure(const fs::path& path, int error)
{
    const std::string text = Utils::path_to_utf8(path);
    if (error == EACCES || error == EPERM) {
        return TransferError::permission_denied(text, std::strerror(error));
    }
    return TransferError::io_error(text, std::strerror(error));
}

TransferError code_failure(const fs::path& path, const std::error_code& ec)
{
    const std::string text = Utils::path_to_utf8(path);
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return TransferError::permission_denied(text, ec.message());
    }
    return TransferError::io_error(text, ec.message());
}

/**
 * @brief Waits for `call` on a helper thread while polling the cancellation token.
 *
 * No deadline of its own: the call is expected to be bounded by the filesystem layer.
 */
template <typename Result, typename Call>
Result run_cancellable(const CancellationToken& cancel, Call call)
{
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    std::thread([promise, call]() mutable {
        try {
            promise->set_value(call());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    while (future.wait_for(kCancelPollInterval) == std::future_status::timeout) {
        if (cancel.is_cancelled()) {
            THROW_TRANSFER_ERROR(TransferError::cancelled("Cancelled while querying free space"));
        }
    }
    return future.get();
}

/**
 * @brief Everything one transfer worker needs; lives on the worker's stack.
 */
class TransferTask {
public:
    TransferTask(OperationContext& context,
                 TransferRequest request,
                 std::shared_ptr<IFileSystem> file_system,
                 EventChannel& channel,
                 ScanEngine& scans,
                 const TransferTuning& tuning,
                 const RollbackCoordinator& rollback)
        : context_(context),
          request_(std::move(request)),
          file_system_(std::move(file_system)),
          channel_(channel),
          scans_(scans),
          tuning_(tuning),
          rollback_(rollback),
          policy_(request_.conflict_policy),
          logger_(Logger::get_logger("core_logger"))
    {
    }

    void run();

private:
    void validate();
    void build_manifest();
    bool all_on_destination_device() const;
    void check_free_space();
    void create_directories();
    void copy_files();
    void move_by_rename();
    void delete_moved_sources();

    void copy_one(const ManifestEntry& entry);
    void write_file(const ManifestEntry& entry, const fs::path& target);
    void copy_contents(const fs::path& source, const fs::path& target, std::uintmax_t size);
    ConflictDecision ask_for_decision(const ConflictRecord& record);
    void check_path_limits(const fs::path& target) const;
    void check_cancelled() const;
    std::optional<EntryInfo> stat_or_fail(const fs::path& path) const;
    bool exists_or_fail(const fs::path& path) const;

    void finish_item(const ManifestEntry& entry, bool counted_bytes);
    void enter_phase(TransferPhase phase);
    void publish_progress();
    void finish_complete();
    void finish_cancelled(bool allow_rollback);
    void finish_error(const TransferError& error);

    OperationContext& context_;
    TransferRequest request_;
    std::shared_ptr<IFileSystem> file_system_;
    EventChannel& channel_;
    ScanEngine& scans_;
    const TransferTuning& tuning_;
    const RollbackCoordinator& rollback_;
    ConflictPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<fs::path> sources_;
    fs::path destination_;
    ScanManifest manifest_;
    TransferJournal journal_;
    std::vector<fs::path> copied_sources_;
    std::optional<EntryInfo> destination_info_;

    TransferPhase phase_{TransferPhase::Scanning};
    std::string current_file_;
    std::size_t files_done_{0};
    std::uintmax_t bytes_done_{0};
    std::chrono::steady_clock::time_point last_emit_{};
    bool aborted_{false};
};

void TransferTask::run()
{
    try {
        validate();
        build_manifest();
        check_cancelled();

        const bool rename_in_place = request_.kind == TransferKind::Move && all_on_destination_device();
        if (!rename_in_place) {
            check_free_space();
        }

        enter_phase(TransferPhase::Copying);
        if (rename_in_place) {
            move_by_rename();
        } else {
            create_directories();
            copy_files();
            if (request_.kind == TransferKind::Move) {
                enter_phase(TransferPhase::Deleting);
                delete_moved_sources();
            }
        }
        finish_complete();
    } catch (const TransferFailure& failure) {
        if (failure.error().is_cancellation()) {
            finish_cancelled(!aborted_);
        } else {
            finish_error(failure.error());
        }
    } catch (const FileSystemTimeout& ex) {
        finish_error(TransferError::io_error(Utils::path_to_utf8(ex.path()), ex.what()));
    } catch (const fs::filesystem_error& ex) {
        finish_error(code_failure(ex.path1(), ex.code()));
    } catch (const std::exception& ex) {
        finish_error(TransferError::io_error(Utils::path_to_utf8(destination_), ex.what()));
    }
}

std::optional<EntryInfo> TransferTask::stat_or_fail(const fs::path& path) const
{
    try {
        return file_system_->stat_entry(path);
    } catch (const FileSystemTimeout&) {
        THROW_TRANSFER_ERROR(TransferError::io_error(Utils::path_to_utf8(path), "Timed out reading entry"));
    } catch (const fs::filesystem_error& ex) {
        THROW_TRANSFER_ERROR(code_failure(path, ex.code()));
    }
}

bool TransferTask::exists_or_fail(const fs::path& path) const
{
    try {
        return file_system_->path_exists(path);
    } catch (const FileSystemTimeout&) {
        THROW_TRANSFER_ERROR(TransferError::io_error(Utils::path_to_utf8(path), "Timed out reading entry"));
    } catch (const fs::filesystem_error& ex) {
        THROW_TRANSFER_ERROR(code_failure(path, ex.code()));
    }
}

void TransferTask::validate()
{
    destination_ = normalize_path(Utils::utf8_to_path(request_.destination));
    for (const auto& source : request_.sources) {
        sources_.push_back(normalize_path(Utils::utf8_to_path(source)));
    }

    std::vector<std::optional<EntryInfo>> source_infos;
    for (const auto& source : sources_) {
        auto info = stat_or_fail(source);
        if (!info) {
            THROW_TRANSFER_ERROR(TransferError::source_not_found(Utils::path_to_utf8(source)));
        }
        source_infos.push_back(info);
    }

    const std::string destination_text = Utils::path_to_utf8(destination_);
    destination_info_ = stat_or_fail(destination_);
    if (!destination_info_) {
        THROW_TRANSFER_ERROR(TransferError::io_error(destination_text, "Destination does not exist"));
    }
    std::error_code ec;
    const bool is_directory = destination_info_->is_directory ||
        (destination_info_->is_symlink && fs::is_directory(destination_, ec));
    if (!is_directory) {
        THROW_TRANSFER_ERROR(TransferError::io_error(destination_text, "Destination is not a directory"));
    }
    if (::access(destination_.c_str(), W_OK) != 0) {
        const int error = errno;
        THROW_TRANSFER_ERROR(TransferError::permission_denied(destination_text, std::strerror(error)));
    }

    const fs::path resolved_destination = canonical_or_lexical(destination_);
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        const fs::path resolved_source = resolve_entry_location(sources_[i]);
        if (resolved_source.parent_path() == resolved_destination) {
            THROW_TRANSFER_ERROR(TransferError::same_location(Utils::path_to_utf8(sources_[i])));
        }
        if (source_infos[i]->is_directory && Utils::is_same_or_inside(resolved_destination, resolved_source)) {
            THROW_TRANSFER_ERROR(TransferError::destination_inside_source(
                Utils::path_to_utf8(sources_[i]), destination_text));
        }
    }
}

void TransferTask::build_manifest()
{
    bool seeded = false;
    if (request_.reused_scan_id) {
        auto cached = scans_.take_completed(*request_.reused_scan_id, sources_);
        if (cached) {
            manifest_ = std::move(*cached);
            seeded = true;
            ScanEngine::sort_files(manifest_.files, request_.order);
            if (logger_) {
                logger_->debug("Transfer '{}' reuses scan '{}'", context_.id(), *request_.reused_scan_id);
            }
        } else if (logger_) {
            logger_->info("Scan '{}' is not available for reuse; scanning again", *request_.reused_scan_id);
        }
    }

    if (!seeded) {
        auto on_progress = [this](const ScanTally& tally) {
            current_file_ = tally.current_path;
            context_.update([&](OperationSnapshot& snapshot) {
                snapshot.files_total = tally.files_found;
                snapshot.bytes_total = tally.bytes_found;
                snapshot.current_file = tally.current_path;
            });
            channel_.publish(TransferProgressEvent{context_.id(), TransferPhase::Scanning, tally.current_path,
                                                   0, tally.files_found, 0, tally.bytes_found});
        };
        manifest_ = scans_.scan_sources(sources_, request_.order, context_.cancellation(),
                                        request_.progress_interval, on_progress, context_.id());
    }

    context_.update([&](OperationSnapshot& snapshot) {
        snapshot.files_total = manifest_.files_total();
        snapshot.bytes_total = manifest_.bytes_total;
    });
}

bool TransferTask::all_on_destination_device() const
{
    for (const auto& source : sources_) {
        auto info = stat_or_fail(source);
        if (!info || info->device != destination_info_->device) {
            return false;
        }
        const fs::path target = destination_ / source.filename();
        if (exists_or_fail(target)) {
            // Existing targets need per-file conflict handling.
            return false;
        }
    }
    return true;
}

void TransferTask::check_free_space()
{
    auto file_system = file_system_;
    const fs::path volume = destination_;
    std::optional<std::uintmax_t> available;
    try {
        available = run_cancellable<std::optional<std::uintmax_t>>(context_.cancellation(),
            [file_system, volume]() { return file_system->free_space(volume); });
    } catch (const FileSystemTimeout& ex) {
        if (logger_) {
            logger_->warn("Free space check skipped: {}", ex.what());
        }
        return;
    } catch (const fs::filesystem_error& ex) {
        if (logger_) {
            logger_->warn("Free space check skipped: {}", ex.what());
        }
        return;
    }

    if (!available) {
        if (logger_) {
            logger_->debug("Free space of '{}' unknown; continuing", Utils::path_to_utf8(destination_));
        }
        return;
    }
    if (*available < manifest_.bytes_total) {
        THROW_TRANSFER_ERROR(TransferError::insufficient_space(manifest_.bytes_total, *available));
    }
}

void TransferTask::check_cancelled() const
{
    if (context_.cancellation().is_cancelled()) {
        THROW_TRANSFER_ERROR(TransferError::cancelled("Cancelled by user"));
    }
}

void TransferTask::check_path_limits(const fs::path& target) const
{
    const std::string name = Utils::path_to_utf8(target.filename());
    if (name.size() > TransferEngine::kMaxNameBytes) {
        THROW_TRANSFER_ERROR(TransferError::io_error(Utils::path_to_utf8(target), "File name too long"));
    }
    if (target.native().size() > TransferEngine::kMaxPathBytes) {
        THROW_TRANSFER_ERROR(TransferError::io_error(Utils::path_to_utf8(target), "Path too long"));
    }
}

void TransferTask::create_directories()
{
    for (const auto& entry : manifest_.directories) {
        check_cancelled();
        const fs::path target = Utils::destination_for(entry, destination_);
        check_path_limits(target);
        current_file_ = Utils::path_to_utf8(entry.path);

        auto existing = stat_or_fail(target);
        if (existing) {
            if (!existing->is_directory) {
                THROW_TRANSFER_ERROR(TransferError::destination_exists(Utils::path_to_utf8(target)));
            }
            continue;
        }

        std::error_code ec;
        fs::create_directory(target, ec);
        if (ec) {
            THROW_TRANSFER_ERROR(code_failure(target, ec));
        }
        journal_.record_created(target);
        publish_progress();
    }
}

void TransferTask::copy_files()
{
    for (const auto& entry : manifest_.files) {
        check_cancelled();
        copy_one(entry);
    }
}

ConflictDecision TransferTask::ask_for_decision(const ConflictRecord& record)
{
    ConflictGate& gate = context_.conflict_gate();
    const std::uint64_t token = gate.open();
    if (logger_) {
        logger_->info("Transfer '{}' paused on conflict '{}' (token {})", context_.id(),
                      record.destination_path, token);
    }
    channel_.publish(TransferConflictEvent{context_.id(), token, record});

    auto decision = gate.wait(token, tuning_.conflict_wait, context_.cancellation());
    if (!decision) {
        if (context_.cancellation().is_cancelled()) {
            check_cancelled();
        }
        if (logger_) {
            logger_->warn("No conflict decision for '{}' within {} ms; cancelling",
                          context_.id(), tuning_.conflict_wait.count());
        }
        aborted_ = true;
        THROW_TRANSFER_ERROR(TransferError::cancelled("No conflict decision received"));
    }
    return *decision;
}

void TransferTask::copy_one(const ManifestEntry& entry)
{
    const fs::path target = Utils::destination_for(entry, destination_);
    current_file_ = Utils::path_to_utf8(entry.path);
    check_path_limits(target);

    auto source_info = stat_or_fail(entry.path);
    if (!source_info) {
        THROW_TRANSFER_ERROR(TransferError::source_not_found(current_file_));
    }

    // Existence is checked again here; an earlier conflict scan may be stale.
    auto existing = stat_or_fail(target);
    if (!existing) {
        write_file(entry, target);
        finish_item(entry, true);
        return;
    }

    if (existing->device == source_info->device && existing->inode == source_info->inode) {
        THROW_TRANSFER_ERROR(TransferError::same_location(current_file_));
    }

    bool overwrite = policy_ == ConflictPolicy::Overwrite;
    if (policy_ == ConflictPolicy::Stop) {
        const ConflictDetector detector(*file_system_);
        auto record = detector.check_one(ConflictDetector::candidate_for(entry), target);
        if (!record) {
            write_file(entry, target);
            finish_item(entry, true);
            return;
        }
        switch (ask_for_decision(*record)) {
            case ConflictDecision::OverwriteThis:
                overwrite = true;
                break;
            case ConflictDecision::SkipThis:
                overwrite = false;
                break;
            case ConflictDecision::OverwriteRemaining:
                policy_ = ConflictPolicy::Overwrite;
                overwrite = true;
                break;
            case ConflictDecision::SkipRemaining:
                policy_ = ConflictPolicy::Skip;
                overwrite = false;
                break;
            case ConflictDecision::Abort:
                aborted_ = true;
                THROW_TRANSFER_ERROR(TransferError::cancelled("Aborted at conflict"));
        }
    }

    if (!overwrite) {
        if (logger_) {
            logger_->info("Skipping existing '{}'", Utils::path_to_utf8(target));
        }
        finish_item(entry, false);
        return;
    }

    if (existing->is_directory) {
        THROW_TRANSFER_ERROR(TransferError::destination_exists(Utils::path_to_utf8(target)));
    }
    write_file(entry, target);
    finish_item(entry, true);
}

void TransferTask::write_file(const ManifestEntry& entry, const fs::path& target)
{
    const fs::path staging = target.parent_path() / (".twinpane-" + context_.id() + ".part");
    std::error_code ec;
    fs::remove(staging, ec);
    ec.clear();

    if (entry.is_symlink) {
        const fs::path link_target = fs::read_symlink(entry.path, ec);
        if (ec) {
            THROW_TRANSFER_ERROR(code_failure(entry.path, ec));
        }
        fs::create_symlink(link_target, staging, ec);
        if (ec) {
            THROW_TRANSFER_ERROR(code_failure(target, ec));
        }
    } else {
        copy_contents(entry.path, staging, entry.size);
        const auto modified = fs::last_write_time(entry.path, ec);
        if (!ec) {
            fs::last_write_time(staging, modified, ec);
        }
        if (ec && logger_) {
            logger_->debug("Could not preserve modification time of '{}': {}",
                           Utils::path_to_utf8(target), ec.message());
        }
        ec.clear();
        fs::permissions(staging, fs::status(entry.path, ec).permissions(), ec);
        ec.clear();
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        THROW_TRANSFER_ERROR(code_failure(target, ec));
    }
    journal_.record_created(target);
}

void TransferTask::copy_contents(const fs::path& source, const fs::path& target, std::uintmax_t size)
{
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        THROW_TRANSFER_ERROR(errno_failure(source, errno));
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_TRANSFER_ERROR(errno_failure(target, errno));
    }

    auto discard_partial = [&]() {
        out.close();
        std::error_code ec;
        fs::remove(target, ec);
    };

    const bool large = size >= tuning_.large_file_bytes;
    std::vector<char> buffer(std::max<std::size_t>(tuning_.copy_chunk_bytes, 1));
    std::uintmax_t written = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }
        out.write(buffer.data(), count);
        if (!out) {
            const int error = errno;
            discard_partial();
            THROW_TRANSFER_ERROR(errno_failure(target, error));
        }
        written += static_cast<std::uintmax_t>(count);

        if (large) {
            if (auto& probe = chunk_probe_slot()) {
                probe(context_.id(), written);
            }
        }
        if (large && context_.cancellation().is_cancelled()) {
            discard_partial();
            if (logger_) {
                logger_->info("Cancelled mid-copy; removed partial '{}'", Utils::path_to_utf8(target));
            }
            check_cancelled();
        }
    }

    if (in.bad()) {
        const int error = errno;
        discard_partial();
        THROW_TRANSFER_ERROR(errno_failure(source, error));
    }
    out.close();
    if (!out) {
        const int error = errno;
        std::error_code ec;
        fs::remove(target, ec);
        THROW_TRANSFER_ERROR(errno_failure(target, error));
    }
    if (written != size && logger_) {
        logger_->warn("'{}' changed size during copy ({} -> {} bytes)",
                      Utils::path_to_utf8(source), size, written);
    }
}

void TransferTask::move_by_rename()
{
    for (const auto& source : sources_) {
        check_cancelled();
        const fs::path target = destination_ / source.filename();
        check_path_limits(target);
        current_file_ = Utils::path_to_utf8(source);

        std::error_code ec;
        fs::rename(source, target, ec);
        if (ec) {
            THROW_TRANSFER_ERROR(code_failure(source, ec));
        }
        journal_.record_renamed(source, target);

        std::size_t files_moved = 0;
        std::uintmax_t bytes_moved = 0;
        for (const auto& entry : manifest_.files) {
            if (Utils::is_same_or_inside(entry.path, source)) {
                ++files_moved;
                bytes_moved += entry.size;
            }
        }
        files_done_ = std::min(files_done_ + files_moved, manifest_.files_total());
        bytes_done_ = std::min(bytes_done_ + bytes_moved, manifest_.bytes_total);
        context_.update([&](OperationSnapshot& snapshot) {
            snapshot.files_done = files_done_;
            snapshot.bytes_done = bytes_done_;
            snapshot.current_file = current_file_;
        });
        if (auto& probe = item_probe_slot()) {
            probe(TestHooks::TransferItemInfo{context_.id(), phase_, current_file_, files_done_,
                                              manifest_.files_total()});
        }
        publish_progress();
    }
}

void TransferTask::delete_moved_sources()
{
    for (const auto& source : copied_sources_) {
        current_file_ = Utils::path_to_utf8(source);
        std::error_code ec;
        fs::remove(source, ec);
        if (ec) {
            THROW_TRANSFER_ERROR(code_failure(source, ec));
        }
        publish_progress();
    }

    // Directories go deepest first; one still holding a skipped file stays.
    for (auto it = manifest_.directories.rbegin(); it != manifest_.directories.rend(); ++it) {
        std::error_code ec;
        if (!fs::remove(it->path, ec) || ec) {
            if (logger_) {
                logger_->info("Keeping source directory '{}': {}", Utils::path_to_utf8(it->path),
                              ec ? ec.message() : "not removed");
            }
        }
    }
}

void TransferTask::finish_item(const ManifestEntry& entry, bool counted_bytes)
{
    ++files_done_;
    if (counted_bytes) {
        bytes_done_ += entry.size;
        copied_sources_.push_back(entry.path);
    }
    files_done_ = std::min(files_done_, manifest_.files_total());
    bytes_done_ = std::min(bytes_done_, manifest_.bytes_total);

    context_.update([&](OperationSnapshot& snapshot) {
        snapshot.files_done = files_done_;
        snapshot.bytes_done = bytes_done_;
        snapshot.current_file = current_file_;
    });
    if (auto& probe = item_probe_slot()) {
        probe(TestHooks::TransferItemInfo{context_.id(), phase_, current_file_, files_done_,
                                          manifest_.files_total()});
    }
    publish_progress();
}

void TransferTask::enter_phase(TransferPhase phase)
{
    phase_ = phase;
    context_.update([&](OperationSnapshot& snapshot) {
        snapshot.phase = to_string(phase);
    });
    if (logger_) {
        logger_->debug("Transfer '{}' entered phase {}", context_.id(), to_string(phase));
    }
}

void TransferTask::publish_progress()
{
    const auto now = std::chrono::steady_clock::now();
    if (now - last_emit_ < request_.progress_interval) {
        return;
    }
    last_emit_ = now;
    channel_.publish(TransferProgressEvent{context_.id(), phase_, current_file_, files_done_,
                                           manifest_.files_total(), bytes_done_, manifest_.bytes_total});
}

void TransferTask::finish_complete()
{
    if (logger_) {
        logger_->info("Transfer '{}' complete: {} files, {}", context_.id(), files_done_,
                      Utils::format_bytes(bytes_done_));
    }
    context_.update([](OperationSnapshot& snapshot) {
        snapshot.phase = "complete";
        snapshot.current_file.clear();
    });
    context_.mark_finished();
    channel_.publish(TransferCompleteEvent{context_.id(), files_done_, bytes_done_});
}

void TransferTask::finish_cancelled(bool allow_rollback)
{
    const bool rollback = allow_rollback && context_.cancellation().rollback_requested();
    if (rollback) {
        enter_phase(TransferPhase::RollingBack);
        const auto result = rollback_.roll_back(journal_,
            [this](std::size_t, std::size_t, const fs::path& current) {
                current_file_ = Utils::path_to_utf8(current);
                publish_progress();
            });
        if (result.failed > 0 && logger_) {
            logger_->warn("Rollback of '{}' left {} path(s) behind", context_.id(), result.failed);
        }
    }
    if (logger_) {
        logger_->info("Transfer '{}' cancelled after {} files (rolled back: {})",
                      context_.id(), files_done_, rollback);
    }
    context_.update([](OperationSnapshot& snapshot) {
        snapshot.phase = "cancelled";
        snapshot.current_file.clear();
    });
    context_.mark_finished();
    channel_.publish(TransferCancelledEvent{context_.id(), files_done_, rollback});
}

void TransferTask::finish_error(const TransferError& error)
{
    if (logger_) {
        logger_->error("Transfer '{}' failed: {} ({} created path(s) left in place)",
                       context_.id(), error.describe(), journal_.size());
    }
    context_.update([](OperationSnapshot& snapshot) {
        snapshot.phase = "error";
    });
    context_.mark_finished();
    channel_.publish(TransferErrorEvent{context_.id(), error});
}

} // namespace

namespace TestHooks {

void set_transfer_item_probe(TransferItemProbe probe) {
    item_probe_slot() = std::move(probe);
}

void reset_transfer_item_probe() {
    item_probe_slot() = TransferItemProbe{};
}

void set_copy_chunk_probe(CopyChunkProbe probe) {
    chunk_probe_slot() = std::move(probe);
}

void reset_copy_chunk_probe() {
    chunk_probe_slot() = CopyChunkProbe{};
}

} // namespace TestHooks

TransferTuning TransferTuning::from_settings(const EngineSettings& settings)
{
    TransferTuning tuning;
    tuning.copy_chunk_bytes = settings.get_copy_chunk_bytes();
    tuning.large_file_bytes = settings.get_large_file_bytes();
    tuning.conflict_wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        settings.get_conflict_wait_timeout());
    return tuning;
}

TransferEngine::TransferEngine(std::shared_ptr<IFileSystem> file_system,
                               EventChannel& channel,
                               OperationRegistry& registry,
                               ScanEngine& scans,
                               TransferTuning tuning)
    : file_system_(std::move(file_system)),
      channel_(channel),
      registry_(registry),
      scans_(scans),
      tuning_(tuning)
{
    if (!file_system_) {
        throw std::invalid_argument("TransferEngine requires a filesystem");
    }
}

std::string TransferEngine::start_transfer(TransferRequest request)
{
    const OperationKind kind = request.kind == TransferKind::Move ? OperationKind::Move : OperationKind::Copy;
    const std::string id = Utils::generate_operation_id(to_string(request.kind) + "-");

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Starting {} '{}' of {} source(s) to '{}' (policy: {})", to_string(request.kind), id,
                     request.sources.size(), request.destination, to_string(request.conflict_policy));
    }

    registry_.launch(id, kind, [this, request = std::move(request)](OperationContext& context) mutable {
        TransferTask task(context, std::move(request), file_system_, channel_, scans_, tuning_, rollback_);
        task.run();
    });
    return id;
}

bool TransferEngine::cancel_transfer(const std::string& id, bool rollback)
{
    return registry_.cancel(id, rollback);
}

bool TransferEngine::resolve_conflict(const std::string& id, std::uint64_t token, ConflictDecision decision)
{
    auto context = registry_.find(id);
    if (!context || context->finished()) {
        return false;
    }
    return context->conflict_gate().resolve(token, decision);
}
