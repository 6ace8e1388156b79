#include "ScanEngine.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "TimedFileSystem.hpp"
#include "TransferError.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace {

TestHooks::ScanEntryProbe& scan_entry_probe_slot() {
    static TestHooks::ScanEntryProbe probe;
    return probe;
}

std::filesystem::path normalize_source(const std::filesystem::path& source)
{
    std::filesystem::path normalized = source.lexically_normal();
    if (!normalized.has_filename() && normalized.has_parent_path() && normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

std::string lower_name(const ManifestEntry& entry)
{
    return Utils::to_lower_copy(Utils::path_to_utf8(entry.path.filename()));
}

std::string lower_extension(const ManifestEntry& entry)
{
    std::string extension = Utils::path_to_utf8(entry.path.extension());
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    return Utils::to_lower_copy(extension);
}

TransferError root_failure(const std::filesystem::path& root, const std::filesystem::filesystem_error& ex)
{
    if (ex.code() == std::errc::permission_denied || ex.code() == std::errc::operation_not_permitted) {
        return TransferError::permission_denied(Utils::path_to_utf8(root), ex.code().message());
    }
    return TransferError::io_error(Utils::path_to_utf8(root), ex.code().message());
}

/**
 * @brief Depth-first traversal state for one scan_sources() call.
 */
class ScanWalker {
public:
    ScanWalker(IFileSystem& file_system,
               const CancellationToken& cancel,
               std::chrono::milliseconds interval,
               const ScanProgressCallback& on_progress,
               const std::string& operation_id)
        : file_system_(file_system),
          cancel_(cancel),
          interval_(interval),
          on_progress_(on_progress),
          operation_id_(operation_id),
          last_emit_(std::chrono::steady_clock::now())
    {
    }

    void walk_root(const std::filesystem::path& source)
    {
        const std::filesystem::path root = normalize_source(source);
        const std::filesystem::path source_root = root.parent_path();
        const std::string root_text = Utils::path_to_utf8(root);

        std::optional<EntryInfo> info;
        try {
            info = file_system_.stat_entry(root);
        } catch (const FileSystemTimeout&) {
            THROW_TRANSFER_ERROR(TransferError::io_error(root_text, "Timed out reading source"));
        } catch (const std::filesystem::filesystem_error& ex) {
            THROW_TRANSFER_ERROR(root_failure(root, ex));
        }
        if (!info) {
            THROW_TRANSFER_ERROR(TransferError::source_not_found(root_text));
        }

        if (info->is_directory) {
            std::vector<std::filesystem::path> children;
            try {
                children = file_system_.list_directory(root);
            } catch (const FileSystemTimeout&) {
                THROW_TRANSFER_ERROR(TransferError::io_error(root_text, "Timed out listing source"));
            } catch (const std::filesystem::filesystem_error& ex) {
                THROW_TRANSFER_ERROR(root_failure(root, ex));
            }
            add_directory(root, source_root, *info);
            visit_children(std::move(children), source_root);
        } else {
            visit_entry(root, source_root, *info);
        }
        maybe_emit(root_text);
    }

    ScanManifest finish(TraversalOrder order)
    {
        ScanEngine::sort_files(manifest_.files, order);
        manifest_.skipped_entries = tally_.skipped_entries;
        return std::move(manifest_);
    }

    const ScanTally& tally() const { return tally_; }

private:
    void check_cancelled() const
    {
        if (cancel_.is_cancelled()) {
            THROW_TRANSFER_ERROR(TransferError::cancelled("Scan cancelled"));
        }
    }

    void skip(const std::filesystem::path& path, const std::string& reason)
    {
        ++tally_.skipped_entries;
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Skipping '{}': {}", Utils::path_to_utf8(path), reason);
        }
    }

    void add_directory(const std::filesystem::path& path,
                       const std::filesystem::path& source_root,
                       const EntryInfo& info)
    {
        manifest_.directories.push_back(ManifestEntry{path, source_root, 0, info.modified_at, false});
        ++tally_.dirs_found;
    }

    void add_file(const std::filesystem::path& path,
                  const std::filesystem::path& source_root,
                  const EntryInfo& info)
    {
        manifest_.files.push_back(ManifestEntry{path, source_root, info.size, info.modified_at, info.is_symlink});
        manifest_.bytes_total += info.size;
        ++tally_.files_found;
        tally_.bytes_found += info.size;
    }

    void visit_entry(const std::filesystem::path& path,
                     const std::filesystem::path& source_root,
                     const EntryInfo& info)
    {
        if (info.is_symlink) {
            if (info.symlink_loop) {
                skip(path, TransferError::symlink_loop(Utils::path_to_utf8(path)).describe());
                return;
            }
            add_file(path, source_root, info);
        } else if (info.is_regular) {
            add_file(path, source_root, info);
        } else if (info.is_directory) {
            std::vector<std::filesystem::path> children;
            try {
                children = file_system_.list_directory(path);
            } catch (const FileSystemTimeout& ex) {
                skip(path, ex.what());
                return;
            } catch (const std::filesystem::filesystem_error& ex) {
                skip(path, ex.code().message());
                return;
            }
            add_directory(path, source_root, info);
            visit_children(std::move(children), source_root);
        } else {
            skip(path, "not a regular file, directory or symlink");
        }
    }

    void visit_children(std::vector<std::filesystem::path> children,
                        const std::filesystem::path& source_root)
    {
        std::sort(children.begin(), children.end());
        for (const auto& child : children) {
            check_cancelled();
            const std::string child_text = Utils::path_to_utf8(child);
            if (auto& probe = scan_entry_probe_slot()) {
                probe(operation_id_, child_text);
            }

            std::optional<EntryInfo> info;
            try {
                info = file_system_.stat_entry(child);
            } catch (const FileSystemTimeout& ex) {
                skip(child, ex.what());
                continue;
            } catch (const std::filesystem::filesystem_error& ex) {
                skip(child, ex.code().message());
                continue;
            }
            if (!info) {
                skip(child, "vanished during scan");
                continue;
            }
            visit_entry(child, source_root, *info);
            maybe_emit(child_text);
        }
    }

    void maybe_emit(const std::string& current_path)
    {
        tally_.current_path = current_path;
        const auto now = std::chrono::steady_clock::now();
        if (on_progress_ && now - last_emit_ >= interval_) {
            last_emit_ = now;
            on_progress_(tally_);
        }
    }

    IFileSystem& file_system_;
    const CancellationToken& cancel_;
    std::chrono::milliseconds interval_;
    const ScanProgressCallback& on_progress_;
    const std::string& operation_id_;
    std::chrono::steady_clock::time_point last_emit_;
    ScanTally tally_;
    ScanManifest manifest_;
};

std::vector<std::filesystem::path> to_paths(const std::vector<std::string>& sources)
{
    std::vector<std::filesystem::path> paths;
    paths.reserve(sources.size());
    for (const auto& source : sources) {
        paths.push_back(normalize_source(Utils::utf8_to_path(source)));
    }
    return paths;
}

} // namespace

namespace TestHooks {

void set_scan_entry_probe(ScanEntryProbe probe) {
    scan_entry_probe_slot() = std::move(probe);
}

void reset_scan_entry_probe() {
    scan_entry_probe_slot() = ScanEntryProbe{};
}

} // namespace TestHooks

ScanEngine::ScanEngine(std::shared_ptr<IFileSystem> file_system,
                       EventChannel& channel,
                       OperationRegistry& registry)
    : file_system_(std::move(file_system)),
      channel_(channel),
      registry_(registry)
{
    if (!file_system_) {
        throw std::invalid_argument("ScanEngine requires a filesystem");
    }
}

void ScanEngine::sort_files(std::vector<ManifestEntry>& files, TraversalOrder order)
{
    auto compare = [column = order.column](const ManifestEntry& a, const ManifestEntry& b) -> int {
        switch (column) {
            case SortColumn::Extension: {
                const auto ext_a = lower_extension(a);
                const auto ext_b = lower_extension(b);
                if (ext_a != ext_b) {
                    return ext_a < ext_b ? -1 : 1;
                }
                break;
            }
            case SortColumn::Size:
                if (a.size != b.size) {
                    return a.size < b.size ? -1 : 1;
                }
                return 0;
            case SortColumn::Modified:
                if (a.modified_at != b.modified_at) {
                    return a.modified_at < b.modified_at ? -1 : 1;
                }
                return 0;
            case SortColumn::Name:
                break;
        }
        const auto name_a = lower_name(a);
        const auto name_b = lower_name(b);
        if (name_a == name_b) {
            return 0;
        }
        return name_a < name_b ? -1 : 1;
    };

    const bool descending = order.order == SortOrder::Descending;
    std::stable_sort(files.begin(), files.end(), [&](const ManifestEntry& a, const ManifestEntry& b) {
        const int result = compare(a, b);
        return descending ? result > 0 : result < 0;
    });
}

ScanManifest ScanEngine::scan_sources(const std::vector<std::filesystem::path>& sources,
                                      TraversalOrder order,
                                      const CancellationToken& cancel,
                                      std::chrono::milliseconds progress_interval,
                                      const ScanProgressCallback& on_progress,
                                      const std::string& operation_id) const
{
    ScanWalker walker(*file_system_, cancel, progress_interval, on_progress, operation_id);
    for (const auto& source : sources) {
        if (cancel.is_cancelled()) {
            THROW_TRANSFER_ERROR(TransferError::cancelled("Scan cancelled"));
        }
        walker.walk_root(source);
    }

    const ScanTally tally = walker.tally();
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Scanned {} source(s): {} files, {} directories, {} ({} skipped)",
                     sources.size(), tally.files_found, tally.dirs_found,
                     Utils::format_bytes(tally.bytes_found), tally.skipped_entries);
    }
    return walker.finish(order);
}

std::string ScanEngine::start_scan(const std::vector<std::string>& sources,
                                   TraversalOrder order,
                                   std::chrono::milliseconds progress_interval)
{
    const std::string id = Utils::generate_operation_id("scan-");
    auto paths = to_paths(sources);
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_[id] = ScanRecord{ScanStatus::Running, paths, std::nullopt};
    }

    registry_.launch(id, OperationKind::Scan,
        [this, paths = std::move(paths), order, progress_interval](OperationContext& context) mutable {
            run_scan(context, std::move(paths), order, progress_interval);
        });
    release_unregistered_records();
    return id;
}

void ScanEngine::release_unregistered_records()
{
    std::vector<std::string> completed;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        for (const auto& [id, record] : records_) {
            if (record.status == ScanStatus::Complete) {
                completed.push_back(id);
            }
        }
    }

    std::vector<std::string> released;
    for (const auto& id : completed) {
        if (!registry_.find(id)) {
            released.push_back(id);
        }
    }
    if (released.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(records_mutex_);
    for (const auto& id : released) {
        records_.erase(id);
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Released {} expired scan result(s)", released.size());
    }
}

bool ScanEngine::cancel_scan(const std::string& id)
{
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        known = records_.erase(id) > 0;
    }
    const bool running = registry_.cancel(id, false);
    return known || running;
}

std::optional<ScanManifest> ScanEngine::take_completed(const std::string& scan_id,
                                                       const std::vector<std::filesystem::path>& sources)
{
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(scan_id);
    if (it == records_.end() || it->second.status != ScanStatus::Complete || !it->second.manifest) {
        return std::nullopt;
    }

    auto requested = sources;
    for (auto& path : requested) {
        path = normalize_source(path);
    }
    auto scanned = it->second.sources;
    std::sort(requested.begin(), requested.end());
    std::sort(scanned.begin(), scanned.end());
    if (requested != scanned) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Scan '{}' covered different sources; rescanning", scan_id);
        }
        return std::nullopt;
    }

    ScanManifest manifest = std::move(*it->second.manifest);
    records_.erase(it);
    return manifest;
}

std::optional<ScanStatus> ScanEngine::status_of(const std::string& scan_id) const
{
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(scan_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

void ScanEngine::set_status(const std::string& id, ScanStatus status, std::optional<ScanManifest> manifest)
{
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return;
    }
    if (status == ScanStatus::Complete) {
        it->second.status = status;
        it->second.manifest = std::move(manifest);
    } else {
        records_.erase(it);
    }
}

void ScanEngine::run_scan(OperationContext& context,
                          std::vector<std::filesystem::path> sources,
                          TraversalOrder order,
                          std::chrono::milliseconds progress_interval)
{
    const std::string& id = context.id();
    auto logger = Logger::get_logger("core_logger");

    auto on_progress = [&](const ScanTally& tally) {
        context.update([&](OperationSnapshot& snapshot) {
            snapshot.files_total = tally.files_found;
            snapshot.bytes_total = tally.bytes_found;
            snapshot.current_file = tally.current_path;
        });
        channel_.publish(ScanProgressEvent{id, tally.files_found, tally.dirs_found,
                                           tally.bytes_found, tally.current_path});
    };

    try {
        ScanManifest manifest = scan_sources(sources, order, context.cancellation(),
                                             progress_interval, on_progress, id);
        ScanCompleteEvent complete{id, manifest.files_total(), manifest.dirs_total(),
                                   manifest.bytes_total, manifest.skipped_entries};
        context.update([&](OperationSnapshot& snapshot) {
            snapshot.phase = to_string(ScanStatus::Complete);
            snapshot.files_total = complete.files_total;
            snapshot.bytes_total = complete.bytes_total;
            snapshot.current_file.clear();
        });
        set_status(id, ScanStatus::Complete, std::move(manifest));
        context.mark_finished();
        channel_.publish(complete);
    } catch (const TransferFailure& failure) {
        if (failure.error().is_cancellation()) {
            if (logger) {
                logger->info("Scan '{}' cancelled", id);
            }
            set_status(id, ScanStatus::Cancelled);
            context.update([](OperationSnapshot& snapshot) {
                snapshot.phase = to_string(ScanStatus::Cancelled);
            });
            context.mark_finished();
            channel_.publish(ScanCancelledEvent{id});
            return;
        }
        if (logger) {
            logger->error("Scan '{}' failed: {}", id, failure.error().describe());
        }
        set_status(id, ScanStatus::Error);
        context.update([](OperationSnapshot& snapshot) {
            snapshot.phase = to_string(ScanStatus::Error);
        });
        context.mark_finished();
        channel_.publish(ScanErrorEvent{id, failure.error().user_message()});
    } catch (const std::exception& ex) {
        if (logger) {
            logger->error("Scan '{}' failed: {}", id, ex.what());
        }
        set_status(id, ScanStatus::Error);
        context.mark_finished();
        channel_.publish(ScanErrorEvent{id, ex.what()});
    }
}
