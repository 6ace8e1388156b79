#include "RollbackCoordinator.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

void TransferJournal::record_created(const fs::path& path)
{
    entries_.push_back(Entry{Entry::Action::Created, path, {}});
}

void TransferJournal::record_renamed(const fs::path& from, const fs::path& to)
{
    entries_.push_back(Entry{Entry::Action::Renamed, to, from});
}

RollbackResult RollbackCoordinator::roll_back(const TransferJournal& journal,
                                              const ProgressCallback& on_progress) const
{
    RollbackResult result;
    auto logger = Logger::get_logger("core_logger");
    const auto& entries = journal.entries();
    const std::size_t total = entries.size();

    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::error_code ec;
        if (it->action == TransferJournal::Entry::Action::Renamed) {
            fs::rename(it->path, it->original, ec);
        } else {
            const bool removed = fs::remove(it->path, ec);
            if (!ec && !removed && logger) {
                logger->debug("Rollback: '{}' was already gone", Utils::path_to_utf8(it->path));
            }
        }

        if (ec) {
            ++result.failed;
            if (logger) {
                logger->warn("Rollback could not revert '{}': {}", Utils::path_to_utf8(it->path), ec.message());
            }
        } else {
            ++result.reverted;
        }

        if (on_progress) {
            on_progress(result.reverted + result.failed, total, it->path);
        }
    }

    if (logger) {
        logger->info("Rollback finished: {} reverted, {} failed", result.reverted, result.failed);
    }
    return result;
}
