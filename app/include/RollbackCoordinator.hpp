#ifndef ROLLBACK_COORDINATOR_HPP
#define ROLLBACK_COORDINATOR_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

/**
 * @brief Ordered record of what a transfer changed at the destination.
 *
 * Entries are appended right after the filesystem call that produced them returns.
 */
class TransferJournal {
public:
    struct Entry {
        enum class Action {Created, Renamed};
        Action action{Action::Created};
        std::filesystem::path path;
        std::filesystem::path original; ///< Where a renamed item came from.
    };

    void record_created(const std::filesystem::path& path);
    void record_renamed(const std::filesystem::path& from, const std::filesystem::path& to);

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

struct RollbackResult {
    std::size_t reverted{0};
    std::size_t failed{0};
};

/**
 * @brief Undoes a journal in reverse order, children before their parents.
 *
 * Created paths are removed and renamed items are moved back. A path that cannot
 * be reverted is logged and skipped; nothing is retried.
 */
class RollbackCoordinator {
public:
    using ProgressCallback = std::function<void(std::size_t done,
                                                std::size_t total,
                                                const std::filesystem::path& current)>;

    RollbackResult roll_back(const TransferJournal& journal,
                             const ProgressCallback& on_progress = {}) const;
};

#endif
