#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>

/**
 * @brief Cooperative cancellation request shared between a caller and one worker.
 *
 * The worker polls it at item boundaries and between chunks of large files.
 */
class CancellationToken {
public:
    /// A rollback request stays in force when a later request omits it.
    void request(bool rollback) noexcept {
        if (rollback) {
            rollback_.store(true, std::memory_order_relaxed);
        }
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    bool rollback_requested() const noexcept {
        return rollback_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> rollback_{false};
};

#endif
