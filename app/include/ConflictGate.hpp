#ifndef CONFLICT_GATE_HPP
#define CONFLICT_GATE_HPP

#include "CancellationToken.hpp"
#include "GenerationCounter.hpp"
#include "Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

/**
 * @brief Rendezvous between a transfer paused on a conflict and the caller's decision.
 *
 * Every pause opens the gate with a fresh generation token. A decision is applied
 * only when it carries the token of the pause currently waiting.
 */
class ConflictGate {
public:
    std::uint64_t open();

    /**
     * @return false when the token is stale or nobody is waiting.
     */
    bool resolve(std::uint64_t token, ConflictDecision decision);

    /**
     * @brief Blocks until a decision for `token` arrives.
     * @return nullopt on timeout or when the operation was cancelled meanwhile.
     */
    std::optional<ConflictDecision> wait(std::uint64_t token,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken& cancel);

    /// Wakes a waiter so it can observe cancellation.
    void interrupt();

    bool waiting() const;

private:
    GenerationCounter generations_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t open_token_{0};
    std::optional<ConflictDecision> decision_;
};

#endif
