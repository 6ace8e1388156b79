#ifndef GENERATION_COUNTER_HPP
#define GENERATION_COUNTER_HPP

#include <atomic>
#include <cstdint>

/**
 * @brief Issues monotonically increasing tokens; only the latest one is current.
 *
 * A response carrying an older token is stale and must be discarded.
 */
class GenerationCounter {
public:
    std::uint64_t issue() noexcept {
        return latest_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    std::uint64_t latest() const noexcept {
        return latest_.load(std::memory_order_acquire);
    }

    bool is_current(std::uint64_t token) const noexcept {
        return token != 0 && token == latest();
    }

private:
    std::atomic<std::uint64_t> latest_{0};
};

#endif
