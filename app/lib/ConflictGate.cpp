#include "ConflictGate.hpp"
#include "Logger.hpp"

std::uint64_t ConflictGate::open()
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_token_ = generations_.issue();
    decision_.reset();
    return open_token_;
}

bool ConflictGate::resolve(std::uint64_t token, ConflictDecision decision)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_token_ == 0 || !generations_.is_current(token) || decision_) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->info("Discarding stale conflict decision '{}' (token {}, current {})",
                             to_string(decision), token, generations_.latest());
            }
            return false;
        }
        decision_ = decision;
    }
    cv_.notify_all();
    return true;
}

std::optional<ConflictDecision> ConflictGate::wait(std::uint64_t token,
                                                   std::chrono::milliseconds timeout,
                                                   const CancellationToken& cancel)
{
    std::unique_lock<std::mutex> lock(mutex_);
    const bool woke = cv_.wait_for(lock, timeout, [&] {
        return decision_.has_value() || cancel.is_cancelled();
    });

    std::optional<ConflictDecision> result;
    if (woke && decision_ && open_token_ == token) {
        result = decision_;
    }
    open_token_ = 0;
    decision_.reset();
    return result;
}

void ConflictGate::interrupt()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

bool ConflictGate::waiting() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_token_ != 0;
}
