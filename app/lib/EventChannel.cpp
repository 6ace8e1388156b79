#include "EventChannel.hpp"
#include "Logger.hpp"

#include <algorithm>

EventSubscription::EventSubscription(std::vector<EventKind> kinds)
    : kinds_(std::move(kinds))
{
}

bool EventSubscription::track(const std::string& operation_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tracked_id_) {
        tracked_id_ = operation_id;
        // Events of other operations queued while the id was unknown are stale now.
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [&](const EngineEvent& event) {
                                        return event.operation_id != operation_id;
                                    }),
                     queue_.end());
        return true;
    }
    if (*tracked_id_ != operation_id) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Subscription already adopted '{}'; ignoring start response '{}'",
                         *tracked_id_, operation_id);
        }
        return false;
    }
    return true;
}

std::optional<std::string> EventSubscription::tracked_id() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_id_;
}

bool EventSubscription::accepts_kind(EventKind kind) const
{
    return kinds_.empty() || std::find(kinds_.begin(), kinds_.end(), kind) != kinds_.end();
}

void EventSubscription::offer(const EngineEvent& event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!tracked_id_) {
            tracked_id_ = event.operation_id;
        } else if (*tracked_id_ != event.operation_id) {
            return;
        }
        queue_.push_back(event);
    }
    cv_.notify_all();
}

std::optional<EngineEvent> EventSubscription::wait_next(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    EngineEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<EngineEvent> EventSubscription::try_next()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    EngineEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<EngineEvent> EventSubscription::drain_until_terminal(std::chrono::milliseconds timeout)
{
    std::vector<EngineEvent> received;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto event = wait_next(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (!event) {
            break;
        }
        const bool terminal = event->terminal();
        received.push_back(std::move(*event));
        if (terminal) {
            break;
        }
    }
    return received;
}

std::size_t EventSubscription::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

EventChannel::SubscriptionHandle EventChannel::subscribe(std::vector<EventKind> kinds)
{
    auto handle = std::make_shared<EventSubscription>(std::move(kinds));
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(handle);
    return handle;
}

void EventChannel::unsubscribe(const SubscriptionHandle& handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [&](const std::weak_ptr<EventSubscription>& weak) {
                                          auto locked = weak.lock();
                                          return !locked || locked == handle;
                                      }),
                       subscribers_.end());
}

void EventChannel::publish(const std::string& operation_id, EventKind kind, Json::Value payload)
{
    const EngineEvent event{kind, operation_id, std::move(payload)};

    std::vector<std::shared_ptr<EventSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.begin();
        while (it != subscribers_.end()) {
            if (auto subscriber = it->lock()) {
                if (subscriber->accepts_kind(kind)) {
                    targets.push_back(std::move(subscriber));
                }
                ++it;
            } else {
                it = subscribers_.erase(it);
            }
        }
    }

    for (const auto& subscriber : targets) {
        subscriber->offer(event);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->trace("Published {} for '{}' to {} subscriber(s)", to_string(kind), operation_id, targets.size());
    }
}

std::size_t EventChannel::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
        [](const std::weak_ptr<EventSubscription>& weak) { return !weak.expired(); }));
}
