#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include "Events.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Queue of events for one subscriber, filtered by kind and operation id.
 *
 * A subscription created before its operation starts does not know the id yet.
 * The first matching event it receives is accepted unconditionally and its id
 * becomes the tracked id; afterwards events of other operations are dropped.
 */
class EventSubscription {
public:
    explicit EventSubscription(std::vector<EventKind> kinds);

    /**
     * @brief Records the id returned by the start call.
     * @return false when a different id was already adopted from an earlier event.
     */
    bool track(const std::string& operation_id);

    std::optional<std::string> tracked_id() const;

    std::optional<EngineEvent> wait_next(std::chrono::milliseconds timeout);
    std::optional<EngineEvent> try_next();

    /**
     * @brief Waits until a terminal event arrives, collecting everything before it.
     * @return Every event received, ending with the terminal one; without it on timeout.
     */
    std::vector<EngineEvent> drain_until_terminal(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    friend class EventChannel;

    bool accepts_kind(EventKind kind) const;
    void offer(const EngineEvent& event);

    const std::vector<EventKind> kinds_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EngineEvent> queue_;
    std::optional<std::string> tracked_id_;
};

class EventChannel {
public:
    using SubscriptionHandle = std::shared_ptr<EventSubscription>;

    SubscriptionHandle subscribe(std::vector<EventKind> kinds);
    void unsubscribe(const SubscriptionHandle& handle);

    void publish(const std::string& operation_id, EventKind kind, Json::Value payload);

    template <typename Event>
    void publish(const Event& event) {
        publish(event.id, Event::kind, event.to_json());
    }

    std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<EventSubscription>> subscribers_;
};

#endif
