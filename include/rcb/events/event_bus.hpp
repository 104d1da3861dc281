#pragma once

#include "rcb/events/events.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace rcb::events {

using SubscriptionId = std::uint64_t;

// Typed publish/subscribe with an ordered outbox.
//
// Producers call enqueue() while holding their own state lock so that the
// queue order matches the order of state transitions, then call dispatch()
// after releasing it. Only one thread drains at a time; a handler that
// publishes from inside a callback has its event delivered after the
// current one. Events published with no subscriber attached are dropped.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);
    std::size_t subscriber_count() const;

    void enqueue(Event event);
    void dispatch();

    void publish(Event event) {
        enqueue(std::move(event));
        dispatch();
    }

    std::uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    std::deque<Event> outbox_;
    SubscriptionId next_id_{1};
    std::uint64_t dropped_{0};
    bool draining_{false};
};

}  // namespace rcb::events
