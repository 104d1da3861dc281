#include "rcb/events/event_bus.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace rcb::events {

SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(id) > 0;
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

std::uint64_t EventBus::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventBus::enqueue(Event event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.empty()) {
        ++dropped_;
        return;
    }
    outbox_.push_back(std::move(event));
}

void EventBus::dispatch() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (draining_) {
        return;
    }
    draining_ = true;

    while (!outbox_.empty()) {
        Event event = std::move(outbox_.front());
        outbox_.pop_front();

        std::vector<std::pair<SubscriptionId, Handler>> targets(handlers_.begin(), handlers_.end());
        lock.unlock();

        for (const auto& [id, handler] : targets) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] subscriber {} failed on '{}': {}", id, event_name(event), e.what());
            } catch (...) {
                lock.lock();
                draining_ = false;
                throw;
            }
        }

        lock.lock();
    }

    draining_ = false;
}

}  // namespace rcb::events
