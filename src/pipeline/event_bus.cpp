#include "pipeline/event_bus.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace auditpipe {

// ============================================================================
// EventSubscription
// ============================================================================

EventSubscription::EventSubscription(std::string name, size_t capacity)
    : name_(std::move(name)), queue_(capacity) {}

bool EventSubscription::offer(const EventPtr& event) {
    return queue_.try_push(event);
}

std::vector<EventPtr> EventSubscription::poll(size_t max_count) {
    std::vector<EventPtr> batch;
    const size_t n = queue_.drain(batch, max_count);
    delivered_.fetch_add(n, std::memory_order_relaxed);
    return batch;
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::EventBus(size_t subscriber_capacity)
    : subscriber_capacity_(subscriber_capacity) {
    if (subscriber_capacity_ == 0 || (subscriber_capacity_ & (subscriber_capacity_ - 1)) != 0) {
        throw std::invalid_argument("Subscriber capacity must be a power of 2");
    }
}

std::shared_ptr<EventSubscription> EventBus::subscribe(const std::string& name) {
    std::unique_lock lock(mutex_);
    if (subscribers_.contains(name)) {
        throw std::invalid_argument(std::format("Subscriber '{}' already registered", name));
    }
    auto sub = std::make_shared<EventSubscription>(name, subscriber_capacity_);
    subscribers_.emplace(name, sub);
    utils::log::info(std::format("Event subscriber '{}' registered (capacity {})",
        name, subscriber_capacity_));
    return sub;
}

bool EventBus::unsubscribe(const std::string& name) {
    std::unique_lock lock(mutex_);
    const auto it = subscribers_.find(name);
    if (it == subscribers_.end()) return false;
    retired_drops_.fetch_add(it->second->dropped(), std::memory_order_relaxed);
    subscribers_.erase(it);
    return true;
}

void EventBus::publish(const EventPtr& event) {
    published_.fetch_add(1, std::memory_order_relaxed);
    std::shared_lock lock(mutex_);
    for (const auto& [name, sub] : subscribers_) {
        if (!sub->offer(event)) {
            utils::log::debug(std::format("Event subscriber '{}' full, event {} dropped",
                name, event->request_id));
        }
    }
}

EventBus::Stats EventBus::get_stats() const {
    std::shared_lock lock(mutex_);
    uint64_t dropped = retired_drops_.load(std::memory_order_relaxed);
    for (const auto& [name, sub] : subscribers_) {
        dropped += sub->dropped();
    }
    return {
        .published = published_.load(std::memory_order_relaxed),
        .dropped = dropped,
        .subscribers = subscribers_.size(),
    };
}

} // namespace auditpipe
