#pragma once

#include "core/types.hpp"
#include "pipeline/ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auditpipe {

using EventPtr = std::shared_ptr<const AuditEvent>;

/**
 * @brief One subscriber's bounded queue of persisted events
 *
 * Filled by EventBus::publish() from any thread; poll() must be called from
 * a single consumer thread.
 */
class EventSubscription {
public:
    EventSubscription(std::string name, size_t capacity);

    [[nodiscard]] std::vector<EventPtr> poll(size_t max_count = 256);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] uint64_t dropped() const { return queue_.overflow_count(); }
    [[nodiscard]] uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t pending() const { return queue_.size_approx(); }

private:
    friend class EventBus;
    bool offer(const EventPtr& event);

    std::string name_;
    MPSCRingBuffer<EventPtr> queue_;
    std::atomic<uint64_t> delivered_{0};
};

/**
 * @brief In-process fan-out of persisted events
 *
 * publish() never blocks on a slow subscriber: a full queue drops the event
 * for that subscriber only and counts it.
 */
class EventBus {
public:
    explicit EventBus(size_t subscriber_capacity = 1024);

    /**
     * @throws std::invalid_argument if the name is taken
     */
    [[nodiscard]] std::shared_ptr<EventSubscription> subscribe(const std::string& name);
    bool unsubscribe(const std::string& name);

    void publish(const EventPtr& event);

    struct Stats {
        uint64_t published;
        uint64_t dropped;
        size_t subscribers;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    size_t subscriber_capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EventSubscription>> subscribers_;

    std::atomic<uint64_t> published_{0};
    // Drops of subscribers that have since unsubscribed
    std::atomic<uint64_t> retired_drops_{0};
};

} // namespace auditpipe
