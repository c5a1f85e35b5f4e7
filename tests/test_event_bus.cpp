#include <catch2/catch_test_macros.hpp>
#include "pipeline/event_bus.hpp"
#include "pipeline/ring_buffer.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace auditpipe;

namespace {

EventPtr event_with_id(std::string id) {
    auto e = std::make_shared<AuditEvent>();
    e->request_id = std::move(id);
    e->event_type = "USER_LOGIN";
    e->description = "Login";
    return e;
}

} // anonymous namespace

// ============================================================================
// MPSCRingBuffer
// ============================================================================

TEST_CASE("MPSCRingBuffer: capacity must be a power of 2", "[ring_buffer]") {
    CHECK_THROWS_AS(MPSCRingBuffer<int>(0), std::invalid_argument);
    CHECK_THROWS_AS(MPSCRingBuffer<int>(3), std::invalid_argument);
    CHECK_NOTHROW(MPSCRingBuffer<int>(8));
}

TEST_CASE("MPSCRingBuffer: FIFO order", "[ring_buffer]") {
    MPSCRingBuffer<int> buf(4);
    REQUIRE(buf.try_push(1));
    REQUIRE(buf.try_push(2));
    REQUIRE(buf.try_push(3));

    CHECK(buf.try_pop().value() == 1);
    CHECK(buf.try_pop().value() == 2);
    CHECK(buf.try_pop().value() == 3);
    CHECK_FALSE(buf.try_pop().has_value());
}

TEST_CASE("MPSCRingBuffer: overflow drops the new item and keeps its position", "[ring_buffer]") {
    MPSCRingBuffer<int> buf(2);
    REQUIRE(buf.try_push(1));
    REQUIRE(buf.try_push(2));
    CHECK_FALSE(buf.try_push(3));
    CHECK_FALSE(buf.try_push(4));
    CHECK(buf.overflow_count() == 2);

    CHECK(buf.try_pop().value() == 1);
    // The freed slot is usable again immediately
    REQUIRE(buf.try_push(5));
    CHECK(buf.try_pop().value() == 2);
    CHECK(buf.try_pop().value() == 5);
    CHECK_FALSE(buf.try_pop().has_value());
}

TEST_CASE("MPSCRingBuffer: drain respects max_count and wraps", "[ring_buffer]") {
    MPSCRingBuffer<int> buf(4);
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 4; ++i) REQUIRE(buf.try_push(round * 10 + i));
        std::vector<int> batch;
        CHECK(buf.drain(batch, 3) == 3);
        CHECK(buf.drain(batch, 10) == 1);
        CHECK(batch == std::vector<int>{round * 10, round * 10 + 1, round * 10 + 2, round * 10 + 3});
    }
    CHECK(buf.size_approx() == 0);
}

TEST_CASE("MPSCRingBuffer: concurrent producers lose nothing within capacity", "[ring_buffer]") {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 1000;
    MPSCRingBuffer<int> buf(8192);

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&buf, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                while (!buf.try_push(p * kPerProducer + i)) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : producers) t.join();

    std::vector<int> all;
    buf.drain(all, kProducers * kPerProducer + 1);
    REQUIRE(all.size() == kProducers * kPerProducer);
    std::sort(all.begin(), all.end());
    CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
    CHECK(buf.overflow_count() == 0);
}

// ============================================================================
// EventBus
// ============================================================================

TEST_CASE("EventBus: every subscriber sees every event", "[event_bus]") {
    EventBus bus(16);
    auto a = bus.subscribe("a");
    auto b = bus.subscribe("b");

    bus.publish(event_with_id("e1"));
    bus.publish(event_with_id("e2"));

    const auto got_a = a->poll();
    const auto got_b = b->poll();
    REQUIRE(got_a.size() == 2);
    REQUIRE(got_b.size() == 2);
    CHECK(got_a[0]->request_id == "e1");
    CHECK(got_b[1]->request_id == "e2");
    // Same immutable instance is shared
    CHECK(got_a[0].get() == got_b[0].get());
    CHECK(a->delivered() == 2);

    const auto stats = bus.get_stats();
    CHECK(stats.published == 2);
    CHECK(stats.subscribers == 2);
    CHECK(stats.dropped == 0);
}

TEST_CASE("EventBus: duplicate subscriber names are rejected", "[event_bus]") {
    EventBus bus(16);
    auto sub = bus.subscribe("dup");
    CHECK_THROWS_AS(bus.subscribe("dup"), std::invalid_argument);
}

TEST_CASE("EventBus: capacity must be a power of 2", "[event_bus]") {
    CHECK_THROWS_AS(EventBus(100), std::invalid_argument);
}

TEST_CASE("EventBus: a slow subscriber only drops its own events", "[event_bus]") {
    EventBus bus(2);
    auto slow = bus.subscribe("slow");
    auto fast = bus.subscribe("fast");

    for (int i = 0; i < 5; ++i) {
        bus.publish(event_with_id(std::format("e{}", i)));
        (void)fast->poll();
    }

    CHECK(fast->dropped() == 0);
    CHECK(fast->delivered() == 5);
    CHECK(slow->dropped() == 3);

    const auto kept = slow->poll();
    REQUIRE(kept.size() == 2);
    CHECK(kept[0]->request_id == "e0");
    CHECK(kept[1]->request_id == "e1");
    CHECK(bus.get_stats().dropped == 3);
}

TEST_CASE("EventBus: unsubscribe stops delivery and keeps drop totals", "[event_bus]") {
    EventBus bus(1);
    auto sub = bus.subscribe("gone");
    bus.publish(event_with_id("e1"));
    bus.publish(event_with_id("e2"));
    REQUIRE(sub->dropped() == 1);

    CHECK(bus.unsubscribe("gone"));
    CHECK_FALSE(bus.unsubscribe("gone"));

    bus.publish(event_with_id("e3"));
    const auto pending = sub->poll();
    REQUIRE(pending.size() == 1);
    CHECK(pending[0]->request_id == "e1");

    const auto stats = bus.get_stats();
    CHECK(stats.subscribers == 0);
    CHECK(stats.dropped == 1);
    CHECK(stats.published == 3);
}

TEST_CASE("EventBus: pending can be read while the subscriber polls", "[event_bus][concurrency]") {
    EventBus bus(1024);
    auto sub = bus.subscribe("watched");
    for (int i = 0; i < 3; ++i) bus.publish(event_with_id(std::format("e{}", i)));
    CHECK(sub->pending() == 3);

    std::atomic<bool> done{false};
    std::atomic<size_t> max_seen{0};
    std::thread observer([&] {
        while (!done.load()) {
            const size_t n = sub->pending();
            if (n > max_seen.load()) max_seen.store(n);
        }
    });

    size_t received = sub->poll().size();
    for (int i = 3; i < 500; ++i) {
        bus.publish(event_with_id(std::format("e{}", i)));
        received += sub->poll().size();
    }
    done.store(true);
    observer.join();

    CHECK(received == 500);
    CHECK(sub->pending() == 0);
    CHECK(max_seen.load() <= 1024);
}
