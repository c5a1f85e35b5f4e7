#include <catch2/catch_test_macros.hpp>
#include "scheduler/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace auditpipe;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

TEST_CASE("PeriodicTask: rejects bad construction", "[periodic_task]") {
    CHECK_THROWS_AS(PeriodicTask("t", 0ms, [] {}), std::invalid_argument);
    CHECK_THROWS_AS(PeriodicTask("t", 10ms, nullptr), std::invalid_argument);
}

TEST_CASE("PeriodicTask: run_now runs on the calling thread", "[periodic_task]") {
    int calls = 0;
    PeriodicTask task("manual", 1h, [&calls] { ++calls; });

    CHECK(task.run_now());
    CHECK(task.run_now());
    CHECK(calls == 2);
    CHECK(task.get_stats().runs == 2);
    CHECK_FALSE(task.is_running());
}

TEST_CASE("PeriodicTask: fires repeatedly once started", "[periodic_task]") {
    std::atomic<int> calls{0};
    PeriodicTask task("ticker", 10ms, [&calls] { calls.fetch_add(1); });

    task.start();
    CHECK(task.is_running());
    CHECK(wait_for([&calls] { return calls.load() >= 3; }));
    task.stop();
    CHECK_FALSE(task.is_running());

    const int after_stop = calls.load();
    std::this_thread::sleep_for(50ms);
    CHECK(calls.load() == after_stop);
}

TEST_CASE("PeriodicTask: stop wakes a long wait immediately", "[periodic_task]") {
    PeriodicTask task("sleepy", 1h, [] {});
    task.start();

    const auto begin = std::chrono::steady_clock::now();
    task.stop();
    CHECK(std::chrono::steady_clock::now() - begin < 1s);
    CHECK(task.get_stats().runs == 0);
}

TEST_CASE("PeriodicTask: exceptions are counted, not propagated", "[periodic_task]") {
    PeriodicTask task("failing", 1h, [] { throw std::runtime_error("boom"); });
    CHECK(task.run_now());
    CHECK(task.run_now());
    const auto stats = task.get_stats();
    CHECK(stats.runs == 2);
    CHECK(stats.failures == 2);
}

TEST_CASE("PeriodicTask: overlapping runs are skipped", "[periodic_task]") {
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    bool first = true;

    PeriodicTask task("single-flight", 1h, [&] {
        if (first) {
            first = false;
            entered.set_value();
            release_future.wait();
        }
    });

    auto runner = std::async(std::launch::async, [&task] { return task.run_now(); });
    entered.get_future().wait();

    CHECK_FALSE(task.run_now());
    release.set_value();
    CHECK(runner.get());

    const auto stats = task.get_stats();
    CHECK(stats.runs == 1);
    CHECK(stats.skipped == 1);
}
