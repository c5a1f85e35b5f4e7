#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace auditpipe {

/**
 * @brief Fixed-rate background task with a single-flight guard
 *
 * Runs fn every interval on its own std::jthread. At most one run is in
 * flight: a tick (or run_now() call) arriving while a run is in progress is
 * skipped and counted, and ticks missed because a run overran the interval
 * are dropped, not queued. Exceptions from fn are caught, counted and logged.
 *
 * stop() wakes the worker immediately and joins it; an in-flight run is
 * allowed to finish.
 */
class PeriodicTask {
public:
    using TaskFn = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, TaskFn fn);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    /**
     * @brief Run on the calling thread unless a run is already in flight
     * @return false if skipped
     */
    bool run_now();

    [[nodiscard]] bool is_running() const { return started_.load(); }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

    struct Stats {
        uint64_t runs;
        uint64_t skipped;
        uint64_t failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .runs = runs_.load(std::memory_order_relaxed),
            .skipped = skipped_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
        };
    }

private:
    void loop(std::stop_token stop);

    std::string name_;
    std::chrono::milliseconds interval_;
    TaskFn fn_;

    std::atomic<bool> started_{false};
    std::atomic<bool> in_flight_{false};
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread thread_;

    std::atomic<uint64_t> runs_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace auditpipe
