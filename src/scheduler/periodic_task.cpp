#include "scheduler/periodic_task.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace auditpipe {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, TaskFn fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument(std::format("Task '{}': interval must be positive", name_));
    }
    if (!fn_) {
        throw std::invalid_argument(std::format("Task '{}': no task function", name_));
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (started_.exchange(true)) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        loop(std::move(stop));
    });
    utils::log::info(std::format("Task '{}' scheduled every {}ms", name_, interval_.count()));
}

void PeriodicTask::stop() {
    if (!started_.exchange(false)) return;
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    utils::log::info(std::format("Task '{}' stopped", name_));
}

bool PeriodicTask::run_now() {
    if (in_flight_.exchange(true, std::memory_order_acq_rel)) {
        skipped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Task '{}' still running, tick skipped", name_));
        return false;
    }

    try {
        fn_();
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Task '{}' failed: {}", name_, e.what()));
    }
    runs_.fetch_add(1, std::memory_order_relaxed);
    in_flight_.store(false, std::memory_order_release);
    return true;
}

void PeriodicTask::loop(std::stop_token stop) {
    auto next = std::chrono::steady_clock::now() + interval_;
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex_);
            if (wait_cv_.wait_until(lock, stop, next, [&stop] { return stop.stop_requested(); })) {
                break;
            }
        }

        (void)run_now();

        next += interval_;
        const auto now = std::chrono::steady_clock::now();
        while (next <= now) {
            next += interval_;
            skipped_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

} // namespace auditpipe
