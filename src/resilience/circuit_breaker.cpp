#include "resilience/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

CircuitBreaker::CircuitBreaker(std::string name)
    : CircuitBreaker(std::move(name), Config{}) {}

bool CircuitBreaker::allow_request() {
    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            const auto opened = std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(opened_time_.load(std::memory_order_acquire)));
            if (std::chrono::steady_clock::now() - opened < config_.timeout) {
                rejected_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            if (transition(CircuitState::OPEN, CircuitState::HALF_OPEN)) {
                success_count_.store(0, std::memory_order_relaxed);
                half_open_calls_.store(1, std::memory_order_release);
                return true;
            }
            // Another caller moved the state first; re-evaluate
            return allow_request();
        }

        case CircuitState::HALF_OPEN: {
            uint64_t current = half_open_calls_.load(std::memory_order_acquire);
            while (current < config_.half_open_max_calls) {
                if (half_open_calls_.compare_exchange_weak(current, current + 1,
                                                           std::memory_order_acq_rel)) {
                    return true;
                }
            }
            rejected_count_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }
    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current = state_.load(std::memory_order_acquire);

    if (current == CircuitState::HALF_OPEN) {
        if (half_open_calls_.load(std::memory_order_acquire) > 0) {
            half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        }
        const uint64_t successes = success_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold &&
            transition(CircuitState::HALF_OPEN, CircuitState::CLOSED)) {
            success_count_.store(0, std::memory_order_relaxed);
            failure_count_.store(0, std::memory_order_relaxed);
            half_open_calls_.store(0, std::memory_order_relaxed);
        }
    } else if (current == CircuitState::CLOSED) {
        failure_count_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    const CircuitState current = state_.load(std::memory_order_acquire);

    // The open timestamp must be visible before the state flips to OPEN
    auto open_from = [this](CircuitState from) {
        opened_time_.store(std::chrono::steady_clock::now().time_since_epoch().count(),
                           std::memory_order_release);
        if (transition(from, CircuitState::OPEN)) {
            half_open_calls_.store(0, std::memory_order_relaxed);
            times_opened_.fetch_add(1, std::memory_order_relaxed);
        }
    };

    if (current == CircuitState::HALF_OPEN) {
        open_from(CircuitState::HALF_OPEN);
    } else if (current == CircuitState::CLOSED) {
        const uint64_t failures = failure_count_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            open_from(CircuitState::CLOSED);
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.failure_count = failure_count_.load(std::memory_order_relaxed);
    stats.rejected_count = rejected_count_.load(std::memory_order_relaxed);
    stats.times_opened = times_opened_.load(std::memory_order_relaxed);
    return stats;
}

void CircuitBreaker::reset() {
    state_.store(CircuitState::CLOSED, std::memory_order_release);
    success_count_.store(0, std::memory_order_relaxed);
    failure_count_.store(0, std::memory_order_relaxed);
    half_open_calls_.store(0, std::memory_order_relaxed);
    opened_time_.store(0, std::memory_order_relaxed);
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChange&)> cb) {
    std::lock_guard lock(callback_mutex_);
    on_state_change_ = std::move(cb);
}

bool CircuitBreaker::transition(CircuitState from, CircuitState to) {
    CircuitState expected = from;
    if (!state_.compare_exchange_strong(expected, to,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
        return false;
    }

    utils::log::info(std::format("Circuit breaker '{}': {} -> {}",
        name_, circuit_state_to_string(from), circuit_state_to_string(to)));

    std::function<void(const StateChange&)> cb;
    {
        std::lock_guard lock(callback_mutex_);
        cb = on_state_change_;
    }
    if (cb) {
        cb(StateChange{from, to, name_});
    }
    return true;
}

} // namespace auditpipe
