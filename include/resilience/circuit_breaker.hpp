#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace auditpipe {

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

[[nodiscard]] inline constexpr std::string_view circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "CLOSED";
}

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    uint64_t rejected_count = 0;
    uint64_t times_opened = 0;
};

/**
 * @brief Circuit Breaker for outbound channel isolation
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately
 * - HALF_OPEN:  Testing recovery, allow limited requests
 *
 * State transitions:
 * - CLOSED -> OPEN:      consecutive failures >= failure_threshold
 * - OPEN -> HALF_OPEN:   timeout elapsed
 * - HALF_OPEN -> CLOSED: successes >= success_threshold
 * - HALF_OPEN -> OPEN:   any failure
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold = 5;
        uint32_t success_threshold = 2;
        std::chrono::milliseconds timeout{30000};
        uint32_t half_open_max_calls = 1;
    };

    struct StateChange {
        CircuitState from;
        CircuitState to;
        std::string breaker_name;
    };

    CircuitBreaker(std::string name, const Config& config);
    explicit CircuitBreaker(std::string name);

    /**
     * @return true if the call may proceed; every true must be followed by
     *         record_success() or record_failure()
     */
    bool allow_request();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const;
    [[nodiscard]] CircuitBreakerStats get_stats() const;

    void reset();

    const std::string& name() const { return name_; }

    void set_on_state_change(std::function<void(const StateChange&)> cb);

private:
    bool transition(CircuitState from, CircuitState to);

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint64_t> success_count_{0};
    std::atomic<uint64_t> failure_count_{0};
    std::atomic<uint64_t> half_open_calls_{0};
    std::atomic<uint64_t> rejected_count_{0};
    std::atomic<uint64_t> times_opened_{0};
    std::atomic<std::chrono::steady_clock::rep> opened_time_{0};

    std::function<void(const StateChange&)> on_state_change_;
    mutable std::mutex callback_mutex_;
};

} // namespace auditpipe
