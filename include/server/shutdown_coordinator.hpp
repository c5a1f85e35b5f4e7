#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace auditpipe {

/**
 * @brief Tracks in-flight API requests so shutdown can wait for them
 *
 * After initiate_shutdown() no new request is admitted; wait_for_drain()
 * blocks until the admitted ones finish or the timeout elapses.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    /**
     * @brief RAII admission ticket; admitted() is false once shutdown began
     */
    class RequestGuard {
    public:
        explicit RequestGuard(ShutdownCoordinator& coordinator)
            : coordinator_(coordinator), admitted_(coordinator.try_enter_request()) {}

        ~RequestGuard() {
            if (admitted_) coordinator_.leave_request();
        }

        RequestGuard(const RequestGuard&) = delete;
        RequestGuard& operator=(const RequestGuard&) = delete;

        [[nodiscard]] bool admitted() const { return admitted_; }

    private:
        ShutdownCoordinator& coordinator_;
        const bool admitted_;
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    void initiate_shutdown();

    /// Returns false once shutdown has begun
    [[nodiscard]] bool try_enter_request();
    void leave_request();

    /// Returns true if drained cleanly, false on timeout
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace auditpipe
