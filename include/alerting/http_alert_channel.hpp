#pragma once

#include "alerting/alert_channel.hpp"
#include "net/http_endpoint.hpp"
#include "resilience/circuit_breaker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Alert channel that POSTs JSON to an HTTP endpoint
 *
 * Body shape per kind:
 * - slack:   {"text": summary}                       (Slack incoming webhook)
 * - email:   {"to": [...], "subject": ..., "text": summary, "alert": payload}
 * - sms:     {"to": [...], "message": summary (<= 160 chars)}
 * - webhook: payload
 *
 * Guarded by a circuit breaker; an open breaker fails delivery immediately.
 */
class HttpAlertChannel : public IAlertChannel {
public:
    struct Config {
        std::string url;
        std::string auth_header;
        std::vector<std::string> recipients;    // email / sms only
        std::chrono::milliseconds timeout{5000};
    };

    /**
     * @throws std::invalid_argument if the URL is not http(s)
     */
    HttpAlertChannel(AlertChannelKind kind, const Config& config,
                     std::shared_ptr<CircuitBreaker> breaker);

    [[nodiscard]] bool deliver(const AlertPayload& payload) override;
    [[nodiscard]] AlertChannelKind kind() const override { return kind_; }
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::string build_body(const AlertPayload& payload) const;

    [[nodiscard]] uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
    [[nodiscard]] const std::shared_ptr<CircuitBreaker>& breaker() const { return breaker_; }

private:
    AlertChannelKind kind_;
    Config config_;
    HttpEndpoint endpoint_;
    std::shared_ptr<CircuitBreaker> breaker_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace auditpipe
