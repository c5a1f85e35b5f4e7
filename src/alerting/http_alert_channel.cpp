#include "alerting/http_alert_channel.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace auditpipe {

namespace {

constexpr size_t kSmsMaxLength = 160;

JsonValue recipients_json(const std::vector<std::string>& recipients) {
    JsonValue arr = JsonValue::array();
    for (const auto& r : recipients) arr.push_back(r);
    return arr;
}

} // anonymous namespace

HttpAlertChannel::HttpAlertChannel(AlertChannelKind kind, const Config& config,
                                   std::shared_ptr<CircuitBreaker> breaker)
    : kind_(kind),
      config_(config),
      breaker_(std::move(breaker)) {
    auto ep = HttpEndpoint::parse(config_.url);
    if (!ep) {
        throw std::invalid_argument(std::format("Alert channel '{}': invalid URL '{}'",
            alert_channel_to_string(kind_), config_.url));
    }
    endpoint_ = std::move(*ep);
}

std::string HttpAlertChannel::name() const {
    return std::format("{}:{}", alert_channel_to_string(kind_), endpoint_.host());
}

std::string HttpAlertChannel::build_body(const AlertPayload& payload) const {
    JsonValue body = JsonValue::object();
    switch (kind_) {
        case AlertChannelKind::SLACK:
            body.set("text", payload.summary());
            break;
        case AlertChannelKind::EMAIL:
            body.set("to", recipients_json(config_.recipients));
            body.set("subject", std::format("[{}] Compliance violation: {}",
                severity_to_string(payload.severity), payload.rule_name));
            body.set("text", payload.summary());
            body.set("alert", payload.to_json());
            break;
        case AlertChannelKind::SMS: {
            std::string message = payload.summary();
            if (message.size() > kSmsMaxLength) message.resize(kSmsMaxLength);
            body.set("to", recipients_json(config_.recipients));
            body.set("message", std::move(message));
            break;
        }
        case AlertChannelKind::WEBHOOK:
            body = payload.to_json();
            break;
    }
    return body.dump();
}

bool HttpAlertChannel::deliver(const AlertPayload& payload) {
    if (breaker_ && !breaker_->allow_request()) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Alert channel {} skipped: circuit open", name()));
        return false;
    }

    const auto result = endpoint_.post_json(build_body(payload), config_.auth_header, config_.timeout);
    if (result.ok) {
        if (breaker_) breaker_->record_success();
        delivered_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (breaker_) breaker_->record_failure();
    failed_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Alert channel {} failed for rule '{}': {}",
        name(), payload.rule_name, result.error));
    return false;
}

} // namespace auditpipe
