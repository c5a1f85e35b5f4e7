#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "rules/rule_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace auditpipe {

/**
 * @brief What a channel is told about one rule match
 */
struct AlertPayload {
    std::string rule_id;
    std::string rule_name;
    Severity severity = Severity::LOW;
    std::string request_id;
    std::string event_type;
    std::string event_category;
    std::string description;
    std::optional<std::string> user_id;
    TimePoint timestamp{};
    JsonValue metadata;

    [[nodiscard]] static AlertPayload from(const AuditEvent& event, const ComplianceRule& rule);
    [[nodiscard]] JsonValue to_json() const;
    // One-line human summary for chat and SMS bodies
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Outbound alert channel (email, slack, webhook, sms)
 */
class IAlertChannel {
public:
    virtual ~IAlertChannel() = default;

    /**
     * @return true when the channel accepted the alert. May also throw; the
     *         dispatcher treats both as a failed delivery.
     */
    [[nodiscard]] virtual bool deliver(const AlertPayload& payload) = 0;

    [[nodiscard]] virtual AlertChannelKind kind() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Configured channels by kind. Built at startup, read-only afterwards.
 */
class AlertChannelRegistry {
public:
    void add(std::shared_ptr<IAlertChannel> channel);

    // nullptr when the kind is not configured
    [[nodiscard]] std::shared_ptr<IAlertChannel> find(AlertChannelKind kind) const;

    [[nodiscard]] size_t size() const { return channels_.size(); }

private:
    std::unordered_map<AlertChannelKind, std::shared_ptr<IAlertChannel>> channels_;
};

} // namespace auditpipe
