#include "alerting/alert_channel.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

AlertPayload AlertPayload::from(const AuditEvent& event, const ComplianceRule& rule) {
    AlertPayload p;
    p.rule_id = rule.id;
    p.rule_name = rule.name;
    p.severity = rule.severity;
    p.request_id = event.request_id;
    p.event_type = event.event_type;
    p.event_category = event.event_category
        ? std::string(event_category_to_string(*event.event_category)) : std::string{};
    p.description = event.description;
    p.user_id = event.user_id;
    p.timestamp = event.timestamp.value_or(utils::now());
    p.metadata = event.metadata.is_null() ? JsonValue::object() : event.metadata;
    return p;
}

JsonValue AlertPayload::to_json() const {
    JsonValue out = JsonValue::object();
    out.set("ruleId", rule_id);
    out.set("ruleName", rule_name);
    out.set("severity", severity_to_string(severity));
    out.set("requestId", request_id);
    out.set("eventType", event_type);
    out.set("eventCategory", event_category);
    out.set("description", description);
    out.set("userId", user_id ? JsonValue(*user_id) : JsonValue());
    out.set("timestamp", utils::format_timestamp(timestamp));
    out.set("metadata", metadata);
    return out;
}

std::string AlertPayload::summary() const {
    return std::format("[{}] Compliance rule '{}' matched {} ({}) for user {}: {}",
        severity_to_string(severity), rule_name, event_type, event_category,
        user_id.value_or("unknown"), description);
}

void AlertChannelRegistry::add(std::shared_ptr<IAlertChannel> channel) {
    if (!channel) return;
    const auto kind = channel->kind();
    channels_[kind] = std::move(channel);
}

std::shared_ptr<IAlertChannel> AlertChannelRegistry::find(AlertChannelKind kind) const {
    const auto it = channels_.find(kind);
    return it != channels_.end() ? it->second : nullptr;
}

} // namespace auditpipe
