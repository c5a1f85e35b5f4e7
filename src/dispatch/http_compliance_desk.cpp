#include "dispatch/http_compliance_desk.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace auditpipe {

namespace {

std::optional<HttpEndpoint> parse_optional(const std::string& url, std::string_view what) {
    if (url.empty()) return std::nullopt;
    auto ep = HttpEndpoint::parse(url);
    if (!ep) {
        throw std::invalid_argument(std::format("Compliance desk: invalid {} URL '{}'", what, url));
    }
    return ep;
}

} // anonymous namespace

HttpComplianceDesk::HttpComplianceDesk(const Config& config)
    : config_(config),
      notify_endpoint_(parse_optional(config.notify_url, "notify")),
      ticket_endpoint_(parse_optional(config.ticket_url, "ticket")) {}

JsonValue HttpComplianceDesk::build_body(const AuditEvent& event, const ComplianceRule& rule,
                                         const JsonValue& parameters) {
    JsonValue body = JsonValue::object();
    body.set("ruleId", rule.id);
    body.set("ruleName", rule.name);
    body.set("severity", severity_to_string(rule.severity));
    body.set("requestId", event.request_id);
    body.set("eventType", event.event_type);
    if (event.event_category) {
        body.set("eventCategory", event_category_to_string(*event.event_category));
    }
    body.set("description", event.description);
    body.set("userId", event.user_id ? JsonValue(*event.user_id) : JsonValue());
    body.set("parameters", parameters.is_null() ? JsonValue::object() : parameters);
    return body;
}

bool HttpComplianceDesk::post(const std::optional<HttpEndpoint>& endpoint, std::string_view action,
                              const AuditEvent& event, const ComplianceRule& rule,
                              const JsonValue& parameters) {
    if (!endpoint) {
        utils::log::error(std::format("Compliance desk: {} endpoint not configured (rule '{}')",
            action, rule.name));
        return false;
    }

    const auto result = endpoint->post_json(build_body(event, rule, parameters).dump(),
                                            config_.auth_header, config_.timeout);
    if (!result.ok) {
        utils::log::warn(std::format("Compliance desk {} for rule '{}' failed: {}",
            action, rule.name, result.error));
        return false;
    }
    return true;
}

bool HttpComplianceDesk::notify_compliance(const AuditEvent& event, const ComplianceRule& rule,
                                           const JsonValue& parameters) {
    return post(notify_endpoint_, "notify_compliance", event, rule, parameters);
}

bool HttpComplianceDesk::create_ticket(const AuditEvent& event, const ComplianceRule& rule,
                                       const JsonValue& parameters) {
    return post(ticket_endpoint_, "create_ticket", event, rule, parameters);
}

} // namespace auditpipe
