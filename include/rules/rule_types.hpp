#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace auditpipe {

// ============================================================================
// Conditions
// ============================================================================

enum class ConditionOperator {
    EQUALS,
    CONTAINS,
    GREATER_THAN,
    LESS_THAN,
    REGEX
};

[[nodiscard]] inline constexpr std::string_view condition_operator_to_string(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::EQUALS:       return "equals";
        case ConditionOperator::CONTAINS:     return "contains";
        case ConditionOperator::GREATER_THAN: return "greater_than";
        case ConditionOperator::LESS_THAN:    return "less_than";
        case ConditionOperator::REGEX:        return "regex";
    }
    return "equals";
}

struct RuleCondition {
    std::string field;                              // dotted path into the wire form
    ConditionOperator op = ConditionOperator::EQUALS;
    JsonValue value;
    std::shared_ptr<const std::regex> pattern;      // compiled once, REGEX only
};

// ============================================================================
// Alert Channels / Auto-Responses
// ============================================================================

enum class AlertChannelKind {
    EMAIL,
    SLACK,
    WEBHOOK,
    SMS
};

[[nodiscard]] inline constexpr std::string_view alert_channel_to_string(AlertChannelKind k) {
    switch (k) {
        case AlertChannelKind::EMAIL:   return "email";
        case AlertChannelKind::SLACK:   return "slack";
        case AlertChannelKind::WEBHOOK: return "webhook";
        case AlertChannelKind::SMS:     return "sms";
    }
    return "webhook";
}

enum class AutoResponseAction {
    BLOCK_USER,
    FLAG_ACCOUNT,
    NOTIFY_COMPLIANCE,
    CREATE_TICKET
};

[[nodiscard]] inline constexpr std::string_view auto_response_to_string(AutoResponseAction a) {
    switch (a) {
        case AutoResponseAction::BLOCK_USER:        return "block_user";
        case AutoResponseAction::FLAG_ACCOUNT:      return "flag_account";
        case AutoResponseAction::NOTIFY_COMPLIANCE: return "notify_compliance";
        case AutoResponseAction::CREATE_TICKET:     return "create_ticket";
    }
    return "notify_compliance";
}

struct AutoResponse {
    AutoResponseAction action = AutoResponseAction::NOTIFY_COMPLIANCE;
    JsonValue parameters;
};

// ============================================================================
// Compliance Rule
// ============================================================================

/**
 * @brief Stored predicate over audit events.
 *
 * Matches iff the event type is in event_types and every condition holds.
 */
struct ComplianceRule {
    std::string id;
    std::string name;
    std::string description;
    std::unordered_set<std::string> event_types;
    std::vector<RuleCondition> conditions;
    Severity severity = Severity::MEDIUM;
    std::vector<AlertChannelKind> alert_channels;
    std::optional<AutoResponse> auto_response;
    bool is_active = true;
};

using RulePtr = std::shared_ptr<const ComplianceRule>;

} // namespace auditpipe
