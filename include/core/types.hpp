#pragma once

#include "core/json.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditpipe {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Event Classification
// ============================================================================

enum class EventCategory {
    AUTHENTICATION,
    AUTHORIZATION,
    DATA_ACCESS,
    DATA_MODIFICATION,
    FINANCIAL_TRANSACTION,
    CREDIT_INQUIRY,
    KYC,
    COMPLIANCE,
    SECURITY,
    EXTERNAL_API,
    SYSTEM_OPERATION,
    BUSINESS_OPERATION,
    PRIVACY,
    FRAUD_DETECTION,
    PERFORMANCE,
    ERROR
};

inline constexpr std::array<EventCategory, 16> kAllEventCategories = {
    EventCategory::AUTHENTICATION, EventCategory::AUTHORIZATION,
    EventCategory::DATA_ACCESS, EventCategory::DATA_MODIFICATION,
    EventCategory::FINANCIAL_TRANSACTION, EventCategory::CREDIT_INQUIRY,
    EventCategory::KYC, EventCategory::COMPLIANCE, EventCategory::SECURITY,
    EventCategory::EXTERNAL_API, EventCategory::SYSTEM_OPERATION,
    EventCategory::BUSINESS_OPERATION, EventCategory::PRIVACY,
    EventCategory::FRAUD_DETECTION, EventCategory::PERFORMANCE,
    EventCategory::ERROR
};

[[nodiscard]] inline constexpr std::string_view event_category_to_string(EventCategory c) {
    switch (c) {
        case EventCategory::AUTHENTICATION:        return "authentication";
        case EventCategory::AUTHORIZATION:         return "authorization";
        case EventCategory::DATA_ACCESS:           return "data_access";
        case EventCategory::DATA_MODIFICATION:     return "data_modification";
        case EventCategory::FINANCIAL_TRANSACTION: return "financial_transaction";
        case EventCategory::CREDIT_INQUIRY:        return "credit_inquiry";
        case EventCategory::KYC:                   return "kyc";
        case EventCategory::COMPLIANCE:            return "compliance";
        case EventCategory::SECURITY:              return "security";
        case EventCategory::EXTERNAL_API:          return "external_api";
        case EventCategory::SYSTEM_OPERATION:      return "system_operation";
        case EventCategory::BUSINESS_OPERATION:    return "business_operation";
        case EventCategory::PRIVACY:               return "privacy";
        case EventCategory::FRAUD_DETECTION:       return "fraud_detection";
        case EventCategory::PERFORMANCE:           return "performance";
        case EventCategory::ERROR:                 return "error";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<EventCategory> parse_event_category(std::string_view s) {
    for (const auto c : kAllEventCategories) {
        if (event_category_to_string(c) == s) return c;
    }
    return std::nullopt;
}

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

[[nodiscard]] inline constexpr std::string_view severity_to_string(Severity s) {
    switch (s) {
        case Severity::LOW:      return "LOW";
        case Severity::MEDIUM:   return "MEDIUM";
        case Severity::HIGH:     return "HIGH";
        case Severity::CRITICAL: return "CRITICAL";
    }
    return "LOW";
}

// Case-insensitive
[[nodiscard]] inline std::optional<Severity> parse_severity(std::string_view s) {
    std::string upper(s);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "LOW") return Severity::LOW;
    if (upper == "MEDIUM") return Severity::MEDIUM;
    if (upper == "HIGH") return Severity::HIGH;
    if (upper == "CRITICAL") return Severity::CRITICAL;
    return std::nullopt;
}

// ============================================================================
// Audit Event
// ============================================================================

/**
 * @brief The unit of record.
 *
 * Optional members are absent when the caller did not supply them. After
 * enrichment, request_id, timestamp, event_category, requires_retention and
 * retention_years are always set; server_id, environment, compliance_flags
 * and the personal/sensitive flags are owned by the pipeline.
 */
struct AuditEvent {
    // Identity
    std::string request_id;
    std::optional<TimePoint> timestamp;

    // Classification
    std::string event_type;
    std::optional<EventCategory> event_category;
    std::string description;

    // Actor / context
    std::optional<std::string> user_id;
    std::optional<std::string> user_email;
    std::optional<std::string> session_id;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    std::optional<std::string> endpoint;
    std::optional<std::string> http_method;

    // Resource / business context
    std::optional<std::string> resource_type;
    std::optional<std::string> resource_id;
    std::optional<double> amount;
    std::optional<std::string> currency;
    std::optional<std::string> product_id;
    std::optional<std::string> institution_id;

    // Payloads (null = absent)
    JsonValue request_data;
    JsonValue response_data;
    std::optional<int> response_status;

    // Risk / compliance
    Severity severity = Severity::LOW;
    std::optional<int> risk_score;
    std::vector<std::string> compliance_flags;

    // Error context
    std::optional<std::string> error;
    std::optional<std::string> error_code;
    std::optional<std::string> stack_trace;

    // Retention
    std::optional<bool> requires_retention;
    std::optional<int> retention_years;
    bool personal_data_included = false;
    bool sensitive_data_included = false;

    // Operational
    JsonValue metadata;
    std::string server_id;
    std::string environment;

    // Assigned by the store on append; drives retention age and report windows
    std::optional<TimePoint> recorded_at;
};

// ============================================================================
// Violation
// ============================================================================

/**
 * @brief One event matched by one rule. Written once, never mutated.
 */
struct Violation {
    std::string event_id;        // request_id of the matched event
    std::string rule_id;
    std::string rule_name;
    Severity severity = Severity::LOW;
    TimePoint detected_at{};
    JsonValue event_snapshot;    // stored wire form of the matched event
};

// ============================================================================
// Query / Reporting
// ============================================================================

inline constexpr size_t kMaxTrailRows = 1000;

// Upper bound accepted for a caller-supplied retentionYears
inline constexpr int kMaxRetentionYears = 1000;

struct TrailFilter {
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    std::vector<std::string> event_types;   // empty = all types
    size_t limit = kMaxTrailRows;
};

struct ReportRow {
    std::string event_category;
    std::string event_type;
    uint64_t event_count = 0;
    uint64_t critical_count = 0;
    uint64_t high_count = 0;
    uint64_t violation_count = 0;
};

struct ReportSummary {
    std::string report_type;
    TimePoint period_start{};
    TimePoint period_end{};
    TimePoint generated_at{};
    uint64_t total_events = 0;
    uint64_t critical_events = 0;
    uint64_t high_events = 0;
    uint64_t violations = 0;
    std::vector<ReportRow> rows;        // ordered by event_count descending
};

// ============================================================================
// Internal Event Types
// ============================================================================

namespace event_types {
inline constexpr std::string_view kAuditLoggingError = "AUDIT_LOGGING_ERROR";
inline constexpr std::string_view kRulesLoadFailed = "COMPLIANCE_RULES_LOAD_FAILED";
inline constexpr std::string_view kUserBlocked = "USER_BLOCKED_AUTOMATICALLY";
inline constexpr std::string_view kAccountFlagged = "ACCOUNT_FLAGGED_AUTOMATICALLY";
inline constexpr std::string_view kLogCleanup = "AUDIT_LOG_CLEANUP";
inline constexpr std::string_view kLoggerInitialized = "AUDIT_LOGGER_INITIALIZED";
inline constexpr std::string_view kLoggerMetrics = "AUDIT_LOGGER_METRICS";
} // namespace event_types

} // namespace auditpipe
