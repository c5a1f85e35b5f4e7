#include "core/event_codec.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace auditpipe {

namespace {

void put_opt(JsonValue& out, std::string_view key, const std::optional<std::string>& v) {
    if (v) out.set(key, *v);
}

template <typename T>
void put_opt_num(JsonValue& out, std::string_view key, const std::optional<T>& v) {
    if (v) out.set(key, *v);
}

// Field readers: absent or null -> nullopt, wrong type -> ValidationError

std::optional<std::string> read_string(const JsonValue& in, std::string_view key) {
    const JsonValue v = in[key];
    if (v.is_null()) return std::nullopt;
    if (!v.is_string()) {
        throw ValidationError(std::format("Field '{}' must be a string", key));
    }
    return v.get<std::string>();
}

std::optional<double> read_number(const JsonValue& in, std::string_view key) {
    const JsonValue v = in[key];
    if (v.is_null()) return std::nullopt;
    if (!v.is_number()) {
        throw ValidationError(std::format("Field '{}' must be a number", key));
    }
    return v.get<double>();
}

std::optional<int> read_int(const JsonValue& in, std::string_view key) {
    const auto d = read_number(in, key);
    if (!d) return std::nullopt;
    if (!std::isfinite(*d) || *d != std::floor(*d)) {
        throw ValidationError(std::format("Field '{}' must be an integer", key));
    }
    if (*d < std::numeric_limits<int>::min() || *d > std::numeric_limits<int>::max()) {
        throw ValidationError(std::format("Field '{}' is out of range", key));
    }
    return static_cast<int>(*d);
}

std::optional<bool> read_bool(const JsonValue& in, std::string_view key) {
    const JsonValue v = in[key];
    if (v.is_null()) return std::nullopt;
    if (!v.is_boolean()) {
        throw ValidationError(std::format("Field '{}' must be a boolean", key));
    }
    return v.get<bool>();
}

std::optional<TimePoint> read_time(const JsonValue& in, std::string_view key) {
    const auto s = read_string(in, key);
    if (!s) return std::nullopt;
    const auto tp = utils::parse_timestamp(*s);
    if (!tp) {
        throw ValidationError(std::format("Field '{}' is not an ISO-8601 timestamp: '{}'", key, *s));
    }
    return tp;
}

} // anonymous namespace

JsonValue EventCodec::to_json(const AuditEvent& e, bool include_pipeline_fields) {
    JsonValue out = JsonValue::object();

    if (!e.request_id.empty()) out.set("requestId", e.request_id);
    if (e.timestamp) out.set("timestamp", utils::format_timestamp(*e.timestamp));

    if (!e.event_type.empty()) out.set("eventType", e.event_type);
    if (e.event_category) out.set("eventCategory", event_category_to_string(*e.event_category));
    if (!e.description.empty()) out.set("description", e.description);

    put_opt(out, "userId", e.user_id);
    put_opt(out, "userEmail", e.user_email);
    put_opt(out, "sessionId", e.session_id);
    put_opt(out, "ipAddress", e.ip_address);
    put_opt(out, "userAgent", e.user_agent);
    put_opt(out, "endpoint", e.endpoint);
    put_opt(out, "httpMethod", e.http_method);

    put_opt(out, "resourceType", e.resource_type);
    put_opt(out, "resourceId", e.resource_id);
    put_opt_num(out, "amount", e.amount);
    put_opt(out, "currency", e.currency);
    put_opt(out, "productId", e.product_id);
    put_opt(out, "institutionId", e.institution_id);

    if (!e.request_data.is_null()) out.set("requestData", e.request_data);
    if (!e.response_data.is_null()) out.set("responseData", e.response_data);
    put_opt_num(out, "responseStatus", e.response_status);

    out.set("severity", severity_to_string(e.severity));
    put_opt_num(out, "riskScore", e.risk_score);

    put_opt(out, "error", e.error);
    put_opt(out, "errorCode", e.error_code);
    put_opt(out, "stackTrace", e.stack_trace);

    if (e.requires_retention) out.set("requiresRetention", *e.requires_retention);
    put_opt_num(out, "retentionYears", e.retention_years);

    if (!e.metadata.is_null()) out.set("metadata", e.metadata);

    if (include_pipeline_fields) {
        JsonValue flags = JsonValue::array();
        for (const auto& f : e.compliance_flags) flags.push_back(f);
        out.set("complianceFlags", std::move(flags));
        out.set("personalDataIncluded", e.personal_data_included);
        out.set("sensitiveDataIncluded", e.sensitive_data_included);
        if (!e.server_id.empty()) out.set("serverId", e.server_id);
        if (!e.environment.empty()) out.set("environment", e.environment);
        if (e.recorded_at) out.set("recordedAt", utils::format_timestamp(*e.recorded_at));
    }

    return out;
}

AuditEvent EventCodec::from_json(const JsonValue& in, Source source) {
    if (!in.is_object()) {
        throw ValidationError("Audit event must be a JSON object");
    }

    AuditEvent e;
    e.request_id = read_string(in, "requestId").value_or("");
    e.timestamp = read_time(in, "timestamp");

    e.event_type = read_string(in, "eventType").value_or("");
    if (const auto cat = read_string(in, "eventCategory")) {
        e.event_category = parse_event_category(*cat);
        if (!e.event_category) {
            throw ValidationError(std::format("Unknown eventCategory '{}'", *cat));
        }
    }
    e.description = read_string(in, "description").value_or("");

    e.user_id = read_string(in, "userId");
    e.user_email = read_string(in, "userEmail");
    e.session_id = read_string(in, "sessionId");
    e.ip_address = read_string(in, "ipAddress");
    e.user_agent = read_string(in, "userAgent");
    e.endpoint = read_string(in, "endpoint");
    e.http_method = read_string(in, "httpMethod");

    e.resource_type = read_string(in, "resourceType");
    e.resource_id = read_string(in, "resourceId");
    e.amount = read_number(in, "amount");
    e.currency = read_string(in, "currency");
    e.product_id = read_string(in, "productId");
    e.institution_id = read_string(in, "institutionId");

    e.request_data = in["requestData"];
    e.response_data = in["responseData"];
    e.response_status = read_int(in, "responseStatus");

    if (const auto sev = read_string(in, "severity")) {
        const auto parsed = parse_severity(*sev);
        if (!parsed) {
            throw ValidationError(std::format("Unknown severity '{}'", *sev));
        }
        e.severity = *parsed;
    }
    e.risk_score = read_int(in, "riskScore");
    if (e.risk_score && (*e.risk_score < 0 || *e.risk_score > 100)) {
        throw ValidationError(std::format("Field 'riskScore' must be within 0-100, got {}", *e.risk_score));
    }

    e.error = read_string(in, "error");
    e.error_code = read_string(in, "errorCode");
    e.stack_trace = read_string(in, "stackTrace");

    e.requires_retention = read_bool(in, "requiresRetention");
    e.retention_years = read_int(in, "retentionYears");
    if (e.retention_years && *e.retention_years < 0) {
        throw ValidationError("Field 'retentionYears' must not be negative");
    }
    if (e.retention_years && *e.retention_years > kMaxRetentionYears) {
        throw ValidationError(std::format("Field 'retentionYears' must be at most {}, got {}",
            kMaxRetentionYears, *e.retention_years));
    }

    e.metadata = in["metadata"];

    if (source == Source::STORED) {
        const JsonValue flags = in["complianceFlags"];
        if (flags.is_array()) {
            for (size_t i = 0; i < flags.size(); ++i) {
                const JsonValue f = flags[i];
                if (f.is_string()) e.compliance_flags.push_back(f.get<std::string>());
            }
        }
        e.personal_data_included = read_bool(in, "personalDataIncluded").value_or(false);
        e.sensitive_data_included = read_bool(in, "sensitiveDataIncluded").value_or(false);
        e.server_id = read_string(in, "serverId").value_or("");
        e.environment = read_string(in, "environment").value_or("");
        e.recorded_at = read_time(in, "recordedAt");
    }

    return e;
}

JsonValue EventCodec::violation_to_json(const Violation& v) {
    JsonValue out = JsonValue::object();
    out.set("eventId", v.event_id);
    out.set("ruleId", v.rule_id);
    out.set("ruleName", v.rule_name);
    out.set("severity", severity_to_string(v.severity));
    out.set("detectedAt", utils::format_timestamp(v.detected_at));
    out.set("eventData", v.event_snapshot);
    return out;
}

} // namespace auditpipe
