#include "storage/pg_audit_store.hpp"
#include "core/error.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace auditpipe {

namespace {

constexpr const char* kInsertEvent =
    "INSERT INTO compliance.audit_log ("
    "  request_id, timestamp, event_type, event_category, description,"
    "  user_id, user_email, session_id, ip_address, user_agent, endpoint, http_method,"
    "  resource_type, resource_id, amount, currency, product_id, institution_id,"
    "  request_data, response_data, response_status,"
    "  severity, risk_score, compliance_flags,"
    "  error, error_code, stack_trace,"
    "  requires_retention, retention_years, personal_data_included, sensitive_data_included,"
    "  metadata, server_id, environment, created_at"
    ") SELECT"
    "  r->>'requestId', (r->>'timestamp')::timestamptz, r->>'eventType',"
    "  r->>'eventCategory', r->>'description',"
    "  r->>'userId', r->>'userEmail', r->>'sessionId', r->>'ipAddress',"
    "  r->>'userAgent', r->>'endpoint', r->>'httpMethod',"
    "  r->>'resourceType', r->>'resourceId', (r->>'amount')::numeric, r->>'currency',"
    "  r->>'productId', r->>'institutionId',"
    "  r->'requestData', r->'responseData', (r->>'responseStatus')::int,"
    "  r->>'severity', (r->>'riskScore')::int,"
    "  ARRAY(SELECT jsonb_array_elements_text(COALESCE(r->'complianceFlags', '[]'::jsonb))),"
    "  r->>'error', r->>'errorCode', r->>'stackTrace',"
    "  COALESCE((r->>'requiresRetention')::boolean, true), (r->>'retentionYears')::int,"
    "  COALESCE((r->>'personalDataIncluded')::boolean, false),"
    "  COALESCE((r->>'sensitiveDataIncluded')::boolean, false),"
    "  r->'metadata', r->>'serverId', r->>'environment', (r->>'recordedAt')::timestamptz"
    " FROM (SELECT $1::jsonb AS r) AS src";

constexpr const char* kInsertViolation =
    "INSERT INTO compliance.violations "
    "(event_id, rule_id, rule_name, severity, detected_at, event_data) "
    "VALUES ($1, $2, $3, $4, $5::timestamptz, $6::jsonb)";

constexpr const char* kSelectWireForm =
    "SELECT json_strip_nulls(json_build_object("
    "  'requestId', request_id, 'timestamp', to_char(timestamp AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'),"
    "  'eventType', event_type, 'eventCategory', event_category, 'description', description,"
    "  'userId', user_id, 'userEmail', user_email, 'sessionId', session_id,"
    "  'ipAddress', ip_address, 'userAgent', user_agent, 'endpoint', endpoint,"
    "  'httpMethod', http_method, 'resourceType', resource_type, 'resourceId', resource_id,"
    "  'amount', amount, 'currency', currency, 'productId', product_id,"
    "  'institutionId', institution_id, 'requestData', request_data,"
    "  'responseData', response_data, 'responseStatus', response_status,"
    "  'severity', severity, 'riskScore', risk_score,"
    "  'complianceFlags', to_json(compliance_flags),"
    "  'error', error, 'errorCode', error_code, 'stackTrace', stack_trace,"
    "  'requiresRetention', requires_retention, 'retentionYears', retention_years,"
    "  'personalDataIncluded', personal_data_included,"
    "  'sensitiveDataIncluded', sensitive_data_included,"
    "  'metadata', metadata, 'serverId', server_id, 'environment', environment,"
    "  'recordedAt', to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')"
    "))::text FROM compliance.audit_log ";

constexpr const char* kTrailWhere =
    "WHERE user_id = $1"
    "  AND ($2::timestamptz IS NULL OR created_at >= $2::timestamptz)"
    "  AND ($3::timestamptz IS NULL OR created_at <= $3::timestamptz)"
    "  AND ($4::jsonb IS NULL OR event_type IN (SELECT jsonb_array_elements_text($4::jsonb)))"
    " ORDER BY created_at DESC, id DESC"
    " LIMIT $5";

constexpr const char* kWindowWhere =
    "WHERE created_at >= $1::timestamptz AND created_at <= $2::timestamptz"
    " ORDER BY created_at, id";

constexpr const char* kDeleteExpired =
    "DELETE FROM compliance.audit_log "
    "WHERE requires_retention = false"
    "  AND created_at + make_interval(years => COALESCE(retention_years, 0)) < $1::timestamptz";

std::optional<std::string> opt_timestamp(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return utils::format_timestamp(*tp);
}

} // anonymous namespace

PgAuditStore::PgAuditStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

DbResultSet PgAuditStore::run(const std::string& sql, const DbParams& params) const {
    auto conn = pool_->acquire();
    if (!conn) {
        throw StorageError(std::format("Audit store '{}' unavailable: no database connection",
            pool_->name()));
    }

    auto result = (*conn)->execute_params(sql, params);
    if (!result.success) {
        if (!(*conn)->is_connected()) {
            conn->discard();
        }
        throw StorageError(std::format("Audit store query failed: {}",
            utils::trim(result.error_message)));
    }
    return result;
}

std::vector<AuditEvent> PgAuditStore::decode_rows(const DbResultSet& result) {
    std::vector<AuditEvent> events;
    events.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (row.empty() || !row[0]) continue;
        try {
            events.push_back(EventCodec::from_json(JsonValue::parse(*row[0]),
                                                   EventCodec::Source::STORED));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Unreadable audit_log row skipped: {}", e.what()));
        }
    }
    return events;
}

// ============================================================================
// Writes
// ============================================================================

void PgAuditStore::append(const AuditEvent& event) {
    if (!event.recorded_at) {
        throw StorageError("Event has no recorded_at");
    }
    (void)run(kInsertEvent, {EventCodec::to_json(event).dump()});
}

void PgAuditStore::append_violation(const Violation& v) {
    (void)run(kInsertViolation, {
        v.event_id,
        v.rule_id,
        v.rule_name,
        std::string(severity_to_string(v.severity)),
        utils::format_timestamp(v.detected_at),
        v.event_snapshot.dump(),
    });
}

// ============================================================================
// Reads
// ============================================================================

std::vector<AuditEvent> PgAuditStore::query_user_trail(const std::string& user_id,
                                                       const TrailFilter& filter) const {
    std::optional<std::string> types;
    if (!filter.event_types.empty()) {
        JsonValue arr = JsonValue::array();
        for (const auto& t : filter.event_types) arr.push_back(t);
        types = arr.dump();
    }
    const size_t limit = std::min(filter.limit, kMaxTrailRows);

    const auto result = run(std::string(kSelectWireForm) + kTrailWhere, {
        user_id,
        opt_timestamp(filter.start),
        opt_timestamp(filter.end),
        types,
        std::to_string(limit),
    });
    return decode_rows(result);
}

void PgAuditStore::scan_window(TimePoint start, TimePoint end, const Visitor& visitor) const {
    const auto result = run(std::string(kSelectWireForm) + kWindowWhere, {
        utils::format_timestamp(start),
        utils::format_timestamp(end),
    });
    for (const auto& event : decode_rows(result)) {
        visitor(event);
    }
}

// ============================================================================
// Retention
// ============================================================================

uint64_t PgAuditStore::delete_expired(TimePoint now) {
    const auto result = run(kDeleteExpired, {utils::format_timestamp(now)});
    return result.affected_rows;
}

} // namespace auditpipe
