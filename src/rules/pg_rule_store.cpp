#include "rules/pg_rule_store.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

namespace {

constexpr const char* kSelectActiveRules =
    "SELECT json_build_object("
    "  'id', id::text,"
    "  'name', name,"
    "  'description', description,"
    "  'event_types', to_json(event_types),"
    "  'conditions', conditions,"
    "  'severity', upper(severity),"
    "  'alert_channels', to_json(alert_channels),"
    "  'auto_response', auto_response,"
    "  'is_active', is_active"
    ")::text "
    "FROM compliance.compliance_rules "
    "WHERE is_active = true "
    "ORDER BY created_at, id";

} // anonymous namespace

PgRuleStore::PgRuleStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

RuleLoader::LoadResult PgRuleStore::list_active_rules() {
    auto conn = pool_->acquire();
    if (!conn) {
        return RuleLoader::LoadResult::error(
            std::format("Rule store '{}' unavailable: no database connection", pool_->name()));
    }

    const auto result = (*conn)->execute(kSelectActiveRules);
    if (!result.success) {
        return RuleLoader::LoadResult::error(
            std::format("Loading compliance rules failed: {}", utils::trim(result.error_message)));
    }

    std::vector<JsonValue> objects;
    objects.reserve(result.rows.size());
    try {
        for (const auto& row : result.rows) {
            if (row.empty() || !row[0]) continue;
            objects.emplace_back(JsonValue::parse(*row[0]));
        }
    } catch (const JsonValue::parse_error& e) {
        return RuleLoader::LoadResult::error(std::format("Malformed rule row: {}", e.what()));
    }

    return RuleLoader::load_from_json(objects);
}

} // namespace auditpipe
