#include "pipeline/audit_pipeline.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace auditpipe {

AuditPipeline::AuditPipeline(Config config, Components components)
    : config_(std::move(config)),
      components_(std::move(components)),
      enricher_(config_.enricher),
      rule_engine_(config_.regex_max_subject_bytes),
      reporter_(components_.persistence ? components_.persistence->backend_ptr() : nullptr),
      started_at_(std::chrono::steady_clock::now()) {
    if (!components_.persistence) {
        throw std::invalid_argument("AuditPipeline requires persistence");
    }
    if (!components_.dispatcher) {
        throw std::invalid_argument("AuditPipeline requires a violation dispatcher");
    }
}

bool AuditPipeline::initialize() {
    const bool rules_ok = reload_rules();

    AuditEvent init;
    init.event_type = std::string(event_types::kLoggerInitialized);
    init.event_category = EventCategory::SYSTEM_OPERATION;
    init.description = "Audit logger initialized";
    JsonValue meta = JsonValue::object();
    meta.set("rulesLoaded", rule_engine_.rule_count());
    meta.set("ruleStore", components_.rule_store ? components_.rule_store->name() : std::string("none"));
    meta.set("auditStore", components_.persistence->backend().name());
    init.metadata = std::move(meta);
    log_internal(std::move(init));

    utils::log::info(std::format("Audit pipeline ready: {} rules, store {}",
        rule_engine_.rule_count(), components_.persistence->backend().name()));
    return rules_ok;
}

// ============================================================================
// Event Logging
// ============================================================================

std::string AuditPipeline::log_event(AuditEvent event) {
    return log_event_impl(std::move(event), 0);
}

std::string AuditPipeline::log_event_impl(AuditEvent event, int depth) {
    const utils::Timer timer;

    AuditEvent enriched;
    try {
        enriched = enricher_.enrich(std::move(event));
    } catch (const ValidationError&) {
        validation_rejections_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    const auto matches = rule_engine_.evaluate(enriched);
    for (const auto& rule : matches) {
        if (std::find(enriched.compliance_flags.begin(), enriched.compliance_flags.end(),
                      rule->name) == enriched.compliance_flags.end()) {
            enriched.compliance_flags.push_back(rule->name);
        }
    }

    if (!matches.empty()) {
        const bool allow_auto_response = (depth == 0);
        try {
            components_.dispatcher->dispatch(enriched, matches, allow_auto_response,
                [this, depth](AuditEvent derived) {
                    (void)log_event_impl(std::move(derived), depth + 1);
                });
        } catch (const std::exception& e) {
            // Side effects are best effort; the event itself is still persisted
            errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Violation dispatch for {} ({}) failed: {}",
                enriched.event_type, enriched.request_id, e.what()));
        }
    }

    AuditEvent stored;
    try {
        stored = components_.persistence->store(enriched);
    } catch (const StorageError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        report_internal_failure(enriched, e);
        throw;
    }

    events_logged_.fetch_add(1, std::memory_order_relaxed);
    compliance_violations_.fetch_add(matches.size(), std::memory_order_relaxed);
    if (stored.severity == Severity::CRITICAL) {
        critical_events_.fetch_add(1, std::memory_order_relaxed);
    }
    record_timing(timer.elapsed_us());

    if (components_.event_bus) {
        components_.event_bus->publish(std::make_shared<const AuditEvent>(stored));
    }
    return stored.request_id;
}

void AuditPipeline::record_timing(std::chrono::microseconds elapsed) {
    total_log_time_us_.fetch_add(static_cast<uint64_t>(elapsed.count()), std::memory_order_relaxed);
    timed_events_.fetch_add(1, std::memory_order_relaxed);
}

void AuditPipeline::report_internal_failure(const AuditEvent& failed, const std::exception& error) {
    if (failed.event_type == event_types::kAuditLoggingError) {
        utils::log::error(std::format("Audit logging failure could not be recorded ({}): {}",
            failed.request_id, error.what()));
        return;
    }

    utils::log::error(std::format("Failed to persist audit event {} ({}): {}",
        failed.event_type, failed.request_id, error.what()));

    AuditEvent err;
    err.event_type = std::string(event_types::kAuditLoggingError);
    err.event_category = EventCategory::ERROR;
    err.description = "Failed to log audit event";
    err.severity = Severity::HIGH;
    err.error = error.what();
    if (const auto* pe = dynamic_cast<const PipelineError*>(&error)) {
        err.error_code = std::string(error_category_to_string(pe->category()));
    }
    JsonValue meta = JsonValue::object();
    meta.set("originalEventType", failed.event_type);
    meta.set("originalRequestId", failed.request_id);
    err.metadata = std::move(meta);
    log_internal(std::move(err));
}

void AuditPipeline::log_internal(AuditEvent event) {
    const std::string type = event.event_type;
    try {
        (void)log_event_impl(std::move(event), 1);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Internal audit event {} not recorded: {}", type, e.what()));
    }
}

// ============================================================================
// Rules
// ============================================================================

bool AuditPipeline::reload_rules() {
    if (!components_.rule_store) {
        utils::log::warn("No rule store configured; running without compliance rules");
        return false;
    }

    RuleLoader::LoadResult result;
    try {
        result = components_.rule_store->list_active_rules();
    } catch (const std::exception& e) {
        result = RuleLoader::LoadResult::error(e.what());
    }

    if (result.success) {
        rule_engine_.load_rules(std::move(result.rules));
        return true;
    }

    rule_load_failures_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("Compliance rules not reloaded from {} (keeping {} cached rules): {}",
        components_.rule_store->name(), rule_engine_.rule_count(), result.error_message));

    AuditEvent failure;
    failure.event_type = std::string(event_types::kRulesLoadFailed);
    failure.event_category = EventCategory::ERROR;
    failure.description = "Failed to load compliance rules";
    failure.severity = Severity::LOW;
    failure.error = result.error_message;
    JsonValue meta = JsonValue::object();
    meta.set("ruleStore", components_.rule_store->name());
    meta.set("cachedRules", rule_engine_.rule_count());
    failure.metadata = std::move(meta);
    log_internal(std::move(failure));
    return false;
}

// ============================================================================
// Reads
// ============================================================================

std::vector<AuditEvent> AuditPipeline::query_trail(const std::string& user_id,
                                                   const TrailFilter& filter) const {
    if (user_id.empty()) {
        throw ValidationError("userId is required");
    }
    if (filter.start && filter.end && *filter.end < *filter.start) {
        throw ValidationError("Trail window ends before it starts");
    }

    TrailFilter bounded = filter;
    bounded.limit = std::min(filter.limit == 0 ? kMaxTrailRows : filter.limit, kMaxTrailRows);

    try {
        return components_.persistence->backend().query_user_trail(user_id, bounded);
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError(std::format("Trail query failed: {}", e.what()));
    }
}

ReportSummary AuditPipeline::report(const std::string& report_type,
                                    TimePoint start, TimePoint end) const {
    try {
        return reporter_.report(report_type, start, end);
    } catch (const StorageError&) {
        throw;
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError(std::format("Report failed: {}", e.what()));
    }
}

// ============================================================================
// Metrics
// ============================================================================

AuditPipeline::Metrics AuditPipeline::get_metrics() const {
    Metrics m;
    m.events_logged = events_logged_.load(std::memory_order_relaxed);
    m.compliance_violations = compliance_violations_.load(std::memory_order_relaxed);
    m.critical_events = critical_events_.load(std::memory_order_relaxed);
    m.errors = errors_.load(std::memory_order_relaxed);
    m.validation_rejections = validation_rejections_.load(std::memory_order_relaxed);
    m.rule_load_failures = rule_load_failures_.load(std::memory_order_relaxed);

    const uint64_t timed = timed_events_.load(std::memory_order_relaxed);
    if (timed > 0) {
        m.average_log_time_ms = static_cast<double>(total_log_time_us_.load(std::memory_order_relaxed))
                              / static_cast<double>(timed) / 1000.0;
    }

    m.rules_loaded = rule_engine_.rule_count();
    m.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    if (components_.event_bus) {
        m.publish_drops = components_.event_bus->get_stats().dropped;
    }
    return m;
}

JsonValue AuditPipeline::metrics_to_json(const Metrics& m) {
    JsonValue out = JsonValue::object();
    out.set("eventsLogged", m.events_logged);
    out.set("complianceViolations", m.compliance_violations);
    out.set("criticalEvents", m.critical_events);
    out.set("errors", m.errors);
    out.set("validationRejections", m.validation_rejections);
    out.set("ruleLoadFailures", m.rule_load_failures);
    out.set("averageLogTime", m.average_log_time_ms);
    out.set("rulesLoaded", m.rules_loaded);
    out.set("uptime", m.uptime.count());
    out.set("publishDrops", m.publish_drops);
    return out;
}

void AuditPipeline::log_metrics_snapshot() {
    AuditEvent snapshot;
    snapshot.event_type = std::string(event_types::kLoggerMetrics);
    snapshot.event_category = EventCategory::PERFORMANCE;
    snapshot.description = "Audit logger performance metrics";
    snapshot.metadata = metrics_to_json(get_metrics());
    log_internal(std::move(snapshot));
}

} // namespace auditpipe
