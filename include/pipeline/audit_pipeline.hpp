#pragma once

#include "core/types.hpp"
#include "dispatch/violation_dispatcher.hpp"
#include "enrich/event_enricher.hpp"
#include "pipeline/event_bus.hpp"
#include "reporting/report_aggregator.hpp"
#include "rules/irule_store.hpp"
#include "rules/rule_engine.hpp"
#include "storage/secure_persistence.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief The audit-event pipeline
 *
 * log_event(): enrich -> evaluate rules -> annotate complianceFlags ->
 * dispatch violations -> persist -> publish to subscribers.
 *
 * Error contract:
 * - ValidationError: thrown before any I/O, nothing is recorded
 * - StorageError: the event was not persisted; the failure is recorded once
 *   as an AUDIT_LOGGING_ERROR event and the error is rethrown
 * - Channel, auto-response, violation-write, dispatch and rule-load failures
 *   never fail log_event()
 *
 * Loop guard: a failure while recording an AUDIT_LOGGING_ERROR event goes to
 * the process log only.
 *
 * Thread-safety: log_event(), query_trail(), report() and reload_rules()
 * may be called concurrently. The rule snapshot is swapped atomically.
 */
class AuditPipeline {
public:
    struct Config {
        EventEnricher::Config enricher;
        size_t regex_max_subject_bytes = RuleEngine::kDefaultRegexMaxSubjectBytes;
    };

    struct Components {
        std::shared_ptr<IRuleStore> rule_store;
        std::shared_ptr<SecurePersistence> persistence;
        std::shared_ptr<ViolationDispatcher> dispatcher;
        std::shared_ptr<EventBus> event_bus;        // optional
    };

    struct Metrics {
        uint64_t events_logged = 0;
        uint64_t compliance_violations = 0;
        uint64_t critical_events = 0;
        uint64_t errors = 0;
        uint64_t validation_rejections = 0;
        uint64_t rule_load_failures = 0;
        double average_log_time_ms = 0.0;
        size_t rules_loaded = 0;
        std::chrono::seconds uptime{0};
        uint64_t publish_drops = 0;
    };

    /**
     * @throws std::invalid_argument when persistence or dispatcher is missing
     */
    AuditPipeline(Config config, Components components);

    AuditPipeline(const AuditPipeline&) = delete;
    AuditPipeline& operator=(const AuditPipeline&) = delete;

    /**
     * @brief Load rules and record AUDIT_LOGGER_INITIALIZED
     * @return false if the initial rule load failed (pipeline still usable)
     */
    bool initialize();

    /**
     * @return requestId of the persisted event
     * @throws ValidationError, StorageError
     */
    std::string log_event(AuditEvent event);

    /**
     * @brief Replace the rule snapshot from the rule store
     * @return false on failure; the previous snapshot stays active
     */
    bool reload_rules();

    /**
     * @throws ValidationError for an empty user id, StorageError
     */
    [[nodiscard]] std::vector<AuditEvent> query_trail(const std::string& user_id,
                                                      const TrailFilter& filter) const;

    /**
     * @throws StorageError, std::invalid_argument for an inverted window
     */
    [[nodiscard]] ReportSummary report(const std::string& report_type,
                                       TimePoint start, TimePoint end) const;

    /**
     * @brief Record an AUDIT_LOGGER_METRICS event with the current metrics
     */
    void log_metrics_snapshot();

    /**
     * @brief Record an internally generated event; failures go to the process log
     */
    void log_internal(AuditEvent event);

    [[nodiscard]] Metrics get_metrics() const;
    [[nodiscard]] static JsonValue metrics_to_json(const Metrics& metrics);

    [[nodiscard]] const RuleEngine& rule_engine() const { return rule_engine_; }
    [[nodiscard]] const std::shared_ptr<EventBus>& event_bus() const { return components_.event_bus; }
    [[nodiscard]] SecurePersistence& persistence() const { return *components_.persistence; }

private:
    // depth > 0 marks events derived from an auto-response
    std::string log_event_impl(AuditEvent event, int depth);
    void report_internal_failure(const AuditEvent& failed, const std::exception& error);
    void record_timing(std::chrono::microseconds elapsed);

    Config config_;
    Components components_;
    EventEnricher enricher_;
    RuleEngine rule_engine_;
    ReportAggregator reporter_;

    const std::chrono::steady_clock::time_point started_at_;

    std::atomic<uint64_t> events_logged_{0};
    std::atomic<uint64_t> compliance_violations_{0};
    std::atomic<uint64_t> critical_events_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> validation_rejections_{0};
    std::atomic<uint64_t> rule_load_failures_{0};
    std::atomic<uint64_t> total_log_time_us_{0};
    std::atomic<uint64_t> timed_events_{0};
};

} // namespace auditpipe
