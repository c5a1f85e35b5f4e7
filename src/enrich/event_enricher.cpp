#include "enrich/event_enricher.hpp"
#include "enrich/retention_policy.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

EventEnricher::EventEnricher() : EventEnricher(Config{}) {}

EventEnricher::EventEnricher(Config config)
    : config_(std::move(config)),
      classifier_(config_.classifier) {}

void EventEnricher::validate(const AuditEvent& event) {
    if (event.event_type.empty()) {
        throw ValidationError("Event type is required");
    }
    if (!event.event_category) {
        throw ValidationError("Event category is required");
    }
    if (event.description.empty()) {
        throw ValidationError("Event description is required");
    }
    if (event.retention_years &&
        (*event.retention_years < 0 || *event.retention_years > kMaxRetentionYears)) {
        throw ValidationError(std::format("Retention years must be within 0-{}, got {}",
            kMaxRetentionYears, *event.retention_years));
    }
}

AuditEvent EventEnricher::enrich(AuditEvent event) const {
    validate(event);

    // Scan before anything is stamped so only caller-supplied data counts
    const auto classification = classifier_.classify(event);

    if (event.request_id.empty()) {
        event.request_id = utils::generate_uuid();
    }
    if (!event.timestamp) {
        event.timestamp = utils::now();
    }
    if (!event.requires_retention) {
        event.requires_retention = true;
    }
    if (!event.retention_years) {
        event.retention_years = RetentionPolicy::default_years(*event.event_category);
    }

    event.personal_data_included = classification.personal;
    event.sensitive_data_included = classification.sensitive;
    event.compliance_flags.clear();
    event.server_id = config_.server_id;
    event.environment = config_.environment;
    event.recorded_at.reset();

    if (event.personal_data_included && !event.user_id) {
        utils::log::warn(std::format("Personal data event '{}' ({}) has no userId",
            event.event_type, event.request_id));
    }
    if (*event.event_category == EventCategory::FINANCIAL_TRANSACTION && !event.amount) {
        utils::log::warn(std::format("Financial transaction '{}' ({}) has no amount",
            event.event_type, event.request_id));
    }

    return event;
}

} // namespace auditpipe
