#include "reporting/report_aggregator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <stdexcept>
#include <utility>

namespace auditpipe {

ReportAggregator::ReportAggregator(std::shared_ptr<IAuditStore> store)
    : store_(std::move(store)) {}

ReportSummary ReportAggregator::report(const std::string& report_type,
                                       TimePoint start, TimePoint end) const {
    if (end < start) {
        throw std::invalid_argument("Report window ends before it starts");
    }

    ReportSummary summary;
    summary.report_type = report_type;
    summary.period_start = start;
    summary.period_end = end;

    std::map<std::pair<std::string, std::string>, ReportRow> groups;
    store_->scan_window(start, end, [&](const AuditEvent& event) {
        const std::string category = event.event_category
            ? std::string(event_category_to_string(*event.event_category)) : std::string("unknown");
        auto& row = groups[{category, event.event_type}];
        if (row.event_count == 0) {
            row.event_category = category;
            row.event_type = event.event_type;
        }
        ++row.event_count;
        if (event.severity == Severity::CRITICAL) ++row.critical_count;
        if (event.severity == Severity::HIGH) ++row.high_count;
        if (!event.compliance_flags.empty()) ++row.violation_count;
    });

    summary.rows.reserve(groups.size());
    for (auto& [key, row] : groups) {
        summary.total_events += row.event_count;
        summary.critical_events += row.critical_count;
        summary.high_events += row.high_count;
        summary.violations += row.violation_count;
        summary.rows.push_back(std::move(row));
    }

    // map order gives the (category, type) tie-break
    std::stable_sort(summary.rows.begin(), summary.rows.end(),
        [](const ReportRow& a, const ReportRow& b) { return a.event_count > b.event_count; });

    summary.generated_at = utils::now();
    return summary;
}

JsonValue ReportAggregator::to_json(const ReportSummary& s) {
    JsonValue out = JsonValue::object();
    out.set("reportType", s.report_type);
    out.set("periodStart", utils::format_timestamp(s.period_start));
    out.set("periodEnd", utils::format_timestamp(s.period_end));
    out.set("generatedAt", utils::format_timestamp(s.generated_at));

    JsonValue totals = JsonValue::object();
    totals.set("events", s.total_events);
    totals.set("criticalEvents", s.critical_events);
    totals.set("highEvents", s.high_events);
    totals.set("violations", s.violations);
    out.set("totals", std::move(totals));

    JsonValue rows = JsonValue::array();
    for (const auto& r : s.rows) {
        JsonValue row = JsonValue::object();
        row.set("eventCategory", r.event_category);
        row.set("eventType", r.event_type);
        row.set("eventCount", r.event_count);
        row.set("criticalCount", r.critical_count);
        row.set("highCount", r.high_count);
        row.set("violationCount", r.violation_count);
        rows.push_back(std::move(row));
    }
    out.set("rows", std::move(rows));
    return out;
}

} // namespace auditpipe
