#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Append-only durable store for audit events and violations
 *
 * Records are never updated. The only deletion path is delete_expired(),
 * driven by the retention sweeper. Every method throws StorageError on
 * failure.
 */
class IAuditStore {
public:
    using Visitor = std::function<void(const AuditEvent&)>;

    virtual ~IAuditStore() = default;

    /**
     * @brief Append one prepared event. recorded_at must be set.
     */
    virtual void append(const AuditEvent& event) = 0;

    virtual void append_violation(const Violation& violation) = 0;

    /**
     * @brief Events for one user, newest first, at most filter.limit rows
     */
    [[nodiscard]] virtual std::vector<AuditEvent> query_user_trail(
        const std::string& user_id, const TrailFilter& filter) const = 0;

    /**
     * @brief Visit every event recorded within [start, end]
     */
    virtual void scan_window(TimePoint start, TimePoint end, const Visitor& visitor) const = 0;

    /**
     * @brief Delete non-retained events older than their retention period
     * @return Number of deleted events
     */
    virtual uint64_t delete_expired(TimePoint now) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// ============================================================================
// Shared predicates
// ============================================================================

// Calendar-year addition; Feb 29 maps to Feb 28 in non-leap years.
// Saturates at TimePoint::max() / min() instead of wrapping past the clock's range.
[[nodiscard]] inline TimePoint add_years(TimePoint tp, int years) {
    using namespace std::chrono;
    const auto day = floor<days>(tp);
    const auto time_of_day = tp - day;
    year_month_day ymd{day};

    const int64_t target = int64_t{static_cast<int>(ymd.year())} + years;
    if (target > static_cast<int>(year::max())) return TimePoint::max();
    if (target < static_cast<int>(year::min())) return TimePoint::min();

    ymd = year{static_cast<int>(target)} / ymd.month() / ymd.day();
    if (!ymd.ok()) {
        ymd = ymd.year() / ymd.month() / last;
    }
    const sys_days shifted{ymd};
    if (shifted >= floor<days>(TimePoint::max())) return TimePoint::max();
    if (shifted <= ceil<days>(TimePoint::min())) return TimePoint::min();
    return shifted + time_of_day;
}

[[nodiscard]] inline TimePoint record_time(const AuditEvent& event) {
    if (event.recorded_at) return *event.recorded_at;
    return event.timestamp.value_or(TimePoint{});
}

/**
 * @brief True iff the record is not retained and older than retention_years
 */
[[nodiscard]] inline bool is_expired(const AuditEvent& event, TimePoint now) {
    if (event.requires_retention.value_or(true)) return false;
    const int years = event.retention_years.value_or(0);
    return add_years(record_time(event), years) < now;
}

[[nodiscard]] inline bool matches_trail_filter(const AuditEvent& event,
                                               const std::string& user_id,
                                               const TrailFilter& filter) {
    if (!event.user_id || *event.user_id != user_id) return false;
    const auto t = record_time(event);
    if (filter.start && t < *filter.start) return false;
    if (filter.end && t > *filter.end) return false;
    if (!filter.event_types.empty()) {
        bool found = false;
        for (const auto& type : filter.event_types) {
            if (type == event.event_type) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

} // namespace auditpipe
