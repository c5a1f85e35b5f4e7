#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "storage/iaudit_store.hpp"

#include <memory>
#include <string>

namespace auditpipe {

/**
 * @brief Read-only window summaries over the audit store
 *
 * Groups events recorded within [start, end] by (eventCategory, eventType)
 * and counts totals, CRITICAL, HIGH and flagged (non-empty complianceFlags)
 * events. Rows are ordered by event count, descending, then by category and
 * type. An empty window yields a zero-filled summary.
 */
class ReportAggregator {
public:
    explicit ReportAggregator(std::shared_ptr<IAuditStore> store);

    /**
     * @throws StorageError, std::invalid_argument when start > end
     */
    [[nodiscard]] ReportSummary report(const std::string& report_type,
                                       TimePoint start, TimePoint end) const;

    [[nodiscard]] static JsonValue to_json(const ReportSummary& summary);

private:
    std::shared_ptr<IAuditStore> store_;
};

} // namespace auditpipe
