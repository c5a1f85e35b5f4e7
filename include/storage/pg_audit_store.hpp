#pragma once

#include "storage/iaudit_store.hpp"
#include "db/connection_pool.hpp"

#include <memory>

namespace auditpipe {

/**
 * @brief PostgreSQL audit store (compliance.audit_log, compliance.violations)
 *
 * The event's wire form travels as a single jsonb parameter and is mapped to
 * columns server-side. Reads render rows back to the wire form with
 * json_build_object so one codec serves both backends. created_at holds
 * recorded_at.
 */
class PgAuditStore : public IAuditStore {
public:
    explicit PgAuditStore(std::shared_ptr<ConnectionPool> pool);

    void append(const AuditEvent& event) override;
    void append_violation(const Violation& violation) override;

    [[nodiscard]] std::vector<AuditEvent> query_user_trail(
        const std::string& user_id, const TrailFilter& filter) const override;
    void scan_window(TimePoint start, TimePoint end, const Visitor& visitor) const override;
    uint64_t delete_expired(TimePoint now) override;

    [[nodiscard]] std::string name() const override { return "postgresql:compliance.audit_log"; }

private:
    DbResultSet run(const std::string& sql, const DbParams& params) const;
    static std::vector<AuditEvent> decode_rows(const DbResultSet& result);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace auditpipe
