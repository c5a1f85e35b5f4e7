#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "rules/rule_types.hpp"

#include <string>

namespace auditpipe {

/**
 * @brief Compliance team hand-off for notify_compliance / create_ticket
 *
 * Calls are fire-and-forget from the dispatcher's point of view: a false
 * return or an exception is logged and not retried.
 */
class IComplianceDesk {
public:
    virtual ~IComplianceDesk() = default;

    virtual bool notify_compliance(const AuditEvent& event, const ComplianceRule& rule,
                                   const JsonValue& parameters) = 0;

    virtual bool create_ticket(const AuditEvent& event, const ComplianceRule& rule,
                               const JsonValue& parameters) = 0;
};

} // namespace auditpipe
