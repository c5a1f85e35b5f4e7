#pragma once

#include "alerting/alert_channel.hpp"
#include "core/types.hpp"
#include "dispatch/iaccount_store.hpp"
#include "dispatch/icompliance_desk.hpp"
#include "rules/rule_types.hpp"
#include "storage/secure_persistence.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace auditpipe {

/**
 * @brief Side effects of rule matches
 *
 * For each matched rule, independently of every other rule:
 * 1. alert through each of the rule's channels (a failure is logged and
 *    never stops the other channels)
 * 2. run the rule's auto-response, if any and if allowed
 * 3. persist one Violation
 *
 * With more than one matched rule the per-rule work runs concurrently.
 * Nothing thrown by a channel, an action or the violation write escapes
 * dispatch().
 */
class ViolationDispatcher {
public:
    // Routes a derived event (e.g. USER_BLOCKED_AUTOMATICALLY) back through the pipeline
    using EmitFn = std::function<void(AuditEvent)>;

    struct Config {
        int flag_risk_score_floor = 80;
    };

    struct Outcome {
        size_t alerts_sent = 0;
        size_t alerts_failed = 0;
        size_t actions_executed = 0;
        size_t actions_failed = 0;
        size_t actions_skipped = 0;
        size_t violations_stored = 0;
        size_t violations_failed = 0;

        Outcome& operator+=(const Outcome& o);
    };

    /**
     * @param accounts nullptr disables block_user / flag_account (logged)
     * @param desk     nullptr makes notify_compliance / create_ticket log only
     */
    ViolationDispatcher(std::shared_ptr<AlertChannelRegistry> channels,
                        std::shared_ptr<IAccountStore> accounts,
                        std::shared_ptr<IComplianceDesk> desk,
                        std::shared_ptr<SecurePersistence> persistence,
                        Config config = {});
    virtual ~ViolationDispatcher() = default;

    ViolationDispatcher(const ViolationDispatcher&) = delete;
    ViolationDispatcher& operator=(const ViolationDispatcher&) = delete;

    /**
     * @param event               enriched event, complianceFlags already set
     * @param allow_auto_response false for events derived from an auto-response
     */
    virtual Outcome dispatch(const AuditEvent& event, const std::vector<RulePtr>& rules,
                     bool allow_auto_response, const EmitFn& emit);

    struct Stats {
        uint64_t alerts_sent;
        uint64_t alerts_failed;
        uint64_t actions_executed;
        uint64_t actions_failed;
        uint64_t violations_stored;
        uint64_t violations_failed;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Outcome handle_rule(const AuditEvent& event, const ComplianceRule& rule,
                        bool allow_auto_response, const EmitFn& emit);
    void send_alerts(const AuditEvent& event, const ComplianceRule& rule, Outcome& outcome);
    void run_auto_response(const AuditEvent& event, const ComplianceRule& rule,
                           const EmitFn& emit, Outcome& outcome);
    void record_violation(const AuditEvent& event, const ComplianceRule& rule, Outcome& outcome);

    // Returns false when the action was skipped
    bool execute_action(const AuditEvent& event, const ComplianceRule& rule,
                        const AutoResponse& response, const EmitFn& emit);

    std::shared_ptr<AlertChannelRegistry> channels_;
    std::shared_ptr<IAccountStore> accounts_;
    std::shared_ptr<IComplianceDesk> desk_;
    std::shared_ptr<SecurePersistence> persistence_;
    Config config_;

    std::atomic<uint64_t> alerts_sent_{0};
    std::atomic<uint64_t> alerts_failed_{0};
    std::atomic<uint64_t> actions_executed_{0};
    std::atomic<uint64_t> actions_failed_{0};
    std::atomic<uint64_t> violations_stored_{0};
    std::atomic<uint64_t> violations_failed_{0};
};

} // namespace auditpipe
