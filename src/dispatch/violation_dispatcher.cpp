#include "dispatch/violation_dispatcher.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <stdexcept>
#include <system_error>

namespace auditpipe {

namespace {

// Derived events carry the action parameters plus a link to the trigger
JsonValue derived_metadata(const AuditEvent& trigger, const ComplianceRule& rule,
                           const JsonValue& parameters) {
    JsonValue meta = parameters.is_object() ? parameters : JsonValue::object();
    meta.set("ruleId", rule.id);
    meta.set("ruleName", rule.name);
    meta.set("triggeringRequestId", trigger.request_id);
    return meta;
}

} // anonymous namespace

ViolationDispatcher::Outcome& ViolationDispatcher::Outcome::operator+=(const Outcome& o) {
    alerts_sent += o.alerts_sent;
    alerts_failed += o.alerts_failed;
    actions_executed += o.actions_executed;
    actions_failed += o.actions_failed;
    actions_skipped += o.actions_skipped;
    violations_stored += o.violations_stored;
    violations_failed += o.violations_failed;
    return *this;
}

ViolationDispatcher::ViolationDispatcher(std::shared_ptr<AlertChannelRegistry> channels,
                                         std::shared_ptr<IAccountStore> accounts,
                                         std::shared_ptr<IComplianceDesk> desk,
                                         std::shared_ptr<SecurePersistence> persistence,
                                         Config config)
    : channels_(std::move(channels)),
      accounts_(std::move(accounts)),
      desk_(std::move(desk)),
      persistence_(std::move(persistence)),
      config_(config) {
    if (!channels_) channels_ = std::make_shared<AlertChannelRegistry>();
    if (!persistence_) {
        throw std::invalid_argument("ViolationDispatcher requires persistence");
    }
}

ViolationDispatcher::Outcome ViolationDispatcher::dispatch(const AuditEvent& event,
                                                           const std::vector<RulePtr>& rules,
                                                           bool allow_auto_response,
                                                           const EmitFn& emit) {
    Outcome total;
    if (rules.empty()) return total;

    if (rules.size() == 1) {
        total += handle_rule(event, *rules.front(), allow_auto_response, emit);
        return total;
    }

    std::vector<std::future<Outcome>> futures;
    futures.reserve(rules.size());
    for (const auto& rule : rules) {
        try {
            futures.push_back(std::async(std::launch::async,
                [this, &event, rule, allow_auto_response, &emit] {
                    return handle_rule(event, *rule, allow_auto_response, emit);
                }));
        } catch (const std::system_error& e) {
            // No thread available: handle this rule on the caller's thread
            utils::log::warn(std::format("Dispatch of rule '{}' runs inline: {}", rule->name, e.what()));
            total += handle_rule(event, *rule, allow_auto_response, emit);
        }
    }
    for (auto& f : futures) {
        total += f.get();
    }
    return total;
}

ViolationDispatcher::Outcome ViolationDispatcher::handle_rule(const AuditEvent& event,
                                                              const ComplianceRule& rule,
                                                              bool allow_auto_response,
                                                              const EmitFn& emit) {
    Outcome outcome;
    send_alerts(event, rule, outcome);

    if (rule.auto_response) {
        if (allow_auto_response) {
            run_auto_response(event, rule, emit, outcome);
        } else {
            ++outcome.actions_skipped;
            utils::log::info(std::format(
                "Auto-response {} of rule '{}' suppressed for derived event {}",
                auto_response_to_string(rule.auto_response->action), rule.name, event.event_type));
        }
    }

    record_violation(event, rule, outcome);
    return outcome;
}

// ============================================================================
// Alerts
// ============================================================================

void ViolationDispatcher::send_alerts(const AuditEvent& event, const ComplianceRule& rule,
                                      Outcome& outcome) {
    if (rule.alert_channels.empty()) return;

    const AlertPayload payload = AlertPayload::from(event, rule);
    for (const auto kind : rule.alert_channels) {
        const auto channel = channels_->find(kind);
        if (!channel) {
            ++outcome.alerts_failed;
            alerts_failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Alert channel {} not configured (rule '{}')",
                alert_channel_to_string(kind), rule.name));
            continue;
        }

        bool delivered = false;
        try {
            delivered = channel->deliver(payload);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Alert channel {} threw for rule '{}': {}",
                channel->name(), rule.name, e.what()));
        }

        if (delivered) {
            ++outcome.alerts_sent;
            alerts_sent_.fetch_add(1, std::memory_order_relaxed);
        } else {
            ++outcome.alerts_failed;
            alerts_failed_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

// ============================================================================
// Auto-responses
// ============================================================================

void ViolationDispatcher::run_auto_response(const AuditEvent& event, const ComplianceRule& rule,
                                            const EmitFn& emit, Outcome& outcome) {
    const auto& response = *rule.auto_response;
    try {
        if (execute_action(event, rule, response, emit)) {
            ++outcome.actions_executed;
            actions_executed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            ++outcome.actions_skipped;
        }
    } catch (const std::exception& e) {
        ++outcome.actions_failed;
        actions_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Auto-response {} of rule '{}' failed: {}",
            auto_response_to_string(response.action), rule.name, e.what()));
    }
}

bool ViolationDispatcher::execute_action(const AuditEvent& event, const ComplianceRule& rule,
                                         const AutoResponse& response, const EmitFn& emit) {
    const auto action_name = auto_response_to_string(response.action);

    switch (response.action) {
        case AutoResponseAction::BLOCK_USER:
        case AutoResponseAction::FLAG_ACCOUNT: {
            if (!event.user_id || event.user_id->empty()) {
                utils::log::warn(std::format("Auto-response {} of rule '{}' skipped: event {} has no userId",
                    action_name, rule.name, event.request_id));
                return false;
            }
            if (!accounts_) {
                utils::log::warn(std::format("Auto-response {} of rule '{}' skipped: no account store",
                    action_name, rule.name));
                return false;
            }

            AuditEvent derived;
            derived.user_id = event.user_id;
            derived.metadata = derived_metadata(event, rule, response.parameters);

            if (response.action == AutoResponseAction::BLOCK_USER) {
                accounts_->set_account_status(*event.user_id, AccountStatus::BLOCKED);
                derived.event_type = std::string(event_types::kUserBlocked);
                derived.event_category = EventCategory::SECURITY;
                derived.description = "User blocked due to compliance violation";
                derived.severity = Severity::HIGH;
            } else {
                const int floor = response.parameters.value("min_risk_score",
                                                            config_.flag_risk_score_floor);
                accounts_->raise_risk_score(*event.user_id, floor);
                derived.event_type = std::string(event_types::kAccountFlagged);
                derived.event_category = EventCategory::COMPLIANCE;
                derived.description = "Account flagged for compliance review";
                derived.severity = Severity::MEDIUM;
                derived.risk_score = floor;
            }
            utils::log::info(std::format("Auto-response {} applied to user {} (rule '{}')",
                action_name, *event.user_id, rule.name));

            if (emit) emit(std::move(derived));
            return true;
        }

        case AutoResponseAction::NOTIFY_COMPLIANCE:
        case AutoResponseAction::CREATE_TICKET: {
            if (!desk_) {
                utils::log::info(std::format("Compliance desk {} for rule '{}' on event {} (no desk configured)",
                    action_name, rule.name, event.request_id));
                return true;
            }
            const bool ok = response.action == AutoResponseAction::NOTIFY_COMPLIANCE
                ? desk_->notify_compliance(event, rule, response.parameters)
                : desk_->create_ticket(event, rule, response.parameters);
            if (!ok) {
                throw std::runtime_error("compliance desk rejected the request");
            }
            return true;
        }
    }
    return false;
}

// ============================================================================
// Violations
// ============================================================================

void ViolationDispatcher::record_violation(const AuditEvent& event, const ComplianceRule& rule,
                                           Outcome& outcome) {
    Violation v;
    v.event_id = event.request_id;
    v.rule_id = rule.id;
    v.rule_name = rule.name;
    v.severity = rule.severity;
    v.detected_at = utils::now();

    try {
        v.event_snapshot = EventCodec::to_json(persistence_->prepare(event));
        persistence_->store_violation(v);
        ++outcome.violations_stored;
        violations_stored_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        ++outcome.violations_failed;
        violations_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Violation record for rule '{}' on event {} not stored: {}",
            rule.name, event.request_id, e.what()));
    }
}

ViolationDispatcher::Stats ViolationDispatcher::get_stats() const {
    return {
        .alerts_sent = alerts_sent_.load(std::memory_order_relaxed),
        .alerts_failed = alerts_failed_.load(std::memory_order_relaxed),
        .actions_executed = actions_executed_.load(std::memory_order_relaxed),
        .actions_failed = actions_failed_.load(std::memory_order_relaxed),
        .violations_stored = violations_stored_.load(std::memory_order_relaxed),
        .violations_failed = violations_failed_.load(std::memory_order_relaxed),
    };
}

} // namespace auditpipe
