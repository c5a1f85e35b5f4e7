#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "rules/rule_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace auditpipe {

/**
 * @brief Rule Engine - evaluates enriched events against compliance rules
 *
 * A rule matches iff the event type is one of the rule's event types and
 * every condition holds. Condition left-hand values come from a dotted-path
 * lookup into the event's wire form ("amount", "requestData.score",
 * "severity"). A missing path is absent, and an absent value makes every
 * operator false.
 *
 * Operators:
 * - equals:       strict typed equality
 * - contains:     substring of the stringified value
 * - greater_than / less_than: numeric, non-numeric sides are false
 * - regex:        ECMAScript search, compiled at load time. Subjects longer
 *                 than the configured cap never match (the std::regex
 *                 matcher recurses per character).
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). evaluate() works
 * on the snapshot current at entry and never sees a half-loaded rule set.
 */
class RuleEngine {
public:
    static constexpr size_t kDefaultRegexMaxSubjectBytes = 4096;

    explicit RuleEngine(size_t regex_max_subject_bytes = kDefaultRegexMaxSubjectBytes);

    /**
     * @brief Replace the active rule set (full replacement)
     */
    void load_rules(std::vector<ComplianceRule> rules);

    /**
     * @brief Matching rules, in load order. Deterministic and side-effect free.
     */
    [[nodiscard]] std::vector<RulePtr> evaluate(const AuditEvent& event) const;

    /**
     * @brief Same as evaluate() over an already-encoded wire form
     */
    [[nodiscard]] std::vector<RulePtr> evaluate(std::string_view event_type,
                                                const JsonValue& wire) const;

    [[nodiscard]] size_t rule_count() const;
    [[nodiscard]] std::vector<RulePtr> rules() const;
    void clear();

    [[nodiscard]] static std::optional<JsonValue> resolve_path(const JsonValue& root,
                                                               std::string_view path);
    [[nodiscard]] static bool evaluate_condition(
        const std::optional<JsonValue>& actual, const RuleCondition& condition,
        size_t regex_max_subject_bytes = kDefaultRegexMaxSubjectBytes);

    [[nodiscard]] size_t regex_max_subject_bytes() const { return regex_max_subject_bytes_; }

private:
    struct RuleSet {
        std::vector<RulePtr> rules;
        std::unordered_map<std::string, std::vector<size_t>> by_event_type;
    };

    [[nodiscard]] bool matches(const ComplianceRule& rule, const JsonValue& wire) const;

    const size_t regex_max_subject_bytes_;
    std::shared_ptr<const RuleSet> store_;
    std::mutex reload_mutex_;
};

} // namespace auditpipe
