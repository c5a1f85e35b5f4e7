#include "rules/rule_engine.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace auditpipe {

namespace {

// Numbers as-is, numeric strings parsed, booleans as 0/1
std::optional<double> to_number(const JsonValue& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_string()) {
        const std::string s = utils::trim(v.get<std::string>());
        if (s.empty()) return std::nullopt;
        return utils::try_parse_double(s);
    }
    return std::nullopt;
}

} // anonymous namespace

RuleEngine::RuleEngine(size_t regex_max_subject_bytes)
    : regex_max_subject_bytes_(regex_max_subject_bytes) {
    std::atomic_store_explicit(&store_, std::make_shared<const RuleSet>(), std::memory_order_release);
}

void RuleEngine::load_rules(std::vector<ComplianceRule> rules) {
    auto new_store = std::make_shared<RuleSet>();
    new_store->rules.reserve(rules.size());

    for (auto& rule : rules) {
        if (!rule.is_active) continue;
        const size_t idx = new_store->rules.size();
        for (const auto& type : rule.event_types) {
            new_store->by_event_type[type].push_back(idx);
        }
        new_store->rules.emplace_back(std::make_shared<const ComplianceRule>(std::move(rule)));
    }

    const size_t count = new_store->rules.size();
    {
        std::lock_guard<std::mutex> lock(reload_mutex_);
        std::atomic_store_explicit(&store_, std::shared_ptr<const RuleSet>(std::move(new_store)),
                                   std::memory_order_release);
    }
    utils::log::info(std::format("RuleEngine: {} active compliance rules loaded", count));
}

std::vector<RulePtr> RuleEngine::evaluate(const AuditEvent& event) const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    const auto it = store->by_event_type.find(event.event_type);
    if (it == store->by_event_type.end()) return {};

    // Encode once, only when some candidate rule has conditions
    const bool needs_wire = std::any_of(it->second.begin(), it->second.end(),
        [&store](size_t idx) { return !store->rules[idx]->conditions.empty(); });
    const JsonValue wire = needs_wire ? EventCodec::to_json(event) : JsonValue();

    std::vector<RulePtr> result;
    for (const size_t idx : it->second) {
        const auto& rule = store->rules[idx];
        if (matches(*rule, wire)) result.push_back(rule);
    }
    return result;
}

std::vector<RulePtr> RuleEngine::evaluate(std::string_view event_type,
                                          const JsonValue& wire) const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    const auto it = store->by_event_type.find(std::string(event_type));
    if (it == store->by_event_type.end()) return {};

    std::vector<RulePtr> result;
    for (const size_t idx : it->second) {
        const auto& rule = store->rules[idx];
        if (matches(*rule, wire)) result.push_back(rule);
    }
    return result;
}

size_t RuleEngine::rule_count() const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    return store->rules.size();
}

std::vector<RulePtr> RuleEngine::rules() const {
    const auto store = std::atomic_load_explicit(&store_, std::memory_order_acquire);
    return store->rules;
}

void RuleEngine::clear() {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&store_, std::make_shared<const RuleSet>(), std::memory_order_release);
}

bool RuleEngine::matches(const ComplianceRule& rule, const JsonValue& wire) const {
    if (!rule.is_active) return false;
    for (const auto& cond : rule.conditions) {
        if (!evaluate_condition(resolve_path(wire, cond.field), cond, regex_max_subject_bytes_)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Path Lookup
// ============================================================================

std::optional<JsonValue> RuleEngine::resolve_path(const JsonValue& root, std::string_view path) {
    if (path.empty()) return std::nullopt;

    JsonValue current = root;
    size_t start = 0;
    while (start <= path.size()) {
        const size_t dot = path.find('.', start);
        const std::string_view segment = path.substr(start,
            dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (segment.empty()) return std::nullopt;

        if (current.is_object()) {
            if (!current.contains(segment)) return std::nullopt;
            current = current[segment];
        } else if (current.is_array()) {
            const auto idx = utils::try_parse_int<size_t>(segment);
            if (!idx || *idx >= current.size()) return std::nullopt;
            current = current[*idx];
        } else {
            return std::nullopt;
        }

        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    if (current.is_null()) return std::nullopt;
    return current;
}

// ============================================================================
// Operators
// ============================================================================

bool RuleEngine::evaluate_condition(const std::optional<JsonValue>& actual,
                                    const RuleCondition& condition,
                                    size_t regex_max_subject_bytes) {
    if (!actual) return false;

    switch (condition.op) {
        case ConditionOperator::EQUALS:
            return *actual == condition.value;

        case ConditionOperator::CONTAINS: {
            if (condition.value.is_null()) return false;
            const std::string haystack = actual->to_display_string();
            return haystack.find(condition.value.to_display_string()) != std::string::npos;
        }

        case ConditionOperator::GREATER_THAN:
        case ConditionOperator::LESS_THAN: {
            const auto lhs = to_number(*actual);
            const auto rhs = to_number(condition.value);
            if (!lhs || !rhs || std::isnan(*lhs) || std::isnan(*rhs)) return false;
            return condition.op == ConditionOperator::GREATER_THAN ? *lhs > *rhs : *lhs < *rhs;
        }

        case ConditionOperator::REGEX: {
            if (!condition.pattern) return false;
            const std::string subject = actual->to_display_string();
            if (subject.size() > regex_max_subject_bytes) {
                utils::log::warn(std::format(
                    "Regex condition on '{}' skipped: value is {} bytes (limit {})",
                    condition.field, subject.size(), regex_max_subject_bytes));
                return false;
            }
            return std::regex_search(subject, *condition.pattern);
        }
    }
    return false;
}

} // namespace auditpipe
