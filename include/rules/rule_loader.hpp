#pragma once

#include "core/json.hpp"
#include "rules/rule_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Compliance rule loader
 *
 * Accepts rules from a TOML rule file ([[rules]] tables) or from JSON rows
 * (the PostgreSQL rule store). Both forms share one set of snake_case keys:
 * id, name, description, event_types, conditions, severity, alert_channels,
 * auto_response, is_active.
 *
 * A single invalid rule fails the whole load so the caller keeps its
 * previous snapshot. Validates:
 * - id and name present, ids unique
 * - at least one event type
 * - known operators, channels, actions and severities
 * - regex patterns compile (ECMAScript)
 */
class RuleLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<ComplianceRule> rules;

        static LoadResult ok(std::vector<ComplianceRule> rules_vec) {
            LoadResult result;
            result.success = true;
            result.rules = std::move(rules_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    static LoadResult load_from_file(const std::string& path);
    static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Load from already-decoded rule objects (one per rule)
     */
    static LoadResult load_from_json(const std::vector<JsonValue>& rule_objects);

    /**
     * @brief Build one rule from its JSON form
     * @return Error text, or std::nullopt on success (rule filled in)
     */
    static std::optional<std::string> parse_rule(const JsonValue& json, ComplianceRule& rule);

    // Convert a TOML node (table, array or scalar) to JSON
    static JsonValue toml_to_json(const toml::node& node);

private:
    static std::optional<ConditionOperator> parse_operator(const std::string& s);
    static std::optional<AlertChannelKind> parse_channel(const std::string& s);
    static std::optional<AutoResponseAction> parse_action(const std::string& s);
};

} // namespace auditpipe
