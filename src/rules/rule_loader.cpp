#include "rules/rule_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace auditpipe {

static constexpr std::string_view kRules         = "rules";
static constexpr std::string_view kEventTypes    = "event_types";
static constexpr std::string_view kConditions    = "conditions";
static constexpr std::string_view kAlertChannels = "alert_channels";
static constexpr std::string_view kAutoResponse  = "auto_response";

namespace {

// Accepts a JSON array of strings; anything else is an error
std::optional<std::string> read_string_list(const JsonValue& node, std::string_view key,
                                            std::vector<std::string>& out) {
    if (node.is_null()) return std::nullopt;
    if (!node.is_array()) {
        return std::format("'{}' must be an array of strings", key);
    }
    for (size_t i = 0; i < node.size(); ++i) {
        const JsonValue item = node[i];
        if (!item.is_string()) {
            return std::format("'{}' must be an array of strings", key);
        }
        if (!item.get<std::string>().empty()) {
            out.push_back(item.get<std::string>());
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Public API - Load from file
// ============================================================================

RuleLoader::LoadResult RuleLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open rule file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

// ============================================================================
// Public API - Load from string
// ============================================================================

RuleLoader::LoadResult RuleLoader::load_from_string(const std::string& toml_content) {
    try {
        auto config = toml::parse(toml_content);

        std::vector<JsonValue> objects;
        if (const auto* rules_array = config[kRules].as_array()) {
            for (const auto& elem : *rules_array) {
                if (!elem.is_table()) {
                    return LoadResult::error("Every [[rules]] entry must be a table");
                }
                objects.emplace_back(toml_to_json(elem));
            }
        }
        return load_from_json(objects);

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error parsing rules: {}", e.what()));
    }
}

RuleLoader::LoadResult RuleLoader::load_from_json(const std::vector<JsonValue>& rule_objects) {
    std::vector<ComplianceRule> rules;
    rules.reserve(rule_objects.size());
    std::unordered_set<std::string> seen_ids;

    for (const auto& obj : rule_objects) {
        ComplianceRule rule;
        if (auto err = parse_rule(obj, rule)) {
            const std::string label = !rule.name.empty() ? rule.name
                                    : !rule.id.empty()   ? rule.id
                                                         : std::string("<unnamed>");
            return LoadResult::error(std::format("Rule '{}': {}", label, *err));
        }
        if (!seen_ids.insert(rule.id).second) {
            return LoadResult::error(std::format("Duplicate rule id '{}'", rule.id));
        }
        if (rule.is_active) {
            rules.emplace_back(std::move(rule));
        }
    }

    return LoadResult::ok(std::move(rules));
}

// ============================================================================
// Rule Parsing
// ============================================================================

std::optional<std::string> RuleLoader::parse_rule(const JsonValue& json, ComplianceRule& rule) {
    if (!json.is_object()) {
        return "rule must be an object";
    }

    rule.id = json.value("id", std::string{});
    rule.name = json.value("name", std::string{});
    rule.description = json.value("description", std::string{});
    if (rule.id.empty()) return "rule must have an id";
    if (rule.name.empty()) return "rule must have a name";

    std::vector<std::string> types;
    if (auto err = read_string_list(json[kEventTypes], kEventTypes, types)) return err;
    if (types.empty()) return "rule must list at least one event type";
    rule.event_types.insert(types.begin(), types.end());

    const std::string severity_str = json.value("severity", std::string("MEDIUM"));
    const auto severity = parse_severity(severity_str);
    if (!severity) return std::format("invalid severity '{}'", severity_str);
    rule.severity = *severity;

    rule.is_active = json.value("is_active", true);

    // Conditions
    const JsonValue conditions = json[kConditions];
    if (!conditions.is_null() && !conditions.is_array()) {
        return "'conditions' must be an array";
    }
    const size_t condition_count = conditions.is_array() ? conditions.size() : 0;
    for (size_t i = 0; i < condition_count; ++i) {
        const JsonValue c = conditions[i];
        RuleCondition cond;
        cond.field = c.value("field", std::string{});
        if (cond.field.empty()) return std::format("condition {} has no field", i + 1);

        const std::string op_str = c.value("operator", std::string{});
        const auto op = parse_operator(op_str);
        if (!op) return std::format("condition {} has invalid operator '{}'", i + 1, op_str);
        cond.op = *op;
        cond.value = c["value"];

        if (cond.op == ConditionOperator::REGEX) {
            if (!cond.value.is_string()) {
                return std::format("condition {} regex value must be a string", i + 1);
            }
            try {
                cond.pattern = std::make_shared<const std::regex>(
                    cond.value.get<std::string>(), std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                return std::format("condition {} has invalid regex '{}': {}",
                    i + 1, cond.value.get<std::string>(), e.what());
            }
        }
        rule.conditions.emplace_back(std::move(cond));
    }

    // Alert channels
    std::vector<std::string> channels;
    if (auto err = read_string_list(json[kAlertChannels], kAlertChannels, channels)) return err;
    for (const auto& ch : channels) {
        const auto kind = parse_channel(ch);
        if (!kind) return std::format("unknown alert channel '{}'", ch);
        if (std::find(rule.alert_channels.begin(), rule.alert_channels.end(), *kind) ==
            rule.alert_channels.end()) {
            rule.alert_channels.push_back(*kind);
        }
    }

    // Auto-response
    const JsonValue ar = json[kAutoResponse];
    if (ar.is_object()) {
        const std::string action_str = ar.value("action", std::string{});
        const auto action = parse_action(action_str);
        if (!action) return std::format("unknown auto-response action '{}'", action_str);
        AutoResponse response;
        response.action = *action;
        response.parameters = ar["parameters"].is_null() ? JsonValue::object() : ar["parameters"];
        rule.auto_response = std::move(response);
    } else if (!ar.is_null()) {
        return "'auto_response' must be a table";
    }

    return std::nullopt;
}

// ============================================================================
// TOML -> JSON
// ============================================================================

JsonValue RuleLoader::toml_to_json(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        JsonValue obj = JsonValue::object();
        for (const auto& [key, value] : *tbl) {
            obj.set(key.str(), toml_to_json(value));
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        JsonValue out = JsonValue::array();
        for (const auto& elem : *arr) {
            out.push_back(toml_to_json(elem));
        }
        return out;
    }
    if (const auto* s = node.as_string()) return JsonValue(s->get());
    if (const auto* i = node.as_integer()) return JsonValue(i->get());
    if (const auto* f = node.as_floating_point()) return JsonValue(f->get());
    if (const auto* b = node.as_boolean()) return JsonValue(b->get());
    if (const auto* dt = node.as_date_time()) {
        std::ostringstream oss;
        oss << *dt;
        return JsonValue(oss.str());
    }
    return {};
}

// ============================================================================
// Private Helpers
// ============================================================================

std::optional<ConditionOperator> RuleLoader::parse_operator(const std::string& s) {
    static const std::unordered_map<std::string, ConditionOperator> lookup = {
        {"equals",       ConditionOperator::EQUALS},
        {"contains",     ConditionOperator::CONTAINS},
        {"greater_than", ConditionOperator::GREATER_THAN},
        {"less_than",    ConditionOperator::LESS_THAN},
        {"regex",        ConditionOperator::REGEX},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<AlertChannelKind> RuleLoader::parse_channel(const std::string& s) {
    static const std::unordered_map<std::string, AlertChannelKind> lookup = {
        {"email",   AlertChannelKind::EMAIL},
        {"slack",   AlertChannelKind::SLACK},
        {"webhook", AlertChannelKind::WEBHOOK},
        {"sms",     AlertChannelKind::SMS},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<AutoResponseAction> RuleLoader::parse_action(const std::string& s) {
    static const std::unordered_map<std::string, AutoResponseAction> lookup = {
        {"block_user",        AutoResponseAction::BLOCK_USER},
        {"flag_account",      AutoResponseAction::FLAG_ACCOUNT},
        {"notify_compliance", AutoResponseAction::NOTIFY_COMPLIANCE},
        {"create_ticket",     AutoResponseAction::CREATE_TICKET},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace auditpipe
