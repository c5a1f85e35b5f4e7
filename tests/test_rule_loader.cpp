#include <catch2/catch_test_macros.hpp>
#include "rules/file_rule_store.hpp"
#include "rules/rule_loader.hpp"

#include <algorithm>
#include <string>

using namespace auditpipe;

namespace {

const ComplianceRule* find_rule(const std::vector<ComplianceRule>& rules, const std::string& id) {
    const auto it = std::find_if(rules.begin(), rules.end(),
        [&id](const ComplianceRule& r) { return r.id == id; });
    return it != rules.end() ? &*it : nullptr;
}

} // anonymous namespace

TEST_CASE("RuleLoader: full rule from TOML", "[rule_loader]") {
    const auto result = RuleLoader::load_from_string(R"(
[[rules]]
id = "r1"
name = "HIGH_VALUE_TRANSACTION"
description = "Large transfer"
event_types = ["TRANSFER", "PAYMENT_RECEIVED"]
severity = "critical"
alert_channels = ["email", "Slack", "email"]
conditions = [
  { field = "amount", operator = "greater_than", value = 500000 },
  { field = "currency", operator = "equals", value = "MXN" },
]
auto_response = { action = "notify_compliance", parameters = { threshold = 500000 } }
)");

    REQUIRE(result.success);
    REQUIRE(result.rules.size() == 1);
    const ComplianceRule& rule = result.rules[0];
    CHECK(rule.id == "r1");
    CHECK(rule.name == "HIGH_VALUE_TRANSACTION");
    CHECK(rule.event_types.count("TRANSFER") == 1);
    CHECK(rule.event_types.count("PAYMENT_RECEIVED") == 1);
    CHECK(rule.severity == Severity::CRITICAL);
    REQUIRE(rule.alert_channels.size() == 2);
    CHECK(rule.alert_channels[0] == AlertChannelKind::EMAIL);
    CHECK(rule.alert_channels[1] == AlertChannelKind::SLACK);
    REQUIRE(rule.conditions.size() == 2);
    CHECK(rule.conditions[0].op == ConditionOperator::GREATER_THAN);
    CHECK(rule.conditions[0].value.get<int>() == 500000);
    CHECK(rule.conditions[1].value.get<std::string>() == "MXN");
    REQUIRE(rule.auto_response.has_value());
    CHECK(rule.auto_response->action == AutoResponseAction::NOTIFY_COMPLIANCE);
    CHECK(rule.auto_response->parameters["threshold"].get<int>() == 500000);
}

TEST_CASE("RuleLoader: defaults", "[rule_loader]") {
    const auto result = RuleLoader::load_from_string(R"(
[[rules]]
id = "r1"
name = "ANY_LOGIN"
event_types = ["USER_LOGIN"]
)");
    REQUIRE(result.success);
    REQUIRE(result.rules.size() == 1);
    CHECK(result.rules[0].severity == Severity::MEDIUM);
    CHECK(result.rules[0].conditions.empty());
    CHECK(result.rules[0].alert_channels.empty());
    CHECK_FALSE(result.rules[0].auto_response.has_value());
    CHECK(result.rules[0].is_active);
}

TEST_CASE("RuleLoader: inactive rules are dropped", "[rule_loader]") {
    const auto result = RuleLoader::load_from_string(R"(
[[rules]]
id = "on"
name = "ON"
event_types = ["A"]

[[rules]]
id = "off"
name = "OFF"
event_types = ["A"]
is_active = false
)");
    REQUIRE(result.success);
    REQUIRE(result.rules.size() == 1);
    CHECK(result.rules[0].id == "on");
}

TEST_CASE("RuleLoader: empty document loads no rules", "[rule_loader]") {
    const auto result = RuleLoader::load_from_string("");
    CHECK(result.success);
    CHECK(result.rules.empty());
}

TEST_CASE("RuleLoader: one bad rule fails the whole load", "[rule_loader]") {
    const std::string good = R"(
[[rules]]
id = "good"
name = "GOOD"
event_types = ["A"]
)";

    SECTION("unknown operator") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = ["A"]
conditions = [ { field = "amount", operator = "between", value = 1 } ]
)");
        CHECK_FALSE(result.success);
        CHECK(result.rules.empty());
        CHECK(result.error_message.find("BAD") != std::string::npos);
        CHECK(result.error_message.find("between") != std::string::npos);
    }

    SECTION("regex that does not compile") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = ["A"]
conditions = [ { field = "description", operator = "regex", value = "([a-z" } ]
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("regex") != std::string::npos);
    }

    SECTION("no event types") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = []
)");
        CHECK_FALSE(result.success);
    }

    SECTION("unknown channel") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = ["A"]
alert_channels = ["pager"]
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("pager") != std::string::npos);
    }

    SECTION("unknown action") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = ["A"]
auto_response = { action = "launch_missiles" }
)");
        CHECK_FALSE(result.success);
    }

    SECTION("invalid severity") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
name = "BAD"
event_types = ["A"]
severity = "URGENT"
)");
        CHECK_FALSE(result.success);
    }

    SECTION("missing name") {
        const auto result = RuleLoader::load_from_string(good + R"(
[[rules]]
id = "bad"
event_types = ["A"]
)");
        CHECK_FALSE(result.success);
    }

    SECTION("duplicate id") {
        const auto result = RuleLoader::load_from_string(good + good);
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Duplicate") != std::string::npos);
    }

    SECTION("malformed TOML") {
        const auto result = RuleLoader::load_from_string("[[rules]\nid = ");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("TOML") != std::string::npos);
    }
}

TEST_CASE("RuleLoader: JSON rows share the TOML schema", "[rule_loader]") {
    std::vector<JsonValue> rows;
    rows.push_back(JsonValue::parse(R"({
        "id": "db-1",
        "name": "DB_RULE",
        "event_types": ["KYC_VERIFICATION"],
        "conditions": [{"field": "requestData.documentType", "operator": "regex", "value": "^INE$"}],
        "severity": "LOW",
        "alert_channels": ["webhook"],
        "auto_response": {"action": "create_ticket"},
        "is_active": true
    })"));

    const auto result = RuleLoader::load_from_json(rows);
    REQUIRE(result.success);
    REQUIRE(result.rules.size() == 1);
    const auto& rule = result.rules[0];
    REQUIRE(rule.conditions.size() == 1);
    CHECK(rule.conditions[0].pattern != nullptr);
    REQUIRE(rule.auto_response.has_value());
    CHECK(rule.auto_response->action == AutoResponseAction::CREATE_TICKET);
    CHECK(rule.auto_response->parameters.is_object());
}

TEST_CASE("RuleLoader: missing file is reported, not thrown", "[rule_loader]") {
    const auto result = RuleLoader::load_from_file("/nonexistent/rules.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Cannot open") != std::string::npos);
}

TEST_CASE("FileRuleStore: shipped rule file loads", "[rule_loader]") {
    FileRuleStore store(std::string(AUDITPIPE_SOURCE_DIR) + "/config/compliance_rules.toml");
    const auto result = store.list_active_rules();
    REQUIRE(result.success);
    CHECK(result.rules.size() == 4);

    const ComplianceRule* buro = find_rule(result.rules, "buro-credit-score-request");
    REQUIRE(buro != nullptr);
    CHECK(buro->name == "BURO_CREDIT_SCORE_REQUEST");
    CHECK(buro->severity == Severity::HIGH);
    REQUIRE(buro->auto_response.has_value());
    CHECK(buro->auto_response->action == AutoResponseAction::FLAG_ACCOUNT);
    CHECK(store.name().starts_with("file:"));
}
