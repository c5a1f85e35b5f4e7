#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/utils.hpp"
#include "mocks/mock_account_store.hpp"
#include "mocks/mock_alert_channel.hpp"
#include "mocks/mock_audit_store.hpp"
#include "mocks/mock_rule_store.hpp"
#include "pipeline/audit_pipeline.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace auditpipe;
using namespace auditpipe::testing;

namespace {

constexpr const char* kBuroRules = R"(
[[rules]]
id = "r-buro"
name = "BURO_SCORE_AUDIT"
event_types = ["BURO_CREDIT_SCORE_REQUEST"]
severity = "high"
alert_channels = ["email"]
auto_response = { action = "flag_account" }

[[rules]]
id = "r-flagged"
name = "ACCOUNT_FLAG_FOLLOWUP"
event_types = ["ACCOUNT_FLAGGED_AUTOMATICALLY"]
severity = "medium"
auto_response = { action = "block_user" }
)";

struct Fixture {
    std::shared_ptr<MockAuditStore> store = std::make_shared<MockAuditStore>();
    std::shared_ptr<MockRuleStore> rules;
    std::shared_ptr<MockAccountStore> accounts = std::make_shared<MockAccountStore>();
    std::shared_ptr<MockAlertChannel> email = std::make_shared<MockAlertChannel>(AlertChannelKind::EMAIL);
    std::shared_ptr<EventBus> bus = std::make_shared<EventBus>(4096);
    std::unique_ptr<AuditPipeline> pipeline;

    explicit Fixture(const char* rule_toml = kBuroRules)
        : rules(std::make_shared<MockRuleStore>(RuleLoader::load_from_string(rule_toml))) {
        auto channels = std::make_shared<AlertChannelRegistry>();
        channels->add(email);
        auto persistence = std::make_shared<SecurePersistence>(store);

        AuditPipeline::Config cfg;
        cfg.enricher.server_id = "test-node";
        cfg.enricher.environment = "test";

        AuditPipeline::Components components;
        components.rule_store = rules;
        components.persistence = persistence;
        components.dispatcher = std::make_shared<ViolationDispatcher>(
            channels, accounts, nullptr, persistence);
        components.event_bus = bus;

        pipeline = std::make_unique<AuditPipeline>(std::move(cfg), std::move(components));
    }
};

// Fails the way dispatch does when no worker thread can be started
class ThreadStarvedDispatcher : public ViolationDispatcher {
public:
    using ViolationDispatcher::ViolationDispatcher;

    Outcome dispatch(const AuditEvent&, const std::vector<RulePtr>&, bool, const EmitFn&) override {
        ++calls;
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "no thread for rule dispatch");
    }

    int calls = 0;
};

AuditEvent buro_check(std::string user = "user-42") {
    AuditEvent e;
    e.event_type = "BURO_CREDIT_SCORE_REQUEST";
    e.event_category = EventCategory::CREDIT_INQUIRY;
    e.description = "Credit bureau score request";
    e.user_id = std::move(user);
    e.ip_address = "203.0.113.7";
    return e;
}

AuditEvent login(std::string user = "user-1") {
    AuditEvent e;
    e.event_type = "USER_LOGIN";
    e.event_category = EventCategory::AUTHENTICATION;
    e.description = "User login";
    e.user_id = std::move(user);
    return e;
}

} // anonymous namespace

TEST_CASE("AuditPipeline: requires persistence and dispatcher", "[pipeline]") {
    CHECK_THROWS_AS(AuditPipeline(AuditPipeline::Config{}, AuditPipeline::Components{}),
                    std::invalid_argument);
}

TEST_CASE("AuditPipeline: initialize loads rules and records itself", "[pipeline]") {
    Fixture f;
    CHECK(f.pipeline->initialize());
    CHECK(f.pipeline->rule_engine().rule_count() == 2);

    const auto init = f.store->events_of_type("AUDIT_LOGGER_INITIALIZED");
    REQUIRE(init.size() == 1);
    CHECK(init[0].event_category == EventCategory::SYSTEM_OPERATION);
    CHECK(init[0].metadata["rulesLoaded"].get<int>() == 2);
    CHECK(f.pipeline->get_metrics().events_logged == 1);
}

TEST_CASE("AuditPipeline: credit bureau check end to end", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());

    const std::string id = f.pipeline->log_event(buro_check());
    CHECK_FALSE(id.empty());

    const auto stored = f.store->events_of_type("BURO_CREDIT_SCORE_REQUEST");
    REQUIRE(stored.size() == 1);
    const AuditEvent& e = stored[0];
    CHECK(e.request_id == id);
    CHECK(e.retention_years == 6);
    CHECK(e.requires_retention == true);
    CHECK(e.server_id == "test-node");
    CHECK(e.environment == "test");
    CHECK(e.recorded_at.has_value());
    CHECK(e.compliance_flags == std::vector<std::string>{"BURO_SCORE_AUDIT"});
    CHECK(e.personal_data_included);
    CHECK(e.ip_address.value() != "203.0.113.7");

    SECTION("alert went out") {
        REQUIRE(f.email->delivered().size() == 1);
    }

    SECTION("violation recorded against the event") {
        const auto violations = f.store->violations();
        const auto it = std::find_if(violations.begin(), violations.end(), [](const Violation& v) {
            return v.rule_name == "BURO_SCORE_AUDIT";
        });
        REQUIRE(it != violations.end());
        CHECK(it->event_id == id);
        CHECK(it->severity == Severity::HIGH);
        // The derived event tripped the follow-up rule
        CHECK(violations.size() == 2);
    }

    SECTION("account flagged and derived event stored first") {
        CHECK(f.accounts->get("user-42").risk_score >= 80);

        const auto all = f.store->events();
        const auto derived_it = std::find_if(all.begin(), all.end(), [](const AuditEvent& x) {
            return x.event_type == "ACCOUNT_FLAGGED_AUTOMATICALLY";
        });
        const auto trigger_it = std::find_if(all.begin(), all.end(), [&id](const AuditEvent& x) {
            return x.request_id == id;
        });
        REQUIRE(derived_it != all.end());
        REQUIRE(trigger_it != all.end());
        CHECK(derived_it < trigger_it);
        CHECK(derived_it->metadata["triggeringRequestId"].get<std::string>() == id);
        CHECK(derived_it->metadata["ruleName"].get<std::string>() == "BURO_SCORE_AUDIT");
    }

    SECTION("auto-responses do not cascade from derived events") {
        const auto derived = f.store->events_of_type("ACCOUNT_FLAGGED_AUTOMATICALLY");
        REQUIRE(derived.size() == 1);
        // The follow-up rule still matches and flags the derived event
        CHECK(derived[0].compliance_flags == std::vector<std::string>{"ACCOUNT_FLAG_FOLLOWUP"});
        CHECK(f.accounts->status_calls() == 0);
        CHECK(f.accounts->get("user-42").status == AccountStatus::ACTIVE);
        CHECK(f.store->events_of_type("USER_BLOCKED_AUTOMATICALLY").empty());
    }

    SECTION("metrics") {
        const auto m = f.pipeline->get_metrics();
        CHECK(m.events_logged == 3);
        CHECK(m.compliance_violations == 2);
        CHECK(m.errors == 0);
    }
}

TEST_CASE("AuditPipeline: a failing alert channel does not fail the event", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    f.email->set_mode(MockAlertChannel::Mode::THROW);

    const std::string id = f.pipeline->log_event(buro_check());
    const auto stored = f.store->events_of_type("BURO_CREDIT_SCORE_REQUEST");
    REQUIRE(stored.size() == 1);
    CHECK(stored[0].request_id == id);
    CHECK(stored[0].compliance_flags == std::vector<std::string>{"BURO_SCORE_AUDIT"});
    CHECK(f.email->attempts() == 1);
}

TEST_CASE("AuditPipeline: a failing dispatch still persists the event", "[pipeline]") {
    auto store = std::make_shared<MockAuditStore>();
    auto persistence = std::make_shared<SecurePersistence>(store);
    auto dispatcher = std::make_shared<ThreadStarvedDispatcher>(
        std::make_shared<AlertChannelRegistry>(), nullptr, nullptr, persistence);

    AuditPipeline::Components components;
    components.rule_store = std::make_shared<MockRuleStore>(RuleLoader::load_from_string(kBuroRules));
    components.persistence = persistence;
    components.dispatcher = dispatcher;
    AuditPipeline pipeline(AuditPipeline::Config{}, std::move(components));
    REQUIRE(pipeline.initialize());

    std::string id;
    REQUIRE_NOTHROW(id = pipeline.log_event(buro_check()));
    CHECK(dispatcher->calls == 1);

    const auto stored = store->events_of_type("BURO_CREDIT_SCORE_REQUEST");
    REQUIRE(stored.size() == 1);
    CHECK(stored[0].request_id == id);
    CHECK(stored[0].compliance_flags == std::vector<std::string>{"BURO_SCORE_AUDIT"});
    CHECK(pipeline.get_metrics().errors == 1);
    CHECK(pipeline.get_metrics().compliance_violations == 1);
}

TEST_CASE("AuditPipeline: events without matching rules carry no flags", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());

    (void)f.pipeline->log_event(login());
    const auto stored = f.store->events_of_type("USER_LOGIN");
    REQUIRE(stored.size() == 1);
    CHECK(stored[0].compliance_flags.empty());
    CHECK(stored[0].retention_years == 3);
    CHECK(f.store->violations().empty());
    CHECK(f.email->attempts() == 0);
}

TEST_CASE("AuditPipeline: caller-supplied flags are replaced", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());

    AuditEvent e = buro_check();
    e.compliance_flags = {"FORGED", "BURO_SCORE_AUDIT"};
    (void)f.pipeline->log_event(std::move(e));

    const auto stored = f.store->events_of_type("BURO_CREDIT_SCORE_REQUEST");
    REQUIRE(stored.size() == 1);
    CHECK(stored[0].compliance_flags == std::vector<std::string>{"BURO_SCORE_AUDIT"});
}

TEST_CASE("AuditPipeline: invalid events are rejected before any I/O", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    const auto before = f.store->append_attempts();

    AuditEvent e = login();
    e.description.clear();
    CHECK_THROWS_AS(f.pipeline->log_event(std::move(e)), ValidationError);

    CHECK(f.store->append_attempts() == before);
    CHECK(f.store->events_of_type("AUDIT_LOGGING_ERROR").empty());
    CHECK(f.pipeline->get_metrics().validation_rejections == 1);
}

TEST_CASE("AuditPipeline: storage failure is recorded once and rethrown", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    const auto before = f.store->append_attempts();
    const auto logged_before = f.pipeline->get_metrics().events_logged;

    f.store->set_fail_appends(true);
    CHECK_THROWS_AS(f.pipeline->log_event(login()), StorageError);

    // The event itself, then one AUDIT_LOGGING_ERROR attempt; no recursion
    CHECK(f.store->append_attempts() - before == 2);
    CHECK(f.pipeline->get_metrics().events_logged == logged_before);
    CHECK(f.pipeline->get_metrics().errors >= 1);

    f.store->set_fail_appends(false);
    CHECK_NOTHROW(f.pipeline->log_event(login()));
}

TEST_CASE("AuditPipeline: rule-load failure keeps the cached rules", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    REQUIRE(f.pipeline->rule_engine().rule_count() == 2);

    f.rules->set_result(RuleLoader::LoadResult::error("rules table unavailable"));
    CHECK_FALSE(f.pipeline->reload_rules());
    CHECK(f.pipeline->rule_engine().rule_count() == 2);
    CHECK(f.pipeline->get_metrics().rule_load_failures == 1);

    const auto failures = f.store->events_of_type("COMPLIANCE_RULES_LOAD_FAILED");
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].severity == Severity::LOW);
    CHECK(failures[0].error.value_or("").find("rules table unavailable") != std::string::npos);

    // Cached rules still apply
    (void)f.pipeline->log_event(buro_check());
    const auto stored = f.store->events_of_type("BURO_CREDIT_SCORE_REQUEST");
    REQUIRE(stored.size() == 1);
    CHECK(stored[0].compliance_flags == std::vector<std::string>{"BURO_SCORE_AUDIT"});
}

TEST_CASE("AuditPipeline: initial rule-load failure leaves the pipeline usable", "[pipeline]") {
    Fixture f;
    f.rules->set_result(RuleLoader::LoadResult::error("no rules yet"));
    CHECK_FALSE(f.pipeline->initialize());
    CHECK(f.pipeline->rule_engine().rule_count() == 0);
    CHECK_NOTHROW(f.pipeline->log_event(buro_check()));
}

TEST_CASE("AuditPipeline: reload swaps in the new rule set", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());

    f.rules->set_result(RuleLoader::load_from_string(R"(
[[rules]]
id = "r-login"
name = "LOGIN_WATCH"
event_types = ["USER_LOGIN"]
)"));
    REQUIRE(f.pipeline->reload_rules());
    CHECK(f.pipeline->rule_engine().rule_count() == 1);

    (void)f.pipeline->log_event(login());
    (void)f.pipeline->log_event(buro_check());
    CHECK(f.store->events_of_type("USER_LOGIN")[0].compliance_flags ==
          std::vector<std::string>{"LOGIN_WATCH"});
    CHECK(f.store->events_of_type("BURO_CREDIT_SCORE_REQUEST")[0].compliance_flags.empty());
}

TEST_CASE("AuditPipeline: concurrent events persist exactly once", "[pipeline][concurrency]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());

    constexpr int kThreads = 8;
    constexpr int kPerThread = 125;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&f, t] {
            for (int i = 0; i < kPerThread; ++i) {
                (void)f.pipeline->log_event(login("user-" + std::to_string(t)));
            }
        });
    }
    for (auto& t : threads) t.join();

    const auto logins = f.store->events_of_type("USER_LOGIN");
    REQUIRE(logins.size() == kThreads * kPerThread);

    std::set<std::string> ids;
    for (const auto& e : logins) ids.insert(e.request_id);
    CHECK(ids.size() == logins.size());
    CHECK(f.pipeline->get_metrics().events_logged == kThreads * kPerThread + 1);
}

TEST_CASE("AuditPipeline: persisted events are published", "[pipeline]") {
    Fixture f;
    auto sub = f.bus->subscribe("tail");
    REQUIRE(f.pipeline->initialize());

    const std::string id = f.pipeline->log_event(login());
    const auto events = sub->poll();
    REQUIRE(events.size() == 2);
    CHECK(events[0]->event_type == "AUDIT_LOGGER_INITIALIZED");
    CHECK(events[1]->request_id == id);
    CHECK(events[1]->recorded_at.has_value());
}

TEST_CASE("AuditPipeline: nothing is published when storage fails", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    auto sub = f.bus->subscribe("tail");

    f.store->set_fail_appends(true);
    CHECK_THROWS_AS(f.pipeline->log_event(login()), StorageError);
    CHECK(sub->poll().empty());
}

TEST_CASE("AuditPipeline: user trail queries", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    (void)f.pipeline->log_event(login("alice"));
    (void)f.pipeline->log_event(login("alice"));
    (void)f.pipeline->log_event(login("bob"));

    CHECK(f.pipeline->query_trail("alice", TrailFilter{}).size() == 2);
    CHECK(f.pipeline->query_trail("bob", TrailFilter{}).size() == 1);
    CHECK_THROWS_AS(f.pipeline->query_trail("", TrailFilter{}), ValidationError);

    TrailFilter inverted;
    inverted.start = utils::now();
    inverted.end = *inverted.start - std::chrono::hours{1};
    CHECK_THROWS_AS(f.pipeline->query_trail("alice", inverted), ValidationError);
}

TEST_CASE("AuditPipeline: report over the store", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    (void)f.pipeline->log_event(login());
    (void)f.pipeline->log_event(buro_check());

    const auto now = utils::now();
    const auto summary = f.pipeline->report("daily", now - std::chrono::hours{1}, now + std::chrono::hours{1});
    // initialized + login + flagged + bureau check
    CHECK(summary.total_events == 4);
    CHECK(summary.violations == 2);

    CHECK_THROWS_AS(f.pipeline->report("bad", now, now - std::chrono::hours{1}), std::invalid_argument);
}

TEST_CASE("AuditPipeline: metrics snapshot is itself an audit event", "[pipeline]") {
    Fixture f;
    REQUIRE(f.pipeline->initialize());
    (void)f.pipeline->log_event(login());

    f.pipeline->log_metrics_snapshot();
    const auto snapshots = f.store->events_of_type("AUDIT_LOGGER_METRICS");
    REQUIRE(snapshots.size() == 1);
    CHECK(snapshots[0].event_category == EventCategory::PERFORMANCE);
    CHECK(snapshots[0].metadata["eventsLogged"].get<int>() == 2);
    CHECK(snapshots[0].metadata["rulesLoaded"].get<int>() == 2);
}
