#include <catch2/catch_test_macros.hpp>
#include "alerting/http_alert_channel.hpp"
#include "mocks/mock_alert_channel.hpp"
#include "net/http_endpoint.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <mutex>
#include <thread>

using namespace auditpipe;
using auditpipe::testing::MockAlertChannel;

namespace {

AlertPayload sample_payload() {
    AuditEvent e;
    e.request_id = "req-9";
    e.event_type = "BURO_CREDIT_CHECK";
    e.event_category = EventCategory::CREDIT_INQUIRY;
    e.description = "Credit bureau score request";
    e.user_id = "user-1";
    e.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1'772'323'200}};

    ComplianceRule rule;
    rule.id = "buro";
    rule.name = "BURO_CREDIT_SCORE_REQUEST";
    rule.severity = Severity::HIGH;
    return AlertPayload::from(e, rule);
}

} // anonymous namespace

TEST_CASE("AlertPayload: built from event and rule", "[alerting]") {
    const AlertPayload p = sample_payload();
    CHECK(p.rule_id == "buro");
    CHECK(p.severity == Severity::HIGH);
    CHECK(p.event_category == "credit_inquiry");
    CHECK(p.metadata.is_object());

    const JsonValue j = p.to_json();
    CHECK(j["ruleName"].get<std::string>() == "BURO_CREDIT_SCORE_REQUEST");
    CHECK(j["severity"].get<std::string>() == "HIGH");
    CHECK(j["userId"].get<std::string>() == "user-1");

    const std::string summary = p.summary();
    CHECK(summary.starts_with("[HIGH]"));
    CHECK(summary.find("BURO_CREDIT_SCORE_REQUEST") != std::string::npos);
    CHECK(summary.find("user-1") != std::string::npos);
}

TEST_CASE("AlertChannelRegistry: one channel per kind", "[alerting]") {
    AlertChannelRegistry registry;
    auto first = std::make_shared<MockAlertChannel>(AlertChannelKind::EMAIL);
    auto second = std::make_shared<MockAlertChannel>(AlertChannelKind::EMAIL);
    registry.add(first);
    registry.add(second);
    registry.add(nullptr);

    CHECK(registry.size() == 1);
    CHECK(registry.find(AlertChannelKind::EMAIL) == second);
    CHECK(registry.find(AlertChannelKind::SMS) == nullptr);
}

TEST_CASE("HttpEndpoint: URL parsing", "[alerting][http_endpoint]") {
    const auto a = HttpEndpoint::parse("https://hooks.slack.com/services/T/B/X");
    REQUIRE(a.has_value());
    CHECK(a->host() == "hooks.slack.com");
    CHECK(a->path() == "/services/T/B/X");
    CHECK(a->port() == 443);
    CHECK(a->use_ssl());

    const auto b = HttpEndpoint::parse("http://localhost:8025");
    REQUIRE(b.has_value());
    CHECK(b->host() == "localhost");
    CHECK(b->path() == "/");
    CHECK(b->port() == 8025);
    CHECK_FALSE(b->use_ssl());

    CHECK_FALSE(HttpEndpoint::parse("ftp://example.com").has_value());
    CHECK_FALSE(HttpEndpoint::parse("http://").has_value());
    CHECK_FALSE(HttpEndpoint::parse("http://host:99999/").has_value());
}

TEST_CASE("HttpAlertChannel: rejects a bad URL", "[alerting]") {
    HttpAlertChannel::Config cfg;
    cfg.url = "not-a-url";
    CHECK_THROWS_AS(HttpAlertChannel(AlertChannelKind::WEBHOOK, cfg, nullptr), std::invalid_argument);
}

TEST_CASE("HttpAlertChannel: body shape per kind", "[alerting]") {
    HttpAlertChannel::Config cfg;
    cfg.url = "http://127.0.0.1:9/alerts";
    cfg.recipients = {"compliance@example.com"};
    const AlertPayload payload = sample_payload();

    SECTION("slack") {
        HttpAlertChannel ch(AlertChannelKind::SLACK, cfg, nullptr);
        const auto body = JsonValue::parse(ch.build_body(payload));
        CHECK(body["text"].get<std::string>() == payload.summary());
    }
    SECTION("email") {
        HttpAlertChannel ch(AlertChannelKind::EMAIL, cfg, nullptr);
        const auto body = JsonValue::parse(ch.build_body(payload));
        CHECK(body["to"][0].get<std::string>() == "compliance@example.com");
        CHECK(body["subject"].get<std::string>().find("BURO_CREDIT_SCORE_REQUEST") != std::string::npos);
        CHECK(body["alert"]["requestId"].get<std::string>() == "req-9");
    }
    SECTION("sms is capped at 160 characters") {
        AlertPayload long_payload = payload;
        long_payload.description = std::string(300, 'x');
        HttpAlertChannel ch(AlertChannelKind::SMS, cfg, nullptr);
        const auto body = JsonValue::parse(ch.build_body(long_payload));
        CHECK(body["message"].get<std::string>().size() == 160);
    }
    SECTION("webhook sends the payload itself") {
        HttpAlertChannel ch(AlertChannelKind::WEBHOOK, cfg, nullptr);
        const auto body = JsonValue::parse(ch.build_body(payload));
        CHECK(body == payload.to_json());
    }
}

TEST_CASE("HttpAlertChannel: open breaker fails fast", "[alerting]") {
    CircuitBreaker::Config bc;
    bc.failure_threshold = 1;
    bc.timeout = std::chrono::seconds(60);
    auto breaker = std::make_shared<CircuitBreaker>("webhook", bc);
    REQUIRE(breaker->allow_request());
    breaker->record_failure();
    REQUIRE(breaker->get_state() == CircuitState::OPEN);

    HttpAlertChannel::Config cfg;
    cfg.url = "http://127.0.0.1:9/alerts";
    HttpAlertChannel ch(AlertChannelKind::WEBHOOK, cfg, breaker);

    CHECK_FALSE(ch.deliver(sample_payload()));
    CHECK(ch.failed() == 1);
    CHECK(breaker->get_stats().rejected_count == 1);
}

TEST_CASE("HttpAlertChannel: unreachable endpoint counts against the breaker", "[alerting]") {
    CircuitBreaker::Config bc;
    bc.failure_threshold = 2;
    auto breaker = std::make_shared<CircuitBreaker>("webhook", bc);

    HttpAlertChannel::Config cfg;
    cfg.url = "http://127.0.0.1:1/alerts";
    cfg.timeout = std::chrono::milliseconds(500);
    HttpAlertChannel ch(AlertChannelKind::WEBHOOK, cfg, breaker);

    CHECK_FALSE(ch.deliver(sample_payload()));
    CHECK_FALSE(ch.deliver(sample_payload()));
    CHECK(breaker->get_state() == CircuitState::OPEN);
    CHECK(ch.failed() == 2);
}

TEST_CASE("HttpAlertChannel: delivers to a live endpoint", "[alerting]") {
    httplib::Server server;
    std::mutex mu;
    std::string received_body;
    std::string received_auth;
    server.Post("/hook", [&](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard lock(mu);
        received_body = req.body;
        received_auth = req.get_header_value("Authorization");
        res.status = 204;
    });

    const int port = server.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    std::thread listener([&server] { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpAlertChannel::Config cfg;
    cfg.url = std::format("http://127.0.0.1:{}/hook", port);
    cfg.auth_header = "Bearer hook-token";
    auto breaker = std::make_shared<CircuitBreaker>("webhook");
    HttpAlertChannel ch(AlertChannelKind::WEBHOOK, cfg, breaker);

    const bool ok = ch.deliver(sample_payload());
    server.stop();
    listener.join();

    CHECK(ok);
    CHECK(ch.delivered() == 1);
    std::lock_guard lock(mu);
    CHECK(received_auth == "Bearer hook-token");
    CHECK(JsonValue::parse(received_body)["ruleId"].get<std::string>() == "buro");
}
