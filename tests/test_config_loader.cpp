#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace auditpipe;

namespace {

bool mentions(const ConfigLoader::LoadResult& result, std::string_view text) {
    return result.error_message.find(text) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.storage.backend == StorageBackend::FILE);
    CHECK(cfg.rules.source == RuleSource::FILE);
    CHECK(cfg.accounts.backend == AccountBackend::NONE);
    CHECK(cfg.accounts.flag_risk_score == 80);
    CHECK(cfg.privacy.marker == "***ENCRYPTED***");
    CHECK_FALSE(cfg.alerting.email.enabled);
    CHECK(cfg.retention.enabled);
    CHECK(cfg.events.subscriber_capacity == 1024);
    CHECK(cfg.rules.regex_max_subject_bytes == 4096);
}

TEST_CASE("ConfigLoader: sections are extracted", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
port = 9090
threads = 2
environment = "staging"

[logging]
level = "DEBUG"

[storage]
backend = "PostgreSQL"
connection_string = "host=db dbname=audit"
min_connections = 1
max_connections = 4

[rules]
source = "postgresql"
refresh_interval_seconds = 0

[privacy]
personal_keywords = ["curp"]
redacted_fields = []
marker = "[X]"

[alerting.slack]
enabled = true
url = "https://hooks.example.com/T000"
timeout_ms = 1500

[alerting.circuit_breaker]
failure_threshold = 3

[accounts]
backend = "postgresql"
flag_risk_score = 90

[retention]
enabled = false
interval_hours = 0
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.threads == 2);
    CHECK(cfg.server.environment == "staging");
    CHECK(cfg.logging.level == "DEBUG");
    CHECK(cfg.storage.backend == StorageBackend::POSTGRESQL);
    CHECK(cfg.storage.max_connections == 4);
    CHECK(cfg.rules.source == RuleSource::POSTGRESQL);
    CHECK(cfg.rules.refresh_interval_seconds == 0);
    CHECK(cfg.privacy.personal_keywords == std::vector<std::string>{"curp"});
    CHECK(cfg.privacy.redacted_fields.empty());
    CHECK(cfg.privacy.marker == "[X]");
    CHECK(cfg.alerting.slack.enabled);
    CHECK(cfg.alerting.slack.timeout_ms == 1500);
    CHECK_FALSE(cfg.alerting.email.enabled);
    CHECK(cfg.alerting.failure_threshold == 3);
    CHECK(cfg.alerting.success_threshold == 2);
    CHECK(cfg.accounts.flag_risk_score == 90);
    CHECK_FALSE(cfg.retention.enabled);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config]") {
    ::setenv("AUDITPIPE_TEST_DSN", "host=vault-db", 1);
    ::unsetenv("AUDITPIPE_TEST_UNSET");

    const auto result = ConfigLoader::load_from_string(R"(
[server]
admin_token = "${AUDITPIPE_TEST_UNSET}"

[storage]
backend = "postgresql"
connection_string = "${AUDITPIPE_TEST_DSN} dbname=audit"
)");
    ::unsetenv("AUDITPIPE_TEST_DSN");

    REQUIRE(result.success);
    CHECK(result.config.storage.connection_string == "host=vault-db dbname=audit");
    CHECK(result.config.server.admin_token.empty());
}

TEST_CASE("ConfigLoader: unclosed substitution is an error", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
admin_token = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Unclosed"));
}

TEST_CASE("ConfigLoader: shipped configuration loads", "[config]") {
    ::setenv("AUDIT_DATABASE_URL", "host=localhost dbname=audit", 1);
    ::setenv("AUDIT_MAIL_RELAY_URL", "https://mail.example.com/send", 1);
    ::setenv("AUDIT_SLACK_WEBHOOK_URL", "https://hooks.example.com/T000", 1);

    const auto result = ConfigLoader::load_from_file(AUDITPIPE_SOURCE_DIR "/config/audit_pipeline.toml");

    ::unsetenv("AUDIT_DATABASE_URL");
    ::unsetenv("AUDIT_MAIL_RELAY_URL");
    ::unsetenv("AUDIT_SLACK_WEBHOOK_URL");

    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.storage.backend == StorageBackend::POSTGRESQL);
    CHECK(cfg.storage.connection_string == "host=localhost dbname=audit");
    CHECK(cfg.alerting.email.enabled);
    CHECK(cfg.alerting.email.recipients == std::vector<std::string>{"compliance@example.com"});
    CHECK(cfg.accounts.backend == AccountBackend::POSTGRESQL);
    CHECK(cfg.rules.file == "config/compliance_rules.toml");
}

TEST_CASE("ConfigLoader: missing file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/audit_pipeline.toml");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to load config"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: port", "[config][validation]") {
    SECTION("zero") {
        const auto result = ConfigLoader::load_from_string("[server]\nport = 0\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "server.port"));
    }
    SECTION("out of range") {
        const auto result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "server.port"));
    }
    SECTION("negative") {
        const auto result = ConfigLoader::load_from_string("[server]\nport = -1\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "must not be negative"));
    }
}

TEST_CASE("ConfigValidation: unknown backends are rejected", "[config][validation]") {
    CHECK(mentions(ConfigLoader::load_from_string("[storage]\nbackend = \"mysql\"\n"), "storage.backend"));
    CHECK(mentions(ConfigLoader::load_from_string("[rules]\nsource = \"etcd\"\n"), "rules.source"));
    CHECK(mentions(ConfigLoader::load_from_string("[accounts]\nbackend = \"ldap\"\n"), "accounts.backend"));
}

TEST_CASE("ConfigValidation: postgresql needs a connection string", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[accounts]
backend = "postgresql"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "storage.connection_string"));
}

TEST_CASE("ConfigValidation: pool bounds", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[storage]
backend = "postgresql"
connection_string = "host=db"
min_connections = 10
max_connections = 2
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "min_connections"));
}

TEST_CASE("ConfigValidation: file backend paths", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[storage]
events_file = "data/audit.jsonl"
violations_file = "data/audit.jsonl"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "must differ"));
}

TEST_CASE("ConfigValidation: encryption needs the file backend", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[storage]
backend = "postgresql"
connection_string = "host=db"
encryption = true
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "storage.encryption"));
}

TEST_CASE("ConfigValidation: enabled channel needs a URL", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[alerting.webhook]
enabled = true
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "alerting.webhook.url"));
}

TEST_CASE("ConfigValidation: miscellaneous ranges", "[config][validation]") {
    CHECK(mentions(ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n"), "logging.level"));
    CHECK(mentions(ConfigLoader::load_from_string("[accounts]\nflag_risk_score = 150\n"),
                   "accounts.flag_risk_score"));
    CHECK(mentions(ConfigLoader::load_from_string("[events]\nsubscriber_capacity = 1000\n"),
                   "power of 2"));
    CHECK(mentions(ConfigLoader::load_from_string("[retention]\ninterval_hours = 0\n"),
                   "retention.interval_hours"));
    CHECK(mentions(ConfigLoader::load_from_string("[privacy]\nmarker = \"\"\n"), "privacy.marker"));
    CHECK(mentions(ConfigLoader::load_from_string("[rules]\nregex_max_subject_bytes = 0\n"),
                   "rules.regex_max_subject_bytes"));

    const auto custom = ConfigLoader::load_from_string("[rules]\nregex_max_subject_bytes = 512\n");
    REQUIRE(custom.success);
    CHECK(custom.config.rules.regex_max_subject_bytes == 512);
}

TEST_CASE("ConfigValidation: all problems are reported together", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[server]
threads = 0

[logging]
level = "loud"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.threads"));
    CHECK(mentions(result, "logging.level"));
}
