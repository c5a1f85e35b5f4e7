#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "alerting/alert_channel.hpp"
#include "alerting/http_alert_channel.hpp"
#include "db/connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "dispatch/http_compliance_desk.hpp"
#include "dispatch/pg_account_store.hpp"
#include "dispatch/violation_dispatcher.hpp"
#include "pipeline/audit_pipeline.hpp"
#include "pipeline/event_bus.hpp"
#include "resilience/circuit_breaker.hpp"
#include "retention/retention_sweeper.hpp"
#include "rules/file_rule_store.hpp"
#include "rules/pg_rule_store.hpp"
#include "scheduler/periodic_task.hpp"
#include "security/local_key_manager.hpp"
#include "security/record_encryptor.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "storage/file_audit_store.hpp"
#include "storage/pg_audit_store.hpp"
#include "storage/secure_persistence.hpp"

#include <unistd.h>

#include <csignal>
#include <format>
#include <memory>

using namespace auditpipe;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop admitting API requests, then let in-flight ones finish
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
        if (g_shutdown->wait_for_drain()) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }
}

namespace {

std::string resolve_server_id(const std::string& configured) {
    if (!configured.empty()) return configured;
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
        return buf;
    }
    return "audit-pipeline";
}

void add_alert_channel(AlertChannelRegistry& registry,
                       std::vector<std::shared_ptr<CircuitBreaker>>& breakers,
                       AlertChannelKind kind, const ChannelConfig& cfg,
                       const AlertingConfig& alerting) {
    if (!cfg.enabled) return;

    CircuitBreaker::Config cb_cfg;
    cb_cfg.failure_threshold = alerting.failure_threshold;
    cb_cfg.success_threshold = alerting.success_threshold;
    cb_cfg.timeout = std::chrono::milliseconds{alerting.breaker_timeout_ms};
    auto breaker = std::make_shared<CircuitBreaker>(
        std::string(alert_channel_to_string(kind)), cb_cfg);

    HttpAlertChannel::Config ch_cfg;
    ch_cfg.url = cfg.url;
    ch_cfg.auth_header = cfg.auth_header;
    ch_cfg.recipients = cfg.recipients;
    ch_cfg.timeout = std::chrono::milliseconds{cfg.timeout_ms};

    registry.add(std::make_shared<HttpAlertChannel>(kind, ch_cfg, breaker));
    breakers.push_back(std::move(breaker));
    utils::log::info(std::format("Alert channel '{}' -> {}", alert_channel_to_string(kind), cfg.url));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Audit pipeline starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/audit_pipeline.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/7] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const PipelineConfig& cfg = config_result.config;

        if (!utils::log::set_level(cfg.logging.level)) {
            utils::log::warn(std::format("Unknown log level '{}', keeping 'info'", cfg.logging.level));
        }

        // =====================================================================
        // [2/7] Database pool (shared by every postgresql backend)
        // =====================================================================
        std::shared_ptr<ConnectionPool> pool;
        const bool needs_db = cfg.storage.backend == StorageBackend::POSTGRESQL ||
                              cfg.rules.source == RuleSource::POSTGRESQL ||
                              cfg.accounts.backend == AccountBackend::POSTGRESQL;
        if (needs_db) {
            PoolConfig pool_cfg;
            pool_cfg.connection_string = cfg.storage.connection_string;
            pool_cfg.min_connections = cfg.storage.min_connections;
            pool_cfg.max_connections = cfg.storage.max_connections;
            pool_cfg.connection_timeout = std::chrono::milliseconds{cfg.storage.connection_timeout_ms};
            pool = std::make_shared<ConnectionPool>("audit", pool_cfg,
                                                    std::make_shared<PgConnectionFactory>());
            utils::log::info(std::format("[2/7] PostgreSQL pool: {}-{} connections",
                pool_cfg.min_connections, pool_cfg.max_connections));
        } else {
            utils::log::info("[2/7] PostgreSQL pool: not needed");
        }

        // =====================================================================
        // [3/7] Audit store + secure persistence
        // =====================================================================
        std::shared_ptr<IAuditStore> store;
        if (cfg.storage.backend == StorageBackend::POSTGRESQL) {
            store = std::make_shared<PgAuditStore>(pool);
        } else {
            std::shared_ptr<RecordEncryptor> encryptor;
            if (cfg.storage.encryption_enabled) {
                encryptor = std::make_shared<RecordEncryptor>(
                    std::make_shared<LocalKeyManager>(cfg.storage.key_file));
            }
            FileAuditStore::Config file_cfg;
            file_cfg.events_file = cfg.storage.events_file;
            file_cfg.violations_file = cfg.storage.violations_file;
            store = std::make_shared<FileAuditStore>(file_cfg, encryptor);
        }
        utils::log::info(std::format("[3/7] Audit store: {}", store->name()));

        SecurePersistence::Config persistence_cfg;
        persistence_cfg.redacted_fields = cfg.privacy.redacted_fields;
        persistence_cfg.marker = cfg.privacy.marker;
        auto persistence = std::make_shared<SecurePersistence>(store, persistence_cfg);

        // =====================================================================
        // [4/7] Rule store, alert channels, compliance desk, accounts
        // =====================================================================
        std::shared_ptr<IRuleStore> rule_store;
        if (cfg.rules.source == RuleSource::POSTGRESQL) {
            rule_store = std::make_shared<PgRuleStore>(pool);
        } else {
            rule_store = std::make_shared<FileRuleStore>(cfg.rules.file);
        }

        auto channels = std::make_shared<AlertChannelRegistry>();
        std::vector<std::shared_ptr<CircuitBreaker>> breakers;
        add_alert_channel(*channels, breakers, AlertChannelKind::EMAIL, cfg.alerting.email, cfg.alerting);
        add_alert_channel(*channels, breakers, AlertChannelKind::SLACK, cfg.alerting.slack, cfg.alerting);
        add_alert_channel(*channels, breakers, AlertChannelKind::WEBHOOK, cfg.alerting.webhook, cfg.alerting);
        add_alert_channel(*channels, breakers, AlertChannelKind::SMS, cfg.alerting.sms, cfg.alerting);

        std::shared_ptr<IComplianceDesk> desk;
        if (!cfg.compliance_desk.notify_url.empty() || !cfg.compliance_desk.ticket_url.empty()) {
            HttpComplianceDesk::Config desk_cfg;
            desk_cfg.notify_url = cfg.compliance_desk.notify_url;
            desk_cfg.ticket_url = cfg.compliance_desk.ticket_url;
            desk_cfg.auth_header = cfg.compliance_desk.auth_header;
            desk_cfg.timeout = std::chrono::milliseconds{cfg.compliance_desk.timeout_ms};
            desk = std::make_shared<HttpComplianceDesk>(desk_cfg);
        }

        std::shared_ptr<IAccountStore> accounts;
        if (cfg.accounts.backend == AccountBackend::POSTGRESQL) {
            accounts = std::make_shared<PgAccountStore>(pool);
        }

        ViolationDispatcher::Config dispatch_cfg;
        dispatch_cfg.flag_risk_score_floor = cfg.accounts.flag_risk_score;
        auto dispatcher = std::make_shared<ViolationDispatcher>(
            channels, accounts, desk, persistence, dispatch_cfg);

        utils::log::info(std::format("[4/7] Rules: {}, channels: {}, desk: {}, accounts: {}",
            rule_store->name(), channels->size(), desk ? "http" : "log-only",
            accounts ? accounts->name() : "none"));

        // =====================================================================
        // [5/7] Pipeline
        // =====================================================================
        AuditPipeline::Config pipeline_cfg;
        pipeline_cfg.enricher.server_id = resolve_server_id(cfg.server.server_id);
        pipeline_cfg.enricher.environment = cfg.server.environment;
        pipeline_cfg.regex_max_subject_bytes = cfg.rules.regex_max_subject_bytes;
        pipeline_cfg.enricher.classifier.personal_keywords = cfg.privacy.personal_keywords;
        pipeline_cfg.enricher.classifier.sensitive_keywords = cfg.privacy.sensitive_keywords;

        AuditPipeline::Components components;
        components.rule_store = rule_store;
        components.persistence = persistence;
        components.dispatcher = dispatcher;
        components.event_bus = std::make_shared<EventBus>(cfg.events.subscriber_capacity);

        auto pipeline = std::make_shared<AuditPipeline>(pipeline_cfg, components);
        if (!pipeline->initialize()) {
            utils::log::warn("[5/7] Pipeline started without compliance rules");
        } else {
            utils::log::info(std::format("[5/7] Pipeline ready: {} rules",
                pipeline->rule_engine().rule_count()));
        }

        // =====================================================================
        // [6/7] Background tasks
        // =====================================================================
        std::unique_ptr<PeriodicTask> rule_refresh;
        if (cfg.rules.refresh_interval_seconds > 0) {
            rule_refresh = std::make_unique<PeriodicTask>("rule-refresh",
                std::chrono::seconds{cfg.rules.refresh_interval_seconds},
                [pipeline] { (void)pipeline->reload_rules(); });
            rule_refresh->start();
        }

        std::unique_ptr<PeriodicTask> metrics_report;
        if (cfg.metrics.report_interval_seconds > 0) {
            metrics_report = std::make_unique<PeriodicTask>("metrics-report",
                std::chrono::seconds{cfg.metrics.report_interval_seconds},
                [pipeline] { pipeline->log_metrics_snapshot(); });
            metrics_report->start();
        }

        RetentionSweeper::Config sweeper_cfg;
        sweeper_cfg.enabled = cfg.retention.enabled;
        sweeper_cfg.interval = std::chrono::hours{cfg.retention.interval_hours};
        RetentionSweeper sweeper(store, sweeper_cfg,
            [pipeline](AuditEvent event) { pipeline->log_internal(std::move(event)); });
        sweeper.start();

        utils::log::info(std::format("[6/7] Background tasks: rule refresh {}s, metrics {}s, retention {}",
            cfg.rules.refresh_interval_seconds, cfg.metrics.report_interval_seconds,
            cfg.retention.enabled ? std::format("every {}h", cfg.retention.interval_hours) : "disabled"));

        // =====================================================================
        // [7/7] HTTP server
        // =====================================================================
        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds{cfg.server.shutdown_timeout_ms};
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        HttpServer::Config server_cfg;
        server_cfg.host = cfg.server.host;
        server_cfg.port = cfg.server.port;
        server_cfg.threads = cfg.server.threads;
        server_cfg.admin_token = cfg.server.admin_token;
        server_cfg.max_body_bytes = cfg.server.max_body_bytes;

        HttpServer::Dependencies deps;
        deps.pipeline = pipeline;
        deps.shutdown = g_shutdown;
        deps.dispatcher = dispatcher;
        deps.pool = pool;
        deps.breakers = breakers;
        g_server = std::make_shared<HttpServer>(server_cfg, std::move(deps));

        utils::log::info(std::format("[7/7] Server ready on http://{}:{}", server_cfg.host, server_cfg.port));

        // Blocks until signal_handler stops the server
        g_server->start();

        if (rule_refresh) rule_refresh->stop();
        if (metrics_report) metrics_report->stop();
        sweeper.stop();
        if (pool) pool->drain();

        const auto m = pipeline->get_metrics();
        utils::log::info(std::format("Audit pipeline stopped: {} events logged, {} violations, {} errors",
            m.events_logged, m.compliance_violations, m.errors));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
