#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/error.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"
#include "db/connection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "dispatch/violation_dispatcher.hpp"
#include "pipeline/audit_pipeline.hpp"
#include "reporting/report_aggregator.hpp"
#include "resilience/circuit_breaker.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <format>
#include <stdexcept>
#include <string_view>
#include <openssl/crypto.h>

namespace auditpipe {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

constexpr auto kDefaultReportWindow = std::chrono::hours(24 * 30);

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= b[i];
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

/// cpp-httplib may report "::ffff:172.18.0.4" for IPv4 peers
std::string_view strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view prefix = "::ffff:";
    if (addr.size() > prefix.size() && addr.substr(0, prefix.size()) == prefix) {
        return addr.substr(prefix.size());
    }
    return addr;
}

void send_json(httplib::Response& res, int status, const JsonValue& body) {
    res.status = status;
    res.set_content(body.dump(), http::kJsonContentType);
}

void send_error(httplib::Response& res, int status, std::string_view message) {
    auto body = JsonValue::object();
    body.set("success", false);
    body.set("error", message);
    send_json(res, status, body);
}

/// @throws ValidationError when present but not a valid ISO-8601 timestamp
std::optional<TimePoint> time_param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return std::nullopt;
    const std::string raw = req.get_param_value(name);
    if (raw.empty()) return std::nullopt;
    const auto tp = utils::parse_timestamp(raw);
    if (!tp) {
        throw ValidationError(std::format("Invalid '{}' timestamp: {}", name, raw));
    }
    return tp;
}

std::vector<std::string> list_param(const httplib::Request& req, const char* name) {
    std::vector<std::string> out;
    if (!req.has_param(name)) return out;
    for (const auto& part : utils::split(req.get_param_value(name), ',')) {
        auto item = utils::trim(part);
        if (!item.empty()) out.push_back(std::move(item));
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Construction / lifecycle
// ============================================================================

HttpServer::HttpServer(Config config, Dependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      server_(std::make_unique<httplib::Server>()) {
    if (!deps_.pipeline) {
        throw std::invalid_argument("HttpServer requires a pipeline");
    }
    if (!deps_.shutdown) {
        throw std::invalid_argument("HttpServer requires a shutdown coordinator");
    }
}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    auto& svr = *server_;

    const size_t pool_size = config_.threads;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_body_bytes);

    register_api_routes(svr);
    register_admin_routes(svr);

    utils::log::info(std::format("Starting audit pipeline server on {}:{} ({} threads)",
        config_.host, config_.port, config_.threads));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}",
            config_.host, config_.port));
    }
}

void HttpServer::stop() {
    server_->stop();
    utils::log::info("Server stopped");
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        .events_accepted = events_accepted_.load(std::memory_order_relaxed),
        .events_rejected = events_rejected_.load(std::memory_order_relaxed),
        .storage_failures = storage_failures_.load(std::memory_order_relaxed),
        .auth_rejects = auth_rejects_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_api_routes(httplib::Server& svr) {
    svr.Post("/api/v1/events", [this](const httplib::Request& req, httplib::Response& res) {
        handle_log_event(req, res);
    });
    svr.Get("/api/v1/users/:id/trail", [this](const httplib::Request& req, httplib::Response& res) {
        handle_user_trail(req, res);
    });
    svr.Get("/api/v1/reports/compliance", [this](const httplib::Request& req, httplib::Response& res) {
        handle_compliance_report(req, res);
    });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });
}

void HttpServer::register_admin_routes(httplib::Server& svr) {
    svr.Post("/admin/rules/reload", [this](const httplib::Request& req, httplib::Response& res) {
        handle_rules_reload(req, res);
    });
}

bool HttpServer::require_admin(const httplib::Request& req, httplib::Response& res) {
    if (config_.admin_token.empty()) return true;
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()),
                              config_.admin_token)) {
        auth_rejects_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::Unauthorized_401, "Unauthorized");
        return false;
    }
    return true;
}

// ============================================================================
// Handler: POST /api/v1/events
// ============================================================================

void HttpServer::handle_log_event(const httplib::Request& req, httplib::Response& res) {
    ShutdownCoordinator::RequestGuard guard(*deps_.shutdown);
    if (!guard.admitted()) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, "Server shutting down");
        return;
    }

    JsonValue body;
    try {
        body = JsonValue::parse(req.body);
    } catch (const JsonValue::parse_error& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::BadRequest_400, e.what());
        return;
    }

    try {
        AuditEvent event = EventCodec::from_json(body, EventCodec::Source::CALLER);

        // Connection context when the caller did not supply it
        if (!event.ip_address && !req.remote_addr.empty()) {
            event.ip_address = std::string(strip_ipv6_mapped(req.remote_addr));
        }
        if (!event.user_agent && req.has_header("User-Agent")) {
            event.user_agent = req.get_header_value("User-Agent");
        }

        const std::string request_id = deps_.pipeline->log_event(std::move(event));
        events_accepted_.fetch_add(1, std::memory_order_relaxed);

        auto out = JsonValue::object();
        out.set("success", true);
        out.set("requestId", request_id);
        send_json(res, httplib::StatusCode::Created_201, out);

    } catch (const ValidationError& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::BadRequest_400, e.what());
    } catch (const StorageError& e) {
        storage_failures_.fetch_add(1, std::memory_order_relaxed);
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, e.what());
    } catch (const std::exception& e) {
        utils::log::error(std::format("POST /api/v1/events failed: {}", e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, e.what());
    }
}

// ============================================================================
// Handler: GET /api/v1/users/:id/trail
// ============================================================================

void HttpServer::handle_user_trail(const httplib::Request& req, httplib::Response& res) {
    ShutdownCoordinator::RequestGuard guard(*deps_.shutdown);
    if (!guard.admitted()) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, "Server shutting down");
        return;
    }

    try {
        const auto it = req.path_params.find("id");
        const std::string user_id = (it != req.path_params.end()) ? it->second : std::string{};

        TrailFilter filter;
        filter.start = time_param(req, "start");
        filter.end = time_param(req, "end");
        filter.event_types = list_param(req, "event_types");
        if (req.has_param("limit")) {
            const auto limit = utils::try_parse_int<size_t>(req.get_param_value("limit"));
            if (!limit || *limit == 0) {
                throw ValidationError("'limit' must be a positive integer");
            }
            filter.limit = *limit;
        }

        const auto events = deps_.pipeline->query_trail(user_id, filter);

        auto rows = JsonValue::array();
        for (const auto& event : events) {
            rows.push_back(EventCodec::to_json(event));
        }
        auto out = JsonValue::object();
        out.set("success", true);
        out.set("userId", user_id);
        out.set("count", events.size());
        out.set("events", std::move(rows));
        send_json(res, httplib::StatusCode::OK_200, out);

    } catch (const ValidationError& e) {
        send_error(res, httplib::StatusCode::BadRequest_400, e.what());
    } catch (const StorageError& e) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, e.what());
    } catch (const std::exception& e) {
        utils::log::error(std::format("GET trail failed: {}", e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, e.what());
    }
}

// ============================================================================
// Handler: GET /api/v1/reports/compliance
// ============================================================================

void HttpServer::handle_compliance_report(const httplib::Request& req, httplib::Response& res) {
    ShutdownCoordinator::RequestGuard guard(*deps_.shutdown);
    if (!guard.admitted()) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, "Server shutting down");
        return;
    }

    try {
        std::string type = req.has_param("type") ? req.get_param_value("type") : "";
        if (type.empty()) type = "compliance";

        const TimePoint end = time_param(req, "end").value_or(utils::now());
        const TimePoint start = time_param(req, "start").value_or(end - kDefaultReportWindow);

        const auto summary = deps_.pipeline->report(type, start, end);
        send_json(res, httplib::StatusCode::OK_200, ReportAggregator::to_json(summary));

    } catch (const ValidationError& e) {
        send_error(res, httplib::StatusCode::BadRequest_400, e.what());
    } catch (const std::invalid_argument& e) {
        send_error(res, httplib::StatusCode::BadRequest_400, e.what());
    } catch (const StorageError& e) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, e.what());
    } catch (const std::exception& e) {
        utils::log::error(std::format("GET compliance report failed: {}", e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, e.what());
    }
}

// ============================================================================
// Handler: POST /admin/rules/reload
// ============================================================================

void HttpServer::handle_rules_reload(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    if (!deps_.pipeline->reload_rules()) {
        send_error(res, httplib::StatusCode::InternalServerError_500,
                   "Rule reload failed; previous rules remain active");
        return;
    }

    const size_t loaded = deps_.pipeline->rule_engine().rule_count();
    auto out = JsonValue::object();
    out.set("success", true);
    out.set("rulesLoaded", loaded);
    send_json(res, httplib::StatusCode::OK_200, out);
    utils::log::info(std::format("Compliance rules reloaded via admin endpoint: {} rules", loaded));
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    const std::string level = req.get_param_value("level");

    auto checks = JsonValue::object();
    bool all_ok = !deps_.shutdown->is_shutting_down();
    checks.set("accepting", all_ok ? "ok" : "shutting_down");
    checks.set("rules", deps_.pipeline->rule_engine().rule_count());

    if (deps_.pool) {
        const auto ps = deps_.pool->get_stats();
        const bool pool_ok = ps.idle_connections > 0 || ps.active_connections < ps.total_connections
                             || ps.total_connections == 0;
        checks.set("connection_pool", pool_ok ? "ok" : "exhausted");

        if (level == "deep") {
            bool db_reachable = false;
            try {
                auto conn = deps_.pool->acquire(std::chrono::milliseconds{2000});
                if (conn && conn->is_valid()) {
                    db_reachable = conn->get()->is_healthy("SELECT 1");
                }
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Health probe failed: {}", e.what()));
            }
            if (!db_reachable) all_ok = false;
            checks.set("database", db_reachable ? "ok" : "unreachable");
        }
    }

    // An open alert-channel breaker degrades alerting but not ingestion
    size_t open_breakers = 0;
    for (const auto& cb : deps_.breakers) {
        if (cb && cb->get_state() != CircuitState::CLOSED) ++open_breakers;
    }
    checks.set("alert_channels", open_breakers == 0 ? "ok" : "degraded");

    auto body = JsonValue::object();
    body.set("status", all_ok ? "healthy" : "unhealthy");
    body.set("service", "audit-pipeline");
    body.set("checks", std::move(checks));
    send_json(res, all_ok ? httplib::StatusCode::OK_200 : httplib::StatusCode::ServiceUnavailable_503,
              body);
}

// ============================================================================
// Handler: GET /metrics
// ============================================================================

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.set_content(build_metrics_output(), http::kPrometheusContentType);
}

std::string HttpServer::build_metrics_output() const {
    std::string output;

    const auto m = deps_.pipeline->get_metrics();
    output += std::format(
        "# HELP audit_pipeline_events_logged_total Events persisted by logEvent\n"
        "# TYPE audit_pipeline_events_logged_total counter\n"
        "audit_pipeline_events_logged_total {}\n\n"
        "# HELP audit_pipeline_compliance_violations_total Rule matches across all events\n"
        "# TYPE audit_pipeline_compliance_violations_total counter\n"
        "audit_pipeline_compliance_violations_total {}\n\n"
        "# HELP audit_pipeline_critical_events_total Persisted events with CRITICAL severity\n"
        "# TYPE audit_pipeline_critical_events_total counter\n"
        "audit_pipeline_critical_events_total {}\n\n"
        "# HELP audit_pipeline_errors_total Storage failures surfaced to callers\n"
        "# TYPE audit_pipeline_errors_total counter\n"
        "audit_pipeline_errors_total {}\n\n"
        "# HELP audit_pipeline_validation_rejections_total Events rejected before any I/O\n"
        "# TYPE audit_pipeline_validation_rejections_total counter\n"
        "audit_pipeline_validation_rejections_total {}\n\n"
        "# HELP audit_pipeline_rule_load_failures_total Failed rule reloads\n"
        "# TYPE audit_pipeline_rule_load_failures_total counter\n"
        "audit_pipeline_rule_load_failures_total {}\n\n"
        "# HELP audit_pipeline_average_log_time_ms Mean logEvent latency\n"
        "# TYPE audit_pipeline_average_log_time_ms gauge\n"
        "audit_pipeline_average_log_time_ms {:.3f}\n\n"
        "# HELP audit_pipeline_rules_loaded Active compliance rules\n"
        "# TYPE audit_pipeline_rules_loaded gauge\n"
        "audit_pipeline_rules_loaded {}\n\n"
        "# HELP audit_pipeline_uptime_seconds Seconds since the pipeline was created\n"
        "# TYPE audit_pipeline_uptime_seconds gauge\n"
        "audit_pipeline_uptime_seconds {}\n\n"
        "# HELP audit_pipeline_publish_drops_total Events dropped by full subscriber queues\n"
        "# TYPE audit_pipeline_publish_drops_total counter\n"
        "audit_pipeline_publish_drops_total {}\n\n",
        m.events_logged, m.compliance_violations, m.critical_events, m.errors,
        m.validation_rejections, m.rule_load_failures, m.average_log_time_ms,
        m.rules_loaded, m.uptime.count(), m.publish_drops);

    const auto ps = deps_.pipeline->persistence().get_stats();
    output += std::format(
        "# HELP audit_pipeline_store_writes_total Store writes by kind\n"
        "# TYPE audit_pipeline_store_writes_total counter\n"
        "audit_pipeline_store_writes_total{{kind=\"event\"}} {}\n"
        "audit_pipeline_store_writes_total{{kind=\"violation\"}} {}\n\n"
        "# HELP audit_pipeline_store_failures_total Failed store writes\n"
        "# TYPE audit_pipeline_store_failures_total counter\n"
        "audit_pipeline_store_failures_total {}\n\n",
        ps.events_stored, ps.violations_stored, ps.failures);

    if (deps_.dispatcher) {
        const auto ds = deps_.dispatcher->get_stats();
        output += std::format(
            "# HELP audit_pipeline_alerts_total Alert deliveries by outcome\n"
            "# TYPE audit_pipeline_alerts_total counter\n"
            "audit_pipeline_alerts_total{{outcome=\"sent\"}} {}\n"
            "audit_pipeline_alerts_total{{outcome=\"failed\"}} {}\n\n"
            "# HELP audit_pipeline_auto_responses_total Auto-response actions by outcome\n"
            "# TYPE audit_pipeline_auto_responses_total counter\n"
            "audit_pipeline_auto_responses_total{{outcome=\"executed\"}} {}\n"
            "audit_pipeline_auto_responses_total{{outcome=\"failed\"}} {}\n\n"
            "# HELP audit_pipeline_violation_records_total Violation records by outcome\n"
            "# TYPE audit_pipeline_violation_records_total counter\n"
            "audit_pipeline_violation_records_total{{outcome=\"stored\"}} {}\n"
            "audit_pipeline_violation_records_total{{outcome=\"failed\"}} {}\n\n",
            ds.alerts_sent, ds.alerts_failed, ds.actions_executed, ds.actions_failed,
            ds.violations_stored, ds.violations_failed);
    }

    if (!deps_.breakers.empty()) {
        output += "# HELP audit_pipeline_circuit_breaker_state Breaker state (0=closed, 1=half_open, 2=open)\n"
                  "# TYPE audit_pipeline_circuit_breaker_state gauge\n";
        for (const auto& cb : deps_.breakers) {
            if (!cb) continue;
            const auto st = cb->get_state();
            const int value = (st == CircuitState::CLOSED) ? 0 : (st == CircuitState::HALF_OPEN) ? 1 : 2;
            output += std::format("audit_pipeline_circuit_breaker_state{{channel=\"{}\"}} {}\n",
                cb->name(), value);
        }
        output += "\n# HELP audit_pipeline_circuit_breaker_rejections_total Calls rejected by an open breaker\n"
                  "# TYPE audit_pipeline_circuit_breaker_rejections_total counter\n";
        for (const auto& cb : deps_.breakers) {
            if (!cb) continue;
            output += std::format("audit_pipeline_circuit_breaker_rejections_total{{channel=\"{}\"}} {}\n",
                cb->name(), cb->get_stats().rejected_count);
        }
        output += "\n";
    }

    const auto hs = get_http_stats();
    output += std::format(
        "# HELP audit_pipeline_http_events_total API ingestion results\n"
        "# TYPE audit_pipeline_http_events_total counter\n"
        "audit_pipeline_http_events_total{{result=\"accepted\"}} {}\n"
        "audit_pipeline_http_events_total{{result=\"rejected\"}} {}\n"
        "audit_pipeline_http_events_total{{result=\"storage_failure\"}} {}\n\n"
        "# HELP audit_pipeline_auth_rejects_total Admin requests rejected\n"
        "# TYPE audit_pipeline_auth_rejects_total counter\n"
        "audit_pipeline_auth_rejects_total {}\n",
        hs.events_accepted, hs.events_rejected, hs.storage_failures, hs.auth_rejects);

    return output;
}

} // namespace auditpipe
