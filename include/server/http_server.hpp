#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace auditpipe {

class AuditPipeline;
class CircuitBreaker;
class ConnectionPool;
class ShutdownCoordinator;
class ViolationDispatcher;

/**
 * @brief HTTP front end of the audit pipeline
 *
 * Routes:
 * - POST /api/v1/events               log one event (201 / 400 / 503)
 * - GET  /api/v1/users/:id/trail      audit trail of one user
 * - GET  /api/v1/reports/compliance   window summary
 * - POST /admin/rules/reload          forced rule reload (bearer admin token)
 * - GET  /health, GET /metrics
 *
 * start() blocks in listen() until stop() is called.
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        size_t threads = 4;
        std::string admin_token;            // empty = admin routes unauthenticated
        size_t max_body_bytes = 1024 * 1024;
    };

    struct Dependencies {
        std::shared_ptr<AuditPipeline> pipeline;
        std::shared_ptr<ShutdownCoordinator> shutdown;
        std::shared_ptr<ViolationDispatcher> dispatcher;            // optional, metrics
        std::shared_ptr<ConnectionPool> pool;                       // optional, health
        std::vector<std::shared_ptr<CircuitBreaker>> breakers;      // optional, metrics
    };

    /**
     * @throws std::invalid_argument when pipeline or shutdown is missing
     */
    HttpServer(Config config, Dependencies deps);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @throws std::runtime_error if the listen socket cannot be bound
    void start();
    void stop();

    struct HttpStats {
        uint64_t events_accepted;
        uint64_t events_rejected;
        uint64_t storage_failures;
        uint64_t auth_rejects;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

    [[nodiscard]] std::string build_metrics_output() const;

private:
    void register_api_routes(httplib::Server& svr);
    void register_admin_routes(httplib::Server& svr);

    void handle_log_event(const httplib::Request& req, httplib::Response& res);
    void handle_user_trail(const httplib::Request& req, httplib::Response& res);
    void handle_compliance_report(const httplib::Request& req, httplib::Response& res);
    void handle_rules_reload(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);

    [[nodiscard]] bool require_admin(const httplib::Request& req, httplib::Response& res);

    const Config config_;
    Dependencies deps_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> events_accepted_{0};
    std::atomic<uint64_t> events_rejected_{0};
    std::atomic<uint64_t> storage_failures_{0};
    std::atomic<uint64_t> auth_rejects_{0};
};

} // namespace auditpipe
