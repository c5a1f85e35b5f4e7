#pragma once

#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace auditpipe {

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Bounded connection pool
 *
 * - max_connections enforced via counting_semaphore: each physical
 *   connection serves one statement at a time
 * - Lazy: connections created on demand up to max
 * - Connections idle longer than idle_timeout are health-checked on acquire
 * - Connections older than max_lifetime are recycled on acquire
 * - PooledConnection returns the connection on destruction
 */
class ConnectionPool {
public:
    ConnectionPool(std::string name,
                   const PoolConfig& config,
                   std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @return RAII handle, or nullptr on timeout, connect failure or shutdown
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire();
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout);

    [[nodiscard]] PoolStats get_stats() const;

    /**
     * @brief Close idle connections and refuse further acquires
     */
    void drain();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::unique_ptr<IDbConnection> create_connection();
    void return_connection(std::unique_ptr<IDbConnection> conn);
    void forget(IDbConnection* conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace auditpipe
