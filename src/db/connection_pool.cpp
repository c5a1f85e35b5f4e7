#include "db/connection_pool.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

ConnectionPool::ConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm with min_connections
    for (size_t i = 0; i < config_.min_connections && i < config_.max_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            const auto now = std::chrono::steady_clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, name_));
        }
    }

    utils::log::info(std::format("ConnectionPool '{}' initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire() {
    return acquire(config_.connection_timeout);
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have been set while waiting on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) birth = it->second;
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) last_used = it->second;
        }
    }

    const auto now = std::chrono::steady_clock::now();
    bool replace = false;
    if (conn && config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    } else if (conn && now - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    }

    if (replace) {
        forget(conn.get());
        conn->close();
        conn.reset();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };
    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats ConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void ConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::info(std::format("ConnectionPool '{}' drained", name_));
}

std::unique_ptr<IDbConnection> ConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void ConnectionPool::forget(IDbConnection* conn) {
    std::lock_guard lock(mutex_);
    created_at_.erase(conn);
    last_used_.erase(conn);
}

void ConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        forget(conn.get());
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }
    semaphore_.release();
}

} // namespace auditpipe
