#pragma once

#include "core/types.hpp"
#include "scheduler/periodic_task.hpp"
#include "storage/iaudit_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace auditpipe {

/**
 * @brief Periodic purge of expired, non-retained audit records
 *
 * Records with requiresRetention = true are never deleted. After a sweep
 * that removed at least one record an AUDIT_LOG_CLEANUP event
 * (system_operation) carrying the count is emitted. Sweep failures are
 * logged and never propagate.
 *
 * A disabled sweeper owns no background task, so its interval is not used.
 */
class RetentionSweeper {
public:
    using EmitFn = std::function<void(AuditEvent)>;

    struct Config {
        bool enabled = true;
        std::chrono::milliseconds interval{std::chrono::hours{24}};
    };

    RetentionSweeper(std::shared_ptr<IAuditStore> store, Config config, EmitFn emit);

    void start();
    void stop();

    /**
     * @return Deleted count, or std::nullopt when the sweep failed
     */
    std::optional<uint64_t> sweep_once();

    [[nodiscard]] uint64_t total_deleted() const {
        return total_deleted_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] PeriodicTask::Stats task_stats() const {
        return task_ ? task_->get_stats() : PeriodicTask::Stats{.runs = 0, .skipped = 0, .failures = 0};
    }

private:
    std::shared_ptr<IAuditStore> store_;
    Config config_;
    EmitFn emit_;
    std::unique_ptr<PeriodicTask> task_;   // null when disabled

    std::atomic<uint64_t> total_deleted_{0};
};

} // namespace auditpipe
