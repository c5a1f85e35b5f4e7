#include "retention/retention_sweeper.hpp"
#include "core/utils.hpp"

#include <format>

namespace auditpipe {

RetentionSweeper::RetentionSweeper(std::shared_ptr<IAuditStore> store, Config config, EmitFn emit)
    : store_(std::move(store)),
      config_(config),
      emit_(std::move(emit)) {
    if (config_.enabled) {
        task_ = std::make_unique<PeriodicTask>("retention-sweep", config_.interval,
                                               [this] { (void)sweep_once(); });
    }
}

void RetentionSweeper::start() {
    if (!task_) {
        utils::log::info("Retention sweep disabled");
        return;
    }
    task_->start();
}

void RetentionSweeper::stop() {
    if (task_) task_->stop();
}

std::optional<uint64_t> RetentionSweeper::sweep_once() {
    uint64_t deleted = 0;
    try {
        deleted = store_->delete_expired(utils::now());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Retention sweep on {} failed: {}", store_->name(), e.what()));
        return std::nullopt;
    }

    total_deleted_.fetch_add(deleted, std::memory_order_relaxed);
    if (deleted == 0) {
        utils::log::debug("Retention sweep: nothing expired");
        return deleted;
    }

    utils::log::info(std::format("Retention sweep deleted {} expired audit records", deleted));
    if (emit_) {
        AuditEvent cleanup;
        cleanup.event_type = std::string(event_types::kLogCleanup);
        cleanup.event_category = EventCategory::SYSTEM_OPERATION;
        cleanup.description = std::format("Deleted {} audit records past their retention period", deleted);
        cleanup.severity = Severity::LOW;
        JsonValue meta = JsonValue::object();
        meta.set("deletedCount", deleted);
        cleanup.metadata = std::move(meta);
        try {
            emit_(std::move(cleanup));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Recording {} failed: {}", event_types::kLogCleanup, e.what()));
        }
    }
    return deleted;
}

} // namespace auditpipe
