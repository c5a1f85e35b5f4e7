#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "storage/iaudit_store.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Redaction and hashing in front of the durable store
 *
 * prepare():
 * - requestData / responseData of events carrying personal data go through
 *   a shallow redaction: each configured key present with a truthy value is
 *   replaced by the marker. Applying it twice changes nothing.
 * - ipAddress is replaced by the leading hex digits of its SHA-256 digest.
 *
 * store() stamps recorded_at and appends. Any store failure surfaces as
 * StorageError.
 */
class SecurePersistence {
public:
    struct Config {
        std::vector<std::string> redacted_fields = default_redacted_fields();
        std::string marker = "***ENCRYPTED***";
        size_t ip_hash_length = 16;

        static std::vector<std::string> default_redacted_fields() {
            return {"curp", "rfc", "email", "phone", "accountNumber", "cardNumber"};
        }
    };

    explicit SecurePersistence(std::shared_ptr<IAuditStore> store);
    SecurePersistence(std::shared_ptr<IAuditStore> store, Config config);

    [[nodiscard]] AuditEvent prepare(AuditEvent event) const;

    /**
     * @return The form that was persisted
     * @throws StorageError
     */
    AuditEvent store(const AuditEvent& event);

    /**
     * @throws StorageError
     */
    void store_violation(const Violation& violation);

    [[nodiscard]] JsonValue redact(const JsonValue& data) const;
    [[nodiscard]] std::string hash_ip(const std::string& ip) const;

    [[nodiscard]] IAuditStore& backend() const { return *store_; }
    [[nodiscard]] std::shared_ptr<IAuditStore> backend_ptr() const { return store_; }

    struct Stats {
        uint64_t events_stored;
        uint64_t violations_stored;
        uint64_t failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .events_stored = events_stored_.load(std::memory_order_relaxed),
            .violations_stored = violations_stored_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
        };
    }

private:
    std::shared_ptr<IAuditStore> store_;
    Config config_;

    std::atomic<uint64_t> events_stored_{0};
    std::atomic<uint64_t> violations_stored_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace auditpipe
