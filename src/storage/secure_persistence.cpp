#include "storage/secure_persistence.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <stdexcept>

namespace auditpipe {

SecurePersistence::SecurePersistence(std::shared_ptr<IAuditStore> store)
    : SecurePersistence(std::move(store), Config{}) {}

SecurePersistence::SecurePersistence(std::shared_ptr<IAuditStore> store, Config config)
    : store_(std::move(store)), config_(std::move(config)) {
    if (!store_) {
        throw std::invalid_argument("SecurePersistence requires a store");
    }
}

// ============================================================================
// Preparation
// ============================================================================

JsonValue SecurePersistence::redact(const JsonValue& data) const {
    if (!data.is_object()) return data;

    JsonValue out = data;
    for (const auto& field : config_.redacted_fields) {
        if (out[field].is_truthy()) {
            out.set(field, config_.marker);
        }
    }
    return out;
}

std::string SecurePersistence::hash_ip(const std::string& ip) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(ip.data(), ip.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw StorageError("SHA-256 digest of ipAddress failed");
    }
    std::string hex = utils::bytes_to_hex(digest, digest_len);
    if (config_.ip_hash_length < hex.size()) {
        hex.resize(config_.ip_hash_length);
    }
    return hex;
}

AuditEvent SecurePersistence::prepare(AuditEvent event) const {
    if (event.personal_data_included) {
        event.request_data = redact(event.request_data);
        event.response_data = redact(event.response_data);
    }
    if (event.ip_address && !event.ip_address->empty()) {
        event.ip_address = hash_ip(*event.ip_address);
    }
    return event;
}

// ============================================================================
// Writes
// ============================================================================

AuditEvent SecurePersistence::store(const AuditEvent& event) {
    AuditEvent prepared = prepare(event);
    prepared.recorded_at = utils::now();

    try {
        store_->append(prepared);
    } catch (const StorageError&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw StorageError(std::format("{}: append failed: {}", store_->name(), e.what()));
    }

    events_stored_.fetch_add(1, std::memory_order_relaxed);
    return prepared;
}

void SecurePersistence::store_violation(const Violation& violation) {
    try {
        store_->append_violation(violation);
    } catch (const StorageError&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw StorageError(std::format("{}: violation append failed: {}", store_->name(), e.what()));
    }
    violations_stored_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace auditpipe
