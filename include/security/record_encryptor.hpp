#pragma once

#include "security/ikey_manager.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace auditpipe {

/**
 * @brief Encrypts stored audit records at rest using AES-256-GCM
 *
 * Each record is independently encrypted with a random IV.
 * Format: AENC:v1:<key_id>:<base64(iv + ciphertext + tag)>
 *
 * encrypt() never falls back to plaintext: any failure throws
 * std::runtime_error. decrypt() passes unprefixed input through unchanged
 * and throws on an unknown key or a failed authentication tag.
 */
class RecordEncryptor {
public:
    explicit RecordEncryptor(std::shared_ptr<IKeyManager> key_manager);

    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;
    [[nodiscard]] std::string decrypt(std::string_view record) const;

    [[nodiscard]] static bool is_encrypted(std::string_view record);

    struct Stats {
        uint64_t records_encrypted;
        uint64_t records_decrypted;
        uint64_t failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .records_encrypted = records_encrypted_.load(std::memory_order_relaxed),
            .records_decrypted = records_decrypted_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
        };
    }

private:
    [[noreturn]] void fail(const std::string& message) const;

    std::shared_ptr<IKeyManager> key_manager_;
    mutable std::atomic<uint64_t> records_encrypted_{0};
    mutable std::atomic<uint64_t> records_decrypted_{0};
    mutable std::atomic<uint64_t> failures_{0};
};

} // namespace auditpipe
