#pragma once

#include "storage/iaudit_store.hpp"
#include "security/record_encryptor.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace auditpipe {

/**
 * @brief Append-only JSONL audit store
 *
 * Events and violations go to separate files, one wire-form record per line.
 * With an encryptor every line is sealed with AES-256-GCM and reads decrypt
 * transparently; plaintext lines written before encryption was enabled stay
 * readable.
 *
 * Appends take the lock exclusively and are flushed before returning.
 * Reads scan the file under a shared lock. delete_expired() rewrites the
 * events file through a temporary file and an atomic rename.
 */
class FileAuditStore : public IAuditStore {
public:
    struct Config {
        std::string events_file = "audit_events.jsonl";
        std::string violations_file = "audit_violations.jsonl";
    };

    explicit FileAuditStore(const Config& config,
                            std::shared_ptr<RecordEncryptor> encryptor = nullptr);
    ~FileAuditStore() override;

    void append(const AuditEvent& event) override;
    void append_violation(const Violation& violation) override;

    [[nodiscard]] std::vector<AuditEvent> query_user_trail(
        const std::string& user_id, const TrailFilter& filter) const override;
    void scan_window(TimePoint start, TimePoint end, const Visitor& visitor) const override;
    uint64_t delete_expired(TimePoint now) override;

    [[nodiscard]] std::string name() const override;

    /// Lines that could not be decoded during reads (skipped)
    [[nodiscard]] uint64_t unreadable_lines() const {
        return unreadable_lines_.load(std::memory_order_relaxed);
    }

private:
    void write_line(std::ofstream& stream, const std::string& path, const std::string& record);
    std::string seal(const std::string& plaintext) const;

    // Calls fn for each decodable event line; caller holds the lock
    template <typename Fn>
    void for_each_event(Fn&& fn) const;

    [[nodiscard]] std::optional<AuditEvent> decode_line(const std::string& line,
                                                        size_t line_no) const;

    Config config_;
    std::shared_ptr<RecordEncryptor> encryptor_;

    mutable std::shared_mutex mutex_;
    std::ofstream events_stream_;
    std::ofstream violations_stream_;

    mutable std::atomic<uint64_t> unreadable_lines_{0};
};

} // namespace auditpipe
