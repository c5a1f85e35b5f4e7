#pragma once

#include "security/ikey_manager.hpp"

#include <shared_mutex>
#include <string>
#include <vector>

namespace auditpipe {

/**
 * @brief Keys kept in a local file, one per line: key_id:hex_key:active
 *
 * Creates and persists a key when the file is missing or empty. With an
 * empty path the keys live only in memory.
 */
class LocalKeyManager : public IKeyManager {
public:
    explicit LocalKeyManager(std::string key_file = "");

    [[nodiscard]] std::optional<KeyInfo> get_active_key() const override;
    [[nodiscard]] std::optional<KeyInfo> get_key(const std::string& key_id) const override;
    bool rotate_key() override;
    [[nodiscard]] size_t key_count() const override;

private:
    void load_keys();
    bool save_keys() const;   // caller holds the lock
    void add_key_locked();

    static std::vector<uint8_t> generate_key();
    static std::string generate_key_id();

    std::string key_file_;
    mutable std::shared_mutex mutex_;
    std::vector<KeyInfo> keys_;
    size_t active_index_ = 0;
};

} // namespace auditpipe
