#include "security/local_key_manager.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace auditpipe {

namespace {
constexpr size_t kKeyLen = 32;
} // anonymous namespace

LocalKeyManager::LocalKeyManager(std::string key_file)
    : key_file_(std::move(key_file)) {
    if (!key_file_.empty()) {
        load_keys();
    } else {
        utils::log::warn("LocalKeyManager: no key file configured, keys will not survive a restart");
    }

    std::unique_lock lock(mutex_);
    if (keys_.empty()) {
        add_key_locked();
    }
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_active_key() const {
    std::shared_lock lock(mutex_);
    if (active_index_ < keys_.size()) {
        return keys_[active_index_];
    }
    return std::nullopt;
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_key(const std::string& key_id) const {
    std::shared_lock lock(mutex_);
    for (const auto& key : keys_) {
        if (key.key_id == key_id) {
            return key;
        }
    }
    return std::nullopt;
}

bool LocalKeyManager::rotate_key() {
    std::unique_lock lock(mutex_);
    add_key_locked();
    return key_file_.empty() || save_keys();
}

size_t LocalKeyManager::key_count() const {
    std::shared_lock lock(mutex_);
    return keys_.size();
}

void LocalKeyManager::add_key_locked() {
    if (active_index_ < keys_.size()) {
        keys_[active_index_].active = false;
    }

    KeyInfo key;
    key.key_id = generate_key_id();
    key.key_bytes = generate_key();
    key.active = true;
    keys_.push_back(std::move(key));
    active_index_ = keys_.size() - 1;

    if (!key_file_.empty()) {
        save_keys();
    }
}

void LocalKeyManager::load_keys() {
    std::ifstream file(key_file_);
    if (!file.is_open()) return;

    std::unique_lock lock(mutex_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto parts = utils::split(line, ':');
        if (parts.size() != 3) {
            utils::log::warn(std::format("Key file {}:{}: malformed entry skipped", key_file_, line_no));
            continue;
        }

        KeyInfo key;
        key.key_id = parts[0];
        key.key_bytes = utils::hex_to_bytes(parts[1]);
        key.active = (parts[2] == "1" || parts[2] == "true");
        if (key.key_id.empty() || key.key_bytes.size() != kKeyLen) {
            utils::log::warn(std::format("Key file {}:{}: invalid key skipped", key_file_, line_no));
            continue;
        }

        if (key.active) {
            active_index_ = keys_.size();
        }
        keys_.push_back(std::move(key));
    }
}

bool LocalKeyManager::save_keys() const {
    std::ofstream file(key_file_, std::ios::trunc);
    if (!file.is_open()) {
        utils::log::error(std::format("Cannot write key file {}", key_file_));
        return false;
    }

    file << "# Key format: key_id:hex_key:active\n";
    for (const auto& key : keys_) {
        file << key.key_id << ':'
             << utils::bytes_to_hex(key.key_bytes.data(), key.key_bytes.size())
             << ':' << (key.active ? "1" : "0") << '\n';
    }
    file.close();

    std::error_code ec;
    std::filesystem::permissions(key_file_,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot restrict permissions on {}: {}", key_file_, ec.message()));
    }
    return static_cast<bool>(file);
}

std::vector<uint8_t> LocalKeyManager::generate_key() {
    std::vector<uint8_t> key(kKeyLen);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a data key");
    }
    return key;
}

std::string LocalKeyManager::generate_key_id() {
    uint8_t raw[6];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a key id");
    }
    return "audit-key-" + utils::bytes_to_hex(raw, sizeof(raw));
}

} // namespace auditpipe
