#include "storage/file_audit_store.hpp"
#include "core/error.hpp"
#include "core/event_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <mutex>

namespace auditpipe {

namespace {

void ensure_parent_dir(const std::string& path) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw StorageError(std::format("Cannot create directory {}: {}",
            parent.string(), ec.message()));
    }
}

void open_append(std::ofstream& stream, const std::string& path) {
    ensure_parent_dir(path);
    stream.open(path, std::ios::app);
    if (!stream.is_open()) {
        throw StorageError("Failed to open audit file: " + path);
    }
}

} // anonymous namespace

FileAuditStore::FileAuditStore(const Config& config, std::shared_ptr<RecordEncryptor> encryptor)
    : config_(config), encryptor_(std::move(encryptor)) {
    open_append(events_stream_, config_.events_file);
    open_append(violations_stream_, config_.violations_file);
}

FileAuditStore::~FileAuditStore() {
    std::unique_lock lock(mutex_);
    if (events_stream_.is_open()) events_stream_.close();
    if (violations_stream_.is_open()) violations_stream_.close();
}

std::string FileAuditStore::name() const {
    return "file:" + config_.events_file;
}

// ============================================================================
// Writes
// ============================================================================

std::string FileAuditStore::seal(const std::string& plaintext) const {
    if (!encryptor_) return plaintext;
    try {
        return encryptor_->encrypt(plaintext);
    } catch (const std::runtime_error& e) {
        throw StorageError(std::format("Record encryption failed: {}", e.what()));
    }
}

void FileAuditStore::write_line(std::ofstream& stream, const std::string& path,
                                const std::string& record) {
    if (!stream.is_open()) {
        throw StorageError("Audit file is closed: " + path);
    }
    stream << record << '\n';
    stream.flush();
    if (!stream.good()) {
        stream.clear();
        throw StorageError("Write to audit file failed: " + path);
    }
}

void FileAuditStore::append(const AuditEvent& event) {
    const std::string line = seal(EventCodec::to_json(event).dump());
    std::unique_lock lock(mutex_);
    write_line(events_stream_, config_.events_file, line);
}

void FileAuditStore::append_violation(const Violation& violation) {
    const std::string line = seal(EventCodec::violation_to_json(violation).dump());
    std::unique_lock lock(mutex_);
    write_line(violations_stream_, config_.violations_file, line);
}

// ============================================================================
// Reads
// ============================================================================

std::optional<AuditEvent> FileAuditStore::decode_line(const std::string& line,
                                                      size_t line_no) const {
    try {
        const std::string plain = encryptor_ ? encryptor_->decrypt(line) : line;
        return EventCodec::from_json(JsonValue::parse(plain), EventCodec::Source::STORED);
    } catch (const std::exception& e) {
        unreadable_lines_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("{}:{}: unreadable record skipped: {}",
            config_.events_file, line_no, e.what()));
        return std::nullopt;
    }
}

template <typename Fn>
void FileAuditStore::for_each_event(Fn&& fn) const {
    std::ifstream in(config_.events_file);
    if (!in.is_open()) {
        throw StorageError("Cannot read audit file: " + config_.events_file);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        if (auto event = decode_line(line, line_no)) {
            fn(std::move(*event));
        }
    }
    if (in.bad()) {
        throw StorageError("Read error on audit file: " + config_.events_file);
    }
}

std::vector<AuditEvent> FileAuditStore::query_user_trail(const std::string& user_id,
                                                         const TrailFilter& filter) const {
    std::vector<AuditEvent> result;
    {
        std::shared_lock lock(mutex_);
        for_each_event([&](AuditEvent&& event) {
            if (matches_trail_filter(event, user_id, filter)) {
                result.push_back(std::move(event));
            }
        });
    }

    std::stable_sort(result.begin(), result.end(), [](const AuditEvent& a, const AuditEvent& b) {
        return record_time(a) > record_time(b);
    });

    const size_t limit = std::min(filter.limit, kMaxTrailRows);
    if (result.size() > limit) result.resize(limit);
    return result;
}

void FileAuditStore::scan_window(TimePoint start, TimePoint end, const Visitor& visitor) const {
    std::shared_lock lock(mutex_);
    for_each_event([&](AuditEvent&& event) {
        const auto t = record_time(event);
        if (t >= start && t <= end) visitor(event);
    });
}

// ============================================================================
// Retention
// ============================================================================

uint64_t FileAuditStore::delete_expired(TimePoint now) {
    std::unique_lock lock(mutex_);

    const std::string tmp_path = config_.events_file + ".sweep";
    std::ifstream in(config_.events_file);
    if (!in.is_open()) {
        throw StorageError("Cannot read audit file: " + config_.events_file);
    }
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
        throw StorageError("Cannot create temporary file: " + tmp_path);
    }

    uint64_t deleted = 0;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        // Unreadable lines are kept; only a decodable, expired record is removed
        const auto event = decode_line(line, line_no);
        if (event && is_expired(*event, now)) {
            ++deleted;
            continue;
        }
        out << line << '\n';
    }
    in.close();
    out.flush();
    if (!out.good()) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw StorageError("Write to temporary file failed: " + tmp_path);
    }
    out.close();

    if (deleted == 0) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return 0;
    }

    events_stream_.close();
    std::error_code ec;
    std::filesystem::rename(tmp_path, config_.events_file, ec);
    events_stream_.open(config_.events_file, std::ios::app);
    if (ec) {
        throw StorageError(std::format("Cannot replace {}: {}", config_.events_file, ec.message()));
    }
    if (!events_stream_.is_open()) {
        throw StorageError("Failed to reopen audit file: " + config_.events_file);
    }
    return deleted;
}

} // namespace auditpipe
