#pragma once

#include "enrich/data_classifier.hpp"
#include "storage/secure_persistence.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace auditpipe {

// ============================================================================
// Server / Logging
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 4;
    std::string admin_token;
    std::string server_id;              // empty = hostname
    std::string environment = "development";
    uint32_t shutdown_timeout_ms = 30000;
    size_t max_body_bytes = 1024 * 1024;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Storage / Rules / Accounts
// ============================================================================

enum class StorageBackend {
    FILE,
    POSTGRESQL
};

struct StorageConfig {
    StorageBackend backend = StorageBackend::FILE;

    // file backend
    std::string events_file = "data/audit_events.jsonl";
    std::string violations_file = "data/audit_violations.jsonl";
    bool encryption_enabled = false;
    std::string key_file;

    // postgresql (also used by the postgresql rule and account backends)
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    uint32_t connection_timeout_ms = 5000;
};

enum class RuleSource {
    FILE,
    POSTGRESQL
};

struct RulesConfig {
    RuleSource source = RuleSource::FILE;
    std::string file = "config/compliance_rules.toml";
    uint32_t refresh_interval_seconds = 300;   // 0 = admin endpoint only
    uint32_t regex_max_subject_bytes = 4096;   // longer values never match a regex condition
};

enum class AccountBackend {
    NONE,
    POSTGRESQL
};

struct AccountsConfig {
    AccountBackend backend = AccountBackend::NONE;
    int flag_risk_score = 80;
};

// ============================================================================
// Privacy
// ============================================================================

struct PrivacyConfig {
    std::vector<std::string> personal_keywords = DataClassifier::default_personal_keywords();
    std::vector<std::string> sensitive_keywords = DataClassifier::default_sensitive_keywords();
    std::vector<std::string> redacted_fields = SecurePersistence::Config::default_redacted_fields();
    std::string marker = "***ENCRYPTED***";
};

// ============================================================================
// Alerting / Compliance desk
// ============================================================================

struct ChannelConfig {
    bool enabled = false;
    std::string url;
    std::string auth_header;
    std::vector<std::string> recipients;
    uint32_t timeout_ms = 5000;
};

struct AlertingConfig {
    ChannelConfig email;
    ChannelConfig slack;
    ChannelConfig webhook;
    ChannelConfig sms;

    // [alerting.circuit_breaker], one breaker per channel
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 2;
    uint32_t breaker_timeout_ms = 30000;
};

struct ComplianceDeskConfig {
    std::string notify_url;
    std::string ticket_url;
    std::string auth_header;
    uint32_t timeout_ms = 5000;
};

// ============================================================================
// Background work
// ============================================================================

struct RetentionConfig {
    bool enabled = true;
    uint32_t interval_hours = 24;
};

struct MetricsConfig {
    uint32_t report_interval_seconds = 3600;   // 0 = no AUDIT_LOGGER_METRICS events
};

struct EventsConfig {
    size_t subscriber_capacity = 1024;          // power of 2
};

// ============================================================================
// Top-level
// ============================================================================

struct PipelineConfig {
    ServerConfig server;
    LoggingConfig logging;
    StorageConfig storage;
    RulesConfig rules;
    PrivacyConfig privacy;
    AlertingConfig alerting;
    ComplianceDeskConfig compliance_desk;
    AccountsConfig accounts;
    RetentionConfig retention;
    MetricsConfig metrics;
    EventsConfig events;
};

} // namespace auditpipe
