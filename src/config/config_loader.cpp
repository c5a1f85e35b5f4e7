#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

namespace auditpipe {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_file(const std::string& path) {
    auto tbl = toml::parse_file(path);
    expand_env_vars_recursive(tbl);
    return tbl;
}

toml::table parse_toml_string(const std::string& content) {
    auto tbl = toml::parse(content);
    expand_env_vars_recursive(tbl);
    return tbl;
}

std::vector<std::string> string_list(const toml::node_view<const toml::node>& node,
                                     std::vector<std::string> fallback) {
    const auto* arr = node.as_array();
    if (!arr) return fallback;
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            out.push_back(s->get());
        }
    }
    return out;
}

template <typename T>
T non_negative(const toml::node_view<const toml::node>& node, T fallback, std::string_view field) {
    const int64_t v = node.value_or(static_cast<int64_t>(fallback));
    if (v < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", field, v));
    }
    return static_cast<T>(v);
}

ChannelConfig extract_channel(const toml::table* alerting, std::string_view name) {
    ChannelConfig cfg;
    if (!alerting) return cfg;
    const auto* sec = (*alerting)[name].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;
    const std::string prefix = std::format("alerting.{}", name);

    cfg.enabled     = s["enabled"].value_or(cfg.enabled);
    cfg.url         = s["url"].value_or(cfg.url);
    cfg.auth_header = s["auth_header"].value_or(cfg.auth_header);
    cfg.recipients  = string_list(s["recipients"], cfg.recipients);
    cfg.timeout_ms  = non_negative<uint32_t>(s["timeout_ms"], cfg.timeout_ms, prefix + ".timeout_ms");
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* sec = root["server"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.host                = s["host"].value_or(cfg.host);
    cfg.port                = non_negative<uint16_t>(s["port"], cfg.port, "server.port");
    cfg.threads             = non_negative<size_t>(s["threads"], cfg.threads, "server.threads");
    cfg.admin_token         = s["admin_token"].value_or(cfg.admin_token);
    cfg.server_id           = s["server_id"].value_or(cfg.server_id);
    cfg.environment         = s["environment"].value_or(cfg.environment);
    cfg.shutdown_timeout_ms = non_negative<uint32_t>(s["shutdown_timeout_ms"],
                                                     cfg.shutdown_timeout_ms, "server.shutdown_timeout_ms");
    cfg.max_body_bytes      = non_negative<size_t>(s["max_body_bytes"], cfg.max_body_bytes,
                                                   "server.max_body_bytes");
    if (const int64_t port = s["port"].value_or(int64_t{cfg.port}); port > 65535) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    cfg.level = (*sec)["level"].value_or(cfg.level);
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* sec = root["storage"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    const std::string backend = utils::to_lower(s["backend"].value_or(std::string("file")));
    if (backend == "file") {
        cfg.backend = StorageBackend::FILE;
    } else if (backend == "postgresql") {
        cfg.backend = StorageBackend::POSTGRESQL;
    } else {
        throw std::runtime_error(std::format(
            "storage.backend must be 'file' or 'postgresql', got '{}'", backend));
    }

    cfg.events_file           = s["events_file"].value_or(cfg.events_file);
    cfg.violations_file       = s["violations_file"].value_or(cfg.violations_file);
    cfg.encryption_enabled    = s["encryption"].value_or(cfg.encryption_enabled);
    cfg.key_file              = s["key_file"].value_or(cfg.key_file);
    cfg.connection_string     = s["connection_string"].value_or(cfg.connection_string);
    cfg.min_connections       = non_negative<size_t>(s["min_connections"], cfg.min_connections,
                                                     "storage.min_connections");
    cfg.max_connections       = non_negative<size_t>(s["max_connections"], cfg.max_connections,
                                                     "storage.max_connections");
    cfg.connection_timeout_ms = non_negative<uint32_t>(s["connection_timeout_ms"],
                                                       cfg.connection_timeout_ms,
                                                       "storage.connection_timeout_ms");
    return cfg;
}

RulesConfig ConfigLoader::extract_rules(const toml::table& root) {
    RulesConfig cfg;
    const auto* sec = root["rules"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    const std::string source = utils::to_lower(s["source"].value_or(std::string("file")));
    if (source == "file") {
        cfg.source = RuleSource::FILE;
    } else if (source == "postgresql") {
        cfg.source = RuleSource::POSTGRESQL;
    } else {
        throw std::runtime_error(std::format(
            "rules.source must be 'file' or 'postgresql', got '{}'", source));
    }

    cfg.file = s["file"].value_or(cfg.file);
    cfg.refresh_interval_seconds = non_negative<uint32_t>(s["refresh_interval_seconds"],
                                                          cfg.refresh_interval_seconds,
                                                          "rules.refresh_interval_seconds");
    cfg.regex_max_subject_bytes = non_negative<uint32_t>(s["regex_max_subject_bytes"],
                                                         cfg.regex_max_subject_bytes,
                                                         "rules.regex_max_subject_bytes");
    return cfg;
}

PrivacyConfig ConfigLoader::extract_privacy(const toml::table& root) {
    PrivacyConfig cfg;
    const auto* sec = root["privacy"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.personal_keywords  = string_list(s["personal_keywords"], cfg.personal_keywords);
    cfg.sensitive_keywords = string_list(s["sensitive_keywords"], cfg.sensitive_keywords);
    cfg.redacted_fields    = string_list(s["redacted_fields"], cfg.redacted_fields);
    cfg.marker             = s["marker"].value_or(cfg.marker);
    return cfg;
}

AlertingConfig ConfigLoader::extract_alerting(const toml::table& root) {
    AlertingConfig cfg;
    const auto* sec = root["alerting"].as_table();
    if (!sec) return cfg;

    cfg.email   = extract_channel(sec, "email");
    cfg.slack   = extract_channel(sec, "slack");
    cfg.webhook = extract_channel(sec, "webhook");
    cfg.sms     = extract_channel(sec, "sms");

    if (const auto* cb = (*sec)["circuit_breaker"].as_table()) {
        const auto& c = *cb;
        cfg.failure_threshold  = non_negative<uint32_t>(c["failure_threshold"], cfg.failure_threshold,
                                                        "alerting.circuit_breaker.failure_threshold");
        cfg.success_threshold  = non_negative<uint32_t>(c["success_threshold"], cfg.success_threshold,
                                                        "alerting.circuit_breaker.success_threshold");
        cfg.breaker_timeout_ms = non_negative<uint32_t>(c["timeout_ms"], cfg.breaker_timeout_ms,
                                                        "alerting.circuit_breaker.timeout_ms");
    }
    return cfg;
}

ComplianceDeskConfig ConfigLoader::extract_compliance_desk(const toml::table& root) {
    ComplianceDeskConfig cfg;
    const auto* sec = root["compliance_desk"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    cfg.notify_url  = s["notify_url"].value_or(cfg.notify_url);
    cfg.ticket_url  = s["ticket_url"].value_or(cfg.ticket_url);
    cfg.auth_header = s["auth_header"].value_or(cfg.auth_header);
    cfg.timeout_ms  = non_negative<uint32_t>(s["timeout_ms"], cfg.timeout_ms, "compliance_desk.timeout_ms");
    return cfg;
}

AccountsConfig ConfigLoader::extract_accounts(const toml::table& root) {
    AccountsConfig cfg;
    const auto* sec = root["accounts"].as_table();
    if (!sec) return cfg;
    const auto& s = *sec;

    const std::string backend = utils::to_lower(s["backend"].value_or(std::string("none")));
    if (backend == "none") {
        cfg.backend = AccountBackend::NONE;
    } else if (backend == "postgresql") {
        cfg.backend = AccountBackend::POSTGRESQL;
    } else {
        throw std::runtime_error(std::format(
            "accounts.backend must be 'none' or 'postgresql', got '{}'", backend));
    }
    cfg.flag_risk_score = static_cast<int>(s["flag_risk_score"].value_or(int64_t{cfg.flag_risk_score}));
    return cfg;
}

RetentionConfig ConfigLoader::extract_retention(const toml::table& root) {
    RetentionConfig cfg;
    const auto* sec = root["retention"].as_table();
    if (!sec) return cfg;
    cfg.enabled = (*sec)["enabled"].value_or(cfg.enabled);
    cfg.interval_hours = non_negative<uint32_t>((*sec)["interval_hours"], cfg.interval_hours,
                                                "retention.interval_hours");
    return cfg;
}

MetricsConfig ConfigLoader::extract_metrics(const toml::table& root) {
    MetricsConfig cfg;
    const auto* sec = root["metrics"].as_table();
    if (!sec) return cfg;
    cfg.report_interval_seconds = non_negative<uint32_t>((*sec)["report_interval_seconds"],
                                                         cfg.report_interval_seconds,
                                                         "metrics.report_interval_seconds");
    return cfg;
}

EventsConfig ConfigLoader::extract_events(const toml::table& root) {
    EventsConfig cfg;
    const auto* sec = root["events"].as_table();
    if (!sec) return cfg;
    cfg.subscriber_capacity = non_negative<size_t>((*sec)["subscriber_capacity"],
                                                   cfg.subscriber_capacity,
                                                   "events.subscriber_capacity");
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

PipelineConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PipelineConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.storage = extract_storage(tbl);
    config.rules = extract_rules(tbl);
    config.privacy = extract_privacy(tbl);
    config.alerting = extract_alerting(tbl);
    config.compliance_desk = extract_compliance_desk(tbl);
    config.accounts = extract_accounts(tbl);
    config.retention = extract_retention(tbl);
    config.metrics = extract_metrics(tbl);
    config.events = extract_events(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PipelineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PipelineConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535, got 0");
    }
    if (config.server.threads == 0) {
        errors.push_back("server.threads must be > 0");
    }

    static constexpr std::string_view kLevels[] = {"debug", "info", "warn", "warning", "error"};
    const std::string level = utils::to_lower(config.logging.level);
    bool level_ok = false;
    for (const auto l : kLevels) level_ok = level_ok || (l == level);
    if (!level_ok) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const bool needs_db = config.storage.backend == StorageBackend::POSTGRESQL ||
                          config.rules.source == RuleSource::POSTGRESQL ||
                          config.accounts.backend == AccountBackend::POSTGRESQL;
    if (needs_db) {
        if (config.storage.connection_string.empty()) {
            errors.push_back("storage.connection_string required when a postgresql backend is selected");
        }
        if (config.storage.max_connections == 0) {
            errors.push_back("storage.max_connections must be > 0");
        }
        if (config.storage.min_connections > config.storage.max_connections) {
            errors.push_back(std::format("storage.min_connections ({}) > max_connections ({})",
                config.storage.min_connections, config.storage.max_connections));
        }
    }

    if (config.storage.backend == StorageBackend::FILE) {
        if (config.storage.events_file.empty()) {
            errors.push_back("storage.events_file must not be empty");
        }
        if (config.storage.violations_file.empty()) {
            errors.push_back("storage.violations_file must not be empty");
        }
        if (config.storage.events_file == config.storage.violations_file) {
            errors.push_back("storage.events_file and storage.violations_file must differ");
        }
    } else if (config.storage.encryption_enabled) {
        errors.push_back("storage.encryption is only supported by the file backend");
    }

    if (config.rules.source == RuleSource::FILE && config.rules.file.empty()) {
        errors.push_back("rules.file required when rules.source = 'file'");
    }

    if (config.privacy.marker.empty()) {
        errors.push_back("privacy.marker must not be empty");
    }

    const std::pair<std::string_view, const ChannelConfig*> channels[] = {
        {"email", &config.alerting.email},
        {"slack", &config.alerting.slack},
        {"webhook", &config.alerting.webhook},
        {"sms", &config.alerting.sms},
    };
    for (const auto& [name, ch] : channels) {
        if (ch->enabled && ch->url.empty()) {
            errors.push_back(std::format("alerting.{}.url required when the channel is enabled", name));
        }
        if (ch->enabled && ch->timeout_ms == 0) {
            errors.push_back(std::format("alerting.{}.timeout_ms must be > 0", name));
        }
    }
    if (config.alerting.failure_threshold == 0) {
        errors.push_back("alerting.circuit_breaker.failure_threshold must be > 0");
    }
    if (config.alerting.success_threshold == 0) {
        errors.push_back("alerting.circuit_breaker.success_threshold must be > 0");
    }
    if (config.alerting.breaker_timeout_ms == 0) {
        errors.push_back("alerting.circuit_breaker.timeout_ms must be > 0");
    }

    if (config.accounts.flag_risk_score < 0 || config.accounts.flag_risk_score > 100) {
        errors.push_back(std::format("accounts.flag_risk_score must be 0-100, got {}",
            config.accounts.flag_risk_score));
    }

    if (config.rules.regex_max_subject_bytes == 0) {
        errors.push_back("rules.regex_max_subject_bytes must be > 0");
    }

    if (config.retention.enabled && config.retention.interval_hours == 0) {
        errors.push_back("retention.interval_hours must be > 0 when retention is enabled");
    }

    const size_t cap = config.events.subscriber_capacity;
    if (cap == 0 || (cap & (cap - 1)) != 0) {
        errors.push_back(std::format("events.subscriber_capacity must be a power of 2, got {}", cap));
    }

    return errors;
}

} // namespace auditpipe
