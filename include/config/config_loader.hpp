#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace auditpipe {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads audit_pipeline.toml
 *
 * ${VAR} in any string value is replaced by the environment variable (empty
 * when unset). Missing sections keep their defaults. Validation problems are
 * collected and reported together, each prefixed with its field name.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        PipelineConfig config;

        static LoadResult ok(PipelineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    [[nodiscard]] static std::vector<std::string> validate_config(const PipelineConfig& config);

private:
    static PipelineConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(PipelineConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static RulesConfig extract_rules(const toml::table& root);
    static PrivacyConfig extract_privacy(const toml::table& root);
    static AlertingConfig extract_alerting(const toml::table& root);
    static ComplianceDeskConfig extract_compliance_desk(const toml::table& root);
    static AccountsConfig extract_accounts(const toml::table& root);
    static RetentionConfig extract_retention(const toml::table& root);
    static MetricsConfig extract_metrics(const toml::table& root);
    static EventsConfig extract_events(const toml::table& root);
};

} // namespace auditpipe
