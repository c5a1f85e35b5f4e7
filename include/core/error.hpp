#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace auditpipe {

/**
 * @brief Error categories for the pipeline
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    RULE_LOAD_ERROR,
    CHANNEL_DELIVERY_ERROR,
    AUTO_RESPONSE_ERROR,
    STORAGE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::VALIDATION_ERROR:       return "validation_error";
        case ErrorCategory::RULE_LOAD_ERROR:        return "rule_load_error";
        case ErrorCategory::CHANNEL_DELIVERY_ERROR: return "channel_delivery_error";
        case ErrorCategory::AUTO_RESPONSE_ERROR:    return "auto_response_error";
        case ErrorCategory::STORAGE_ERROR:          return "storage_error";
        case ErrorCategory::INTERNAL_ERROR:         return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Base of the errors surfaced to pipeline callers
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Malformed caller input; raised before any I/O happens
class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& message)
        : PipelineError(ErrorCategory::VALIDATION_ERROR, message) {}
};

// The durable store rejected or failed a write or read
class StorageError : public PipelineError {
public:
    explicit StorageError(const std::string& message)
        : PipelineError(ErrorCategory::STORAGE_ERROR, message) {}
};

} // namespace auditpipe
