#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace auditpipe {

/**
 * @brief Flags events that carry personal or sensitive data.
 *
 * Walks the caller-supplied part of the event's wire form: every field name,
 * every string value, and recursively every key and string value inside
 * requestData, responseData and metadata. A case-insensitive substring hit on
 * any keyword sets the corresponding flag.
 */
class DataClassifier {
public:
    struct Config {
        std::vector<std::string> personal_keywords = default_personal_keywords();
        std::vector<std::string> sensitive_keywords = default_sensitive_keywords();
    };

    struct Classification {
        bool personal = false;
        bool sensitive = false;
    };

    DataClassifier();
    explicit DataClassifier(Config config);

    [[nodiscard]] Classification classify(const AuditEvent& event) const;
    [[nodiscard]] Classification classify(const JsonValue& wire) const;

    [[nodiscard]] static std::vector<std::string> default_personal_keywords();
    [[nodiscard]] static std::vector<std::string> default_sensitive_keywords();

private:
    void scan(const JsonValue& node, Classification& out) const;
    void check_text(std::string_view text, Classification& out) const;

    std::vector<std::string> personal_;     // lower-cased
    std::vector<std::string> sensitive_;    // lower-cased
};

} // namespace auditpipe
