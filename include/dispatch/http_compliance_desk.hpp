#pragma once

#include "dispatch/icompliance_desk.hpp"
#include "net/http_endpoint.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace auditpipe {

/**
 * @brief Compliance desk reached over HTTP (notification and ticket endpoints)
 *
 * Either URL may be empty; the matching action then fails with a logged
 * error.
 */
class HttpComplianceDesk : public IComplianceDesk {
public:
    struct Config {
        std::string notify_url;
        std::string ticket_url;
        std::string auth_header;
        std::chrono::milliseconds timeout{5000};
    };

    /**
     * @throws std::invalid_argument for a non-empty URL that is not http(s)
     */
    explicit HttpComplianceDesk(const Config& config);

    bool notify_compliance(const AuditEvent& event, const ComplianceRule& rule,
                           const JsonValue& parameters) override;
    bool create_ticket(const AuditEvent& event, const ComplianceRule& rule,
                       const JsonValue& parameters) override;

    [[nodiscard]] static JsonValue build_body(const AuditEvent& event, const ComplianceRule& rule,
                                              const JsonValue& parameters);

private:
    bool post(const std::optional<HttpEndpoint>& endpoint, std::string_view action,
              const AuditEvent& event, const ComplianceRule& rule, const JsonValue& parameters);

    Config config_;
    std::optional<HttpEndpoint> notify_endpoint_;
    std::optional<HttpEndpoint> ticket_endpoint_;
};

} // namespace auditpipe
