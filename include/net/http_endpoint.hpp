#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace auditpipe {

/**
 * @brief Parsed http(s) URL plus a JSON POST helper (cpp-httplib client)
 */
class HttpEndpoint {
public:
    struct PostResult {
        bool ok = false;            // transport succeeded and status is 2xx
        int status = 0;             // 0 when no response arrived
        std::string error;
    };

    /**
     * @return std::nullopt for anything but an http:// or https:// URL with a host
     */
    [[nodiscard]] static std::optional<HttpEndpoint> parse(const std::string& url);

    /**
     * @param auth_header Sent verbatim as the Authorization header when non-empty
     */
    [[nodiscard]] PostResult post_json(const std::string& body,
                                       const std::string& auth_header,
                                       std::chrono::milliseconds timeout) const;

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] int port() const { return port_; }
    [[nodiscard]] bool use_ssl() const { return use_ssl_; }

private:
    std::string url_;
    std::string host_;
    std::string path_ = "/";
    int port_ = 443;
    bool use_ssl_ = true;
};

} // namespace auditpipe
