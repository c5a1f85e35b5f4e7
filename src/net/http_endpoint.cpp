#include "net/http_endpoint.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace auditpipe {

std::optional<HttpEndpoint> HttpEndpoint::parse(const std::string& url) {
    HttpEndpoint ep;
    ep.url_ = url;

    std::string rest;
    if (url.starts_with("https://")) {
        rest = url.substr(8);
        ep.use_ssl_ = true;
        ep.port_ = 443;
    } else if (url.starts_with("http://")) {
        rest = url.substr(7);
        ep.use_ssl_ = false;
        ep.port_ = 80;
    } else {
        return std::nullopt;
    }

    const auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        ep.host_ = rest.substr(0, path_pos);
        ep.path_ = rest.substr(path_pos);
    } else {
        ep.host_ = rest;
    }

    const auto port_pos = ep.host_.find(':');
    if (port_pos != std::string::npos) {
        const auto port = utils::try_parse_int<int>(std::string_view(ep.host_).substr(port_pos + 1));
        if (!port || *port <= 0 || *port > 65535) return std::nullopt;
        ep.port_ = *port;
        ep.host_ = ep.host_.substr(0, port_pos);
    }

    if (ep.host_.empty()) return std::nullopt;
    return ep;
}

HttpEndpoint::PostResult HttpEndpoint::post_json(const std::string& body,
                                                 const std::string& auth_header,
                                                 std::chrono::milliseconds timeout) const {
    PostResult result;
    try {
        const std::string scheme_host = std::format("{}{}:{}",
            use_ssl_ ? "https://" : "http://", host_, port_);
        httplib::Client client(scheme_host);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        httplib::Headers headers;
        if (!auth_header.empty()) {
            headers.emplace(http::kAuthorizationHeader, auth_header);
        }

        auto res = client.Post(path_, headers, body, http::kJsonContentType);
        if (!res) {
            result.error = httplib::to_string(res.error());
            return result;
        }
        result.status = res->status;
        result.ok = res->status >= 200 && res->status < 300;
        if (!result.ok) {
            result.error = std::format("HTTP {}", res->status);
        }
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace auditpipe
