#pragma once

#include <boost/beast/http.hpp>
#include <optional>
#include <string>
#include <string_view>
#include "server_config.hpp"
#include "key_provider.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace wkd {

// A request for one of the Web Key Directory resources.
struct WkdRequest {
    enum class Kind { Lookup, Policy };

    Kind kind;
    std::string domain;  // lowercase; from the path (advanced) or the Host header (direct)
    std::string token;   // hashed local part; empty for Policy
};

class WkdHandler {
public:
    WkdHandler(const ServerConfig& config, KeyProvider& provider)
        : config_(config), provider_(provider) {}

    /**
     * Maps a request target onto a WKD resource.
     *
     *   /.well-known/openpgpkey/hu/<token>            direct lookup, domain from `host`
     *   /.well-known/openpgpkey/<domain>/hu/<token>   advanced lookup
     *   /.well-known/openpgpkey[/<domain>]/policy     policy document
     *
     * The query string (e.g. "?l=joe.doe") is ignored. Returns std::nullopt
     * for targets outside the well-known prefix.
     */
    static std::optional<WkdRequest> parse_target(std::string_view target, std::string_view host);

    // Host header without port, lowercased.
    static std::string host_domain(std::string_view host);

    http::response<http::string_body> handle(const http::request<http::string_body>& req,
                                             const WkdRequest& wkd_req,
                                             const std::string& remote_addr);

private:
    const ServerConfig& config_;
    KeyProvider& provider_;

    http::response<http::string_body> handle_lookup(const http::request<http::string_body>& req,
                                                    const WkdRequest& wkd_req,
                                                    const std::string& remote_addr);
    http::response<http::string_body> handle_policy(unsigned version);
    http::response<http::string_body> handle_not_found(unsigned version);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        if (config_.enable_tls) {
            res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
        }
    }

    // WKD resources are public; any origin may fetch them.
    template<class Body>
    void add_cors_headers(http::response<Body>& res) {
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    }
};

}
