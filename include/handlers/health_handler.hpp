#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "certificate_store.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace wkd {

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, const CertificateStore& store)
        : config_(config), store_(store) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Checks the X-Admin-Token header. Always false when no token is configured.
    bool verify_admin_request(const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    const CertificateStore& store_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
    }
};

}
