#include "handlers/health_handler.hpp"
#include "key_errors.hpp"
#include <openssl/crypto.h>

namespace wkd {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    try {
        response["status"] = "healthy";
        response["certificates"] = static_cast<int64_t>(store_.certificate_count());
        response["identities"] = static_cast<int64_t>(store_.identity_count());
        response["files"] = static_cast<int64_t>(store_.file_count());
    } catch (const LockError& e) {
        response["status"] = "degraded";
        response["error"] = e.what();
    }
    response["key_directory"] = config_.key_directory;
    response["tls"] = config_.enable_tls;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) {
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    if (provided_token.size() != config_.admin_token.size()) {
        return false;
    }
    return CRYPTO_memcmp(provided_token.data(), config_.admin_token.data(), provided_token.size()) == 0;
}

}
