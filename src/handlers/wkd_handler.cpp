#include "handlers/wkd_handler.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"

namespace wkd {

namespace {
// Older clients and the first deployments used the plural form.
constexpr std::string_view kPrefixes[] = {"/.well-known/openpgpkey/", "/.well-known/openpgpkeys/"};
}

std::string WkdHandler::host_domain(std::string_view host) {
    std::string_view name = host;
    size_t colon = name.rfind(':');
    size_t bracket = name.rfind(']');
    if (colon != std::string_view::npos && (bracket == std::string_view::npos || bracket < colon)) {
        name = name.substr(0, colon);
    }
    while (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    return InputValidator::to_lower(std::string(name));
}

std::optional<WkdRequest> WkdHandler::parse_target(std::string_view target, std::string_view host) {
    size_t query = target.find('?');
    std::string_view path = target.substr(0, query);

    std::string_view rest;
    bool matched = false;
    for (auto prefix : kPrefixes) {
        if (path.substr(0, prefix.size()) == prefix) {
            rest = path.substr(prefix.size());
            matched = true;
            break;
        }
    }
    if (!matched) return std::nullopt;

    if (rest == "policy") {
        return WkdRequest{WkdRequest::Kind::Policy, host_domain(host), ""};
    }
    if (rest.substr(0, 3) == "hu/") {
        return WkdRequest{WkdRequest::Kind::Lookup, host_domain(host), std::string(rest.substr(3))};
    }

    size_t slash = rest.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    std::string domain = InputValidator::to_lower(std::string(rest.substr(0, slash)));
    std::string_view resource = rest.substr(slash + 1);
    if (resource == "policy") {
        return WkdRequest{WkdRequest::Kind::Policy, domain, ""};
    }
    if (resource.substr(0, 3) == "hu/") {
        return WkdRequest{WkdRequest::Kind::Lookup, domain, std::string(resource.substr(3))};
    }
    return std::nullopt;
}

http::response<http::string_body> WkdHandler::handle(const http::request<http::string_body>& req,
                                                     const WkdRequest& wkd_req,
                                                     const std::string& remote_addr) {
    if (wkd_req.kind == WkdRequest::Kind::Policy) {
        return handle_policy(req.version());
    }
    return handle_lookup(req, wkd_req, remote_addr);
}

http::response<http::string_body> WkdHandler::handle_lookup(const http::request<http::string_body>& req,
                                                            const WkdRequest& wkd_req,
                                                            const std::string& remote_addr) {
    if (!InputValidator::is_valid_wkd_token(wkd_req.token) || !InputValidator::is_valid_domain(wkd_req.domain)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Malformed WKD lookup for domain " + wkd_req.domain);
        return handle_not_found(req.version());
    }

    auto cert = provider_.discover(wkd_req.token, wkd_req.domain);
    if (!cert) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LOOKUP, remote_addr,
                            "miss " + wkd_req.token + "@" + wkd_req.domain);
        return handle_not_found(req.version());
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LOOKUP, remote_addr,
                        "hit " + wkd_req.token + "@" + wkd_req.domain + " -> " + cert->fingerprint());

    const auto& bytes = cert->to_bytes();
    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/octet-stream");
    res.body().assign(bytes.begin(), bytes.end());
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

http::response<http::string_body> WkdHandler::handle_policy(unsigned version) {
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain");
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

http::response<http::string_body> WkdHandler::handle_not_found(unsigned version) {
    http::response<http::string_body> res{http::status::not_found, version};
    res.set(http::field::content_type, "text/plain");
    res.body() = "Not found";
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

}
