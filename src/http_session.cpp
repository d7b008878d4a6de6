#include "http_session.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>

namespace json = boost::json;

namespace wkd {

namespace {
template<class Stream>
std::string peer_address(Stream& stream) {
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(stream).socket().remote_endpoint(ec);
    return ec ? "unknown" : ep.address().to_string();
}
}

// HTTPS session (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    KeyProvider& provider,
    const CertificateStore& store
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , health_handler_(config, store)
    , wkd_handler_(config, provider)
{
    remote_addr_ = peer_address(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
}

// Plaintext HTTP session (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    KeyProvider& provider,
    const CertificateStore& store
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , health_handler_(config, store)
    , wkd_handler_(config, provider)
{
    remote_addr_ = peer_address(std::get<beast::tcp_stream>(stream_));
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Scanners fail the handshake constantly; close without logging.
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(
            std::chrono::seconds(config_.connection_timeout_sec));
    } else {
        beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).expires_after(
            std::chrono::seconds(config_.connection_timeout_sec));
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return;
    }
    if (ec) {
        if (ec == http::error::body_limit) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                                remote_addr_, "Request body exceeds limit");
        }
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    auto target = req_.target();
    auto method = req_.method();

    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---

    if (target == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
        return;
    }
    if (target == "/metrics" && method == http::verb::get) {
        if (is_local_peer() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }
        return;
    }

    // Web Key Directory
    if (method == http::verb::get) {
        std::string_view host;
        auto host_it = req_.find(http::field::host);
        if (host_it != req_.end()) {
            host = std::string_view(host_it->value().data(), host_it->value().size());
        }

        auto wkd_req = WkdHandler::parse_target(std::string_view(target.data(), target.size()), host);
        if (wkd_req) {
            send_response(wkd_handler_.handle(req_, *wkd_req, remote_addr_));
            return;
        }
    }

    send_response(handle_not_found());
}

bool HttpSession::is_local_peer() const {
    return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1";
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    add_cors_headers(res);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "wkd-server");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "no-referrer");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");

    if (config_.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*") {
            res.set(http::field::access_control_allow_origin, "*");
            break;
        }
        if (allowed == origin) {
            res.set(http::field::access_control_allow_origin, origin);
            res.set(http::field::vary, "Origin");
            break;
        }
    }

    if (!res.count(http::field::access_control_allow_origin) && !origin.empty()) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                            remote_addr_, "Disallowed origin: " + origin);
    }

    res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type,X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    sp->keep_alive(req_.keep_alive());

    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        return;
    }

    if (close) {
        if (is_tls_) {
            beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        } else {
            beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        }
        return;
    }

    do_read();
}

}
