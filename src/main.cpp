#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "file_key_provider.hpp"
#include "http_session.hpp"
#include "security_logger.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace wkd {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        KeyProvider& provider,
        const CertificateStore& store
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , provider_(provider)
        , store_(store)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    KeyProvider& provider_;
    const CertificateStore& store_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED,
                                "internal", "Accept error: " + ec.message());
        } else if (config_.enable_tls) {
            std::make_shared<HttpSession>(
                beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), ssl_ctx_),
                config_,
                provider_,
                store_
            )->run();
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)),
                config_,
                provider_,
                store_
            )->run();
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using wkd::SecurityLogger;
    try {
        wkd::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if ((arg == "--keys" || arg == "-k") && i + 1 < argc) {
                config.key_directory = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --keys, -k DIR Directory of published certificates (default: keys)\n"
                          << "  --tls, -t      Serve HTTPS\n"
                          << "  --no-tls, -n   Serve plain HTTP (default; put a TLS proxy in front)\n"
                          << "  --help, -h     Show this help\n"
                          << "Environment: WKD_PORT, WKD_ADDR, WKD_KEY_DIR, WKD_THREADS,\n"
                          << "  WKD_WATCH_RETRY_SEC, WKD_TLS_CERT, WKD_TLS_KEY, WKD_ADMIN_TOKEN,\n"
                          << "  WKD_ALLOWED_ORIGINS\n";
                return 0;
            } else {
                int port = 0;
                try {
                    port = std::stoi(arg);
                } catch (const std::exception&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    return 1;
                }
                if (port <= 0 || port > 65535) {
                    std::cerr << "[!] Port out of range: " << arg << "\n";
                    return 1;
                }
                config.port = static_cast<uint16_t>(port);
            }
        }

        // --- Environment Variable Overrides ---
        wkd::apply_environment(config);

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        std::filesystem::path exe_path;
        try {
            exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
        } catch (const std::exception& e) {
            std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
            exe_path = std::filesystem::current_path();
        }

        if (config.enable_tls) {
            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set WKD_TLS_CERT and WKD_TLS_KEY, or use --no-tls behind a TLS proxy.\n";
                return 1;
            }
        }

        std::cout << "WKD key server\n"
                  << "  keys:   " << config.key_directory << "\n"
                  << "  listen: " << config.address << ":" << config.port
                  << (config.enable_tls ? " (TLS 1.2+)" : " (plain HTTP)") << "\n\n";

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        wkd::FileKeyProvider provider(ioc.get_executor(), config.key_directory,
                                      std::chrono::seconds(config.watch_retry_interval_sec));
        provider.start();

        auto listener = std::make_shared<wkd::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            provider,
            provider.store()
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Serving " + std::to_string(provider.store().certificate_count()) + " certificates");

        // SIGINT and SIGTERM stop accepting, abort the watcher and let in-flight requests drain.
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&provider, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                                    "internal", "Initiating graceful shutdown");
                listener->stop();
                provider.watcher().stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
