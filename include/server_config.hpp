#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace wkd {

// Server configuration. Defaults below, overridden by the command line and
// then by WKD_* environment variables.
struct ServerConfig {
    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Key directory ---
    std::string key_directory = "keys";
    int watch_retry_interval_sec = 5;  // backoff between failed watch subscriptions

    // --- Request limits ---
    size_t max_message_size = 16 * 1024;  // requests carry no body worth keeping
    int connection_timeout_sec = 30;

    // --- Administration ---
    std::string admin_token = "";  // grants remote access to /metrics

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {"*"};
};

// Splits a comma-separated list, dropping empty items.
std::vector<std::string> split_list(const std::string& list);

/**
 * Applies WKD_PORT, WKD_ADDR, WKD_KEY_DIR, WKD_THREADS, WKD_WATCH_RETRY_SEC,
 * WKD_TLS_CERT, WKD_TLS_KEY, WKD_ADMIN_TOKEN and WKD_ALLOWED_ORIGINS.
 * @throws std::invalid_argument or std::out_of_range on malformed numbers.
 */
void apply_environment(ServerConfig& config);

}
