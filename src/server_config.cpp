#include "server_config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace wkd {

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string item = list.substr(start, comma - start);
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

void apply_environment(ServerConfig& config) {
    if (const char* env_port = std::getenv("WKD_PORT")) {
        int port = std::stoi(env_port);
        if (port <= 0 || port > 65535) {
            throw std::out_of_range("WKD_PORT out of range");
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (const char* env_addr = std::getenv("WKD_ADDR")) {
        config.address = env_addr;
    }
    if (const char* env_dir = std::getenv("WKD_KEY_DIR")) {
        config.key_directory = env_dir;
    }
    if (const char* env_threads = std::getenv("WKD_THREADS")) {
        config.thread_count = std::stoi(env_threads);
    }
    if (const char* env_retry = std::getenv("WKD_WATCH_RETRY_SEC")) {
        config.watch_retry_interval_sec = std::stoi(env_retry);
        if (config.watch_retry_interval_sec < 1) config.watch_retry_interval_sec = 1;
    }
    if (const char* env_cert = std::getenv("WKD_TLS_CERT")) {
        config.cert_path = env_cert;
    }
    if (const char* env_key = std::getenv("WKD_TLS_KEY")) {
        config.key_path = env_key;
    }
    if (const char* env_admin = std::getenv("WKD_ADMIN_TOKEN")) {
        config.admin_token = env_admin;
    }
    if (const char* env_origins = std::getenv("WKD_ALLOWED_ORIGINS")) {
        config.allowed_origins = split_list(env_origins);
    }
}

}
