#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <ctime>
#include <mutex>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace wkd {

// Logs key-directory and request events. Client IPs are blinded with a
// rotating salt before they reach the log.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        KEY_LOADED,
        KEY_UNLOADED,
        KEY_REJECTED,
        IDENTITY_CONFLICT,
        WATCH_FAILURE,
        LOOKUP,
        INVALID_INPUT,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an event.
     * @param level Severity level of the event.
     * @param event Event category.
     * @param remote_addr Client IP (blinded before logging), or "internal" for
     *        events raised by the server itself.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "src=" << blind(remote_addr);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::KEY_LOADED: return "KEY_LOADED";
            case EventType::KEY_UNLOADED: return "KEY_UNLOADED";
            case EventType::KEY_REJECTED: return "KEY_REJECTED";
            case EventType::IDENTITY_CONFLICT: return "IDENTITY_CONFLICT";
            case EventType::WATCH_FAILURE: return "WATCH_FAILURE";
            case EventType::LOOKUP: return "LOOKUP";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::mutex& output_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    // Salted hash of a client address. The salt is regenerated every 6 hours so
    // old log lines cannot be linked to new ones.
    static std::string blind(const std::string& remote_addr) {
        if (remote_addr == "internal" || remote_addr == "unknown") {
            return remote_addr;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() ||
                std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    return "anon_unavailable";
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
};

}
