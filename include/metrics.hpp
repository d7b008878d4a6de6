#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace wkd {

// Names of the metrics the key directory records.
namespace metric {
constexpr const char* keys_loaded = "wkd_keys_loaded_total";
constexpr const char* keys_load_failed = "wkd_keys_load_failed_total";
constexpr const char* keys_unloaded = "wkd_keys_unloaded_total";
constexpr const char* watch_failures = "wkd_watch_failures_total";
constexpr const char* lookup_hits = "wkd_lookup_hits_total";
constexpr const char* lookup_misses = "wkd_lookup_misses_total";
constexpr const char* certificates = "wkd_certificates";
constexpr const char* identities = "wkd_identities";
}

// Process-wide counters and gauges, exported in Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Counters only increase.
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
