#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace edgegate {

using MetricLabels = std::map<std::string, std::string>;
 
// Singleton Metrics Registry for operational visibility.
// Counters and gauges are keyed by series (name plus sorted labels) and
// exported in Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        increment_counter(name, {}, value);
    }

    void increment_counter(const std::string& name, const MetricLabels& labels, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name][format_labels(labels)] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] = value;
    }
    
    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] += value;
    }
    
    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name][""] -= value;
    }

    // Sum over every label set of the counter.
    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        if (it == counters_.end()) return 0.0;
        double total = 0.0;
        for (const auto& [labels, val] : it->second) total += val;
        return total;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        if (it == gauges_.end()) return 0.0;
        auto series = it->second.find("");
        return series != it->second.end() ? series->second : 0.0;
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
        
        for (const auto& [name, series] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            for (const auto& [labels, val] : series) {
                ss << name << labels << " " << val << "\n";
            }
        }
        
        for (const auto& [name, series] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            for (const auto& [labels, val] : series) {
                ss << name << labels << " " << val << "\n";
            }
        }
        
        return ss.str();
    }

private:
    MetricsRegistry() = default;

    static std::string format_labels(const MetricLabels& labels) {
        if (labels.empty()) return "";
        std::string out = "{";
        bool first = true;
        for (const auto& [key, value] : labels) {
            if (!first) out += ",";
            first = false;
            out += key + "=\"";
            for (char c : value) {
                if (c == '"' || c == '\\') out += '\\';
                if (c == '\n') { out += "\\n"; continue; }
                out += c;
            }
            out += "\"";
        }
        return out + "}";
    }
    
    std::map<std::string, std::map<std::string, double>> counters_;
    std::map<std::string, std::map<std::string, double>> gauges_;
    std::mutex mutex_;
};

} 
