#include "telemetry.hpp"

#include <cctype>
#include <boost/asio/post.hpp>

namespace edgegate {

namespace {

const char* const kDroppedTags[] = {"connection_id", "session_token", "duration_ms", "messages"};

}

MetricsTelemetry::MetricsTelemetry(size_t threads)
    : pool_(threads)
{}

MetricsTelemetry::~MetricsTelemetry() {
    shutdown();
}

std::string MetricsTelemetry::counter_name(const std::string& event_name) {
    std::string out;
    out.reserve(event_name.size() + 6);
    for (char c : event_name) {
        out += std::isalnum(static_cast<unsigned char>(c)) ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : '_';
    }
    return out + "_total";
}

void MetricsTelemetry::record_event(const std::string& name, const MetricLabels& tags) {
    if (stopped_.load()) return;

    MetricLabels labels = tags;
    for (const char* tag : kDroppedTags) labels.erase(tag);

    boost::asio::post(pool_, [this, counter = counter_name(name), labels = std::move(labels)] {
        MetricsRegistry::instance().increment_counter(counter, labels);
        recorded_++;
    });
}

void MetricsTelemetry::shutdown() {
    if (stopped_.exchange(true)) return;
    pool_.join();
}

}
