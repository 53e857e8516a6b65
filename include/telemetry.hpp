#pragma once

#include <atomic>
#include <string>
#include <boost/asio/thread_pool.hpp>

#include "gateway_dependencies.hpp"
#include "metrics.hpp"

namespace edgegate {

// TelemetryEmitter backed by the process MetricsRegistry.
// Events are handed to a small background pool so record_event never blocks
// the connection strand. "websocket.message.received" becomes the counter
// websocket_message_received_total; per-connection tags are dropped to keep
// series cardinality bounded.
class MetricsTelemetry : public TelemetryEmitter {
public:
    explicit MetricsTelemetry(size_t threads = 1);
    ~MetricsTelemetry() override;

    void record_event(const std::string& name, const MetricLabels& tags) override;

    // Drains queued events and stops the pool. Events recorded afterwards are dropped.
    void shutdown();

    size_t recorded() const { return recorded_.load(); }

    static std::string counter_name(const std::string& event_name);

private:
    boost::asio::thread_pool pool_;
    std::atomic<size_t> recorded_{0};
    std::atomic<bool> stopped_{false};
};

}
