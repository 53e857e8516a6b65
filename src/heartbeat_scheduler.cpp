#include "heartbeat_scheduler.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>

namespace edgegate {

HeartbeatTask::HeartbeatTask(boost::asio::any_io_executor executor,
                             std::weak_ptr<FrameSink> sink,
                             std::chrono::milliseconds interval,
                             StaleCheck stale_check)
    : timer_(std::move(executor))
    , sink_(std::move(sink))
    , interval_(interval)
    , stale_check_(std::move(stale_check))
{}

void HeartbeatTask::start() {
    if (cancelled_.load() || running_.exchange(true)) return;
    arm();
}

void HeartbeatTask::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->on_tick(ec);
    });
}

void HeartbeatTask::on_tick(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || cancelled_.load()) {
        running_ = false;
        return;
    }

    auto sink = sink_.lock();
    if (!sink || !sink->is_open()) {
        stop();
        return;
    }

    if (stale_check_ && stale_check_()) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CONNECTION_CLOSED,
                            "internal", "Heartbeat timeout, closing stale connection");
        MetricsRegistry::instance().increment_counter("ws_heartbeat_timeouts_total");
        sink->close(1001, "Heartbeat timeout");
        stop();
        return;
    }

    if (!sink->send_text(ping_frame())) {
        stop();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_sent_at_ = std::chrono::system_clock::now();
    }
    pings_sent_++;
    arm();
}

// Ends the loop without counting as a cancellation.
void HeartbeatTask::stop() {
    running_ = false;
}

bool HeartbeatTask::cancel() {
    cancel_requests_++;
    if (cancelled_.exchange(true)) {
        return false;
    }
    timer_.cancel();
    running_ = false;
    return true;
}

std::chrono::system_clock::time_point HeartbeatTask::last_sent_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sent_at_;
}

std::string HeartbeatTask::ping_frame() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm gmt;
    gmtime_r(&now, &gmt);
    std::stringstream ts;
    ts << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%SZ");

    boost::json::object frame;
    frame["type"] = "heartbeat";
    frame["action"] = "ping";
    frame["timestamp"] = ts.str();
    return boost::json::serialize(frame);
}

std::shared_ptr<HeartbeatTask> HeartbeatScheduler::start(boost::asio::any_io_executor executor,
                                                         std::weak_ptr<FrameSink> sink,
                                                         std::chrono::milliseconds interval,
                                                         HeartbeatTask::StaleCheck stale_check) {
    auto task = std::make_shared<HeartbeatTask>(std::move(executor), std::move(sink),
                                                interval, std::move(stale_check));
    task->start();
    return task;
}

}
