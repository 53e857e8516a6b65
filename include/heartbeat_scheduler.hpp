#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "frame_sink.hpp"

namespace edgegate {

// One keepalive loop for one connection. Runs on the connection's executor
// so ticks never interleave with frame processing.
class HeartbeatTask : public std::enable_shared_from_this<HeartbeatTask> {
public:
    // Returns true when the peer is considered dead; the task then closes the sink.
    using StaleCheck = std::function<bool()>;

    HeartbeatTask(boost::asio::any_io_executor executor,
                  std::weak_ptr<FrameSink> sink,
                  std::chrono::milliseconds interval,
                  StaleCheck stale_check = nullptr);

    void start();

    // Idempotent. Returns true only for the call that actually stopped the task.
    bool cancel();

    bool cancelled() const { return cancelled_.load(); }
    bool running() const { return running_.load(); }
    size_t cancel_requests() const { return cancel_requests_.load(); }
    size_t pings_sent() const { return pings_sent_.load(); }
    std::chrono::system_clock::time_point last_sent_at() const;

    // {"type":"heartbeat","action":"ping","timestamp":<ISO-8601 UTC>}
    static std::string ping_frame();

private:
    void arm();
    void on_tick(const boost::system::error_code& ec);
    void stop();

    boost::asio::steady_timer timer_;
    std::weak_ptr<FrameSink> sink_;
    std::chrono::milliseconds interval_;
    StaleCheck stale_check_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> running_{false};
    std::atomic<size_t> cancel_requests_{0};
    std::atomic<size_t> pings_sent_{0};

    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point last_sent_at_{};
};

class HeartbeatScheduler {
public:
    /**
     * Starts a keepalive task for a connection.
     * @param executor The connection's strand.
     * @param sink Connection to ping. The task stops once it is gone or closed.
     * @param interval Time between pings.
     */
    static std::shared_ptr<HeartbeatTask> start(boost::asio::any_io_executor executor,
                                                std::weak_ptr<FrameSink> sink,
                                                std::chrono::milliseconds interval,
                                                HeartbeatTask::StaleCheck stale_check = nullptr);
};

}
