#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "gateway_error.hpp"
#include "metrics.hpp"

namespace edgegate {

/**
 * Runs blocking collaborator calls (request router, agent handler) away
 * from the io_context threads.
 *
 * The completion is posted back to the caller's executor, so it runs on the
 * connection's strand, and the caller's io_context counts the call as
 * outstanding work until then. With zero threads the call and its
 * completion run inline on the calling thread.
 */
class DependencyPool {
public:
    template<class Result>
    using Completion = std::function<void(std::exception_ptr, Result)>;

    explicit DependencyPool(size_t threads)
        : pool_(threads > 0 ? std::make_unique<boost::asio::thread_pool>(threads) : nullptr)
    {}

    ~DependencyPool() {
        shutdown();
    }

    DependencyPool(const DependencyPool&) = delete;
    DependencyPool& operator=(const DependencyPool&) = delete;

    template<class Result>
    void submit(boost::asio::any_io_executor home, std::function<Result()> work, Completion<Result> done) {
        if (!pool_) {
            std::exception_ptr error;
            Result result = invoke(work, error);
            done(error, std::move(result));
            return;
        }

        if (stopped_.load()) {
            done(std::make_exception_ptr(GatewayError(ErrorKind::ROUTING_ERROR, "Gateway is shutting down")),
                 Result{});
            return;
        }

        MetricsRegistry::instance().set_gauge("dependency_calls_in_flight", static_cast<double>(++in_flight_));
        auto tracked = boost::asio::prefer(home, boost::asio::execution::outstanding_work.tracked);

        boost::asio::post(*pool_, [this, tracked, work = std::move(work), done = std::move(done)]() mutable {
            std::exception_ptr error;
            Result result = invoke(work, error);
            MetricsRegistry::instance().set_gauge("dependency_calls_in_flight", static_cast<double>(--in_flight_));

            boost::asio::post(tracked, [done = std::move(done), error, result = std::move(result)]() mutable {
                done(error, std::move(result));
            });
        });
    }

    // Waits for queued and running calls. Their completions are still posted
    // to the callers' executors; later submits fail with ROUTING_ERROR.
    void shutdown() {
        if (pool_ && !stopped_.exchange(true)) {
            pool_->join();
        }
    }

    bool runs_inline() const { return pool_ == nullptr; }
    size_t in_flight() const { return in_flight_.load(); }

private:
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<bool> stopped_{false};
    std::atomic<size_t> in_flight_{0};

    // The exception travels to the completion instead of unwinding a pool thread.
    template<class Result>
    static Result invoke(std::function<Result()>& work, std::exception_ptr& error) {
        try {
            return work();
        } catch (...) {
            error = std::current_exception();
        }
        return Result{};
    }
};

}
