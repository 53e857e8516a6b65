#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace edgegate {

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    long long reset_after_sec;
};
 
// Protection Layer for per-session message rates.
// Keeps a sliding window of accepted timestamps per key and enforces both a
// per-second and a per-minute cap. Windows are sharded by key so unrelated
// sessions never contend on the same lock.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kWindow{60};
    static constexpr std::chrono::seconds kBurstWindow{1};

    RateLimiter(size_t max_per_second, size_t max_per_minute,
                std::chrono::seconds idle_ttl = std::chrono::seconds(300),
                TimeSource now = nullptr);
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Evaluates and, when allowed, records one event for a key.
     * @param key Session key of the caller.
     * @return allowed flag plus the counter that decided and its retry hint.
     */
    RateLimitResult check(const std::string& key);

    bool check_and_record(const std::string& key) { return check(key).allowed; }

    // Drops windows untouched for longer than the idle TTL. Returns the number removed.
    size_t sweep();

    size_t window_size(const std::string& key) const;
    size_t tracked_keys() const;

private:
    struct Window {
        std::deque<Clock::time_point> timestamps;
        Clock::time_point last_touched;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Window> windows;
    };

    static constexpr size_t kShardCount = 16;

    const size_t max_per_second_;
    const size_t max_per_minute_;
    const std::chrono::seconds idle_ttl_;
    TimeSource now_;
    std::array<Shard, kShardCount> shards_;

    Shard& shard_for(const std::string& key);
    const Shard& shard_for(const std::string& key) const;
};

} 
