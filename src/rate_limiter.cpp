#include "rate_limiter.hpp"
#include <algorithm>

namespace edgegate {

constexpr std::chrono::seconds RateLimiter::kWindow;
constexpr std::chrono::seconds RateLimiter::kBurstWindow;

RateLimiter::RateLimiter(size_t max_per_second, size_t max_per_minute,
                         std::chrono::seconds idle_ttl, TimeSource now)
    : max_per_second_(max_per_second)
    , max_per_minute_(max_per_minute)
    , idle_ttl_(idle_ttl)
    , now_(now ? std::move(now) : TimeSource([] { return Clock::now(); }))
{}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

const RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

// Prunes the key's window to the last minute, then checks the one-second and
// one-minute counts. A rejected event is not recorded.
RateLimitResult RateLimiter::check(const std::string& key) {
    const auto now = now_();
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    Window& window = shard.windows[key];
    window.last_touched = now;
    auto& ts = window.timestamps;

    while (!ts.empty() && now - ts.front() >= kWindow) {
        ts.pop_front();
    }

    auto recent = std::count_if(ts.begin(), ts.end(),
        [&now](const Clock::time_point& t) { return now - t < kBurstWindow; });

    if (static_cast<size_t>(recent) >= max_per_second_) {
        return {false, static_cast<long long>(recent), static_cast<long long>(max_per_second_), 1};
    }

    if (ts.size() >= max_per_minute_) {
        auto waited = std::chrono::duration_cast<std::chrono::seconds>(now - ts.front());
        long long reset = std::max<long long>(1, (kWindow - waited).count());
        return {false, static_cast<long long>(ts.size()), static_cast<long long>(max_per_minute_), reset};
    }

    ts.push_back(now);
    return {true, static_cast<long long>(ts.size()), static_cast<long long>(max_per_minute_), 0};
}

size_t RateLimiter::sweep() {
    const auto now = now_();
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.windows.begin(); it != shard.windows.end(); ) {
            if (now - it->second.last_touched > idle_ttl_) {
                it = shard.windows.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t RateLimiter::window_size(const std::string& key) const {
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.windows.find(key);
    return it != shard.windows.end() ? it->second.timestamps.size() : 0;
}

size_t RateLimiter::tracked_keys() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.windows.size();
    }
    return total;
}

}
