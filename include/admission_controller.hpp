#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace edgegate {

struct AdmitResult {
    enum class Reason {
        NONE,
        PER_SESSION_LIMIT,
        GLOBAL_LIMIT
    };

    bool accepted;
    Reason reason;
};

// Process-wide concurrent connection caps for WebSocket sessions.
// Both counter families live under one mutex so that the global count
// always equals the sum of the per-session counts.
class AdmissionController {
public:
    AdmissionController(size_t max_per_session, size_t max_global);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Checks both caps and increments on success; never mutates on rejection.
    AdmitResult try_admit(const std::string& session_key);

    // Decrements both counters, floored at zero. Releasing an unknown key is a no-op.
    void release(const std::string& session_key);

    size_t global_count() const;
    size_t session_count(const std::string& session_key) const;
    size_t per_session_sum() const;

    size_t max_per_session() const { return max_per_session_; }
    size_t max_global() const { return max_global_; }

private:
    const size_t max_per_session_;
    const size_t max_global_;

    std::unordered_map<std::string, size_t> per_session_;
    size_t global_ = 0;
    mutable std::mutex mutex_;
};

}
