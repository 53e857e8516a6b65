#include "admission_controller.hpp"
#include "metrics.hpp"

namespace edgegate {

AdmissionController::AdmissionController(size_t max_per_session, size_t max_global)
    : max_per_session_(max_per_session)
    , max_global_(max_global)
{}

AdmitResult AdmissionController::try_admit(const std::string& session_key) {
    std::unique_lock lock(mutex_);

    auto it = per_session_.find(session_key);
    size_t current = (it != per_session_.end()) ? it->second : 0;

    if (current >= max_per_session_) {
        lock.unlock();
        MetricsRegistry::instance().increment_counter("ws_admission_rejected_total", {{"reason", "per_session"}});
        return {false, AdmitResult::Reason::PER_SESSION_LIMIT};
    }
    if (global_ >= max_global_) {
        lock.unlock();
        MetricsRegistry::instance().increment_counter("ws_admission_rejected_total", {{"reason", "global"}});
        return {false, AdmitResult::Reason::GLOBAL_LIMIT};
    }

    per_session_[session_key] = current + 1;
    global_++;
    size_t snapshot = global_;
    lock.unlock();

    MetricsRegistry::instance().set_gauge("ws_active_connections", static_cast<double>(snapshot));
    return {true, AdmitResult::Reason::NONE};
}

void AdmissionController::release(const std::string& session_key) {
    std::unique_lock lock(mutex_);

    auto it = per_session_.find(session_key);
    if (it == per_session_.end()) {
        return;
    }

    if (it->second > 0) {
        it->second--;
        if (global_ > 0) global_--;
    }
    if (it->second == 0) {
        per_session_.erase(it);
    }
    size_t snapshot = global_;
    lock.unlock();

    MetricsRegistry::instance().set_gauge("ws_active_connections", static_cast<double>(snapshot));
}

size_t AdmissionController::global_count() const {
    std::lock_guard lock(mutex_);
    return global_;
}

size_t AdmissionController::session_count(const std::string& session_key) const {
    std::lock_guard lock(mutex_);
    auto it = per_session_.find(session_key);
    return it != per_session_.end() ? it->second : 0;
}

size_t AdmissionController::per_session_sum() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [key, count] : per_session_) total += count;
    return total;
}

}
