#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/json.hpp>

#include "frame_sink.hpp"
#include "gateway_dependencies.hpp"
#include "gateway_error.hpp"

namespace edgegate::test {

// In-memory FrameSink recording every frame and close request.
class FakeSink : public FrameSink {
public:
    bool send_text(const std::string& frame) override {
        if (!open || fail_sends) return false;
        frames.push_back(frame);
        return true;
    }

    void close(uint16_t code, const std::string& reason) override {
        ++close_calls;
        if (!open) return;
        open = false;
        close_code = code;
        close_reason = reason;
    }

    bool is_open() const override { return open; }

    boost::json::object frame(size_t i) const {
        return boost::json::parse(frames.at(i)).as_object();
    }

    boost::json::object last_frame() const {
        return boost::json::parse(frames.back()).as_object();
    }

    std::vector<std::string> frames;
    bool open = true;
    bool fail_sends = false;
    uint16_t close_code = 0;
    std::string close_reason;
    int close_calls = 0;
};

// AgentMessageHandler that echoes the message, or throws when told to.
// May be called from dependency pool threads.
class FakeAgent : public AgentMessageHandler {
public:
    boost::json::object handle(const boost::json::object& message,
                               const AuthContextPtr& auth,
                               const std::string& connection_id) override {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        last_thread = std::this_thread::get_id();
        last_message = message;
        last_auth = auth;
        last_connection_id = connection_id;
        if (fail) {
            throw std::runtime_error("agent exploded");
        }
        return {
            {"type", "response"},
            {"echo", message.at("message")},
            {"user", auth ? boost::json::value(auth->user_id) : boost::json::value(nullptr)}
        };
    }

    std::mutex mutex;
    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
    std::chrono::milliseconds delay{0};
    std::thread::id last_thread;
    boost::json::object last_message;
    AuthContextPtr last_auth;
    std::string last_connection_id;
};

class FakeRouter : public RequestRouter {
public:
    enum class Mode { OK, GATEWAY_ERROR, CRASH };

    boost::json::value route(const RequestEnvelope& envelope, const AuthContextPtr& auth) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        last_thread = std::this_thread::get_id();
        last_payload = envelope.to_payload();
        last_auth = auth;
        switch (mode) {
            case Mode::OK:
                return {{"success", true}, {"pillar", envelope.pillar}, {"sub_path", envelope.sub_path}};
            case Mode::GATEWAY_ERROR:
                throw GatewayError(ErrorKind::ROUTING_ERROR, "No route for pillar");
            case Mode::CRASH:
                throw std::runtime_error("router crashed");
        }
        return nullptr;
    }

    std::mutex mutex;
    Mode mode = Mode::OK;
    std::atomic<int> calls{0};
    std::thread::id last_thread;
    boost::json::object last_payload;
    AuthContextPtr last_auth;
};

class FakeValidator : public TokenValidator {
public:
    AuthContext validate(const std::string& token) override {
        ++calls;
        if (reject) throw GatewayError(ErrorKind::INVALID_TOKEN, "bad token");
        return AuthContext("jwt-user", "jwt-tenant", {"member"}, {"chat"},
                           AuthContext::Origin::LOCAL_VALIDATION);
    }

    int calls = 0;
    bool reject = false;
};

class FakeTelemetry : public TelemetryEmitter {
public:
    void record_event(const std::string& name, const MetricLabels& tags) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.emplace_back(name, tags);
    }

    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& e : events) if (e.first == name) ++n;
        return n;
    }

    std::mutex mutex;
    std::vector<std::pair<std::string, MetricLabels>> events;
};

class FakeRegistry : public SessionRegistry {
public:
    std::string get_or_create(const std::string& session_token) override {
        if (fail) throw std::runtime_error("registry down");
        return "sess_" + session_token;
    }

    void link(const std::string& connection_id, const std::string& session_id) override {
        if (fail) throw std::runtime_error("registry down");
        links.emplace_back(connection_id, session_id);
    }

    void unlink(const std::string& connection_id) override {
        unlinks.push_back(connection_id);
    }

    bool fail = false;
    std::vector<std::pair<std::string, std::string>> links;
    std::vector<std::string> unlinks;
};

}
