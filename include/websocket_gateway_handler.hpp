#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/json.hpp>

#include "auth_context.hpp"
#include "frame_sink.hpp"
#include "gateway_services.hpp"
#include "heartbeat_scheduler.hpp"
#include "request_envelope.hpp"
#include "security_logger.hpp"

namespace edgegate {

// What the gateway keeps from the HTTP upgrade request.
struct UpgradeRequest {
    std::string origin;
    std::string session_token;
    HeaderMap headers;
    std::string remote_addr;
};

/**
 * Per-connection gateway logic for the agent WebSocket.
 *
 * Life cycle: ACCEPTED -> (DEGRADED <-> ACTIVE) -> CLOSING -> CLOSED.
 * All methods must be called from the connection's strand; the transport
 * feeds inbound text frames to on_message() one at a time and reads the
 * next frame only after the previous one completed.
 */
class WebSocketGatewayHandler {
public:
    enum class State {
        ACCEPTED,
        DEGRADED,
        ACTIVE,
        CLOSING,
        CLOSED
    };

    WebSocketGatewayHandler(GatewayServices& services,
                            boost::asio::any_io_executor executor,
                            std::weak_ptr<FrameSink> sink,
                            UpgradeRequest upgrade);
    ~WebSocketGatewayHandler();

    WebSocketGatewayHandler(const WebSocketGatewayHandler&) = delete;
    WebSocketGatewayHandler& operator=(const WebSocketGatewayHandler&) = delete;

    // Origin check, admission, welcome frame and heartbeat.
    // Returns false when the connection was refused and closed.
    bool open();

    using Continuation = std::function<void(bool keep_reading)>;

    // Processes one inbound text frame and calls `next` exactly once: inline,
    // or on the connection's executor after the agent replies. next(false)
    // means the connection is closing. The handler must outlive a pending
    // agent call; WebSocketSession keeps itself alive through `next`.
    void on_message(const std::string& text, Continuation next);

    // Peer went away or the transport failed.
    void on_disconnect(const std::string& reason);

    // Single cleanup path. Every step runs even if an earlier one fails; later calls are no-ops.
    void finish(uint16_t code, const std::string& reason);

    State state() const { return state_; }
    const std::string& connection_id() const { return connection_id_; }
    const std::string& session_key() const { return session_key_; }
    const std::string& session_id() const { return session_id_; }
    const AuthContextPtr& auth_context() const { return auth_; }
    std::shared_ptr<HeartbeatTask> heartbeat() const { return heartbeat_; }
    std::chrono::system_clock::time_point last_heartbeat_at() const { return last_heartbeat_at_; }
    bool welcome_sent() const { return welcome_sent_; }

    static const char* to_string(State state);

    static std::string generate_connection_id();

    // {type:"error", code, message, recoverable}
    static boost::json::object error_frame(const std::string& code, const std::string& message,
                                           bool recoverable);

private:
    GatewayServices& services_;
    boost::asio::any_io_executor executor_;
    std::weak_ptr<FrameSink> sink_;
    UpgradeRequest upgrade_;

    std::string connection_id_;
    std::string session_key_;
    std::string session_id_;
    AuthContextPtr auth_;
    State state_ = State::ACCEPTED;

    std::shared_ptr<HeartbeatTask> heartbeat_;
    std::chrono::system_clock::time_point opened_at_;
    std::chrono::system_clock::time_point last_heartbeat_at_;

    bool admitted_ = false;
    bool linked_ = false;
    bool welcome_sent_ = false;
    bool finished_ = false;
    size_t messages_handled_ = 0;

    void ensure_setup();
    void dispatch_to_agent(boost::json::object msg, const std::string& agent_type, Continuation next);
    bool on_agent_reply(const std::string& agent_type, std::exception_ptr error, boost::json::object response);
    void link_session();
    void authenticate();

    // Empty string when the message is acceptable.
    static std::string schema_violation(const boost::json::object& msg);

    bool send(const boost::json::object& frame);
    void emit(const std::string& name, MetricLabels tags);
    void log(SecurityLogger::Level level, SecurityLogger::EventType event, const std::string& msg) const;
};

}
