#include "websocket_gateway_handler.hpp"
#include "gateway_error.hpp"
#include "metrics.hpp"

#include <iomanip>
#include <sstream>
#include <openssl/rand.h>

namespace edgegate {

namespace json = boost::json;

using Level = SecurityLogger::Level;
using Event = SecurityLogger::EventType;

namespace {

std::string string_field(const json::object& obj, const char* key, const std::string& fallback = "") {
    auto v = obj.if_contains(key);
    return (v && v->is_string()) ? json::value_to<std::string>(*v) : fallback;
}

}

WebSocketGatewayHandler::WebSocketGatewayHandler(GatewayServices& services,
                                                 boost::asio::any_io_executor executor,
                                                 std::weak_ptr<FrameSink> sink,
                                                 UpgradeRequest upgrade)
    : services_(services)
    , executor_(std::move(executor))
    , sink_(std::move(sink))
    , upgrade_(std::move(upgrade))
    , connection_id_(generate_connection_id())
    , session_key_(upgrade_.session_token.empty() ? "anonymous" : upgrade_.session_token)
    , session_id_(session_key_)
    , opened_at_(std::chrono::system_clock::now())
{}

WebSocketGatewayHandler::~WebSocketGatewayHandler() {
    finish(1001, "Going away");
}

const char* WebSocketGatewayHandler::to_string(State state) {
    switch (state) {
        case State::ACCEPTED: return "accepted";
        case State::DEGRADED: return "degraded";
        case State::ACTIVE: return "active";
        case State::CLOSING: return "closing";
        case State::CLOSED: return "closed";
    }
    return "unknown";
}

std::string WebSocketGatewayHandler::generate_connection_id() {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw GatewayError(ErrorKind::INTERNAL_ERROR, "CSPRNG failure generating connection id");
    }
    std::stringstream ss;
    ss << "ws_";
    for (unsigned char b : bytes) ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return ss.str();
}

json::object WebSocketGatewayHandler::error_frame(const std::string& code, const std::string& message,
                                                  bool recoverable) {
    return {
        {"type", "error"},
        {"code", code},
        {"message", message},
        {"recoverable", recoverable}
    };
}

void WebSocketGatewayHandler::log(Level level, Event event, const std::string& msg) const {
    SecurityLogger::log(level, event, upgrade_.remote_addr, "[" + connection_id_ + "] " + msg);
}

bool WebSocketGatewayHandler::send(const json::object& frame) {
    auto sink = sink_.lock();
    if (!sink || !sink->is_open()) return false;
    return sink->send_text(json::serialize(frame));
}

void WebSocketGatewayHandler::emit(const std::string& name, MetricLabels tags) {
    if (!services_.deps.telemetry) return;
    try {
        tags["connection_id"] = connection_id_;
        services_.deps.telemetry->record_event(name, tags);
    } catch (const std::exception& e) {
        log(Level::DEBUG, Event::DEPENDENCY_FAILURE, std::string("Telemetry failed: ") + e.what());
    }
}

bool WebSocketGatewayHandler::open() {
    if (!services_.origin_validator.validate(upgrade_.origin)) {
        log(Level::WARNING, Event::ORIGIN_REJECTED, "Origin not allowed: " + upgrade_.origin);
        MetricsRegistry::instance().increment_counter("ws_origin_rejected_total");
        finish(ws_close_code_for(ErrorKind::ORIGIN_REJECTED), "Origin not allowed");
        return false;
    }

    AdmitResult admit = services_.admission.try_admit(session_key_);
    if (!admit.accepted) {
        bool per_session = admit.reason == AdmitResult::Reason::PER_SESSION_LIMIT;
        log(Level::WARNING, Event::CONNECTION_REJECTED,
            per_session ? "Per-session connection limit exceeded" : "Global connection limit exceeded");
        finish(per_session ? ws_close_code_for(ErrorKind::ADMISSION_REJECTED) : close_code::SERVER_AT_CAPACITY,
               per_session ? "Connection limit exceeded" : "Server at capacity");
        return false;
    }
    admitted_ = true;

    log(Level::INFO, Event::CONNECTION_OPENED,
        "Accepted (global=" + std::to_string(services_.admission.global_count()) + ")");
    emit("websocket.connection.accepted", {{"origin", upgrade_.origin.empty() ? "unknown" : upgrade_.origin}});

    send({{"type", "system"}, {"message", "connected"}, {"connection_id", connection_id_}});
    welcome_sent_ = true;

    // The stale check runs on this strand and only before cancellation, so `this` is alive.
    HeartbeatTask::StaleCheck stale_check;
    if (services_.config.heartbeat_stale_sec > 0) {
        auto stale_after = std::chrono::seconds(services_.config.heartbeat_stale_sec);
        stale_check = [this, stale_after] {
            auto last = last_heartbeat_at_ > opened_at_ ? last_heartbeat_at_ : opened_at_;
            return std::chrono::system_clock::now() - last > stale_after;
        };
    }
    heartbeat_ = HeartbeatScheduler::start(executor_, sink_,
                                           std::chrono::seconds(services_.config.heartbeat_interval_sec),
                                           std::move(stale_check));
    return true;
}

void WebSocketGatewayHandler::link_session() {
    auto& registry = services_.deps.session_registry;
    if (linked_ || !registry) return;

    try {
        std::string id = registry->get_or_create(session_key_);
        if (!id.empty()) session_id_ = id;
    } catch (const std::exception& e) {
        log(Level::WARNING, Event::DEPENDENCY_FAILURE,
            std::string("Session lookup failed, using session token: ") + e.what());
    }

    try {
        registry->link(connection_id_, session_id_);
        linked_ = true;
    } catch (const std::exception& e) {
        log(Level::WARNING, Event::DEPENDENCY_FAILURE, std::string("Session link failed: ") + e.what());
    }
}

// Forwarded identity headers on the upgrade win; otherwise a JWT-shaped
// session token is validated when a validator exists.
void WebSocketGatewayHandler::authenticate() {
    if (auth_) return;

    if (auto ctx = AuthResolver::resolve_from_headers(upgrade_.headers)) {
        auth_ = std::move(ctx);
        log(Level::INFO, Event::AUTH_SUCCESS, "Forwarded identity accepted");
        return;
    }

    if (upgrade_.session_token.empty() || !AuthResolver::looks_like_jwt(upgrade_.session_token) ||
        !services_.auth_resolver.has_validator()) {
        return;
    }

    auth_ = services_.auth_resolver.resolve_from_token(upgrade_.session_token);
    log(Level::INFO, Event::AUTH_SUCCESS, "Session token validated");
}

void WebSocketGatewayHandler::ensure_setup() {
    if (state_ == State::ACTIVE) return;

    if (!services_.deps.agent_message_handler) {
        throw GatewayError(ErrorKind::ROUTING_ERROR, "Agent service not available, please retry");
    }
    link_session();
    authenticate();

    if (state_ == State::DEGRADED) {
        log(Level::INFO, Event::LIFECYCLE, "Recovered from degraded state");
    }
    state_ = State::ACTIVE;
}

std::string WebSocketGatewayHandler::schema_violation(const json::object& msg) {
    auto text = msg.if_contains("message");
    if (!text || !text->is_string()) {
        return "Field 'message' is required";
    }

    std::string agent_type = string_field(msg, "agent_type");
    if (agent_type != "guide" && agent_type != "liaison") {
        return "Field 'agent_type' must be 'guide' or 'liaison'";
    }
    if (agent_type == "liaison" && string_field(msg, "pillar").empty()) {
        return "Field 'pillar' is required for liaison messages";
    }
    return "";
}

void WebSocketGatewayHandler::on_message(const std::string& text, Continuation next) {
    if (state_ == State::CLOSING || state_ == State::CLOSED) {
        next(false);
        return;
    }

    boost::system::error_code ec;
    json::value parsed = json::parse(text, ec);
    if (ec || !parsed.is_object()) {
        log(Level::WARNING, Event::INVALID_INPUT, "Frame is not a JSON object");
        send(error_frame(::edgegate::to_string(ErrorKind::MALFORMED_REQUEST), "Message must be a JSON object", true));
        next(true);
        return;
    }
    json::object& msg = parsed.as_object();

    // Keepalive traffic never reaches setup, rate limiting or the agent.
    if (string_field(msg, "type") == "heartbeat") {
        std::string action = string_field(msg, "action");
        if (action == "pong") {
            last_heartbeat_at_ = std::chrono::system_clock::now();
        } else if (action == "ping") {
            send({{"type", "heartbeat"}, {"action", "pong"}});
        }
        next(true);
        return;
    }

    const std::string agent_type = string_field(msg, "agent_type", "unknown");

    // Every other frame counts, including those that only retry setup.
    if (!services_.ws_rate_limiter.check_and_record(session_key_)) {
        log(Level::WARNING, Event::RATE_LIMIT_HIT, "Message rate exceeded");
        MetricsRegistry::instance().increment_counter("ws_rate_limited_total");
        json::object frame = error_frame(::edgegate::to_string(ErrorKind::RATE_LIMIT_EXCEEDED),
                                         "Rate limit exceeded. Please slow down your requests.", false);
        frame["agent_type"] = agent_type;
        if (auto conv = msg.if_contains("conversation_id")) frame["conversation_id"] = *conv;
        send(frame);
        finish(ws_close_code_for(ErrorKind::RATE_LIMIT_EXCEEDED), "Rate limit exceeded");
        next(false);
        return;
    }

    try {
        ensure_setup();
    } catch (const GatewayError& e) {
        state_ = State::DEGRADED;
        log(Level::WARNING, Event::DEPENDENCY_FAILURE, std::string("Setup failed: ") + e.what());
        MetricsRegistry::instance().increment_counter("ws_setup_failures_total", {{"kind", ::edgegate::to_string(e.kind())}});
        send(error_frame(::edgegate::to_string(e.kind()), e.what(), true));
        next(true);
        return;
    } catch (const std::exception& e) {
        state_ = State::DEGRADED;
        log(Level::ERROR, Event::DEPENDENCY_FAILURE, std::string("Setup failed: ") + e.what());
        send(error_frame(::edgegate::to_string(ErrorKind::INTERNAL_ERROR), "Setup failed, please retry", true));
        next(true);
        return;
    }

    std::string violation = schema_violation(msg);
    if (!violation.empty()) {
        log(Level::INFO, Event::INVALID_INPUT, violation);
        send(error_frame(::edgegate::to_string(ErrorKind::MALFORMED_REQUEST), violation, true));
        next(true);
        return;
    }

    emit("websocket.message.received", {{"agent_type", agent_type},
                                        {"pillar", string_field(msg, "pillar", "none")}});

    dispatch_to_agent(std::move(msg), agent_type, std::move(next));
}

void WebSocketGatewayHandler::dispatch_to_agent(json::object msg, const std::string& agent_type,
                                                Continuation next) {
    auto agent = services_.deps.agent_message_handler;
    auto message = std::make_shared<const json::object>(std::move(msg));
    auto auth = auth_;
    auto connection_id = connection_id_;

    services_.dependency_pool.submit<json::object>(
        executor_,
        [agent, message, auth, connection_id] {
            return agent->handle(*message, auth, connection_id);
        },
        [this, agent_type, next = std::move(next)](std::exception_ptr error, json::object response) {
            next(on_agent_reply(agent_type, error, std::move(response)));
        });
}

bool WebSocketGatewayHandler::on_agent_reply(const std::string& agent_type, std::exception_ptr error,
                                             json::object response) {
    // Closed while the agent was working: the reply has nowhere to go.
    if (finished_) {
        log(Level::DEBUG, Event::CONNECTION_CLOSED, "Dropping agent reply for closed connection");
        return false;
    }

    if (error) {
        std::string what;
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            what = e.what();
        }
        log(Level::ERROR, Event::INTERNAL_ERROR, "Agent handler failed: " + what);
        json::object frame = error_frame(::edgegate::to_string(ErrorKind::INTERNAL_ERROR),
                                         "Internal error: " + what, false);
        frame["agent_type"] = agent_type;
        send(frame);
        finish(ws_close_code_for(ErrorKind::INTERNAL_ERROR), "Internal error");
        return false;
    }

    messages_handled_++;
    MetricsRegistry::instance().increment_counter("ws_messages_total", {{"agent_type", agent_type}});
    send(response);
    return true;
}

void WebSocketGatewayHandler::on_disconnect(const std::string& reason) {
    if (finished_) return;
    log(Level::INFO, Event::CONNECTION_CLOSED, "Peer disconnected: " + reason);
    finish(1000, reason);
}

void WebSocketGatewayHandler::finish(uint16_t code, const std::string& reason) {
    if (finished_) return;
    finished_ = true;
    state_ = State::CLOSING;

    try {
        if (heartbeat_) heartbeat_->cancel();
    } catch (const std::exception& e) {
        log(Level::ERROR, Event::INTERNAL_ERROR, std::string("Heartbeat cancel failed: ") + e.what());
    }

    try {
        if (admitted_) {
            services_.admission.release(session_key_);
            admitted_ = false;
        }
    } catch (const std::exception& e) {
        log(Level::ERROR, Event::INTERNAL_ERROR, std::string("Admission release failed: ") + e.what());
    }

    try {
        if (linked_ && services_.deps.session_registry) {
            linked_ = false;
            services_.deps.session_registry->unlink(connection_id_);
        }
    } catch (const std::exception& e) {
        log(Level::WARNING, Event::DEPENDENCY_FAILURE, std::string("Session unlink failed: ") + e.what());
    }

    try {
        auto sink = sink_.lock();
        if (sink && sink->is_open()) sink->close(code, reason);
    } catch (const std::exception& e) {
        log(Level::WARNING, Event::INTERNAL_ERROR, std::string("Socket close failed: ") + e.what());
    }

    try {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - opened_at_).count();
        emit("websocket.connection.closed", {{"close_code", std::to_string(code)},
                                             {"duration_ms", std::to_string(duration)},
                                             {"messages", std::to_string(messages_handled_)}});
    } catch (const std::exception& e) {
        log(Level::DEBUG, Event::DEPENDENCY_FAILURE, std::string("Close telemetry failed: ") + e.what());
    }

    state_ = State::CLOSED;
    log(Level::INFO, Event::CONNECTION_CLOSED, "Closed with " + std::to_string(code) + " (" + reason + ")");
}

}
