#pragma once

#include <memory>
#include <string>
#include <boost/json.hpp>

#include "auth_context.hpp"
#include "metrics.hpp"
#include "request_envelope.hpp"

namespace edgegate {

// Validates a bearer/session token. Throws GatewayError with
// INVALID_TOKEN or AUTH_SERVICE_UNAVAILABLE.
class TokenValidator {
public:
    virtual ~TokenValidator() = default;
    virtual AuthContext validate(const std::string& token) = 0;
};

// Business-layer entry point for HTTP requests. Throws on routing failure.
class RequestRouter {
public:
    virtual ~RequestRouter() = default;
    virtual boost::json::value route(const RequestEnvelope& envelope, const AuthContextPtr& auth) = 0;
};

// Business-layer entry point for agent chat messages; returns the response frame.
class AgentMessageHandler {
public:
    virtual ~AgentMessageHandler() = default;
    virtual boost::json::object handle(const boost::json::object& message,
                                       const AuthContextPtr& auth,
                                       const std::string& connection_id) = 0;
};

// Fire-and-forget event sink. Implementations must not block the caller.
class TelemetryEmitter {
public:
    virtual ~TelemetryEmitter() = default;
    virtual void record_event(const std::string& name, const MetricLabels& tags) = 0;
};

// External registry linking WebSocket connections to user sessions.
class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;
    virtual std::string get_or_create(const std::string& session_token) = 0;
    virtual void link(const std::string& connection_id, const std::string& session_id) = 0;
    virtual void unlink(const std::string& connection_id) = 0;
};

// Collaborators injected at construction. A null member means the
// collaborator is not available in this deployment.
struct GatewayDependencies {
    std::shared_ptr<TokenValidator> token_validator;
    std::shared_ptr<RequestRouter> request_router;
    std::shared_ptr<AgentMessageHandler> agent_message_handler;
    std::shared_ptr<TelemetryEmitter> telemetry;
    std::shared_ptr<SessionRegistry> session_registry;
};

}
