#pragma once

#include <chrono>
#include <string>
#include <boost/json.hpp>

#include "gateway_dependencies.hpp"

namespace edgegate {

// Relays gateway traffic to the business layer as JSON over HTTP/1.1.
//   RequestRouter        -> POST <base>/route          body: envelope payload
//   AgentMessageHandler  -> POST <base>/agent/message  body: {message, connection_id, user_context}
// Calls block the calling thread for at most the configured timeout, so the
// gateway runs them on its DependencyPool. Connection failures and non-2xx
// replies throw GatewayError ROUTING_ERROR.
class UpstreamClient : public RequestRouter, public AgentMessageHandler {
public:
    struct Endpoint {
        std::string host;
        std::string port;
        std::string base_path;
    };

    UpstreamClient(const std::string& base_url, std::chrono::seconds timeout);

    boost::json::value route(const RequestEnvelope& envelope, const AuthContextPtr& auth) override;

    boost::json::object handle(const boost::json::object& message,
                               const AuthContextPtr& auth,
                               const std::string& connection_id) override;

    boost::json::value post_json(const std::string& path, const boost::json::value& body);

    // Accepts "http://host[:port][/base]". Throws std::invalid_argument otherwise.
    static Endpoint parse_url(const std::string& url);

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Endpoint endpoint_;
    std::chrono::seconds timeout_;
};

}
