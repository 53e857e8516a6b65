#include <gtest/gtest.h>
#include "upstream_client.hpp"
#include "gateway_error.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <set>
#include <stdexcept>
#include <thread>

using namespace edgegate;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace json = boost::json;
using tcp = net::ip::tcp;

namespace {

// Answers exactly one request with a canned status and body, remembering what it received.
class OneShotServer {
public:
    OneShotServer(http::status status, std::string body)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        thread_ = std::thread([this, status, body = std::move(body)] {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) return;

            beast::flat_buffer buffer;
            http::read(socket, buffer, received, ec);
            if (ec) return;

            http::response<http::string_body> res{status, 11};
            res.set(http::field::content_type, "application/json");
            res.body() = body;
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });
    }

    ~OneShotServer() { thread_.join(); }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/svc/";
    }

    http::request<http::string_body> received;

private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
};

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        return e.kind();
    }
    return ErrorKind::INTERNAL_ERROR;
}

}

TEST(UpstreamClientTest, ParseUrl) {
    auto ep = UpstreamClient::parse_url("http://business.internal:9000/api/");
    EXPECT_EQ(ep.host, "business.internal");
    EXPECT_EQ(ep.port, "9000");
    EXPECT_EQ(ep.base_path, "/api");

    ep = UpstreamClient::parse_url("http://localhost");
    EXPECT_EQ(ep.host, "localhost");
    EXPECT_EQ(ep.port, "80");
    EXPECT_EQ(ep.base_path, "");

    EXPECT_THROW(UpstreamClient::parse_url("https://secure.example"), std::invalid_argument);
    EXPECT_THROW(UpstreamClient::parse_url("http://"), std::invalid_argument);
    EXPECT_THROW(UpstreamClient::parse_url("http://host:/x"), std::invalid_argument);
}

TEST(UpstreamClientTest, AgentMessageRoundTrip) {
    OneShotServer server(http::status::ok, R"({"type":"response","message":"hi there"})");
    UpstreamClient client(server.url(), std::chrono::seconds(5));

    auto auth = std::make_shared<const AuthContext>("u-1", "t-1", std::set<std::string>{},
                                                    std::set<std::string>{},
                                                    AuthContext::Origin::FORWARD_AUTH);
    json::object reply = client.handle({{"message", "hello"}, {"agent_type", "guide"}}, auth, "ws_abc");
    EXPECT_EQ(reply.at("message").as_string(), "hi there");

    EXPECT_EQ(server.received.target(), "/svc/agent/message");
    auto sent = json::parse(server.received.body()).as_object();
    EXPECT_EQ(sent.at("connection_id").as_string(), "ws_abc");
    EXPECT_EQ(sent.at("message").as_object().at("message").as_string(), "hello");
    EXPECT_EQ(sent.at("user_context").as_object().at("user_id").as_string(), "u-1");
}

TEST(UpstreamClientTest, RoutePostsEnvelopePayload) {
    OneShotServer server(http::status::ok, R"({"success":true})");
    UpstreamClient client(server.url(), std::chrono::seconds(5));

    RequestEnvelope env;
    env.method = "GET";
    env.path = "/api/v1/insights/list";
    json::value result = client.route(env, nullptr);
    EXPECT_TRUE(result.as_object().at("success").as_bool());

    EXPECT_EQ(server.received.target(), "/svc/route");
    auto sent = json::parse(server.received.body()).as_object();
    EXPECT_EQ(sent.at("endpoint").as_string(), "/api/v1/insights/list");
    EXPECT_EQ(sent.at("user_id").as_string(), "anonymous");
}

TEST(UpstreamClientTest, ErrorStatusIsRoutingError) {
    OneShotServer server(http::status::bad_gateway, R"({"error":"down"})");
    UpstreamClient client(server.url(), std::chrono::seconds(5));
    EXPECT_EQ(kind_of([&] { client.post_json("/route", json::object{}); }), ErrorKind::ROUTING_ERROR);
}

TEST(UpstreamClientTest, NonObjectAgentReplyRejected) {
    OneShotServer server(http::status::ok, "[1,2,3]");
    UpstreamClient client(server.url(), std::chrono::seconds(5));
    EXPECT_EQ(kind_of([&] { client.handle({{"message", "x"}}, nullptr, "ws_1"); }), ErrorKind::ROUTING_ERROR);
}

TEST(UpstreamClientTest, ConnectionRefusedIsRoutingError) {
    unsigned short port;
    {
        net::io_context ioc;
        tcp::acceptor scratch(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = scratch.local_endpoint().port();
    }
    UpstreamClient client("http://127.0.0.1:" + std::to_string(port), std::chrono::seconds(2));
    EXPECT_EQ(kind_of([&] { client.post_json("/route", json::object{}); }), ErrorKind::ROUTING_ERROR);
}
