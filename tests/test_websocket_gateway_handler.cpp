#include <gtest/gtest.h>
#include "websocket_gateway_handler.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/optional.hpp>
#include <set>
#include <thread>

using namespace edgegate;
using namespace edgegate::test;
namespace json = boost::json;

namespace {

ServerConfig test_config() {
    ServerConfig config;
    config.allowed_origins = {"https://app.example.com"};
    config.max_connections_per_user = 2;
    config.max_global_connections = 10;
    config.ws_max_per_second = 3;
    config.ws_max_per_minute = 100;
    config.heartbeat_interval_sec = 30;
    config.dependency_threads = 0;  // agent replies complete inline
    return config;
}

std::string chat(const std::string& text, const std::string& agent_type = "guide") {
    return json::serialize(json::object{
        {"message", text},
        {"agent_type", agent_type},
        {"conversation_id", "conv-1"}
    });
}

}

class WebSocketGatewayHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        build(test_config());
    }

    void build(ServerConfig config) {
        handlers.clear();
        services.reset();
        GatewayDependencies deps;
        deps.agent_message_handler = agent;
        deps.telemetry = telemetry;
        deps.session_registry = registry;
        deps.token_validator = validator;
        services = std::make_unique<GatewayServices>(std::move(config), std::move(deps));
    }

    WebSocketGatewayHandler& connect(std::shared_ptr<FakeSink> s, const std::string& token = "tok-1",
                                     const std::string& origin = "https://app.example.com",
                                     HeaderMap headers = {}) {
        UpgradeRequest upgrade{origin, token, std::move(headers), "198.51.100.4"};
        handlers.push_back(std::make_unique<WebSocketGatewayHandler>(
            *services, ioc.get_executor(), s, std::move(upgrade)));
        return *handlers.back();
    }

    // Delivers one frame and waits for the handler to decide whether to keep reading.
    bool deliver(WebSocketGatewayHandler& h, const std::string& text) {
        boost::optional<bool> keep_reading;
        deliver(h, text, [&keep_reading](bool keep) { keep_reading = keep; });
        for (int i = 0; i < 50 && !keep_reading; ++i) {
            ioc.restart();
            ioc.run_one_for(std::chrono::milliseconds(100));
        }
        EXPECT_TRUE(keep_reading.has_value());
        return keep_reading.value_or(false);
    }

    // Declared first so timers never outlive their io_context.
    boost::asio::io_context ioc;
    std::shared_ptr<FakeAgent> agent = std::make_shared<FakeAgent>();
    std::shared_ptr<FakeTelemetry> telemetry = std::make_shared<FakeTelemetry>();
    std::shared_ptr<FakeRegistry> registry = std::make_shared<FakeRegistry>();
    std::shared_ptr<FakeValidator> validator = std::make_shared<FakeValidator>();
    std::unique_ptr<GatewayServices> services;
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    std::vector<std::unique_ptr<WebSocketGatewayHandler>> handlers;

    void TearDown() override {
        handlers.clear();
    }
};

TEST_F(WebSocketGatewayHandlerTest, OpenSendsWelcomeAndStartsHeartbeat) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACCEPTED);
    EXPECT_EQ(h.connection_id().rfind("ws_", 0), 0u);
    EXPECT_EQ(h.connection_id().size(), 3u + 16u);
    ASSERT_EQ(sink->frames.size(), 1u);
    auto welcome = sink->frame(0);
    EXPECT_EQ(welcome.at("type").as_string(), "system");
    EXPECT_EQ(welcome.at("message").as_string(), "connected");
    EXPECT_EQ(welcome.at("connection_id").as_string(), h.connection_id());

    ASSERT_NE(h.heartbeat(), nullptr);
    EXPECT_TRUE(h.heartbeat()->running());
    EXPECT_EQ(services->admission.session_count("tok-1"), 1u);
    EXPECT_EQ(telemetry->count("websocket.connection.accepted"), 1u);
}

TEST_F(WebSocketGatewayHandlerTest, OriginRejectedBeforeAdmission) {
    auto& h = connect(sink, "tok-1", "https://evil.example.net");
    EXPECT_FALSE(h.open());

    EXPECT_EQ(sink->close_code, close_code::ORIGIN_REJECTED);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::CLOSED);
    EXPECT_EQ(services->admission.global_count(), 0u);
    EXPECT_TRUE(sink->frames.empty());
    EXPECT_EQ(h.heartbeat(), nullptr);
}

TEST_F(WebSocketGatewayHandlerTest, PerSessionLimitCloses4004) {
    auto s1 = std::make_shared<FakeSink>();
    auto s2 = std::make_shared<FakeSink>();
    auto s3 = std::make_shared<FakeSink>();
    EXPECT_TRUE(connect(s1).open());
    EXPECT_TRUE(connect(s2).open());
    EXPECT_FALSE(connect(s3).open());

    EXPECT_EQ(s3->close_code, close_code::PER_USER_LIMIT);
    EXPECT_TRUE(s3->frames.empty());
    EXPECT_EQ(services->admission.session_count("tok-1"), 2u);
    EXPECT_EQ(services->admission.global_count(), 2u);
    EXPECT_EQ(services->admission.per_session_sum(), services->admission.global_count());
}

TEST_F(WebSocketGatewayHandlerTest, GlobalLimitCloses4005) {
    auto config = test_config();
    config.max_global_connections = 1;
    build(config);

    auto s1 = std::make_shared<FakeSink>();
    auto s2 = std::make_shared<FakeSink>();
    EXPECT_TRUE(connect(s1, "a").open());
    EXPECT_FALSE(connect(s2, "b").open());
    EXPECT_EQ(s2->close_code, close_code::SERVER_AT_CAPACITY);
}

TEST_F(WebSocketGatewayHandlerTest, ClosingReleasesAdmissionSlot) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());
    h.on_disconnect("peer closed");

    EXPECT_EQ(services->admission.global_count(), 0u);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::CLOSED);
    EXPECT_EQ(telemetry->count("websocket.connection.closed"), 1u);
}

TEST_F(WebSocketGatewayHandlerTest, MessageIsForwardedToAgent) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, chat("hello")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
    EXPECT_EQ(agent->calls.load(), 1);
    EXPECT_EQ(agent->last_connection_id, h.connection_id());
    EXPECT_EQ(agent->last_message.at("message").as_string(), "hello");

    auto reply = sink->last_frame();
    EXPECT_EQ(reply.at("type").as_string(), "response");
    EXPECT_EQ(reply.at("echo").as_string(), "hello");
    EXPECT_EQ(telemetry->count("websocket.message.received"), 1u);
}

TEST_F(WebSocketGatewayHandlerTest, PongUpdatesHeartbeatAndIsNotForwarded) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());
    EXPECT_EQ(h.last_heartbeat_at(), std::chrono::system_clock::time_point{});

    EXPECT_TRUE(deliver(h, R"({"type":"heartbeat","action":"pong"})"));

    EXPECT_NE(h.last_heartbeat_at(), std::chrono::system_clock::time_point{});
    EXPECT_EQ(agent->calls.load(), 0);
    EXPECT_EQ(sink->frames.size(), 1u);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACCEPTED);
    EXPECT_EQ(services->ws_rate_limiter.window_size("tok-1"), 0u);
}

TEST_F(WebSocketGatewayHandlerTest, ClientPingGetsPong) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());
    EXPECT_TRUE(deliver(h, R"({"type":"heartbeat","action":"ping"})"));

    auto pong = sink->last_frame();
    EXPECT_EQ(pong.at("type").as_string(), "heartbeat");
    EXPECT_EQ(pong.at("action").as_string(), "pong");
    EXPECT_EQ(agent->calls.load(), 0);
}

TEST_F(WebSocketGatewayHandlerTest, DegradedRecoversWithoutSecondWelcome) {
    services->deps.agent_message_handler = nullptr;
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, chat("first")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::DEGRADED);
    auto err = sink->last_frame();
    EXPECT_EQ(err.at("type").as_string(), "error");
    EXPECT_EQ(err.at("code").as_string(), "routing_error");
    EXPECT_TRUE(err.at("recoverable").as_bool());
    EXPECT_TRUE(sink->is_open());

    services->deps.agent_message_handler = agent;
    EXPECT_TRUE(deliver(h, chat("second")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
    EXPECT_EQ(agent->calls.load(), 1);
    EXPECT_EQ(agent->last_message.at("message").as_string(), "second");

    size_t welcomes = 0;
    for (size_t i = 0; i < sink->frames.size(); ++i) {
        if (sink->frame(i).at("type").as_string() == "system") ++welcomes;
    }
    EXPECT_EQ(welcomes, 1u);
}

TEST_F(WebSocketGatewayHandlerTest, RejectedTokenDegradesThenRecovers) {
    validator->reject = true;
    auto& h = connect(sink, "eyJhbGciOiJIUzI1NiJ9.eyJzdWIiOiJ1In0.c2ln");
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, chat("hi")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::DEGRADED);
    EXPECT_EQ(sink->last_frame().at("code").as_string(), "invalid_token");
    EXPECT_EQ(agent->calls.load(), 0);

    validator->reject = false;
    EXPECT_TRUE(deliver(h, chat("hi again")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
    ASSERT_NE(agent->last_auth, nullptr);
    EXPECT_EQ(agent->last_auth->user_id, "jwt-user");
}

TEST_F(WebSocketGatewayHandlerTest, ForwardedIdentityHeadersUsed) {
    HeaderMap headers{{"X-User-Id", "header-user"}, {"X-Tenant-Id", "t9"}};
    auto& h = connect(sink, "opaque-token", "https://app.example.com", headers);
    ASSERT_TRUE(h.open());
    EXPECT_TRUE(deliver(h, chat("hi")));

    ASSERT_NE(h.auth_context(), nullptr);
    EXPECT_EQ(h.auth_context()->user_id, "header-user");
    EXPECT_EQ(validator->calls, 0);
}

TEST_F(WebSocketGatewayHandlerTest, OpaqueTokenStaysAnonymous) {
    auto& h = connect(sink, "opaque-token");
    ASSERT_TRUE(h.open());
    EXPECT_TRUE(deliver(h, chat("hi")));
    EXPECT_EQ(h.auth_context(), nullptr);
    EXPECT_EQ(validator->calls, 0);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
}

TEST_F(WebSocketGatewayHandlerTest, SessionLinkedAndUnlinked) {
    auto& h = connect(sink, "tok-9");
    ASSERT_TRUE(h.open());
    EXPECT_TRUE(deliver(h, chat("hi")));

    EXPECT_EQ(h.session_id(), "sess_tok-9");
    ASSERT_EQ(registry->links.size(), 1u);
    EXPECT_EQ(registry->links[0].first, h.connection_id());

    std::string conn = h.connection_id();
    h.on_disconnect("bye");
    ASSERT_EQ(registry->unlinks.size(), 1u);
    EXPECT_EQ(registry->unlinks[0], conn);
}

TEST_F(WebSocketGatewayHandlerTest, RegistryFailureIsNotFatal) {
    registry->fail = true;
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());
    EXPECT_TRUE(deliver(h, chat("hi")));

    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
    EXPECT_EQ(h.session_id(), "tok-1");
    EXPECT_EQ(agent->calls.load(), 1);
    h.on_disconnect("bye");
    EXPECT_TRUE(registry->unlinks.empty());
}

TEST_F(WebSocketGatewayHandlerTest, SchemaViolationsAreRecoverable) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, R"({"agent_type":"guide"})"));
    EXPECT_EQ(sink->last_frame().at("code").as_string(), "malformed_request");

    EXPECT_TRUE(deliver(h, R"({"message":"x","agent_type":"oracle"})"));
    EXPECT_TRUE(sink->last_frame().at("recoverable").as_bool());

    EXPECT_TRUE(deliver(h, R"({"message":"x","agent_type":"liaison"})"));
    EXPECT_EQ(sink->last_frame().at("code").as_string(), "malformed_request");

    EXPECT_TRUE(deliver(h, R"({"message":"x","agent_type":"liaison","pillar":"content"})"));
    EXPECT_EQ(agent->calls.load(), 1);
    EXPECT_TRUE(sink->is_open());
}

TEST_F(WebSocketGatewayHandlerTest, InvalidJsonIsRecoverable) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, "{not json"));
    EXPECT_TRUE(deliver(h, "[1,2]"));
    auto err = sink->last_frame();
    EXPECT_EQ(err.at("code").as_string(), "malformed_request");
    EXPECT_TRUE(err.at("recoverable").as_bool());
    EXPECT_TRUE(sink->is_open());
}

TEST_F(WebSocketGatewayHandlerTest, RateLimitClosesWith4029) {
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, chat("1")));
    EXPECT_TRUE(deliver(h, chat("2")));
    EXPECT_TRUE(deliver(h, chat("3")));
    EXPECT_FALSE(deliver(h, chat("4")));

    auto err = sink->last_frame();
    EXPECT_EQ(err.at("code").as_string(), "rate_limit_exceeded");
    EXPECT_FALSE(err.at("recoverable").as_bool());
    EXPECT_EQ(err.at("agent_type").as_string(), "guide");
    EXPECT_EQ(err.at("conversation_id").as_string(), "conv-1");

    EXPECT_EQ(sink->close_code, close_code::RATE_LIMITED);
    EXPECT_EQ(agent->calls.load(), 3);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::CLOSED);
    EXPECT_EQ(services->admission.global_count(), 0u);

    // The rejected message produced no receive event
    EXPECT_EQ(telemetry->count("websocket.message.received"), 3u);
    EXPECT_EQ(telemetry->count("websocket.connection.closed"), 1u);

    // Nothing is processed after closing
    EXPECT_FALSE(deliver(h, chat("5")));
    EXPECT_EQ(agent->calls.load(), 3);
}

// Frames that only retry setup still count against the session's rate.
TEST_F(WebSocketGatewayHandlerTest, DegradedRetriesAreRateLimited) {
    services->deps.agent_message_handler = nullptr;
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_TRUE(deliver(h, chat("1")));
    EXPECT_TRUE(deliver(h, chat("2")));
    EXPECT_TRUE(deliver(h, chat("3")));
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::DEGRADED);
    EXPECT_EQ(services->ws_rate_limiter.window_size("tok-1"), 3u);

    EXPECT_FALSE(deliver(h, chat("4")));
    EXPECT_EQ(sink->last_frame().at("code").as_string(), "rate_limit_exceeded");
    EXPECT_EQ(sink->close_code, close_code::RATE_LIMITED);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::CLOSED);
    EXPECT_EQ(services->admission.global_count(), 0u);
}

TEST_F(WebSocketGatewayHandlerTest, AgentCallRunsOnDependencyPool) {
    auto config = test_config();
    config.dependency_threads = 2;
    build(config);
    agent->delay = std::chrono::milliseconds(50);

    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    boost::optional<bool> keep_reading;
    h.on_message(chat("slow"), [&keep_reading](bool keep) { keep_reading = keep; });

    // The reply is posted to this io_context, so nothing resumes reading until it runs.
    EXPECT_FALSE(keep_reading.has_value());
    EXPECT_EQ(sink->frames.size(), 1u);

    for (int i = 0; i < 50 && !keep_reading; ++i) {
        ioc.restart();
        ioc.run_one_for(std::chrono::milliseconds(100));
    }
    ASSERT_TRUE(keep_reading.has_value());
    EXPECT_TRUE(*keep_reading);
    EXPECT_NE(agent->last_thread, std::this_thread::get_id());
    EXPECT_EQ(sink->last_frame().at("echo").as_string(), "slow");
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::ACTIVE);
}

TEST_F(WebSocketGatewayHandlerTest, ReplyAfterDisconnectIsDropped) {
    auto config = test_config();
    config.dependency_threads = 1;
    build(config);
    agent->delay = std::chrono::milliseconds(50);

    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    boost::optional<bool> keep_reading;
    h.on_message(chat("late"), [&keep_reading](bool keep) { keep_reading = keep; });
    h.on_disconnect("gone");
    EXPECT_EQ(services->admission.global_count(), 0u);

    for (int i = 0; i < 50 && !keep_reading; ++i) {
        ioc.restart();
        ioc.run_one_for(std::chrono::milliseconds(100));
    }
    ASSERT_TRUE(keep_reading.has_value());
    EXPECT_FALSE(*keep_reading);
    EXPECT_EQ(agent->calls.load(), 1);
    EXPECT_EQ(sink->frames.size(), 1u);
    EXPECT_EQ(h.state(), WebSocketGatewayHandler::State::CLOSED);
}

TEST_F(WebSocketGatewayHandlerTest, AgentFailureClosesWith4006) {
    agent->fail = true;
    auto& h = connect(sink);
    ASSERT_TRUE(h.open());

    EXPECT_FALSE(deliver(h, chat("boom")));
    auto err = sink->last_frame();
    EXPECT_EQ(err.at("type").as_string(), "error");
    EXPECT_FALSE(err.at("recoverable").as_bool());
    EXPECT_EQ(sink->close_code, close_code::INTERNAL_ERROR);
    EXPECT_EQ(services->admission.global_count(), 0u);
}

TEST_F(WebSocketGatewayHandlerTest, HeartbeatCancelledExactlyOnceOnEveryExitPath) {
    // Peer disconnect, then destruction
    {
        auto s = std::make_shared<FakeSink>();
        auto& h = connect(s, "a");
        ASSERT_TRUE(h.open());
        auto hb = h.heartbeat();
        h.on_disconnect("gone");
        h.finish(1000, "again");
        handlers.clear();
        EXPECT_EQ(hb->cancel_requests(), 1u);
        EXPECT_TRUE(hb->cancelled());
        EXPECT_EQ(s->close_calls, 1);
    }
    // Rate limit close
    {
        auto s = std::make_shared<FakeSink>();
        auto& h = connect(s, "b");
        ASSERT_TRUE(h.open());
        auto hb = h.heartbeat();
        for (int i = 0; i < 4; ++i) deliver(h, chat("x"));
        handlers.clear();
        EXPECT_EQ(hb->cancel_requests(), 1u);
    }
    // Agent failure close
    {
        agent->fail = true;
        auto s = std::make_shared<FakeSink>();
        auto& h = connect(s, "c");
        ASSERT_TRUE(h.open());
        auto hb = h.heartbeat();
        deliver(h, chat("x"));
        handlers.clear();
        EXPECT_EQ(hb->cancel_requests(), 1u);
        agent->fail = false;
    }
    // Destruction without any explicit close
    {
        auto s = std::make_shared<FakeSink>();
        auto& h = connect(s, "d");
        ASSERT_TRUE(h.open());
        auto hb = h.heartbeat();
        handlers.clear();
        EXPECT_EQ(hb->cancel_requests(), 1u);
        EXPECT_EQ(s->close_code, 1001);
    }
    EXPECT_EQ(services->admission.global_count(), 0u);
}

TEST_F(WebSocketGatewayHandlerTest, ConcurrentOpensRespectPerSessionCap) {
    auto config = test_config();
    config.max_connections_per_user = 5;
    build(config);

    std::vector<std::shared_ptr<FakeSink>> sinks;
    int accepted = 0;
    for (int i = 0; i < 6; ++i) {
        sinks.push_back(std::make_shared<FakeSink>());
        if (connect(sinks.back(), "S").open()) ++accepted;
    }
    EXPECT_EQ(accepted, 5);
    EXPECT_EQ(sinks.back()->close_code, close_code::PER_USER_LIMIT);
    EXPECT_EQ(services->admission.per_session_sum(), services->admission.global_count());
}

TEST(WebSocketGatewayHandlerStaticTest, ErrorFrameShape) {
    auto frame = WebSocketGatewayHandler::error_frame("routing_error", "try later", true);
    EXPECT_EQ(frame.at("type").as_string(), "error");
    EXPECT_EQ(frame.at("code").as_string(), "routing_error");
    EXPECT_EQ(frame.at("message").as_string(), "try later");
    EXPECT_TRUE(frame.at("recoverable").as_bool());
}

TEST(WebSocketGatewayHandlerStaticTest, ConnectionIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) ids.insert(WebSocketGatewayHandler::generate_connection_id());
    EXPECT_EQ(ids.size(), 100u);
}

TEST(WebSocketGatewayHandlerStaticTest, ErrorKindMappings) {
    EXPECT_EQ(ws_close_code_for(ErrorKind::ORIGIN_REJECTED), close_code::ORIGIN_REJECTED);
    EXPECT_EQ(ws_close_code_for(ErrorKind::ADMISSION_REJECTED), close_code::PER_USER_LIMIT);
    EXPECT_EQ(ws_close_code_for(ErrorKind::RATE_LIMIT_EXCEEDED), close_code::RATE_LIMITED);
    EXPECT_EQ(ws_close_code_for(ErrorKind::ROUTING_ERROR), close_code::INTERNAL_ERROR);
    EXPECT_EQ(ws_close_code_for(ErrorKind::INTERNAL_ERROR), close_code::INTERNAL_ERROR);
    EXPECT_EQ(ws_close_code_for(ErrorKind::INVALID_TOKEN), 0);

    EXPECT_EQ(http_status_for(ErrorKind::ORIGIN_REJECTED), 403u);
    EXPECT_EQ(http_status_for(ErrorKind::ADMISSION_REJECTED), 503u);
    EXPECT_EQ(http_status_for(ErrorKind::AUTHENTICATION_REQUIRED), 401u);
    EXPECT_EQ(http_status_for(ErrorKind::RATE_LIMIT_EXCEEDED), 429u);
    EXPECT_EQ(http_status_for(ErrorKind::MALFORMED_REQUEST), 400u);
    EXPECT_STREQ(to_string(ErrorKind::ORIGIN_REJECTED), "origin_rejected");
}
