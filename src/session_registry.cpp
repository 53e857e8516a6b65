#include "session_registry.hpp"
#include "gateway_error.hpp"
#include "metrics.hpp"

#include <iomanip>
#include <sstream>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace edgegate {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string connections_key(const std::string& session_id) {
    return "eg:session:" + session_id + ":connections";
}

}

RedisSessionRegistry::RedisSessionRegistry(const std::string& redis_url, std::chrono::seconds session_ttl)
    : redis_(std::make_unique<sw::redis::Redis>(redis_url))
    , session_ttl_(session_ttl)
{}

bool RedisSessionRegistry::ping() {
    try {
        return redis_->ping() == "PONG";
    } catch (const sw::redis::Error&) {
        return false;
    }
}

std::string RedisSessionRegistry::token_key(const std::string& session_token) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(session_token.data()), session_token.size(), hash);
    return "eg:session:" + to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string RedisSessionRegistry::new_session_id() {
    unsigned char bytes[12];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw GatewayError(ErrorKind::INTERNAL_ERROR, "CSPRNG failure generating session id");
    }
    return "sess_" + to_hex(bytes, sizeof(bytes));
}

// SET NX makes concurrent callers for the same token agree on one id.
std::string RedisSessionRegistry::get_or_create(const std::string& session_token) {
    const std::string key = token_key(session_token);

    auto existing = redis_->get(key);
    if (existing) {
        redis_->expire(key, session_ttl_);
        return *existing;
    }

    std::string id = new_session_id();
    if (redis_->set(key, id, session_ttl_, sw::redis::UpdateType::NOT_EXIST)) {
        MetricsRegistry::instance().increment_counter("session_registry_created_total");
        return id;
    }

    auto winner = redis_->get(key);
    if (!winner) {
        throw GatewayError(ErrorKind::INTERNAL_ERROR, "Session key vanished during creation");
    }
    return *winner;
}

void RedisSessionRegistry::link(const std::string& connection_id, const std::string& session_id) {
    auto pipe = redis_->pipeline();
    pipe.set("eg:ws:" + connection_id, session_id, session_ttl_)
        .sadd(connections_key(session_id), connection_id)
        .expire(connections_key(session_id), session_ttl_);
    pipe.exec();
}

void RedisSessionRegistry::unlink(const std::string& connection_id) {
    const std::string ws_key = "eg:ws:" + connection_id;
    auto session_id = redis_->get(ws_key);
    redis_->del(ws_key);
    if (session_id) {
        redis_->srem(connections_key(*session_id), connection_id);
    }
}

long long RedisSessionRegistry::connection_count(const std::string& session_id) {
    return redis_->scard(connections_key(session_id));
}

}
