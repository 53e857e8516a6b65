#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "gateway_dependencies.hpp"

namespace edgegate {

// SessionRegistry kept in Redis.
//
//   eg:session:<sha256(token)>      -> session id           (TTL session_ttl)
//   eg:ws:<connection id>           -> session id           (TTL session_ttl)
//   eg:session:<id>:connections     -> set of connection ids
//
// redis++ errors propagate as sw::redis::Error; the gateway treats every
// registry failure as non-fatal.
class RedisSessionRegistry : public SessionRegistry {
public:
    explicit RedisSessionRegistry(const std::string& redis_url,
                                  std::chrono::seconds session_ttl = std::chrono::hours(24));

    std::string get_or_create(const std::string& session_token) override;
    void link(const std::string& connection_id, const std::string& session_id) override;
    void unlink(const std::string& connection_id) override;

    // Number of connections currently linked to a session.
    long long connection_count(const std::string& session_id);

    // True when the server answers PING.
    bool ping();

    static std::string token_key(const std::string& session_token);

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::chrono::seconds session_ttl_;

    static std::string new_session_id();
};

}
