#pragma once

#include <memory>
#include <set>
#include <string>
#include <boost/json.hpp>

namespace edgegate {

// Resolved caller identity. Instances are immutable once built and are
// shared as AuthContextPtr.
struct AuthContext {
    enum class Origin {
        FORWARD_AUTH,
        LOCAL_VALIDATION
    };

    const std::string user_id;
    const std::string tenant_id;
    const std::set<std::string> roles;
    const std::set<std::string> permissions;
    const Origin origin;

    AuthContext(std::string user, std::string tenant,
                std::set<std::string> role_set, std::set<std::string> permission_set,
                Origin source)
        : user_id(std::move(user))
        , tenant_id(std::move(tenant))
        , roles(std::move(role_set))
        , permissions(std::move(permission_set))
        , origin(source)
    {}

    bool has_role(const std::string& role) const { return roles.count(role) > 0; }
    bool has_permission(const std::string& permission) const { return permissions.count(permission) > 0; }

    // {user_id, tenant_id, roles, permissions, session_id} as handed downstream.
    boost::json::object to_json(const std::string& session_id) const {
        boost::json::object obj;
        obj["user_id"] = user_id;
        obj["tenant_id"] = tenant_id.empty() ? boost::json::value(nullptr) : boost::json::value(tenant_id);
        boost::json::array role_list;
        for (const auto& r : roles) role_list.emplace_back(r);
        boost::json::array permission_list;
        for (const auto& p : permissions) permission_list.emplace_back(p);
        obj["roles"] = std::move(role_list);
        obj["permissions"] = std::move(permission_list);
        obj["session_id"] = session_id.empty() ? boost::json::value(nullptr) : boost::json::value(session_id);
        return obj;
    }
};

using AuthContextPtr = std::shared_ptr<const AuthContext>;

}
