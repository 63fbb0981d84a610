#pragma once

#include "Request.h"
#include "Response.h"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "auth/Policy.h"

// Method + path pattern dispatch. A pattern segment written "{name}" matches any one
// non-empty segment and is captured under that name; literal segments win over captures.
class Router {
public:
    using Params = std::unordered_map<std::string, std::string>;

    struct Context {
        Params params;
        Params query;
        std::optional<auth::Caller> caller;
    };

    // Must be called exactly once, possibly after the handler returned.
    using Reply = std::function<void(Response)>;
    using Handler = std::function<Response(const Request&)>;
    using AsyncHandler = std::function<void(const Request&, const Context&, Reply)>;

    enum class Access { open, authenticated };

    void add_route(std::string method, std::string pattern, Handler h);
    void add_async_route(std::string method, std::string pattern, AsyncHandler h, Access access = Access::authenticated);

    void dispatch(const Request& req, const std::optional<auth::Caller>& caller, Reply reply) const;

    // Synchronous convenience; routes that reply later yield 500.
    Response route(const Request& req, const std::optional<auth::Caller>& caller = std::nullopt) const;

    // The matched pattern, for metrics labels. Unmatched paths collapse to one label.
    std::string label_for(std::string_view method, std::string_view target) const;

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        AsyncHandler handler;
        Access access;
    };

    struct Match {
        const Route* route = nullptr;
        Params params;
        bool path_known = false;
    };

    Match match(std::string_view method, std::string_view path) const;

    std::vector<Route> routes_;
};

std::string url_decode(std::string_view s);
Router::Params parse_query(std::string_view target);
