#include "Router.h"
#include <boost/beast/http.hpp>
#include <memory>
#include "observability/Logging.h"

namespace http = boost::beast::http;

static std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < path.size()) {
        if (path[i] == '/') { ++i; continue; }
        size_t j = path.find('/', i);
        if (j == std::string_view::npos) j = path.size();
        out.emplace_back(path.substr(i, j - i));
        i = j;
    }
    return out;
}

static bool is_capture(const std::string& seg) {
    return seg.size() > 2 && seg.front() == '{' && seg.back() == '}';
}

static std::string_view strip_query(std::string_view target) {
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    auto hex = [](char h)->int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            int hi = hex(s[i+1]); int lo = hex(s[i+2]);
            if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

Router::Params parse_query(std::string_view target) {
    Router::Params out;
    auto q = target.find('?');
    if (q == std::string_view::npos) return out;
    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
        size_t amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string val = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
            out.emplace(std::move(key), std::move(val));
        }
        if (amp == std::string_view::npos) break;
        rest = rest.substr(amp + 1);
    }
    return out;
}

void Router::add_route(std::string method, std::string pattern, Handler h) {
    add_async_route(std::move(method), std::move(pattern),
        [h = std::move(h)](const Request& req, const Context&, Reply reply) { reply(h(req)); },
        Access::open);
}

void Router::add_async_route(std::string method, std::string pattern, AsyncHandler h, Access access) {
    Route r;
    r.method = std::move(method);
    r.segments = split_path(pattern);
    r.pattern = std::move(pattern);
    r.handler = std::move(h);
    r.access = access;
    routes_.push_back(std::move(r));
}

Router::Match Router::match(std::string_view method, std::string_view path) const {
    auto segs = split_path(path);
    Match best;
    int best_literals = -1;
    for (const auto& r : routes_) {
        if (r.segments.size() != segs.size()) continue;
        Params params;
        int literals = 0;
        bool ok = true;
        for (size_t i = 0; i < segs.size() && ok; ++i) {
            const auto& p = r.segments[i];
            if (is_capture(p)) params[p.substr(1, p.size() - 2)] = url_decode(segs[i]);
            else if (p == segs[i]) ++literals;
            else ok = false;
        }
        if (!ok) continue;
        best.path_known = true;
        if (r.method != method || literals <= best_literals) continue;
        best_literals = literals;
        best.route = &r;
        best.params = std::move(params);
    }
    return best;
}

void Router::dispatch(const Request& req, const std::optional<auth::Caller>& caller, Reply reply) const {
    std::string_view target(req.target().data(), req.target().size());
    std::string_view method(req.method_string().data(), req.method_string().size());
    auto m = match(method, strip_query(target));
    if (!m.route) {
        if (m.path_known) reply(json_response(req, http::status::method_not_allowed, "{\"error\":\"method not allowed\"}"));
        else reply(json_response(req, http::status::not_found, "{\"error\":\"not found\"}"));
        return;
    }
    if (m.route->access == Access::authenticated && !caller) {
        reply(json_response(req, http::status::unauthorized, "{\"error\":\"unauthorized\",\"message\":\"missing or invalid bearer token\"}"));
        return;
    }
    Context ctx;
    ctx.params = std::move(m.params);
    ctx.query = parse_query(target);
    ctx.caller = caller;
    try {
        m.route->handler(req, ctx, reply);
    } catch (const std::exception& e) {
        observability::log_error("router.handler_exception", {{"path", m.route->pattern}, {"err", std::string(e.what())}});
        reply(json_response(req, http::status::internal_server_error, "{\"error\":\"internal\"}"));
    }
}

Response Router::route(const Request& req, const std::optional<auth::Caller>& caller) const {
    auto out = std::make_shared<std::optional<Response>>();
    dispatch(req, caller, [out](Response res) { *out = std::move(res); });
    if (*out) return std::move(**out);
    return json_response(req, http::status::internal_server_error, "{\"error\":\"handler did not reply\"}");
}

std::string Router::label_for(std::string_view method, std::string_view target) const {
    auto m = match(method, strip_query(target));
    return m.route ? m.route->pattern : std::string("(unmatched)");
}
