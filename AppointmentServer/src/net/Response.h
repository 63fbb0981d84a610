#pragma once

#include <string>
#include <boost/beast/http.hpp>
#include "Request.h"

using Response = boost::beast::http::response<boost::beast::http::string_body>;

inline Response json_response(const Request& req, boost::beast::http::status st, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}
