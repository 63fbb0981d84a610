#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "auth/Jwt.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

const std::size_t kHeaderLimit = 8 * 1024;
const std::size_t kBodyLimit = 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    std::shared_ptr<const ServerOptions> options;

    Session(net::ip::tcp::socket&& s, Router& r, std::shared_ptr<const ServerOptions> opts)
        : socket(std::move(s)), read_timer(socket.get_executor()), router(r), options(std::move(opts)) {}

    void run() { do_read(); }

    void arm_read_timer(std::chrono::seconds after) {
        auto self = shared_from_this();
        read_timer.expires_after(after);
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });
    }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        arm_read_timer(std::chrono::seconds(5));

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();
            if (ec) {
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version || ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            self->http_version = parser->get().version();
            auto content_len = parser->content_length().value_or(0);
            if (content_len > kBodyLimit) {
                observability::log_info("oversized_body_header", {{"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", true, "(body)");
                return;
            }
            if (content_len == 0) self->arm_read_timer(std::chrono::seconds(10));
            else if (content_len <= 128 * 1024) self->arm_read_timer(std::chrono::seconds(20));
            else self->arm_read_timer(std::chrono::seconds(60));

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        auto self = shared_from_this();
        std::string method(req.method_string());
        std::string label = router.label_for(method, std::string_view(req.target().data(), req.target().size()));

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, PATCH, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, label);
            return;
        }

        std::optional<auth::Caller> caller;
        auto it = req.find(http::field::authorization);
        if (it != req.end()) caller = auth::authenticate_bearer(std::string(it->value()), options->jwt_secret);

        // The handler may reply from a store worker thread; writes go back through the socket's executor.
        router.dispatch(req, caller, [self, label](Response res) {
            auto sp = std::make_shared<Response>(std::move(res));
            net::post(self->socket.get_executor(), [self, sp, label]() { self->send_response(sp, label); });
        });
    }

    void set_cors(Response& res) {
        auto it = req.find(http::field::origin);
        if (it != req.end()) res.set("Access-Control-Allow-Origin", std::string(it->value()));
        else res.set("Access-Control-Allow-Origin", "*");
        res.set("Access-Control-Allow-Credentials", "true");
    }

    void record(const Response& res, const std::string& label) {
        std::string method(req.method_string());
        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (options->metrics_enabled) {
            auto& m = observability::Metrics::instance();
            m.inc(label, method, res.result_int());
            m.observe_latency(label, method, ms);
        }
        if (options->access_log) {
            observability::log_info("access", {{"method", method}, {"path", label}, {"status", int64_t(res.result_int())}, {"ms", ms}});
        }
    }

    void send_response(std::shared_ptr<Response> sp, const std::string& label) {
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) sp->keep_alive(req.keep_alive());
        set_cors(*sp);
        record(*sp, label);
        http::async_write(socket, *sp, [self, sp, label](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", label}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    // Reads and discards until the peer closes so the response is not lost to a reset.
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                self->read_timer.cancel();
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& label) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        set_cors(*res);
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (!close_conn) {
            send_response(res, label);
            return;
        }
        res->set(http::field::connection, "close");
        http::async_write(socket, *res, [self = shared_from_this(), res, label](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", label}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

}

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, ServerOptions options)
    : acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      options_(std::make_shared<const ServerOptions>(std::move(options))) {}

void HttpServer::run() { do_accept(); }

unsigned short HttpServer::local_port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, options_)->run();
        } else {
            observability::log_warn("accept_error", {{"err", int64_t(ec.value())}});
        }
        if (acceptor_.is_open()) do_accept();
    });
}
