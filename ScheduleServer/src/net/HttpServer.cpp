#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <algorithm>
#include <array>
#include <boost/beast/http.hpp>
#include <chrono>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

// Collapses ids so metric labels stay bounded.
std::string metrics_path(const std::string& path) {
    RouteParams ignored;
    if (match_path("/entries/{id}", path, ignored)) return "/entries/{id}";
    if (match_path("/conflicts/{id}/resolve", path, ignored)) return "/conflicts/{id}/resolve";
    return path;
}

}

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
    bool metrics_enabled;
    bool access_log;
    std::shared_ptr<ServiceBackend> backend;
    std::shared_ptr<db::DbPool> db;
    std::shared_ptr<const ScheduleApi> api;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::shared_ptr<ServiceBackend> be,
            std::shared_ptr<db::DbPool> dbp, std::shared_ptr<const ScheduleApi> a)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al),
          backend(std::move(be)), db(std::move(dbp)), api(std::move(a)) {}
    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(1 * 1024 * 1024);

        self->read_timer.expires_after(std::chrono::seconds(5));
        self->read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored_cancel; self->read_timer.cancel(ignored_cancel);

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\",\"message\":\"request headers too large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\",\"message\":\"malformed request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();
            std::size_t content_len = 0;
            auto it = hdr_req.find(http::field::content_length);
            if (it != hdr_req.end()) {
                try {
                    content_len = std::stoul(std::string(it->value()));
                } catch (const std::exception&) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\",\"message\":\"invalid content-length\"}", true, "(header)");
                    return;
                }
            }

            const std::size_t MAX_PARSER_BODY = 1 * 1024 * 1024;
            if (content_len > MAX_PARSER_BODY) {
                observability::log_info("oversized_body_header", {{"path", std::string("(header)")}, {"len", int64_t(content_len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(content_len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\",\"message\":\"request body too large\"}", true, "(body)");
                return;
            }

            if (content_len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (content_len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            self->read_timer.async_wait([self](const boost::system::error_code& ec) {
                if (!ec) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored_cancel2; self->read_timer.cancel(ignored_cancel2);

                if (ec2) {
                    if (ec2 == http::error::end_of_stream) { self->close_socket(); return; }
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\",\"message\":\"request body too large\"}", true, "(body)");
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
        std::string target = std::string(req.target());
        auto qpos = target.find('?');
        if (qpos != std::string::npos) target.erase(qpos);
        const std::string cleaned_target = target;
        auto self = shared_from_this();

        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, X-Tenant-Id, X-Requested-With");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, cleaned_target);
            return;
        }

        if (cleaned_target == "/db/health") {
            if (!db) {
                auto res = std::make_shared<Response>(json_response(http::status::internal_server_error, req, "{\"db\":\"down\"}"));
                send_response(res, cleaned_target);
                return;
            }
            db->async_scalar_int("SELECT 1", [self, cleaned_target](const boost::system::error_code& ec, int v) {
                const bool up = !ec && v == 1;
                auto res = std::make_shared<Response>(json_response(up ? http::status::ok : http::status::internal_server_error,
                                                                    self->req, up ? "{\"db\":\"ok\"}" : "{\"db\":\"down\"}"));
                self->send_response(res, cleaned_target);
            });
            return;
        }

        if (ScheduleApi::handles(cleaned_target)) {
            if (!backend) {
                auto res = std::make_shared<Response>(json_response(http::status::internal_server_error, req,
                    "{\"error\":\"transaction_failed\",\"message\":\"no storage backend\"}"));
                send_response(res, cleaned_target);
                return;
            }
            backend->submit([self, cleaned_target](scheduling::SchedulingService& svc) {
                std::shared_ptr<Response> res;
                try {
                    res = std::make_shared<Response>(self->api->handle(svc, self->req));
                } catch (const std::exception& e) {
                    observability::log_error("request_failed", {{"path", cleaned_target}, {"err", std::string(e.what())}});
                    res = std::make_shared<Response>(json_response(http::status::internal_server_error, self->req,
                        "{\"error\":\"transaction_failed\",\"message\":\"internal error\"}"));
                }
                net::post(self->socket.get_executor(), [self, res, cleaned_target]() {
                    self->send_response(res, cleaned_target);
                });
            });
            return;
        }

        auto res = std::make_shared<Response>(router.route(req));
        send_response(res, cleaned_target);
    }

    void record_request(const std::string& cleaned_target, int code) {
        const std::string method = std::string(req.method_string());
        const std::string path = metrics_path(cleaned_target);
        const double latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            auto& m = observability::Metrics::instance();
            m.inc(path, method, code);
            m.observe_latency(path, method, latency_ms);
        }
        if (access_log) {
            observability::Fields f{{"method", method}, {"path", cleaned_target}, {"status", int64_t(code)}, {"latency_ms", latency_ms}};
            auto it = req.find("X-Tenant-Id");
            if (it != req.end()) f["tenant"] = std::string(it->value());
            observability::log_info("access", f);
        }
    }

    void send_response(std::shared_ptr<Response> res, const std::string& cleaned_target) {
        auto self = shared_from_this();
        auto sp = std::move(res);
        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(self->req.keep_alive());
        }
        auto it = self->req.find(http::field::origin);
        if (it != self->req.end()) sp->set("Access-Control-Allow-Origin", std::string(it->value())); else sp->set("Access-Control-Allow-Origin", "*");
        record_request(cleaned_target, static_cast<int>(sp->result_int()));

        http::async_write(socket, *sp, [self, sp, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) {
                self->do_read();
            } else {
                self->graceful_close_after_write();
            }
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    // Reads and discards whatever the peer still sends so the error response is not
    // lost to a connection reset.
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
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

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& cleaned_target) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->set("Access-Control-Allow-Origin", "*");
        res->keep_alive(!close_conn && req.keep_alive());
        res->body() = body;
        res->prepare_payload();
        if (!close_conn) {
            send_response(res, cleaned_target);
            return;
        }
        res->set(http::field::connection, "close");
        start_ts = std::chrono::steady_clock::now();
        record_request(cleaned_target, static_cast<int>(res->result_int()));
        http::async_write(socket, *res, [self = shared_from_this(), res, cleaned_target](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", cleaned_target}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
                       std::shared_ptr<ServiceBackend> backend, std::shared_ptr<db::DbPool> db)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log), backend_(std::move(backend)), db_(std::move(db)),
      api_(std::make_shared<ScheduleApi>()) {}

void HttpServer::run() { do_accept(); }

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, backend_, db_, api_);
            s->run();
        } else observability::log_warn("accept error", {{"err", int64_t(ec.value())}});

        do_accept();
    });
}
