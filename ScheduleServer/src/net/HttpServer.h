#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include "ScheduleApi.h"
#include "ServiceBackend.h"
#include "../db/DbPool.h"
#include <memory>
#include <string>

class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log,
               std::shared_ptr<ServiceBackend> backend, std::shared_ptr<db::DbPool> db = nullptr);
    void run();
    // bound port; differs from the requested one when that was 0
    unsigned short port() const { return acceptor_.local_endpoint().port(); }
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::shared_ptr<ServiceBackend> backend_;
    std::shared_ptr<db::DbPool> db_;
    std::shared_ptr<const ScheduleApi> api_;
};
