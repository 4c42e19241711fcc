#include "http_server.hpp"

#include <spdlog/spdlog.h>

namespace mmds_cpp {

HttpServer::HttpServer(Router router) : router_{std::move(router)} {
    // Let one byte over the limit through so the router answers with its own 413.
    server_.set_payload_max_length(transport_body_limit(router_.options()));

    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res);
    };
    server_.Get(".*", handler);
    server_.Put(".*", handler);
    server_.Patch(".*", handler);
    server_.Post(".*", handler);
    server_.Delete(".*", handler);
}

auto HttpServer::listen(const std::string& host, std::uint16_t port) -> bool {
    spdlog::info("listening on {}:{} with prefix '{}'", host, port, router_.options().prefix);
    if (!server_.listen(host, port)) {
        spdlog::error("failed to listen on {}:{}", host, port);
        return false;
    }
    spdlog::info("server stopped");
    return true;
}

void HttpServer::stop() {
    server_.stop();
}

void HttpServer::dispatch(const httplib::Request& req, httplib::Response& res) const {
    const auto response = router_.handle(Request{parse_method(req.method), req.path, req.body,
                                               req.get_header_value("Accept")});
    res.status = response.status;
    if (!response.content_type.empty()) {
        res.set_content(response.body, response.content_type);
    }
}

}  // namespace mmds_cpp
