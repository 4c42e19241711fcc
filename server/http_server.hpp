// http_server.hpp: cpp-httplib front end for mmds_cpp::Router.

#pragma once

#include <mmds-cpp/http.hpp>

#include <httplib.h>

#include <cstdint>
#include <string>

namespace mmds_cpp {

/// Serves a Router over HTTP/1.1.
///
/// Every request, whatever its method or path, is handed to the router;
/// httplib only does the socket and parsing work.
class HttpServer {
public:
    explicit HttpServer(Router router);

    /// Bind and serve until stop() is called. Returns false if binding fails.
    auto listen(const std::string& host, std::uint16_t port) -> bool;

    void stop();

private:
    void dispatch(const httplib::Request& req, httplib::Response& res) const;

    Router router_;
    httplib::Server server_;
};

}  // namespace mmds_cpp
