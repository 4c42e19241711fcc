/// @file http.hpp
/// @brief Transport-independent HTTP routing over a DocumentStore.
///
/// Router maps GET/PUT/PATCH requests under a path prefix onto the store and
/// turns typed errors into status codes and text. It never touches a socket;
/// the server executable adapts it to cpp-httplib.

#pragma once

#include <mmds-cpp/document_store.hpp>
#include <mmds-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mmds_cpp {

/// The request methods the router distinguishes.
enum class Method : std::uint8_t {
    get,
    put,
    patch,
    other,
};

/// Map an HTTP method token ("GET", "PUT", ...) to a Method.
auto parse_method(std::string_view token) noexcept -> Method;

/// Convert a Method to its string representation.
constexpr auto to_string_view(Method m) noexcept -> std::string_view {
    switch (m) {
        case Method::get:   return "GET";
        case Method::put:   return "PUT";
        case Method::patch: return "PATCH";
        case Method::other: return "OTHER";
    }
    return "unknown";
}

/// An already-decoded HTTP request.
struct Request {
    Method method{Method::get};
    std::string target;  ///< Decoded path, optionally followed by "?query".
    std::string body;
    std::string accept;  ///< Accept header; "application/json" selects the JSON form.
};

/// The response the transport should send back.
struct Response {
    int status{200};
    std::string content_type;  ///< Empty when there is no body.
    std::string body;

    auto operator==(const Response&) const -> bool = default;
};

/// Routing parameters.
struct RouterOptions {
    std::string prefix{"/mds"};         ///< Mount point of the document.
    std::size_t max_body_bytes{51200};  ///< Larger PUT/PATCH bodies get 413.
};

/// Human-readable text for an Error, used in response bodies.
auto describe(const Error& error) -> std::string;

/// Body size limit to configure on the transport: one byte over the router's
/// own limit, so oversized bodies reach the router and get its 413.
/// Saturates instead of wrapping when `max_body_bytes` is SIZE_MAX.
auto transport_body_limit(const RouterOptions& options) noexcept -> std::size_t;

/// Dispatches requests to a shared DocumentStore.
///
/// | Request                 | Success         | Failure                         |
/// |-------------------------|-----------------|---------------------------------|
/// | GET   prefix[/path...]  | 200 rendered    | 400 not found, 500 bad type     |
/// | PUT   prefix            | 204             | 400 bad JSON, 413, 500 bad type |
/// | PATCH prefix            | 204             | 400 bad JSON, 413, 500 bad type |
///
/// A GET that accepts application/json gets the value as JSON instead of
/// rendered lines. A write body nested deeper than max_nesting_depth is a
/// bad request (400). Other methods on the prefix get 405; targets outside
/// it get 404.
/// handle() never throws.
class Router {
public:
    explicit Router(std::shared_ptr<DocumentStore> store, RouterOptions options = {});

    auto handle(const Request& request) const -> Response;

    auto options() const -> const RouterOptions& { return options_; }
    auto store() const -> const std::shared_ptr<DocumentStore>& { return store_; }

private:
    auto handle_get(std::string_view path, bool as_json) const -> Response;
    auto handle_write(const Request& request) const -> Response;

    std::shared_ptr<DocumentStore> store_;
    RouterOptions options_;
};

}  // namespace mmds_cpp
