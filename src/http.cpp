#include <mmds-cpp/http.hpp>

#include <mmds-cpp/json.hpp>
#include <mmds-cpp/path.hpp>
#include <mmds-cpp/validator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mmds_cpp {

namespace {

constexpr auto text_plain = "text/plain; charset=utf-8";
constexpr auto application_json = "application/json";

auto text_response(int status, std::string body) -> Response {
    return Response{status, text_plain, std::move(body)};
}

auto empty_response(int status) -> Response {
    return Response{status, {}, {}};
}

auto join_lines(const std::vector<std::string>& lines) -> std::string {
    auto out = std::string{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

auto status_for(ErrorKind kind) -> int {
    switch (kind) {
        case ErrorKind::not_found:              return 400;
        case ErrorKind::unsupported_value_type: return 500;
    }
    return 500;
}

auto normalize_prefix(std::string prefix) -> std::string {
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return prefix;
}

/// Strip the prefix from `target`. Returns nullopt when `target` lies
/// outside it ("/mdsx" is outside "/mds").
auto strip_prefix(std::string_view target, std::string_view prefix)
    -> std::optional<std::string_view> {
    if (!target.starts_with(prefix)) return std::nullopt;
    auto rest = target.substr(prefix.size());
    if (!rest.empty() && rest.front() != '/') return std::nullopt;
    return rest;
}

}  // anonymous namespace

auto parse_method(std::string_view token) noexcept -> Method {
    if (token == "GET") return Method::get;
    if (token == "PUT") return Method::put;
    if (token == "PATCH") return Method::patch;
    return Method::other;
}

auto describe(const Error& error) -> std::string {
    switch (error.kind) {
        case ErrorKind::not_found:
            return "The MMDS resource does not exist: '" + error.detail + "'.";
        case ErrorKind::unsupported_value_type:
            return "Cannot store value at '" + error.detail
                 + "': only strings and objects are supported.";
    }
    return std::string{to_string_view(error.kind)};
}

Router::Router(std::shared_ptr<DocumentStore> store, RouterOptions options)
    : store_{std::move(store)}, options_{std::move(options)} {
    options_.prefix = normalize_prefix(std::move(options_.prefix));
}

auto transport_body_limit(const RouterOptions& options) noexcept -> std::size_t {
    constexpr auto most = std::numeric_limits<std::size_t>::max() - 1;
    return std::min(options.max_body_bytes, most) + 1;
}

auto Router::handle(const Request& request) const -> Response {
    auto target = std::string_view{request.target};
    if (auto q = target.find('?'); q != std::string_view::npos) {
        target = target.substr(0, q);
    }

    auto response = Response{};
    try {
        auto path = strip_prefix(target, options_.prefix);
        if (!path) {
            response = text_response(404, "No route for '" + std::string{target} + "'.");
        } else if (request.method == Method::get) {
            auto as_json = request.accept.find(application_json) != std::string::npos;
            response = handle_get(*path, as_json);
        } else if (request.method == Method::put || request.method == Method::patch) {
            if (split_path(*path).empty()) {
                response = handle_write(request);
            } else {
                response = text_response(404, "Writes are only accepted at '"
                                              + options_.prefix + "'.");
            }
        } else {
            response = text_response(405, "Method not allowed.");
        }
    } catch (const std::exception& e) {
        spdlog::error("{} {}: {}", to_string_view(request.method), target, e.what());
        response = text_response(500, "Internal error.");
    }

    spdlog::debug("{} {} -> {}", to_string_view(request.method), target, response.status);
    return response;
}

auto Router::handle_get(std::string_view path, bool as_json) const -> Response {
    auto result = store_->resolve(path);
    if (const auto* error = std::get_if<Error>(&result)) {
        return text_response(status_for(error->kind), describe(*error));
    }
    const auto& value = std::get<Value>(result);
    if (as_json) {
        return Response{200, application_json, Json(value).dump()};
    }
    return text_response(200, join_lines(render(value)));
}

auto Router::handle_write(const Request& request) const -> Response {
    if (request.body.size() > options_.max_body_bytes) {
        spdlog::warn("{} rejected: body of {} bytes exceeds limit of {}",
                     to_string_view(request.method), request.body.size(),
                     options_.max_body_bytes);
        return text_response(413, "Request body exceeds "
                                  + std::to_string(options_.max_body_bytes) + " bytes.");
    }

    auto body = parse_json(request.body);
    if (!body) {
        spdlog::warn("{} rejected: body is not valid JSON", to_string_view(request.method));
        return text_response(400, "Request body is not valid JSON.");
    }
    if (auto error = check_depth(*body)) {
        spdlog::warn("{} rejected: body nests deeper than {} levels at '{}'",
                     to_string_view(request.method), max_nesting_depth, error->detail);
        return text_response(400, "Request body nests deeper than "
                                  + std::to_string(max_nesting_depth) + " levels.");
    }

    auto error = request.method == Method::put ? store_->replace(*body)
                                               : store_->merge(*body);
    if (error) {
        spdlog::warn("{} rejected: {} at '{}'", to_string_view(request.method),
                     to_string_view(error->kind), error->detail);
        return text_response(status_for(error->kind), describe(*error));
    }
    return empty_response(204);
}

}  // namespace mmds_cpp
