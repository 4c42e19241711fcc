#include <mmds-cpp/config.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace mmds_cpp {

namespace {

constexpr auto log_level_names = std::array<std::string_view, 9>{
    "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off",
};

auto check_log_level(std::string level) -> std::string {
    if (std::ranges::find(log_level_names, std::string_view{level}) == log_level_names.end()) {
        throw std::runtime_error{"unknown log level: " + level};
    }
    return level;
}

auto check_prefix(std::string prefix) -> std::string {
    if (!prefix.empty() && prefix.front() != '/') {
        throw std::runtime_error{"prefix must start with '/': " + prefix};
    }
    return prefix;
}

auto to_port(std::uint64_t value) -> std::uint16_t {
    if (value == 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error{"port out of range: " + std::to_string(value)};
    }
    return static_cast<std::uint16_t>(value);
}

auto parse_unsigned(std::string_view flag, std::string_view text) -> std::uint64_t {
    auto value = std::uint64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error{std::string{flag} + " expects a number, got '"
                                 + std::string{text} + "'"};
    }
    return value;
}

auto string_member(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (!it->is_string()) {
        throw std::runtime_error{std::string{"config key '"} + key + "' must be a string"};
    }
    return it->get<std::string>();
}

auto unsigned_member(const nlohmann::json& j, const char* key) -> std::optional<std::uint64_t> {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (!it->is_number_unsigned()) {
        throw std::runtime_error{std::string{"config key '"} + key
                                 + "' must be a non-negative integer"};
    }
    return it->get<std::uint64_t>();
}

}  // anonymous namespace

void from_json(const nlohmann::json& j, ServerConfig& config) {
    if (!j.is_object()) {
        throw std::runtime_error{"config must be a JSON object"};
    }
    if (auto v = string_member(j, "host")) config.host = std::move(*v);
    if (auto v = unsigned_member(j, "port")) config.port = to_port(*v);
    if (auto v = string_member(j, "prefix")) config.prefix = check_prefix(std::move(*v));
    if (auto v = unsigned_member(j, "max_body_bytes")) {
        config.max_body_bytes = static_cast<std::size_t>(*v);
    }
    if (auto v = string_member(j, "log_level")) config.log_level = check_log_level(std::move(*v));
}

void to_json(nlohmann::json& j, const ServerConfig& config) {
    j = nlohmann::json{
        {"host", config.host},
        {"port", config.port},
        {"prefix", config.prefix},
        {"max_body_bytes", config.max_body_bytes},
        {"log_level", config.log_level},
    };
}

auto load_config_file(const std::filesystem::path& path) -> ServerConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw std::runtime_error{"cannot open config file: " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw std::runtime_error{"config file is not valid JSON: " + path.string()};
    }
    auto config = ServerConfig{};
    from_json(j, config);
    return config;
}

auto parse_command_line(int argc, const char* const* argv) -> CommandLine {
    auto args = std::vector<std::string_view>{};
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto value_after = [&](std::size_t& i) -> std::string_view {
        if (i + 1 >= args.size()) {
            throw std::runtime_error{std::string{args[i]} + " requires a value"};
        }
        return args[++i];
    };

    auto result = CommandLine{};

    // The config file is the base layer, wherever --config appears.
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            result.config = load_config_file(std::filesystem::path{value_after(i)});
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto flag = args[i];
        if (flag == "-h" || flag == "--help") {
            result.show_help = true;
        } else if (flag == "--config") {
            ++i;
        } else if (flag == "--host") {
            result.config.host = std::string{value_after(i)};
        } else if (flag == "--port") {
            result.config.port = to_port(parse_unsigned(flag, value_after(i)));
        } else if (flag == "--prefix") {
            result.config.prefix = check_prefix(std::string{value_after(i)});
        } else if (flag == "--max-body") {
            result.config.max_body_bytes =
                static_cast<std::size_t>(parse_unsigned(flag, value_after(i)));
        } else if (flag == "--log-level") {
            result.config.log_level = check_log_level(std::string{value_after(i)});
        } else {
            throw std::runtime_error{"unknown argument: " + std::string{flag}};
        }
    }
    return result;
}

auto usage(std::string_view program) -> std::string {
    auto text = std::string{"Usage: "};
    text += program;
    text += " [options]\n"
            "\n"
            "Options:\n"
            "  --config FILE      JSON config file (applied before other flags)\n"
            "  --host HOST        address to bind (default 127.0.0.1)\n"
            "  --port PORT        port to listen on (default 7878)\n"
            "  --prefix PATH      URL prefix of the document (default /mds)\n"
            "  --max-body BYTES   largest accepted PUT/PATCH body (default 51200)\n"
            "  --log-level LEVEL  trace, debug, info, warn, error, critical or off\n"
            "  -h, --help         show this help\n";
    return text;
}

auto log_level(const ServerConfig& config) -> spdlog::level::level_enum {
    return spdlog::level::from_str(check_log_level(config.log_level));
}

auto router_options(const ServerConfig& config) -> RouterOptions {
    return RouterOptions{config.prefix, config.max_body_bytes};
}

}  // namespace mmds_cpp
