/// @file config.hpp
/// @brief Server configuration: JSON file plus command-line overrides.

#pragma once

#include <mmds-cpp/http.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace mmds_cpp {

/// Settings for the metadata server executable.
struct ServerConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{7878};
    std::string prefix{"/mds"};
    std::size_t max_body_bytes{51200};
    std::string log_level{"info"};

    auto operator==(const ServerConfig&) const -> bool = default;
};

/// Read config keys present in `j`; absent keys keep their current value.
/// @throws std::runtime_error on a wrong type or an out-of-range value.
void from_json(const nlohmann::json& j, ServerConfig& config);
void to_json(nlohmann::json& j, const ServerConfig& config);

/// Load a JSON config file on top of the defaults.
/// @throws std::runtime_error if the file cannot be read or is invalid.
auto load_config_file(const std::filesystem::path& path) -> ServerConfig;

/// Result of parsing the command line.
struct CommandLine {
    ServerConfig config;
    bool show_help{false};
};

/// Parse `--config FILE` first, then apply `--host`, `--port`, `--prefix`,
/// `--max-body` and `--log-level` on top. `-h`/`--help` sets show_help.
/// @throws std::runtime_error on unknown flags or bad values.
auto parse_command_line(int argc, const char* const* argv) -> CommandLine;

/// Usage text for --help.
auto usage(std::string_view program) -> std::string;

/// The spdlog level named by `config.log_level`.
auto log_level(const ServerConfig& config) -> spdlog::level::level_enum;

/// RouterOptions derived from the config.
auto router_options(const ServerConfig& config) -> RouterOptions;

}  // namespace mmds_cpp
