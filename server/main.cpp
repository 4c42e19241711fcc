// mmds_server: serves one in-memory metadata document over HTTP.
//
//   GET   /mds/<path>   read a leaf or list a node's children
//   PUT   /mds          replace the document with a JSON body
//   PATCH /mds          apply a JSON Merge Patch (RFC 7396)
//
// Run: ./build/server/mmds_server --port 7878 --log-level debug

#include "http_server.hpp"

#include <mmds-cpp/config.hpp>
#include <mmds-cpp/document_store.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>

namespace {

std::atomic<mmds_cpp::HttpServer*> g_server{nullptr};

extern "C" void handle_signal(int) {
    if (auto* server = g_server.load()) server->stop();
}

}  // namespace

int main(int argc, char** argv) {
    auto command_line = mmds_cpp::CommandLine{};
    try {
        command_line = mmds_cpp::parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s\n\n%s", e.what(), mmds_cpp::usage(argv[0]).c_str());
        return 2;
    }
    if (command_line.show_help) {
        std::printf("%s", mmds_cpp::usage(argv[0]).c_str());
        return 0;
    }

    const auto& config = command_line.config;
    spdlog::set_level(mmds_cpp::log_level(config));

    auto store = std::make_shared<mmds_cpp::DocumentStore>();
    auto server = mmds_cpp::HttpServer{
        mmds_cpp::Router{store, mmds_cpp::router_options(config)}};

    g_server.store(&server);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto ok = server.listen(config.host, config.port);
    g_server.store(nullptr);
    return ok ? 0 : 1;
}
