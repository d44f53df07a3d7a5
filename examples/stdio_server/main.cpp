/// Echo server over stdio.
/// Usage: ./stdio_server [--quiet-notifications]
/// Reads newline-delimited JSON-RPC requests from stdin and writes one
/// response per line to stdout.

#include <jsonrpc/jsonrpc.hpp>
#include <log4cplus/initializer.h>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;
    jsonrpc::init_logging("log4cplus.properties");

    jsonrpc::ServerOptions opts;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--quiet-notifications") {
            opts.notification_errors = jsonrpc::NotificationErrorPolicy::Suppress;
        }
    }

    auto router = std::make_unique<jsonrpc::Router<>>();
    router->on("echo", [](jsonrpc::Request& req, const jsonrpc::NoContext&) -> nlohmann::json {
        return req.take_params();
    });
    router->on("ping", [](jsonrpc::Request&, const jsonrpc::NoContext&) -> nlohmann::json {
        return nlohmann::json::object();
    });

    jsonrpc::Server<> server(opts);
    server.add(std::move(router));

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        if (auto out = server.serve_message(line, jsonrpc::NoContext{})) {
            std::cout << *out << '\n' << std::flush;
        }
    }
    return 0;
}
