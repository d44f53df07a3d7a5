/// Hello world: one service, one request, no transport.

#include <jsonrpc/jsonrpc.hpp>
#include <log4cplus/initializer.h>
#include <iostream>

class HelloService : public jsonrpc::Service<> {
public:
    std::optional<jsonrpc::Response> handle(jsonrpc::Request& req, const jsonrpc::NoContext&) override {
        if (!req.matches("hello")) return std::nullopt;
        auto name = req.deserialize<std::string>();
        return jsonrpc::Response::reply(req, "Hello, " + name + "!");
    }
};

int main() {
    log4cplus::Initializer log_initializer;
    jsonrpc::init_logging("log4cplus.properties");

    jsonrpc::Server<> server;
    server.add(std::make_unique<HelloService>());

    auto request = jsonrpc::Request::new_reply("hello", "world");
    auto response = server.serve(request, jsonrpc::NoContext{});
    if (!response) return 1;

    std::cout << jsonrpc::Codec::serialize(*response) << std::endl;
    return response->is_error() ? 1 : 0;
}
