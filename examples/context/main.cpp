/// Context example: services read caller-owned state passed into serve().

#include <jsonrpc/jsonrpc.hpp>
#include <log4cplus/initializer.h>
#include <iostream>
#include <string>

struct ServiceData {
    std::string message;
};

class GreetingService : public jsonrpc::Service<ServiceData> {
public:
    std::optional<jsonrpc::Response> handle(jsonrpc::Request& req, const ServiceData& ctx) override {
        if (!req.matches("hello")) return std::nullopt;
        return jsonrpc::Response::reply(req, "Hello, " + ctx.message + "!");
    }
};

int main() {
    log4cplus::Initializer log_initializer;
    jsonrpc::init_logging("log4cplus.properties");

    jsonrpc::Server<ServiceData> server;
    server.add(std::make_unique<GreetingService>());

    // A router can share the chain with hand-written services
    auto admin = std::make_unique<jsonrpc::Router<ServiceData>>();
    admin->on("version", [](jsonrpc::Request&, const ServiceData&) -> nlohmann::json {
        return std::string(jsonrpc::LIBRARY_VERSION);
    });
    server.add(std::move(admin));

    ServiceData data{"world"};
    for (const char* method : {"hello", "version", "missing"}) {
        auto request = jsonrpc::Request::new_reply(method);
        if (auto response = server.serve(request, data)) {
            std::cout << jsonrpc::Codec::serialize(*response) << std::endl;
        }
    }
    return 0;
}
