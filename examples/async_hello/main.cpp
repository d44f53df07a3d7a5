/// Suspending service: the answer is produced on another thread.

#include <jsonrpc/jsonrpc.hpp>
#include <log4cplus/initializer.h>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>

class SlowHello : public jsonrpc::AsyncService<> {
public:
    std::future<std::optional<jsonrpc::Response>> handle(jsonrpc::Request& req,
                                                         const jsonrpc::NoContext&) override {
        return std::async(std::launch::async, [&req]() -> std::optional<jsonrpc::Response> {
            if (!req.matches("hello")) return std::nullopt;
            auto name = req.deserialize<std::string>();
            // Pretend to wait on I/O
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return jsonrpc::Response::reply(req, "Hello, " + name + "!");
        });
    }
};

int main() {
    log4cplus::Initializer log_initializer;
    jsonrpc::init_logging("log4cplus.properties");

    jsonrpc::AsyncServer<> server;
    server.add(std::make_unique<SlowHello>());

    const jsonrpc::NoContext ctx;
    auto request = jsonrpc::Request::new_reply("hello", "world");
    auto response = server.serve(request, ctx).get();
    if (!response) return 1;

    std::cout << jsonrpc::Codec::serialize(*response) << std::endl;
    return 0;
}
