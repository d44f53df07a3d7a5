#include <benchmark/benchmark.h>
#include "jsonrpc/router.hpp"
#include "jsonrpc/server.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace jsonrpc;

namespace {

// Answers a single method name.
class NamedService : public Service<> {
public:
    explicit NamedService(std::string method) : method_(std::move(method)) {}

    std::optional<Response> handle(Request& req, const NoContext&) override {
        if (!req.matches(method_)) return std::nullopt;
        return Response::reply(req, nlohmann::json{{"result", "ok"}});
    }

private:
    std::string method_;
};

// Create a server with a chain of N single-method services
std::unique_ptr<Server<>> make_chain(int n_services) {
    auto server = std::make_unique<Server<>>();
    for (int i = 0; i < n_services; ++i) {
        server->add(std::make_unique<NamedService>("method_" + std::to_string(i)));
    }
    return server;
}

// Create a server with one router holding N methods
std::unique_ptr<Server<>> make_routed(int n_methods) {
    auto router = std::make_unique<Router<>>();
    for (int i = 0; i < n_methods; ++i) {
        router->on("method_" + std::to_string(i),
            [](Request&, const NoContext&) -> nlohmann::json {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    auto server = std::make_unique<Server<>>();
    server->add(std::move(router));
    return server;
}

} // namespace

static void BM_DispatchFirstService(benchmark::State& state) {
    auto server = make_chain(1);
    Request req(1, "method_0");

    for (auto _ : state) {
        auto resp = server->serve(req, NoContext{});
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchFirstService)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto server = make_chain(1);
    Request req(1, "not_registered_method");

    for (auto _ : state) {
        auto resp = server->serve(req, NoContext{});
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchLastOfChain(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto server = make_chain(n);
    Request req(1, "method_" + std::to_string(n - 1));

    for (auto _ : state) {
        auto resp = server->serve(req, NoContext{});
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchLastOfChain)->Arg(1)->Arg(10)->Arg(100)->MinTime(1.0);

static void BM_DispatchRouter100Methods(benchmark::State& state) {
    auto server = make_routed(100);

    std::vector<Request> requests;
    for (int i = 0; i < 100; ++i) {
        requests.emplace_back(i, "method_" + std::to_string(i));
    }

    int i = 0;
    for (auto _ : state) {
        auto resp = server->serve(requests[i % 100], NoContext{});
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_DispatchRouter100Methods)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    auto server = make_chain(1);
    auto notif = Request::new_notification("method_0");

    for (auto _ : state) {
        auto resp = server->serve(notif, NoContext{});
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

static void BM_ServeMessage(benchmark::State& state) {
    auto server = make_chain(1);
    const std::string raw = R"({"jsonrpc":"2.0","id":1,"method":"method_0","params":{}})";

    for (auto _ : state) {
        auto out = server->serve_message(raw, NoContext{});
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ServeMessage)->MinTime(1.0);
