#include <benchmark/benchmark.h>
#include "jsonrpc/codec.hpp"
#include "jsonrpc/json_rpc.hpp"
#include <string>
#include <vector>

using namespace jsonrpc;

// Small message (~50 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kHelloRequest =
    R"({"jsonrpc":"2.0","id":7,"method":"hello","params":"world"})";

// Request with a large params payload of N records
static std::string make_large_request(int n) {
    nlohmann::json rows = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        rows.push_back({
            {"name", "row_" + std::to_string(i)},
            {"description", "A record carrying some payload, number " + std::to_string(i)},
            {"values", {i, i * 2, i * 3}},
            {"enabled", i % 2 == 0}
        });
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "store/bulk_insert"},
        {"params", {{"rows", rows}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(100);

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseHelloRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kHelloRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kHelloRequest.size());
}
BENCHMARK(BM_ParseHelloRequest)->MinTime(1.0);

static void BM_ParseLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeMessage)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.code());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

static void BM_ParseMissingVersion(benchmark::State& state) {
    const std::string bad = R"({"id":1,"method":"ping"})";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const InvalidRequestError& e) {
            benchmark::DoNotOptimize(e.code());
        }
    }
}
BENCHMARK(BM_ParseMissingVersion)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    auto resp = Response::success(1, nlohmann::json::object());
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeErrorResponse(benchmark::State& state) {
    auto resp = Response::from_error(ParseError("expected value at line 1 column 2"));
    for (auto _ : state) {
        auto s = Codec::serialize(resp, true);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorResponse)->MinTime(1.0);

static void BM_SerializeLargeRequest(benchmark::State& state) {
    // Pre-parse the large request
    auto req = Codec::parse(kLargeRequest);

    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_SerializeLargeRequest)->MinTime(1.0);
