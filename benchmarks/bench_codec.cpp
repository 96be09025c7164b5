#include <benchmark/benchmark.h>
#include "twosum/codec.hpp"
#include "twosum/error.hpp"
#include "twosum/json_rpc.hpp"
#include <string>

using namespace twosum;

static const std::string kListRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"two_sum","arguments":{"nums":[2,7,11,15],"target":9}}})";

// tools/call request carrying n integers
static std::string make_large_call(int n) {
    nlohmann::json nums = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        nums.push_back(i * 3 - n);
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "tools/call"},
        {"params", {{"name", "two_sum"}, {"arguments", {{"nums", nums}, {"target", 1}}}}}
    };
    return req.dump();
}

static const std::string kLargeCall = make_large_call(100000);

// ---- Parse benchmarks ----

static void BM_ParseListRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kListRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kListRequest.size());
}
BENCHMARK(BM_ParseListRequest);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest);

static void BM_ParseLargeCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kLargeCall);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeCall.size());
}
BENCHMARK(BM_ParseLargeCall);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        bool rejected = false;
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError&) {
            rejected = true;
        }
        benchmark::DoNotOptimize(rejected);
    }
}
BENCHMARK(BM_ParseInvalidJson);

// ---- Serialize benchmarks ----

static void BM_SerializeToolResult(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{42}}, nlohmann::json{
        {"content", {{{"type", "text"}, {"text", "indices: [0,1]"}}}},
        {"structuredContent", {{"indices", {0, 1}}}}
    });

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult);

static void BM_SerializeError(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(RequestId{std::string{"req-1"}},
        JsonRpcError{-32601, "Method not found: resources/list", std::nullopt});

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeError);
