#include <benchmark/benchmark.h>
#include "twosum/router.hpp"
#include "twosum/server.hpp"
#include "twosum/tools/two_sum.hpp"
#include <string>

using namespace twosum;

// Router with n methods registered
static Router make_router(int n_methods) {
    Router router;
    for (int i = 0; i < n_methods; ++i) {
        router.on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    return router;
}

static void BM_RouterDispatch(benchmark::State& state) {
    auto router = make_router(static_cast<int>(state.range(0)));
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "method_0";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterDispatch)->Arg(3)->Arg(10)->Arg(100);

static void BM_RouterMethodNotFound(benchmark::State& state) {
    auto router = make_router(10);
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "nonexistent";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterMethodNotFound);

static void BM_ServerToolsList(benchmark::State& state) {
    ToolRegistry registry;
    register_two_sum(registry);
    McpServer server(McpServer::default_options(), registry);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsList);

static void BM_ServerToolsCall(benchmark::State& state) {
    ToolRegistry registry;
    register_two_sum(registry);
    McpServer server(McpServer::default_options(), registry);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{
        {"name", "two_sum"},
        {"arguments", {{"nums", {2, 7, 11, 15}}, {"target", 9}}}
    };

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsCall);
