#include <benchmark/benchmark.h>
#include "twosum/codec.hpp"
#include "twosum/server.hpp"
#include "twosum/tools/two_sum.hpp"
#include "twosum/transport/stdio_transport.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <string>
#include <thread>
#include <vector>

using namespace twosum;

static std::string make_call_request(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id)
         + R"(,"method":"tools/call","params":{"name":"two_sum","arguments":{"nums":[1,5,9,)"
         + std::to_string(id) + R"(],"target":14}}})";
}

static void BM_SessionThroughput(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));

    std::string input;
    for (int i = 1; i <= n; ++i) {
        input += make_call_request(i) + "\n";
    }

    ToolRegistry registry;
    register_two_sum(registry);
    McpServer server(McpServer::default_options(), registry);

    for (auto _ : state) {
        int in[2];
        if (pipe(in) < 0) {
            state.SkipWithError("pipe failed");
            break;
        }
        int out = ::open("/dev/null", O_WRONLY);
        if (out < 0) {
            ::close(in[0]);
            ::close(in[1]);
            state.SkipWithError("open /dev/null failed");
            break;
        }

        // Input is larger than the pipe buffer, so feed it concurrently
        std::thread writer([&input, fd = in[1]]() {
            size_t off = 0;
            while (off < input.size()) {
                ssize_t w = ::write(fd, input.data() + off, input.size() - off);
                if (w <= 0) break;
                off += static_cast<size_t>(w);
            }
            ::close(fd);
        });

        StdioTransport transport(in[0], out);
        auto stats = server.serve(transport);
        writer.join();
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * n);
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_SessionThroughput)->Arg(100)->Arg(10000);

static void BM_ParseAndSerialize1K(benchmark::State& state) {
    // Parse + dispatch + serialize, no transport
    ToolRegistry registry;
    register_two_sum(registry);
    McpServer server(McpServer::default_options(), registry);

    std::vector<std::string> messages;
    for (int i = 0; i < 1000; ++i) {
        messages.push_back(make_call_request(i));
    }

    for (auto _ : state) {
        for (const auto& raw : messages) {
            auto out = Codec::serialize(server.handle(Codec::parse(raw)));
            benchmark::DoNotOptimize(out);
        }
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_ParseAndSerialize1K);
