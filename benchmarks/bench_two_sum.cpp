#include <benchmark/benchmark.h>
#include "twosum/tools/two_sum.hpp"
#include <random>
#include <vector>

using namespace twosum;

// Worst case: the only pair is the last two elements.
static std::vector<int64_t> make_input(std::size_t n) {
    std::vector<int64_t> nums;
    nums.reserve(n);
    for (std::size_t i = 0; i + 2 < n; ++i) {
        nums.push_back(static_cast<int64_t>(i) * 2);
    }
    nums.push_back(-1);
    nums.push_back(-2);
    return nums;
}

static void BM_FindTwoSumWorstCase(benchmark::State& state) {
    auto nums = make_input(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto r = find_two_sum(nums, -3);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FindTwoSumWorstCase)->RangeMultiplier(10)->Range(10, 1000000);

static void BM_FindTwoSumRandom(benchmark::State& state) {
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int64_t> dist(-1000000, 1000000);
    std::vector<int64_t> nums(static_cast<std::size_t>(state.range(0)));
    for (auto& n : nums) n = dist(rng);

    for (auto _ : state) {
        auto r = find_two_sum(nums, 12345);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_FindTwoSumRandom)->Arg(1000)->Arg(100000);

static void BM_TwoSumArgumentDecode(benchmark::State& state) {
    nlohmann::json args = {{"nums", make_input(static_cast<std::size_t>(state.range(0)))},
                           {"target", -3}};

    for (auto _ : state) {
        auto decoded = args.get<TwoSumArguments>();
        benchmark::DoNotOptimize(decoded);
    }
}
BENCHMARK(BM_TwoSumArgumentDecode)->Arg(100)->Arg(10000);
