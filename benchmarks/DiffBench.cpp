#include <benchmark/benchmark.h>
#include "wsb/DiffEngine.hpp"
#include <rapidjson/document.h>
#include <string>

namespace {

// A flat document with `n` numeric fields f0..f{n-1}
static rapidjson::Document makeDoc(int n, int bump) {
    rapidjson::Document d(rapidjson::kObjectType);
    auto& alloc = d.GetAllocator();
    for (int i = 0; i < n; ++i) {
        std::string k = "f" + std::to_string(i);
        d.AddMember(rapidjson::Value(k.c_str(), alloc), rapidjson::Value(i == n - 1 ? i + bump : i), alloc);
    }
    return d;
}

// One topic per field
static wsb::TopicRegistry makeRegistry(int n) {
    wsb::TopicRegistry r;
    for (int i = 0; i < n; ++i) {
        std::string k = "f" + std::to_string(i);
        r.add("t" + std::to_string(i), "", {k});
    }
    return r;
}

} // namespace

static void BM_ChangedTopics(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    auto reg  = makeRegistry(n);
    auto prev = makeDoc(n, 0);
    auto next = makeDoc(n, 1);

    for (auto _ : state) {
        auto changed = wsb::changedTopics(prev, next, reg);
        benchmark::DoNotOptimize(changed);
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_ChangedTopics)
    ->Arg(8)
    ->Arg(64)
    ->Arg(512)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
