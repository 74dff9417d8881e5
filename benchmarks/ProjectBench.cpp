#include <benchmark/benchmark.h>
#include "wsb/Projector.hpp"
#include <rapidjson/document.h>
#include <string>

static void BM_ProjectAndEncode(benchmark::State& state) {
    auto doc = wsb::parseDocument(
        R"({"p1name":"Alice","p2name":"Bob","p1score":3,"p2score":5,)"
        R"("clock":{"m":12,"s":34,"ms":567},"meta":{"round":2,"venue":"Main"}})");

    wsb::TopicRegistry reg;
    reg.add("state", "stateChange", {"p1name", "p2name", "p1score", "p2score", "clock.m", "clock.s", "meta.round"});
    const wsb::TopicSpec& topic = reg.topics().front();

    for (auto _ : state) {
        auto payload = wsb::project(topic, *doc);
        auto msg = wsb::buildEventMessage(topic, payload);
        benchmark::DoNotOptimize(msg);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ProjectAndEncode)->Unit(benchmark::kMicrosecond);

static void BM_SnapshotMessage(benchmark::State& state) {
    auto doc = wsb::parseDocument(
        R"({"p1name":"Alice","p2name":"Bob","p1score":3,"p2score":5,"clock":{"m":12,"s":34}})");
    for (auto _ : state) {
        auto msg = wsb::buildSnapshotMessage(*doc);
        benchmark::DoNotOptimize(msg);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SnapshotMessage)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
