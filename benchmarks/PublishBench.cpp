#include <benchmark/benchmark.h>
#include "wsb/EventBus.hpp"
#include <rapidjson/document.h>
#include <atomic>
#include <memory>

static void BM_PublishFanOut(benchmark::State& state) {
    const int listeners = static_cast<int>(state.range(0));
    wsb::EventBus bus;
    wsb::TopicSpec topic{"score", "scoreChange", {wsb::FieldPath::parse("p1score")}};

    std::atomic<long> hits{0};
    for (int i = 0; i < listeners; ++i) {
        bus.subscribe(topic.name, static_cast<wsb::OwnerId>(i + 1),
                      [&hits](const wsb::TopicSpec&, const wsb::Payload&) { hits.fetch_add(1, std::memory_order_relaxed); });
    }
    // Noise on another topic
    for (int i = 0; i < listeners; ++i) {
        bus.subscribe("other", static_cast<wsb::OwnerId>(i + 1), [](const wsb::TopicSpec&, const wsb::Payload&) {});
    }

    auto payload = std::make_shared<rapidjson::Document>(rapidjson::kObjectType);
    payload->AddMember("p1score", 1, payload->GetAllocator());
    wsb::Payload shared = payload;

    for (auto _ : state) {
        benchmark::DoNotOptimize(bus.publish(topic, shared));
    }
    state.SetItemsProcessed(state.iterations() * listeners);
}

BENCHMARK(BM_PublishFanOut)
    ->Arg(1)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
