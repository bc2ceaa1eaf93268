#include <benchmark/benchmark.h>
#include <vector>

#include "bus/event_bus.hpp"

#include <tabweave/logger.hpp>

using namespace tabweave;

// ═══════════════════════════════════════════════════════════════════════════════
// Event Bus Throughput
//
// Lifecycle traffic is dominated by small events fanned out to a handful of
// subscribers, so these measure publish cost against subscriber count.
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Publish_NoSubscribers(benchmark::State& state)
{
    EventBus bus;
    for (auto _ : state)
        bus.publish(LoadStarted{1});
}
BENCHMARK(BM_Publish_NoSubscribers);

static void BM_Publish_Fanout(benchmark::State& state)
{
    EventBus                            bus;
    std::vector<EventBus::Unsubscriber> subs;
    uint64_t                            seen = 0;
    for (int64_t i = 0; i < state.range(0); ++i)
        subs.push_back(bus.on<TabActivated>([&seen](const TabActivated& e) { seen += e.tab_id; }));

    TabId tab = 1;
    for (auto _ : state)
    {
        bus.publish(TabActivated{1, tab, tab - 1});
        ++tab;
    }
    benchmark::DoNotOptimize(seen);
    state.SetItemsProcessed(state.iterations() * state.range(0));

    for (auto& unsub : subs)
        unsub();
}
BENCHMARK(BM_Publish_Fanout)->Arg(1)->Arg(4)->Arg(16)->Arg(64);

// Publishing a type nobody listens to while other types are busy.
static void BM_Publish_OtherTypeSubscribed(benchmark::State& state)
{
    EventBus bus;
    auto     unsub = bus.on<SurfaceCrashed>([](const SurfaceCrashed&) {});
    for (auto _ : state)
        bus.publish(TitleChanged{3, "title"});
    unsub();
}
BENCHMARK(BM_Publish_OtherTypeSubscribed);

static void BM_SubscribeUnsubscribe(benchmark::State& state)
{
    EventBus bus;
    for (auto _ : state)
    {
        auto unsub = bus.on<LoadFinished>([](const LoadFinished&) {});
        unsub();
    }
}
BENCHMARK(BM_SubscribeUnsubscribe);

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Critical);
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv))
        return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
