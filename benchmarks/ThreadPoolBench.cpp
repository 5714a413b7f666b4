#include <benchmark/benchmark.h>
#include "mvr/rt/ThreadPool.hpp"
#include "mvr/ws/PendingRequests.hpp"
#include <atomic>

static void BM_ThreadPoolPost(benchmark::State& state) {
    mvr::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.drain();
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

// One request's trip: ticket in, handler on a worker, resolve back.
static void BM_PendingRoundTrip(benchmark::State& state) {
    mvr::rt::ThreadPool pool(2);
    mvr::ws::PendingRequests pending;
    std::atomic<int> sent{0};

    for (auto _ : state) {
        for (int i = 0; i < 100; ++i) {
            const auto t = pending.add("r", [&sent](const std::string&){ sent.fetch_add(1, std::memory_order_relaxed); });
            pool.post([&pending, t]{ pending.resolve(t, "{}"); });
        }
        pool.drain();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_PendingRoundTrip)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
