#include <benchmark/benchmark.h>
#include "mvr/store/TimeSeriesStore.hpp"
#include <string>
#include <vector>

namespace {

constexpr std::int64_t kBase = 1704189600000LL;

mvr::store::SeriesIndex makeIndex(int symbols, int minutes) {
    mvr::store::SeriesIndex idx;
    for (int s = 0; s < symbols; ++s) {
        const std::string sym = "SYM_" + std::to_string(s);
        for (int m = 0; m < minutes; ++m) {
            idx.add({sym, kBase + static_cast<std::int64_t>(m) * 60'000 + (s % 60) * 1'000, 100.0 + m});
        }
    }
    return idx;
}

} // namespace

static void BM_SeriesIndexAdd(benchmark::State& state) {
    std::int64_t i = 0;
    for (auto _ : state) {
        mvr::store::SeriesIndex idx;
        for (int k = 0; k < 1000; ++k, ++i) {
            idx.add({"SYM", kBase + i * 7'000, 1.0});
        }
        benchmark::DoNotOptimize(idx.window);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}

BENCHMARK(BM_SeriesIndexAdd);

static void BM_BuildTimeframe(benchmark::State& state) {
    const auto idx = makeIndex(static_cast<int>(state.range(0)), 1440);
    for (auto _ : state) {
        benchmark::DoNotOptimize(mvr::store::TimeSeriesStore::buildTimeframe(idx, kBase));
    }
}

BENCHMARK(BM_BuildTimeframe)->Arg(10)->Arg(100)->Unit(benchmark::kMicrosecond);

static void BM_BuildOverview(benchmark::State& state) {
    const auto idx = makeIndex(1, 1440);
    const int resolution = static_cast<int>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(mvr::store::TimeSeriesStore::buildOverview(
            idx, "SYM_0", kBase, kBase + 1440LL * 60'000, resolution));
    }
}

BENCHMARK(BM_BuildOverview)->Arg(1)->Arg(60)->Arg(300)->Unit(benchmark::kMicrosecond);

static void BM_SnapshotRead_Contended(benchmark::State& state) {
    static mvr::store::TimeSeriesStore store;
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.snapshot());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SnapshotRead_Contended)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
