#include <benchmark/benchmark.h>
#include "mvr/ingest/TickFileParser.hpp"
#include <sstream>
#include <string>

namespace {

std::string csvFile(int rows) {
    std::string out = "time_msc,bid,ask,last\n";
    for (int i = 0; i < rows; ++i) {
        out += std::to_string(1704189600000LL + i * 250) + ",100.25,100.50,\"100.375\"\n";
    }
    return out;
}

std::string pipeFile(int rows) {
    std::string out;
    for (int i = 0; i < rows; ++i) {
        out += std::to_string(1704189600000LL + i * 250) + "|B:3:0:1:100.375:200\n";
    }
    return out;
}

} // namespace

static void BM_ParseCsvStream(benchmark::State& state) {
    const std::string text = csvFile(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        std::istringstream in(text);
        double sum = 0;
        auto r = mvr::ingest::parseStream(in, [&sum](const mvr::ingest::ParsedRow& row){ sum += row.price; });
        benchmark::DoNotOptimize(sum);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ParseCsvStream)->Arg(1000)->Arg(10000)->Unit(benchmark::kMicrosecond);

static void BM_ParsePipeStream(benchmark::State& state) {
    const std::string text = pipeFile(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        std::istringstream in(text);
        double sum = 0;
        auto r = mvr::ingest::parseStream(in, [&sum](const mvr::ingest::ParsedRow& row){ sum += row.price; });
        benchmark::DoNotOptimize(sum);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ParsePipeStream)->Arg(1000)->Arg(10000)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
