#include "mvr/store/TimeSeriesStore.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <mutex>

namespace mvr::store {

namespace {

struct CoverageBand {
  std::int64_t maxSpanMinutes;
  std::int64_t resolutionMinutes;
  const char* label;
};

// Coverage resolution by window span; the last band catches everything longer.
constexpr CoverageBand kBands[] = {
  {120,       1,   "1m"},
  {360,       5,   "5m"},
  {1440,      10,  "10m"},
  {10080,     60,  "1h"},
  {INT64_MAX, 720, "12h"},
};

const CoverageBand& bandFor(std::int64_t spanMinutes) {
  for (const auto& b : kBands) {
    if (spanMinutes <= b.maxSpanMinutes) return b;
  }
  return kBands[std::size(kBands) - 1];
}

long long elapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - since).count();
}

} // namespace

TimeSeriesStore::TimeSeriesStore()
  : snap_(std::make_shared<const SeriesIndex>())
{}

ingest::ScanStats TimeSeriesStore::load(const std::vector<std::string>& roots) {
  const auto t0 = std::chrono::steady_clock::now();
  auto next = std::make_shared<SeriesIndex>();
  ingest::DirectoryScanner scanner(roots);
  const auto stats = scanner.scanAll([&](const ingest::TickPoint& t){ next->add(t); });

  const std::size_t symbols = next->symbolCount();
  publish(std::move(next));
  MVR_METRIC_HIT("store.load");
  util::logger().log(util::LogLevel::Info, "store.load.done", {
    {"symbols", std::to_string(symbols)},
    {"files", std::to_string(stats.files)},
    {"rows", std::to_string(stats.rows)},
    {"ms", std::to_string(elapsedMs(t0))}
  });
  return stats;
}

ingest::ScanStats TimeSeriesStore::loadRange(const std::vector<std::string>& roots,
                                             std::int64_t startMs,
                                             std::int64_t endMs) {
  const auto t0 = std::chrono::steady_clock::now();
  auto next = std::make_shared<SeriesIndex>();
  ingest::DirectoryScanner scanner(roots);
  const auto stats = scanner.scanRange(startMs, endMs, [&](const ingest::TickPoint& t){ next->add(t); });

  const std::size_t symbols = next->symbolCount();
  publish(std::move(next));
  MVR_METRIC_HIT("store.load_range");
  util::logger().log(util::LogLevel::Info, "store.load_range.done", {
    {"start", util::formatRfc3339(startMs)},
    {"end", util::formatRfc3339(endMs)},
    {"symbols", std::to_string(symbols)},
    {"files", std::to_string(stats.files)},
    {"ms", std::to_string(elapsedMs(t0))}
  });
  return stats;
}

void TimeSeriesStore::publish(std::shared_ptr<SeriesIndex> next) {
  Snapshot published = std::move(next);
  {
    std::unique_lock lock(mx_);
    snap_.swap(published);
  }
  // `published` now holds the previous generation; it is released outside the lock.
  MVR_METRIC_SET("store.symbols", static_cast<double>(snapshot()->symbolCount()));
}

TimeSeriesStore::Snapshot TimeSeriesStore::snapshot() const {
  std::shared_lock lock(mx_);
  return snap_;
}

GlobalWindow TimeSeriesStore::window() const {
  return snapshot()->window;
}

std::size_t TimeSeriesStore::symbolCount() const {
  return snapshot()->symbolCount();
}

std::vector<std::string> TimeSeriesStore::listSymbols() const {
  const auto snap = snapshot();
  std::vector<std::string> out;
  out.reserve(snap->coverage.size());
  for (const auto& [symbol, minutes] : snap->coverage) out.push_back(symbol);
  return out; // std::map keeps them sorted
}

TimeframePayload TimeSeriesStore::buildTimeframeResponse() const {
  const auto snap = snapshot();
  return buildTimeframe(*snap, util::nowMs());
}

std::optional<PriceOverview> TimeSeriesStore::buildPriceOverview(const std::string& symbol,
                                                                 std::int64_t startMs,
                                                                 std::int64_t endMs,
                                                                 int resolutionSeconds) const {
  const auto snap = snapshot();
  return buildOverview(*snap, symbol, startMs, endMs, resolutionSeconds);
}

TimeframePayload TimeSeriesStore::buildTimeframe(const SeriesIndex& index, std::int64_t nowMs) {
  TimeframePayload out;
  if (index.empty() || !index.window.valid) {
    out.start = util::formatRfc3339(nowMs);
    out.end = out.start;
    out.resolutionLabel = "1m";
    return out;
  }

  const std::int64_t startMinute = util::truncateToMinute(index.window.minMs);
  const std::int64_t endMinute = util::truncateToMinute(index.window.maxMs);
  const std::int64_t spanMinutes = std::max<std::int64_t>(0, (endMinute - startMinute) / util::kMsPerMinute);

  const CoverageBand& band = bandFor(spanMinutes);
  const std::size_t buckets = static_cast<std::size_t>(spanMinutes / band.resolutionMinutes + 1);

  std::vector<const CoverageIndex::value_type*> order;
  order.reserve(index.coverage.size());
  for (const auto& entry : index.coverage) order.push_back(&entry);
  std::stable_sort(order.begin(), order.end(), [](const auto* a, const auto* b) {
    if (a->second.size() != b->second.size()) return a->second.size() > b->second.size();
    return a->first < b->first;
  });

  out.start = util::formatRfc3339(index.window.minMs);
  out.end = util::formatRfc3339(index.window.maxMs);
  out.resolutionLabel = band.label;
  out.frameQuality.reserve(order.size());

  for (const auto* entry : order) {
    FrameQuality fq;
    fq.symbol = entry->first;
    fq.quality.assign(buckets, 0);
    for (MinuteKey minute : entry->second) {
      const std::int64_t offset = (minute * util::kMsPerSecond - startMinute) / util::kMsPerMinute;
      if (offset < 0) continue;
      const std::size_t bucket = static_cast<std::size_t>(offset / band.resolutionMinutes);
      if (bucket < buckets) fq.quality[bucket] = 1;
    }
    out.frameQuality.push_back(std::move(fq));
  }
  return out;
}

std::optional<PriceOverview> TimeSeriesStore::buildOverview(const SeriesIndex& index,
                                                            const std::string& symbol,
                                                            std::int64_t startMs,
                                                            std::int64_t endMs,
                                                            int resolutionSeconds) {
  auto it = index.prices.find(symbol);
  if (it == index.prices.end() || it->second.empty()) return std::nullopt;
  const auto& points = it->second;

  if (resolutionSeconds <= 0) resolutionSeconds = 300;
  const std::int64_t start = util::truncateToSecond(startMs);
  std::int64_t end = util::truncateToSecond(endMs);
  if (end < start) end = start;

  const std::int64_t stepMs = static_cast<std::int64_t>(resolutionSeconds) * util::kMsPerSecond;
  const std::int64_t buckets = (end - start) / stepMs + 1;

  auto lookup = [&points](std::int64_t ms) -> std::optional<double> {
    auto p = points.find(SeriesIndex::minuteOf(ms));
    if (p == points.end()) return std::nullopt;
    return p->second.price;
  };

  PriceOverview out;
  out.resolutionLabel = std::to_string(resolutionSeconds) + "s";
  out.prices.reserve(static_cast<std::size_t>(buckets));
  out.datetimes.reserve(static_cast<std::size_t>(buckets));

  for (std::int64_t i = 0; i < buckets; ++i) {
    const std::int64_t bucketStart = start + i * stepMs;
    if (bucketStart > end) break;
    const std::int64_t bucketEnd = std::min(bucketStart + stepMs - util::kMsPerSecond, end);
    out.datetimes.push_back(util::formatDateTime(bucketStart));

    std::optional<double> latest;
    if (resolutionSeconds < 60) {
      latest = lookup(bucketEnd);
    } else {
      for (std::int64_t m = util::truncateToMinute(bucketStart); m <= bucketEnd; m += util::kMsPerMinute) {
        if (auto v = lookup(m)) latest = v;
      }
    }
    out.prices.push_back(latest);
  }
  return out;
}

} // namespace mvr::store
