#include "mvr/overview/OverviewBuilder.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <limits>

namespace mvr::overview {

namespace {

std::string trimSymbol(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

OverviewBuilder::OverviewBuilder(store::PriceSource& source, store::TimeframeCache* cache)
  : source_(source)
  , cache_(cache)
{}

std::vector<store::OverviewItem> OverviewBuilder::buildBatch(const std::vector<std::string>& symbols,
                                                             std::int64_t startMs,
                                                             std::int64_t endMs,
                                                             int resolutionSeconds) const {
  std::vector<store::OverviewItem> items;
  items.reserve(symbols.size());

  for (const auto& raw : symbols) {
    store::OverviewItem item;
    item.symbol = trimSymbol(raw);
    if (item.symbol.empty()) continue;

    try {
      item.data = source_.buildPriceOverview(item.symbol, startMs, endMs, resolutionSeconds);
    } catch (const std::exception& ex) {
      MVR_METRIC_HIT("overview.entry_error");
      util::logger().log(util::LogLevel::Error, "overview.entry.failed",
                         {{"symbol", item.symbol}, {"what", ex.what()}});
      item.data.reset();
      item.error = "could not build price overview";
    }
    items.push_back(std::move(item));
  }
  return items;
}

IncreaseResolutionPayload OverviewBuilder::increaseResolution(const std::vector<std::string>& roots,
                                                              int ticks,
                                                              std::int64_t startMs,
                                                              std::int64_t endMs,
                                                              const std::vector<std::string>& symbols) {
  if (ticks <= 0) ticks = kDefaultTicks;

  source_.loadRange(roots, startMs, endMs);
  if (cache_) cache_->reset();

  IncreaseResolutionPayload out;
  out.resolutionSeconds = resolutionForTicks(startMs, endMs, ticks);
  out.items = buildBatch(symbols.empty() ? source_.listSymbols() : symbols,
                         startMs, endMs, out.resolutionSeconds);
  return out;
}

int OverviewBuilder::resolutionForTicks(std::int64_t startMs, std::int64_t endMs, int ticks) {
  if (ticks <= 0) ticks = kDefaultTicks;
  if (ticks <= 1 || endMs < startMs) return kFallbackResolutionSeconds;

  // Unsigned difference: endMs >= startMs, so it is exact even for extreme inputs.
  const std::uint64_t spanMs = static_cast<std::uint64_t>(endMs) - static_cast<std::uint64_t>(startMs);
  const std::uint64_t totalSeconds = spanMs / static_cast<std::uint64_t>(util::kMsPerSecond);
  if (totalSeconds == 0) return kFallbackResolutionSeconds;

  const std::uint64_t steps = static_cast<std::uint64_t>(ticks - 1);
  std::uint64_t seconds = totalSeconds / steps;
  if (totalSeconds % steps != 0) ++seconds;
  if (seconds < 1) seconds = 1;
  constexpr auto kMaxResolution = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  return seconds > kMaxResolution ? std::numeric_limits<int>::max() : static_cast<int>(seconds);
}

} // namespace mvr::overview
