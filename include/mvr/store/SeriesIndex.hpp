// include/mvr/store/SeriesIndex.hpp
#pragma once

#include "mvr/ingest/TickPoint.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>

namespace mvr::store {

// Minute keys are unix seconds of the minute start.
using MinuteKey = std::int64_t;

struct MinutePrice {
  std::int64_t timestampMs = 0;
  double price = 0.0;
};

using CoverageIndex = std::map<std::string, std::set<MinuteKey>>;
using PriceIndex    = std::map<std::string, std::unordered_map<MinuteKey, MinutePrice>>;

struct GlobalWindow {
  std::int64_t minMs = 0;
  std::int64_t maxMs = 0;
  bool valid = false;
};

// One immutable generation of the store. Built by a loader, then published.
struct SeriesIndex {
  CoverageIndex coverage;
  PriceIndex prices;
  GlobalWindow window;

  static MinuteKey minuteOf(std::int64_t timestampMs) {
    return util::truncateToMinute(timestampMs) / util::kMsPerSecond;
  }

  void add(const ingest::TickPoint& t) {
    const MinuteKey key = minuteOf(t.timestampMs);
    coverage[t.symbol].insert(key);

    auto& slot = prices[t.symbol];
    auto it = slot.find(key);
    if (it == slot.end()) {
      slot.emplace(key, MinutePrice{t.timestampMs, t.price});
    } else if (t.timestampMs > it->second.timestampMs ||
               (t.timestampMs == it->second.timestampMs && t.price > it->second.price)) {
      // Equal timestamps resolve to the higher price so arrival order never matters.
      it->second = MinutePrice{t.timestampMs, t.price};
    }

    if (!window.valid) {
      window = GlobalWindow{t.timestampMs, t.timestampMs, true};
    } else {
      if (t.timestampMs < window.minMs) window.minMs = t.timestampMs;
      if (t.timestampMs > window.maxMs) window.maxMs = t.timestampMs;
    }
  }

  bool empty() const { return coverage.empty(); }
  std::size_t symbolCount() const { return coverage.size(); }
};

} // namespace mvr::store
