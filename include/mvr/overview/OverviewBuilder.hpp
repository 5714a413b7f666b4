// include/mvr/overview/OverviewBuilder.hpp
#pragma once

#include "mvr/store/Payloads.hpp"
#include "mvr/store/PriceSource.hpp"
#include "mvr/store/TimeframeCache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mvr::overview {

constexpr int kDefaultTicks = 5000;
constexpr int kFallbackResolutionSeconds = 60;

struct IncreaseResolutionPayload {
  int resolutionSeconds = kFallbackResolutionSeconds;
  std::vector<store::OverviewItem> items;
};

// Batch and increase-resolution orchestration over a PriceSource.
//
// Batch entries are isolated: a symbol without points gives data=null, and a
// symbol whose build throws gives data=null plus an error message. Neither
// affects the other entries.
class OverviewBuilder {
public:
  explicit OverviewBuilder(store::PriceSource& source, store::TimeframeCache* cache = nullptr);

  std::vector<store::OverviewItem> buildBatch(const std::vector<std::string>& symbols,
                                              std::int64_t startMs,
                                              std::int64_t endMs,
                                              int resolutionSeconds) const;

  // Reloads [startMs, endMs] from roots, invalidates the timeframe cache, then
  // answers at a resolution that yields about `ticks` buckets. Throws whatever
  // the reload throws.
  IncreaseResolutionPayload increaseResolution(const std::vector<std::string>& roots,
                                               int ticks,
                                               std::int64_t startMs,
                                               std::int64_t endMs,
                                               const std::vector<std::string>& symbols);

  // ceil(window / (ticks - 1)) seconds, at least 1. ticks <= 0 means the
  // default budget; ticks == 1 or an empty window falls back to 60 s.
  static int resolutionForTicks(std::int64_t startMs, std::int64_t endMs, int ticks);

private:
  store::PriceSource& source_;
  store::TimeframeCache* cache_;
};

} // namespace mvr::overview
