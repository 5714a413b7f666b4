#include "mvr/store/TimeframeCache.hpp"
#include "mvr/util/Metrics.hpp"

#include <mutex>

namespace mvr::store {

TimeframeCache::TimeframeCache(std::chrono::seconds ttl, Clock clock)
  : ttl_(ttl)
  , clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::steady_clock::now(); }))
{}

bool TimeframeCache::fresh(std::chrono::steady_clock::time_point now) const {
  return payload_.has_value() && now - builtAt_ < ttl_;
}

TimeframePayload TimeframeCache::getOrBuild(const Builder& build) {
  {
    std::shared_lock lock(mx_);
    if (fresh(clock_())) {
      MVR_METRIC_HIT("cache.timeframe.hit");
      return *payload_;
    }
  }

  std::unique_lock lock(mx_);
  if (fresh(clock_())) {
    MVR_METRIC_HIT("cache.timeframe.hit");
    return *payload_;
  }

  MVR_METRIC_HIT("cache.timeframe.miss");
  payload_.reset();
  TimeframePayload built = build();
  payload_ = built;
  builtAt_ = clock_();
  return built;
}

void TimeframeCache::reset() {
  std::unique_lock lock(mx_);
  payload_.reset();
  builtAt_ = {};
}

} // namespace mvr::store
