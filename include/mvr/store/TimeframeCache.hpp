// include/mvr/store/TimeframeCache.hpp
#pragma once

#include "mvr/store/Payloads.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>

namespace mvr::store {

// TTL memo of the coverage view. Concurrent misses collapse into a single
// rebuild: the second waiter re-checks under the exclusive lock and finds the
// fresh payload.
class TimeframeCache {
public:
  using Clock   = std::function<std::chrono::steady_clock::time_point()>;
  using Builder = std::function<TimeframePayload()>;

  explicit TimeframeCache(std::chrono::seconds ttl = std::chrono::seconds(60), Clock clock = {});

  // A throwing builder leaves the cache empty and the exception propagates.
  TimeframePayload getOrBuild(const Builder& build);

  void reset();

  std::chrono::seconds ttl() const { return ttl_; }

private:
  bool fresh(std::chrono::steady_clock::time_point now) const;

  std::chrono::seconds ttl_;
  Clock clock_;

  mutable std::shared_mutex mx_;
  std::optional<TimeframePayload> payload_;
  std::chrono::steady_clock::time_point builtAt_{};
};

} // namespace mvr::store
