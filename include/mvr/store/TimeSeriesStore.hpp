// include/mvr/store/TimeSeriesStore.hpp
#pragma once

#include "mvr/store/PriceSource.hpp"
#include "mvr/store/SeriesIndex.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mvr::store {

// Process-wide tick index. Readers copy the current snapshot handle under a
// shared lock and work on it unlocked; loaders build a fresh SeriesIndex off to
// the side and swap it in under the exclusive lock. A published snapshot is
// never mutated.
class TimeSeriesStore : public PriceSource {
public:
  using Snapshot = std::shared_ptr<const SeriesIndex>;

  TimeSeriesStore();

  // Full rescan. Throws ingest::ScanError and keeps the current snapshot when
  // a root cannot be listed.
  ingest::ScanStats load(const std::vector<std::string>& roots);

  // Rescan restricted to files whose path time is in [startMs, endMs]. The
  // result replaces the whole snapshot.
  ingest::ScanStats loadRange(const std::vector<std::string>& roots,
                              std::int64_t startMs,
                              std::int64_t endMs) override;

  TimeframePayload buildTimeframeResponse() const;

  std::optional<PriceOverview> buildPriceOverview(const std::string& symbol,
                                                  std::int64_t startMs,
                                                  std::int64_t endMs,
                                                  int resolutionSeconds) const override;

  std::vector<std::string> listSymbols() const override;

  GlobalWindow window() const;
  std::size_t symbolCount() const;
  Snapshot snapshot() const;

  // Pure builders over one snapshot.
  static TimeframePayload buildTimeframe(const SeriesIndex& index, std::int64_t nowMs);
  static std::optional<PriceOverview> buildOverview(const SeriesIndex& index,
                                                    const std::string& symbol,
                                                    std::int64_t startMs,
                                                    std::int64_t endMs,
                                                    int resolutionSeconds);

private:
  void publish(std::shared_ptr<SeriesIndex> next);

  mutable std::shared_mutex mx_;
  Snapshot snap_;
};

} // namespace mvr::store
