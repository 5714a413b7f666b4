// include/mvr/store/PriceSource.hpp
#pragma once

#include "mvr/ingest/DirectoryScanner.hpp"
#include "mvr/store/Payloads.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mvr::store {

// What the overview orchestration needs from a store.
class PriceSource {
public:
  virtual ~PriceSource() = default;

  // nullopt when the symbol has no points.
  virtual std::optional<PriceOverview> buildPriceOverview(const std::string& symbol,
                                                          std::int64_t startMs,
                                                          std::int64_t endMs,
                                                          int resolutionSeconds) const = 0;

  virtual std::vector<std::string> listSymbols() const = 0;

  virtual ingest::ScanStats loadRange(const std::vector<std::string>& roots,
                                      std::int64_t startMs,
                                      std::int64_t endMs) = 0;
};

} // namespace mvr::store
