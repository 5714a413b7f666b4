// include/mvr/store/Payloads.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mvr::store {

struct FrameQuality {
  std::string symbol;
  std::vector<int> quality;   // one 0/1 flag per bucket
};

struct TimeframePayload {
  std::string start;
  std::string end;
  std::string resolutionLabel;
  std::vector<FrameQuality> frameQuality;
};

struct PriceOverview {
  std::string resolutionLabel;
  std::vector<std::optional<double>> prices;
  std::vector<std::string> datetimes;
};

// Entry of a batch reply. `error` is set only when building this entry failed.
struct OverviewItem {
  std::string symbol;
  std::optional<PriceOverview> data;
  std::string error;
};

} // namespace mvr::store
