// include/mvr/ingest/TickPoint.hpp
#pragma once

#include <cstdint>
#include <string>

namespace mvr::ingest {

// One normalized observation. Produced during a scan and folded into the
// index immediately.
struct TickPoint {
  std::string symbol;
  std::int64_t timestampMs = 0;
  double price = 0.0;
};

} // namespace mvr::ingest
