// include/mvr/session/SessionState.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace mvr::session {

// Interactive state of one client identity. Zero-valued fields are the reset
// state.
struct SessionState {
  bool computeMode = false;
  int rangeStart = 0;
  int rangeEnd = 0;
  std::map<std::string, int> markers;
  int ticksRequested = 0;
  std::string lastSymbol;
  std::string rangeStartTime;
  std::string rangeEndTime;
  std::string resolution;
  int customResolutionSeconds = 0;
  std::int64_t updatedAtMs = 0;
};

} // namespace mvr::session
