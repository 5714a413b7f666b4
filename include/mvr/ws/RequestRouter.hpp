// include/mvr/ws/RequestRouter.hpp
#pragma once

#include "mvr/Result.hpp"
#include "mvr/session/SessionManager.hpp"
#include "mvr/store/TimeSeriesStore.hpp"
#include "mvr/store/TimeframeCache.hpp"
#include "mvr/util/TimeUtil.hpp"
#include "mvr/ws/JsonCodec.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mvr::ws {

// Turns one request text into exactly one response text. Stateless apart from
// the collaborators it is handed; the session id is passed per call.
class RequestRouter {
public:
  using Clock = std::function<std::int64_t()>;   // unix ms

  RequestRouter(store::TimeSeriesStore& store,
                store::TimeframeCache& cache,
                session::SessionManager& sessions,
                std::vector<std::string> dataDirs,
                Clock clock = {});

  struct Decoded {
    Result<Request> request;
    std::string requestId;   // best effort, also set for malformed input
  };

  // decode() is cheap and runs on the connection's strand; dispatch() may
  // block on a store reload and runs on a worker.
  static Decoded decode(const std::string& text);
  std::string dispatch(const std::string& sessionId, const Decoded& decoded);

  std::string handle(const std::string& sessionId, const std::string& text) {
    return dispatch(sessionId, decode(text));
  }

  static int defaultResolutionSeconds() { return 300; }

private:
  using Handler = std::string (RequestRouter::*)(const std::string& sessionId, const Request& req);

  std::string onTimeframe(const std::string& sessionId, const Request& req);
  std::string onPriceOverview(const std::string& sessionId, const Request& req);
  std::string onPriceOverviewBatch(const std::string& sessionId, const Request& req);
  std::string onStateGet(const std::string& sessionId, const Request& req);
  std::string onStateUpdate(const std::string& sessionId, const Request& req);
  std::string onRangeSelection(const std::string& sessionId, const Request& req);
  std::string onStateReset(const std::string& sessionId, const Request& req);
  std::string onComputeMode(const std::string& sessionId, const Request& req);
  std::string onIncreaseResolution(const std::string& sessionId, const Request& req);

  Result<util::TimeRange> range(const Request& req) const;
  static Result<int> resolution(const Request& req);

  store::TimeSeriesStore& store_;
  store::TimeframeCache& cache_;
  session::SessionManager& sessions_;
  std::vector<std::string> dataDirs_;
  Clock clock_;

  std::unordered_map<std::string, Handler> handlers_;
};

} // namespace mvr::ws
