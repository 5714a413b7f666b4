#include "mvr/ws/RequestRouter.hpp"
#include "mvr/overview/OverviewBuilder.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"

#include <cctype>
#include <exception>

namespace mvr::ws {

namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string statusOk(const std::string& type, const std::string& requestId) {
  return dataResponse(type, requestId, [](JsonWriter& w){ writeStatusOk(w); });
}

} // namespace

RequestRouter::RequestRouter(store::TimeSeriesStore& store,
                             store::TimeframeCache& cache,
                             session::SessionManager& sessions,
                             std::vector<std::string> dataDirs,
                             Clock clock)
  : store_(store)
  , cache_(cache)
  , sessions_(sessions)
  , dataDirs_(std::move(dataDirs))
  , clock_(clock ? std::move(clock) : Clock([]{ return util::nowMs(); }))
{
  handlers_ = {
    {"timeframe",            &RequestRouter::onTimeframe},
    {"price_overview",       &RequestRouter::onPriceOverview},
    {"price_overview_batch", &RequestRouter::onPriceOverviewBatch},
    {"state_get",            &RequestRouter::onStateGet},
    {"state_update",         &RequestRouter::onStateUpdate},
    {"range_selection",      &RequestRouter::onRangeSelection},
    {"state_reset",          &RequestRouter::onStateReset},
    {"compute_mode",         &RequestRouter::onComputeMode},
    {"increase_resolution",  &RequestRouter::onIncreaseResolution},
  };
}

RequestRouter::Decoded RequestRouter::decode(const std::string& text) {
  std::string rid;
  auto parsed = parseRequest(text, &rid);
  return Decoded{std::move(parsed), std::move(rid)};
}

std::string RequestRouter::dispatch(const std::string& sessionId, const Decoded& decoded) {
  const auto& parsed = decoded.request;
  if (!parsed) {
    MVR_METRIC_HIT("ws.request.malformed");
    util::logger().log(util::LogLevel::Debug, "ws.request.malformed",
                       {{"session", sessionId}, {"error", parsed.error().describe()}});
    return errorResponse(decoded.requestId, parsed.error().message);
  }

  const Request& req = *parsed;
  const std::string type = trim(req.type);
  auto it = handlers_.find(type);
  if (it == handlers_.end()) {
    MVR_METRIC_HIT("ws.request.unknown");
    return errorResponse(req.requestId, "unknown message type");
  }

  MVR_METRIC_HIT("ws.request." + type);
  util::logger().log(util::LogLevel::Debug, "ws.request",
                     {{"session", sessionId}, {"type", type}, {"request_id", req.requestId}});
  try {
    return (this->*(it->second))(sessionId, req);
  } catch (const std::exception& ex) {
    MVR_METRIC_HIT("ws.request.internal_error");
    util::logger().log(util::LogLevel::Error, "ws.request.failed",
                       {{"type", type}, {"request_id", req.requestId}, {"what", ex.what()}});
    return errorResponse(req.requestId, "internal error");
  }
}

Result<util::TimeRange> RequestRouter::range(const Request& req) const {
  return util::parseTimeRange(req.start, req.end, clock_());
}

Result<int> RequestRouter::resolution(const Request& req) {
  if (req.resolution == 0) return defaultResolutionSeconds();
  if (req.resolution < 0) {
    return Error{"resolution must be a positive integer in seconds", "resolution"};
  }
  return req.resolution;
}

std::string RequestRouter::onTimeframe(const std::string&, const Request& req) {
  store::TimeframePayload payload;
  try {
    payload = cache_.getOrBuild([this]{ return store_.buildTimeframeResponse(); });
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "timeframe.build.failed", {{"what", ex.what()}});
    return errorResponse(req.requestId, "could not build timeframe");
  }
  return dataResponse("timeframe", req.requestId, [&](JsonWriter& w){ writeTimeframe(w, payload); });
}

std::string RequestRouter::onPriceOverview(const std::string&, const Request& req) {
  const std::string symbol = trim(req.symbol);
  if (symbol.empty()) return errorResponse(req.requestId, "missing symbol");

  auto r = range(req);
  if (!r) return errorResponse(req.requestId, r.error().message);
  auto res = resolution(req);
  if (!res) return errorResponse(req.requestId, res.error().message);

  std::optional<store::PriceOverview> overview;
  try {
    overview = store_.buildPriceOverview(symbol, r->startMs, r->endMs, *res);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "overview.build.failed",
                       {{"symbol", symbol}, {"what", ex.what()}});
    return errorResponse(req.requestId, "could not build price overview");
  }
  if (!overview) return dataResponse("price_overview", req.requestId, nullptr);
  return dataResponse("price_overview", req.requestId, [&](JsonWriter& w){ writeOverview(w, *overview); });
}

std::string RequestRouter::onPriceOverviewBatch(const std::string&, const Request& req) {
  auto r = range(req);
  if (!r) return errorResponse(req.requestId, r.error().message);
  auto res = resolution(req);
  if (!res) return errorResponse(req.requestId, res.error().message);

  overview::OverviewBuilder builder(store_, &cache_);
  const auto items = builder.buildBatch(req.symbols, r->startMs, r->endMs, *res);
  return dataResponse("price_overview_batch", req.requestId, [&](JsonWriter& w){ writeOverviewItems(w, items); });
}

std::string RequestRouter::onStateGet(const std::string& sessionId, const Request& req) {
  const auto state = sessions_.get(sessionId);
  if (!state) return dataResponse("state", req.requestId, nullptr);
  return dataResponse("state", req.requestId, [&](JsonWriter& w){ writeState(w, *state); });
}

std::string RequestRouter::onStateUpdate(const std::string& sessionId, const Request& req) {
  if (!req.state) return errorResponse(req.requestId, "missing state");
  sessions_.replace(sessionId, *req.state);
  return statusOk("state_update", req.requestId);
}

std::string RequestRouter::onRangeSelection(const std::string& sessionId, const Request& req) {
  auto r = range(req);
  if (!r) return errorResponse(req.requestId, r.error().message);
  sessions_.updateRange(sessionId, r->startMs, r->endMs, req.rangeStart, req.rangeEnd, req.computeMode);
  return statusOk("range_selection", req.requestId);
}

std::string RequestRouter::onStateReset(const std::string& sessionId, const Request& req) {
  const auto state = sessions_.reset(sessionId);
  return dataResponse("state_reset", req.requestId, [&](JsonWriter& w){ writeState(w, state); });
}

std::string RequestRouter::onComputeMode(const std::string&, const Request& req) {
  auto r = range(req);
  if (!r) return errorResponse(req.requestId, r.error().message);

  try {
    store_.loadRange(dataDirs_, r->startMs, r->endMs);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "store.load_range.failed", {{"what", ex.what()}});
    return errorResponse(req.requestId, "could not load range");
  }
  cache_.reset();
  return statusOk("compute_mode", req.requestId);
}

std::string RequestRouter::onIncreaseResolution(const std::string&, const Request& req) {
  auto r = range(req);
  if (!r) return errorResponse(req.requestId, r.error().message);

  overview::OverviewBuilder builder(store_, &cache_);
  overview::IncreaseResolutionPayload payload;
  try {
    payload = builder.increaseResolution(dataDirs_, req.ticks, r->startMs, r->endMs, req.symbols);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "store.load_range.failed", {{"what", ex.what()}});
    return errorResponse(req.requestId, "could not load range");
  }
  return dataResponse("increase_resolution", req.requestId,
                      [&](JsonWriter& w){ writeIncreaseResolution(w, payload); });
}

} // namespace mvr::ws
