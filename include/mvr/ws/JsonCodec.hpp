// include/mvr/ws/JsonCodec.hpp
#pragma once

#include "mvr/Result.hpp"
#include "mvr/overview/OverviewBuilder.hpp"
#include "mvr/session/SessionState.hpp"
#include "mvr/store/Payloads.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mvr::ws {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// One decoded client message. Absent fields keep their zero value.
struct Request {
  std::string type;
  std::string requestId;
  std::string symbol;
  std::vector<std::string> symbols;
  std::string start;
  std::string end;
  int rangeStart = 0;
  int rangeEnd = 0;
  std::optional<bool> computeMode;
  int resolution = 0;
  int ticks = 0;
  std::optional<session::SessionState> state;
};

// Fails with "malformed request" for invalid JSON, a non-object, or a known
// field of the wrong type. requestId is filled in whenever it could be read.
Result<Request> parseRequest(const std::string& text, std::string* requestId = nullptr);

session::SessionState parseState(const rapidjson::Value& v);

void writeTimeframe(JsonWriter& w, const store::TimeframePayload& p);
void writeOverview(JsonWriter& w, const store::PriceOverview& p);
void writeOverviewItems(JsonWriter& w, const std::vector<store::OverviewItem>& items);
void writeIncreaseResolution(JsonWriter& w, const overview::IncreaseResolutionPayload& p);
void writeState(JsonWriter& w, const session::SessionState& s);
void writeStatusOk(JsonWriter& w);

// {"type":..,"request_id":..,"data":<writeData>}; request_id omitted when empty.
std::string dataResponse(const std::string& type, const std::string& requestId,
                         const std::function<void(JsonWriter&)>& writeData);
// {"type":"error","request_id":..,"message":..}
std::string errorResponse(const std::string& requestId, const std::string& message);

} // namespace mvr::ws
