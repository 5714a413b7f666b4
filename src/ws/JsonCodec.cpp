#include "mvr/ws/JsonCodec.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace mvr::ws {

namespace {

class FieldError : public std::runtime_error {
public:
  explicit FieldError(const std::string& field)
    : std::runtime_error("wrong type for field '" + field + "'"), field_(field) {}
  const std::string& field() const noexcept { return field_; }
private:
  std::string field_;
};

// Member or nullptr; JSON null counts as absent.
const rapidjson::Value* member(const rapidjson::Value& v, const char* k) {
  auto it = v.FindMember(k);
  if (it == v.MemberEnd() || it->value.IsNull()) return nullptr;
  return &it->value;
}

std::string strOr(const rapidjson::Value& v, const char* k, const std::string& def = "") {
  const auto* m = member(v, k);
  if (!m) return def;
  if (m->IsString()) return std::string(m->GetString(), m->GetStringLength());
  throw FieldError(k);
}

// Time fields may also arrive as bare numbers.
std::string timeOr(const rapidjson::Value& v, const char* k) {
  const auto* m = member(v, k);
  if (!m) return {};
  if (m->IsString()) return std::string(m->GetString(), m->GetStringLength());
  if (m->IsInt64()) return std::to_string(m->GetInt64());
  throw FieldError(k);
}

int toInt(const rapidjson::Value& m, const char* k) {
  if (m.IsInt()) return m.GetInt();
  if (m.IsDouble()) {
    const double d = m.GetDouble();
    if (std::trunc(d) == d &&
        d >= static_cast<double>(std::numeric_limits<int>::min()) &&
        d <= static_cast<double>(std::numeric_limits<int>::max())) {
      return static_cast<int>(d);
    }
  }
  throw FieldError(k);
}

int intOr(const rapidjson::Value& v, const char* k, int def = 0) {
  const auto* m = member(v, k);
  return m ? toInt(*m, k) : def;
}

std::optional<bool> boolOpt(const rapidjson::Value& v, const char* k) {
  const auto* m = member(v, k);
  if (!m) return std::nullopt;
  if (!m->IsBool()) throw FieldError(k);
  return m->GetBool();
}

std::vector<std::string> stringArray(const rapidjson::Value& v, const char* k) {
  std::vector<std::string> out;
  const auto* m = member(v, k);
  if (!m) return out;
  if (!m->IsArray()) throw FieldError(k);
  out.reserve(m->Size());
  for (const auto& e : m->GetArray()) {
    if (!e.IsString()) throw FieldError(k);
    out.emplace_back(e.GetString(), e.GetStringLength());
  }
  return out;
}

void key(JsonWriter& w, const char* k) {
  w.Key(k);
}

void str(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

} // namespace

session::SessionState parseState(const rapidjson::Value& v) {
  if (!v.IsObject()) throw FieldError("state");

  session::SessionState s;
  s.computeMode = boolOpt(v, "compute_mode").value_or(false);
  s.rangeStart = intOr(v, "range_start");
  s.rangeEnd = intOr(v, "range_end");
  if (const auto* m = member(v, "markers")) {
    if (!m->IsObject()) throw FieldError("markers");
    for (const auto& kv : m->GetObject()) {
      s.markers[std::string(kv.name.GetString(), kv.name.GetStringLength())] = toInt(kv.value, "markers");
    }
  }
  s.ticksRequested = intOr(v, "ticks_requested");
  s.lastSymbol = strOr(v, "last_symbol");
  s.rangeStartTime = strOr(v, "range_start_time");
  s.rangeEndTime = strOr(v, "range_end_time");
  s.resolution = strOr(v, "resolution");
  s.customResolutionSeconds = intOr(v, "custom_resolution_seconds");
  return s;
}

Result<Request> parseRequest(const std::string& text, std::string* requestId) {
  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError() || !doc.IsObject()) return Error{"malformed request", {}};

  if (requestId) {
    const auto* rid = member(doc, "request_id");
    if (rid && rid->IsString()) *requestId = rid->GetString();
  }

  Request r;
  try {
    r.type = strOr(doc, "type");
    r.requestId = strOr(doc, "request_id");
    r.symbol = strOr(doc, "symbol");
    r.symbols = stringArray(doc, "symbols");
    r.start = timeOr(doc, "start");
    r.end = timeOr(doc, "end");
    r.rangeStart = intOr(doc, "range_start");
    r.rangeEnd = intOr(doc, "range_end");
    r.computeMode = boolOpt(doc, "compute_mode");
    r.resolution = intOr(doc, "resolution");
    r.ticks = intOr(doc, "ticks");
    if (const auto* st = member(doc, "state")) r.state = parseState(*st);
  } catch (const FieldError& e) {
    return Error{"malformed request", e.field()};
  }
  return r;
}

void writeTimeframe(JsonWriter& w, const store::TimeframePayload& p) {
  w.StartObject();
  key(w, "start");            str(w, p.start);
  key(w, "end");              str(w, p.end);
  key(w, "resolution_label"); str(w, p.resolutionLabel);
  key(w, "frame_quality");
  w.StartArray();
  for (const auto& fq : p.frameQuality) {
    w.StartObject();
    key(w, "symbol"); str(w, fq.symbol);
    key(w, "quality");
    w.StartArray();
    for (int q : fq.quality) w.Int(q);
    w.EndArray();
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();
}

void writeOverview(JsonWriter& w, const store::PriceOverview& p) {
  w.StartObject();
  key(w, "resolution_label"); str(w, p.resolutionLabel);
  key(w, "prices");
  w.StartArray();
  for (const auto& v : p.prices) {
    if (v) w.Double(*v); else w.Null();
  }
  w.EndArray();
  key(w, "datetimes");
  w.StartArray();
  for (const auto& d : p.datetimes) str(w, d);
  w.EndArray();
  w.EndObject();
}

void writeOverviewItems(JsonWriter& w, const std::vector<store::OverviewItem>& items) {
  w.StartArray();
  for (const auto& item : items) {
    w.StartObject();
    key(w, "symbol"); str(w, item.symbol);
    key(w, "data");
    if (item.data) writeOverview(w, *item.data); else w.Null();
    if (!item.error.empty()) {
      key(w, "error"); str(w, item.error);
    }
    w.EndObject();
  }
  w.EndArray();
}

void writeIncreaseResolution(JsonWriter& w, const overview::IncreaseResolutionPayload& p) {
  w.StartObject();
  key(w, "resolution_seconds"); w.Int(p.resolutionSeconds);
  key(w, "items");
  writeOverviewItems(w, p.items);
  w.EndObject();
}

void writeState(JsonWriter& w, const session::SessionState& s) {
  w.StartObject();
  key(w, "compute_mode"); w.Bool(s.computeMode);
  key(w, "range_start");  w.Int(s.rangeStart);
  key(w, "range_end");    w.Int(s.rangeEnd);
  key(w, "markers");
  w.StartObject();
  for (const auto& [name, idx] : s.markers) {
    str(w, name);
    w.Int(idx);
  }
  w.EndObject();
  key(w, "ticks_requested");           w.Int(s.ticksRequested);
  key(w, "last_symbol");               str(w, s.lastSymbol);
  key(w, "range_start_time");          str(w, s.rangeStartTime);
  key(w, "range_end_time");            str(w, s.rangeEndTime);
  key(w, "resolution");                str(w, s.resolution);
  key(w, "custom_resolution_seconds"); w.Int(s.customResolutionSeconds);
  key(w, "updated_at");                str(w, util::formatRfc3339(s.updatedAtMs, true));
  w.EndObject();
}

void writeStatusOk(JsonWriter& w) {
  w.StartObject();
  key(w, "status");
  w.String("ok");
  w.EndObject();
}

std::string dataResponse(const std::string& type, const std::string& requestId,
                         const std::function<void(JsonWriter&)>& writeData) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  key(w, "type"); str(w, type);
  if (!requestId.empty()) {
    key(w, "request_id"); str(w, requestId);
  }
  key(w, "data");
  if (writeData) writeData(w); else w.Null();
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

std::string errorResponse(const std::string& requestId, const std::string& message) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  key(w, "type"); w.String("error");
  if (!requestId.empty()) {
    key(w, "request_id"); str(w, requestId);
  }
  key(w, "message"); str(w, message);
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace mvr::ws
