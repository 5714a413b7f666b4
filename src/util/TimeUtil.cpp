#include "mvr/util/TimeUtil.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace mvr::util {

namespace {

constexpr std::int64_t kMsPerDay = 86'400'000LL;

// Proleptic Gregorian day counts relative to 1970-01-01.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

Civil civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {y + (m <= 2), m, d};
}

bool isLeap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeap(y)) return 29;
  return kDays[m - 1];
}

bool readDigits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    char c = s[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

bool parseInteger(const std::string& s, std::int64_t& out) {
  if (s.empty()) return false;
  std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (std::size_t k = i; k < s.size(); ++k) {
    if (s[k] < '0' || s[k] > '9') return false;
  }
  errno = 0;
  long long v = std::strtoll(s.c_str(), nullptr, 10);
  if (errno == ERANGE) return false;
  out = static_cast<std::int64_t>(v);
  return true;
}

// "YYYY-MM-DD?HH:MM:SS" with the given separator at index 10.
bool parseCivilPrefix(const std::string& s, char sep, std::int64_t& ms) {
  int y, mo, d, h, mi, se;
  if (s.size() < 19) return false;
  if (s[4] != '-' || s[7] != '-' || s[10] != sep || s[13] != ':' || s[16] != ':') return false;
  if (!readDigits(s, 0, 4, y) || !readDigits(s, 5, 2, mo) || !readDigits(s, 8, 2, d) ||
      !readDigits(s, 11, 2, h) || !readDigits(s, 14, 2, mi) || !readDigits(s, 17, 2, se)) {
    return false;
  }
  auto v = civilToMs(y, mo, d, h, mi, se);
  if (!v) return false;
  ms = *v;
  return true;
}

bool parseRfc3339(const std::string& s, std::int64_t& out) {
  std::int64_t ms = 0;
  if (!parseCivilPrefix(s, 'T', ms)) return false;

  std::size_t pos = 19;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    const std::size_t fracStart = pos;
    std::int64_t fracMs = 0;
    int digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) {
        fracMs = fracMs * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (pos == fracStart) return false;
    while (digits < 3) { fracMs *= 10; ++digits; }
    ms += fracMs;
  }

  if (pos >= s.size()) return false;
  if (s[pos] == 'Z') {
    if (pos + 1 != s.size()) return false;
    out = ms;
    return true;
  }
  if (s[pos] != '+' && s[pos] != '-') return false;
  const int sign = s[pos] == '+' ? 1 : -1;
  int oh, om;
  if (pos + 6 != s.size() || s[pos + 3] != ':') return false;
  if (!readDigits(s, pos + 1, 2, oh) || !readDigits(s, pos + 4, 2, om)) return false;
  if (oh > 23 || om > 59) return false;
  out = ms - sign * (static_cast<std::int64_t>(oh) * 60 + om) * kMsPerMinute;
  return true;
}

std::string trimmed(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

} // namespace

std::int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t floorTo(std::int64_t ms, std::int64_t unitMs) {
  std::int64_t q = ms / unitMs;
  if (ms % unitMs != 0 && ms < 0) --q;
  return q * unitMs;
}

std::optional<std::int64_t> civilToMs(int year, int month, int day, int hour, int minute, int second) {
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
  if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) return std::nullopt;
  const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  return days * kMsPerDay +
         (static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second) * kMsPerSecond;
}

Result<std::int64_t> parseDateTime(const std::string& raw) {
  const std::string value = trimmed(raw);
  if (value.empty()) return Error{"invalid datetime", {}};

  std::int64_t ts = 0;
  if (parseInteger(value, ts)) {
    if (ts > kSecondsCutoff) return ts;
    if (ts < std::numeric_limits<std::int64_t>::min() / kMsPerSecond) return Error{"invalid datetime", {}};
    return ts * kMsPerSecond;
  }
  if (parseRfc3339(value, ts)) return ts;
  if (value.size() == 19 && parseCivilPrefix(value, ' ', ts)) return ts;
  return Error{"invalid datetime format", {}};
}

std::string formatDateTime(std::int64_t ms) {
  const std::int64_t dayStart = floorTo(ms, kMsPerDay);
  const Civil c = civilFromDays(dayStart / kMsPerDay);
  const std::int64_t secs = (ms - dayStart) / kMsPerSecond;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02d:%02d:%02d",
                static_cast<long long>(c.year), c.month, c.day,
                static_cast<int>(secs / 3600), static_cast<int>((secs / 60) % 60),
                static_cast<int>(secs % 60));
  return buf;
}

std::string formatRfc3339(std::int64_t ms, bool fraction) {
  std::string out = formatDateTime(ms);
  out[10] = 'T';
  const int frac = static_cast<int>(ms - floorTo(ms, kMsPerSecond));
  if (fraction && frac != 0) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), ".%03d", frac);
    std::string f(buf);
    while (f.back() == '0') f.pop_back();
    out += f;
  }
  out += 'Z';
  return out;
}

Result<TimeRange> parseTimeRange(const std::string& start, const std::string& end, std::int64_t now) {
  const std::int64_t nowMinute = truncateToMinute(now);
  TimeRange r{nowMinute - 60 * kMsPerMinute, nowMinute};

  if (!trimmed(start).empty()) {
    auto s = parseDateTime(start);
    if (!s) return Error{s.error().message, "start"};
    r.startMs = *s;
  }
  if (!trimmed(end).empty()) {
    auto e = parseDateTime(end);
    if (!e) return Error{e.error().message, "end"};
    r.endMs = *e;
  }
  if (r.endMs < r.startMs) return Error{"end must be after start", "end"};
  return r;
}

} // namespace mvr::util
