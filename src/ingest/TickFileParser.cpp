#include "mvr/ingest/TickFileParser.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <limits>

namespace mvr::ingest {

namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool equalsIgnoreCase(const std::string& a, const char* b) {
  std::size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return i == a.size() && b[i] == '\0';
}

int indexOf(const std::vector<std::string>& headers, const char* name) {
  for (std::size_t i = 0; i < headers.size(); ++i) {
    if (equalsIgnoreCase(trim(headers[i]), name)) return static_cast<int>(i);
  }
  return -1;
}

void stripBom(std::string& line) {
  if (line.size() >= 3 &&
      static_cast<unsigned char>(line[0]) == 0xEF &&
      static_cast<unsigned char>(line[1]) == 0xBB &&
      static_cast<unsigned char>(line[2]) == 0xBF) {
    line.erase(0, 3);
  }
}

void stripCr(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

bool isPipeLine(const std::string& line) {
  return line.find('|') != std::string::npos && line.find(',') == std::string::npos;
}

// True while a quoted field in `record` has not been closed. Quotes open a
// field only at its start, matching splitCsvRecord; a stray '"' inside an
// unquoted field is literal.
bool quoteOpen(const std::string& record) {
  bool inQuotes = false;
  bool fieldStart = true;
  for (std::size_t i = 0; i < record.size(); ++i) {
    const char c = record[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < record.size() && record[i + 1] == '"') ++i;
        else inQuotes = false;
      }
      continue;
    }
    if (c == ',') {
      fieldStart = true;
    } else if (c == '"' && fieldStart) {
      inQuotes = true;
      fieldStart = false;
    } else {
      fieldStart = false;
    }
  }
  return inQuotes;
}

std::optional<double> fieldPrice(const std::vector<std::string>& fields, int idx) {
  if (idx < 0 || static_cast<std::size_t>(idx) >= fields.size()) return std::nullopt;
  return parsePrice(fields[static_cast<std::size_t>(idx)]);
}

} // namespace

Result<FileEncoding> classify(const std::string& firstLine) {
  std::string line = trim(firstLine);
  stripBom(line);
  if (isPipeLine(line)) return FileEncoding{PipeDelimited{}};

  const auto headers = splitCsvRecord(line);
  HeaderLayout layout;
  layout.time = indexOf(headers, "time_msc");
  if (layout.time < 0) layout.time = indexOf(headers, "t");
  if (layout.time < 0) return Error{"missing time column", "header"};

  layout.last = indexOf(headers, "last");
  layout.bid  = indexOf(headers, "bid");
  layout.ask  = indexOf(headers, "ask");
  layout.p    = indexOf(headers, "p");
  return FileEncoding{HeaderDelimited{layout}};
}

std::optional<std::int64_t> parseTimestamp(const std::string& value) {
  const std::string s = trim(value);
  if (s.empty()) return std::nullopt;

  const char* first = s.data();
  const char* last = s.data() + s.size();
  if (*first == '+') ++first;
  if (first == last) return std::nullopt;

  std::int64_t ts = 0;
  auto [ptr, ec] = std::from_chars(first, last, ts);
  if (ec != std::errc() || ptr != last) return std::nullopt;

  if (ts < util::kSecondsCutoff) {
    if (ts < std::numeric_limits<std::int64_t>::min() / util::kMsPerSecond) return std::nullopt;
    ts *= util::kMsPerSecond;
  }
  return ts;
}

std::optional<double> parsePrice(const std::string& value) {
  const std::string s = trim(value);
  if (s.empty()) return std::nullopt;

  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

std::vector<std::string> splitCsvRecord(const std::string& record) {
  std::vector<std::string> out;
  std::string field;
  bool inQuotes = false;

  for (std::size_t i = 0; i < record.size(); ++i) {
    const char c = record[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < record.size() && record[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == ',') {
      out.push_back(std::move(field));
      field.clear();
    } else if (c == '"' && field.empty()) {
      inQuotes = true;
    } else {
      field.push_back(c);
    }
  }
  out.push_back(std::move(field));
  return out;
}

std::optional<ParsedRow> parsePipeLine(const std::string& line) {
  const auto bar = line.find('|');
  if (bar == std::string::npos) return std::nullopt;

  auto ts = parseTimestamp(line.substr(0, bar));
  if (!ts) return std::nullopt;

  // Only the segment between the first and second '|' carries fields.
  std::string rest = line.substr(bar + 1);
  const auto nextBar = rest.find('|');
  if (nextBar != std::string::npos) rest.resize(nextBar);

  std::size_t pos = 0;
  for (int field = 0; field < 4; ++field) {
    pos = rest.find(':', pos);
    if (pos == std::string::npos) return std::nullopt;
    ++pos;
  }
  const auto end = rest.find(':', pos);
  auto price = parsePrice(rest.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
  if (!price) return std::nullopt;

  return ParsedRow{*ts, *price};
}

std::optional<ParsedRow> parseCsvRecord(const HeaderLayout& layout,
                                        const std::vector<std::string>& fields) {
  if (layout.time < 0 || static_cast<std::size_t>(layout.time) >= fields.size()) return std::nullopt;

  auto ts = parseTimestamp(fields[static_cast<std::size_t>(layout.time)]);
  if (!ts) return std::nullopt;

  std::optional<double> price;
  for (int idx : {layout.last, layout.bid, layout.ask, layout.p}) {
    price = fieldPrice(fields, idx);
    if (price) break;
  }
  if (!price) return std::nullopt;

  return ParsedRow{*ts, *price};
}

Result<ParseStats> parseStream(std::istream& in, const RowSink& sink) {
  ParseStats stats;
  std::string line;

  std::string first;
  while (std::getline(in, line)) {
    stripCr(line);
    if (!trim(line).empty()) {
      first = line;
      break;
    }
  }
  if (first.empty()) return stats;
  stripBom(first);

  auto enc = classify(first);
  if (!enc) return enc.error();

  auto emit = [&](const std::optional<ParsedRow>& row) {
    if (row) {
      sink(*row);
      ++stats.accepted;
    } else {
      ++stats.skipped;
    }
  };

  if (std::holds_alternative<PipeDelimited>(*enc)) {
    emit(parsePipeLine(trim(first)));
    while (std::getline(in, line)) {
      line = trim(line);
      if (line.empty()) continue;
      emit(parsePipeLine(line));
    }
    return stats;
  }

  const HeaderLayout layout = std::get<HeaderDelimited>(*enc).layout;
  while (std::getline(in, line)) {
    stripCr(line);
    // A quoted field may carry embedded newlines.
    while (quoteOpen(line)) {
      std::string more;
      if (!std::getline(in, more)) break;
      stripCr(more);
      line += '\n';
      line += more;
    }
    if (trim(line).empty()) continue;
    emit(parseCsvRecord(layout, splitCsvRecord(line)));
  }
  return stats;
}

} // namespace mvr::ingest
