// include/mvr/ingest/TickFileParser.hpp
#pragma once

#include "mvr/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mvr::ingest {

// Column positions resolved from a header row; -1 when the column is absent.
struct HeaderLayout {
  int time = -1;
  int last = -1;
  int bid  = -1;
  int ask  = -1;
  int p    = -1;
};

// Format (a): delimited rows under a header naming the columns.
struct HeaderDelimited {
  HeaderLayout layout;
};

// Format (b): `timestamp|f0:f1:f2:f3:price[:...]`.
struct PipeDelimited {};

using FileEncoding = std::variant<HeaderDelimited, PipeDelimited>;

struct ParsedRow {
  std::int64_t timestampMs = 0;
  double price = 0.0;
};

struct ParseStats {
  std::size_t accepted = 0;
  std::size_t skipped = 0;
};

// Sniffs the first non-blank line of a file. A header without a time column is
// an error; anything else classifies.
Result<FileEncoding> classify(const std::string& firstLine);

// Integer timestamp; values below 1e10 are seconds and are scaled to ms.
std::optional<std::int64_t> parseTimestamp(const std::string& value);
// Finite decimal number, surrounding blanks ignored.
std::optional<double> parsePrice(const std::string& value);

// RFC 4180 field splitting for one record ("" inside quotes is a literal quote).
std::vector<std::string> splitCsvRecord(const std::string& record);

std::optional<ParsedRow> parsePipeLine(const std::string& line);
std::optional<ParsedRow> parseCsvRecord(const HeaderLayout& layout,
                                        const std::vector<std::string>& fields);

// Classifies and parses a whole stream, invoking sink for every accepted row.
// Returns the classification error for a header without a time column; blank
// input parses to zero rows.
using RowSink = std::function<void(const ParsedRow&)>;
Result<ParseStats> parseStream(std::istream& in, const RowSink& sink);

} // namespace mvr::ingest
