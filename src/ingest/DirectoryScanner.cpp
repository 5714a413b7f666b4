#include "mvr/ingest/DirectoryScanner.hpp"
#include "mvr/ingest/TickFileParser.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace mvr::ingest {

namespace {

bool hidden(const fs::path& p) {
  const std::string name = p.filename().string();
  return !name.empty() && name.front() == '.';
}

// Lists `dir` in name order, hidden entries dropped.
std::vector<fs::directory_entry> listSorted(const fs::path& dir, std::error_code& ec) {
  std::vector<fs::directory_entry> out;
  fs::directory_iterator it(dir, ec);
  if (ec) return out;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) return out;
    if (hidden(it->path())) continue;
    out.push_back(*it);
  }
  std::sort(out.begin(), out.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
    return a.path().filename() < b.path().filename();
  });
  return out;
}

bool isDir(const fs::directory_entry& e) {
  std::error_code ec;
  return e.is_directory(ec);
}

bool isFile(const fs::directory_entry& e) {
  std::error_code ec;
  return e.is_regular_file(ec);
}

bool parseUnsigned(const std::string& s, int& out) {
  if (s.empty() || s.size() > 4) return false;
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

void ingestFile(const fs::path& path, const std::string& symbol,
                const TickSink& sink, ScanStats& stats) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    ++stats.skippedFiles;
    MVR_METRIC_HIT("ingest.file_skipped");
    util::logger().log(util::LogLevel::Warn, "ingest.file.unreadable", {{"path", path.string()}});
    return;
  }

  auto parsed = parseStream(in, [&](const ParsedRow& row) {
    sink(TickPoint{symbol, row.timestampMs, row.price});
  });
  if (!parsed) {
    ++stats.skippedFiles;
    MVR_METRIC_HIT("ingest.file_skipped");
    util::logger().log(util::LogLevel::Warn, "ingest.file.rejected",
                       {{"path", path.string()}, {"error", parsed.error().describe()}});
    return;
  }
  if (in.bad()) {
    util::logger().log(util::LogLevel::Warn, "ingest.file.read_error", {{"path", path.string()}});
  }

  ++stats.files;
  stats.rows += parsed->accepted;
  stats.skippedRows += parsed->skipped;
  if (parsed->skipped > 0) {
    util::logger().log(util::LogLevel::Debug, "ingest.rows.skipped",
                       {{"path", path.string()}, {"count", std::to_string(parsed->skipped)}});
  }
}

} // namespace

DirectoryScanner::DirectoryScanner(std::vector<std::string> roots)
  : roots_(std::move(roots))
{}

ScanStats DirectoryScanner::scanAll(const TickSink& sink) const {
  return scan(std::nullopt, sink);
}

ScanStats DirectoryScanner::scanRange(std::int64_t startMs, std::int64_t endMs, const TickSink& sink) const {
  return scan(Filter{startMs, endMs}, sink);
}

std::optional<std::int64_t> DirectoryScanner::fileTimestamp(const std::string& dateName,
                                                            const std::string& fileName) {
  if (dateName.size() != 10 || dateName[4] != '-' || dateName[7] != '-') return std::nullopt;
  int year = 0, month = 0, day = 0;
  if (!parseUnsigned(dateName.substr(0, 4), year) ||
      !parseUnsigned(dateName.substr(5, 2), month) ||
      !parseUnsigned(dateName.substr(8, 2), day)) {
    return std::nullopt;
  }
  auto dayStart = util::civilToMs(year, month, day);
  if (!dayStart) return std::nullopt;

  const std::string stem = fs::path(fileName).stem().string();

  const auto us = stem.find('_');
  if (us == std::string::npos) {
    // Millisecond-stamped batch file.
    return parseTimestamp(stem);
  }

  int hour = 0, minute = 0;
  if (stem.find('_', us + 1) != std::string::npos) return std::nullopt;
  if (!parseUnsigned(stem.substr(0, us), hour) || !parseUnsigned(stem.substr(us + 1), minute)) {
    return std::nullopt;
  }
  return util::civilToMs(year, month, day, hour, minute, 0);
}

ScanStats DirectoryScanner::scan(const std::optional<Filter>& filter, const TickSink& sink) const {
  ScanStats stats;
  for (const auto& root : roots_) {
    if (root.find_first_not_of(" \t") == std::string::npos) continue;
    scanRoot(root, filter, sink, stats);
  }
  MVR_METRIC_INC("ingest.files", static_cast<double>(stats.files));
  MVR_METRIC_INC("ingest.rows", static_cast<double>(stats.rows));
  return stats;
}

void DirectoryScanner::scanRoot(const std::string& root, const std::optional<Filter>& filter,
                                const TickSink& sink, ScanStats& stats) const {
  const fs::path rootPath(root);
  std::error_code ec;
  const auto st = fs::status(rootPath, ec);
  if (st.type() == fs::file_type::not_found) {
    util::logger().log(util::LogLevel::Warn, "ingest.root.missing", {{"root", root}});
    return;
  }
  if (ec) throw ScanError("cannot stat root " + root + ": " + ec.message());
  if (st.type() != fs::file_type::directory) throw ScanError("root is not a directory: " + root);

  const auto dates = listSorted(rootPath, ec);
  if (ec) throw ScanError("cannot list root " + root + ": " + ec.message());

  for (const auto& dateEntry : dates) {
    if (!isDir(dateEntry)) continue;
    const std::string dateName = dateEntry.path().filename().string();

    const auto symbols = listSorted(dateEntry.path(), ec);
    if (ec) {
      util::logger().log(util::LogLevel::Warn, "ingest.dir.unreadable",
                         {{"path", dateEntry.path().string()}, {"error", ec.message()}});
      ec.clear();
      continue;
    }

    for (const auto& symbolEntry : symbols) {
      if (!isDir(symbolEntry)) continue;
      const std::string symbol = symbolEntry.path().filename().string();

      const auto files = listSorted(symbolEntry.path(), ec);
      if (ec) {
        util::logger().log(util::LogLevel::Warn, "ingest.dir.unreadable",
                           {{"path", symbolEntry.path().string()}, {"error", ec.message()}});
        ec.clear();
        continue;
      }

      for (const auto& fileEntry : files) {
        if (!isFile(fileEntry)) continue;
        if (filter) {
          auto ts = fileTimestamp(dateName, fileEntry.path().filename().string());
          if (!ts || *ts < filter->startMs || *ts > filter->endMs) continue;
        }
        ingestFile(fileEntry.path(), symbol, sink, stats);
      }
    }
  }
}

} // namespace mvr::ingest
