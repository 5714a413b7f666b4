// include/mvr/ingest/DirectoryScanner.hpp
#pragma once

#include "mvr/ingest/TickPoint.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mvr::ingest {

// A root exists but could not be listed. The scan pass is abandoned.
class ScanError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ScanStats {
  std::size_t files = 0;
  std::size_t skippedFiles = 0;
  std::size_t rows = 0;
  std::size_t skippedRows = 0;
};

using TickSink = std::function<void(const TickPoint&)>;

// Walks root/<date>/<symbol>/<file> trees. Entries are visited in name order so
// repeated scans of the same tree feed ticks in the same sequence.
class DirectoryScanner {
public:
  explicit DirectoryScanner(std::vector<std::string> roots);

  // Every file under every root.
  ScanStats scanAll(const TickSink& sink) const;

  // Only files whose path-encoded time lies in [startMs, endMs].
  ScanStats scanRange(std::int64_t startMs, std::int64_t endMs, const TickSink& sink) const;

  // Time encoded by "<YYYY-MM-DD>/<stem>.<ext>" where the stem is a timestamp
  // or HH_MM. nullopt if neither part parses.
  static std::optional<std::int64_t> fileTimestamp(const std::string& dateName,
                                                   const std::string& fileName);

  const std::vector<std::string>& roots() const { return roots_; }

private:
  struct Filter {
    std::int64_t startMs;
    std::int64_t endMs;
  };

  ScanStats scan(const std::optional<Filter>& filter, const TickSink& sink) const;
  void scanRoot(const std::string& root, const std::optional<Filter>& filter,
                const TickSink& sink, ScanStats& stats) const;

  std::vector<std::string> roots_;
};

} // namespace mvr::ingest
