#pragma once

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace mvr {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel lvl);

class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  // empty -> stdout; falls back to stdout if the file cannot be opened.
  bool setFile(const std::string& path);

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

  mutable std::mutex mx_;
  std::FILE* file_ = nullptr;
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

} // namespace util
} // namespace mvr
