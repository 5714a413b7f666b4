#pragma once

#include <string>
#include <vector>

namespace mvr {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if the file was read (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Override from the process environment (PORT, DATA_DIRS, ...).
  void applyEnv();

  // Apply a single key/value pair; returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  unsigned short port = 8080;
  std::string version = "dev";
  std::vector<std::string> allowedOrigins{"*"};
  std::vector<std::string> dataDirs{"/data/cedro-ticker-uploader",
                                    "/data/massive-ticker-uploader"};

  int cacheTtlSeconds = 60;
  int reloadMinutes   = 30;   // 0 disables the scheduled reload
  int ioThreads       = 2;
  int workerThreads   = 8;

  std::string logLevel = "info";
  bool logJson = false;
  std::string logFile;
  int metricsIntervalSeconds = 0; // 0 disables the reporter

  static std::vector<std::string> splitList(const std::string& s);
  static std::string trim(const std::string& s);

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
};

} // namespace util
} // namespace mvr
