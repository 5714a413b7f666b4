#include "mvr/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace mvr {
namespace util {

namespace {

int toInt(const std::string& v, int fallback) {
  char* end = nullptr;
  long x = std::strtol(v.c_str(), &end, 10);
  if (end == v.c_str() || (end && *end != '\0')) return fallback;
  return static_cast<int>(x);
}

bool toBool(const std::string& v) {
  std::string x = v;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

struct EnvKey {
  const char* env;
  const char* key;
};

constexpr EnvKey kEnvKeys[] = {
  {"PORT",                "port"},
  {"APP_VERSION",         "version"},
  {"BFF_ALLOWED_ORIGINS", "allowed_origins"},
  {"DATA_DIRS",           "data_dirs"},
  {"CACHE_TTL_SECONDS",   "cache_ttl_seconds"},
  {"RELOAD_MINUTES",      "reload_minutes"},
  {"IO_THREADS",          "io_threads"},
  {"WORKER_THREADS",      "worker_threads"},
  {"LOG_LEVEL",           "log_level"},
  {"LOG_JSON",            "log_json"},
  {"LOG_FILE",            "log_file"},
  {"METRICS_INTERVAL",    "metrics_interval"},
};

} // namespace

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::vector<std::string> Config::splitList(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      auto t = trim(cur);
      if (!t.empty()) out.push_back(std::move(t));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  auto t = trim(cur);
  if (!t.empty()) out.push_back(std::move(t));
  return out;
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  return !k.empty();
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "port") {
    int p = toInt(val, port);
    if (p > 0 && p <= 65535) port = static_cast<unsigned short>(p);
  }
  else if (key == "version")            version = val;
  else if (key == "allowed_origins")    allowedOrigins = splitList(val);
  else if (key == "data_dirs")          dataDirs = splitList(val);
  else if (key == "cache_ttl_seconds")  cacheTtlSeconds = std::max(0, toInt(val, cacheTtlSeconds));
  else if (key == "reload_minutes")     reloadMinutes = std::max(0, toInt(val, reloadMinutes));
  else if (key == "io_threads")         ioThreads = std::max(1, toInt(val, ioThreads));
  else if (key == "worker_threads")     workerThreads = std::max(1, toInt(val, workerThreads));
  else if (key == "log_level")          logLevel = val;
  else if (key == "log_json")           logJson = toBool(val);
  else if (key == "log_file")           logFile = val;
  else if (key == "metrics_interval")   metricsIntervalSeconds = std::max(0, toInt(val, metricsIntervalSeconds));
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.assign(tmp);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue;

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;
    set(key, val); // unknown keys are ignored to stay forward-compatible
  }

  std::fclose(f);
  return true;
}

void Config::applyEnv() {
  for (const auto& ek : kEnvKeys) {
    const char* raw = std::getenv(ek.env);
    if (!raw) continue;
    auto v = trim(raw);
    if (v.empty()) continue;
    set(ek.key, v);
  }
}

} // namespace util
} // namespace mvr
