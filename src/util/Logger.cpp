#include "mvr/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mvr::util {

namespace {

std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

void appendEscaped(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:   oss << c;
    }
  }
}

} // namespace

const char* levelName(LogLevel l) {
  switch (l) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  std::transform(x.begin(), x.end(), x.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn" || x == "warning") return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::~Logger() {
  if (file_ && file_ != stdout) std::fclose(file_);
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(file_);
  file_ = nullptr;
  if (path.empty()) return true;
  file_ = std::fopen(path.c_str(), "a");
  return file_ != nullptr;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::ostringstream oss;
  const std::string ts = nowIso();

  std::lock_guard<std::mutex> lk(mx_);
  std::FILE* f = file_ ? file_ : stdout;

  if (json_) {
    oss << "{\"ts\":\"" << ts << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    appendEscaped(oss, msg);
    oss << "\"";
    for (const auto& kv : fields) {
      oss << ",\"";
      appendEscaped(oss, kv.k);
      oss << "\":\"";
      appendEscaped(oss, kv.v);
      oss << "\"";
    }
    oss << "}\n";
  } else {
    oss << '[' << ts << "] " << std::left << std::setw(5) << levelName(lvl) << ' ' << msg;
    for (const auto& kv : fields) oss << ' ' << kv.k << '=' << kv.v;
    oss << '\n';
  }

  const std::string line = oss.str();
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

} // namespace mvr::util
