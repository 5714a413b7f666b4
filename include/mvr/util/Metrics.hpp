#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mvr {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: a background reporter that logs a snapshot every N seconds.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  // If already running, restarts with the new interval.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned int intervalSeconds);

  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex runMu_;
  std::condition_variable runCv_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util
} // namespace mvr

#define MVR_METRIC_INC(name, d) ::mvr::util::MetricRegistry::instance().increment((name), (d))
#define MVR_METRIC_HIT(name)    ::mvr::util::MetricRegistry::instance().increment((name), 1.0)
#define MVR_METRIC_SET(name, v) ::mvr::util::MetricRegistry::instance().setGauge((name), (v))
