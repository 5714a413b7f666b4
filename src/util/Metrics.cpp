#include "mvr/util/Metrics.hpp"
#include "mvr/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace mvr {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  stopReporter();
  if (intervalSeconds == 0) intervalSeconds = 1;

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{ reporterLoop(intervalSeconds); });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(runMu_);
    running_.store(false, std::memory_order_release);
  }
  runCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds);

  for (;;) {
    {
      std::unique_lock<std::mutex> lk(runMu_);
      if (runCv_.wait_for(lk, period, [this]{ return !running_.load(std::memory_order_acquire); })) {
        return;
      }
    }

    std::vector<Field> fields;
    {
      std::lock_guard<std::mutex> lk(mu_);
      fields.reserve(counters_.size() + gauges_.size());
      for (const auto& kv : counters_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
      for (const auto& kv : gauges_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
    }
    if (!fields.empty()) logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace mvr
