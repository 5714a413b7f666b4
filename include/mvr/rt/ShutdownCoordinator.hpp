#pragma once

#include "mvr/util/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mvr::rt {

class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
  }

  // Idempotent stop: each step executed once, in ascending order.
  void stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return; // already stopping
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      std::stable_sort(steps_.begin(), steps_.end(), [](const Step& a, const Step& b){
        return a.order < b.order;
      });
      run = steps_;
    }
    for (auto& s : run) {
      const auto t0 = std::chrono::steady_clock::now();
      try {
        s.fn();
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Warn, "shutdown.step.failed",
                           {{"step", s.name}, {"what", ex.what()}});
        continue;
      }
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - t0).count();
      util::logger().log(util::LogLevel::Debug, "shutdown.step.done",
                         {{"step", s.name}, {"ms", std::to_string(ms)}});
    }
  }

  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

  std::size_t stepCount() const {
    std::lock_guard<std::mutex> lk(mx_);
    return steps_.size();
  }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  mutable std::mutex mx_;
};

} // namespace mvr::rt
