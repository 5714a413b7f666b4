#include "mvr/rt/PeriodicTask.hpp"
#include "mvr/util/Logger.hpp"

#include <exception>

namespace mvr::rt {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds period, std::function<void()> fn)
  : name_(std::move(name))
  , period_(period.count() > 0 ? period : std::chrono::milliseconds(1))
  , fn_(std::move(fn))
{}

PeriodicTask::~PeriodicTask() {
  stop();
}

void PeriodicTask::start() {
  std::lock_guard<std::mutex> lk(mx_);
  if (running_ || thr_.joinable()) return;
  running_ = true;
  thr_ = std::thread([this]{ loop(); });
}

void PeriodicTask::stop() noexcept {
  {
    std::lock_guard<std::mutex> lk(mx_);
    running_ = false;
  }
  cv_.notify_all();
  if (thr_.joinable() && thr_.get_id() != std::this_thread::get_id()) thr_.join();
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lk(mx_);
  return running_;
}

unsigned long PeriodicTask::runs() const {
  std::lock_guard<std::mutex> lk(mx_);
  return runs_;
}

void PeriodicTask::loop() {
  auto next = std::chrono::steady_clock::now() + period_;
  for (;;) {
    {
      std::unique_lock<std::mutex> lk(mx_);
      if (cv_.wait_until(lk, next, [this]{ return !running_; })) return;
    }

    try {
      if (fn_) fn_();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "periodic.run.failed",
                         {{"task", name_}, {"what", ex.what()}});
    }

    {
      std::lock_guard<std::mutex> lk(mx_);
      ++runs_;
    }
    next += period_;
    const auto now = std::chrono::steady_clock::now();
    if (next < now) next = now + period_;
  }
}

} // namespace mvr::rt
