#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mvr::rt {

// Runs fn every `period` on its own thread until stop(). The first run happens
// one full period after start(). stop() wakes the sleeper and joins; a run in
// progress completes first.
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds period, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop() noexcept;

  bool running() const;
  unsigned long runs() const;

private:
  void loop();

  std::string name_;
  std::chrono::milliseconds period_;
  std::function<void()> fn_;

  mutable std::mutex mx_;
  std::condition_variable cv_;
  bool running_{false};
  unsigned long runs_{0};
  std::thread thr_;
};

} // namespace mvr::rt
