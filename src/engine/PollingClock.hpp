#pragma once

#include <chrono>
#include <thread>

namespace folio::engine {

// Time source for the blocking poll and backoff loops; tests substitute a
// clock whose sleep only advances a counter.
class PollingClock {
public:
  virtual ~PollingClock() = default;
  virtual std::chrono::milliseconds now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SteadyPollingClock final : public PollingClock {
public:
  std::chrono::milliseconds now() override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
  }
  void sleep_for(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

} // namespace folio::engine
