#include "spanproof/core/clock.h"

#include <thread>

namespace spanproof::core {

IClock::TimePoint SystemClock::now() {
  return std::chrono::time_point_cast<Duration>(std::chrono::steady_clock::now());
}

void SystemClock::sleep_for(const Duration duration) {
  std::this_thread::sleep_for(duration);
}

IClock::TimePoint ManualClock::now() {
  return current_;
}

void ManualClock::sleep_for(const Duration duration) {
  ++sleep_count_;
  current_ += duration;
}

}  // namespace spanproof::core
