#pragma once

#include <chrono>

namespace spanproof::core {

// Abstract monotonic clock for deadline polling.
// Production code uses the steady clock and a real sleep; tests use ManualClock so
// that deadline behaviour is exercised without waiting.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  using Duration = std::chrono::nanoseconds;
  using TimePoint = std::chrono::time_point<std::chrono::steady_clock, Duration>;

  virtual ~IClock() = default;

  virtual TimePoint now() = 0;
  virtual void sleep_for(Duration duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: std::chrono::steady_clock and std::this_thread::sleep_for.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  TimePoint now() override;
  void sleep_for(Duration duration) override;
};

// Manual clock: time only moves when sleep_for() or advance() is called.
class ManualClock final : public IClock {
 public:
  ManualClock() = default;
  ~ManualClock() override = default;

  ManualClock(const ManualClock&) = default;
  ManualClock& operator=(const ManualClock&) = default;
  ManualClock(ManualClock&&) = default;
  ManualClock& operator=(ManualClock&&) = default;

  TimePoint now() override;
  void sleep_for(Duration duration) override;

  void advance(Duration duration) { current_ += duration; }
  [[nodiscard]] int sleep_count() const noexcept { return sleep_count_; }

 private:
  TimePoint current_{};
  int sleep_count_{0};
};

}  // namespace spanproof::core
