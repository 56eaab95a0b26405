#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace tamma {

using TimePoint = std::chrono::system_clock::time_point;

// Milliseconds since the epoch; the precision the store persists.
[[nodiscard]] inline auto to_millis(TimePoint tp) noexcept -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) noexcept -> TimePoint {
  return TimePoint{std::chrono::milliseconds(ms)};
}

class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

// Wall clock that never goes backwards, truncated to milliseconds.
class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const -> TimePoint override {
    auto current = to_millis(std::chrono::system_clock::now());
    auto last = last_.load(std::memory_order_relaxed);
    while (current > last) {
      if (last_.compare_exchange_weak(last, current,
                                      std::memory_order_relaxed)) {
        return from_millis(current);
      }
    }
    return from_millis(last);
  }

private:
  mutable std::atomic<std::int64_t> last_{0};
};

// Time only moves when told to.
class ManualClock final : public Clock {
public:
  explicit ManualClock(TimePoint start = from_millis(1'700'000'000'000))
      : now_(to_millis(start)) {}

  [[nodiscard]] auto now() const -> TimePoint override {
    return from_millis(now_.load(std::memory_order_acquire));
  }

  auto advance(std::chrono::milliseconds delta) -> void {
    now_.fetch_add(delta.count(), std::memory_order_acq_rel);
  }

  auto set(TimePoint tp) -> void {
    now_.store(to_millis(tp), std::memory_order_release);
  }

private:
  std::atomic<std::int64_t> now_;
};

}  // namespace tamma
