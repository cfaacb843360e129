#pragma once

#include <chrono>
#include <cstdint>

namespace gpk {

class Timer {
  using clock = std::chrono::steady_clock;

 public:
  Timer() : b(clock::now()) {}

  void reset() { b = clock::now(); }

  template <typename Unit = std::chrono::microseconds>
  uint64_t elapsed() const {
    return std::chrono::duration_cast<Unit>(clock::now() - b).count();
  }

  uint64_t elapsed_ns() const { return elapsed<std::chrono::nanoseconds>(); }
  uint64_t elapsed_us() const { return elapsed<std::chrono::microseconds>(); }
  uint64_t elapsed_ms() const { return elapsed<std::chrono::milliseconds>(); }

 private:
  clock::time_point b;
};

}  // namespace gpk
