#pragma once
#include <chrono>
#include <cstddef>

// Wall-clock stopwatch for the drivers' throughput lines.
//   Stopwatch sw;  ...;  double s = sw.lap();   // seconds since start / last lap
struct Stopwatch {
  using clock = std::chrono::steady_clock;

  Stopwatch() : t0_(clock::now()), lap_(t0_) {}

  double lap() {
    const auto now = clock::now();
    const double s = std::chrono::duration<double>(now - lap_).count();
    lap_ = now;
    return s;
  }

  double total() const { return std::chrono::duration<double>(clock::now() - t0_).count(); }

private:
  clock::time_point t0_, lap_;
};

// Items per second, 0 when nothing was timed.
inline double throughput(std::size_t items, double seconds) {
  return seconds > 0.0 ? static_cast<double>(items) / seconds : 0.0;
}
