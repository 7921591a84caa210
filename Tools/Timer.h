#pragma once

#include <chrono>

// A timer to measure how long some code takes to execute.
class Timer {
 public:
  // Constructs a timer and starts it.
  Timer() : startTime(std::chrono::steady_clock::now()) {}

  // Returns the time elapsed since the timer was started.
  template <typename UnitT = std::chrono::milliseconds>
  int elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<UnitT>(now - startTime).count();
  }

  // Returns the time elapsed since the timer was started, and restarts the timer. Useful for
  // timing a sequence of phases with a single timer.
  template <typename UnitT = std::chrono::milliseconds>
  int lap() {
    const auto now = std::chrono::steady_clock::now();
    const int time = std::chrono::duration_cast<UnitT>(now - startTime).count();
    startTime = now;
    return time;
  }

 private:
  std::chrono::steady_clock::time_point startTime; // Time point when the timer was started.
};
