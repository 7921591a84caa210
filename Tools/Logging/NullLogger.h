#pragma once

// A logger that discards the data written to it, avoiding any overhead at runtime. It mimics the
// part of the std::ofstream interface that the log writers use.
class NullLogger {
 public:
  template <typename T>
  explicit NullLogger(const T&) noexcept {}

  explicit operator bool() const noexcept {
    return true;
  }

  template <typename T>
  NullLogger& operator<<(const T&) noexcept {
    return *this;
  }

  NullLogger& flush() noexcept {
    return *this;
  }
};
