#pragma once

#include <chrono>

namespace ebeflow {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  void reset() { t0_ = clock::now(); }

  double elapsed_seconds() const {
    const auto dt = clock::now() - t0_;
    return std::chrono::duration_cast<std::chrono::duration<double>>(dt).count();
  }

private:
  clock::time_point t0_;
};

// Adds the lifetime of the scope to `acc` (seconds).
class ScopedTimer {
public:
  explicit ScopedTimer(double& acc) : acc_(acc) {}
  ~ScopedTimer() { acc_ += t_.elapsed_seconds(); }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  double& acc_;
  WallTimer t_;
};

} // namespace ebeflow
