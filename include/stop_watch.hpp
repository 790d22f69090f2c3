#pragma once
#include <chrono>

namespace randfile {

// Wall-clock timer for a generation run. Elapsed time is read on demand as a `Duration`;
// nothing is printed. `StopWatch<std::chrono::duration<double>>` yields fractional seconds.
template <typename Duration = std::chrono::milliseconds>
class StopWatch {
 public:
  using clock = std::chrono::steady_clock;

  StopWatch() : begin_time_{clock::now()} {
  }

  auto elapsed() const -> Duration {
    return std::chrono::duration_cast<Duration>(clock::now() - begin_time_);
  }

 private:
  clock::time_point begin_time_;
};

}  // namespace randfile
