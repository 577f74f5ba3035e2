#pragma once

#ifdef ISODIST_PROFILE
#include <chrono>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace utils {

// Appends one line per measurement to isodist_profile.log:
//   [ message ] ~ elapsed milliseconds
class ProfilingTimer {
  std::ofstream out_;
  std::mutex mutex_;

  explicit ProfilingTimer(const std::string& output_file) {
    out_.open(output_file, std::ofstream::out | std::ofstream::app);
  }

  ~ProfilingTimer() { out_.close(); }

 public:
  typedef std::chrono::high_resolution_clock Clock;

  inline static ProfilingTimer& instance() {
    static ProfilingTimer timer("isodist_profile.log");
    return timer;
  }

  void record(const std::string& message, Clock::time_point start) {
    auto milli = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[ " << message << " ] ~ " << milli << std::endl;
  }
};

class ScopedTimer {
  ProfilingTimer::Clock::time_point start_;
  std::stringstream message_;

 public:
  ScopedTimer() : start_(ProfilingTimer::Clock::now()) {}

  ~ScopedTimer() { ProfilingTimer::instance().record(message_.str(), start_); }

  template <typename T>
  ScopedTimer& operator<<(const T& obj) {
    message_ << obj;
    return *this;
  }
};
}
#else  // no-op logger
namespace utils {
struct ScopedTimer {
  template <typename T>
  ScopedTimer& operator<<(const T&) {
    return *this;
  }
};
}
#endif
