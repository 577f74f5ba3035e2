#include "cffi/common.hpp"

#include <string>
#include <mutex>

namespace cffi {
  static std::string last_error;

  static std::mutex m_;

  void setErrorMessage(const std::string& e) {
    std::lock_guard<std::mutex> lock_guard(m_);
    last_error = e;
  }

  // valid until the next call from the same thread
  static const char* errorMessage() {
    thread_local std::string message;
    std::lock_guard<std::mutex> lock_guard(m_);
    message = last_error;
    return message.c_str();
  }
}

extern "C" {

  ISODIST_EXTERN const char* isodist_strerror() {
    return cffi::errorMessage();
  }
}
