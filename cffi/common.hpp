#pragma once

#if defined _WIN32
  #define ISODIST_EXTERN __declspec(dllexport)
#else
  #define ISODIST_EXTERN __attribute__ ((visibility ("default")))
#endif

extern "C" {
  ISODIST_EXTERN const char* isodist_strerror();
}

#include <string>
#include <exception>
#include <functional>

namespace cffi {
  void setErrorMessage(const std::string& e);

  // Runs the callable and converts any exception into
  // the on_error value plus a message for isodist_strerror().
  template <typename R>
  R wrap_catch(R on_error, std::function<R()>&& setter) {
    try {
      return setter();
    } catch (std::exception& e) {
      setErrorMessage(e.what());
      return on_error;
    }
  }

  template <typename T>
  T* heapify(const T& value) {
    return new T(value);
  }
}
