#pragma once

#include <exception>
#include <sstream>
#include <string>

namespace ms {

class IsotopeError : public std::exception {
 protected:
  std::string msg_;

 public:
  IsotopeError() {}
  explicit IsotopeError(const std::string& msg) : msg_(msg) {}

  virtual const char* what() const noexcept { return msg_.c_str(); }
};

class UnsupportedMode : public IsotopeError {
 public:
  explicit UnsupportedMode(const std::string& mode) {
    msg_ = mode + " is not implemented";
  }
};

class DegenerateConvolution : public IsotopeError {
 public:
  explicit DegenerateConvolution(const std::string& reason) {
    msg_ = "degenerate convolution: " + reason;
  }
};

class InvalidExponent : public IsotopeError {
 public:
  explicit InvalidExponent(long n) {
    std::ostringstream ss;
    ss << "envelope can only be multiplied a positive number of times (got " << n << ")";
    msg_ = ss.str();
  }
};

class InvalidCharge : public IsotopeError {
 public:
  InvalidCharge() : IsotopeError("charge must be non-zero") {}
};

class MassOutOfRange : public IsotopeError {
 public:
  explicit MassOutOfRange(double mass) {
    std::ostringstream ss;
    ss << "mass " << mass << " is outside of the range of the averagine model";
    msg_ = ss.str();
  }
};

class NegativeAtomCount : public IsotopeError {
 public:
  NegativeAtomCount(const std::string& element, long count) {
    std::ostringstream ss;
    ss << "number of " << element << " atoms (" << count << ") is less than zero";
    msg_ = ss.str();
  }
};

class UnknownElement : public IsotopeError {
 public:
  explicit UnknownElement(const std::string& element) {
    msg_ = "unknown element " + element;
  }
};
}
