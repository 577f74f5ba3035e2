#pragma once

#include "ms/periodic_table.hpp"

#include <exception>
#include <map>
#include <sstream>
#include <string>

namespace ms {
typedef std::map<std::string, int> ElementCounter;

std::string sumFormula(const ElementCounter& counter);
}

namespace sf_parser {
class ParseError : public std::exception {
  std::string msg_;

 public:
  ParseError(const std::string& str, size_t pos) {
    std::ostringstream ss;
    ss << str << " at position " << pos;
    msg_ = ss.str();
  }

  virtual const char* what() const noexcept { return msg_.c_str(); }
};

class NegativeTotalError : public std::exception {
  std::string msg_;

 public:
  NegativeTotalError(const std::string& element, int total) {
    std::ostringstream ss;
    ss << "total number of " << element << " elements (" << total
       << ") is less than zero";
    msg_ = ss.str();
  }

  virtual const char* what() const noexcept { return msg_.c_str(); }
};

// Parses formulas such as "C6H12O6", "2(CH3)2SO.H2O" or "C3H7NO2+Na-H".
// Elements must be present in the given table.
ms::ElementCounter parseSumFormula(const std::string& formula,
                                   const ms::ElementTable& table = ms::periodic_table);
}
