#include "ms/formula.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>

namespace ms {

std::string sumFormula(const ElementCounter& counter) {
  std::stringstream ss;
  // Hill order: carbon and hydrogen first, the rest alphabetically
  auto write = [&](const std::string& element, int count) {
    if (count <= 0) return;
    ss << element;
    if (count > 1) ss << count;
  };
  auto c = counter.find("C");
  if (c != counter.end()) {
    write("C", c->second);
    auto h = counter.find("H");
    if (h != counter.end()) write("H", h->second);
  }
  for (auto& item : counter) {
    if (c != counter.end() && (item.first == "C" || item.first == "H")) continue;
    write(item.first, item.second);
  }
  return ss.str();
}
}

namespace sf_parser {
typedef ms::ElementCounter ElementCounter;

class SumFormulaParser {
  std::string s;
  size_t n;
  const ms::ElementTable& table_;
  ElementCounter counter_;

 public:
  SumFormulaParser(const std::string& input, const ms::ElementTable& table)
      : s(input), n(0), table_(table) {
    parseSumFormula(counter_);
  }

  const ElementCounter& elementCounts() const { return counter_; }

 private:
  bool eof() const { return n >= s.length(); }

  void checkAvailable() const {
    if (eof()) throw ParseError("unexpected end of input", n);
  }

  char nextChar() {
    checkAvailable();
    return s[n++];
  }

  char peek() const {
    checkAvailable();
    return s[n];
  }

  uint16_t parseOptionalNumber() {
    if (eof() || !std::isdigit(peek())) return 1;
    auto pos = n;
    uint16_t result = 0;
    while (!eof() && std::isdigit(peek())) {
      if (result >= 3000) throw ParseError("the number is too big", pos);
      result = result * 10 + (nextChar() - '0');
    }
    return result;
  }

  void parseElement(ElementCounter& counter) {
    std::string element;
    auto pos = n;
    element.push_back(nextChar());
    if (!std::isupper(element.back())) throw ParseError("expected an element", pos);
    while (!eof() && std::islower(peek()))
      element.push_back(nextChar());
    uint16_t num = parseOptionalNumber();
    if (table_.find(element) == table_.end())
      throw ParseError("unknown element " + element, pos);
    counter[element] += num;
  }

  void parseSimpleFragment(ElementCounter& counter) {
    while (!eof() && std::isupper(peek())) {
      parseElement(counter);
    }
  }

  void parseFragment(ElementCounter& counter) {
    checkAvailable();

    if (peek() == '(') {
      nextChar();
      ElementCounter tmp;
      parseFragment(tmp);
      while (!eof() && peek() != ')')
        parseFragment(tmp);
      if (eof() || nextChar() != ')')
        throw ParseError("expected closing parenthesis", n - 1);
      auto repeats = parseOptionalNumber();
      for (auto& item : tmp)
        counter[item.first] += item.second * repeats;
    } else if (std::isupper(peek())) {
      parseSimpleFragment(counter);
    } else {
      throw ParseError(std::string{"unexpected character '"} + peek() + "'", n);
    }
  }

  void parseMolecularComplex(ElementCounter& counter) {
    ElementCounter tmp;
    auto repeats = parseOptionalNumber();
    parseFragment(tmp);
    while (!eof()) {
      if (peek() == '.' || peek() == '-' || peek() == '+' || peek() == ')') break;
      parseFragment(tmp);
    }
    for (auto& item : tmp)
      counter[item.first] += repeats * item.second;
  }

  void parseSumFormula(ElementCounter& counter) {
    parseMolecularComplex(counter);

    while (!eof()) {
      if (peek() == '.') {
        nextChar();
        parseMolecularComplex(counter);
      } else {
        break;
      }
    }

    while (!eof()) {
      ElementCounter adduct;
      char sign = nextChar();
      int mult;
      if (sign == '-')
        mult = -1;
      else if (sign == '+')
        mult = 1;
      else
        throw ParseError("expected +/-", n - 1);
      parseMolecularComplex(adduct);
      for (auto& item : adduct)
        counter[item.first] += mult * item.second;
    }

    for (auto it = counter.begin(); it != counter.end();) {
      if (it->second < 0) throw NegativeTotalError(it->first, it->second);
      if (it->second != 0)
        ++it;
      else
        it = counter.erase(it);
    }
  }
};

ms::ElementCounter parseSumFormula(const std::string& formula, const ms::ElementTable& table) {
  SumFormulaParser parser{formula, table};
  return parser.elementCounts();
}
}
