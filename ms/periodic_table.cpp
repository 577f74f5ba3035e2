#include "ms/periodic_table.hpp"
#include "ms/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace ms {

Element::Element(const std::string& abbr, unsigned atomicNumber, double monoisotopic_mass,
                 const std::vector<double>& abundances)
    : abbr{abbr}, number{atomicNumber} {
  if (abundances.empty())
    throw std::invalid_argument("element " + abbr + " has no isotopes");
  double top = *std::max_element(abundances.begin(), abundances.end());
  if (!(top > 0))
    throw std::invalid_argument("element " + abbr + " has no abundant isotope");

  std::vector<double> intensities(abundances);
  for (auto& item : intensities)
    item /= top;
  isotope_pattern = IsotopeEnvelope{monoisotopic_mass, intensities.size(), intensities};
}

// abundances are indexed by the nominal mass difference to the lightest isotope
static ElementTable makePeriodicTable() {
  ElementTable table;
  auto add = [&](const Element& e) { table.insert(std::make_pair(e.abbr, e)); };
  add(Element("H", 1, 1.00782503223, {0.999885, 0.000115}));
  add(Element("C", 6, 12.0, {0.9893, 0.0107}));
  add(Element("N", 7, 14.00307400443, {0.99636, 0.00364}));
  add(Element("O", 8, 15.99491461957, {0.99757, 0.00038, 0.00205}));
  add(Element("Na", 11, 22.98976928, {1.0}));
  add(Element("P", 15, 30.97376199842, {1.0}));
  add(Element("S", 16, 31.9720711744, {0.9499, 0.0075, 0.0425, 0.0, 0.0001}));
  add(Element("K", 19, 38.9637064864, {0.932581, 0.000117, 0.067302}));
  return table;
}

const ElementTable periodic_table = makePeriodicTable();

const AveragineModel averagine = {
  {{"C", 4.9384}, {"H", 7.7583}, {"N", 1.3577}, {"O", 1.4773}, {"S", 0.0417}},
  111.1254
};

const Element& findElement(const ElementTable& table, const std::string& abbr) {
  auto it = table.find(abbr);
  if (it == table.end())
    throw UnknownElement(abbr);
  return it->second;
}
}
