#include "ms/averagine.hpp"
#include "ms/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <string>

namespace ms {

Distribution& Distribution::charged(int charge) {
  if (charge == 0)
    throw InvalidCharge();
  for (auto& m : masses)
    m = (m + charge * protonMass) / std::abs(charge);
  return *this;
}

double monoisotopicMass(const ElementCounter& counter, const ElementTable& table) {
  double sum = 0.0;
  for (auto& item : counter)
    sum += item.second * findElement(table, item.first).monoisotopicMass();
  return sum;
}

IsotopeEnvelope compositionToEnvelope(const ElementCounter& counter,
                                      const ElementTable& table, double prune_level) {
  IsotopeEnvelope envelope;
  for (auto& item : counter) {
    if (item.second < 0)
      throw NegativeAtomCount(item.first, item.second);
    if (item.second == 0)
      continue;
    const Element& element = findElement(table, item.first);
    envelope.add(element.isotope_pattern.mult(item.second, prune_level), prune_level);
  }
  return envelope;
}

static int roundedCount(double value, double molecule_mass) {
  double count = std::round(value);
  if (std::fabs(count) > std::numeric_limits<int>::max())
    throw MassOutOfRange(molecule_mass);
  return static_cast<int>(count);
}

ElementCounter averageFormula(double molecule_mass, const AveragineModel& model,
                              const ElementTable& table, bool include_sulfur) {
  if (!include_sulfur)
    throw UnsupportedMode("averagine without sulfur");
  if (!std::isfinite(molecule_mass))
    throw MassOutOfRange(molecule_mass);

  double averagine_units = molecule_mass / model.average_mass;

  ElementCounter counter;
  double final_mass = 0.0;
  for (auto& item : model.ratios) {
    int count = roundedCount(averagine_units * item.second, molecule_mass);
    counter[item.first] = count;
    final_mass += count * findElement(table, item.first).monoisotopicMass();
  }

  // hydrogen has the finest mass granularity, so it absorbs the rounding error
  auto h = counter.find("H");
  if (h == counter.end())
    throw UnknownElement("H (missing from the averagine model)");
  double h_mass = findElement(table, "H").monoisotopicMass();
  double hydrogens = h->second + std::round((molecule_mass - final_mass) / h_mass);
  h->second = roundedCount(hydrogens, molecule_mass);

  for (auto& item : counter)
    if (item.second < 0)
      throw NegativeAtomCount(item.first, item.second);

  return counter;
}

Distribution massToDistribution(double molecule_mass, const AveragineModel& model,
                                const ElementTable& table, double prune_level) {
  auto counter = averageFormula(molecule_mass, model, table);
  auto envelope = compositionToEnvelope(counter, table, prune_level);
  return Distribution{envelope.masses(), envelope.significant()};
}

Distribution formulaToDistribution(const std::string& formula, const ElementTable& table,
                                   double prune_level) {
  auto counter = sf_parser::parseSumFormula(formula, table);
  auto envelope = compositionToEnvelope(counter, table, prune_level);
  return Distribution{envelope.masses(), envelope.significant()};
}

double massFromMz(double mono_mz, int charge) {
  if (charge == 0)
    throw InvalidCharge();
  return mono_mz * std::abs(charge) - charge * protonMass;
}
}
