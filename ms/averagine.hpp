#pragma once

#include "ms/formula.hpp"
#include "ms/isotope_envelope.hpp"
#include "ms/periodic_table.hpp"

#include <string>
#include <vector>

namespace ms {

struct Distribution {
  std::vector<double> masses;
  std::vector<double> intensities;

  size_t size() const { return masses.size(); }

  // keeps only the first new_size peaks
  Distribution& trimmed(size_t new_size) {
    if (new_size < size()) {
      masses.resize(new_size);
      intensities.resize(new_size);
    }
    return *this;
  }

  // converts neutral masses into m/z values of the [M + zH]^z ion
  Distribution& charged(int charge);
};

double monoisotopicMass(const ElementCounter& counter, const ElementTable& table = periodic_table);

// Folds the element counts into a single envelope.
// Elements with zero atoms are skipped, negative counts are rejected.
IsotopeEnvelope compositionToEnvelope(const ElementCounter& counter,
                                      const ElementTable& table = periodic_table,
                                      double prune_level = defaultPruneLevel);

/**
   Integer elemental composition of a peptide with the given monoisotopic mass.

   Each element count is the averagine ratio scaled by the number of
   averagine units in the mass, rounded to the nearest integer.
   The difference between the requested mass and the mass of the rounded
   composition is then absorbed by adding or removing hydrogens.

   Throws UnsupportedMode when sulfur is excluded and NegativeAtomCount
   when the hydrogen correction leads to a negative count.
 **/
ElementCounter averageFormula(double molecule_mass,
                              const AveragineModel& model = averagine,
                              const ElementTable& table = periodic_table,
                              bool include_sulfur = true);

// Isotope distribution of a peptide of the given mass under the averagine model.
Distribution massToDistribution(double molecule_mass,
                                const AveragineModel& model = averagine,
                                const ElementTable& table = periodic_table,
                                double prune_level = defaultPruneLevel);

Distribution formulaToDistribution(const std::string& formula,
                                   const ElementTable& table = periodic_table,
                                   double prune_level = defaultPruneLevel);

// Neutral precursor mass from the monoisotopic m/z and the charge state.
double massFromMz(double mono_mz, int charge);
}
