#include "cffi/common.hpp"
#include "ms/averagine.hpp"
#include "ms/formula.hpp"
#include "ms/isotope_envelope.hpp"
#include "ms/periodic_table.hpp"

#include <cmath>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ms;
using namespace cffi;

extern "C" {

ISODIST_EXTERN IsotopeEnvelope* envelope_new(double mono_offset, int n, double* intensities) {
  return wrap_catch<IsotopeEnvelope*>(nullptr, [&]() -> IsotopeEnvelope* {
    if (n < 1)
      throw std::invalid_argument("envelope needs at least one peak");
    return heapify(IsotopeEnvelope{mono_offset, static_cast<size_t>(n),
                                   std::vector<double>(intensities, intensities + n)});
  });
}

ISODIST_EXTERN IsotopeEnvelope* envelope_new_from_element(const char* element) {
  return wrap_catch<IsotopeEnvelope*>(nullptr, [&]() {
    return heapify(findElement(periodic_table, element).isotope_pattern);
  });
}

ISODIST_EXTERN IsotopeEnvelope* envelope_copy(IsotopeEnvelope* e) {
  return new (std::nothrow) IsotopeEnvelope(e->copy());
}

ISODIST_EXTERN void envelope_free(IsotopeEnvelope* e) {
  delete e;
}

ISODIST_EXTERN int envelope_add(IsotopeEnvelope* e1, IsotopeEnvelope* e2, double prune_level) {
  return wrap_catch<int>(-1, [&]() -> int {
    e1->add(*e2, prune_level);
    return 0;
  });
}

ISODIST_EXTERN int envelope_add_packed(IsotopeEnvelope* e, int n, double* packed,
                                       double prune_level) {
  return wrap_catch<int>(-1, [&]() -> int {
    e->addPacked(std::vector<double>(packed, packed + n), prune_level);
    return 0;
  });
}

ISODIST_EXTERN IsotopeEnvelope* envelope_mult(IsotopeEnvelope* e, long n, double prune_level) {
  return wrap_catch<IsotopeEnvelope*>(nullptr, [&]() {
    return heapify(e->mult(n, prune_level));
  });
}

ISODIST_EXTERN int envelope_size(IsotopeEnvelope* e) {
  return e->size();
}

ISODIST_EXTERN double envelope_mono_offset(IsotopeEnvelope* e) {
  return e->mono_offset;
}

ISODIST_EXTERN void envelope_intensities(IsotopeEnvelope* e, double* out) {
  for (size_t i = 0; i < e->size(); i++)
    out[i] = e->intensities.at(i);
}

// Writes the averagine formula into out (at most out_size bytes including the
// terminating zero) and returns its length, or -1 on error.
ISODIST_EXTERN int averagine_formula(double molecule_mass, char* out, int out_size) {
  return wrap_catch<int>(-1, [&]() -> int {
    auto formula = sumFormula(averageFormula(molecule_mass));
    if (out_size <= static_cast<int>(formula.size()))
      throw std::length_error("output buffer is too small for " + formula);
    std::strcpy(out, formula.c_str());
    return static_cast<int>(formula.size());
  });
}

// Fills at most max_peaks masses and intensities, returns the number of peaks written.
ISODIST_EXTERN int mass_to_distribution(double molecule_mass, double prune_level, int max_peaks,
                                        double* masses, double* intensities) {
  return wrap_catch<int>(-1, [&]() -> int {
    auto d = massToDistribution(molecule_mass, averagine, periodic_table, prune_level);
    d.trimmed(max_peaks < 0 ? 0 : max_peaks);
    for (size_t i = 0; i < d.size(); i++) {
      masses[i] = d.masses[i];
      intensities[i] = d.intensities[i];
    }
    return static_cast<int>(d.size());
  });
}

ISODIST_EXTERN double mass_from_mz(double mono_mz, int charge) {
  return wrap_catch<double>(NAN, [&]() {
    return massFromMz(mono_mz, charge);
  });
}
}
