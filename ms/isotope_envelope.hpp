#pragma once

#include <cstdlib>
#include <initializer_list>
#include <vector>

namespace ms {

// relative intensity below which trailing isotope peaks are dropped
constexpr double defaultPruneLevel = 1e-6;

// Isotope pattern on a unit mass grid: intensities[i] is the abundance
// of the isotopologue that is i mass units heavier than mono_offset.
// Only the first peak_count intensities are significant, the vector
// itself may be longer.
struct IsotopeEnvelope {
  double mono_offset;
  size_t peak_count;
  std::vector<double> intensities;

  // convolution unit, corresponds to zero atoms
  IsotopeEnvelope() : mono_offset{0.0}, peak_count{1}, intensities{1.0} {}

  IsotopeEnvelope(double mono_offset, std::initializer_list<double> intensities)
      : mono_offset{mono_offset}, peak_count{intensities.size()}, intensities{intensities} {}

  IsotopeEnvelope(double mono_offset, size_t peak_count, std::vector<double> intensities)
      : mono_offset{mono_offset}, peak_count{peak_count}, intensities{intensities} {}

  // Convolves with another envelope in place,
  // the result describes the species made of both.
  void add(const IsotopeEnvelope& other, double prune_level = defaultPruneLevel);

  // Same as add() for an envelope packed as
  // [mono_offset, peak_count, intensity_0, ..., intensity_{peak_count-1}]
  void addPacked(const std::vector<double>& packed, double prune_level = defaultPruneLevel);

  IsotopeEnvelope copy() const {
    IsotopeEnvelope e{mono_offset, peak_count, intensities};
    return e;
  }

  // Envelope of n copies of this species, computed with O(log n) convolutions.
  IsotopeEnvelope mult(long n, double prune_level = defaultPruneLevel) const;

  bool isIdentity() const {
    return mono_offset == 0.0 && peak_count == 1 && intensities[0] == 1.0;
  }

  // absolute masses of the significant peaks
  std::vector<double> masses() const;

  // the significant part of the intensity vector
  std::vector<double> significant() const {
    return std::vector<double>(intensities.begin(), intensities.begin() + peak_count);
  }

  size_t size() const { return peak_count; }
};

// Normalized polynomial convolution of two envelopes.
// Trailing peaks with relative intensity below prune_level are excluded
// from peak_count of the result.
IsotopeEnvelope convolve(const IsotopeEnvelope& e1, const IsotopeEnvelope& e2,
                         double prune_level = defaultPruneLevel);
}
