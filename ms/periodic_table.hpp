#pragma once

#include "ms/isotope_envelope.hpp"

#include <map>
#include <string>
#include <vector>

namespace ms {

constexpr double protonMass = 1.00727646687;

struct Element {
  std::string abbr;
  unsigned number;
  IsotopeEnvelope isotope_pattern;  // unit mass grid, scaled to max intensity 1

  Element(const std::string& abbr, unsigned atomicNumber, double monoisotopic_mass,
          const std::vector<double>& abundances);

  double monoisotopicMass() const { return isotope_pattern.mono_offset; }
};

typedef std::map<std::string, ms::Element> ElementTable;

// Natural isotope patterns of the elements occurring in peptides and common adducts.
extern const ElementTable periodic_table;

const Element& findElement(const ElementTable& table, const std::string& abbr);

// Averagine: composition of an average amino acid residue
// expressed as the number of atoms per residue.
struct AveragineModel {
  std::map<std::string, double> ratios;
  double average_mass;  // average mass of one residue
};

extern const AveragineModel averagine;
}
