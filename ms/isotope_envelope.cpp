#include "ms/isotope_envelope.hpp"
#include "ms/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace ms {

IsotopeEnvelope convolve(const IsotopeEnvelope& e1, const IsotopeEnvelope& e2,
                         double prune_level) {
  size_t n1 = e1.peak_count, n2 = e2.peak_count;
  if (n1 == 0 || n2 == 0 || e1.intensities.size() < n1 || e2.intensities.size() < n2)
    throw DegenerateConvolution("envelope has no significant peaks");

  IsotopeEnvelope result;
  result.mono_offset = e1.mono_offset + e2.mono_offset;
  result.intensities.assign(n1 + n2 - 1, 0.0);

  for (size_t i = 0; i < n1; i++)
    for (size_t j = 0; j < n2; j++)
      result.intensities[i + j] += e1.intensities[i] * e2.intensities[j];

  double top = *std::max_element(result.intensities.begin(), result.intensities.end());
  if (!(top > 0) || !std::isfinite(top))
    throw DegenerateConvolution("intensities have no positive maximum");
  for (auto& item : result.intensities)
    item /= top;

  size_t n = result.intensities.size();
  while (n > 0 && result.intensities[n - 1] < prune_level)
    --n;
  if (n == 0)
    throw DegenerateConvolution("all peaks are below the prune level");
  result.peak_count = n;
  return result;
}

void IsotopeEnvelope::add(const IsotopeEnvelope& other, double prune_level) {
  *this = convolve(*this, other, prune_level);
}

void IsotopeEnvelope::addPacked(const std::vector<double>& packed, double prune_level) {
  if (packed.size() < 3 || !std::isfinite(packed[1]) || packed[1] < 1)
    throw std::invalid_argument("packed envelope must contain an offset, a peak count and intensities");
  if (packed[1] > static_cast<double>(packed.size() - 2))
    throw std::invalid_argument("packed envelope is shorter than its peak count");
  size_t peak_count = static_cast<size_t>(packed[1]);
  IsotopeEnvelope other{packed[0], peak_count,
                        std::vector<double>(packed.begin() + 2, packed.end())};
  add(other, prune_level);
}

IsotopeEnvelope IsotopeEnvelope::mult(long n, double prune_level) const {
  if (n <= 0)
    throw InvalidExponent(n);
  if (n == 1)
    return copy();

  IsotopeEnvelope result;
  IsotopeEnvelope multiples = copy();
  for (;;) {
    if (n & 1)
      result.add(multiples, prune_level);
    n >>= 1;
    if (n == 0)
      break;
    multiples.add(multiples, prune_level);
  }
  return result;
}

std::vector<double> IsotopeEnvelope::masses() const {
  std::vector<double> result(peak_count);
  for (size_t i = 0; i < peak_count; i++)
    result[i] = mono_offset + i;
  return result;
}
}
