#ifndef TESTS_TESTUTILS
#define TESTS_TESTUTILS
#include <cstddef>

#include "doctest.h"
#include "ms/isotope_envelope.hpp"

namespace TestUtils {
// Checks that two envelopes agree in offset, number of significant peaks and
// the significant intensities up to the given tolerance.
inline void check_envelopes_equal(const ms::IsotopeEnvelope& a,
                                  const ms::IsotopeEnvelope& b,
                                  double epsilon = 1e-12) {
    CHECK(a.mono_offset == doctest::Approx(b.mono_offset).epsilon(epsilon));
    REQUIRE(a.peak_count == b.peak_count);
    for (size_t i = 0; i < a.peak_count; ++i) {
        CHECK(a.intensities[i] == doctest::Approx(b.intensities[i]).epsilon(epsilon));
    }
}

inline double max_significant(const ms::IsotopeEnvelope& e) {
    double top = 0.0;
    for (size_t i = 0; i < e.peak_count; ++i) {
        if (e.intensities[i] > top) {
            top = e.intensities[i];
        }
    }
    return top;
}

}  // namespace TestUtils

#endif /* TESTS_TESTUTILS */
