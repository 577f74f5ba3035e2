#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "doctest.h"
#include "ms/averagine.hpp"
#include "ms/errors.hpp"
#include "ms/formula.hpp"
#include "ms/periodic_table.hpp"

TEST_CASE("Averagine formula") {
    SUBCASE("Composition for a 1000 Da peptide") {
        auto counter = ms::averageFormula(1000.0);
        CHECK(counter.at("C") == 44);
        CHECK(counter.at("H") == 95);
        CHECK(counter.at("N") == 12);
        CHECK(counter.at("O") == 13);
        CHECK(counter.at("S") == 0);
        CHECK(ms::sumFormula(counter) == "C44H95N12O13");
    }

    SUBCASE("Mass is conserved within one hydrogen") {
        double h_mass = ms::findElement(ms::periodic_table, "H").monoisotopicMass();
        for (double mass : {500.0, 1000.0, 2000.0, 5000.0}) {
            auto counter = ms::averageFormula(mass);
            double estimated = ms::monoisotopicMass(counter);
            CHECK(std::fabs(estimated - mass) <= h_mass);
        }
    }

    SUBCASE("Sulfur is included for larger peptides") {
        auto counter = ms::averageFormula(2000.0);
        CHECK(counter.at("S") == 1);
        CHECK(counter.at("H") == 131);
    }

    SUBCASE("Mode without sulfur is not implemented") {
        CHECK_THROWS_AS(
            ms::averageFormula(1000.0, ms::averagine, ms::periodic_table, false),
            ms::UnsupportedMode);
    }

    SUBCASE("Masses outside of the model range") {
        // rounding up C, N and O overshoots 50 Da by seven hydrogens
        CHECK_THROWS_AS(ms::averageFormula(50.0), ms::NegativeAtomCount);
        CHECK_THROWS_AS(ms::averageFormula(-100.0), ms::NegativeAtomCount);
    }

    SUBCASE("Non-finite and huge masses") {
        CHECK_THROWS_AS(ms::averageFormula(std::numeric_limits<double>::quiet_NaN()),
                        ms::MassOutOfRange);
        CHECK_THROWS_AS(ms::averageFormula(std::numeric_limits<double>::infinity()),
                        ms::MassOutOfRange);
        CHECK_THROWS_AS(ms::averageFormula(-std::numeric_limits<double>::infinity()),
                        ms::MassOutOfRange);
        CHECK_THROWS_AS(ms::averageFormula(1e12), ms::MassOutOfRange);
        CHECK_THROWS_AS(ms::massToDistribution(1e12), ms::MassOutOfRange);
        // tens of millions of atoms still fit into an int
        CHECK_NOTHROW(ms::averageFormula(1e9));
    }

    SUBCASE("A single hydrogen") {
        auto counter = ms::averageFormula(1.0);
        CHECK(counter.at("H") == 1);
        CHECK(counter.at("C") == 0);
    }

    SUBCASE("Custom model and element table") {
        ms::AveragineModel model = {{{"C", 1.0}, {"H", 2.0}}, 14.0};
        ms::ElementTable table;
        table.insert(std::make_pair("C", ms::Element("C", 6, 12.0, {1.0})));
        table.insert(std::make_pair("H", ms::Element("H", 1, 1.0, {1.0})));
        auto counter = ms::averageFormula(140.0, model, table);
        CHECK(counter.at("C") == 10);
        CHECK(counter.at("H") == 20);

        ms::AveragineModel no_hydrogen = {{{"C", 1.0}}, 12.0};
        CHECK_THROWS_AS(ms::averageFormula(120.0, no_hydrogen, table), ms::UnknownElement);

        ms::AveragineModel unknown = {{{"C", 1.0}, {"H", 2.0}, {"Se", 0.1}}, 14.0};
        CHECK_THROWS_AS(ms::averageFormula(140.0, unknown, table), ms::UnknownElement);
    }
}

TEST_CASE("Composition to envelope") {
    SUBCASE("Empty composition is the identity") {
        auto envelope = ms::compositionToEnvelope(ms::ElementCounter{});
        CHECK(envelope.isIdentity());
        auto zeros = ms::compositionToEnvelope(ms::ElementCounter{{"C", 0}, {"S", 0}});
        CHECK(zeros.isIdentity());
    }

    SUBCASE("Single atom") {
        auto envelope = ms::compositionToEnvelope(ms::ElementCounter{{"O", 1}});
        CHECK(envelope.mono_offset == doctest::Approx(15.99491461957));
        REQUIRE(envelope.peak_count == 3);
        CHECK(envelope.intensities[0] == doctest::Approx(1.0));
        CHECK(envelope.intensities[1] == doctest::Approx(0.00038 / 0.99757));
        CHECK(envelope.intensities[2] == doctest::Approx(0.00205 / 0.99757));
    }

    SUBCASE("Water") {
        auto envelope = ms::compositionToEnvelope(ms::ElementCounter{{"H", 2}, {"O", 1}});
        CHECK(envelope.mono_offset == doctest::Approx(18.010564684));
        CHECK(envelope.intensities[0] == doctest::Approx(1.0));
    }

    SUBCASE("Invalid compositions") {
        CHECK_THROWS_AS(ms::compositionToEnvelope(ms::ElementCounter{{"C", -1}}),
                        ms::NegativeAtomCount);
        CHECK_THROWS_AS(ms::compositionToEnvelope(ms::ElementCounter{{"Xe", 1}}),
                        ms::UnknownElement);
    }
}

TEST_CASE("Mass to distribution") {
    SUBCASE("1000 Da peptide") {
        auto d = ms::massToDistribution(1000.0);
        REQUIRE(d.size() == 9);
        REQUIRE(d.masses.size() == d.intensities.size());
        CHECK(d.masses[0] == doctest::Approx(999.7141561694));
        for (size_t i = 1; i < d.size(); ++i) {
            CHECK(d.masses[i] == doctest::Approx(d.masses[0] + i));
        }
        std::vector<double> expected = {
            1.0, 0.5356099108978, 0.1674893692499, 0.0384986187122,
            0.0071398568959, 0.0011211663788, 0.0001530496895,
            0.0000170080533, 0.0000018868244,
        };
        for (size_t i = 0; i < expected.size(); ++i) {
            CHECK(d.intensities[i] == doctest::Approx(expected[i]).epsilon(1e-6));
        }
    }

    SUBCASE("Heavier peptides peak after the monoisotopic mass") {
        auto d = ms::massToDistribution(2000.0);
        REQUIRE(d.size() == 12);
        CHECK(d.intensities[0] == doctest::Approx(0.9229125623).epsilon(1e-6));
        CHECK(d.intensities[1] == doctest::Approx(1.0));
        CHECK(d.intensities[2] == doctest::Approx(0.6292680506).epsilon(1e-6));
    }

    SUBCASE("Coarser prune level keeps fewer peaks") {
        auto d = ms::massToDistribution(1000.0, ms::averagine, ms::periodic_table, 1e-3);
        CHECK(d.size() == 5);
    }

    SUBCASE("Trimming and charging") {
        auto d = ms::massToDistribution(1000.0);
        d.trimmed(3);
        REQUIRE(d.size() == 3);
        double mono = d.masses[0];
        d.charged(2);
        CHECK(d.masses[0] == doctest::Approx((mono + 2 * ms::protonMass) / 2));
        CHECK(d.masses[1] - d.masses[0] == doctest::Approx(0.5));
        CHECK_THROWS_AS(d.charged(0), ms::InvalidCharge);
    }

    SUBCASE("Failures propagate") {
        CHECK_THROWS_AS(ms::massToDistribution(50.0), ms::NegativeAtomCount);
    }
}

TEST_CASE("Formula to distribution") {
    auto d = ms::formulaToDistribution("C6H12O6");
    CHECK(d.masses[0] == doctest::Approx(180.0633881));
    CHECK(d.intensities[0] == doctest::Approx(1.0));
    CHECK(d.size() > 3);

    CHECK_THROWS_AS(ms::formulaToDistribution("C6H12Q6"), sf_parser::ParseError);
}

TEST_CASE("Mass from m/z") {
    const double precursor_mass = 1234.5678;
    for (int charge : {1, 2, 3, -1}) {
        double mono_mz = (precursor_mass + charge * ms::protonMass) / std::abs(charge);
        CHECK(ms::massFromMz(mono_mz, charge) == doctest::Approx(precursor_mass));
    }

    CHECK(ms::massFromMz(500.0, 2) == doctest::Approx(1000.0 - 2 * 1.00727646687));
    CHECK(ms::massFromMz(500.0, -1) == doctest::Approx(500.0 + 1.00727646687));
    CHECK_THROWS_AS(ms::massFromMz(500.0, 0), ms::InvalidCharge);
}
