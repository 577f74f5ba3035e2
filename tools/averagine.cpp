#include "ms/averagine.hpp"
#include "ms/errors.hpp"
#include "ms/formula.hpp"
#include "cxxopts.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int distribution_main(int argc, char** argv) {
  double prune_level;
  unsigned max_peaks;
  int charge;
  std::vector<double> masses;

  cxxopts::Options options("isodist distribution", " <mass> [<mass>...]");
  options.add_options()
    ("prune-level",  "Relative intensity below which trailing peaks are dropped",
     cxxopts::value<double>(prune_level)->default_value("1e-6"))
    ("max-peaks",    "Maximum number of peaks to print (0 prints all)",
     cxxopts::value<unsigned>(max_peaks)->default_value("0"))
    ("charge",       "Print m/z values of [M+zH] ions instead of neutral masses",
     cxxopts::value<int>(charge)->default_value("0"))
    ("help", "Print help");

  options.add_options("hidden")
    ("masses", "Monoisotopic neutral masses",
     cxxopts::value<std::vector<double>>(masses));

  options.parse_positional(std::vector<std::string>{"masses"});
  options.parse(argc, argv);

  if (options.count("help") || masses.empty()) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  try {
    std::cout << std::setprecision(10);
    for (double mass : masses) {
      auto d = ms::massToDistribution(mass, ms::averagine, ms::periodic_table, prune_level);
      if (max_peaks > 0)
        d.trimmed(max_peaks);
      if (charge != 0)
        d.charged(charge);
      std::cout << "# " << mass << std::endl;
      for (size_t i = 0; i < d.size(); i++)
        std::cout << d.masses[i] << "," << d.intensities[i] << std::endl;
    }
  } catch (ms::IsotopeError& e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }
  return 0;
}

int formula_main(int argc, char** argv) {
  std::vector<double> masses;

  cxxopts::Options options("isodist formula", " <mass> [<mass>...]");
  options.add_options()
    ("help", "Print help");

  options.add_options("hidden")
    ("masses", "Monoisotopic neutral masses",
     cxxopts::value<std::vector<double>>(masses));

  options.parse_positional(std::vector<std::string>{"masses"});
  options.parse(argc, argv);

  if (options.count("help") || masses.empty()) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  try {
    for (double mass : masses) {
      auto counter = ms::averageFormula(mass);
      std::cout << mass << "," << ms::sumFormula(counter) << ","
                << std::setprecision(10) << ms::monoisotopicMass(counter)
                << std::setprecision(6) << std::endl;
    }
  } catch (ms::IsotopeError& e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }
  return 0;
}

int precursor_main(int argc, char** argv) {
  double mz;
  int charge;

  cxxopts::Options options("isodist precursor", "");
  options.add_options()
    ("mz",     "Monoisotopic m/z",
     cxxopts::value<double>(mz))
    ("charge", "Charge state, negative for negative mode",
     cxxopts::value<int>(charge)->default_value("1"))
    ("help", "Print help");

  options.parse(argc, argv);

  if (options.count("help") || !options.count("mz")) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  try {
    std::cout << std::setprecision(10) << ms::massFromMz(mz, charge) << std::endl;
  } catch (ms::InvalidCharge& e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }
  return 0;
}
