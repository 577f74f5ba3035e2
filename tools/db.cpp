#include "utils/distribution_db.hpp"
#include "ms/averagine.hpp"
#include "ms/errors.hpp"
#include "cxxopts.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<double> readMasses(const std::string& input_file) {
  std::ifstream in(input_file);
  if (!in)
    throw std::runtime_error("can't open " + input_file);

  std::vector<double> masses;
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ss{line};
    double mass;
    if (!(ss >> mass))
      continue;  // header or empty line
    masses.push_back(mass);
  }
  return masses;
}

int db_main(int argc, char** argv) {
  unsigned max_peaks;
  double prune_level;

  std::string input_file, output_file;

  cxxopts::Options options("isodist db",
  " <input.txt> <output.db>\n\t\t\twhere input contains one monoisotopic mass per line.");
  options.add_options()
    ("max-peaks",   "Maximum number of peaks to store",
     cxxopts::value<unsigned>(max_peaks)->default_value("5"))
    ("prune-level", "Relative intensity below which trailing peaks are dropped",
     cxxopts::value<double>(prune_level)->default_value("1e-6"))
    ("help", "Print help");

  options.add_options("hidden")
    ("input-file",  "List of masses, one per line",
     cxxopts::value<std::string>(input_file))
    ("output-file", "Output file",
     cxxopts::value<std::string>(output_file));

  options.parse_positional(std::vector<std::string>{"input-file", "output-file"});
  options.parse(argc, argv);

  if (options.count("help") || input_file.empty() || output_file.empty()) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  try {
    utils::DistributionDB db{readMasses(input_file)};
    std::cout << "Generating averagine distributions for "
              << db.keys().size() << " masses..." << std::endl;
    std::ios_base::sync_with_stdio(true);
    db.useProgressBar(true);
    db.computeDistributions(ms::averagine, ms::periodic_table, max_peaks, prune_level);
    if (db.size() < db.keys().size())
      std::cout << db.keys().size() - db.size()
                << " masses are too small for the averagine model and were skipped" << std::endl;
    db.save(output_file);
    std::cout << "Distributions have been saved to " << output_file << std::endl;
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl;
    return -1;
  }
  return 0;
}
