#pragma once

#include "ms/averagine.hpp"
#include "ms/periodic_table.hpp"

#include <cassert>
#include <map>
#include <string>
#include <vector>

namespace utils {

// Averagine isotope distributions for a list of precursor masses,
// stored on disk in msgpack format.
class DistributionDB {
  std::vector<double> masses_;

  // use a simple structure that doesn't require special msgpack methods
  std::map<double, std::map<std::string, std::vector<double>>> patterns_;

  bool use_progressbar_;

 public:
  void save(const std::string& output_filename) const;
  void load(const std::string& input_filename);

  explicit DistributionDB(const std::vector<double>& masses)
      : masses_(masses), use_progressbar_(false) {}

  explicit DistributionDB(const std::string& dump_filename) : use_progressbar_(false) {
    load(dump_filename);
  }

  // Masses that are too small for the averagine model are skipped.
  void computeDistributions(const ms::AveragineModel& model = ms::averagine,
                            const ms::ElementTable& table = ms::periodic_table,
                            size_t max_peaks = 5,
                            double prune_level = ms::defaultPruneLevel);

  ms::Distribution operator()(double mass) const {
    auto& entry = patterns_.at(mass);
    return ms::Distribution{entry.at("masses"), entry.at("intensities")};
  }

  bool contains(double mass) const { return patterns_.count(mass) > 0; }

  void useProgressBar(bool use) { use_progressbar_ = use; }

  // number of computed distributions
  size_t size() const {
    assert(patterns_.size() <= masses_.size());
    return patterns_.size();
  }

  const std::vector<double>& keys() const { return masses_; }
};
}
