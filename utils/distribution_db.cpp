#include "utils/distribution_db.hpp"
#include "utils/timer.hpp"
#include "ms/errors.hpp"

#include "msgpack.hpp"

extern "C" {
#include "progressbar.h"
}

#include <cstdio>
#include <exception>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace utils {

void DistributionDB::computeDistributions(const ms::AveragineModel& model,
                                          const ms::ElementTable& table,
                                          size_t max_peaks, double prune_level) {
  std::mutex map_mutex;
  std::exception_ptr error;

  progressbar* bar = nullptr;
  const int BAR_STEP = 100;
  if (use_progressbar_)
    bar = progressbar_new("", masses_.size() / BAR_STEP);

#pragma omp parallel for
  for (size_t i = 0; i < masses_.size(); i++) {
    double mass = masses_[i];
    try {
      ScopedTimer timer;
      timer << "averagine " << mass;

      auto distribution = ms::massToDistribution(mass, model, table, prune_level);
      distribution.trimmed(max_peaks);

      std::lock_guard<std::mutex> lock(map_mutex);
      patterns_[mass]["masses"] = distribution.masses;
      patterns_[mass]["intensities"] = distribution.intensities;
    } catch (ms::NegativeAtomCount&) {
      // mass is below the range of the averagine model
    } catch (...) {
      std::lock_guard<std::mutex> lock(map_mutex);
      if (!error)
        error = std::current_exception();
    }

    std::lock_guard<std::mutex> lock(map_mutex);
    if (bar != nullptr && (i + 1) % BAR_STEP == 0)
      progressbar_inc(bar);
  }

  if (bar != nullptr) {
    progressbar_finish(bar);
    std::fflush(stdout);
  }

  if (error)
    std::rethrow_exception(error);
}

void DistributionDB::save(const std::string& output_filename) const {
  msgpack::sbuffer sbuf;
  msgpack::pack(sbuf, patterns_);
  std::ofstream db(output_filename, std::ios::binary);
  if (db)
    db.write(sbuf.data(), sbuf.size());
  else
    throw std::runtime_error("can't open " + output_filename + " for writing");
}

void DistributionDB::load(const std::string& input_filename) {
  std::ifstream in(input_filename, std::ios::binary | std::ios::ate);
  if (!in)
    throw std::runtime_error("can't open " + input_filename + " for reading");
  size_t bufsize = in.tellg();
  std::vector<char> buf(bufsize);
  in.seekg(0, std::ios::beg);
  in.read(buf.data(), bufsize);
  in.close();

  msgpack::unpacked unpacked;
  msgpack::unpack(&unpacked, buf.data(), bufsize);

  msgpack::object obj = unpacked.get();
  patterns_.clear();
  obj.convert(patterns_);
  masses_.clear();
  for (auto& item : patterns_) masses_.push_back(item.first);
}
}
