#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>

#include "bloom_errors.hpp"
#include "filter_params.hpp"

// Prints the filter size and hash count chosen for each capacity / error rate
// pair, with the false-positive probability those settings give at capacity.
void run_parameter_sweep() {
  // Print CSV Header
  std::cout << "capacity,errorRate,length,numHashFuncs,bitsPerKey,theoreticalFpp"
            << std::endl;

  std::vector<size_t> capacity_range = {100,     1000,     10000,
                                        100000,  1000000,  10000000};
  std::vector<double> error_rate_range = {0.5,   0.1,   0.05,  0.01, 0.005,
                                          0.001, 1e-4,  1e-6,  1e-9, 1e-12,
                                          1e-20, 1e-29, 1e-35};

  for (size_t capacity : capacity_range) {
    for (double error_rate : error_rate_range) {
      try {
        FilterParameters params = calculateFilterParameters(capacity, error_rate);
        double bits_per_key =
            static_cast<double>(params.length) / static_cast<double>(capacity);
        double fpp = falsePositiveProbability(params.length,
                                              params.numHashFuncs, capacity);
        std::cout << capacity << "," << error_rate << "," << params.length
                  << "," << params.numHashFuncs << "," << std::fixed
                  << std::setprecision(4) << bits_per_key << ","
                  << std::setprecision(12) << fpp << std::defaultfloat
                  << std::endl;
      } catch (const InvalidParameters& e) {
        spdlog::warn("capacity={} errorRate={}: {}", capacity, error_rate,
                     e.what());
        std::cout << capacity << "," << error_rate << ",error,error,error,error"
                  << std::endl;
      }
    }
  }
}

int main() {
  // stdout carries the CSV
  spdlog::set_default_logger(spdlog::stderr_color_mt("stderr"));
  try {
    run_parameter_sweep();
  } catch (const std::exception& e) {
    spdlog::error("[Error] {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
