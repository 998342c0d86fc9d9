#include "exp_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <filesystem>
#include <fstream>
#include <future>
#include <numeric>
#include <random>
#include <stdexcept>

#include "bloom_filter.hpp"
#include "stopwatch.hpp"

extern boost::asio::thread_pool globalThreadPool;

std::string makeKey(const std::string& prefix, size_t index) {
  const std::string digits = std::to_string(index);
  return prefix + std::string(20 - std::min<size_t>(digits.size(), 20), '0') +
         digits;
}

TrialResult runFalsePositiveTrial(size_t capacity, double errorRate,
                                  size_t numQueries, uint64_t seed) {
  std::mt19937_64 engine(seed);
  BloomFilter filter(capacity, errorRate, engine);

  TrialResult result;
  result.filterLength = filter.filterLength();
  result.numHashFuncs = filter.numHashFuncs();

  // the seed keeps keys of parallel trials apart
  const std::string keyPrefix = "key" + std::to_string(seed) + "_";
  const std::string queryPrefix = "query" + std::to_string(seed) + "_";

  StopWatch sw;
  sw.start();
  for (size_t i = 0; i < capacity; ++i) {
    filter.add(makeKey(keyPrefix, i));
  }
  sw.stop();
  result.fillMicros = sw.elapsedMicros();

  for (size_t i = 0; i < capacity; ++i) {
    if (!filter.check(makeKey(keyPrefix, i))) {
      ++result.falseNegatives;
    }
  }

  sw.start();
  for (size_t i = 0; i < numQueries; ++i) {
    if (filter.check(makeKey(queryPrefix, i))) {
      ++result.falsePositives;
    }
  }
  sw.stop();
  result.queryMicros = sw.elapsedMicros();

  result.queries = numQueries;
  result.falsePositiveRate =
      numQueries == 0 ? 0.0
                      : static_cast<double>(result.falsePositives) / numQueries;
  return result;
}

std::vector<TrialResult> runFalsePositiveTrialsAsync(size_t capacity,
                                                     double errorRate,
                                                     int numTrials,
                                                     size_t numQueries,
                                                     uint64_t seed) {
  std::vector<std::future<TrialResult>> futures;
  futures.reserve(numTrials);

  for (int trial = 0; trial < numTrials; ++trial) {
    std::promise<TrialResult> promise;
    futures.push_back(promise.get_future());
    const uint64_t trialSeed = seed + static_cast<uint64_t>(trial);

    boost::asio::post(globalThreadPool, [capacity, errorRate, numQueries,
                                         trialSeed,
                                         promise = std::move(promise)]() mutable {
      try {
        promise.set_value(
            runFalsePositiveTrial(capacity, errorRate, numQueries, trialSeed));
      } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
      }
    });
  }

  std::vector<TrialResult> results;
  results.reserve(futures.size());
  for (auto& fut : futures) {
    results.push_back(fut.get());
  }
  return results;
}

template <typename T>
NumericStatistics<T> calculateNumericStatistics(const std::vector<T>& values) {
  if (values.empty()) {
    spdlog::warn(
        "calculateNumericStatistics called with empty vector. Returning zeroed "
        "statistics.");
    return NumericStatistics<T>{};
  }

  std::vector<T> sorted_values = values;
  std::sort(sorted_values.begin(), sorted_values.end());

  NumericStatistics<T> stats;
  stats.min = sorted_values.front();
  stats.max = sorted_values.back();

  if (sorted_values.size() % 2 == 0) {
    stats.median =
        (static_cast<double>(sorted_values[sorted_values.size() / 2 - 1]) +
         static_cast<double>(sorted_values[sorted_values.size() / 2])) /
        2.0;
  } else {
    stats.median = static_cast<double>(sorted_values[sorted_values.size() / 2]);
  }

  stats.average = std::accumulate(sorted_values.begin(), sorted_values.end(),
                                  0.0, [](double sum, T value) {
                                    return sum + static_cast<double>(value);
                                  }) /
                  sorted_values.size();
  return stats;
}

template TimingStatistics calculateNumericStatistics<long long>(
    const std::vector<long long>& values);
template RateStatistics calculateNumericStatistics<double>(
    const std::vector<double>& values);

std::string lookupDbPath(const std::string& dbDir, size_t numRecords) {
  return dbDir + "/lookup_db_" + std::to_string(numRecords);
}

void writeCsvHeader(const std::string& filename,
                    const std::string& headerLine) {
  std::error_code ec;
  if (std::filesystem::exists(filename, ec) &&
      std::filesystem::file_size(filename, ec) > 0) {
    return;
  }

  std::ofstream out(filename, std::ios::app);
  if (!out) {
    throw std::runtime_error("Cannot open '" + filename +
                             "' to write the CSV header");
  }
  out << headerLine << "\n";
}
