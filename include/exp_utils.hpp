#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

template <typename T>
struct NumericStatistics {
  T min{};
  T max{};
  double median = 0.0;
  double average = 0.0;
};

using TimingStatistics = NumericStatistics<long long>;
using RateStatistics = NumericStatistics<double>;

// Outcome of filling one filter to capacity and querying it with absent keys.
struct TrialResult {
  size_t falseNegatives = 0;
  size_t falsePositives = 0;
  size_t queries = 0;
  double falsePositiveRate = 0.0;
  size_t filterLength = 0;
  size_t numHashFuncs = 0;
  long long fillMicros = 0;
  long long queryMicros = 0;
};

// "<prefix>" followed by `index` zero-padded to 20 digits, so keys sort by index.
std::string makeKey(const std::string& prefix, size_t index);

TrialResult runFalsePositiveTrial(size_t capacity, double errorRate,
                                  size_t numQueries, uint64_t seed);

// Runs `numTrials` trials on globalThreadPool, trial i seeded with seed + i.
std::vector<TrialResult> runFalsePositiveTrialsAsync(size_t capacity,
                                                     double errorRate,
                                                     int numTrials,
                                                     size_t numQueries,
                                                     uint64_t seed);

// Instantiated for long long (timings) and double (rates).
template <typename T>
NumericStatistics<T> calculateNumericStatistics(const std::vector<T>& values);

// RocksDB directory holding keys 1..numRecords for the guarded-lookup run.
std::string lookupDbPath(const std::string& dbDir, size_t numRecords);

// Writes `headerLine` unless `filename` already has content.
void writeCsvHeader(const std::string& filename, const std::string& headerLine);
