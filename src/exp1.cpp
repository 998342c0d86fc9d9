#include "exp1.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "exp_utils.hpp"
#include "filter_params.hpp"
#include "stopwatch.hpp"

namespace {

void writeExp1Headers(const std::string& csvPath) {
  writeCsvHeader(csvPath,
                 "capacity,errorRate,filterLength,numHashFuncs,trials,queries,"
                 "minFpr,maxFpr,medianFpr,avgFpr,theoreticalFpr,"
                 "falseNegatives,medianFillMicros,medianQueryMicros");
}

}  // namespace

void runExp1(const ExperimentParams& params) {
  const std::string csvPath = params.csvDir + "/exp_1_false_positive.csv";
  writeExp1Headers(csvPath);

  for (size_t capacity : params.capacities) {
    for (double errorRate : params.errorRates) {
      spdlog::info(
          "Exp1: capacity={} errorRate={} trials={} queries={}", capacity,
          errorRate, params.numTrials, params.numQueries);

      StopWatch sw;
      sw.start();
      std::vector<TrialResult> trials = runFalsePositiveTrialsAsync(
          capacity, errorRate, params.numTrials, params.numQueries,
          params.seed);
      sw.stop();

      if (trials.empty()) {
        spdlog::warn("Exp1: no trials ran for capacity={} errorRate={}",
                     capacity, errorRate);
        continue;
      }

      std::vector<double> rates;
      std::vector<long long> fillTimes;
      std::vector<long long> queryTimes;
      size_t falseNegatives = 0;
      for (const auto& trial : trials) {
        rates.push_back(trial.falsePositiveRate);
        fillTimes.push_back(trial.fillMicros);
        queryTimes.push_back(trial.queryMicros);
        falseNegatives += trial.falseNegatives;
      }

      if (falseNegatives > 0) {
        spdlog::error("Exp1: {} false negatives for capacity={} errorRate={}",
                      falseNegatives, capacity, errorRate);
      }

      RateStatistics fpr = calculateNumericStatistics(rates);
      TimingStatistics fill = calculateNumericStatistics(fillTimes);
      TimingStatistics query = calculateNumericStatistics(queryTimes);
      const TrialResult& first = trials.front();
      const double theoretical = falsePositiveProbability(
          first.filterLength, first.numHashFuncs, capacity);

      spdlog::info(
          "Exp1: m={} k={} avg fpr={:.6f} (target {}, theoretical {:.6f}), "
          "{} trials in {} µs",
          first.filterLength, first.numHashFuncs, fpr.average, errorRate,
          theoretical, trials.size(), sw.elapsedMicros());

      std::ofstream out(csvPath, std::ios::app);
      if (!out) {
        throw std::runtime_error("Exp1: cannot open '" + csvPath + "'");
      }
      out << capacity << "," << errorRate << "," << first.filterLength << ","
          << first.numHashFuncs << "," << trials.size() << ","
          << params.numQueries << "," << fpr.min << "," << fpr.max << ","
          << fpr.median << "," << fpr.average << "," << theoretical << ","
          << falseNegatives << "," << fill.median << "," << query.median
          << "\n";
    }
  }
}
