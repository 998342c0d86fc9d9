#include "exp2.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bloom_filter.hpp"
#include "db_manager.hpp"
#include "exp_utils.hpp"
#include "stopwatch.hpp"

namespace {

struct LookupCounts {
  size_t present = 0;
  size_t absent = 0;
  size_t filterRejected = 0;  // reads skipped
  size_t falsePositives = 0;  // filter said maybe, DB had nothing
  size_t falseNegatives = 0;
};

void writeExp2Headers(const std::string& csvPath) {
  writeCsvHeader(csvPath,
                 "numRecords,errorRate,filterLength,numHashFuncs,lookups,"
                 "presentRatio,present,absent,dbReads,avoidedReads,"
                 "falsePositives,falseNegatives,observedFpr,"
                 "guardedMicros,unguardedMicros");
}

}  // namespace

void runExp2(const ExperimentParams& params) {
  // one database per record count, holding exactly keys 1..numRecords
  const std::string dbPath = lookupDbPath(params.dbDir, params.numRecords);
  const std::string csvPath = params.csvDir + "/exp_2_guarded_lookups.csv";
  writeExp2Headers(csvPath);

  const bool freshDb = !std::filesystem::exists(dbPath);

  DBManager dbManager;
  spdlog::info("Exp2: Opening database '{}'.", dbPath);
  dbManager.openDB(dbPath);

  if (params.buildDb || freshDb) {
    dbManager.insertRecords(params.numRecords);
  }

  std::mt19937_64 engine(params.seed);
  BloomFilter filter(params.numRecords, params.lookupErrorRate, engine);

  StopWatch sw;
  sw.start();
  size_t storedKeys = 0;
  dbManager.forEachKey([&](const std::string& key) {
    if (++storedKeys <= params.numRecords) filter.add(key);
  });
  sw.stop();
  if (storedKeys != params.numRecords) {
    throw std::runtime_error(
        "Exp2: '" + dbPath + "' holds " + std::to_string(storedKeys) +
        " keys, expected " + std::to_string(params.numRecords) +
        "; rerun with --build-db");
  }
  spdlog::info("Exp2: Filter over {} keys built in {} µs ({} bits, {} hashes).",
               filter.keyCount(), sw.elapsedMicros(), filter.filterLength(),
               filter.numHashFuncs());

  // lookup plan: indices 1..numRecords exist, larger ones never do
  std::bernoulli_distribution presentDist(params.presentRatio);
  std::uniform_int_distribution<size_t> presentIndex(1, params.numRecords);
  std::uniform_int_distribution<size_t> absentIndex(params.numRecords + 1,
                                                    params.numRecords * 2);
  std::vector<std::pair<std::string, bool>> lookups;
  lookups.reserve(params.numLookups);
  for (int i = 0; i < params.numLookups; ++i) {
    const bool present = presentDist(engine);
    const size_t index = present ? presentIndex(engine) : absentIndex(engine);
    lookups.emplace_back(makeKey("key", index), present);
  }

  LookupCounts counts;
  dbManager.resetReadCount();
  sw.start();
  for (const auto& [key, present] : lookups) {
    if (present) {
      ++counts.present;
    } else {
      ++counts.absent;
    }
    if (!filter.check(key)) {
      ++counts.filterRejected;
      if (present) ++counts.falseNegatives;
      continue;
    }
    if (!dbManager.getValue(key).has_value()) {
      ++counts.falsePositives;
    }
  }
  sw.stop();
  const long long guardedMicros = sw.elapsedMicros();
  const size_t dbReads = dbManager.readCount();

  size_t unguardedHits = 0;
  sw.start();
  for (const auto& lookup : lookups) {
    if (dbManager.getValue(lookup.first).has_value()) ++unguardedHits;
  }
  sw.stop();
  const long long unguardedMicros = sw.elapsedMicros();
  spdlog::debug("Exp2: unguarded pass found {} of {} keys", unguardedHits,
                lookups.size());

  if (counts.falseNegatives > 0) {
    spdlog::error("Exp2: {} stored keys were rejected by the filter",
                  counts.falseNegatives);
  }

  const double observedFpr =
      counts.absent == 0
          ? 0.0
          : static_cast<double>(counts.falsePositives) / counts.absent;
  spdlog::info(
      "Exp2: {} lookups, {} DB reads, {} avoided, {} false positives "
      "(fpr {:.6f}), guarded {} µs vs unguarded {} µs",
      lookups.size(), dbReads, counts.filterRejected, counts.falsePositives,
      observedFpr, guardedMicros, unguardedMicros);

  std::ofstream out(csvPath, std::ios::app);
  if (!out) {
    throw std::runtime_error("Exp2: cannot open '" + csvPath + "'");
  }
  out << params.numRecords << "," << params.lookupErrorRate << ","
      << filter.filterLength() << "," << filter.numHashFuncs() << ","
      << lookups.size() << "," << params.presentRatio << "," << counts.present
      << "," << counts.absent << "," << dbReads << "," << counts.filterRejected
      << "," << counts.falsePositives << "," << counts.falseNegatives << ","
      << observedFpr << "," << guardedMicros << "," << unguardedMicros << "\n";
  out.close();

  spdlog::info("Exp2: Closing database '{}'.", dbPath);
  auto status = dbManager.closeDB();
  if (!status.ok()) {
    throw std::runtime_error("Exp2: closing DB failed: " + status.ToString());
  }
}
