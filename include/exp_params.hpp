#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct ExperimentParams {
    std::string experiment = "all";  // "1", "2" or "all"
    std::string csvDir = "csv";
    std::string dbDir = "db";
    bool buildDb = false;
    bool verbose = false;
    uint64_t seed = 42;

    // exp1
    std::vector<size_t> capacities{1'000, 10'000, 100'000};
    std::vector<double> errorRates{0.1, 0.01, 0.001};
    int numTrials = 8;
    size_t numQueries = 100'000;

    // exp2
    size_t numRecords = 200'000;
    double lookupErrorRate = 0.01;
    int numLookups = 100'000;
    double presentRatio = 0.5;
};

// Parses --flag value pairs over the defaults; throws std::invalid_argument.
ExperimentParams parseExperimentArgs(int argc, char* argv[]);
