#include "exp_params.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace {

template <typename T, typename Parse>
std::vector<T> parseList(const std::string& text, Parse parse) {
  std::vector<T> values;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) values.push_back(parse(item));
  }
  if (values.empty()) {
    throw std::invalid_argument("empty list: '" + text + "'");
  }
  return values;
}

size_t parseSize(const std::string& text) {
  if (!text.empty() && text[0] == '-') {
    throw std::invalid_argument("negative value: '" + text + "'");
  }
  return static_cast<size_t>(std::stoull(text));
}

double parseDouble(const std::string& text) { return std::stod(text); }

}  // namespace

ExperimentParams parseExperimentArgs(int argc, char* argv[]) {
  ExperimentParams params;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "--build-db") {
      params.buildDb = true;
      continue;
    }
    if (arg == "--verbose") {
      params.verbose = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw std::invalid_argument("missing value for " + arg);
    }
    const std::string value(argv[++i]);

    if (arg == "--exp") {
      if (value != "1" && value != "2" && value != "all") {
        throw std::invalid_argument("--exp expects 1, 2 or all");
      }
      params.experiment = value;
    } else if (arg == "--csv-dir") {
      params.csvDir = value;
    } else if (arg == "--db-dir") {
      params.dbDir = value;
    } else if (arg == "--seed") {
      params.seed = std::stoull(value);
    } else if (arg == "--capacities") {
      params.capacities = parseList<size_t>(value, parseSize);
    } else if (arg == "--error-rates") {
      params.errorRates = parseList<double>(value, parseDouble);
    } else if (arg == "--trials") {
      params.numTrials = std::stoi(value);
    } else if (arg == "--queries") {
      params.numQueries = parseSize(value);
    } else if (arg == "--records") {
      params.numRecords = parseSize(value);
    } else if (arg == "--lookup-error-rate") {
      params.lookupErrorRate = parseDouble(value);
    } else if (arg == "--lookups") {
      params.numLookups = std::stoi(value);
    } else if (arg == "--present-ratio") {
      params.presentRatio = parseDouble(value);
    } else {
      throw std::invalid_argument("unknown option " + arg);
    }
  }

  if (params.numTrials <= 0 || params.numLookups < 0) {
    throw std::invalid_argument("--trials must be positive, --lookups non-negative");
  }
  if (params.numRecords == 0) {
    throw std::invalid_argument("--records must be positive");
  }
  if (!(params.presentRatio >= 0.0 && params.presentRatio <= 1.0)) {
    throw std::invalid_argument("--present-ratio must be inside [0, 1]");
  }
  return params;
}
