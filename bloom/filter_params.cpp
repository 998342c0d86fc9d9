#include "filter_params.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <limits>

#include "bloom_errors.hpp"

FilterParameters calculateFilterParameters(size_t numKeys, double errorRate) {
    if (numKeys == 0) {
        throw InvalidParameters("capacity must be positive");
    }
    // written this way so NaN is rejected as well
    if (!(errorRate > 0.0 && errorRate < 1.0)) {
        throw InvalidParameters(fmt::format("error rate {} is not inside (0, 1)", errorRate));
    }

    bool found = false;
    double lowestM = 0.0;
    size_t bestK = 0;
    for (size_t k = 1; k <= kMaxHashFuncs; ++k) {
        const double denominator = std::log(1.0 - std::pow(errorRate, 1.0 / static_cast<double>(k)));
        // p^(1/k) too small to move 1.0: m would be infinite
        if (denominator == 0.0) continue;

        const double m = (-static_cast<double>(k) * static_cast<double>(numKeys)) / denominator;
        if (!std::isfinite(m) || m <= 0.0) continue;

        if (!found || m < lowestM) {
            found = true;
            lowestM = m;
            bestK = k;
        }
    }

    if (!found) {
        throw InvalidParameters(
            fmt::format("no filter size found for {} keys at error rate {}", numKeys, errorRate));
    }
    if (bestK == kMaxHashFuncs) {
        throw InvalidParameters(fmt::format(
            "error rate {} needs {} or more hash functions", errorRate, kMaxHashFuncs));
    }
    if (lowestM >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        throw InvalidParameters(
            fmt::format("filter for {} keys at error rate {} is too large", numKeys, errorRate));
    }

    return FilterParameters{static_cast<size_t>(std::floor(lowestM)) + 1, bestK};
}

double falsePositiveProbability(size_t length, size_t numHashFuncs, size_t numKeys) {
    if (length == 0) {
        return 1.0;
    }
    double exponent = -static_cast<double>(numHashFuncs) * static_cast<double>(numKeys) /
                      static_cast<double>(length);
    double base = 1.0 - std::exp(exponent);
    return std::pow(base, static_cast<double>(numHashFuncs));
}
