#pragma once

#include <cstddef>

// Upper bound of the hash-function count search.
constexpr size_t kMaxHashFuncs = 100;

struct FilterParameters {
    size_t length;        // m, bits in the vector
    size_t numHashFuncs;  // k, positions per key
};

/**
 * @brief Finds the smallest bit vector able to hold `numKeys` keys at
 * `errorRate`, trying k = 1..kMaxHashFuncs hash functions.
 *
 * m(k) = (-k * n) / ln(1 - p^(1/k)); the result is floor(min m) + 1 and the
 * k reaching it.
 *
 * @throws InvalidParameters if numKeys is 0, errorRate is not inside (0, 1),
 * or the optimum needs kMaxHashFuncs or more hash functions.
 */
FilterParameters calculateFilterParameters(size_t numKeys, double errorRate);

/**
 * @brief Theoretical false-positive probability (1 - e^(-k*n/m))^k of a
 * filter with `length` bits and `numHashFuncs` hashes holding `numKeys` keys.
 */
double falsePositiveProbability(size_t length, size_t numHashFuncs, size_t numKeys);
