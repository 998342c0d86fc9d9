#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Text form of a salt as it is appended to keys before hashing.
std::string saltText(double salt);

/**
 * @brief Bit positions of `key`, one per salt.
 *
 * Each position hashes key + saltText(salt) with MurmurHash3_x64_128, reads
 * the 16-byte digest as four big-endian 32-bit words, XORs them onto
 * `blankVector` and reduces the result modulo `filterLength`.
 */
std::vector<size_t> getCells(std::string_view key, size_t filterLength, uint32_t blankVector,
                             const std::vector<double>& salts);

// Same as above with salts already rendered by saltText().
std::vector<size_t> getCells(std::string_view key, size_t filterLength, uint32_t blankVector,
                             const std::vector<std::string>& saltTexts);
