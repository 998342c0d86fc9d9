#include "cells.hpp"

#include <spdlog/fmt/fmt.h>

#include <climits>

#include "MurmurHash3.h"
#include "bloom_errors.hpp"

namespace {

constexpr size_t kDigestBytes = 16;

size_t cellFor(std::string_view key, std::string_view salt, size_t filterLength,
               uint32_t blankVector, std::string& buffer) {
    buffer.assign(key.data(), key.size());
    buffer.append(salt.data(), salt.size());

    if (buffer.size() > static_cast<size_t>(INT_MAX)) {
        throw InvalidParameters("key is too long to hash");
    }

    unsigned char digest[kDigestBytes];
    MurmurHash3_x64_128(buffer.data(), static_cast<int>(buffer.size()), 0, digest);

    uint32_t folded = blankVector;
    for (size_t i = 0; i < kDigestBytes; i += 4) {
        uint32_t word = (static_cast<uint32_t>(digest[i]) << 24) |
                        (static_cast<uint32_t>(digest[i + 1]) << 16) |
                        (static_cast<uint32_t>(digest[i + 2]) << 8) |
                        static_cast<uint32_t>(digest[i + 3]);
        folded ^= word;
    }
    return static_cast<size_t>(folded) % filterLength;
}

}  // namespace

std::string saltText(double salt) {
    return fmt::format("{}", salt);
}

std::vector<size_t> getCells(std::string_view key, size_t filterLength, uint32_t blankVector,
                             const std::vector<double>& salts) {
    std::vector<std::string> texts;
    texts.reserve(salts.size());
    for (double salt : salts) {
        texts.push_back(saltText(salt));
    }
    return getCells(key, filterLength, blankVector, texts);
}

std::vector<size_t> getCells(std::string_view key, size_t filterLength, uint32_t blankVector,
                             const std::vector<std::string>& saltTexts) {
    if (filterLength == 0) {
        throw InvalidParameters("filter length must be positive");
    }

    std::vector<size_t> cells;
    cells.reserve(saltTexts.size());
    std::string buffer;
    for (const auto& salt : saltTexts) {
        cells.push_back(cellFor(key, salt, filterLength, blankVector, buffer));
    }
    return cells;
}
