#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "key_bytes.hpp"

/**
 * Insert-only Bloom filter sized from a key capacity and a target error rate.
 *
 * Each of the k hash functions is the same digest salted with its own random
 * value, drawn once at construction. Not thread-safe: callers sharing one
 * filter between threads must lock around add() and merge().
 */
class BloomFilter {
   public:
    // XOR fold starts here
    static constexpr uint32_t kBlankVector = 0;

    /**
     * @brief Sizes the filter and draws salts from a randomly seeded engine.
     * @throws InvalidParameters for capacity 0, an error rate outside (0, 1)
     * or one that needs too many hash functions.
     */
    BloomFilter(size_t capacity, double errorRate);

    /**
     * @brief Same as above with salts drawn from `engine`, so two filters built
     * from engines in the same state hash identically.
     */
    BloomFilter(size_t capacity, double errorRate, std::mt19937_64& engine);

    /**
     * @brief Records a key.
     * @throws CapacityExceeded when keyCount() == capacity(); nothing changes.
     */
    template <typename Key>
    void add(const Key& key) {
        // converted within the call: toKeyBytes may view a temporary
        addBytes(std::string_view(toKeyBytes(key)));
    }

    /**
     * @brief False means the key was never added; true means it probably was.
     */
    template <typename Key>
    bool check(const Key& key) const {
        return checkBytes(std::string_view(toKeyBytes(key)));
    }

    // Bit positions this filter uses for `key`.
    template <typename Key>
    std::vector<size_t> cells(const Key& key) const {
        return cellsOf(std::string_view(toKeyBytes(key)));
    }

    /**
     * @brief ORs `other` into this filter. Both must share length, hash count
     * and salts.
     * @throws InvalidParameters on a layout mismatch.
     * @throws CapacityExceeded if the combined key count exceeds capacity().
     */
    void merge(const BloomFilter& other);

    // Theoretical false-positive rate at the current key count.
    double estimatedFalsePositiveRate() const;

    size_t bitsSet() const;

    size_t capacity() const { return capacity_; }
    double errorRate() const { return errorRate_; }
    size_t keyCount() const { return keyCount_; }
    size_t filterLength() const { return filterLength_; }
    size_t numHashFuncs() const { return numHashFuncs_; }
    const std::vector<double>& salts() const { return salts_; }

   private:
    double errorRate_;
    size_t capacity_;
    size_t keyCount_{0};
    size_t filterLength_{0};
    size_t numHashFuncs_{0};
    std::vector<double> salts_;
    std::vector<std::string> saltTexts_;
    std::vector<bool> filter_;

    void initialize(std::mt19937_64& engine);
    void addBytes(std::string_view key);
    bool checkBytes(std::string_view key) const;
    std::vector<size_t> cellsOf(std::string_view key) const;
};
