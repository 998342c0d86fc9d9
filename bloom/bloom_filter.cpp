#include "bloom_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "bloom_errors.hpp"
#include "cells.hpp"
#include "filter_params.hpp"
#include "salts.hpp"

namespace {

std::mt19937_64 seededEngine() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

}  // namespace

BloomFilter::BloomFilter(size_t capacity, double errorRate)
    : errorRate_(errorRate), capacity_(capacity) {
    std::mt19937_64 engine = seededEngine();
    initialize(engine);
}

BloomFilter::BloomFilter(size_t capacity, double errorRate, std::mt19937_64& engine)
    : errorRate_(errorRate), capacity_(capacity) {
    initialize(engine);
}

void BloomFilter::initialize(std::mt19937_64& engine) {
    FilterParameters params = calculateFilterParameters(capacity_, errorRate_);
    filterLength_ = params.length;
    numHashFuncs_ = params.numHashFuncs;

    salts_ = createSalts(numHashFuncs_, engine);
    saltTexts_.reserve(salts_.size());
    for (double salt : salts_) {
        saltTexts_.push_back(saltText(salt));
    }
    filter_.assign(filterLength_, false);

    spdlog::debug("BloomFilter: capacity {}, error rate {} -> {} bits, {} hash functions",
                  capacity_, errorRate_, filterLength_, numHashFuncs_);
}

void BloomFilter::addBytes(std::string_view key) {
    if (keyCount_ >= capacity_) {
        throw CapacityExceeded("BloomFilter at capacity (" + std::to_string(capacity_) + " keys)");
    }
    // positions first, so a failing hash leaves the filter as it was
    std::vector<size_t> positions = cellsOf(key);
    ++keyCount_;
    for (size_t pos : positions) {
        filter_[pos] = true;
    }
}

bool BloomFilter::checkBytes(std::string_view key) const {
    for (size_t pos : cellsOf(key)) {
        if (!filter_[pos]) {
            return false;
        }
    }
    return true;
}

std::vector<size_t> BloomFilter::cellsOf(std::string_view key) const {
    return getCells(key, filterLength_, kBlankVector, saltTexts_);
}

void BloomFilter::merge(const BloomFilter& other) {
    if (filterLength_ != other.filterLength_ || numHashFuncs_ != other.numHashFuncs_ ||
        salts_ != other.salts_) {
        throw InvalidParameters("BloomFilter layout mismatch during merge");
    }
    if (other.keyCount_ > capacity_ - keyCount_) {
        throw CapacityExceeded("merged BloomFilter would hold " +
                               std::to_string(keyCount_ + other.keyCount_) + " keys, capacity is " +
                               std::to_string(capacity_));
    }

    for (size_t i = 0; i < filter_.size(); ++i) {
        filter_[i] = filter_[i] | other.filter_[i];
    }
    keyCount_ += other.keyCount_;
}

double BloomFilter::estimatedFalsePositiveRate() const {
    return falsePositiveProbability(filterLength_, numHashFuncs_, keyCount_);
}

size_t BloomFilter::bitsSet() const {
    return static_cast<size_t>(std::count(filter_.begin(), filter_.end(), true));
}
