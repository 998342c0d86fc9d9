#pragma once

#include <stdexcept>
#include <string>

// Thrown by BloomFilter::add / merge once the filter holds `capacity` keys.
class CapacityExceeded : public std::runtime_error {
   public:
    explicit CapacityExceeded(const std::string& what) : std::runtime_error(what) {}
};

// Thrown for an unusable capacity / error rate, or mismatched filters.
class InvalidParameters : public std::invalid_argument {
   public:
    explicit InvalidParameters(const std::string& what) : std::invalid_argument(what) {}
};
