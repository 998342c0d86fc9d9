#pragma once

#include <string>
#include <string_view>
#include <type_traits>

// Byte form of a key, as hashed by BloomFilter. Text keys are used as is,
// integral keys by their decimal text. Other key types opt in with their own
// toKeyBytes overload next to the type.

inline std::string_view toKeyBytes(std::string_view key) {
    return key;
}

inline std::string_view toKeyBytes(const std::string& key) {
    return key;
}

inline std::string_view toKeyBytes(const char* key) {
    return std::string_view(key);
}

template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
std::string toKeyBytes(T key) {
    return std::to_string(key);
}
