#include "salts.hpp"

#include <unordered_set>

std::vector<double> createSalts(size_t count, std::mt19937_64& engine) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::unordered_set<double> seen;
    std::vector<double> salts;
    salts.reserve(count);

    while (salts.size() < count) {
        double salt = dist(engine);
        // a repeated salt would make two hash functions identical
        if (!seen.insert(salt).second) continue;
        salts.push_back(salt);
    }
    return salts;
}
