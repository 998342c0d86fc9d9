#pragma once

#include <cstddef>
#include <random>
#include <vector>

// `count` distinct uniform values in [0, 1), in the order they were drawn.
std::vector<double> createSalts(size_t count, std::mt19937_64& engine);
