#pragma once

#include "exp_params.hpp"

// RocksDB point lookups guarded by a BloomFilter over the stored keys.
void runExp2(const ExperimentParams& params);
