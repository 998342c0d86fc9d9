#pragma once

#include "exp_params.hpp"

// Empirical false-positive rate of filters filled to capacity.
void runExp1(const ExperimentParams& params);
