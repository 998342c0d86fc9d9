#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "bloom_errors.hpp"
#include "filter_params.hpp"

template <typename F>
bool throwsInvalidParameters(F&& f) {
    try {
        f();
    } catch (const InvalidParameters&) {
        return true;
    }
    return false;
}

void test_known_sizes() {
    std::cout << "[TEST] Testing filter sizing ------------" << std::endl;

    FilterParameters p = calculateFilterParameters(100, 0.01);
    assert(p.length == 960);
    assert(p.numHashFuncs == 7);

    p = calculateFilterParameters(2, 0.1);
    assert(p.length == 10);
    assert(p.numHashFuncs == 3);

    p = calculateFilterParameters(1000, 0.001);
    assert(p.length == 14378);
    assert(p.numHashFuncs == 10);

    p = calculateFilterParameters(10000, 0.01);
    assert(p.length == 95930);
    assert(p.numHashFuncs == 7);

    p = calculateFilterParameters(1, 0.5);
    assert(p.length == 2);
    assert(p.numHashFuncs == 1);
    std::cout << "Known sizes tests PASSED." << std::endl;

    // same inputs, same answer
    FilterParameters a = calculateFilterParameters(12345, 0.02);
    FilterParameters b = calculateFilterParameters(12345, 0.02);
    assert(a.length == b.length);
    assert(a.numHashFuncs == b.numHashFuncs);
    std::cout << "Deterministic sizing tests PASSED." << std::endl;
}

void test_search_bound() {
    std::cout << "[TEST] Testing hash count search bound ------------" << std::endl;

    FilterParameters p = calculateFilterParameters(100, 1e-29);
    assert(p.numHashFuncs == 96);
    assert(p.numHashFuncs < kMaxHashFuncs);

    assert(throwsInvalidParameters([] { calculateFilterParameters(100, 1e-40); }));
    assert(throwsInvalidParameters([] { calculateFilterParameters(100, 1e-300); }));
    std::cout << "Search bound tests PASSED." << std::endl;
}

void test_invalid_inputs() {
    std::cout << "[TEST] Testing invalid sizing inputs ------------" << std::endl;

    assert(throwsInvalidParameters([] { calculateFilterParameters(0, 0.01); }));
    assert(throwsInvalidParameters([] { calculateFilterParameters(10, 0.0); }));
    assert(throwsInvalidParameters([] { calculateFilterParameters(10, 1.0); }));
    assert(throwsInvalidParameters([] { calculateFilterParameters(10, -0.5); }));
    assert(throwsInvalidParameters([] { calculateFilterParameters(10, 1.5); }));
    assert(throwsInvalidParameters(
        [] { calculateFilterParameters(10, std::numeric_limits<double>::quiet_NaN()); }));
    std::cout << "Invalid input tests PASSED." << std::endl;
}

void test_false_positive_probability() {
    std::cout << "[TEST] Testing false positive probability ------------" << std::endl;

    assert(falsePositiveProbability(0, 3, 10) == 1.0);
    assert(falsePositiveProbability(960, 7, 0) == 0.0);

    // the chosen size meets the target at capacity
    FilterParameters p = calculateFilterParameters(100, 0.01);
    double fpp = falsePositiveProbability(p.length, p.numHashFuncs, 100);
    assert(fpp <= 0.01 * 1.01);
    assert(fpp > 0.005);

    // more keys, more false positives
    assert(falsePositiveProbability(1000, 5, 200) > falsePositiveProbability(1000, 5, 100));
    std::cout << "False positive probability tests PASSED." << std::endl;
}

int main() {
    test_known_sizes();
    test_search_bound();
    test_invalid_inputs();
    test_false_positive_probability();
    std::cout << "All filter_params tests PASSED." << std::endl;
    return 0;
}
