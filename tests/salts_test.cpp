#undef NDEBUG
#include <cassert>
#include <iostream>
#include <random>
#include <set>

#include "cells.hpp"
#include "salts.hpp"

void test_salt_uniqueness() {
    std::cout << "[TEST] Testing salt generation ------------" << std::endl;

    std::mt19937_64 engine(1234);
    for (size_t count : {1u, 7u, 50u, 99u, 1000u}) {
        std::vector<double> salts = createSalts(count, engine);
        assert(salts.size() == count);
        std::set<double> distinct(salts.begin(), salts.end());
        assert(distinct.size() == count);
        for (double salt : salts) {
            assert(salt >= 0.0 && salt < 1.0);
        }
    }
    assert(createSalts(0, engine).empty());
    std::cout << "Salt uniqueness tests PASSED." << std::endl;
}

void test_salt_reproducibility() {
    std::cout << "[TEST] Testing salt reproducibility ------------" << std::endl;

    std::mt19937_64 a(99);
    std::mt19937_64 b(99);
    assert(createSalts(10, a) == createSalts(10, b));

    std::mt19937_64 c(100);
    std::mt19937_64 d(99);
    assert(createSalts(10, c) != createSalts(10, d));
    std::cout << "Salt reproducibility tests PASSED." << std::endl;
}

void test_salt_text() {
    std::cout << "[TEST] Testing salt text ------------" << std::endl;

    assert(saltText(0.5) == "0.5");
    assert(saltText(0.25) == "0.25");
    assert(saltText(0.0) == "0");

    // shortest text that reads back as the same value
    std::mt19937_64 engine(7);
    for (double salt : createSalts(20, engine)) {
        assert(std::stod(saltText(salt)) == salt);
    }
    std::cout << "Salt text tests PASSED." << std::endl;
}

int main() {
    test_salt_uniqueness();
    test_salt_reproducibility();
    test_salt_text();
    std::cout << "All salts tests PASSED." << std::endl;
    return 0;
}
