#undef NDEBUG
#include <boost/asio/thread_pool.hpp>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "exp_utils.hpp"

boost::asio::thread_pool globalThreadPool{2};

bool near(double a, double b) { return std::fabs(a - b) < 1e-12; }

void test_timing_statistics() {
    std::cout << "[TEST] Testing timing statistics ------------" << std::endl;

    TimingStatistics odd = calculateNumericStatistics(std::vector<long long>{40, 10, 30});
    assert(odd.min == 10);
    assert(odd.max == 40);
    assert(near(odd.median, 30.0));
    assert(near(odd.average, 80.0 / 3.0));

    TimingStatistics even = calculateNumericStatistics(std::vector<long long>{7, 1, 4, 2});
    assert(even.min == 1);
    assert(even.max == 7);
    assert(near(even.median, 3.0));
    assert(near(even.average, 3.5));
    std::cout << "Timing statistics tests PASSED." << std::endl;
}

void test_rate_statistics() {
    std::cout << "[TEST] Testing rate statistics ------------" << std::endl;

    // rates keep their fractions: no rounding through an integer type
    RateStatistics rates =
        calculateNumericStatistics(std::vector<double>{0.011, 0.009, 0.0105, 0.0095});
    assert(near(rates.min, 0.009));
    assert(near(rates.max, 0.011));
    assert(near(rates.median, (0.0095 + 0.0105) / 2.0));
    assert(near(rates.average, 0.01));

    RateStatistics single = calculateNumericStatistics(std::vector<double>{0.25});
    assert(near(single.min, 0.25));
    assert(near(single.max, 0.25));
    assert(near(single.median, 0.25));
    assert(near(single.average, 0.25));
    std::cout << "Rate statistics tests PASSED." << std::endl;

    TimingStatistics emptyTimes = calculateNumericStatistics(std::vector<long long>{});
    assert(emptyTimes.min == 0 && emptyTimes.max == 0);
    assert(emptyTimes.median == 0.0 && emptyTimes.average == 0.0);
    RateStatistics emptyRates = calculateNumericStatistics(std::vector<double>{});
    assert(emptyRates.min == 0.0 && emptyRates.max == 0.0);
    assert(emptyRates.median == 0.0 && emptyRates.average == 0.0);
    std::cout << "Empty statistics tests PASSED." << std::endl;
}

void test_keys_and_paths() {
    std::cout << "[TEST] Testing keys and database paths ------------" << std::endl;

    assert(makeKey("key", 42) == "key00000000000000000042");
    assert(makeKey("key", 0).size() == 23);
    assert(makeKey("key", 9) < makeKey("key", 10));
    std::cout << "Key padding tests PASSED." << std::endl;

    // a database built for one record count is never reused for another
    assert(lookupDbPath("db", 100000) == "db/lookup_db_100000");
    assert(lookupDbPath("db", 1000) != lookupDbPath("db", 100000));
    assert(lookupDbPath("db", 1000) == lookupDbPath("db", 1000));
    std::cout << "Lookup database path tests PASSED." << std::endl;
}

void test_false_positive_trials() {
    std::cout << "[TEST] Testing false positive trials ------------" << std::endl;

    TrialResult trial = runFalsePositiveTrial(1000, 0.01, 20000, 5);
    assert(trial.falseNegatives == 0);
    assert(trial.queries == 20000);
    assert(trial.falsePositiveRate <= 0.03);
    assert(trial.filterLength > 0 && trial.numHashFuncs > 0);

    // same seed, same filter, same outcome
    TrialResult again = runFalsePositiveTrial(1000, 0.01, 20000, 5);
    assert(again.falsePositives == trial.falsePositives);
    std::cout << "Single trial tests PASSED." << std::endl;

    std::vector<TrialResult> trials = runFalsePositiveTrialsAsync(1000, 0.01, 4, 5000, 5);
    assert(trials.size() == 4);
    // trial 0 runs with the base seed
    assert(trials.front().falsePositives ==
           runFalsePositiveTrial(1000, 0.01, 5000, 5).falsePositives);
    for (const auto& t : trials) {
        assert(t.falseNegatives == 0);
        assert(t.queries == 5000);
    }
    std::cout << "Parallel trial tests PASSED." << std::endl;
}

int main() {
    test_timing_statistics();
    test_rate_statistics();
    test_keys_and_paths();
    test_false_positive_trials();
    globalThreadPool.join();
    std::cout << "All exp_utils tests PASSED." << std::endl;
    return 0;
}
