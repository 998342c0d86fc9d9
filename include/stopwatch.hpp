#ifndef STOPWATCH_HPP
#define STOPWATCH_HPP

#include <chrono>

class StopWatch {
public:
    StopWatch() = default;

    /**
     * @brief Starts (or restarts) the timer.
     */
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    /**
     * @brief Stops the timer. A stopped watch keeps its last reading.
     */
    void stop() {
        end_time_ = std::chrono::steady_clock::now();
        running_ = false;
    }

    /**
     * @brief Elapsed time in microseconds, up to now while still running.
     */
    long long elapsedMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();
    }

    long long elapsedNanos() const {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed()).count();
    }

private:
    std::chrono::steady_clock::time_point start_time_{};
    std::chrono::steady_clock::time_point end_time_{};
    bool running_{false};

    std::chrono::steady_clock::duration elapsed() const {
        auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
        return end - start_time_;
    }
};

#endif // STOPWATCH_HPP
