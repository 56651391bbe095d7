#pragma once

#include <chrono>
#include <cstddef>

namespace ember {

/// Tracks the wall-clock and iteration budget of one search run.
/// Only consulted at iteration boundaries.
class BudgetManager {
public:
    BudgetManager(double max_seconds, size_t max_iterations)
        : max_seconds_(max_seconds), max_iterations_(max_iterations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        iterations_ = 0;
    }

    void recordIteration() { iterations_++; }

    bool canContinue() const {
        return !isIterationExhausted() && !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    size_t iterations() const { return iterations_; }
    bool isTimeExhausted() const { return elapsedSeconds() >= max_seconds_; }
    bool isIterationExhausted() const { return iterations_ >= max_iterations_; }

private:
    double max_seconds_;
    size_t max_iterations_;
    size_t iterations_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace ember
