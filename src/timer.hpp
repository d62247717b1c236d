#pragma once
#include <chrono>

struct Timer {
    using clock = std::chrono::steady_clock;
    clock::time_point start = clock::now();

    void reset() { start = clock::now(); }

    double seconds() const {
        auto end = clock::now();
        std::chrono::duration<double> diff = end - start;
        return diff.count();
    }

    // max_seconds <= 0 means no budget.
    bool expired(double max_seconds) const {
        return max_seconds > 0.0 && seconds() > max_seconds;
    }
};
