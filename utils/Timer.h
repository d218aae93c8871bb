#pragma once
#include <chrono>

// --------------------- Timer ---------------------
// Milliseconds since construction or the last reset, on a monotonic clock.
class Stopwatch {
public:
    using clock = std::chrono::steady_clock;

    Stopwatch() : start_(clock::now()) {}

    void reset() { start_ = clock::now(); }

    double elapsed_ms() const { return to_ms(clock::now() - start_); }

private:
    static double to_ms(clock::duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    }

    clock::time_point start_;
};
