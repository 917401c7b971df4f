#ifndef TIMER_H
#define TIMER_H

#include <chrono>
#include <ostream>

// Wall clock stopwatch for the console summary.
class Timer {
    std::chrono::time_point<std::chrono::steady_clock> start_time;

public:
    Timer() : start_time(std::chrono::steady_clock::now()) {}

    void reset() {
        start_time = std::chrono::steady_clock::now();
    }

    double elapsedMs() const {
        auto end_time = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end_time - start_time).count();
    }

    void printElapsed(std::ostream& os, const char* label) const {
        os << label << ": " << elapsedMs() << " ms" << std::endl;
    }
};

#endif // TIMER_H
