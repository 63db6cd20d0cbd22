#pragma once

#include <chrono>

namespace Slowosiec {

/// Wall time since construction, reported in the load summary line.
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    double elapsed_sec() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace Slowosiec
