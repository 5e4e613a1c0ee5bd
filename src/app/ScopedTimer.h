#pragma once

#include <chrono>

class ScopedTimer {
public:
    ScopedTimer() = default;

    // in seconds, with millisecond precision
    double elapsed() const noexcept {
        return static_cast<double>(elapsedMs()) / 1000.0;
    }

    long long elapsedMs() const noexcept {
        const auto end_time = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_).count();
    }

private:
    const std::chrono::steady_clock::time_point start_time_{std::chrono::steady_clock::now()};
};
