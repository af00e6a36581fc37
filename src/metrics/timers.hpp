#pragma once
#include <chrono>
#include <cstdint>

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = t1 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
    double secs() const { return ms() / 1000.0; }

    // Throughput over the stopped interval; 0 if nothing was timed.
    double mb_per_sec(std::uint64_t bytes) const {
        const double s = secs();
        return s > 0.0 ? (static_cast<double>(bytes) / (1024.0 * 1024.0)) / s : 0.0;
    }
};
