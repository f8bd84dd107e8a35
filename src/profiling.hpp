#pragma once
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <string>
#include <thread>

// Format a duration in milliseconds as a human-readable string
inline std::string format_duration(long long ms) {
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }
    double seconds = ms / 1000.0;
    if (seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << seconds << " s";
        return oss.str();
    }
    int total_seconds = static_cast<int>(seconds);
    int hours = total_seconds / 3600;
    int minutes = (total_seconds % 3600) / 60;
    int secs = total_seconds % 60;
    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else {
        oss << minutes << "m " << secs << "s";
    }
    return oss.str();
}

// Milliseconds each frame may take at the given frames-per-second cap.
inline long long frame_budget_ms(int fps) {
    if (fps <= 0) return 0;
    return 1000 / fps;
}

/*
FrameClock: caps the loop at a frame rate. tick() sleeps for whatever is left
of the frame budget since the previous tick, and returns the milliseconds
actually slept.
*/
class FrameClock {
private:
    std::chrono::steady_clock::time_point last_tick;

public:
    FrameClock() : last_tick(std::chrono::steady_clock::now()) {}

    long long tick(int fps) {
        auto now = std::chrono::steady_clock::now();
        long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick).count();
        long long delay = std::max(0LL, frame_budget_ms(fps) - elapsed);
        if (delay > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        last_tick = std::chrono::steady_clock::now();
        return delay;
    }
};

// Generations advanced and wall time, reported once the screen is restored.
struct RunStats {
    long long generations = 0;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    long long elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    }

    void report(std::ostream& out, int alive) const {
        out << "Ran " << generations << " generations in " << format_duration(elapsed_ms())
            << ", " << alive << " cells alive\n";
    }
};
