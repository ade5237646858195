#include "racetrack/utils/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace racetrack {
namespace time_utils {

double get_elapsed_time(const TimePoint& start, const TimePoint& end) {
    auto duration = end - start;
    return std::chrono::duration<double>(duration).count();
}

double get_elapsed_time_since(const TimePoint& start) {
    return get_elapsed_time(start, Clock::now());
}

std::string format_duration(double seconds) {
    std::ostringstream oss;

    if (seconds < 1e-3) {
        oss << std::fixed << std::setprecision(2) << (seconds * 1e6) << " us";
    } else if (seconds < 1.0) {
        oss << std::fixed << std::setprecision(2) << (seconds * 1e3) << " ms";
    } else if (seconds < 60.0) {
        oss << std::fixed << std::setprecision(2) << seconds << " s";
    } else {
        int minutes = static_cast<int>(seconds / 60);
        double remaining_seconds = seconds - minutes * 60;
        oss << minutes << "m " << std::fixed << std::setprecision(1) << remaining_seconds << "s";
    }

    return oss.str();
}

std::string get_timestamp_string() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

// Timer class implementation
Timer::Timer() : running_(false) {}

void Timer::start() {
    start_time_ = Clock::now();
    running_ = true;
}

double Timer::stop() {
    if (!running_) {
        return 0.0;
    }

    double elapsed = get_elapsed_time(start_time_, Clock::now());
    running_ = false;

    return elapsed;
}

double Timer::elapsed() const {
    if (!running_) {
        return 0.0;
    }

    return get_elapsed_time_since(start_time_);
}

bool Timer::is_running() const {
    return running_;
}

} // namespace time_utils
} // namespace racetrack
