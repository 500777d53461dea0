#include "time_utils.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    long long total = dur.count();
    if (total < 0)
        total = 0;
    if (total < 1000)
        return std::to_string(total) + "ms";
    if (total < 60000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(total) / 1000.0);
        return std::string(buf);
    }
    long long secs = total / 1000;
    long long m = secs / 60;
    long long s = secs % 60;
    return std::to_string(m) + "m" + std::to_string(s) + "s";
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    if (!(seconds > 0.0))
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}
