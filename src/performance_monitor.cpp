#include "performance_monitor.hpp"
#include <utility>
#include "logger.hpp"
#include "time_utils.hpp"

namespace memsync {

LoggingPerformanceMonitor::LoggingPerformanceMonitor(std::chrono::milliseconds slow_threshold)
    : slow_threshold_(slow_threshold) {}

void LoggingPerformanceMonitor::record(const std::string& operation,
                                       std::chrono::milliseconds elapsed, bool success) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Stats& s = stats_[operation];
        ++s.count;
        if (!success)
            ++s.failures;
        s.total += elapsed;
        if (elapsed > s.max)
            s.max = elapsed;
    }
    std::map<std::string, std::string> fields{{"operation", operation},
                                              {"elapsed", format_elapsed(elapsed)},
                                              {"success", success ? "true" : "false"}};
    if (elapsed > slow_threshold_)
        log_warning("Slow operation", fields);
    else
        log_debug("Operation timed", fields);
}

std::map<std::string, LoggingPerformanceMonitor::Stats>
LoggingPerformanceMonitor::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

void LoggingPerformanceMonitor::log_summary() const {
    for (const auto& [op, s] : snapshot()) {
        auto mean = s.count ? std::chrono::milliseconds(s.total.count() /
                                                        static_cast<long long>(s.count))
                            : std::chrono::milliseconds(0);
        log_info("Operation summary", {{"operation", op},
                                       {"count", std::to_string(s.count)},
                                       {"failures", std::to_string(s.failures)},
                                       {"mean", format_elapsed(mean)},
                                       {"max", format_elapsed(s.max)}});
    }
}

ScopedOperationTimer::ScopedOperationTimer(PerformanceMonitor& monitor, std::string operation)
    : monitor_(monitor), operation_(std::move(operation)),
      start_(std::chrono::steady_clock::now()) {}

ScopedOperationTimer::~ScopedOperationTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    monitor_.record(operation_, elapsed, success_);
}

} // namespace memsync
