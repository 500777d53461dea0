#ifndef MEMSYNC_PERFORMANCE_MONITOR_HPP
#define MEMSYNC_PERFORMANCE_MONITOR_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace memsync {

/**
 * @brief Receives the duration and outcome of timed engine operations.
 */
class PerformanceMonitor {
  public:
    virtual ~PerformanceMonitor() = default;
    virtual void record(const std::string& operation, std::chrono::milliseconds elapsed,
                        bool success) = 0;
};

/// Discards every measurement.
class NullPerformanceMonitor final : public PerformanceMonitor {
  public:
    void record(const std::string&, std::chrono::milliseconds, bool) override {}
};

/**
 * @brief Logs each measurement and keeps per-operation totals.
 *
 * Operations slower than the threshold are logged as warnings.
 */
class LoggingPerformanceMonitor : public PerformanceMonitor {
  public:
    struct Stats {
        size_t count = 0;
        size_t failures = 0;
        std::chrono::milliseconds total{0};
        std::chrono::milliseconds max{0};
    };

    explicit LoggingPerformanceMonitor(
        std::chrono::milliseconds slow_threshold = std::chrono::seconds(10));

    void record(const std::string& operation, std::chrono::milliseconds elapsed,
                bool success) override;

    std::map<std::string, Stats> snapshot() const;

    /// Write one info line per operation with count, failures and mean time.
    void log_summary() const;

  private:
    std::chrono::milliseconds slow_threshold_;
    mutable std::mutex mtx_;
    std::map<std::string, Stats> stats_;
};

/**
 * @brief Reports the lifetime of a scope to a monitor.
 *
 * The outcome defaults to failure so early returns that skip
 * @ref set_success are counted as failed.
 */
class ScopedOperationTimer {
  public:
    ScopedOperationTimer(PerformanceMonitor& monitor, std::string operation);
    ~ScopedOperationTimer();
    ScopedOperationTimer(const ScopedOperationTimer&) = delete;
    ScopedOperationTimer& operator=(const ScopedOperationTimer&) = delete;

    void set_success(bool success) { success_ = success; }

  private:
    PerformanceMonitor& monitor_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
    bool success_ = false;
};

} // namespace memsync

#endif // MEMSYNC_PERFORMANCE_MONITOR_HPP
