#ifndef MEMSYNC_COMMAND_EXECUTOR_HPP
#define MEMSYNC_COMMAND_EXECUTOR_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "process_runner.hpp"
#include "sync_result.hpp"

namespace memsync {

/// Blocking delay used between attempts; replaced in tests to record delays.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by `std::this_thread::sleep_for`.
Sleeper thread_sleeper();

constexpr std::chrono::seconds kDefaultCommandTimeout{30};
constexpr std::chrono::seconds kPushTimeout{60};
constexpr std::chrono::seconds kGcTimeout{60};
constexpr std::chrono::seconds kCloneTimeout{300};

/**
 * @brief Runs git commands and in-process repository operations with bounded
 *        retries and exponential backoff.
 *
 * The delay before attempt `n + 1` is `base_delay * 2^(n-1)` seconds. Nothing
 * thrown by the runner or an operation escapes; it becomes a failed
 * @ref SyncResult instead.
 */
class CommandExecutor {
  public:
    explicit CommandExecutor(std::shared_ptr<procutil::ProcessRunner> runner,
                             Sleeper sleeper = thread_sleeper());

    /**
     * @brief Execute @p command until it succeeds or attempts run out.
     *
     * @param command      Program and arguments, e.g. `{"git", "push", ...}`.
     * @param operation    Short name used in messages and logs.
     * @param working_dir  Directory the command runs in.
     * @param max_attempts Upper bound on executions, at least 1.
     * @param base_delay   Backoff base in seconds.
     * @param timeout      Per-attempt wall-clock limit.
     * @param output       Optional output receiving stdout of the last attempt.
     * @return Success with the attempt number that succeeded, or a failure with
     *         `GIT_COMMAND_FAILED`, `GIT_COMMAND_TIMEOUT` or
     *         `GIT_COMMAND_UNEXPECTED_ERROR`.
     */
    SyncResult run(const std::vector<std::string>& command, const std::string& operation,
                   const std::filesystem::path& working_dir, int max_attempts = 3,
                   double base_delay = 1.0,
                   std::chrono::seconds timeout = kDefaultCommandTimeout,
                   std::string* output = nullptr) const;

    /**
     * @brief Same retry loop around an in-process operation.
     *
     * @p op returns `false` and fills its argument with a reason on failure.
     * Final failure code is `GIT_OPERATION_FAILED`.
     */
    SyncResult run_operation(const std::function<bool(std::string&)>& op,
                             const std::string& operation, int max_attempts = 1,
                             double base_delay = 1.0) const;

    /// Delay slept after failed attempt @p attempt (1-based).
    static std::chrono::milliseconds backoff_delay(double base_delay, int attempt);

    procutil::ProcessRunner& runner() const { return *runner_; }

  private:
    std::shared_ptr<procutil::ProcessRunner> runner_;
    Sleeper sleeper_;
};

} // namespace memsync

#endif // MEMSYNC_COMMAND_EXECUTOR_HPP
