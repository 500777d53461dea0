#include "command_executor.hpp"
#include <cmath>
#include <exception>
#include <thread>
#include <utility>
#include "logger.hpp"
#include "time_utils.hpp"

namespace memsync {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

static std::string trimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string attempts_text(int n) {
    return std::to_string(n) + (n == 1 ? " attempt" : " attempts");
}

CommandExecutor::CommandExecutor(std::shared_ptr<procutil::ProcessRunner> runner,
                                 Sleeper sleeper)
    : runner_(std::move(runner)), sleeper_(std::move(sleeper)) {
    if (!sleeper_)
        sleeper_ = thread_sleeper();
}

std::chrono::milliseconds CommandExecutor::backoff_delay(double base_delay, int attempt) {
    if (attempt < 1)
        attempt = 1;
    return seconds_to_ms(base_delay * std::pow(2.0, attempt - 1));
}

SyncResult CommandExecutor::run(const std::vector<std::string>& command,
                                const std::string& operation,
                                const std::filesystem::path& working_dir, int max_attempts,
                                double base_delay, std::chrono::seconds timeout,
                                std::string* output) const {
    if (max_attempts < 1)
        max_attempts = 1;
    const std::string cmdline = procutil::format_command(command);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        const bool last = attempt == max_attempts;
        std::string code;
        std::string reason;
        log_debug("Running command",
                  {{"operation", operation},
                   {"command", cmdline},
                   {"attempt", std::to_string(attempt) + "/" + std::to_string(max_attempts)}});
        try {
            procutil::ProcessResult res = runner_->run(command, working_dir, timeout);
            if (output)
                *output = res.out;
            if (!res.timed_out && res.exit_code == 0) {
                if (attempt > 1)
                    log_info(operation + " succeeded after " + attempts_text(attempt));
                return SyncResult::ok(operation + " completed: " + cmdline, operation, attempt);
            }
            if (res.timed_out) {
                code = "GIT_COMMAND_TIMEOUT";
                reason = "timeout after " + std::to_string(timeout.count()) + "s";
            } else {
                code = "GIT_COMMAND_FAILED";
                std::string detail = trimmed(res.err);
                if (detail.empty())
                    detail = trimmed(res.out);
                reason = "exit code " + std::to_string(res.exit_code) +
                         (detail.empty() ? "" : ": " + detail);
            }
        } catch (const std::exception& e) {
            code = "GIT_COMMAND_UNEXPECTED_ERROR";
            reason = std::string("unexpected error: ") + e.what();
        }
        if (last) {
            log_error(operation + " failed",
                      {{"command", cmdline}, {"attempts", std::to_string(attempt)}, {"error", code}});
            return SyncResult::failure(operation + " failed after " + attempts_text(attempt) +
                                           " (" + reason + ")",
                                       operation, code, attempt);
        }
        auto delay = backoff_delay(base_delay, attempt);
        log_warning(operation + " attempt " + std::to_string(attempt) + " failed, retrying in " +
                        format_elapsed(delay),
                    {{"reason", reason}});
        sleeper_(delay);
    }
    // Not reached: the loop returns on the final attempt.
    return SyncResult::failure(operation + " was not attempted", operation, "GIT_COMMAND_FAILED");
}

SyncResult CommandExecutor::run_operation(const std::function<bool(std::string&)>& op,
                                          const std::string& operation, int max_attempts,
                                          double base_delay) const {
    if (max_attempts < 1)
        max_attempts = 1;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        std::string error;
        std::string code = "GIT_OPERATION_FAILED";
        try {
            if (op(error))
                return SyncResult::ok(operation + " completed", operation, attempt);
        } catch (const std::exception& e) {
            code = "GIT_COMMAND_UNEXPECTED_ERROR";
            error = std::string("unexpected error: ") + e.what();
        }
        if (attempt == max_attempts) {
            log_error(operation + " failed", {{"attempts", std::to_string(attempt)}, {"error", error}});
            return SyncResult::failure(operation + " failed after " + attempts_text(attempt) +
                                           (error.empty() ? "" : ": " + error),
                                       operation, code, attempt);
        }
        auto delay = backoff_delay(base_delay, attempt);
        log_warning(operation + " attempt " + std::to_string(attempt) + " failed, retrying in " +
                        format_elapsed(delay),
                    {{"reason", error}});
        sleeper_(delay);
    }
    return SyncResult::failure(operation + " was not attempted", operation, "GIT_OPERATION_FAILED");
}

} // namespace memsync
