#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Outcome of one child process execution.
 */
struct ProcessResult {
    int exit_code = -1;     ///< Exit status, `128 + signal` when killed
    std::string out;        ///< Captured standard output
    std::string err;        ///< Captured standard error
    bool timed_out = false; ///< The child was killed after exceeding its timeout
};

/**
 * @brief Seam for launching external executables.
 *
 * Implementations throw `std::system_error` when the process cannot be
 * started at all; a program that starts and fails is reported through
 * @ref ProcessResult::exit_code.
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run @p argv to completion.
     *
     * @param argv    Program name followed by its arguments.
     * @param cwd     Working directory for the child; empty keeps the current one.
     * @param timeout Wall-clock limit; zero or negative disables it.
     */
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd,
                              std::chrono::seconds timeout) = 0;
};

/**
 * @brief Production runner built on fork/exec with pipes and poll.
 *
 * On timeout the child's whole process group receives SIGKILL. On Windows
 * the command runs through `_popen` and the timeout is not enforced.
 */
class SubprocessRunner : public ProcessRunner {
  public:
    /**
     * @param env_overrides Variables added to the inherited environment.
     *        Defaults disable interactive credential prompts from git.
     */
    explicit SubprocessRunner(std::map<std::string, std::string> env_overrides = {
                                  {"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}});

    ProcessResult run(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
                      std::chrono::seconds timeout) override;

  private:
    std::map<std::string, std::string> env_overrides_;
};

/**
 * @brief Render @p argv as a single shell-like string for logs and messages.
 */
std::string format_command(const std::vector<std::string>& argv);

} // namespace procutil

#endif // PROCESS_RUNNER_HPP
