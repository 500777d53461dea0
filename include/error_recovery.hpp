#ifndef MEMSYNC_ERROR_RECOVERY_HPP
#define MEMSYNC_ERROR_RECOVERY_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include "command_executor.hpp"
#include "error_types.hpp"
#include "sync_result.hpp"

namespace memsync {

/**
 * @brief Turns failures into user-facing guidance and drives recovery.
 *
 * Also owns repository integrity checking and corruption repair for the
 * repository at @p repo_dir.
 */
class RecoveryEngine {
  public:
    using Context = std::map<std::string, std::string>;

    RecoveryEngine(std::filesystem::path repo_dir, const CommandExecutor& executor,
                   Sleeper sleeper = thread_sleeper());

    ErrorCategory categorize(const std::string& message, const std::string& code = "") const {
        return categorize_error(message, code);
    }

    /**
     * @brief Build the failure reported to callers for an error.
     *
     * The error code becomes `<CATEGORY>_<code>` (`<CATEGORY>_ERROR` when
     * @p code is empty). The message holds the user message, numbered
     * resolution steps, a retry notice for retryable categories and a
     * technical section with the raw message and @p context.
     */
    SyncResult handle_error(const std::string& message, const std::string& operation,
                            const std::string& code = "", const Context& context = {}) const;

    /**
     * @brief Run @p recover according to the category's resolution.
     *
     * Categories needing the user fail with `USER_ACTION_REQUIRED` and abort
     * with `OPERATION_ABORTED`; neither calls @p recover. Otherwise up to
     * `max_retries + 1` attempts are made with `retry_delay` between them.
     * Exceptions thrown by @p recover count as failed attempts.
     */
    SyncResult attempt_recovery(ErrorCategory category, const std::function<SyncResult()>& recover,
                                const Context& context = {}) const;

    /**
     * @brief Run `git fsck` (30 second limit).
     *
     * Codes: `NO_REPOSITORY`, `INTEGRITY_FAILED`, `INTEGRITY_TIMEOUT`,
     * `INTEGRITY_ERROR`.
     */
    SyncResult validate_repository_integrity() const;

    /**
     * @brief Repair the repository, recreating it when repair is not enough.
     *
     * First `git gc --prune=now` (60 second limit) followed by a new
     * integrity check. If the repository is still broken the `.git` directory
     * is deleted and a fresh repository with @p default_branch is created;
     * working files stay, local history is lost.
     */
    SyncResult recover_corrupted_repository(const std::string& default_branch) const;

  private:
    std::filesystem::path repo_dir_;
    const CommandExecutor& executor_;
    Sleeper sleeper_;
};

} // namespace memsync

#endif // MEMSYNC_ERROR_RECOVERY_HPP
