#ifndef MEMSYNC_ERROR_TYPES_HPP
#define MEMSYNC_ERROR_TYPES_HPP

#include <string>
#include <vector>

namespace memsync {

enum class ErrorCategory {
    NETWORK,
    AUTHENTICATION,
    REPOSITORY_ACCESS,
    BRANCH_DETECTION,
    MERGE_CONFLICT,
    REPOSITORY_CORRUPTION,
    CONFIGURATION,
    UNKNOWN
};

enum class RecoveryAction { RETRY, FALLBACK, USER_ACTION_REQUIRED, ABORT, REINITIALIZE };

/// Lower-case name, e.g. `repository_corruption`.
const char* to_string(ErrorCategory category);
/// Lower-case name, e.g. `user_action_required`.
const char* to_string(RecoveryAction action);

/**
 * @brief How a category of failure is explained and recovered from.
 */
struct ErrorResolution {
    ErrorCategory category;
    RecoveryAction action;
    std::string user_message;
    std::string technical_message;
    std::vector<std::string> resolution_steps;
    double retry_delay = 0.0; ///< Seconds between recovery attempts
    int max_retries = 0;      ///< Recovery runs at most max_retries + 1 times
};

/**
 * @brief The static resolution table, one entry per @ref ErrorCategory.
 */
const std::vector<ErrorResolution>& error_resolutions();

/// Entry of @ref error_resolutions for @p category.
const ErrorResolution& resolution_for(ErrorCategory category);

/**
 * @brief One classification rule: a lower-case substring and its category.
 */
struct ErrorRule {
    std::string pattern;
    ErrorCategory category;

    /// @p lowered must already be lower-case.
    bool matches(const std::string& lowered) const;
};

/**
 * @brief Classification rules in evaluation order; the first match wins.
 *
 * Network patterns come first, then authentication, repository access,
 * branch detection, merge conflict and finally corruption. The generic
 * `conflict` and `corrupt` patterns sit at the end of their groups so the more
 * specific phrases above them decide first.
 */
const std::vector<ErrorRule>& error_rules();

/**
 * @brief Map a failure message (and optional error code) to a category.
 *
 * Matching is case-insensitive. When no rule matches the message, the code
 * is inspected: `timeout` means network, `auth`/`permission` authentication,
 * `branch` branch detection and `conflict` merge conflict.
 */
ErrorCategory categorize_error(const std::string& message, const std::string& code = "");

} // namespace memsync

#endif // MEMSYNC_ERROR_TYPES_HPP
