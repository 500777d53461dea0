#include "error_types.hpp"
#include <algorithm>
#include <cctype>

namespace memsync {

const char* to_string(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::NETWORK:
        return "network";
    case ErrorCategory::AUTHENTICATION:
        return "authentication";
    case ErrorCategory::REPOSITORY_ACCESS:
        return "repository_access";
    case ErrorCategory::BRANCH_DETECTION:
        return "branch_detection";
    case ErrorCategory::MERGE_CONFLICT:
        return "merge_conflict";
    case ErrorCategory::REPOSITORY_CORRUPTION:
        return "repository_corruption";
    case ErrorCategory::CONFIGURATION:
        return "configuration";
    case ErrorCategory::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

const char* to_string(RecoveryAction action) {
    switch (action) {
    case RecoveryAction::RETRY:
        return "retry";
    case RecoveryAction::FALLBACK:
        return "fallback";
    case RecoveryAction::USER_ACTION_REQUIRED:
        return "user_action_required";
    case RecoveryAction::ABORT:
        return "abort";
    case RecoveryAction::REINITIALIZE:
        return "reinitialize";
    }
    return "abort";
}

const std::vector<ErrorResolution>& error_resolutions() {
    static const std::vector<ErrorResolution> table = {
        {ErrorCategory::NETWORK,
         RecoveryAction::RETRY,
         "Unable to connect to the remote repository. Your memories are saved locally and will "
         "sync when the connection is restored.",
         "Network connectivity issue preventing git operations",
         {"Check your internet connection",
          "Verify the remote repository URL is correct",
          "Check if the remote host is reachable",
          "Try again in a few minutes"},
         5.0,
         3},
        {ErrorCategory::AUTHENTICATION,
         RecoveryAction::USER_ACTION_REQUIRED,
         "Authentication failed when accessing the remote repository. Please check your "
         "credentials.",
         "Git authentication failure",
         {"Verify your git credentials are configured",
          "For HTTPS remotes use a personal access token instead of a password",
          "For SSH remotes make sure your key is loaded and registered with the host",
          "Test access with: git ls-remote <remote-url>"},
         0.0,
         0},
        {ErrorCategory::REPOSITORY_ACCESS,
         RecoveryAction::USER_ACTION_REQUIRED,
         "Cannot access the remote repository. It may not exist or you may not have "
         "permission.",
         "Repository access denied or repository not found",
         {"Verify the repository URL is correct",
          "Check that the repository exists",
          "Ensure you have read and write access to the repository",
          "Create the repository on the hosting service if it does not exist yet"},
         0.0,
         1},
        {ErrorCategory::BRANCH_DETECTION,
         RecoveryAction::FALLBACK,
         "Could not determine the default branch. Using 'main' as the default.",
         "Branch detection failed, falling back to the default branch",
         {"Check that the remote repository has at least one branch",
          "Verify the default branch setting of the remote",
          "Push an initial commit if the remote repository is empty"},
         1.0,
         2},
        {ErrorCategory::MERGE_CONFLICT,
         RecoveryAction::FALLBACK,
         "Merge conflicts detected. Remote changes will take precedence.",
         "Merge conflict resolved by preferring remote content",
         {"Review conflicting memory files in the repository",
          "Local changes set aside during synchronization are kept in 'git stash list'",
          "Restore anything that was overridden by hand if needed"},
         0.0,
         1},
        {ErrorCategory::REPOSITORY_CORRUPTION,
         RecoveryAction::REINITIALIZE,
         "The local repository appears to be corrupted. It will be repaired or recreated.",
         "Git repository corruption detected",
         {"The repository will be checked and garbage collected",
          "If that does not help it will be reinitialized from the working files",
          "Memories already pushed to the remote are not affected"},
         0.0,
         1},
        {ErrorCategory::CONFIGURATION,
         RecoveryAction::USER_ACTION_REQUIRED,
         "Git configuration error. Please check your git settings.",
         "Invalid or missing git configuration",
         {"Check that git is installed and on PATH: git --version",
          "Verify the configured remote URL",
          "Set an identity if commits fail: git config --global user.name/user.email"},
         0.0,
         0},
        {ErrorCategory::UNKNOWN,
         RecoveryAction::USER_ACTION_REQUIRED,
         "An unexpected error occurred during git synchronization. Your memories are still "
         "saved locally.",
         "Unclassified git synchronization failure",
         {"Check the log file for details",
          "Run 'memsync validate' to check the repository",
          "Report the problem together with the technical details below"},
         0.0,
         0},
    };
    return table;
}

const ErrorResolution& resolution_for(ErrorCategory category) {
    const auto& table = error_resolutions();
    auto it = std::find_if(table.begin(), table.end(),
                           [category](const ErrorResolution& r) { return r.category == category; });
    if (it != table.end())
        return *it;
    return table.back();
}

bool ErrorRule::matches(const std::string& lowered) const {
    return lowered.find(pattern) != std::string::npos;
}

const std::vector<ErrorRule>& error_rules() {
    static const std::vector<ErrorRule> rules = {
        {"connection refused", ErrorCategory::NETWORK},
        {"network is unreachable", ErrorCategory::NETWORK},
        {"timeout", ErrorCategory::NETWORK},
        {"connection timed out", ErrorCategory::NETWORK},
        {"no route to host", ErrorCategory::NETWORK},
        {"temporary failure in name resolution", ErrorCategory::NETWORK},
        {"could not resolve host", ErrorCategory::NETWORK},

        {"authentication failed", ErrorCategory::AUTHENTICATION},
        {"permission denied", ErrorCategory::AUTHENTICATION},
        {"forbidden", ErrorCategory::AUTHENTICATION},
        {"invalid credentials", ErrorCategory::AUTHENTICATION},
        {"401", ErrorCategory::AUTHENTICATION},
        {"403", ErrorCategory::AUTHENTICATION},

        {"repository not found", ErrorCategory::REPOSITORY_ACCESS},
        {"remote repository does not exist", ErrorCategory::REPOSITORY_ACCESS},
        {"could not read from remote repository", ErrorCategory::REPOSITORY_ACCESS},
        {"not a git repository", ErrorCategory::REPOSITORY_CORRUPTION},

        {"branch does not exist", ErrorCategory::BRANCH_DETECTION},
        {"no such branch", ErrorCategory::BRANCH_DETECTION},
        {"unknown revision", ErrorCategory::BRANCH_DETECTION},
        {"ambiguous argument", ErrorCategory::BRANCH_DETECTION},

        {"automatic merge failed", ErrorCategory::MERGE_CONFLICT},
        {"merge conflict", ErrorCategory::MERGE_CONFLICT},
        {"unmerged paths", ErrorCategory::MERGE_CONFLICT},
        {"conflict", ErrorCategory::MERGE_CONFLICT},

        {"corrupt", ErrorCategory::REPOSITORY_CORRUPTION},
        {"broken", ErrorCategory::REPOSITORY_CORRUPTION},
        {"invalid object", ErrorCategory::REPOSITORY_CORRUPTION},
        {"loose object", ErrorCategory::REPOSITORY_CORRUPTION},
    };
    return rules;
}

static std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

ErrorCategory categorize_error(const std::string& message, const std::string& code) {
    const std::string msg = lowered(message);
    if (!msg.empty()) {
        for (const auto& rule : error_rules()) {
            if (rule.matches(msg))
                return rule.category;
        }
    }
    const std::string c = lowered(code);
    if (c.find("timeout") != std::string::npos)
        return ErrorCategory::NETWORK;
    if (c.find("auth") != std::string::npos || c.find("permission") != std::string::npos)
        return ErrorCategory::AUTHENTICATION;
    if (c.find("branch") != std::string::npos)
        return ErrorCategory::BRANCH_DETECTION;
    if (c.find("conflict") != std::string::npos)
        return ErrorCategory::MERGE_CONFLICT;
    return ErrorCategory::UNKNOWN;
}

} // namespace memsync
