#include "error_recovery.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <system_error>
#include <utility>
#include "git_utils.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace memsync {

static std::string upper(const char* s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

RecoveryEngine::RecoveryEngine(fs::path repo_dir, const CommandExecutor& executor,
                               Sleeper sleeper)
    : repo_dir_(std::move(repo_dir)), executor_(executor), sleeper_(std::move(sleeper)) {
    if (!sleeper_)
        sleeper_ = thread_sleeper();
}

SyncResult RecoveryEngine::handle_error(const std::string& message, const std::string& operation,
                                        const std::string& code, const Context& context) const {
    const ErrorCategory category = categorize(message, code);
    const ErrorResolution& res = resolution_for(category);
    log_error("Git sync error in " + operation,
              {{"category", to_string(category)},
               {"action", to_string(res.action)},
               {"code", code.empty() ? "ERROR" : code},
               {"error", message}});

    std::string text = res.user_message;
    if (!res.resolution_steps.empty()) {
        text += "\n\nWhat you can do:";
        for (size_t i = 0; i < res.resolution_steps.size(); ++i)
            text += "\n  " + std::to_string(i + 1) + ". " + res.resolution_steps[i];
    }
    if (res.action == RecoveryAction::RETRY && res.max_retries > 0)
        text += "\n\nThis operation will be retried automatically (up to " +
                std::to_string(res.max_retries) + " times).";
    text += "\n\nTechnical details:";
    text += "\n  Error: " + res.technical_message;
    text += "\n  Category: " + std::string(to_string(category));
    text += "\n  Action: " + std::string(to_string(res.action));
    text += "\n  Message: " + message;
    for (const auto& [k, v] : context)
        text += "\n  " + k + ": " + v;

    const std::string error_code =
        upper(to_string(category)) + "_" + (code.empty() ? std::string("ERROR") : code);
    return SyncResult::failure(text, operation, error_code);
}

SyncResult RecoveryEngine::attempt_recovery(ErrorCategory category,
                                            const std::function<SyncResult()>& recover,
                                            const Context& context) const {
    const ErrorResolution& res = resolution_for(category);
    const std::string op = std::string("recover ") + to_string(category);
    if (res.action == RecoveryAction::USER_ACTION_REQUIRED) {
        log_warning("Recovery requires user action", {{"category", to_string(category)}});
        return SyncResult::failure(res.user_message, op, "USER_ACTION_REQUIRED");
    }
    if (res.action == RecoveryAction::ABORT)
        return SyncResult::failure("Operation aborted: " + res.user_message, op,
                                   "OPERATION_ABORTED");

    const int total = res.max_retries + 1;
    std::string last_error;
    for (int attempt = 1; attempt <= total; ++attempt) {
        if (attempt > 1)
            sleeper_(seconds_to_ms(res.retry_delay));
        Context fields = context;
        fields["category"] = to_string(category);
        fields["attempt"] = std::to_string(attempt) + "/" + std::to_string(total);
        log_info("Attempting recovery", fields);
        try {
            SyncResult r = recover();
            if (r.success()) {
                log_info("Recovery succeeded", fields);
                return SyncResult::ok(r.message(), op, attempt);
            }
            last_error = r.message();
        } catch (const std::exception& e) {
            last_error = e.what();
            fields["error"] = last_error;
            log_error("Recovery attempt raised", fields);
        }
    }
    return SyncResult::failure("Recovery failed after " + std::to_string(total) + " attempts" +
                                   (last_error.empty() ? "" : ": " + last_error),
                               op, "RECOVERY_FAILED", total);
}

SyncResult RecoveryEngine::validate_repository_integrity() const {
    const std::string op = "integrity check";
    std::error_code ec;
    if (!fs::exists(repo_dir_ / ".git", ec))
        return SyncResult::failure("No git repository found in " + repo_dir_.string(), op,
                                   "NO_REPOSITORY");
    SyncResult r = executor_.run({"git", "fsck", "--no-progress"}, op, repo_dir_, 1, 0.0,
                                 kDefaultCommandTimeout);
    if (r.success())
        return SyncResult::ok("Repository integrity check passed", op);
    const std::string code = r.error_code().value_or("");
    if (code == "GIT_COMMAND_TIMEOUT")
        return SyncResult::failure("Repository integrity check timeout: " + r.message(), op,
                                   "INTEGRITY_TIMEOUT");
    if (code == "GIT_COMMAND_FAILED")
        return SyncResult::failure(
            "Repository integrity issues detected, repository may be corrupt: " + r.message(), op,
            "INTEGRITY_FAILED");
    return SyncResult::failure("Repository integrity check error: " + r.message(), op,
                               "INTEGRITY_ERROR");
}

SyncResult RecoveryEngine::recover_corrupted_repository(const std::string& default_branch) const {
    const std::string op = "corruption recovery";
    std::error_code ec;
    const fs::path git_dir = repo_dir_ / ".git";
    if (fs::exists(git_dir, ec)) {
        SyncResult gc = executor_.run({"git", "gc", "--prune=now"}, "gc", repo_dir_, 1, 0.0,
                                      kGcTimeout);
        if (gc.success() && validate_repository_integrity().success()) {
            log_info("Repository repaired by garbage collection");
            return SyncResult::ok("Repository corruption repaired successfully", op);
        }
        log_warning("Repository still corrupted after gc, reinitializing",
                    {{"repo", repo_dir_.string()}});
        fs::remove_all(git_dir, ec);
        if (ec)
            return SyncResult::failure("Could not remove corrupted repository metadata: " +
                                           ec.message(),
                                       op, "CORRUPTION_RECOVERY_FAILED");
    }
    SyncResult init = executor_.run_operation(
        [&](std::string& err) { return git::init_repo(repo_dir_, default_branch, &err); },
        "reinitialize");
    if (!init.success())
        return SyncResult::failure("Repository reinitialization failed: " + init.message(), op,
                                   "CORRUPTION_RECOVERY_FAILED");
    log_warning("Repository reinitialized after corruption", {{"branch", default_branch}});
    return SyncResult::ok("Repository reinitialized after corruption; local history was "
                          "discarded, working files were preserved",
                          op);
}

} // namespace memsync
