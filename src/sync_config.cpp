#include "sync_config.hpp"
#include <cstdlib>

namespace memsync {

std::filesystem::path default_repo_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home)
        return std::filesystem::path(home) / ".memsync";
    return std::filesystem::path(".memsync");
}

std::filesystem::path normalize_repo_dir(const std::filesystem::path& dir) {
    if (dir.empty())
        return dir;
    std::filesystem::path out = dir.lexically_normal();
    if (!out.has_filename() && out.has_relative_path())
        out = out.parent_path();
    return out;
}

bool validate_config(const SyncConfig& cfg, std::string& error) {
    if (cfg.retry_attempts < 1) {
        error = "retry attempts must be at least 1";
        return false;
    }
    if (cfg.retry_delay < 0.0) {
        error = "retry delay must not be negative";
        return false;
    }
    if (cfg.repo_dir.empty()) {
        error = "repository directory is not set";
        return false;
    }
    if (cfg.files_subdir.empty() || std::filesystem::path(cfg.files_subdir).is_absolute()) {
        error = "files directory must be a relative path";
        return false;
    }
    if (cfg.remote_url && cfg.remote_url->empty()) {
        error = "remote URL is empty";
        return false;
    }
    if (cfg.max_pending_syncs < 1) {
        error = "max pending syncs must be at least 1";
        return false;
    }
    if (cfg.user_name.empty() || cfg.user_email.empty()) {
        error = "commit identity requires a name and an email";
        return false;
    }
    return true;
}

} // namespace memsync
