#ifndef MEMSYNC_SYNC_CONFIG_HPP
#define MEMSYNC_SYNC_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace memsync {

/**
 * @brief Settings that drive the synchronization engine.
 */
struct SyncConfig {
    bool enable_sync = true;
    std::optional<std::string> remote_url;
    int retry_attempts = 3;   ///< Per command, at least 1
    double retry_delay = 1.0; ///< Backoff base in seconds
    std::filesystem::path repo_dir;
    std::string files_subdir = "files"; ///< Memory files live under repo_dir/files_subdir
    std::string user_name = "memsync";
    std::string user_email = "memsync@localhost";
    size_t max_pending_syncs = 64; ///< Background requests allowed to wait
};

/**
 * @brief `$HOME/.memsync`, or `.memsync` in the working directory when no
 *        home directory is known.
 */
std::filesystem::path default_repo_dir();

/**
 * @brief Lexically normalized @p dir without a trailing separator.
 *
 * `~/.memsync/` and `~/.memsync` name the same repository; only the second
 * form has a filename, which clone backups are named after.
 */
std::filesystem::path normalize_repo_dir(const std::filesystem::path& dir);

/**
 * @brief Check value ranges and required fields.
 *
 * @param error Receives a description of the first problem found.
 * @return `true` when @p cfg can be used.
 */
bool validate_config(const SyncConfig& cfg, std::string& error);

} // namespace memsync

#endif // MEMSYNC_SYNC_CONFIG_HPP
