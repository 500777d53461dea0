#ifndef MEMSYNC_REPOSITORY_STATE_HPP
#define MEMSYNC_REPOSITORY_STATE_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "branch_detector.hpp"
#include "command_executor.hpp"
#include "sync_config.hpp"
#include "sync_result.hpp"

namespace memsync {

/**
 * @brief Observes and reshapes the local repository relative to `origin`.
 *
 * Detection results are cached until @ref clear_cache; every method that
 * changes the repository clears the cache itself. Local queries go through
 * libgit2, anything touching the network or the working tree runs the git
 * executable through @ref CommandExecutor.
 */
class RepositoryStateManager {
  public:
    RepositoryStateManager(SyncConfig config, const CommandExecutor& executor,
                           const BranchDetector& detector);

    /**
     * @brief Cached snapshot of the local/remote pair.
     */
    RepositoryInfo get_repository_info();

    /// Forget the cached snapshot.
    void clear_cache();

    /// Default branch from the cached snapshot.
    std::string get_default_branch();

    /**
     * @brief Clone the configured remote into the repository directory.
     *
     * Hidden entries and `README*`/`LICENSE*` files already in the directory
     * are moved aside during the clone and put back afterwards unless the
     * clone brought a file with the same name.
     */
    SyncResult clone_existing_repository();

    /**
     * @brief Make @p branch exist locally and track `origin/<branch>`.
     */
    SyncResult setup_upstream_tracking(const std::string& branch);

    /**
     * @brief Bring the local default branch up to date with the remote.
     *
     * Nothing is touched when the local branch is not behind. Otherwise the
     * remote branch is merged and conflicts are resolved with the remote
     * version. Uncommitted changes are stashed only when they block the merge
     * and are restored afterwards; whatever collides with remote content stays
     * in the stash. The message lists whatever was set aside or overridden.
     */
    SyncResult synchronize_with_remote();

    /**
     * @brief Point `origin` at the configured URL when it is missing or different.
     */
    SyncResult configure_remote();

    /**
     * @brief Set `user.name`/`user.email` in the local config when not already visible.
     */
    SyncResult ensure_identity();

    const SyncConfig& config() const { return config_; }

  private:
    RepositoryInfo detect();
    std::optional<std::string> list_remote_heads(const std::string& url);
    SyncResult checkout_branch(const std::string& branch, bool force);
    SyncResult resolve_conflicts_with_remote(const std::vector<std::string>& files,
                                             const std::string& branch);
    SyncResult merge_remote(const std::string& branch);
    std::vector<std::string> unmerged_files();
    void restore_stashed_changes(std::vector<std::string>& notes);

    SyncConfig config_;
    const CommandExecutor& executor_;
    const BranchDetector& detector_;
    std::mutex mtx_;
    std::optional<RepositoryInfo> cache_;
};

/**
 * @brief Tip id of `refs/heads/<branch>` in `git ls-remote --heads` output.
 */
std::optional<std::string> find_remote_head(const std::string& ls_remote_output,
                                            const std::string& branch);

} // namespace memsync

#endif // MEMSYNC_REPOSITORY_STATE_HPP
