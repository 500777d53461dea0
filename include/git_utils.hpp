#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference counts initialization, so nested guards are safe. Every
 * function in this namespace must run while at least one guard is alive.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using config_ptr = GitHandle<git_config, git_config_free>;

/**
 * @brief Determine whether @p p is the working directory of a repository.
 *
 * Parent directories are not searched, so a plain folder nested inside some
 * other checkout is reported as not being a repository.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Create a repository in @p path with @p initial_branch as unborn HEAD.
 *
 * @param path           Working directory; created when missing.
 * @param initial_branch Branch name HEAD will point to.
 * @param error          Optional output string receiving a libgit2 error message.
 * @return `true` on success.
 */
bool init_repo(const fs::path& path, const std::string& initial_branch,
               std::string* error = nullptr);

/**
 * @brief Get the commit id pointed to by `HEAD`.
 *
 * @return 40 character hexadecimal id or `std::nullopt` when HEAD is unborn
 *         or on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Resolve a full reference name (e.g. `refs/remotes/origin/main`) to an id.
 */
std::optional<std::string> get_ref_hash(const fs::path& repo, const std::string& refname,
                                        std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * An unborn HEAD (fresh repository without commits) still reports the branch
 * it points to.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/// @return `true` if `refs/heads/<branch>` exists.
bool local_branch_exists(const fs::path& repo, const std::string& branch);

/**
 * @brief Obtain the URL of the specified remote.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Create @p remote with @p url, or update its URL when it already exists.
 */
bool set_remote_url(const fs::path& repo, const std::string& remote, const std::string& url,
                    std::string* error = nullptr);

/**
 * @brief Read a configuration value visible to the repository.
 *
 * Looks through every level (local, global, system) like `git config <key>`.
 */
std::optional<std::string> get_config_value(const fs::path& repo, const std::string& key,
                                            std::string* error = nullptr);

/**
 * @brief Write a value into the repository-local configuration.
 */
bool set_config_value(const fs::path& repo, const std::string& key, const std::string& value,
                      std::string* error = nullptr);

/**
 * @brief Check whether `branch.<branch>.remote` and `branch.<branch>.merge` are set.
 */
bool has_upstream(const fs::path& repo, const std::string& branch);

/**
 * @brief Make @p branch track `<remote>/<branch>`.
 *
 * The remote-tracking reference must already exist (fetch first).
 */
bool set_upstream(const fs::path& repo, const std::string& branch, const std::string& remote,
                  std::string* error = nullptr);

/**
 * @brief Check if there are uncommitted changes, untracked files included.
 */
bool has_uncommitted_changes(const fs::path& repo);

/**
 * @brief Count commits unique to each side of HEAD and @p refname.
 *
 * @return `false` if either side cannot be resolved.
 */
bool ahead_behind(const fs::path& repo, const std::string& refname, size_t& ahead,
                  size_t& behind, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
