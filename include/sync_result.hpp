#ifndef MEMSYNC_SYNC_RESULT_HPP
#define MEMSYNC_SYNC_RESULT_HPP

#include <optional>
#include <string>

namespace memsync {

/**
 * @brief Relationship between the local repository and its remote.
 */
enum class RepositoryState { NEW_LOCAL, EXISTING_LOCAL, EXISTING_REMOTE, SYNCHRONIZED };

/// Lower-case name, e.g. `existing_remote`.
const char* to_string(RepositoryState state);

/**
 * @brief Snapshot of what was observed about the repository pair.
 */
struct RepositoryInfo {
    RepositoryState state = RepositoryState::NEW_LOCAL;
    bool local_exists = false;
    bool remote_exists = false;
    std::optional<std::string> remote_url;
    std::string default_branch = "main";
    std::optional<std::string> local_branch;
    bool tracking_configured = false;
    bool needs_sync = false;
};

/**
 * @brief Pure mapping from observations to a @ref RepositoryState.
 *
 * | local | remote | tracking | needs_sync | state           |
 * |-------|--------|----------|------------|-----------------|
 * | no    | no     | -        | -          | NEW_LOCAL       |
 * | no    | yes    | -        | -          | EXISTING_REMOTE |
 * | yes   | -      | no       | -          | EXISTING_LOCAL  |
 * | yes   | -      | -        | yes        | EXISTING_LOCAL  |
 * | yes   | -      | yes      | no         | SYNCHRONIZED    |
 */
RepositoryState classify_repository(bool local_exists, bool remote_exists,
                                    bool tracking_configured, bool needs_sync);

/**
 * @brief Immutable outcome of every engine operation.
 *
 * A failed result always carries an error code; a successful one never does.
 * Results are created through @ref ok and @ref failure and never modified
 * afterwards; the `with_*` helpers return annotated copies.
 */
class SyncResult {
  public:
    static SyncResult ok(std::string message, std::string operation, int attempts = 1);
    static SyncResult failure(std::string message, std::string operation, std::string error_code,
                              int attempts = 1);

    bool success() const { return success_; }
    const std::string& message() const { return message_; }
    const std::string& operation() const { return operation_; }
    int attempts() const { return attempts_; }
    const std::optional<std::string>& error_code() const { return error_code_; }
    const std::optional<RepositoryInfo>& repository_info() const { return repository_info_; }
    const std::optional<std::string>& branch_used() const { return branch_used_; }

    SyncResult with_repository_info(RepositoryInfo info) const;
    SyncResult with_branch(std::string branch) const;

  private:
    SyncResult(bool success, std::string message, std::string operation, int attempts,
               std::optional<std::string> error_code);

    bool success_;
    std::string message_;
    std::string operation_;
    int attempts_;
    std::optional<std::string> error_code_;
    std::optional<RepositoryInfo> repository_info_;
    std::optional<std::string> branch_used_;
};

} // namespace memsync

#endif // MEMSYNC_SYNC_RESULT_HPP
