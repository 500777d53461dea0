#include "sync_result.hpp"
#include <utility>

namespace memsync {

const char* to_string(RepositoryState state) {
    switch (state) {
    case RepositoryState::NEW_LOCAL:
        return "new_local";
    case RepositoryState::EXISTING_LOCAL:
        return "existing_local";
    case RepositoryState::EXISTING_REMOTE:
        return "existing_remote";
    case RepositoryState::SYNCHRONIZED:
        return "synchronized";
    }
    return "new_local";
}

RepositoryState classify_repository(bool local_exists, bool remote_exists,
                                    bool tracking_configured, bool needs_sync) {
    if (!local_exists)
        return remote_exists ? RepositoryState::EXISTING_REMOTE : RepositoryState::NEW_LOCAL;
    if (!tracking_configured || needs_sync)
        return RepositoryState::EXISTING_LOCAL;
    return RepositoryState::SYNCHRONIZED;
}

SyncResult::SyncResult(bool success, std::string message, std::string operation, int attempts,
                       std::optional<std::string> error_code)
    : success_(success), message_(std::move(message)), operation_(std::move(operation)),
      attempts_(attempts < 1 ? 1 : attempts), error_code_(std::move(error_code)) {}

SyncResult SyncResult::ok(std::string message, std::string operation, int attempts) {
    return SyncResult(true, std::move(message), std::move(operation), attempts, std::nullopt);
}

SyncResult SyncResult::failure(std::string message, std::string operation,
                               std::string error_code, int attempts) {
    if (error_code.empty())
        error_code = "UNKNOWN_ERROR";
    return SyncResult(false, std::move(message), std::move(operation), attempts,
                      std::move(error_code));
}

SyncResult SyncResult::with_repository_info(RepositoryInfo info) const {
    SyncResult copy = *this;
    copy.repository_info_ = std::move(info);
    return copy;
}

SyncResult SyncResult::with_branch(std::string branch) const {
    SyncResult copy = *this;
    copy.branch_used_ = std::move(branch);
    return copy;
}

} // namespace memsync
