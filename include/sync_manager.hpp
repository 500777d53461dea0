#ifndef MEMSYNC_SYNC_MANAGER_HPP
#define MEMSYNC_SYNC_MANAGER_HPP

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "branch_detector.hpp"
#include "command_executor.hpp"
#include "error_recovery.hpp"
#include "git_utils.hpp"
#include "performance_monitor.hpp"
#include "process_runner.hpp"
#include "repository_state.hpp"
#include "sync_config.hpp"
#include "sync_orchestrator.hpp"
#include "sync_result.hpp"

namespace memsync {

/**
 * @brief Collaborators a @ref SyncManager can be given instead of the defaults.
 */
struct SyncDependencies {
    std::shared_ptr<procutil::ProcessRunner> runner;  ///< Default: SubprocessRunner
    Sleeper sleeper;                                  ///< Default: thread_sleeper()
    std::shared_ptr<PerformanceMonitor> monitor;      ///< Default: NullPerformanceMonitor
};

/**
 * @brief Health summary reported by @ref SyncManager::get_repository_status.
 */
struct RepositoryStatus {
    bool initialized = false;
    bool sync_enabled = false;
    bool repository_exists = false;
    bool remote_configured = false;
    std::string remote_url;
    std::optional<std::string> actual_remote_url; ///< `origin` as configured in the repository
    std::optional<std::string> last_error;
};

/**
 * @brief Entry point of the synchronization engine for one repository.
 *
 * Construction prepares the repository according to its detected state:
 *  - NEW_LOCAL: create it, set identity and the remote
 *  - EXISTING_REMOTE: clone, then set up upstream tracking
 *  - EXISTING_LOCAL: fix the remote, pull remote changes, set up tracking
 *  - SYNCHRONIZED: only point `origin` at the configured URL
 *
 * Problems during preparation are logged and remembered as the last error;
 * the constructor itself does not throw because of them. Everything that
 * touches the repository runs on the orchestrator's queue.
 */
class SyncManager : public RepositoryInitializer {
  public:
    explicit SyncManager(SyncConfig config, SyncDependencies deps = {});

    bool is_initialized() const override;

    /**
     * @brief Run the state-driven preparation again.
     */
    SyncResult initialize() override;

    SyncResult sync_memory_with_retry(const std::string& memory_id, const std::string& filename);

    std::future<SyncResult> sync_memory_background(const std::string& memory_id,
                                                   const std::string& filename);

    /// Never fails; missing pieces are reported as `false` or empty.
    RepositoryStatus get_repository_status() const;

    /// Freshly detected repository information, detected on the sync queue.
    RepositoryInfo repository_info();

    /**
     * @brief Categorize @p failed and run the matching recovery.
     *
     * Corruption repairs the repository and prepares it again; every other
     * recoverable category clears cached state and prepares it again.
     */
    SyncResult recover_from_error(const SyncResult& failed);

    /**
     * @brief Check repository integrity and repair it when the check fails.
     */
    SyncResult validate_and_recover();

    /// Block until queued syncs are done.
    void wait_idle() { orchestrator_.wait_idle(); }

    const SyncConfig& config() const { return config_; }
    const RecoveryEngine& recovery() const { return recovery_; }

  private:
    SyncResult do_initialize();
    SyncResult initialize_new_local(const RepositoryInfo& info, std::vector<std::string>& notes);
    SyncResult initialize_existing_remote(const RepositoryInfo& info,
                                          std::vector<std::string>& notes);
    SyncResult initialize_existing_local(const RepositoryInfo& info,
                                         std::vector<std::string>& notes);
    std::vector<std::string> validate_git_configuration() const;
    SyncResult repair_corruption();
    void record_outcome(const SyncResult& result);
    void set_initialized(bool value);

    SyncConfig config_;
    git::GitInitGuard git_guard_;
    std::shared_ptr<procutil::ProcessRunner> runner_;
    std::shared_ptr<PerformanceMonitor> monitor_;
    CommandExecutor executor_;
    BranchDetector detector_;
    RepositoryStateManager state_;
    RecoveryEngine recovery_;
    mutable std::mutex mtx_;
    bool initialized_ = false;
    std::optional<std::string> last_error_;
    // Declared last: its queue drains before the members above go away.
    SyncOrchestrator orchestrator_;
};

} // namespace memsync

#endif // MEMSYNC_SYNC_MANAGER_HPP
