#ifndef MEMSYNC_SYNC_ORCHESTRATOR_HPP
#define MEMSYNC_SYNC_ORCHESTRATOR_HPP

#include <functional>
#include <future>
#include <string>
#include "command_executor.hpp"
#include "error_recovery.hpp"
#include "performance_monitor.hpp"
#include "repository_state.hpp"
#include "sync_config.hpp"
#include "sync_queue.hpp"
#include "sync_result.hpp"

namespace memsync {

/**
 * @brief Lazily prepares the repository before the first sync.
 */
class RepositoryInitializer {
  public:
    virtual ~RepositoryInitializer() = default;
    virtual bool is_initialized() const = 0;
    virtual SyncResult initialize() = 0;
};

/**
 * @brief Stages, commits and pushes single memory files.
 *
 * Every sync, blocking or not, runs on the orchestrator's @ref SyncQueue so
 * add/commit/push sequences never interleave.
 */
class SyncOrchestrator {
  public:
    using CompletionHook = std::function<void(const SyncResult&)>;

    SyncOrchestrator(const SyncConfig& config, const CommandExecutor& executor,
                     RepositoryStateManager& state, const RecoveryEngine& recovery,
                     PerformanceMonitor& monitor, RepositoryInitializer& initializer,
                     CompletionHook on_complete = {});

    /**
     * @brief Sync one memory file and wait for the outcome.
     *
     * A failed push still reports success, with a message saying the memory
     * was only committed locally.
     */
    SyncResult sync_memory_with_retry(const std::string& memory_id, const std::string& filename);

    /**
     * @brief Queue a sync and return immediately.
     *
     * @return Future for the outcome; invalid (`valid() == false`) when sync is
     *         disabled. The outcome is logged whether or not the caller keeps
     *         the future.
     */
    std::future<SyncResult> sync_memory_background(const std::string& memory_id,
                                                   const std::string& filename);

    /**
     * @brief Run @p task on the sync queue and wait for it.
     *
     * Runs inline when already on the queue's worker thread.
     */
    SyncResult run_serialized(const std::string& label, SyncQueue::Task task);

    /// Block until every queued sync has finished.
    void wait_idle() { queue_.wait_idle(); }

    size_t pending() const { return queue_.pending(); }

  private:
    SyncResult perform_sync(const std::string& memory_id, const std::string& filename);
    SyncQueue::Task make_task(const std::string& memory_id, const std::string& filename,
                              bool background);

    const SyncConfig& config_;
    const CommandExecutor& executor_;
    RepositoryStateManager& state_;
    const RecoveryEngine& recovery_;
    PerformanceMonitor& monitor_;
    RepositoryInitializer& initializer_;
    CompletionHook on_complete_;
    SyncQueue queue_;
};

} // namespace memsync

#endif // MEMSYNC_SYNC_ORCHESTRATOR_HPP
