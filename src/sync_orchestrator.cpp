#include "sync_orchestrator.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <utility>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace memsync {

static bool safe_relative(const std::string& filename) {
    if (filename.empty())
        return false;
    fs::path p(filename);
    if (p.is_absolute() || p.has_root_name())
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

SyncOrchestrator::SyncOrchestrator(const SyncConfig& config, const CommandExecutor& executor,
                                   RepositoryStateManager& state, const RecoveryEngine& recovery,
                                   PerformanceMonitor& monitor,
                                   RepositoryInitializer& initializer, CompletionHook on_complete)
    : config_(config), executor_(executor), state_(state), recovery_(recovery),
      monitor_(monitor), initializer_(initializer), on_complete_(std::move(on_complete)),
      queue_(config.max_pending_syncs) {}

SyncResult SyncOrchestrator::perform_sync(const std::string& memory_id,
                                          const std::string& filename) {
    const std::string op = "sync memory";
    ScopedOperationTimer timer(monitor_, op);
    try {
        if (!safe_relative(filename))
            return SyncResult::failure("Invalid memory filename '" + filename + "'", op,
                                       "INVALID_MEMORY_FILENAME");
        if (!initializer_.is_initialized()) {
            SyncResult init = initializer_.initialize();
            if (!init.success())
                return init;
        }
        const fs::path& dir = config_.repo_dir;
        const std::string rel = (fs::path(config_.files_subdir) / filename).generic_string();

        SyncResult add = executor_.run({"git", "add", "--", rel}, "stage memory", dir,
                                       config_.retry_attempts, config_.retry_delay);
        if (!add.success())
            return add;
        SyncResult commit = executor_.run({"git", "commit", "-m", "Add memory " + memory_id},
                                          "commit memory", dir, config_.retry_attempts,
                                          config_.retry_delay);
        if (!commit.success())
            return commit;
        int attempts = std::max(add.attempts(), commit.attempts());

        if (!config_.remote_url) {
            timer.set_success(true);
            return SyncResult::ok("Memory " + memory_id + " committed to Git locally", op,
                                  attempts);
        }
        const std::string branch = state_.get_default_branch();
        SyncResult push = executor_.run({"git", "push", "origin", branch}, "push memory", dir,
                                        config_.retry_attempts, config_.retry_delay,
                                        kPushTimeout);
        attempts = std::max(attempts, push.attempts());
        timer.set_success(true);
        if (!push.success()) {
            log_warning("Push failed, memory kept in local commit",
                        {{"memory_id", memory_id}, {"error", push.error_code().value_or("")}});
            return SyncResult::ok("Memory " + memory_id + " committed locally (push failed: " +
                                      push.message() + ")",
                                  op, attempts)
                .with_branch(branch);
        }
        return SyncResult::ok("Memory " + memory_id + " synced to Git and pushed to remote", op,
                              attempts)
            .with_branch(branch);
    } catch (const std::exception& e) {
        return recovery_.handle_error(e.what(), op, "GIT_SYNC_UNEXPECTED_ERROR",
                                      {{"memory_id", memory_id}, {"filename", filename}});
    }
}

SyncQueue::Task SyncOrchestrator::make_task(const std::string& memory_id,
                                            const std::string& filename, bool background) {
    return [this, memory_id, filename, background]() {
        SyncResult r = perform_sync(memory_id, filename);
        if (r.success())
            log_info(background ? "Background sync finished" : "Sync finished",
                     {{"memory_id", memory_id}, {"result", r.message()}});
        else
            log_error(background ? "Background sync failed" : "Sync failed",
                      {{"memory_id", memory_id},
                       {"error", r.error_code().value_or("")},
                       {"message", r.message()}});
        if (on_complete_)
            on_complete_(r);
        return r;
    };
}

SyncResult SyncOrchestrator::run_serialized(const std::string& label, SyncQueue::Task task) {
    if (queue_.on_worker_thread())
        return task();
    return queue_.enqueue(label, std::move(task)).get();
}

SyncResult SyncOrchestrator::sync_memory_with_retry(const std::string& memory_id,
                                                    const std::string& filename) {
    if (!config_.enable_sync)
        return SyncResult::failure("Git sync is disabled", "sync memory", "GIT_SYNC_DISABLED");
    return run_serialized("sync " + memory_id, make_task(memory_id, filename, false));
}

std::future<SyncResult> SyncOrchestrator::sync_memory_background(const std::string& memory_id,
                                                                 const std::string& filename) {
    if (!config_.enable_sync) {
        log_debug("Git sync disabled, background sync skipped", {{"memory_id", memory_id}});
        return {};
    }
    log_debug("Queueing background sync", {{"memory_id", memory_id}, {"file", filename}});
    return queue_.try_enqueue("sync " + memory_id, make_task(memory_id, filename, true));
}

} // namespace memsync
