#include "sync_manager.hpp"
#include <exception>
#include <optional>
#include <system_error>
#include <utility>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace memsync {

static std::shared_ptr<procutil::ProcessRunner>
runner_or_default(std::shared_ptr<procutil::ProcessRunner> runner) {
    if (runner)
        return runner;
    return std::make_shared<procutil::SubprocessRunner>();
}

static std::shared_ptr<PerformanceMonitor>
monitor_or_default(std::shared_ptr<PerformanceMonitor> monitor) {
    if (monitor)
        return monitor;
    return std::make_shared<NullPerformanceMonitor>();
}

static Sleeper sleeper_or_default(Sleeper sleeper) {
    return sleeper ? std::move(sleeper) : thread_sleeper();
}

static std::string with_notes(const std::string& message, const std::vector<std::string>& notes) {
    std::string out = message;
    for (const auto& n : notes)
        out += "; " + n;
    return out;
}

static SyncConfig normalized(SyncConfig config) {
    config.repo_dir = normalize_repo_dir(config.repo_dir);
    return config;
}

SyncManager::SyncManager(SyncConfig config, SyncDependencies deps)
    : config_(normalized(std::move(config))), runner_(runner_or_default(std::move(deps.runner))),
      monitor_(monitor_or_default(std::move(deps.monitor))),
      executor_(runner_, sleeper_or_default(deps.sleeper)), detector_(runner_),
      state_(config_, executor_, detector_),
      recovery_(config_.repo_dir, executor_, sleeper_or_default(deps.sleeper)),
      orchestrator_(config_, executor_, state_, recovery_, *monitor_, *this,
                    [this](const SyncResult& r) { record_outcome(r); }) {
    if (!config_.enable_sync) {
        log_info("Git sync disabled");
        set_initialized(true);
        return;
    }
    SyncResult r = initialize();
    if (r.success())
        log_info("Git sync ready", {{"repo", config_.repo_dir.string()}, {"result", r.message()}});
    else
        log_error("Git sync initialization failed",
                  {{"error", r.error_code().value_or("")}, {"message", r.message()}});
}

bool SyncManager::is_initialized() const {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!initialized_)
            return false;
    }
    return !config_.enable_sync || git::is_git_repo(config_.repo_dir);
}

void SyncManager::set_initialized(bool value) {
    std::lock_guard<std::mutex> lk(mtx_);
    initialized_ = value;
}

void SyncManager::record_outcome(const SyncResult& result) {
    if (result.success())
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    last_error_ = result.error_code().value_or("") + ": " + result.message();
}

SyncResult SyncManager::initialize() {
    if (!config_.enable_sync) {
        set_initialized(true);
        return SyncResult::ok("Git sync is disabled", "initialize");
    }
    SyncResult r = orchestrator_.run_serialized("initialize", [this]() { return do_initialize(); });
    record_outcome(r);
    return r;
}

SyncResult SyncManager::initialize_new_local(const RepositoryInfo& info,
                                             std::vector<std::string>& notes) {
    const std::string op = "initialize";
    const fs::path dir = config_.repo_dir;
    const std::string branch = info.default_branch;
    SyncResult init = executor_.run_operation(
        [&dir, &branch](std::string& err) { return git::init_repo(dir, branch, &err); },
        "create repository");
    if (!init.success())
        return SyncResult::failure(init.message(), op, "GIT_INIT_FAILED", init.attempts());
    log_info("Created repository", {{"repo", dir.string()}, {"branch", branch}});

    SyncResult identity = state_.ensure_identity();
    if (!identity.success())
        notes.push_back(identity.message());
    if (config_.remote_url) {
        SyncResult remote = state_.configure_remote();
        if (!remote.success())
            notes.push_back(remote.message());
    }
    return SyncResult::ok("Initialized new repository", op);
}

SyncResult SyncManager::initialize_existing_remote(const RepositoryInfo& info,
                                                   std::vector<std::string>& notes) {
    SyncResult clone = state_.clone_existing_repository();
    if (!clone.success())
        return clone;
    SyncResult identity = state_.ensure_identity();
    if (!identity.success())
        notes.push_back(identity.message());
    SyncResult tracking = state_.setup_upstream_tracking(info.default_branch);
    if (!tracking.success()) {
        log_warning("Upstream tracking not configured",
                    {{"error", tracking.error_code().value_or("")}});
        notes.push_back(tracking.message());
    }
    return SyncResult::ok("Cloned existing remote repository", "initialize", clone.attempts());
}

SyncResult SyncManager::initialize_existing_local(const RepositoryInfo& info,
                                                  std::vector<std::string>& notes) {
    SyncResult identity = state_.ensure_identity();
    if (!identity.success())
        notes.push_back(identity.message());
    if (config_.remote_url) {
        SyncResult remote = state_.configure_remote();
        if (!remote.success())
            notes.push_back(remote.message());
    }
    if (info.remote_exists && info.needs_sync) {
        SyncResult sync = state_.synchronize_with_remote();
        if (sync.success()) {
            notes.push_back(sync.message());
        } else {
            log_warning("Synchronization with remote failed",
                        {{"error", sync.error_code().value_or("")}, {"message", sync.message()}});
            notes.push_back(sync.message());
        }
    }
    if (info.remote_exists && !git::has_upstream(config_.repo_dir, info.default_branch)) {
        SyncResult tracking = state_.setup_upstream_tracking(info.default_branch);
        if (!tracking.success())
            notes.push_back(tracking.message());
    }
    return SyncResult::ok("Using existing local repository", "initialize");
}

SyncResult SyncManager::do_initialize() {
    const std::string op = "initialize";
    try {
        std::error_code ec;
        fs::create_directories(config_.repo_dir, ec);
        if (ec)
            return SyncResult::failure("Cannot create repository directory " +
                                           config_.repo_dir.string() + ": " + ec.message(),
                                       op, "REPO_DIR_UNAVAILABLE");

        state_.clear_cache();
        const RepositoryInfo info = state_.get_repository_info();
        log_info("Preparing repository", {{"state", to_string(info.state)},
                                          {"branch", info.default_branch},
                                          {"repo", config_.repo_dir.string()}});

        std::vector<std::string> notes;
        std::optional<SyncResult> step;
        switch (info.state) {
        case RepositoryState::NEW_LOCAL:
            step = initialize_new_local(info, notes);
            break;
        case RepositoryState::EXISTING_REMOTE:
            step = initialize_existing_remote(info, notes);
            break;
        case RepositoryState::EXISTING_LOCAL:
            step = initialize_existing_local(info, notes);
            break;
        case RepositoryState::SYNCHRONIZED:
            if (config_.remote_url) {
                SyncResult remote = state_.configure_remote();
                if (!remote.success())
                    notes.push_back(remote.message());
            }
            step = SyncResult::ok("Repository already synchronized", op);
            break;
        }
        if (!step->success())
            return *step;

        fs::create_directories(config_.repo_dir / config_.files_subdir, ec);
        if (ec)
            notes.push_back("cannot create " + config_.files_subdir + ": " + ec.message());
        for (const auto& w : validate_git_configuration()) {
            log_warning(w);
            notes.push_back(w);
        }

        set_initialized(true);
        state_.clear_cache();
        RepositoryInfo final_info = state_.get_repository_info();
        const std::string branch = final_info.default_branch;
        return SyncResult::ok(with_notes(step->message(), notes), op, step->attempts())
            .with_repository_info(std::move(final_info))
            .with_branch(branch);
    } catch (const std::exception& e) {
        return recovery_.handle_error(e.what(), op, "GIT_INIT_FAILED",
                                      {{"repo", config_.repo_dir.string()}});
    }
}

std::vector<std::string> SyncManager::validate_git_configuration() const {
    std::vector<std::string> warnings;
    const fs::path& dir = config_.repo_dir;
    if (!git::is_git_repo(dir)) {
        warnings.push_back("repository missing after initialization");
        return warnings;
    }
    if (!git::get_config_value(dir, "user.name"))
        warnings.push_back("user.name is not configured");
    if (!git::get_config_value(dir, "user.email"))
        warnings.push_back("user.email is not configured");
    if (config_.remote_url) {
        auto actual = git::get_remote_url(dir, "origin");
        if (!actual)
            warnings.push_back("remote origin is not configured");
        else if (*actual != *config_.remote_url)
            warnings.push_back("remote origin points to " + *actual);
    }
    return warnings;
}

SyncResult SyncManager::sync_memory_with_retry(const std::string& memory_id,
                                               const std::string& filename) {
    return orchestrator_.sync_memory_with_retry(memory_id, filename);
}

std::future<SyncResult> SyncManager::sync_memory_background(const std::string& memory_id,
                                                            const std::string& filename) {
    return orchestrator_.sync_memory_background(memory_id, filename);
}

RepositoryStatus SyncManager::get_repository_status() const {
    RepositoryStatus s;
    s.initialized = is_initialized();
    s.sync_enabled = config_.enable_sync;
    s.repository_exists = git::is_git_repo(config_.repo_dir);
    s.remote_configured = config_.remote_url.has_value();
    s.remote_url = config_.remote_url.value_or("");
    if (s.repository_exists)
        s.actual_remote_url = git::get_remote_url(config_.repo_dir, "origin");
    std::lock_guard<std::mutex> lk(mtx_);
    s.last_error = last_error_;
    return s;
}

RepositoryInfo SyncManager::repository_info() {
    SyncResult r = orchestrator_.run_serialized("repository info", [this]() {
        state_.clear_cache();
        return SyncResult::ok("Repository information refreshed", "repository info")
            .with_repository_info(state_.get_repository_info());
    });
    if (auto info = r.repository_info())
        return *info;
    log_warning("Repository information unavailable",
                {{"error", r.error_code().value_or("")}, {"message", r.message()}});
    return state_.get_repository_info();
}

SyncResult SyncManager::repair_corruption() {
    SyncResult repaired = recovery_.recover_corrupted_repository(state_.get_default_branch());
    state_.clear_cache();
    if (!repaired.success())
        return repaired;
    set_initialized(false);
    SyncResult init = do_initialize();
    if (!init.success())
        return init;
    return SyncResult::ok(with_notes(repaired.message(), {init.message()}), "recover repository",
                          repaired.attempts())
        .with_repository_info(init.repository_info().value_or(RepositoryInfo{}))
        .with_branch(init.branch_used().value_or(state_.get_default_branch()));
}

SyncResult SyncManager::recover_from_error(const SyncResult& failed) {
    if (failed.success())
        return SyncResult::ok("Nothing to recover", "recover");
    const ErrorCategory category =
        recovery_.categorize(failed.message(), failed.error_code().value_or(""));
    RecoveryEngine::Context ctx{{"operation", failed.operation()},
                                {"error_code", failed.error_code().value_or("")}};
    log_info("Attempting recovery", {{"category", to_string(category)},
                                     {"error", failed.error_code().value_or("")}});
    return orchestrator_.run_serialized("recover", [this, category, ctx]() {
        if (category == ErrorCategory::REPOSITORY_CORRUPTION)
            return recovery_.attempt_recovery(category, [this]() { return repair_corruption(); },
                                              ctx);
        return recovery_.attempt_recovery(
            category,
            [this]() {
                state_.clear_cache();
                return do_initialize();
            },
            ctx);
    });
}

SyncResult SyncManager::validate_and_recover() {
    if (!config_.enable_sync)
        return SyncResult::failure("Git sync is disabled", "validate", "GIT_SYNC_DISABLED");
    return orchestrator_.run_serialized("validate", [this]() {
        SyncResult check = recovery_.validate_repository_integrity();
        if (check.success())
            return check;
        if (check.error_code().value_or("") == "NO_REPOSITORY") {
            log_warning("Repository missing, initializing", {{"repo", config_.repo_dir.string()}});
            return do_initialize();
        }
        log_warning("Repository integrity check failed",
                    {{"error", check.error_code().value_or("")}, {"message", check.message()}});
        SyncResult r = recovery_.attempt_recovery(ErrorCategory::REPOSITORY_CORRUPTION,
                                                  [this]() { return repair_corruption(); },
                                                  {{"operation", "validate"}});
        record_outcome(r);
        return r;
    });
}

} // namespace memsync
