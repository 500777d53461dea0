#include "repository_state.hpp"
#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>
#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace memsync {

static const char* const kRemote = "origin";

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& i : items) {
        if (!out.empty())
            out += sep;
        out += i;
    }
    return out;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            lines.push_back(line);
    }
    return lines;
}

// Preserve the original message (classification depends on it) under a new code.
static SyncResult recode(const SyncResult& r, const std::string& operation,
                         const std::string& code) {
    return SyncResult::failure(r.message(), operation, code, r.attempts());
}

std::optional<std::string> find_remote_head(const std::string& ls_remote_output,
                                            const std::string& branch) {
    const std::string ref = "refs/heads/" + branch;
    for (const auto& line : split_lines(ls_remote_output)) {
        size_t tab = line.find('\t');
        if (tab == std::string::npos)
            continue;
        if (line.substr(tab + 1) == ref)
            return line.substr(0, tab);
    }
    return std::nullopt;
}

RepositoryStateManager::RepositoryStateManager(SyncConfig config, const CommandExecutor& executor,
                                               const BranchDetector& detector)
    : config_(std::move(config)), executor_(executor), detector_(detector) {
    config_.repo_dir = normalize_repo_dir(config_.repo_dir);
}

RepositoryInfo RepositoryStateManager::get_repository_info() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!cache_)
        cache_ = detect();
    return *cache_;
}

void RepositoryStateManager::clear_cache() {
    std::lock_guard<std::mutex> lk(mtx_);
    cache_.reset();
}

std::string RepositoryStateManager::get_default_branch() {
    return get_repository_info().default_branch;
}

std::optional<std::string> RepositoryStateManager::list_remote_heads(const std::string& url) {
    std::string out;
    std::error_code ec;
    // The repository directory may not exist before the first clone.
    fs::path cwd = fs::is_directory(config_.repo_dir, ec) ? config_.repo_dir : fs::path();
    SyncResult r = executor_.run({"git", "ls-remote", "--heads", url}, "remote check", cwd, 1,
                                 0.0, kDefaultCommandTimeout, &out);
    if (!r.success())
        return std::nullopt;
    return out;
}

RepositoryInfo RepositoryStateManager::detect() {
    RepositoryInfo info;
    const fs::path& dir = config_.repo_dir;
    info.local_exists = git::is_git_repo(dir);
    info.remote_url = config_.remote_url;

    std::optional<std::string> heads;
    if (info.remote_url) {
        heads = list_remote_heads(*info.remote_url);
        info.remote_exists = heads.has_value();
    }
    if (info.local_exists)
        info.local_branch = git::get_current_branch(dir);

    if (info.remote_exists)
        info.default_branch = detector_.detect(*info.remote_url, dir);
    else if (info.local_branch)
        info.default_branch = *info.local_branch;
    else
        info.default_branch = "main";

    if (info.local_exists && info.local_branch)
        info.tracking_configured = git::has_upstream(dir, *info.local_branch);

    if (info.local_exists && info.remote_exists) {
        // An absent remote branch means there is nothing to pull.
        auto remote_tip = find_remote_head(*heads, info.default_branch);
        auto local_tip = git::get_local_hash(dir);
        info.needs_sync = remote_tip.has_value() && local_tip != remote_tip;
    }

    info.state = classify_repository(info.local_exists, info.remote_exists,
                                     info.tracking_configured, info.needs_sync);
    log_debug("Repository state detected",
              {{"state", to_string(info.state)},
               {"branch", info.default_branch},
               {"local", info.local_exists ? "yes" : "no"},
               {"remote", info.remote_exists ? "yes" : "no"},
               {"tracking", info.tracking_configured ? "yes" : "no"},
               {"needs_sync", info.needs_sync ? "yes" : "no"}});
    return info;
}

SyncResult RepositoryStateManager::ensure_identity() {
    const fs::path& dir = config_.repo_dir;
    const std::pair<const char*, const std::string*> keys[] = {{"user.name", &config_.user_name},
                                                               {"user.email", &config_.user_email}};
    for (const auto& [key, value] : keys) {
        if (git::get_config_value(dir, key))
            continue;
        std::string err;
        if (!git::set_config_value(dir, key, *value, &err))
            return SyncResult::failure(std::string("Could not set ") + key + ": " + err,
                                       "identity", "IDENTITY_CONFIG_FAILED");
        log_info(std::string("Configured ") + key, {{"value", *value}});
    }
    return SyncResult::ok("Commit identity configured", "identity");
}

SyncResult RepositoryStateManager::configure_remote() {
    if (!config_.remote_url)
        return SyncResult::ok("No remote configured", "configure remote");
    const std::string url = *config_.remote_url;
    auto current = git::get_remote_url(config_.repo_dir, kRemote);
    if (current && *current == url)
        return SyncResult::ok("Remote origin already points to " + url, "configure remote");
    SyncResult r = executor_.run_operation(
        [&](std::string& err) { return git::set_remote_url(config_.repo_dir, kRemote, url, &err); },
        "configure remote");
    clear_cache();
    if (!r.success())
        return recode(r, "configure remote", "REMOTE_CONFIG_FAILED");
    log_info(current ? "Updated remote origin" : "Added remote origin",
             {{"url", url}, {"previous", current.value_or("")}});
    return SyncResult::ok("Remote origin set to " + url, "configure remote");
}

SyncResult RepositoryStateManager::clone_existing_repository() {
    const std::string op = "clone";
    if (!config_.remote_url)
        return SyncResult::failure("No remote URL configured for cloning", op, "NO_REMOTE_URL");
    const fs::path dir = config_.repo_dir;
    if (git::is_git_repo(dir))
        return SyncResult::failure("A local repository already exists in " + dir.string(), op,
                                   "LOCAL_REPO_EXISTS");

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return SyncResult::failure("Cannot create " + dir.string() + ": " + ec.message(), op,
                                   "GIT_CLONE_FAILED");
    const std::string default_branch = get_default_branch();

    std::vector<fs::path> movable;
    std::vector<std::string> blocking;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind('.', 0) == 0 || name.rfind("README", 0) == 0 ||
            name.rfind("LICENSE", 0) == 0)
            movable.push_back(entry.path());
        else
            blocking.push_back(name);
    }
    if (!blocking.empty()) {
        std::sort(blocking.begin(), blocking.end());
        return SyncResult::failure("Target directory " + dir.string() +
                                       " is not empty: " + join(blocking, ", "),
                                   op, "TARGET_DIR_NOT_EMPTY");
    }

    const fs::path backup = dir.parent_path() / (dir.filename().string() + "_clone_backup");
    if (!movable.empty()) {
        fs::remove_all(backup, ec);
        fs::create_directories(backup, ec);
        for (const auto& p : movable) {
            fs::rename(p, backup / p.filename(), ec);
            if (ec)
                return SyncResult::failure("Cannot move " + p.string() + " aside: " + ec.message(),
                                           op, "GIT_CLONE_FAILED");
        }
        log_debug("Moved existing files aside for clone", {{"count", std::to_string(movable.size())}});
    }

    SyncResult cloned =
        executor_.run({"git", "clone", "--single-branch", *config_.remote_url, dir.string()}, op,
                      dir.parent_path(), config_.retry_attempts, config_.retry_delay,
                      kCloneTimeout);

    if (!movable.empty()) {
        for (const auto& p : movable) {
            fs::path target = dir / p.filename();
            if (fs::exists(target, ec)) {
                log_warning("Kept pre-existing file in clone backup",
                            {{"file", p.filename().string()}, {"backup", backup.string()}});
                continue;
            }
            fs::rename(backup / p.filename(), target, ec);
        }
        if (fs::is_empty(backup, ec))
            fs::remove(backup, ec);
    }
    clear_cache();

    if (!cloned.success())
        return recode(cloned, op, "GIT_CLONE_FAILED");

    auto origin = git::get_remote_url(dir, kRemote);
    if (!origin || *origin != *config_.remote_url)
        return SyncResult::failure("Clone validation failed: origin is " +
                                       origin.value_or("<missing>") + ", expected " +
                                       *config_.remote_url,
                                   op, "CLONE_VALIDATION_FAILED", cloned.attempts());
    std::string err;
    auto branch = git::get_current_branch(dir, &err);
    if (!branch)
        return SyncResult::failure("Clone validation failed: no current branch (" + err + ")", op,
                                   "CLONE_VALIDATION_FAILED", cloned.attempts());
    if (!git::get_local_hash(dir) && *branch != default_branch) {
        // An empty remote leaves HEAD on whatever unborn branch the clone picked.
        SyncResult moved = executor_.run(
            {"git", "symbolic-ref", "HEAD", "refs/heads/" + default_branch}, op, dir, 1, 0.0);
        if (!moved.success())
            return recode(moved, op, "CLONE_VALIDATION_FAILED");
        log_info("Empty remote, starting branch " + default_branch, {{"was", *branch}});
        branch = default_branch;
        clear_cache();
    }
    SyncResult identity = ensure_identity();
    if (!identity.success())
        log_warning(identity.message());

    log_info("Cloned remote repository", {{"url", *config_.remote_url}, {"branch", *branch}});
    return SyncResult::ok("Cloned " + *config_.remote_url + " into " + dir.string(), op,
                          cloned.attempts())
        .with_branch(*branch);
}

SyncResult RepositoryStateManager::checkout_branch(const std::string& branch, bool force) {
    const fs::path& dir = config_.repo_dir;
    std::vector<std::string> cmd{"git", "checkout"};
    if (force)
        cmd.push_back("-f");
    if (git::local_branch_exists(dir, branch)) {
        cmd.push_back(branch);
    } else {
        cmd.insert(cmd.end(), {"-B", branch, "--track", std::string(kRemote) + "/" + branch});
    }
    SyncResult r = executor_.run(cmd, "checkout", dir, 1, 0.0);
    if (!r.success())
        return recode(r, "checkout", "BRANCH_CREATION_FAILED");
    return r;
}

SyncResult RepositoryStateManager::setup_upstream_tracking(const std::string& branch) {
    const std::string op = "upstream tracking";
    const fs::path& dir = config_.repo_dir;
    if (!git::is_git_repo(dir))
        return SyncResult::failure("No local repository in " + dir.string(), op, "NO_LOCAL_REPO");
    if (!config_.remote_url)
        return SyncResult::failure("No remote URL configured", op, "NO_REMOTE_URL");
    if (!git::get_remote_url(dir, kRemote))
        return SyncResult::failure("Local repository has no origin remote", op, "NO_LOCAL_REMOTE");

    SyncResult fetched = executor_.run({"git", "fetch", kRemote}, "fetch", dir,
                                       config_.retry_attempts, config_.retry_delay);
    if (!fetched.success())
        return recode(fetched, op, "FETCH_FAILED");
    if (!git::get_ref_hash(dir, "refs/remotes/origin/" + branch))
        return SyncResult::failure("Remote branch origin/" + branch + " does not exist", op,
                                   "REMOTE_BRANCH_NOT_FOUND");

    auto current = git::get_current_branch(dir);
    if (!git::local_branch_exists(dir, branch) || !current || *current != branch) {
        SyncResult co = checkout_branch(branch, false);
        if (!co.success())
            return co;
        clear_cache();
    }
    if (git::has_upstream(dir, branch))
        return SyncResult::ok("Upstream tracking already configured for " + branch, op)
            .with_branch(branch);

    SyncResult set = executor_.run_operation(
        [&](std::string& err) { return git::set_upstream(dir, branch, kRemote, &err); }, op);
    clear_cache();
    if (!set.success())
        return recode(set, op, "UPSTREAM_SETUP_FAILED");
    if (!git::has_upstream(dir, branch))
        return SyncResult::failure("Upstream for " + branch + " is still not configured", op,
                                   "UPSTREAM_SETUP_FAILED");
    log_info("Configured upstream tracking", {{"branch", branch}, {"upstream", "origin/" + branch}});
    return SyncResult::ok(branch + " now tracks origin/" + branch, op).with_branch(branch);
}

SyncResult RepositoryStateManager::resolve_conflicts_with_remote(
    const std::vector<std::string>& files, const std::string& branch) {
    const fs::path& dir = config_.repo_dir;
    for (const auto& f : files) {
        SyncResult theirs = executor_.run({"git", "checkout", "--theirs", "--", f},
                                          "conflict resolution", dir, 1, 0.0);
        // The remote side deleted the file.
        SyncResult staged = theirs.success()
                                ? executor_.run({"git", "add", "--", f}, "conflict resolution",
                                                dir, 1, 0.0)
                                : executor_.run({"git", "rm", "--quiet", "--", f},
                                                "conflict resolution", dir, 1, 0.0);
        if (!staged.success())
            return recode(staged, "synchronize", "MERGE_RESOLUTION_FAILED");
    }
    SyncResult commit =
        executor_.run({"git", "commit", "--no-edit"}, "conflict resolution", dir, 1, 0.0);
    if (!commit.success())
        return recode(commit, "synchronize", "MERGE_RESOLUTION_FAILED");
    log_warning("Resolved merge conflicts with remote content",
                {{"branch", branch}, {"files", join(files, ",")}});
    return commit;
}

SyncResult RepositoryStateManager::synchronize_with_remote() {
    const std::string op = "synchronize";
    const fs::path& dir = config_.repo_dir;
    if (!git::is_git_repo(dir))
        return SyncResult::failure("No local repository in " + dir.string(), op, "NO_LOCAL_REPO");
    if (!config_.remote_url)
        return SyncResult::failure("No remote URL configured", op, "NO_REMOTE_URL");
    if (!git::get_remote_url(dir, kRemote))
        return SyncResult::failure("Local repository has no origin remote", op, "NO_LOCAL_REMOTE");

    RepositoryInfo info = get_repository_info();
    if (!info.remote_exists)
        return SyncResult::failure("Remote repository " + *config_.remote_url +
                                       " is not accessible",
                                   op, "REMOTE_NOT_ACCESSIBLE");
    const std::string branch = info.default_branch;
    const std::string remote_ref = "refs/remotes/origin/" + branch;

    SyncResult fetched = executor_.run({"git", "fetch", kRemote}, "fetch", dir,
                                       config_.retry_attempts, config_.retry_delay);
    if (!fetched.success())
        return recode(fetched, op, "FETCH_FAILED");
    auto remote_tip = git::get_ref_hash(dir, remote_ref);
    if (!remote_tip) {
        clear_cache();
        return SyncResult::ok("Remote branch origin/" + branch +
                                  " does not exist yet; nothing to pull",
                              op, fetched.attempts())
            .with_branch(branch);
    }

    std::vector<std::string> notes;
    auto local_tip = git::get_local_hash(dir);
    if (!local_tip) {
        // No local commits: adopt the remote branch outright.
        SyncResult co = checkout_branch(branch, true);
        clear_cache();
        if (!co.success())
            return co;
        return SyncResult::ok("Checked out origin/" + branch +
                                  "; local repository had no commits, remote content took "
                                  "precedence over any files in the way",
                              op, fetched.attempts())
            .with_branch(branch);
    }

    auto current = git::get_current_branch(dir);
    if (!current || *current != branch) {
        SyncResult co = checkout_branch(branch, false);
        if (!co.success()) {
            clear_cache();
            return co;
        }
    }
    if (!git::has_upstream(dir, branch)) {
        std::string err;
        if (!git::set_upstream(dir, branch, kRemote, &err))
            log_warning("Could not set upstream during synchronize", {{"error", err}});
    }

    auto suffix = [&notes]() { return notes.empty() ? std::string() : "; " + join(notes, "; "); };
    size_t ahead = 0;
    size_t behind = 0;
    std::string ab_err;
    if (git::get_local_hash(dir) == remote_tip) {
        clear_cache();
        return SyncResult::ok("Already synchronized with origin/" + branch, op,
                              fetched.attempts())
            .with_branch(branch);
    }
    if (git::ahead_behind(dir, remote_ref, ahead, behind, &ab_err) && behind == 0) {
        clear_cache();
        return SyncResult::ok("Local " + branch + " is " + std::to_string(ahead) +
                                  " commit(s) ahead of origin/" + branch + "; nothing to pull",
                              op, fetched.attempts())
            .with_branch(branch);
    }

    SyncResult merged = merge_remote(branch);
    std::vector<std::string> files;
    if (!merged.success())
        files = unmerged_files();

    // Local edits the merge would overwrite are set aside for the merge only.
    bool stashed = false;
    if (!merged.success() && files.empty() && git::has_uncommitted_changes(dir)) {
        SyncResult stash = executor_.run({"git", "stash", "push", "--include-untracked",
                                          "--message", "memsync: local changes before sync"},
                                         "stash", dir, 1, 0.0);
        if (!stash.success()) {
            clear_cache();
            return recode(stash, op, "STASH_FAILED");
        }
        stashed = true;
        log_warning("Stashed uncommitted changes that blocked the merge", {{"branch", branch}});
        merged = merge_remote(branch);
        if (!merged.success())
            files = unmerged_files();
    }

    if (!merged.success()) {
        if (files.empty()) {
            SyncResult aborted =
                executor_.run({"git", "merge", "--abort"}, "merge abort", dir, 1, 0.0);
            if (!aborted.success())
                log_debug("No merge in progress to abort");
            if (stashed)
                restore_stashed_changes(notes);
            clear_cache();
            return recode(merged, op, "PULL_FAILED");
        }
        SyncResult resolved = resolve_conflicts_with_remote(files, branch);
        if (!resolved.success()) {
            SyncResult aborted =
                executor_.run({"git", "merge", "--abort"}, "merge abort", dir, 1, 0.0);
            if (!aborted.success())
                log_warning("Merge abort failed after unresolved conflicts");
            if (stashed)
                restore_stashed_changes(notes);
            clear_cache();
            return resolved;
        }
        notes.push_back("conflicts in " + std::to_string(files.size()) +
                        " file(s) were resolved using remote content: " + join(files, ", "));
    }
    if (stashed)
        restore_stashed_changes(notes);
    clear_cache();
    log_info("Synchronized with remote", {{"branch", branch}, {"behind", std::to_string(behind)}});
    return SyncResult::ok("Synchronized " + branch + " with origin/" + branch + suffix(), op,
                          fetched.attempts())
        .with_branch(branch);
}

SyncResult RepositoryStateManager::merge_remote(const std::string& branch) {
    return executor_.run({"git", "merge", "--no-edit", "--allow-unrelated-histories", "-X",
                          "theirs", std::string(kRemote) + "/" + branch},
                         "merge", config_.repo_dir, 1, 0.0);
}

std::vector<std::string> RepositoryStateManager::unmerged_files() {
    std::string out;
    SyncResult r = executor_.run({"git", "diff", "--name-only", "--diff-filter=U"},
                                 "conflict listing", config_.repo_dir, 1, 0.0,
                                 kDefaultCommandTimeout, &out);
    if (!r.success())
        return {};
    return split_lines(out);
}

void RepositoryStateManager::restore_stashed_changes(std::vector<std::string>& notes) {
    const fs::path& dir = config_.repo_dir;
    SyncResult popped = executor_.run({"git", "stash", "pop"}, "stash restore", dir, 1, 0.0);
    if (popped.success()) {
        log_info("Restored stashed local changes");
        return;
    }

    // Something collides with remote content: go back to the merged tree,
    // keep the stash entry and bring back untracked files that are free.
    SyncResult reset =
        executor_.run({"git", "reset", "--hard", "--quiet", "HEAD"}, "stash restore", dir, 1, 0.0);
    SyncResult cleaned = executor_.run({"git", "clean", "-fd", "--quiet"}, "stash restore", dir,
                                       1, 0.0);
    if (!reset.success() || !cleaned.success())
        log_warning("Could not clean up after a failed stash restore",
                    {{"error", reset.success() ? cleaned.message() : reset.message()}});

    const std::string untracked = "stash@{0}^3";
    std::string listing;
    std::vector<std::string> restored;
    std::vector<std::string> kept;
    SyncResult listed = executor_.run({"git", "ls-tree", "-r", "--name-only", untracked},
                                      "stash restore", dir, 1, 0.0, kDefaultCommandTimeout,
                                      &listing);
    if (listed.success()) {
        std::error_code ec;
        for (const auto& f : split_lines(listing)) {
            if (fs::exists(dir / f, ec)) {
                kept.push_back(f);
                continue;
            }
            SyncResult co = executor_.run({"git", "checkout", untracked, "--", f},
                                          "stash restore", dir, 1, 0.0);
            SyncResult unstaged = co.success() ? executor_.run({"git", "reset", "--quiet", "--", f},
                                                               "stash restore", dir, 1, 0.0)
                                               : co;
            if (unstaged.success())
                restored.push_back(f);
            else
                kept.push_back(f);
        }
    }
    std::string note = "local changes that collide with remote content were kept in "
                       "'git stash list' and remote content took precedence";
    if (!kept.empty())
        note += " (" + join(kept, ", ") + ")";
    notes.push_back(note);
    log_warning("Local changes collide with remote content, kept in stash",
                {{"kept", join(kept, ",")}, {"restored", join(restored, ",")}});
}

} // namespace memsync
