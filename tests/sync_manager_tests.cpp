#include <future>
#include <memory>
#include <thread>
#include "fake_runner.hpp"
#include "git_fixtures.hpp"
#include "performance_monitor.hpp"
#include "sync_manager.hpp"
#include "test_common.hpp"

using namespace memsync;
using namespace memsync::test_support;

namespace {
SyncConfig manager_config(const fs::path& dir, std::optional<std::string> url = std::nullopt) {
    SyncConfig cfg;
    cfg.repo_dir = dir;
    cfg.remote_url = std::move(url);
    cfg.retry_attempts = 1;
    cfg.retry_delay = 0.0;
    return cfg;
}

SyncDependencies quiet_deps(const RecordingSleeper& sleeper) {
    SyncDependencies deps;
    deps.sleeper = sleeper.fn();
    return deps;
}
} // namespace

TEST_CASE("SyncManager with sync disabled does nothing") {
    TempDir tmp("memsync_mgr_disabled");
    SyncConfig cfg = manager_config(tmp.path / "repo");
    cfg.enable_sync = false;
    SyncManager mgr(cfg);

    REQUIRE(mgr.is_initialized());
    REQUIRE_FALSE(fs::exists(tmp.path / "repo"));
    REQUIRE(mgr.initialize().success());

    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    REQUIRE_FALSE(r.success());
    REQUIRE(r.error_code() == std::optional<std::string>("GIT_SYNC_DISABLED"));
    REQUIRE_FALSE(mgr.sync_memory_background("m1", "m1.md").valid());
    REQUIRE(mgr.validate_and_recover().error_code() ==
            std::optional<std::string>("GIT_SYNC_DISABLED"));

    RepositoryStatus status = mgr.get_repository_status();
    REQUIRE(status.initialized);
    REQUIRE_FALSE(status.sync_enabled);
    REQUIRE_FALSE(status.repository_exists);
    REQUIRE_FALSE(status.last_error.has_value());
}

TEST_CASE("SyncManager creates a local-only repository") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_local");
    const fs::path repo = tmp.path / "repo";
    RecordingSleeper sleeper;
    auto monitor = std::make_shared<LoggingPerformanceMonitor>();
    SyncDependencies deps = quiet_deps(sleeper);
    deps.monitor = monitor;
    SyncManager mgr(manager_config(repo), deps);

    REQUIRE(mgr.is_initialized());
    REQUIRE(git::is_git_repo(repo));
    REQUIRE(fs::is_directory(repo / "files"));
    REQUIRE(git::get_current_branch(repo) == std::optional<std::string>("main"));
    REQUIRE(git::get_config_value(repo, "user.name").has_value());

    write_file(repo / "files" / "m1.md", "first memory\n");
    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    INFO(r.message());
    REQUIRE(r.success());
    REQUIRE(r.message() == "Memory m1 committed to Git locally");
    REQUIRE(git_output(repo, "log -1 --format=%s") == "Add memory m1");
    REQUIRE_FALSE(git::has_uncommitted_changes(repo));

    auto stats = monitor->snapshot();
    REQUIRE(stats.count("sync memory") == 1);
    REQUIRE(stats["sync memory"].count == 1);
    REQUIRE(stats["sync memory"].failures == 0);

    SECTION("missing file fails and is remembered") {
        SyncResult missing = mgr.sync_memory_with_retry("m2", "missing.md");
        REQUIRE_FALSE(missing.success());
        RepositoryStatus status = mgr.get_repository_status();
        REQUIRE(status.last_error.has_value());
        REQUIRE(status.last_error->find(missing.error_code().value_or("?")) == 0);
    }
    SECTION("paths outside the files directory are refused") {
        SyncResult bad = mgr.sync_memory_with_retry("m3", "../escape.md");
        REQUIRE(bad.error_code() == std::optional<std::string>("INVALID_MEMORY_FILENAME"));
    }
    SECTION("background sync resolves through a future") {
        write_file(repo / "files" / "m4.md", "background\n");
        std::future<SyncResult> f = mgr.sync_memory_background("m4", "m4.md");
        REQUIRE(f.valid());
        SyncResult bg = f.get();
        INFO(bg.message());
        REQUIRE(bg.success());
        REQUIRE(git_output(repo, "log -1 --format=%s") == "Add memory m4");
    }
    SECTION("status reflects the repository") {
        RepositoryStatus status = mgr.get_repository_status();
        REQUIRE(status.initialized);
        REQUIRE(status.sync_enabled);
        REQUIRE(status.repository_exists);
        REQUIRE_FALSE(status.remote_configured);
        REQUIRE_FALSE(status.actual_remote_url.has_value());
        REQUIRE(mgr.repository_info().default_branch == "main");
    }
}

TEST_CASE("SyncManager clones an existing remote and pushes") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_remote");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = make_seeded_remote(tmp.path);
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo, bare.string()), quiet_deps(sleeper));

    REQUIRE(mgr.is_initialized());
    REQUIRE(fs::exists(repo / "files" / "seed.md"));
    REQUIRE(git::has_upstream(repo, "main"));
    RepositoryStatus status = mgr.get_repository_status();
    REQUIRE(status.remote_configured);
    REQUIRE(status.actual_remote_url == std::optional<std::string>(bare.string()));
    REQUIRE(mgr.repository_info().state == RepositoryState::SYNCHRONIZED);

    write_file(repo / "files" / "m1.md", "pushed memory\n");
    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    INFO(r.message());
    REQUIRE(r.success());
    REQUIRE(r.message() == "Memory m1 synced to Git and pushed to remote");
    REQUIRE(r.branch_used() == std::optional<std::string>("main"));
    REQUIRE(git_output(bare, "rev-parse main") == git::get_local_hash(repo).value_or("?"));
}

TEST_CASE("SyncManager pushes the first memory into an empty remote") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_empty_remote");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = tmp.path / "empty.git";
    REQUIRE(git_cmd("init -q --bare " + quoted(bare)) == 0);
    REQUIRE(git_in(bare, "symbolic-ref HEAD refs/heads/master") == 0);
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo, bare.string()), quiet_deps(sleeper));
    REQUIRE(mgr.is_initialized());
    const std::string branch = mgr.repository_info().default_branch;
    REQUIRE(git::get_current_branch(repo) == std::optional<std::string>(branch));

    write_file(repo / "files" / "m1.md", "first memory\n");
    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    INFO(r.message());
    REQUIRE(r.success());
    REQUIRE(r.message() == "Memory m1 synced to Git and pushed to remote");
    REQUIRE(git_output(bare, "rev-parse " + branch) == git::get_local_hash(repo).value_or("?"));
}

TEST_CASE("SyncManager keeps the commit when the push fails") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_pushfail");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = make_seeded_remote(tmp.path);
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo, bare.string()), quiet_deps(sleeper));
    REQUIRE(mgr.is_initialized());

    remove_all(bare);
    write_file(repo / "files" / "m1.md", "offline memory\n");
    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    INFO(r.message());
    REQUIRE(r.success());
    REQUIRE(r.message().find("committed locally (push failed") != std::string::npos);
    REQUIRE(git_output(repo, "log -1 --format=%s") == "Add memory m1");
}

TEST_CASE("SyncManager pulls remote changes into an existing clone") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_existing");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = make_seeded_remote(tmp.path);
    RecordingSleeper sleeper;
    {
        SyncManager first(manager_config(repo, bare.string()), quiet_deps(sleeper));
        REQUIRE(first.is_initialized());
    }
    push_remote_change(tmp.path, bare, "files/from_elsewhere.md", "remote memory\n");

    SyncManager second(manager_config(repo, bare.string()), quiet_deps(sleeper));
    REQUIRE(second.is_initialized());
    REQUIRE(read_file(repo / "files" / "from_elsewhere.md") == "remote memory\n");
    REQUIRE(git_output(bare, "rev-parse main") == git::get_local_hash(repo).value_or("?"));
}

TEST_CASE("SyncManager fixes a mismatched origin") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_origin");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = make_seeded_remote(tmp.path);
    REQUIRE(git_cmd("clone -q " + quoted(bare) + " " + quoted(repo)) == 0);
    REQUIRE(git_in(repo, "remote set-url origin https://example.invalid/other.git") == 0);

    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo, bare.string()), quiet_deps(sleeper));
    REQUIRE(mgr.is_initialized());
    REQUIRE(git::get_remote_url(repo, "origin") == std::optional<std::string>(bare.string()));
}

TEST_CASE("SyncManager validates and repairs the repository") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_validate");
    const fs::path repo = tmp.path / "repo";
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo), quiet_deps(sleeper));
    write_file(repo / "files" / "m1.md", "memory\n");
    REQUIRE(mgr.sync_memory_with_retry("m1", "m1.md").success());

    SECTION("healthy repository passes") {
        SyncResult r = mgr.validate_and_recover();
        REQUIRE(r.success());
        REQUIRE(r.message() == "Repository integrity check passed");
    }
    SECTION("missing repository is recreated") {
        remove_all(repo / ".git");
        REQUIRE_FALSE(mgr.is_initialized());
        SyncResult r = mgr.validate_and_recover();
        INFO(r.message());
        REQUIRE(r.success());
        REQUIRE(git::is_git_repo(repo));
        REQUIRE(mgr.is_initialized());
        REQUIRE(read_file(repo / "files" / "m1.md") == "memory\n");
    }
    SECTION("corrupted objects trigger reinitialization") {
        std::string head = git::get_local_hash(repo).value_or("");
        REQUIRE(head.size() == 40);
        fs::path object = repo / ".git" / "objects" / head.substr(0, 2) / head.substr(2);
        REQUIRE(fs::exists(object));
        fs::permissions(object, fs::perms::owner_write, fs::perm_options::add);
        write_file(object, "garbage");

        SyncResult r = mgr.validate_and_recover();
        INFO(r.message());
        REQUIRE(r.success());
        REQUIRE(git::is_git_repo(repo));
        REQUIRE(r.message().find("Using existing local repository") != std::string::npos);
        REQUIRE(mgr.validate_and_recover().success());
        REQUIRE(read_file(repo / "files" / "m1.md") == "memory\n");
    }
}

TEST_CASE("SyncManager reports remote content restored after a repair") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_repair_remote");
    const fs::path repo = tmp.path / "repo";
    const fs::path bare = make_seeded_remote(tmp.path);
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo, bare.string()), quiet_deps(sleeper));
    write_file(repo / "files" / "m1.md", "memory\n");
    REQUIRE(mgr.sync_memory_with_retry("m1", "m1.md").success());

    // The commit object was created locally, so the remote keeps its own copy.
    std::string head = git::get_local_hash(repo).value_or("");
    REQUIRE(head.size() == 40);
    fs::path object = repo / ".git" / "objects" / head.substr(0, 2) / head.substr(2);
    REQUIRE(fs::exists(object));
    fs::permissions(object, fs::perms::owner_write, fs::perm_options::add);
    write_file(object, "garbage");

    SyncResult r = mgr.validate_and_recover();
    INFO(r.message());
    REQUIRE(r.success());
    REQUIRE(r.message().find("reinitialized") != std::string::npos);
    REQUIRE(r.message().find("remote content took precedence") != std::string::npos);
    REQUIRE(git_output(bare, "rev-parse main") == git::get_local_hash(repo).value_or("?"));
    REQUIRE(read_file(repo / "files" / "m1.md") == "memory\n");
}

TEST_CASE("SyncManager recover_from_error follows the error category") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    TempDir tmp("memsync_mgr_recover");
    const fs::path repo = tmp.path / "repo";
    RecordingSleeper sleeper;
    SyncManager mgr(manager_config(repo), quiet_deps(sleeper));
    REQUIRE(mgr.is_initialized());

    REQUIRE(mgr.recover_from_error(SyncResult::ok("fine", "sync memory")).success());

    SyncResult conflict = SyncResult::failure("CONFLICT (content): Merge conflict in files/a.md",
                                              "sync memory", "GIT_COMMAND_FAILED");
    SyncResult fixed = mgr.recover_from_error(conflict);
    INFO(fixed.message());
    REQUIRE(fixed.success());
    REQUIRE(fixed.operation() == "recover merge_conflict");

    SyncResult auth = SyncResult::failure("fatal: Authentication failed for 'https://x'",
                                          "push memory", "GIT_COMMAND_FAILED");
    SyncResult needs_user = mgr.recover_from_error(auth);
    REQUIRE_FALSE(needs_user.success());
    REQUIRE(needs_user.error_code() == std::optional<std::string>("USER_ACTION_REQUIRED"));

    remove_all(repo / ".git");
    SyncResult corrupt = SyncResult::failure("fatal: not a git repository", "sync memory",
                                             "GIT_COMMAND_FAILED");
    SyncResult rebuilt = mgr.recover_from_error(corrupt);
    INFO(rebuilt.message());
    REQUIRE(rebuilt.success());
    REQUIRE(git::is_git_repo(repo));
}

TEST_CASE("SyncManager reports initialization failures without throwing") {
    TempDir tmp("memsync_mgr_fail");
    auto runner = std::make_shared<ScriptedRunner>();
    RecordingSleeper sleeper;
    SyncDependencies deps;
    deps.runner = runner;
    deps.sleeper = sleeper.fn();
    // A regular file where the repository directory should be.
    write_file(tmp.path / "blocked", "x");
    SyncManager mgr(manager_config(tmp.path / "blocked" / "repo"), deps);

    REQUIRE_FALSE(mgr.is_initialized());
    RepositoryStatus status = mgr.get_repository_status();
    REQUIRE(status.last_error.has_value());
    REQUIRE(status.last_error->rfind("REPO_DIR_UNAVAILABLE", 0) == 0);

    SyncResult r = mgr.sync_memory_with_retry("m1", "m1.md");
    REQUIRE(r.error_code() == std::optional<std::string>("REPO_DIR_UNAVAILABLE"));
}

TEST_CASE("SyncManager detects repository information on the sync queue") {
    TempDir tmp("memsync_mgr_info_queue");
    auto runner = std::make_shared<ScriptedRunner>();
    runner->on({"ls-remote", "--symref"}, 0, "ref: refs/heads/trunk\tHEAD\nabc\tHEAD\n");
    RecordingSleeper sleeper;
    SyncDependencies deps;
    deps.runner = runner;
    deps.sleeper = sleeper.fn();
    SyncManager mgr(manager_config(tmp.path / "repo", "https://example.invalid/m.git"), deps);

    const size_t before = runner->calls().size();
    RepositoryInfo info = mgr.repository_info();
    REQUIRE(info.remote_exists);
    REQUIRE(info.default_branch == "trunk");

    auto threads = runner->threads();
    REQUIRE(threads.size() > before);
    for (size_t i = before; i < threads.size(); ++i)
        REQUIRE(threads[i] != std::this_thread::get_id());
}
