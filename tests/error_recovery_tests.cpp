#include <memory>
#include <stdexcept>
#include "command_executor.hpp"
#include "error_recovery.hpp"
#include "fake_runner.hpp"
#include "test_common.hpp"

using namespace memsync;
using memsync::test_support::RecordingSleeper;
using memsync::test_support::ScriptedRunner;
using memsync::test_support::TempDir;
using std::chrono::milliseconds;

TEST_CASE("handle_error builds guidance for the caller") {
    auto runner = std::make_shared<ScriptedRunner>();
    CommandExecutor exec(runner, RecordingSleeper().fn());
    RecoveryEngine engine("/tmp/unused", exec, RecordingSleeper().fn());

    SyncResult r = engine.handle_error("fatal: unable to access: Connection refused", "push",
                                       "PUSH_FAILED", {{"memory_id", "m1"}});
    REQUIRE_FALSE(r.success());
    REQUIRE(r.operation() == "push");
    REQUIRE(r.error_code() == std::optional<std::string>("NETWORK_PUSH_FAILED"));
    const std::string& msg = r.message();
    REQUIRE(msg.find(resolution_for(ErrorCategory::NETWORK).user_message) == 0);
    REQUIRE(msg.find("What you can do:") != std::string::npos);
    REQUIRE(msg.find("  1. Check your internet connection") != std::string::npos);
    REQUIRE(msg.find("retried automatically (up to 3 times)") != std::string::npos);
    REQUIRE(msg.find("Technical details:") != std::string::npos);
    REQUIRE(msg.find("Category: network") != std::string::npos);
    REQUIRE(msg.find("Message: fatal: unable to access: Connection refused") !=
            std::string::npos);
    REQUIRE(msg.find("memory_id: m1") != std::string::npos);

    SyncResult unknown = engine.handle_error("weird", "sync");
    REQUIRE(unknown.error_code() == std::optional<std::string>("UNKNOWN_ERROR"));
    REQUIRE(unknown.message().find("retried automatically") == std::string::npos);
}

TEST_CASE("attempt_recovery follows the resolution table") {
    auto runner = std::make_shared<ScriptedRunner>();
    CommandExecutor exec(runner, RecordingSleeper().fn());
    RecordingSleeper sleeper;
    RecoveryEngine engine("/tmp/unused", exec, sleeper.fn());
    int calls = 0;
    auto failing = [&calls]() {
        ++calls;
        return SyncResult::failure("still broken", "fix", "FIX_FAILED");
    };

    SECTION("user action categories never call the recovery") {
        SyncResult r = engine.attempt_recovery(ErrorCategory::AUTHENTICATION, failing);
        REQUIRE_FALSE(r.success());
        REQUIRE(r.error_code() == std::optional<std::string>("USER_ACTION_REQUIRED"));
        REQUIRE(calls == 0);
        REQUIRE(engine.attempt_recovery(ErrorCategory::UNKNOWN, failing).error_code() ==
                std::optional<std::string>("USER_ACTION_REQUIRED"));
        REQUIRE(calls == 0);
    }
    SECTION("network retries with the table delay") {
        SyncResult r = engine.attempt_recovery(ErrorCategory::NETWORK, failing);
        REQUIRE_FALSE(r.success());
        REQUIRE(r.error_code() == std::optional<std::string>("RECOVERY_FAILED"));
        REQUIRE(r.message().find("Recovery failed after 4 attempts") == 0);
        REQUIRE(r.attempts() == 4);
        REQUIRE(calls == 4);
        REQUIRE(*sleeper.delays == std::vector<milliseconds>(3, milliseconds(5000)));
    }
    SECTION("success stops further attempts") {
        auto second_time = [&calls]() {
            if (++calls < 2)
                return SyncResult::failure("no", "fix", "X");
            return SyncResult::ok("fixed", "fix");
        };
        SyncResult r = engine.attempt_recovery(ErrorCategory::BRANCH_DETECTION, second_time);
        REQUIRE(r.success());
        REQUIRE(r.message() == "fixed");
        REQUIRE(r.attempts() == 2);
        REQUIRE(*sleeper.delays == std::vector<milliseconds>{milliseconds(1000)});
    }
    SECTION("exceptions count as failed attempts") {
        auto throwing = [&calls]() -> SyncResult {
            ++calls;
            throw std::runtime_error("disk on fire");
        };
        SyncResult r = engine.attempt_recovery(ErrorCategory::REPOSITORY_CORRUPTION, throwing);
        REQUIRE_FALSE(r.success());
        REQUIRE(calls == 2);
        REQUIRE(r.message().find("disk on fire") != std::string::npos);
    }
}

TEST_CASE("Integrity check maps fsck outcomes") {
    TempDir tmp("memsync_integrity");
    auto runner = std::make_shared<ScriptedRunner>();
    CommandExecutor exec(runner, RecordingSleeper().fn());
    RecoveryEngine engine(tmp.path, exec, RecordingSleeper().fn());

    REQUIRE(engine.validate_repository_integrity().error_code() ==
            std::optional<std::string>("NO_REPOSITORY"));
    REQUIRE(runner->calls().empty());

    fs::create_directories(tmp.path / ".git");
    SECTION("clean") {
        SyncResult r = engine.validate_repository_integrity();
        REQUIRE(r.success());
        REQUIRE(runner->calls().front() ==
                std::vector<std::string>{"git", "fsck", "--no-progress"});
    }
    SECTION("fsck reports problems") {
        runner->on({"fsck"}, 1, "", "error: object 1234 is corrupt");
        SyncResult r = engine.validate_repository_integrity();
        REQUIRE(r.error_code() == std::optional<std::string>("INTEGRITY_FAILED"));
        REQUIRE(r.message().find("corrupt") != std::string::npos);
        REQUIRE(categorize_error(r.message()) == ErrorCategory::REPOSITORY_CORRUPTION);
    }
    SECTION("fsck hangs") {
        runner->timeout_on({"fsck"});
        REQUIRE(engine.validate_repository_integrity().error_code() ==
                std::optional<std::string>("INTEGRITY_TIMEOUT"));
    }
    SECTION("fsck cannot start") {
        runner->throw_on({"fsck"});
        REQUIRE(engine.validate_repository_integrity().error_code() ==
                std::optional<std::string>("INTEGRITY_ERROR"));
    }
}

TEST_CASE("Corruption recovery repairs or reinitializes") {
    git::GitInitGuard guard;
    TempDir tmp("memsync_corrupt");
    auto runner = std::make_shared<ScriptedRunner>();
    CommandExecutor exec(runner, RecordingSleeper().fn());
    RecoveryEngine engine(tmp.path, exec, RecordingSleeper().fn());
    REQUIRE(git::init_repo(tmp.path, "main"));
    memsync::test_support::write_file(tmp.path / "files" / "m1.md", "keep me");

    SECTION("gc is enough") {
        SyncResult r = engine.recover_corrupted_repository("main");
        REQUIRE(r.success());
        REQUIRE(r.message() == "Repository corruption repaired successfully");
        REQUIRE(runner->count({"gc", "--prune=now"}) == 1);
        REQUIRE(runner->timeouts().front() == std::chrono::seconds(60));
    }
    SECTION("still corrupt after gc") {
        runner->on({"fsck"}, 1, "", "error: corrupt loose object");
        fs::create_directories(tmp.path / ".git" / "marker");
        SyncResult r = engine.recover_corrupted_repository("trunk");
        REQUIRE(r.success());
        REQUIRE(r.message().find("reinitialized") != std::string::npos);
        REQUIRE_FALSE(fs::exists(tmp.path / ".git" / "marker"));
        REQUIRE(git::is_git_repo(tmp.path));
        REQUIRE(git::get_current_branch(tmp.path) == std::optional<std::string>("trunk"));
        REQUIRE(memsync::test_support::read_file(tmp.path / "files" / "m1.md") == "keep me");
    }
}
