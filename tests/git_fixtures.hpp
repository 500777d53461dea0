#pragma once
#include <atomic>
#include <cstdio>
#include <string>
#include "test_common.hpp"

namespace memsync::test_support {

inline int git_cmd(const std::string& args) {
    std::string cmd = "git -c user.name=tester -c user.email=tester@example.com " + args + REDIR;
    return std::system(cmd.c_str());
}

inline std::string quoted(const fs::path& p) { return "\"" + p.string() + "\""; }

/// First line of `git -C dir <args>` stdout, empty on failure.
inline std::string git_output(const fs::path& dir, const std::string& args) {
    std::string cmd = "git -C " + quoted(dir) + " " + args;
#ifdef _WIN32
    FILE* pipe = _popen(cmd.c_str(), "r");
#else
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (!pipe)
        return "";
    std::string out;
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe))
        out += buf;
#ifdef _WIN32
    _pclose(pipe);
#else
    pclose(pipe);
#endif
    return out.substr(0, out.find('\n'));
}

/**
 * Bare repository at @p root/remote.git whose `main` holds files/seed.md.
 */
inline fs::path make_seeded_remote(const fs::path& root) {
    const fs::path bare = root / "remote.git";
    const fs::path seed = root / "seed";
    REQUIRE(git_cmd("init -q --bare " + quoted(bare)) == 0);
    REQUIRE(git_in(bare, "symbolic-ref HEAD refs/heads/main") == 0);
    REQUIRE(git_cmd("init -q " + quoted(seed)) == 0);
    REQUIRE(git_in(seed, "checkout -q -b main") == 0);
    write_file(seed / "files" / "seed.md", "seed memory\n");
    REQUIRE(git_in(seed, "add -A") == 0);
    REQUIRE(git_in(seed, "commit -q -m seed") == 0);
    REQUIRE(git_in(seed, "remote add origin " + quoted(bare)) == 0);
    REQUIRE(git_in(seed, "push -q origin main") == 0);
    return bare;
}

/**
 * Commit @p content to @p rel_path through a fresh clone and push it to `main`.
 */
inline void push_remote_change(const fs::path& root, const fs::path& bare,
                               const std::string& rel_path, const std::string& content) {
    static std::atomic<int> counter{0};
    const fs::path work = root / ("other_" + std::to_string(counter++));
    REQUIRE(git_cmd("clone -q " + quoted(bare) + " " + quoted(work)) == 0);
    write_file(work / rel_path, content);
    REQUIRE(git_in(work, "add -A") == 0);
    REQUIRE(git_in(work, "commit -q -m \"remote change\"") == 0);
    REQUIRE(git_in(work, "push -q origin main") == 0);
}

} // namespace memsync::test_support
