#include "process_runner.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include "system_utils.hpp"
#ifdef _WIN32
#include <array>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace procutil {

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty())
            out += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos)
            out += "\"" + a + "\"";
        else
            out += a;
    }
    return out;
}

SubprocessRunner::SubprocessRunner(std::map<std::string, std::string> env_overrides)
    : env_overrides_(std::move(env_overrides)) {}

#ifdef _WIN32

static std::string quote_arg(const std::string& a) {
    if (!a.empty() && a.find_first_of(" \t\"") == std::string::npos)
        return a;
    std::string q = "\"";
    for (char c : a) {
        if (c == '"')
            q += '\\';
        q += c;
    }
    q += '"';
    return q;
}

ProcessResult SubprocessRunner::run(const std::vector<std::string>& argv,
                                    const std::filesystem::path& cwd, std::chrono::seconds) {
    if (argv.empty())
        throw std::invalid_argument("empty command line");
    for (const auto& [k, v] : env_overrides_)
        _putenv_s(k.c_str(), v.c_str());
    std::string cmd;
    if (!cwd.empty())
        cmd = "cd /d " + quote_arg(cwd.string()) + " && ";
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0)
            cmd += ' ';
        cmd += quote_arg(argv[i]);
    }
    cmd += " 2>&1";
    FILE* pipe = _popen(cmd.c_str(), "r");
    if (!pipe)
        throw std::system_error(errno, std::generic_category(), "_popen");
    ProcessResult res;
    std::array<char, 4096> buf{};
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe))
        res.out += buf.data();
    res.exit_code = _pclose(pipe);
    // stdout and stderr share the pipe; mirror into err so failures carry text.
    if (res.exit_code != 0)
        res.err = res.out;
    return res;
}

#else

static void child_fail(const char* msg) {
    ssize_t rc = write(STDERR_FILENO, msg, std::strlen(msg));
    (void)rc;
}

ProcessResult SubprocessRunner::run(const std::vector<std::string>& argv,
                                    const std::filesystem::path& cwd,
                                    std::chrono::seconds timeout) {
    if (argv.empty())
        throw std::invalid_argument("empty command line");

    ProcessResult res;
    const std::string exe = resolve_executable(argv[0]);
    if (exe.empty()) {
        res.exit_code = 127;
        res.err = argv[0] + ": command not found";
        return res;
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> env = environment_with(env_overrides_);
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv)
        c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);
    std::vector<char*> c_env;
    c_env.reserve(env.size() + 1);
    for (auto& e : env)
        c_env.push_back(const_cast<char*>(e.c_str()));
    c_env.push_back(nullptr);
    const std::string dir = cwd.string();

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe");
    UniqueFd out_r(out_pipe[0]);
    UniqueFd out_w(out_pipe[1]);
    if (pipe(err_pipe) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe");
    UniqueFd err_r(err_pipe[0]);
    UniqueFd err_w(err_pipe[1]);

    pid_t pid = fork();
    if (pid < 0)
        throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_w.get(), STDOUT_FILENO);
        dup2(err_w.get(), STDERR_FILENO);
        close(out_r.get());
        close(err_r.get());
        close(out_w.get());
        close(err_w.get());
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            child_fail("memsync: cannot change to working directory\n");
            _exit(126);
        }
        execve(exe.c_str(), c_argv.data(), c_env.data());
        child_fail("memsync: exec failed\n");
        _exit(127);
    }
    out_w.reset();
    err_w.reset();

    const bool limited = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    while (out_r || err_r) {
        pollfd fds[2];
        UniqueFd* owners[2];
        nfds_t n = 0;
        if (out_r) {
            fds[n] = {out_r.get(), POLLIN, 0};
            owners[n++] = &out_r;
        }
        if (err_r) {
            fds[n] = {err_r.get(), POLLIN, 0};
            owners[n++] = &err_r;
        }
        int wait_ms = -1;
        if (limited) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }
        int rc = poll(fds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0) {
            res.timed_out = true;
            if (kill(-pid, SIGKILL) != 0)
                kill(pid, SIGKILL);
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                (owners[i] == &out_r ? res.out : res.err).append(buf, static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                owners[i]->reset();
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (WIFEXITED(status))
        res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        res.exit_code = 128 + WTERMSIG(status);
    return res;
}

#endif

} // namespace procutil
