#include "branch_detector.hpp"
#include <exception>
#include <sstream>
#include <utility>
#include "command_executor.hpp"
#include "logger.hpp"

namespace memsync {

BranchDetector::BranchDetector(std::shared_ptr<procutil::ProcessRunner> runner)
    : runner_(std::move(runner)) {}

std::optional<std::string> BranchDetector::parse_symref(const std::string& ls_remote_output) {
    const std::string prefix = "ref: refs/heads/";
    std::istringstream iss(ls_remote_output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.rfind(prefix, 0) != 0)
            continue;
        std::string rest = line.substr(prefix.size());
        size_t tab = rest.find('\t');
        if (tab == std::string::npos || rest.substr(tab + 1).rfind("HEAD", 0) != 0)
            continue;
        std::string name = rest.substr(0, tab);
        if (!name.empty())
            return name;
    }
    return std::nullopt;
}

std::optional<std::string> BranchDetector::probe(const std::vector<std::string>& argv,
                                                 const std::filesystem::path& repo_dir) const {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::is_directory(repo_dir, ec) ? repo_dir : "";
    try {
        procutil::ProcessResult res = runner_->run(argv, cwd, kDefaultCommandTimeout);
        if (res.timed_out || res.exit_code != 0) {
            log_debug("Branch probe failed", {{"command", procutil::format_command(argv)},
                                              {"exit", std::to_string(res.exit_code)}});
            return std::nullopt;
        }
        return res.out;
    } catch (const std::exception& e) {
        log_debug("Branch probe raised", {{"command", procutil::format_command(argv)},
                                          {"error", e.what()}});
        return std::nullopt;
    }
}

std::string BranchDetector::detect(const std::string& remote_url,
                                   const std::filesystem::path& repo_dir) const {
    if (auto out = probe({"git", "ls-remote", "--symref", remote_url, "HEAD"}, repo_dir)) {
        if (auto name = parse_symref(*out)) {
            log_debug("Default branch from remote HEAD: " + *name);
            return *name;
        }
    }
    for (const char* candidate : {"main", "master"}) {
        auto out = probe({"git", "ls-remote", "--heads", remote_url, candidate}, repo_dir);
        if (out && out->find_first_not_of(" \t\r\n") != std::string::npos) {
            log_debug(std::string("Default branch from branch probe: ") + candidate);
            return candidate;
        }
    }
    log_info("Could not detect remote default branch, using main",
             {{"remote", remote_url}});
    return "main";
}

} // namespace memsync
