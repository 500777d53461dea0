#ifndef MEMSYNC_BRANCH_DETECTOR_HPP
#define MEMSYNC_BRANCH_DETECTOR_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "process_runner.hpp"

namespace memsync {

/**
 * @brief Determines the default branch of a remote repository.
 *
 * Probes, first hit wins:
 *  1. `git ls-remote --symref <url> HEAD`
 *  2. `git ls-remote --heads <url> main`
 *  3. `git ls-remote --heads <url> master`
 *  4. `"main"`
 *
 * Every probe runs once with a 30 second timeout. Detection never fails.
 */
class BranchDetector {
  public:
    explicit BranchDetector(std::shared_ptr<procutil::ProcessRunner> runner);

    std::string detect(const std::string& remote_url,
                       const std::filesystem::path& repo_dir) const;

    /**
     * @brief Extract `<name>` from a `ref: refs/heads/<name>\tHEAD` line.
     */
    static std::optional<std::string> parse_symref(const std::string& ls_remote_output);

  private:
    std::optional<std::string> probe(const std::vector<std::string>& argv,
                                     const std::filesystem::path& repo_dir) const;

    std::shared_ptr<procutil::ProcessRunner> runner_;
};

} // namespace memsync

#endif // MEMSYNC_BRANCH_DETECTOR_HPP
