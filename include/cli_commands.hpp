#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "options.hpp"
#include "sync_manager.hpp"

namespace cli {

/**
 * @brief Reject unknown commands and wrong argument counts.
 *
 * Writes a short message to @p err. Returns `2` for a usage error or
 * `std::nullopt` when @a opts names a runnable command.
 */
std::optional<int> check_usage(const Options& opts, std::ostream& err);

/**
 * @brief Print the repository status, as JSON when `--json` was given.
 */
int handle_status(const Options& opts, memsync::SyncManager& manager, std::ostream& out);

/**
 * @brief Commit (and push when a remote is configured) one memory file.
 *
 * The file must already exist below the configured files directory.
 */
int handle_sync(const Options& opts, memsync::SyncManager& manager, std::ostream& out,
                std::ostream& err);

/**
 * @brief Check repository integrity and repair it when needed.
 */
int handle_validate(memsync::SyncManager& manager, std::ostream& out, std::ostream& err);

/**
 * @brief Print the default branch of the repository.
 */
int handle_branch(memsync::SyncManager& manager, std::ostream& out);

/**
 * @brief Collaborators for the manager `main` builds.
 *
 * `--perf-log` installs a LoggingPerformanceMonitor; otherwise the manager
 * keeps its defaults.
 */
memsync::SyncDependencies make_dependencies(const Options& opts);

/**
 * @brief Dispatch @a opts.command to the matching handler.
 */
int run_command(const Options& opts, memsync::SyncManager& manager, std::ostream& out,
                std::ostream& err);

/// Status document as printed by `status --json`.
std::string status_json(const memsync::RepositoryStatus& status,
                        const std::optional<memsync::RepositoryInfo>& info);

} // namespace cli
