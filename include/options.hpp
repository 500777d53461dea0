#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "logger.hpp"
#include "sync_config.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_rotate = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
    bool perf_log = false; ///< Time git operations and log a summary on exit
};

struct Options {
    memsync::SyncConfig sync;
    LoggingOptions logging;
    std::filesystem::path config_file;
    std::string command;           ///< First positional argument
    std::vector<std::string> args; ///< Remaining positional arguments
    bool json = false;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Read the `MEMSYNC_*` environment variables.
 *
 * @return Values keyed by the long flag they correspond to, e.g.
 *         `MEMSYNC_REMOTE_URL` becomes `--remote-url`. Unset variables are
 *         absent from the map.
 */
std::map<std::string, std::string> load_env_config();

/**
 * Parse command-line arguments, configuration files and the environment to
 * populate an Options instance.
 *
 * Later sources win: built-in defaults, then the file named by
 * `--config-yaml`/`--config-json`, then the environment, then the command
 * line.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error naming the offending flag on invalid input.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
