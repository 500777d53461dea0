/**
 * @file memsync.cpp
 * @brief CLI entry point for the memory synchronization engine.
 *
 * Parses options, sets up logging and runs a single command against the
 * configured repository.
 */

#include <iostream>
#include <memory>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "performance_monitor.hpp"
#include "version.hpp"

static void setup_logging(const LoggingOptions& log) {
    if (!log.log_file.empty()) {
        init_logger(log.log_file, log.log_level, log.max_log_size, log.log_rotate);
        set_json_logging(log.json_log);
        set_log_compression(log.compress_logs);
    } else {
        set_log_level(log.log_level);
    }
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
    set_console_logging(true, log.log_level > LogLevel::WARNING ? log.log_level
                                                                : LogLevel::WARNING);
}

/**
 * @brief Application entry point.
 *
 * @return 0 on success, 1 when the command or option parsing fails, 2 on
 *         usage errors.
 */
#ifndef MEMSYNC_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << MEMSYNC_VERSION << "\n";
            return 0;
        }
        if (auto rc = cli::check_usage(opts, std::cerr); rc)
            return *rc;
        setup_logging(opts.logging);
        int rc = 0;
        {
            memsync::SyncDependencies deps = cli::make_dependencies(opts);
            auto monitor =
                std::dynamic_pointer_cast<memsync::LoggingPerformanceMonitor>(deps.monitor);
            memsync::SyncManager manager(opts.sync, deps);
            rc = cli::run_command(opts, manager, std::cout, std::cerr);
            manager.wait_idle();
            if (monitor)
                monitor->log_summary();
        }
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // MEMSYNC_NO_MAIN
