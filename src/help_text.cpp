#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--remote-url", "-r", "<url>", "Remote repository to sync with", "Sync"},
        {"--repo-dir", "-d", "<path>", "Local repository (default ~/.memsync)", "Sync"},
        {"--files-subdir", "", "<dir>", "Directory holding memory files (default files)",
         "Sync"},
        {"--enable-sync", "", "", "Turn synchronization on (--enable-sync=false turns it off)",
         "Sync"},
        {"--disable-sync", "", "", "Turn synchronization off", "Sync"},
        {"--retry-attempts", "", "<n>", "Attempts per git command (default 3)", "Sync"},
        {"--retry-delay", "", "<sec>", "Base delay for exponential backoff (default 1.0)",
         "Sync"},
        {"--max-pending", "", "<n>", "Background syncs allowed to wait (default 64)", "Sync"},
        {"--user-name", "", "<name>", "Commit author name when none is configured", "Sync"},
        {"--user-email", "", "<email>", "Commit author email when none is configured", "Sync"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON", "Config"},
        {"--log-file", "-l", "<path>", "Write logs to file", "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning or error", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level debug", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file above this size", "Logging"},
        {"--log-rotate", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--json-log", "", "", "Write logs as JSON lines", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--perf-log", "", "", "Log slow operations and a timing summary", "Logging"},
        {"--json", "", "", "Machine readable status output", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    std::cout << "memsync - Git synchronization for memory files\n";
    std::cout << "Commits memory files to a local repository and pushes them to a remote.\n";
    std::cout << "Options can also come from YAML/JSON files and MEMSYNC_* variables.\n\n";
    std::cout << "Usage: " << prog << " [options] status [--json]\n";
    std::cout << "       " << prog << " [options] sync <memory-id> <filename>\n";
    std::cout << "       " << prog << " [options] validate\n";
    std::cout << "       " << prog << " [options] branch\n\n";
    const std::vector<std::string> order{"Basics", "Sync", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o)
                      << o->desc << "\n";
        }
        std::cout << "\n";
    }
}
