#include "options.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

static const std::set<std::string> kKnown{
    "--config-yaml",   "--config-json",    "--enable-sync",   "--disable-sync",
    "--remote-url",    "--repo-dir",       "--retry-attempts", "--retry-delay",
    "--files-subdir",  "--user-name",      "--user-email",    "--max-pending",
    "--log-file",      "--log-level",      "--max-log-size",  "--log-rotate",
    "--json-log",      "--compress-logs",  "--syslog",        "--syslog-facility",
    "--verbose",       "--perf-log",       "--json",          "--help",
    "--version"};

static const std::set<std::string> kSwitches{"--enable-sync", "--disable-sync", "--json-log",
                                             "--compress-logs", "--syslog",     "--verbose",
                                             "--perf-log",      "--json",       "--help",
                                             "--version"};

// Options that only make sense on the command line.
static const std::set<std::string> kCliOnly{"--config-yaml", "--config-json", "--help",
                                            "--version", "--json"};

static const std::map<std::string, std::string> kEnvVars{
    {"MEMSYNC_ENABLE_SYNC", "--enable-sync"},
    {"MEMSYNC_REMOTE_URL", "--remote-url"},
    {"MEMSYNC_REPO_DIR", "--repo-dir"},
    {"MEMSYNC_RETRY_ATTEMPTS", "--retry-attempts"},
    {"MEMSYNC_RETRY_DELAY", "--retry-delay"},
    {"MEMSYNC_LOG_LEVEL", "--log-level"},
    {"MEMSYNC_LOG_FILE", "--log-file"}};

std::map<std::string, std::string> load_env_config() {
    std::map<std::string, std::string> out;
    for (const auto& [var, flag] : kEnvVars) {
        const char* v = std::getenv(var.c_str());
        if (v)
            out[flag] = v;
    }
    return out;
}

static void load_config_file(const ArgParser& parser, std::map<std::string, std::string>& values,
                             fs::path& config_file) {
    std::string err;
    if (parser.has_flag("--config-yaml") && parser.has_flag("--config-json"))
        throw std::runtime_error("--config-yaml and --config-json are mutually exclusive");
    if (parser.has_flag("--config-yaml")) {
        config_file = parser.get_option("--config-yaml");
        if (config_file.empty())
            throw std::runtime_error("--config-yaml requires a file");
        if (!load_yaml_config(config_file.string(), values, err))
            throw std::runtime_error("Failed to load config: " + err);
    } else if (parser.has_flag("--config-json")) {
        config_file = parser.get_option("--config-json");
        if (config_file.empty())
            throw std::runtime_error("--config-json requires a file");
        if (!load_json_config(config_file.string(), values, err))
            throw std::runtime_error("Failed to load config: " + err);
    }
    for (const auto& kv : values) {
        if (!kKnown.count(kv.first) || kCliOnly.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
}

static bool flag_value(const std::map<std::string, std::string>& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end())
        return false;
    bool ok = false;
    bool v = parse_bool(it->second, ok);
    if (!ok)
        throw std::runtime_error("Invalid value for " + key);
    return v;
}

static std::string required_value(const std::map<std::string, std::string>& values,
                                  const std::string& key) {
    const std::string& v = values.at(key);
    if (v.empty())
        throw std::runtime_error(key + " requires a value");
    return v;
}

Options parse_options(int argc, char* argv[]) {
    const std::map<char, std::string> short_opts{{'h', "--help"},        {'V', "--version"},
                                                 {'y', "--config-yaml"}, {'j', "--config-json"},
                                                 {'r', "--remote-url"},  {'d', "--repo-dir"},
                                                 {'l', "--log-file"},    {'L', "--log-level"},
                                                 {'v', "--verbose"}};
    ArgParser parser(argc, argv, kKnown, kSwitches, short_opts);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    std::map<std::string, std::string> values;
    load_config_file(parser, values, opts.config_file);
    for (const auto& kv : load_env_config())
        values[kv.first] = kv.second;
    for (const auto& flag : parser.flags())
        values[flag] = parser.get_option(flag);

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.json = parser.has_flag("--json");
    const auto& pos = parser.positional();
    if (!pos.empty()) {
        opts.command = pos.front();
        opts.args.assign(pos.begin() + 1, pos.end());
    }

    memsync::SyncConfig& sync = opts.sync;
    bool ok = false;
    if (values.count("--enable-sync"))
        sync.enable_sync = flag_value(values, "--enable-sync");
    if (flag_value(values, "--disable-sync"))
        sync.enable_sync = false;
    if (values.count("--remote-url")) {
        const std::string& url = values.at("--remote-url");
        if (url.empty())
            sync.remote_url.reset();
        else
            sync.remote_url = url;
    }
    sync.repo_dir = memsync::normalize_repo_dir(
        values.count("--repo-dir") ? fs::path(required_value(values, "--repo-dir"))
                                   : memsync::default_repo_dir());
    if (values.count("--retry-attempts")) {
        sync.retry_attempts = parse_int(values.at("--retry-attempts"), 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --retry-attempts");
    }
    if (values.count("--retry-delay")) {
        sync.retry_delay = parse_double(values.at("--retry-delay"), 0.0, 3600.0, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --retry-delay");
    }
    if (values.count("--files-subdir"))
        sync.files_subdir = required_value(values, "--files-subdir");
    if (values.count("--user-name"))
        sync.user_name = required_value(values, "--user-name");
    if (values.count("--user-email"))
        sync.user_email = required_value(values, "--user-email");
    if (values.count("--max-pending")) {
        sync.max_pending_syncs = parse_size_t(values.at("--max-pending"), 1, 100000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-pending");
    }

    LoggingOptions& log = opts.logging;
    if (values.count("--log-file"))
        log.log_file = values.at("--log-file");
    if (values.count("--log-level")) {
        const std::string val = required_value(values, "--log-level");
        if (!parse_log_level(val, log.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (flag_value(values, "--verbose"))
        log.log_level = LogLevel::DEBUG;
    if (values.count("--max-log-size")) {
        log.max_log_size = parse_bytes(values.at("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (values.count("--log-rotate")) {
        log.log_rotate = parse_size_t(values.at("--log-rotate"), 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-rotate");
    }
    log.json_log = flag_value(values, "--json-log");
    log.compress_logs = flag_value(values, "--compress-logs");
    log.use_syslog = flag_value(values, "--syslog");
    log.perf_log = flag_value(values, "--perf-log");
    if (values.count("--syslog-facility")) {
        log.syslog_facility = parse_int(values.at("--syslog-facility"), 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
    }

    std::string err;
    if (!memsync::validate_config(sync, err))
        throw std::runtime_error(err);
    return opts;
}
