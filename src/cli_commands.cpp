#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

#include "cli_commands.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {
const std::map<std::string, size_t> kArgCounts{
    {"status", 0}, {"sync", 2}, {"validate", 0}, {"branch", 0}};

nlohmann::json optional_json(const std::optional<std::string>& v) {
    if (v)
        return *v;
    return nullptr;
}

void print_failure(const memsync::SyncResult& r, std::ostream& err) {
    err << "Error [" << r.error_code().value_or("UNKNOWN_ERROR") << "]: " << r.message() << "\n";
}
} // namespace

std::optional<int> check_usage(const Options& opts, std::ostream& err) {
    if (opts.command.empty()) {
        err << "No command given (status, sync, validate, branch); see --help\n";
        return 2;
    }
    auto it = kArgCounts.find(opts.command);
    if (it == kArgCounts.end()) {
        err << "Unknown command: " << opts.command << "\n";
        return 2;
    }
    if (opts.args.size() != it->second) {
        if (opts.command == "sync")
            err << "Usage: memsync sync <memory-id> <filename>\n";
        else
            err << opts.command << " takes no arguments\n";
        return 2;
    }
    return std::nullopt;
}

std::string status_json(const memsync::RepositoryStatus& status,
                        const std::optional<memsync::RepositoryInfo>& info) {
    nlohmann::json j;
    j["initialized"] = status.initialized;
    j["sync_enabled"] = status.sync_enabled;
    j["repository_exists"] = status.repository_exists;
    j["remote_configured"] = status.remote_configured;
    j["remote_url"] = status.remote_url;
    j["actual_remote_url"] = optional_json(status.actual_remote_url);
    j["last_error"] = optional_json(status.last_error);
    if (info) {
        j["state"] = memsync::to_string(info->state);
        j["default_branch"] = info->default_branch;
        j["local_branch"] = optional_json(info->local_branch);
        j["remote_exists"] = info->remote_exists;
        j["tracking_configured"] = info->tracking_configured;
        j["needs_sync"] = info->needs_sync;
    }
    return j.dump(2);
}

memsync::SyncDependencies make_dependencies(const Options& opts) {
    memsync::SyncDependencies deps;
    if (opts.logging.perf_log)
        deps.monitor = std::make_shared<memsync::LoggingPerformanceMonitor>();
    return deps;
}

int handle_status(const Options& opts, memsync::SyncManager& manager, std::ostream& out) {
    memsync::RepositoryStatus status = manager.get_repository_status();
    std::optional<memsync::RepositoryInfo> info;
    if (status.sync_enabled)
        info = manager.repository_info();
    if (opts.json) {
        out << status_json(status, info) << "\n";
        return 0;
    }
    auto yes_no = [](bool b) { return b ? "yes" : "no"; };
    out << "Sync enabled:      " << yes_no(status.sync_enabled) << "\n";
    out << "Initialized:       " << yes_no(status.initialized) << "\n";
    out << "Repository:        " << manager.config().repo_dir.string()
        << (status.repository_exists ? "" : " (missing)") << "\n";
    out << "Remote:            "
        << (status.remote_configured ? status.remote_url : std::string("(none)")) << "\n";
    if (status.actual_remote_url && *status.actual_remote_url != status.remote_url)
        out << "Origin:            " << *status.actual_remote_url << "\n";
    if (info) {
        out << "State:             " << memsync::to_string(info->state) << "\n";
        out << "Default branch:    " << info->default_branch << "\n";
        out << "Tracking:          " << yes_no(info->tracking_configured) << "\n";
    }
    if (status.last_error)
        out << "Last error:        " << *status.last_error << "\n";
    return 0;
}

int handle_sync(const Options& opts, memsync::SyncManager& manager, std::ostream& out,
                std::ostream& err) {
    const std::string& memory_id = opts.args.at(0);
    const std::string& filename = opts.args.at(1);
    const auto& cfg = manager.config();
    std::error_code ec;
    fs::path file = cfg.repo_dir / cfg.files_subdir / filename;
    if (!fs::is_regular_file(file, ec)) {
        err << "Memory file not found: " << file.string() << "\n";
        return 1;
    }
    memsync::SyncResult r = manager.sync_memory_with_retry(memory_id, filename);
    if (!r.success()) {
        print_failure(r, err);
        return 1;
    }
    out << r.message() << "\n";
    return 0;
}

int handle_validate(memsync::SyncManager& manager, std::ostream& out, std::ostream& err) {
    memsync::SyncResult r = manager.validate_and_recover();
    if (!r.success()) {
        print_failure(r, err);
        return 1;
    }
    out << r.message() << "\n";
    return 0;
}

int handle_branch(memsync::SyncManager& manager, std::ostream& out) {
    out << manager.repository_info().default_branch << "\n";
    return 0;
}

int run_command(const Options& opts, memsync::SyncManager& manager, std::ostream& out,
                std::ostream& err) {
    if (opts.command == "status")
        return handle_status(opts, manager, out);
    if (opts.command == "sync")
        return handle_sync(opts, manager, out, err);
    if (opts.command == "validate")
        return handle_validate(manager, out, err);
    if (opts.command == "branch")
        return handle_branch(manager, out);
    err << "Unknown command: " << opts.command << "\n";
    return 2;
}

} // namespace cli
