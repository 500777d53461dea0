#include "system_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#ifndef _WIN32
#include <sys/stat.h>
extern char** environ;
#endif

namespace procutil {

std::string resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos)
        return name;
    const char* path = std::getenv("PATH");
    if (!path)
        return "";
#ifdef _WIN32
    const char sep = ';';
    const char* exts[] = {".exe", ".cmd", ".bat", ""};
#else
    const char sep = ':';
    const char* exts[] = {""};
#endif
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, sep)) {
        if (dir.empty())
            continue;
        for (const char* ext : exts) {
            std::filesystem::path candidate = std::filesystem::path(dir) / (name + ext);
#ifdef _WIN32
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
                return candidate.string();
#else
            struct stat st {};
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                access(candidate.c_str(), X_OK) == 0)
                return candidate.string();
#endif
        }
    }
    return "";
}

std::vector<std::string> environment_with(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
#ifdef _WIN32
    char** entries = _environ;
#else
    char** entries = environ;
#endif
    for (char** e = entries; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        if (overrides.count(key) == 0)
            env.push_back(entry);
    }
    for (const auto& [k, v] : overrides)
        env.push_back(k + "=" + v);
    return env;
}

} // namespace procutil
