#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

static bool all_digits(const std::string& v) {
    return !v.empty() &&
           std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); });
}

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::logic_error&) {
        return 0;
    }
}

double parse_double(const std::string& value, double min, double max, bool& ok) {
    ok = false;
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size() || v < min || v > max)
            return 0.0;
        ok = true;
        return v;
    } catch (const std::logic_error&) {
        return 0.0;
    }
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("tb")) {
        mult = 1024ull * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("b")) {
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    const std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
