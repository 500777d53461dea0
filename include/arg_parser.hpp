#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`).
 * A list of known flags can be provided so that unknown flags are collected
 * and reported separately. Options may also be specified using the form
 * `--opt=value`. Flags listed in @a switches never consume the following
 * argument, so `--json status` keeps `status` positional. A mapping of short
 * options (like `-h`) to their long counterparts can optionally be supplied.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> switches_;             ///< Flags that take no value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool accept(const std::string& key) {
        if (known_flags_.empty() || known_flags_.count(key))
            return true;
        unknown_flags_.push_back(key);
        return false;
    }

    bool takes_value(const std::string& key, int i, int argc, char* argv[]) const {
        return !switches_.count(key) && i + 1 < argc && argv[i + 1][0] != '-';
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param switches Flags that never take a value.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& switches = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), switches_(switches), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string key = arg.substr(0, eq);
                    if (accept(key)) {
                        flags_.insert(key);
                        options_[key] = arg.substr(eq + 1);
                    }
                } else if (takes_value(arg, i, argc, argv)) {
                    std::string val = argv[++i];
                    if (accept(arg)) {
                        flags_.insert(arg);
                        options_[arg] = val;
                    }
                } else if (accept(arg)) {
                    flags_.insert(arg);
                }
            } else if (arg.size() == 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                const std::string key = short_map_.at(arg[1]);
                if (takes_value(key, i, argc, argv)) {
                    std::string val = argv[++i];
                    if (accept(key)) {
                        flags_.insert(key);
                        options_[key] = val;
                    }
                } else if (accept(key)) {
                    flags_.insert(key);
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                unknown_flags_.push_back(arg);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
