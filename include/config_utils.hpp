#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars become `--key` entries. Mappings one level deep are
 * treated as categories (e.g. `logging:`) whose scalar children are flattened
 * into @p opts the same way, so both
 *
 *     remote-url: git@host:memories.git
 *
 * and
 *
 *     sync:
 *       remote-url: git@host:memories.git
 *
 * yield `--remote-url`.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
