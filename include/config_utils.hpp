#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load release options from a YAML file.
 *
 * Top-level scalars become `--key` entries. A top-level map is treated as a
 * section (for example `publish:` or `logging:`) whose scalar members are
 * flattened into `--member` entries. Sequences are joined with commas so
 * list options such as `resource` can be written as YAML lists.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load release options from a JSON file.
 *
 * Same flattening rules as load_yaml_config(): objects are sections and
 * arrays are joined with commas.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
