#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * The root node must be a map. Scalar values are stored under their key
 * prefixed with `--` so they can be merged with command line options. A
 * nested map (for example a `logging:` section) is flattened one level; its
 * keys are stored the same way. Sequences are rejected.
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
 * Same layout rules as load_yaml_config(): the root must be an object,
 * nested objects are flattened one level and arrays are rejected.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
