#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Options read from a configuration file, keyed like CLI flags.
 *
 * Scalar keys become `--key` entries in @ref opts. Sequences become
 * @ref list_opts entries (one value per element). Nested maps other than
 * `repositories` are flattened into the same two maps, so
 * `logging: {log-file: x}` is equivalent to `log-file: x`.
 * `repositories` maps a repository path to its own `--key` overrides.
 */
struct ConfigValues {
    std::map<std::string, std::string> opts;
    std::map<std::string, std::vector<std::string>> list_opts;
    std::map<std::string, std::map<std::string, std::string>> repo_opts;

    /** @return `true` when @p key appears as a scalar or a list. */
    bool has(const std::string& key) const { return opts.count(key) || list_opts.count(key); }
};

/**
 * @brief Load configuration options from a YAML file.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param cfg   Receives the parsed values; existing entries are overwritten.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, ConfigValues& cfg, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigValues& cfg, std::string& error);

#endif // CONFIG_UTILS_HPP
