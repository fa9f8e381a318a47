#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include "command_runner.hpp"
#include "config_utils.hpp"
#include "logger.hpp"
#include "repo_options.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    bool silent = false;
};

struct SummaryOptions {
    std::string url; ///< Empty means local diff statistics only
    std::chrono::milliseconds timeout{10000};
    size_t max_bytes = 64 * 1024;
};

struct Options {
    ManagerConfig manager;
    GitRunnerOptions git;
    SummaryOptions summary;
    LoggingOptions logging;
    bool rescan = false;
    bool clear_cache = false;
    bool single_run = false;
    bool show_help = false;
    bool print_version = false;
    std::filesystem::path config_file;
};

class ArgParser;

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Values given on the command line override those of the configuration file.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown options, unknown config keys or
 *         invalid values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Load the file named by `--config-yaml` or `--config-json`, if any.
 *
 * @param cfg         Receives the parsed configuration.
 * @param config_file Set to the loaded file's path.
 */
void load_config_file(int argc, char* argv[], ConfigValues& cfg,
                      std::filesystem::path& config_file);

/**
 * Parse `--interval` and `--summary-timeout`.
 */
void parse_timing_options(Options& opts, const ArgParser& parser,
                          const std::function<std::string(const std::string&)>& cfg_opt,
                          const ConfigValues& cfg);

/**
 * Turn the `repositories:` section into per-repository overrides.
 *
 * Recognized keys are `exclude-from-checks` and `alternative-remote`.
 */
void parse_repo_settings(Options& opts,
                         const std::map<std::string, std::map<std::string, std::string>>&
                             cfg_repo_opts);

#endif // OPTIONS_HPP
