#include <algorithm>
#include <climits>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Timing and per-repository settings are parsed in src/options/timing.cpp
// and src/options/repo_settings.cpp.

namespace {

const std::set<std::string> kKnownFlags{"--root",
                                        "--interval",
                                        "--scan-exclude",
                                        "--check-exclude",
                                        "--no-default-excludes",
                                        "--cache-file",
                                        "--rescan",
                                        "--clear-cache",
                                        "--single-run",
                                        "--remote",
                                        "--author-name",
                                        "--author-email",
                                        "--ssh-public-key",
                                        "--ssh-private-key",
                                        "--credential-file",
                                        "--summary-url",
                                        "--summary-timeout",
                                        "--summary-max-bytes",
                                        "--log-file",
                                        "--log-level",
                                        "--verbose",
                                        "--max-log-size",
                                        "--log-files",
                                        "--json-log",
                                        "--compress-logs",
                                        "--syslog",
                                        "--silent",
                                        "--help",
                                        "--version",
                                        "--config-yaml",
                                        "--config-json"};

const std::map<char, std::string> kShortFlags{{'o', "--root"},        {'i', "--interval"},
                                              {'x', "--scan-exclude"}, {'X', "--check-exclude"},
                                              {'C', "--cache-file"},  {'u', "--single-run"},
                                              {'l', "--log-file"},    {'L', "--log-level"},
                                              {'g', "--verbose"},     {'s', "--silent"},
                                              {'h', "--help"},        {'V', "--version"},
                                              {'y', "--config-yaml"}, {'j', "--config-json"}};

// Options that only make sense on the command line.
const std::set<std::string> kCliOnly{"--help", "--version", "--config-yaml", "--config-json"};

} // namespace

Options parse_options(int argc, char* argv[]) {
    ConfigValues cfg;
    Options opts;
    load_config_file(argc, argv, cfg, opts.config_file);

    ArgParser parser(argc, argv, kKnownFlags, kShortFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    auto check_key = [](const std::string& key) {
        if (!kKnownFlags.count(key) || kCliOnly.count(key))
            throw std::runtime_error("Unknown option in config: " + key);
    };
    for (const auto& kv : cfg.opts)
        check_key(kv.first);
    for (const auto& kv : cfg.list_opts)
        check_key(kv.first);

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg.opts.find(k);
        return it != cfg.opts.end() && parse_bool_value(it->second);
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg.opts.find(k);
        if (it != cfg.opts.end())
            return it->second;
        return std::string();
    };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    // CLI value if given, otherwise the config value, otherwise empty.
    auto value = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k);
        return cfg_opt(k);
    };
    auto has_value = [&](const std::string& k) {
        return parser.has_flag(k) || cfg.opts.count(k) > 0;
    };
    // Repeatable options: CLI values replace the config list.
    auto list = [&](const std::string& k) {
        std::vector<std::string> vals = parser.get_all_options(k);
        if (!vals.empty() || parser.has_flag(k))
            return vals;
        auto it = cfg.list_opts.find(k);
        if (it != cfg.list_opts.end())
            return it->second;
        if (cfg.opts.count(k))
            return std::vector<std::string>{cfg_opt(k)};
        return std::vector<std::string>{};
    };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    if (has_value("--root"))
        opts.manager.root_dir = value("--root");
    else if (!parser.positional().empty())
        opts.manager.root_dir = parser.positional().front();
    if (opts.manager.root_dir.empty())
        throw std::runtime_error("--root is required");

    if (flag("--no-default-excludes"))
        opts.manager.scan_excludes.clear();
    for (const auto& v : list("--scan-exclude")) {
        if (v.empty())
            throw std::runtime_error("Invalid value for --scan-exclude");
        opts.manager.scan_excludes.insert(v);
    }
    for (const auto& v : list("--check-exclude")) {
        if (v.empty())
            throw std::runtime_error("Invalid value for --check-exclude");
        opts.manager.check_excludes.insert(v);
    }
    if (has_value("--cache-file")) {
        std::string val = value("--cache-file");
        if (val.empty())
            throw std::runtime_error("--cache-file requires a path");
        opts.manager.cache_file = val;
    }
    opts.rescan = flag("--rescan");
    opts.clear_cache = flag("--clear-cache");
    opts.single_run = flag("--single-run");

    parse_timing_options(opts, parser, cfg_opt, cfg);

    if (has_value("--remote")) {
        std::string val = value("--remote");
        if (val.empty())
            throw std::runtime_error("--remote requires a name");
        opts.git.default_remote = val;
    }
    if (has_value("--author-name"))
        opts.git.signature.name = value("--author-name");
    if (has_value("--author-email"))
        opts.git.signature.email = value("--author-email");
    if (opts.git.signature.name.empty() || opts.git.signature.email.empty())
        throw std::runtime_error("Author name and email must not be empty");
    opts.git.credentials.ssh_public_key = value("--ssh-public-key");
    opts.git.credentials.ssh_private_key = value("--ssh-private-key");
    opts.git.credentials.credential_file = value("--credential-file");

    opts.summary.url = value("--summary-url");
    bool ok = false;
    if (has_value("--summary-max-bytes")) {
        opts.summary.max_bytes = parse_bytes(value("--summary-max-bytes"), 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --summary-max-bytes");
    }

    opts.logging.log_file = value("--log-file");
    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (has_value("--log-level")) {
        std::string val = value("--log-level");
        if (!parse_log_level(val, opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (has_value("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(value("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (has_value("--log-files")) {
        opts.logging.log_files = parse_size_t(value("--log-files"), 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    opts.logging.use_syslog = flag("--syslog");
    opts.logging.silent = flag("--silent");

    parse_repo_settings(opts, cfg.repo_opts);
    return opts;
}
