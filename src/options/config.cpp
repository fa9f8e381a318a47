// options_config.cpp
//
// Load configuration from a YAML or JSON file named on the command line.

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

void load_config_file(int argc, char* argv[], ConfigValues& cfg, fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short);
    if (pre_parser.has_flag("--config-yaml") && pre_parser.has_flag("--config-json"))
        throw std::runtime_error("--config-yaml and --config-json are mutually exclusive");
    if (pre_parser.has_flag("--config-yaml")) {
        std::string path = pre_parser.get_option("--config-yaml");
        if (path.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(path, cfg, err))
            throw std::runtime_error("Failed to load config " + path + ": " + err);
        config_file = path;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string path = pre_parser.get_option("--config-json");
        if (path.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(path, cfg, err))
            throw std::runtime_error("Failed to load config " + path + ": " + err);
        config_file = path;
    }
}
