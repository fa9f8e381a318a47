// options_repo_settings.cpp
//
// Parse per-repository override settings from configuration maps.

#include <map>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

void parse_repo_settings(Options& opts,
                         const std::map<std::string, std::map<std::string, std::string>>&
                             cfg_repo_opts) {
    for (const auto& [repo, values] : cfg_repo_opts) {
        if (repo.empty())
            throw std::runtime_error("Empty repository path in config");
        RepoOverride ro;
        for (const auto& [key, val] : values) {
            if (key == "--exclude-from-checks") {
                ro.exclude_from_checks = parse_bool_value(val);
            } else if (key == "--alternative-remote") {
                if (val.empty())
                    throw std::runtime_error("Invalid per-repo alternative-remote for " + repo);
                ro.alternative_remote = val;
            } else {
                throw std::runtime_error("Unknown option in config: " + repo + ": " + key);
            }
        }
        opts.manager.repo_overrides[fs::path(repo)] = ro;
    }
}
