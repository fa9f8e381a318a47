#ifndef REPO_OPTIONS_HPP
#define REPO_OPTIONS_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

/** Per-repository settings from the `repositories:` config section. */
struct RepoOverride {
    std::optional<bool> exclude_from_checks;
    std::optional<std::string> alternative_remote;
};

/**
 * @brief Settings shared by the scanner, the monitor and the manager.
 *
 * Exclude entries are matched as substrings of a directory's base name.
 */
struct ManagerConfig {
    std::filesystem::path root_dir;
    std::set<std::string> scan_excludes{"node_modules", ".git", ".venv"};
    std::set<std::string> check_excludes;
    std::chrono::milliseconds check_interval = std::chrono::minutes(30);
    std::filesystem::path cache_file = ".autogitpush_cache.txt";
    /// Keys are repository paths; relative keys are resolved against root_dir.
    std::map<std::filesystem::path, RepoOverride> repo_overrides;
};

#endif // REPO_OPTIONS_HPP
