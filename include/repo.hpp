#ifndef REPO_HPP
#define REPO_HPP
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief A repository discovered by the scanner.
 *
 * Entries are produced by RepoScanner only and are not modified afterwards.
 */
struct RepositoryEntry {
    std::filesystem::path path;                   ///< Absolute path, unique within a run
    bool excluded_from_checks = false;            ///< Tracked, but never committed or pushed
    std::optional<std::string> alternative_remote; ///< Push target instead of the default

    bool operator==(const RepositoryEntry& o) const {
        return path == o.path && excluded_from_checks == o.excluded_from_checks &&
               alternative_remote == o.alternative_remote;
    }
};

#endif // REPO_HPP
