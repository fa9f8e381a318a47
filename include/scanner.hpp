#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <deque>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cache_store.hpp"
#include "command_runner.hpp"
#include "repo.hpp"
#include "repo_options.hpp"

/**
 * @brief A non-fatal problem met while scanning.
 */
struct ScanIssue {
    enum class Kind {
        Traversal,    ///< A directory could not be enumerated
        SymlinkCycle, ///< A symlink led back to one of its own ancestors
        Submodule,    ///< A nested repository could not be registered as submodule
        CacheWrite    ///< The discovered list could not be persisted
    };
    Kind kind;
    std::filesystem::path path;
    std::string message;
};

/** Return true if @p name contains any entry of @p patterns as substring. */
bool matches_exclude(const std::string& name, const std::set<std::string>& patterns);

/**
 * @brief Sorted child directories of @p dir.
 *
 * Symlinked directories are included; plain files are not. Enumeration
 * errors are reported through @p ec.
 */
std::vector<std::filesystem::path> list_child_dirs(const std::filesystem::path& dir,
                                                   std::error_code& ec);

/**
 * @brief Discovers repositories under a root directory.
 *
 * The discovered path list is cached under `"repos"` as `;`-separated,
 * percent-encoded absolute paths; while that key exists scan() rebuilds the
 * entries from it and does not touch the filesystem.
 * A nested repository found directly inside a repository is registered as a
 * submodule of its parent and is not listed on its own.
 */
class RepoScanner {
  public:
    static constexpr const char* kCacheKey = "repos";

    RepoScanner(const ManagerConfig& cfg, CacheStore& cache, CommandRunner& runner);

    std::vector<RepositoryEntry> scan();

    /** Problems recorded by the last scan(). */
    const std::vector<ScanIssue>& issues() const { return issues_; }

    /** Whether the last scan() was answered from the cache. */
    bool from_cache() const { return from_cache_; }

  private:
    RepositoryEntry make_entry(const std::filesystem::path& path) const;
    struct PendingLink {
        std::filesystem::path path;
        std::filesystem::path parent_real;
    };

    void walk(const std::filesystem::path& dir, const std::filesystem::path& real,
              std::vector<RepositoryEntry>& out);
    void walk_pending_links(std::vector<RepositoryEntry>& out);
    void normalize_nested(const std::filesystem::path& repo);
    bool resolve_child(const std::filesystem::path& child, const std::filesystem::path& parent_real,
                       std::filesystem::path& real);
    void record(ScanIssue::Kind kind, const std::filesystem::path& path, const std::string& msg);

    const ManagerConfig& cfg_;
    CacheStore& cache_;
    CommandRunner& runner_;
    std::filesystem::path root_;
    std::filesystem::path real_root_;
    std::map<std::filesystem::path, RepoOverride> overrides_;
    std::set<std::filesystem::path> visited_;
    std::deque<PendingLink> pending_links_;
    std::vector<ScanIssue> issues_;
    bool from_cache_ = false;
};

#endif // SCANNER_HPP
