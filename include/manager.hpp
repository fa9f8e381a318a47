#ifndef MANAGER_HPP
#define MANAGER_HPP

#include <memory>
#include <vector>

#include "cache_store.hpp"
#include "command_runner.hpp"
#include "monitor.hpp"
#include "repo.hpp"
#include "repo_options.hpp"
#include "scanner.hpp"
#include "summarizer.hpp"

/**
 * @brief Ties scanning and monitoring into one lifecycle.
 *
 * start() scans once and hands the result to a new RepoMonitor. The
 * collaborators are borrowed and must outlive the manager.
 */
class GitManager {
  public:
    /**
     * @throws std::invalid_argument if the interval is not positive or the
     *         root directory does not exist.
     */
    GitManager(ManagerConfig cfg, CacheStore& cache, CommandRunner& runner,
               Summarizer& summarizer);
    ~GitManager();

    GitManager(const GitManager&) = delete;
    GitManager& operator=(const GitManager&) = delete;

    /** Scan and start monitoring. Calling it again is a no-op. */
    void start();
    void stop();

    /**
     * @brief Scan and run a single tick on the calling thread.
     *
     * The monitor is created but its worker is not started.
     * @return Report of the tick, or an empty report if start() already ran.
     */
    TickReport run_once();

    const ManagerConfig& config() const { return cfg_; }
    /** Snapshot handed to the monitor; empty before start(). */
    const std::vector<RepositoryEntry>& repositories() const { return repos_; }
    const std::vector<ScanIssue>& scan_issues() const { return scanner_.issues(); }
    /** @return nullptr before start(). */
    RepoMonitor* monitor() { return monitor_.get(); }

  private:
    ManagerConfig cfg_;
    CommandRunner& runner_;
    Summarizer& summarizer_;
    RepoScanner scanner_;
    std::vector<RepositoryEntry> repos_;
    std::unique_ptr<RepoMonitor> monitor_;
};

/**
 * @brief Check the invariants GitManager relies on.
 *
 * @throws std::invalid_argument describing the first violation.
 */
void validate_config(const ManagerConfig& cfg);

#endif // MANAGER_HPP
