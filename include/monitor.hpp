#ifndef MONITOR_HPP
#define MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "command_runner.hpp"
#include "repo.hpp"
#include "summarizer.hpp"

/** A per-repository failure inside one tick. */
struct RepoFailure {
    std::filesystem::path path;
    std::string operation; ///< "has_changes", "diff", "summarize", "commit" or "push"
    std::string message;
};

/** What one pass over the repository list did. */
struct TickReport {
    size_t processed = 0; ///< Entries not excluded from checks
    size_t skipped = 0;   ///< Entries excluded from checks
    size_t clean = 0;
    size_t committed = 0;
    size_t pushed = 0;
    std::vector<RepoFailure> failures;
};

enum class MonitorState { Stopped, Running };

/**
 * @brief Periodically commits and pushes changes in a fixed repository list.
 *
 * A single worker thread runs one tick immediately on start() and then one
 * every interval, measured from the end of the previous tick. Failures are
 * isolated per repository: they end up in the TickReport and the log, and the
 * tick moves on to the next entry.
 */
class RepoMonitor {
  public:
    /** Longest accepted interval. */
    static constexpr std::chrono::milliseconds kMaxInterval = std::chrono::hours(24 * 366);

    RepoMonitor(std::vector<RepositoryEntry> repos, std::chrono::milliseconds interval,
                CommandRunner& runner, Summarizer& summarizer);
    ~RepoMonitor();

    RepoMonitor(const RepoMonitor&) = delete;
    RepoMonitor& operator=(const RepoMonitor&) = delete;

    /** Start the worker. No-op while running. */
    void start();

    /**
     * @brief Stop the worker and wait for it.
     *
     * An in-flight tick is allowed to finish; no further tick starts.
     * Safe to call from any thread, and more than once.
     */
    void stop();

    /** Process every repository once on the calling thread. */
    TickReport run_tick();

    MonitorState state() const;
    size_t ticks() const { return ticks_.load(); }
    const std::vector<RepositoryEntry>& repositories() const { return repos_; }

  private:
    void loop(unsigned generation);
    bool stopped(unsigned generation) const;
    TickReport tick_locked();
    void process(const RepositoryEntry& repo, TickReport& report);
    void reap_retired();

    const std::vector<RepositoryEntry> repos_;
    const std::chrono::milliseconds interval_;
    CommandRunner& runner_;
    Summarizer& summarizer_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool running_ = false;
    unsigned generation_ = 0; ///< Bumped on every start(); a loop from an older run exits
    std::thread worker_;
    std::thread retired_; ///< Worker that stopped itself from inside a tick
    std::mutex tick_mtx_;
    std::atomic<size_t> ticks_{0};
};

#endif // MONITOR_HPP
