#include "monitor.hpp"

#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

RepoMonitor::RepoMonitor(std::vector<RepositoryEntry> repos, std::chrono::milliseconds interval,
                         CommandRunner& runner, Summarizer& summarizer)
    : repos_(std::move(repos)), interval_(interval), runner_(runner), summarizer_(summarizer) {
    if (interval_.count() <= 0)
        throw std::invalid_argument("Monitor interval must be positive");
    if (interval_ > kMaxInterval)
        throw std::invalid_argument("Monitor interval is longer than " +
                                    format_duration_short(kMaxInterval));
}

RepoMonitor::~RepoMonitor() {
    stop();
    reap_retired();
}

void RepoMonitor::reap_retired() {
    std::thread retired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        retired = std::move(retired_);
    }
    if (!retired.joinable())
        return;
    if (retired.get_id() == std::this_thread::get_id())
        retired.detach();
    else
        retired.join();
}

void RepoMonitor::start() {
    reap_retired();
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_)
        return;
    running_ = true;
    worker_ = std::thread(&RepoMonitor::loop, this, ++generation_);
    log_info("Monitor started", {{"repositories", std::to_string(repos_.size())},
                                 {"interval", format_duration_short(interval_)}});
}

void RepoMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_)
            return;
        running_ = false;
        worker = std::move(worker_);
        // Called from inside a tick: the loop exits once the tick returns and
        // is joined by the next start() or the destructor.
        if (worker.get_id() == std::this_thread::get_id())
            retired_ = std::move(worker);
    }
    cv_.notify_all();
    if (worker.joinable())
        worker.join();
    log_info("Monitor stopped", {{"ticks", std::to_string(ticks_.load())}});
}

MonitorState RepoMonitor::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_ ? MonitorState::Running : MonitorState::Stopped;
}

// Caller holds mtx_.
bool RepoMonitor::stopped(unsigned generation) const {
    return !running_ || generation_ != generation;
}

void RepoMonitor::loop(unsigned generation) {
    while (true) {
        {
            // Checked under tick_mtx_ so no tick begins once stop() returned.
            std::lock_guard<std::mutex> tick_lk(tick_mtx_);
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (stopped(generation))
                    break;
            }
            tick_locked();
        }
        std::unique_lock<std::mutex> lk(mtx_);
        if (cv_.wait_for(lk, interval_, [&] { return stopped(generation); }))
            break;
    }
}

TickReport RepoMonitor::run_tick() {
    std::lock_guard<std::mutex> lk(tick_mtx_);
    return tick_locked();
}

TickReport RepoMonitor::tick_locked() {
    TickReport report;
    for (const auto& repo : repos_) {
        if (repo.excluded_from_checks) {
            ++report.skipped;
            continue;
        }
        ++report.processed;
        process(repo, report);
    }
    ++ticks_;
    std::map<std::string, std::string> fields{{"processed", std::to_string(report.processed)},
                                              {"skipped", std::to_string(report.skipped)},
                                              {"committed", std::to_string(report.committed)},
                                              {"pushed", std::to_string(report.pushed)},
                                              {"failures", std::to_string(report.failures.size())}};
    if (report.failures.empty())
        log_info("Tick complete", fields);
    else
        log_warning("Tick complete with failures", fields);
    return report;
}

void RepoMonitor::process(const RepositoryEntry& repo, TickReport& report) {
    std::string op = "has_changes";
    auto fail = [&](const std::string& message) {
        report.failures.push_back({repo.path, op, message});
        log_error("Repository operation failed",
                  {{"path", repo.path.string()}, {"operation", op}, {"error", message}});
    };
    try {
        git::FlagResult changed = runner_.has_changes(repo.path);
        if (!changed) {
            fail(changed.error);
            return;
        }
        if (!changed.value) {
            ++report.clean;
            log_debug("No changes", {{"path", repo.path.string()}});
            return;
        }

        op = "diff";
        GitResult diff = runner_.diff(repo.path);
        if (!diff) {
            fail(diff.error);
            return;
        }

        op = "summarize";
        std::string message = summarizer_.summarize(diff.value);
        if (message.empty())
            message = DiffStatSummarizer::kGenericMessage;

        op = "commit";
        GitResult commit = runner_.commit(repo.path, message);
        if (!commit) {
            fail(commit.error);
            return;
        }
        ++report.committed;
        log_info("Committed changes",
                 {{"path", repo.path.string()}, {"commit", commit.value}, {"message", message}});

        // A failed push leaves the commit in place; the next change retries it.
        op = "push";
        GitResult push = runner_.push(repo.path, repo.alternative_remote);
        if (!push) {
            fail(push.error);
            return;
        }
        ++report.pushed;
        log_info("Pushed", {{"path", repo.path.string()}, {"remote", push.value}});
    } catch (const std::exception& e) {
        fail(e.what());
    }
}
