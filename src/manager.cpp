#include "manager.hpp"

#include <stdexcept>
#include <system_error>

#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

void validate_config(const ManagerConfig& cfg) {
    if (cfg.check_interval.count() <= 0)
        throw std::invalid_argument("Check interval must be positive");
    if (cfg.check_interval > RepoMonitor::kMaxInterval)
        throw std::invalid_argument("Check interval is longer than " +
                                    format_duration_short(RepoMonitor::kMaxInterval));
    if (cfg.root_dir.empty())
        throw std::invalid_argument("Root directory is not set");
    std::error_code ec;
    if (!fs::exists(cfg.root_dir, ec))
        throw std::invalid_argument("Root directory does not exist: " + cfg.root_dir.string());
    if (!fs::is_directory(cfg.root_dir, ec))
        throw std::invalid_argument("Root path is not a directory: " + cfg.root_dir.string());
}

// validate_config runs before the scanner member is built from cfg_.
static ManagerConfig validated(ManagerConfig cfg) {
    validate_config(cfg);
    return cfg;
}

GitManager::GitManager(ManagerConfig cfg, CacheStore& cache, CommandRunner& runner,
                       Summarizer& summarizer)
    : cfg_(validated(std::move(cfg))), runner_(runner), summarizer_(summarizer),
      scanner_(cfg_, cache, runner) {}

GitManager::~GitManager() { stop(); }

void GitManager::start() {
    if (monitor_)
        return;
    log_info("Starting manager", {{"root", cfg_.root_dir.string()}});
    repos_ = scanner_.scan();
    monitor_ = std::make_unique<RepoMonitor>(repos_, cfg_.check_interval, runner_, summarizer_);
    monitor_->start();
}

void GitManager::stop() {
    if (monitor_)
        monitor_->stop();
}

TickReport GitManager::run_once() {
    if (monitor_)
        return {};
    log_info("Running single check", {{"root", cfg_.root_dir.string()}});
    repos_ = scanner_.scan();
    monitor_ = std::make_unique<RepoMonitor>(repos_, cfg_.check_interval, runner_, summarizer_);
    return monitor_->run_tick();
}
