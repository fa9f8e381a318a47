#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "cli_commands.hpp"
#include "command_runner.hpp"
#include "logger.hpp"
#include "manager.hpp"
#include "summarizer.hpp"

namespace cli {

namespace {
std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested.store(true); }
} // namespace

void setup_logging(const LoggingOptions& opts) {
    set_json_logging(opts.json_log);
    set_log_compression(opts.compress_logs);
    set_console_logging(!opts.silent);
    init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.log_files);
    if (opts.use_syslog)
        init_syslog();
}

void prepare_cache(CacheStore& cache, const Options& opts) {
    if (opts.clear_cache) {
        cache.clear();
        log_info("Cache cleared");
    } else if (opts.rescan) {
        cache.remove(RepoScanner::kCacheKey);
        log_info("Cached repository list dropped");
    }
}

std::string summary_token() {
    const char* tok = std::getenv("AUTOGITPUSH_SUMMARY_TOKEN");
    return tok ? tok : "";
}

int handle_monitoring_run(const Options& opts) {
    setup_logging(opts.logging);
    struct LoggerGuard {
        ~LoggerGuard() { shutdown_logger(); }
    } logger_guard;
    if (!opts.config_file.empty())
        log_info("Loaded configuration", {{"file", opts.config_file.string()}});

    validate_config(opts.manager);
    FileCacheStore cache(opts.manager.cache_file);
    prepare_cache(cache, opts);

    GitCommandRunner runner(opts.git);
    DiffStatSummarizer local_summarizer;
    std::unique_ptr<HttpSummarizer> http_summarizer;
    Summarizer* summarizer = &local_summarizer;
    if (!opts.summary.url.empty()) {
        HttpSummarizerOptions hopts;
        hopts.url = opts.summary.url;
        hopts.timeout = opts.summary.timeout;
        hopts.max_bytes = opts.summary.max_bytes;
        std::string token = summary_token();
        if (!token.empty())
            hopts.token = token;
        http_summarizer = std::make_unique<HttpSummarizer>(hopts, local_summarizer);
        summarizer = http_summarizer.get();
    }

    GitManager manager(opts.manager, cache, runner, *summarizer);
    if (opts.single_run) {
        TickReport report = manager.run_once();
        std::cout << "Repositories: " << manager.repositories().size()
                  << ", committed: " << report.committed << ", pushed: " << report.pushed
                  << ", failures: " << report.failures.size() << "\n";
        return report.failures.empty() ? 0 : 1;
    }

    g_stop_requested.store(false);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    manager.start();
    while (!g_stop_requested.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    log_info("Shutdown requested");
    manager.stop();
    return 0;
}

} // namespace cli
