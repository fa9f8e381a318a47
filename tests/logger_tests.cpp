#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <thread>
#include <atomic>
#include <chrono>
#include <future>
#include <nlohmann/json.hpp>
#include "test_common.hpp"
#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
static std::vector<int> g_syslog_priorities;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int pri, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
    g_syslog_priorities.push_back(pri);
}
extern "C" void closelog() {}
#endif

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

static std::vector<std::string> read_lines(const fs::path& file) {
    std::ifstream ifs(file);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("logger_rotate");
    fs::path log = dir / "agp.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));
    REQUIRE(read_lines(log1).size() >= 1);
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("logger_compress");
    fs::path log = dir / "agp.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";

    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    set_log_compression(false);

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    fs::path plain1 = log;
    plain1 += ".1";
    REQUIRE_FALSE(fs::exists(plain1));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[64];
    int n = gzread(zf, buf, sizeof(buf) - 1);
    gzclose(zf);
    REQUIRE(n > 0);
    buf[n] = '\0';
    REQUIRE(std::string(buf).find("[INFO] entry") != std::string::npos);
}

TEST_CASE("Logger switches between JSON and plain") {
    TempDir dir("logger_format");
    fs::path log = dir / "agp.log";
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json \"entry\"", {{"path", "/srv/repo"}, {"k", "v"}});
    flush_logger();
    set_json_logging(false);
    log_info("plain entry", {{"path", "/srv/repo"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    auto j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["level"] == "INFO");
    REQUIRE(j["msg"] == "json \"entry\"");
    REQUIRE(j["k"] == "v");
    REQUIRE(j["path"] == "/srv/repo");
    REQUIRE(j.contains("timestamp"));
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[INFO] plain entry path=/srv/repo") != std::string::npos);
}

TEST_CASE("Logger honours the minimum level") {
    TempDir dir("logger_level");
    fs::path log = dir / "agp.log";
    set_console_logging(false);
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning");
    log_error("shown error");
    set_log_level(LogLevel::DEBUG);
    log_debug("shown debug");
    shutdown_logger();
    set_console_logging(true);

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].find("[WARNING] shown warning") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error") != std::string::npos);
    REQUIRE(lines[2].find("[DEBUG] shown debug") != std::string::npos);
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    LogLevel lvl = LogLevel::INFO;
    REQUIRE(parse_log_level("DEBUG", lvl));
    REQUIRE(lvl == LogLevel::DEBUG);
    REQUIRE(parse_log_level("warn", lvl));
    REQUIRE(lvl == LogLevel::WARNING);
    REQUIRE(parse_log_level("Warning", lvl));
    REQUIRE(parse_log_level("error", lvl));
    REQUIRE(lvl == LogLevel::ERR);
    REQUIRE(parse_log_level("info", lvl));
    REQUIRE(lvl == LogLevel::INFO);
    REQUIRE_FALSE(parse_log_level("verbose", lvl));
    REQUIRE(lvl == LogLevel::INFO);
}

TEST_CASE("shutdown_logger drains queued messages") {
    TempDir dir("logger_drain");
    fs::path log = dir / "agp.log";
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 50);
    REQUIRE(lines.back().find("queued 49") != std::string::npos);
}

TEST_CASE("shutdown_logger exits cleanly with no messages") {
    TempDir dir("logger_noop");
    fs::path log = dir / "agp.log";
    init_logger(log.string());
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log));
    REQUIRE(fs::file_size(log) == 0);
}

TEST_CASE("Messages are dropped while the logger is stopped") {
    TempDir dir("logger_dropped");
    fs::path log = dir / "agp.log";
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    log_error("nobody listens");
    init_logger(log.string());
    log_info("after start");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("after start") != std::string::npos);
}

TEST_CASE("init_logger can be called twice") {
    TempDir dir("logger_reinit");
    fs::path log = dir / "agp.log";
    init_logger(log.string());
    log_info("first entry");
    init_logger(log.string());
    log_info("second entry");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("first entry") != std::string::npos);
    REQUIRE(lines[1].find("second entry") != std::string::npos);
}

TEST_CASE("init_logger without a usable file keeps running") {
    TempDir dir("logger_bad_path");
    fs::path good = dir / "agp.log";
    fs::path bad = dir / "missing" / "agp.log";
    init_logger(good.string());
    log_info("before");
    init_logger(bad.string());
    REQUIRE(logger_initialized());
    log_info("after");
    shutdown_logger();
    REQUIRE_FALSE(fs::exists(bad));
    auto lines = read_lines(good);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("before") != std::string::npos);
}

TEST_CASE("init_logger with an empty path runs console-only") {
    init_logger("");
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    log_info("console only");
    flush_logger();
}

TEST_CASE("Logging from many threads loses nothing while running") {
    TempDir dir("logger_threads");
    fs::path log = dir / "agp.log";
    init_logger(log.string());
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 100; ++i)
                log_info("thread " + std::to_string(t), {{"i", std::to_string(i)}});
        });
    }
    for (auto& th : threads)
        th.join();
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 400);
}

TEST_CASE("init_logger and shutdown_logger can run concurrently") {
    TempDir dir("logger_race");
    fs::path log1 = dir / "race1.log";
    fs::path log2 = dir / "race2.log";
    init_logger(log1.string());
    std::promise<void> go;
    auto ready = go.get_future().share();
    std::thread t1([&] {
        ready.wait();
        init_logger(log2.string());
    });
    std::thread t2([&] {
        ready.wait();
        shutdown_logger();
    });
    go.set_value();
    t1.join();
    t2.join();
    if (logger_initialized())
        shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    TempDir dir("logger_syslog");
    fs::path log = dir / "agp.log";
    g_syslog_messages.clear();
    g_syslog_priorities.clear();
    set_console_logging(false);
    init_logger(log.string());
    init_syslog(LOG_USER);
    log_info("syslog entry");
    log_error("syslog failure");
    shutdown_logger();
    set_console_logging(true);
    REQUIRE(g_syslog_messages.size() == 2);
    REQUIRE(g_syslog_messages[0].find("syslog entry") != std::string::npos);
    REQUIRE(g_syslog_priorities[0] == LOG_INFO);
    REQUIRE(g_syslog_priorities[1] == LOG_ERR);
}
#endif
