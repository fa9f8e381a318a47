#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_console{true};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<LogMessage> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static size_t g_in_flight = 0;
static std::atomic<bool> g_running{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_log_path.clear();
    if (!path.empty()) {
        g_log_ofs.open(path, std::ios::app);
        if (g_log_ofs.is_open())
            g_log_path = path;
        else
            std::cerr << "Failed to open log file: " << path << std::endl;
    }
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_syslog.store(true);
    openlog("autogitpush", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug")
        out = LogLevel::DEBUG;
    else if (v == "info")
        out = LogLevel::INFO;
    else if (v == "warning" || v == "warn")
        out = LogLevel::WARNING;
    else if (v == "error")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

void set_console_logging(bool enable) { g_console.store(enable); }

bool logger_initialized() { return g_running.load(); }

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return (g_log_queue.empty() && g_in_flight == 0) || !g_running; });
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

/**
 * @brief Shift `<log>.N[.gz]` to `<log>.N+1[.gz]`, dropping the oldest, and
 * move the active file to `<log>.1` (gzipped when compression is on).
 */
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static std::string format_line(const LogMessage& m, bool json) {
    std::string ts = timestamp();
    const char* label = level_label(m.level);
    std::string line;
    if (json) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + label +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + label + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

/**
 * @brief Write one entry to every enabled sink.
 *
 * The file sink honours JSON mode and rotation; the console sink always uses
 * the plain format and only receives warnings and errors.
 */
static void write_log_entry(const LogMessage& m) {
    if (m.level < g_min_level.load())
        return;
    std::string line = format_line(m, g_json_log.load());
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        if (g_max_size.load() > 0) {
            g_log_ofs.flush();
            std::error_code ec;
            auto size = fs::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load()) {
                g_log_ofs.close();
                if (g_max_files.load() > 0)
                    rotate_files();
                g_log_ofs.open(g_log_path, std::ios::trunc);
            }
        }
    }
    if (g_console.load() && m.level >= LogLevel::WARNING)
        std::cerr << (g_json_log.load() ? format_line(m, false) : line) << std::endl;
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", m.msg.c_str());
    }
#endif
}

// Messages logged while no writer is running are dropped.
static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running.load())
            return;
        g_log_queue.push(LogMessage{level, msg, fields});
    }
    g_queue_cv.notify_one();
}

void log_event(LogLevel level, const std::string& message) { enqueue_message(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    enqueue_message(level, message, fields);
}

void log_debug(const std::string& msg) { enqueue_message(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue_message(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue_message(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue_message(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const LogMessage& m : batch)
            write_log_entry(m);
        batch.clear();
        if (g_log_ofs.is_open())
            g_log_ofs.flush();
        lk.lock();
        g_in_flight = 0;
        bool drained = g_log_queue.empty();
        lk.unlock();
        if (drained)
            g_drained_cv.notify_all();
    }
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
}
