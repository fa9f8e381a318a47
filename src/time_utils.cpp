#include "time_utils.hpp"
#include <chrono>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_duration_short(std::chrono::milliseconds dur) {
    if (dur < std::chrono::seconds(1))
        return std::to_string(dur.count()) + "ms";
    long long total = std::chrono::duration_cast<std::chrono::seconds>(dur).count();
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = (total / 3600) % 24;
    long long d = total / 86400;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (h > 0 || d > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0 || d > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}
