#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace {

// Digits only: std::stoull would otherwise accept "-1" and leading spaces.
bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool to_ull(const std::string& s, unsigned long long& out) {
    if (!all_digits(s))
        return false;
    try {
        out = std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd') {
        num.pop_back();
    } else if (std::isdigit(static_cast<unsigned char>(unit))) {
        unit = 's';
    } else {
        return std::chrono::seconds(0);
    }
    unsigned long long n = 0;
    if (!to_ull(num, n))
        return std::chrono::seconds(0);
    unsigned long long per = 1;
    switch (unit) {
    case 'm':
        per = 60;
        break;
    case 'h':
        per = 60 * 60;
        break;
    case 'd':
        per = 24 * 60 * 60;
        break;
    default:
        break;
    }
    if (n > static_cast<unsigned long long>(kMaxDuration.count()) / per)
        return std::chrono::seconds(0);
    ok = true;
    return std::chrono::seconds(static_cast<long long>(n * per));
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string val = lower(value);
    long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("ms")) {
        val.erase(val.size() - 2);
    } else if (ends_with("s")) {
        mult = 1000;
        val.pop_back();
    } else if (ends_with("m")) {
        mult = 60 * 1000;
        val.pop_back();
    }
    unsigned long long n = 0;
    if (!to_ull(val, n) || n > static_cast<unsigned long long>(INT_MAX))
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(static_cast<long long>(n) * mult);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (!val.empty() && val.back() == 'k') {
        mult = 1024ull;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'm') {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'g') {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    } else if (!val.empty() && val.back() == 'b') {
        val.pop_back();
    }
    unsigned long long base = 0;
    if (!to_ull(val, base) || base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_bool_value(const std::string& value) {
    std::string v = lower(value);
    return v.empty() || v == "1" || v == "true" || v == "yes";
}
