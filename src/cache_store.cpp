#include "cache_store.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kValueReserved = "\n\r";
const char* const kKeyReserved = "=\n\r";

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace

std::string percent_encode(const std::string& text, const std::string& reserved) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '%' || reserved.find(c) != std::string::npos) {
            auto u = static_cast<unsigned char>(c);
            out += '%';
            out += kHex[u >> 4];
            out += kHex[u & 0x0F];
        } else {
            out += c;
        }
    }
    return out;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 &&
            hex_value(text[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

FileCacheStore::FileCacheStore(fs::path path) : path_(std::move(path)) { load(); }

void FileCacheStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec)
            throw std::runtime_error("Cannot access cache file " + path_.string() + ": " +
                                     ec.message());
        return;
    }
    if (fs::is_directory(path_, ec))
        throw std::runtime_error("Cache file is a directory: " + path_.string());
    std::ifstream ifs(path_);
    if (!ifs)
        throw std::runtime_error("Cannot read cache file " + path_.string());
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        values_[percent_decode(line.substr(0, eq))] = percent_decode(line.substr(eq + 1));
    }
    if (ifs.bad())
        throw std::runtime_error("Error while reading cache file " + path_.string());
    log_debug("Loaded cache", {{"file", path_.string()}, {"keys", std::to_string(values_.size())}});
}

void FileCacheStore::save() const {
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Cannot write cache file " + tmp.string());
        for (const auto& [k, v] : values_)
            ofs << percent_encode(k, kKeyReserved) << '=' << percent_encode(v, kValueReserved)
                << '\n';
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("Error while writing cache file " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw std::runtime_error("Cannot replace cache file " + path_.string() + ": " + reason);
    }
}

std::optional<std::string> FileCacheStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

void FileCacheStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mtx_);
    values_[key] = value;
    save();
}

void FileCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(mtx_);
    values_.erase(key);
    save();
}

void FileCacheStore::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    values_.clear();
    save();
}
