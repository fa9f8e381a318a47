#include "scanner.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include "logger.hpp"

namespace fs = std::filesystem;

bool matches_exclude(const std::string& name, const std::set<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pat) {
        return !pat.empty() && name.find(pat) != std::string::npos;
    });
}

std::vector<fs::path> list_child_dirs(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> result;
    ec.clear();
    fs::directory_iterator it(dir, ec);
    fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec))
            result.push_back(it->path());
    }
    if (ec)
        return {};
    std::sort(result.begin(), result.end());
    return result;
}

static bool within_root(const fs::path& root, const fs::path& p) {
    auto norm = p.lexically_normal();
    auto root_it = root.begin();
    auto p_it = norm.begin();
    for (; root_it != root.end() && p_it != norm.end(); ++root_it, ++p_it) {
        if (*root_it != *p_it)
            return false;
    }
    return root_it == root.end();
}

bool RepoScanner::resolve_child(const fs::path& child, const fs::path& parent_real,
                                fs::path& real) {
    std::error_code ec;
    if (fs::is_symlink(child, ec)) {
        real = fs::weakly_canonical(child, ec);
        if (ec) {
            record(ScanIssue::Kind::Traversal, child, "cannot resolve symlink: " + ec.message());
            return false;
        }
        if (!within_root(real_root_, real)) {
            log_debug("Skipping symlink outside root",
                      {{"path", child.string()}, {"target", real.string()}});
            return false;
        }
    } else {
        real = parent_real / child.filename();
    }
    if (!visited_.insert(real).second) {
        if (within_root(real, parent_real))
            record(ScanIssue::Kind::SymlinkCycle, child, "links back to " + real.string());
        else
            log_debug("Skipping link to a directory already scanned",
                      {{"path", child.string()}, {"target", real.string()}});
        return false;
    }
    return true;
}
