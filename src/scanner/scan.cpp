#include "scanner.hpp"

#include <stdexcept>
#include <system_error>

#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

// Characters that would split or truncate an entry of the cached list.
const char* const kPathReserved = ";\n\r";

fs::path normalize_path(const fs::path& p) {
    fs::path norm = p.lexically_normal();
    if (norm.filename().empty() && norm.has_relative_path())
        norm = norm.parent_path();
    return norm;
}

const char* kind_name(ScanIssue::Kind kind) {
    switch (kind) {
    case ScanIssue::Kind::Traversal:
        return "traversal";
    case ScanIssue::Kind::SymlinkCycle:
        return "symlink-cycle";
    case ScanIssue::Kind::Submodule:
        return "submodule";
    case ScanIssue::Kind::CacheWrite:
        return "cache-write";
    }
    return "unknown";
}

} // namespace

RepoScanner::RepoScanner(const ManagerConfig& cfg, CacheStore& cache, CommandRunner& runner)
    : cfg_(cfg), cache_(cache), runner_(runner) {
    std::error_code ec;
    root_ = normalize_path(fs::absolute(cfg_.root_dir, ec));
    if (ec)
        root_ = normalize_path(cfg_.root_dir);
    real_root_ = fs::weakly_canonical(root_, ec);
    if (ec)
        real_root_ = root_;
    for (const auto& [path, ovr] : cfg_.repo_overrides) {
        fs::path key = path.is_relative() ? root_ / path : path;
        overrides_[normalize_path(key)] = ovr;
    }
}

void RepoScanner::record(ScanIssue::Kind kind, const fs::path& path, const std::string& msg) {
    issues_.push_back({kind, path, msg});
    std::map<std::string, std::string> fields{
        {"kind", kind_name(kind)}, {"path", path.string()}, {"error", msg}};
    if (kind == ScanIssue::Kind::CacheWrite)
        log_error("Scan problem", fields);
    else
        log_warning("Scan problem", fields);
}

RepositoryEntry RepoScanner::make_entry(const fs::path& path) const {
    RepositoryEntry entry;
    entry.path = path;
    entry.excluded_from_checks = matches_exclude(path.filename().string(), cfg_.check_excludes);
    auto it = overrides_.find(normalize_path(path));
    if (it != overrides_.end()) {
        if (it->second.exclude_from_checks)
            entry.excluded_from_checks = *it->second.exclude_from_checks;
        if (it->second.alternative_remote && !it->second.alternative_remote->empty())
            entry.alternative_remote = it->second.alternative_remote;
    }
    return entry;
}

std::vector<RepositoryEntry> RepoScanner::scan() {
    issues_.clear();
    visited_.clear();
    pending_links_.clear();
    from_cache_ = false;
    std::vector<RepositoryEntry> out;

    if (auto cached = cache_.get(kCacheKey)) {
        size_t start = 0;
        while (start <= cached->size()) {
            size_t sep = cached->find(';', start);
            if (sep == std::string::npos)
                sep = cached->size();
            std::string piece = cached->substr(start, sep - start);
            start = sep + 1;
            if (piece.empty())
                continue;
            fs::path path = percent_decode(piece);
            if (!path.is_absolute()) {
                record(ScanIssue::Kind::Traversal, path, "cached path is not absolute");
                continue;
            }
            out.push_back(make_entry(path));
        }
        from_cache_ = true;
        log_info("Using cached repository list", {{"repositories", std::to_string(out.size())}});
        return out;
    }

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        record(ScanIssue::Kind::Traversal, root_, "root is not a directory");
        return out;
    }
    log_info("Scanning for repositories", {{"root", root_.string()}});
    if (matches_exclude(root_.filename().string(), cfg_.scan_excludes)) {
        log_debug("Root is scan-excluded", {{"path", root_.string()}});
    } else {
        visited_.insert(real_root_);
        walk(root_, real_root_, out);
        walk_pending_links(out);
    }

    std::string joined;
    for (const auto& e : out) {
        if (!joined.empty())
            joined += ';';
        joined += percent_encode(e.path.string(), kPathReserved);
    }
    try {
        cache_.set(kCacheKey, joined);
    } catch (const std::exception& e) {
        record(ScanIssue::Kind::CacheWrite, cfg_.cache_file, e.what());
    }
    log_info("Scan complete", {{"repositories", std::to_string(out.size())},
                               {"issues", std::to_string(issues_.size())}});
    return out;
}

void RepoScanner::walk(const fs::path& dir, const fs::path& real,
                       std::vector<RepositoryEntry>& out) {
    if (runner_.is_repository(dir)) {
        out.push_back(make_entry(dir));
        log_debug("Found repository", {{"path", dir.string()}});
        normalize_nested(dir);
        return;
    }
    std::error_code ec;
    auto children = list_child_dirs(dir, ec);
    if (ec) {
        record(ScanIssue::Kind::Traversal, dir, ec.message());
        return;
    }
    for (const auto& child : children) {
        if (matches_exclude(child.filename().string(), cfg_.scan_excludes))
            continue;
        std::error_code link_ec;
        if (fs::is_symlink(child, link_ec)) {
            pending_links_.push_back({child, real});
            continue;
        }
        fs::path child_real;
        if (!resolve_child(child, real, child_real))
            continue;
        walk(child, child_real, out);
    }
}

// Symlinked directories are walked after every real directory, so a target
// reachable both ways is listed under its real path.
void RepoScanner::walk_pending_links(std::vector<RepositoryEntry>& out) {
    while (!pending_links_.empty()) {
        PendingLink link = pending_links_.front();
        pending_links_.pop_front();
        fs::path link_real;
        if (!resolve_child(link.path, link.parent_real, link_real))
            continue;
        walk(link.path, link_real, out);
    }
}

void RepoScanner::normalize_nested(const fs::path& repo) {
    std::error_code ec;
    auto children = list_child_dirs(repo, ec);
    if (ec) {
        record(ScanIssue::Kind::Traversal, repo, ec.message());
        return;
    }
    for (const auto& child : children) {
        if (matches_exclude(child.filename().string(), cfg_.scan_excludes))
            continue;
        std::error_code link_ec;
        if (fs::is_symlink(child, link_ec) || !runner_.is_repository(child))
            continue;
        GitResult res = runner_.add_submodule(repo, child);
        if (!res) {
            record(ScanIssue::Kind::Submodule, child, res.error);
            continue;
        }
        log_info("Nested repository registered as submodule",
                 {{"parent", repo.string()}, {"child", child.string()}, {"result", res.value}});
    }
}
