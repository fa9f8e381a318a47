#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "cache_store.hpp"
#include "command_runner.hpp"
#include "config_utils.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "manager.hpp"
#include "monitor.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "repo.hpp"
#include "scanner.hpp"
#include "summarizer.hpp"
#include "time_utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

#define REDIR " > /dev/null 2>&1"

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace autogitpush::test_support {

/** Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
  public:
    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("autogitpush_" + name + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

  private:
    fs::path path_;
};

/** Create @p dir with an empty `.git` directory so it looks like a repository root. */
inline void make_fake_repo(const fs::path& dir) { fs::create_directories(dir / ".git"); }

inline void write_file(const fs::path& file, const std::string& content) {
    fs::create_directories(file.parent_path());
    std::ofstream(file) << content;
}

inline std::string read_file(const fs::path& file) {
    std::ifstream ifs(file);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

inline int git_cmd(const fs::path& repo, const std::string& args) {
    std::string cmd = "git -C \"" + repo.string() + "\" " + args + REDIR;
    return std::system(cmd.c_str());
}

/** `git init` plus a local identity so commits work on CI machines. */
inline void init_git_repo(const fs::path& repo) {
    fs::create_directories(repo);
    REQUIRE(git_cmd(repo, "init") == 0);
    git_cmd(repo, "config user.email tester@example.com");
    git_cmd(repo, "config user.name tester");
}

/** CacheStore kept in memory; can be told to fail writes. */
class MemoryCache : public CacheStore {
  public:
    std::optional<std::string> get(const std::string& key) const override {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = values.find(key);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    }
    void set(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lk(mtx_);
        values[key] = value;
        ++writes;
        if (fail_writes)
            throw std::runtime_error("disk full");
    }
    void remove(const std::string& key) override {
        std::lock_guard<std::mutex> lk(mtx_);
        values.erase(key);
        ++writes;
    }
    void clear() override {
        std::lock_guard<std::mutex> lk(mtx_);
        values.clear();
        ++writes;
    }

    std::map<std::string, std::string> values;
    int writes = 0;
    bool fail_writes = false;

  private:
    mutable std::mutex mtx_;
};

/**
 * CommandRunner that records every call.
 *
 * is_repository() looks for a real `.git` directory, so scanner tests can
 * build trees on disk. Changes, failures and throws are scripted per path.
 */
class FakeRunner : public CommandRunner {
  public:
    bool is_repository(const fs::path& path) override {
        if (before_is_repository)
            before_is_repository(path);
        std::lock_guard<std::mutex> lk(mtx);
        ++is_repository_calls;
        std::error_code ec;
        return fs::is_directory(path / ".git", ec);
    }
    git::FlagResult has_changes(const fs::path& path) override {
        if (auto r = scripted(path, "has_changes"))
            return git::FlagResult::failure(r->error);
        std::lock_guard<std::mutex> lk(mtx);
        return git::FlagResult::success(dirty.count(path) > 0);
    }
    GitResult diff(const fs::path& path) override {
        if (auto r = scripted(path, "diff"))
            return *r;
        return GitResult::success("diff --git a/f.txt b/f.txt\n@@ -0,0 +1 @@\n+x\n");
    }
    GitResult commit(const fs::path& path, const std::string& message) override {
        if (auto r = scripted(path, "commit"))
            return *r;
        std::lock_guard<std::mutex> lk(mtx);
        commits.emplace_back(path, message);
        return GitResult::success("abc123");
    }
    GitResult push(const fs::path& path, const std::optional<std::string>& remote) override {
        if (auto r = scripted(path, "push"))
            return *r;
        std::lock_guard<std::mutex> lk(mtx);
        pushes.emplace_back(path, remote);
        return GitResult::success(remote.value_or("origin"));
    }
    GitResult add_submodule(const fs::path& parent, const fs::path& child) override {
        if (auto r = scripted(child, "add_submodule"))
            return *r;
        std::lock_guard<std::mutex> lk(mtx);
        submodules.emplace_back(parent, child);
        return GitResult::success("./" + child.filename().string());
    }

    size_t count(const std::string& op) {
        std::lock_guard<std::mutex> lk(mtx);
        size_t n = 0;
        for (const auto& c : calls)
            n += c.second == op ? 1 : 0;
        return n;
    }

    std::mutex mtx;
    int is_repository_calls = 0;
    std::function<void(const fs::path&)> before_is_repository;
    std::set<fs::path> dirty;
    std::map<std::pair<fs::path, std::string>, std::string> failures; ///< (path, op) -> error
    std::set<std::pair<fs::path, std::string>> throws;                ///< (path, op) throws
    std::vector<std::pair<fs::path, std::string>> calls;
    std::vector<std::pair<fs::path, std::string>> commits;
    std::vector<std::pair<fs::path, std::optional<std::string>>> pushes;
    std::vector<std::pair<fs::path, fs::path>> submodules;

  private:
    std::optional<GitResult> scripted(const fs::path& path, const std::string& op) {
        std::lock_guard<std::mutex> lk(mtx);
        calls.emplace_back(path, op);
        if (throws.count({path, op}))
            throw std::runtime_error(op + " exploded");
        auto it = failures.find({path, op});
        if (it != failures.end())
            return GitResult::failure(it->second);
        return std::nullopt;
    }
};

class FakeSummarizer : public Summarizer {
  public:
    std::string summarize(const std::string& diff) override {
        ++calls;
        last_diff = diff;
        return message;
    }
    std::atomic<int> calls{0};
    std::string last_diff;
    std::string message = "fake summary";
};

} // namespace autogitpush::test_support

using namespace autogitpush::test_support;
