#include "test_common.hpp"

using namespace std::chrono_literals;

TEST_CASE("validate_config rejects broken configurations") {
    TempDir root("manager_validate");
    ManagerConfig cfg;
    cfg.root_dir = root.path();
    REQUIRE_NOTHROW(validate_config(cfg));

    SECTION("zero interval") {
        cfg.check_interval = 0ms;
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
    SECTION("negative interval") {
        cfg.check_interval = -1ms;
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
    SECTION("interval beyond the monitor limit") {
        cfg.check_interval = std::chrono::hours(24 * 400);
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
    SECTION("empty root") {
        cfg.root_dir.clear();
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
    SECTION("missing root") {
        cfg.root_dir = root / "missing";
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
    SECTION("root is a file") {
        write_file(root / "file.txt", "x");
        cfg.root_dir = root / "file.txt";
        REQUIRE_THROWS_AS(validate_config(cfg), std::invalid_argument);
    }
}

TEST_CASE("Manager constructor validates the configuration") {
    TempDir root("manager_ctor");
    ManagerConfig cfg;
    cfg.root_dir = root / "nope";
    MemoryCache cache;
    FakeRunner runner;
    FakeSummarizer summarizer;
    REQUIRE_THROWS_AS(GitManager(cfg, cache, runner, summarizer), std::invalid_argument);
}

TEST_CASE("Default configuration values") {
    ManagerConfig cfg;
    REQUIRE(cfg.scan_excludes == std::set<std::string>{"node_modules", ".git", ".venv"});
    REQUIRE(cfg.check_excludes.empty());
    REQUIRE(cfg.check_interval == std::chrono::milliseconds(30 * 60 * 1000));
    REQUIRE(cfg.cache_file == fs::path(".autogitpush_cache.txt"));
    REQUIRE(cfg.repo_overrides.empty());
}

TEST_CASE("Manager scans on start and hands the list to the monitor") {
    TempDir root("manager_start");
    make_fake_repo(root / "a");
    make_fake_repo(root / "b");
    ManagerConfig cfg;
    cfg.root_dir = root.path();
    cfg.check_interval = 1h;
    MemoryCache cache;
    FakeRunner runner;
    runner.dirty = {root / "a"};
    FakeSummarizer summarizer;

    GitManager mgr(cfg, cache, runner, summarizer);
    REQUIRE(mgr.monitor() == nullptr);
    REQUIRE(mgr.repositories().empty());
    mgr.start();
    REQUIRE(mgr.monitor() != nullptr);
    REQUIRE(mgr.repositories().size() == 2);
    REQUIRE(mgr.monitor()->repositories() == mgr.repositories());
    REQUIRE(mgr.monitor()->state() == MonitorState::Running);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (mgr.monitor()->ticks() < 1 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    REQUIRE(mgr.monitor()->ticks() == 1);

    RepoMonitor* first = mgr.monitor();
    mgr.start();
    REQUIRE(mgr.monitor() == first);

    mgr.stop();
    REQUIRE(mgr.monitor()->state() == MonitorState::Stopped);
    REQUIRE(runner.commits.size() == 1);
    REQUIRE(runner.commits[0].first == root / "a");
    REQUIRE(cache.values.count(RepoScanner::kCacheKey));
}

TEST_CASE("Manager run_once performs one synchronous tick") {
    TempDir root("manager_once");
    make_fake_repo(root / "repo");
    make_fake_repo(root / "repo" / "nested");
    ManagerConfig cfg;
    cfg.root_dir = root.path();
    MemoryCache cache;
    FakeRunner runner;
    runner.dirty = {root / "repo"};
    runner.failures[{root / "repo", "push"}] = "no upstream";
    FakeSummarizer summarizer;

    GitManager mgr(cfg, cache, runner, summarizer);
    TickReport report = mgr.run_once();
    REQUIRE(report.processed == 1);
    REQUIRE(report.committed == 1);
    REQUIRE(report.pushed == 0);
    REQUIRE(report.failures.size() == 1);
    REQUIRE(runner.submodules.size() == 1);
    REQUIRE(mgr.monitor() != nullptr);
    REQUIRE(mgr.monitor()->state() == MonitorState::Stopped);
    REQUIRE(mgr.monitor()->ticks() == 1);
}

TEST_CASE("Manager surfaces scan issues") {
    TempDir root("manager_issues");
    make_fake_repo(root / "repo");
    ManagerConfig cfg;
    cfg.root_dir = root.path();
    MemoryCache cache;
    cache.fail_writes = true;
    FakeRunner runner;
    FakeSummarizer summarizer;
    GitManager mgr(cfg, cache, runner, summarizer);
    mgr.run_once();
    REQUIRE(mgr.repositories().size() == 1);
    REQUIRE(mgr.scan_issues().size() == 1);
    REQUIRE(mgr.scan_issues()[0].kind == ScanIssue::Kind::CacheWrite);
}

TEST_CASE("Manager stop before start is harmless") {
    TempDir root("manager_stop_early");
    ManagerConfig cfg;
    cfg.root_dir = root.path();
    MemoryCache cache;
    FakeRunner runner;
    FakeSummarizer summarizer;
    GitManager mgr(cfg, cache, runner, summarizer);
    REQUIRE_NOTHROW(mgr.stop());
    REQUIRE(mgr.config().root_dir == root.path());
}
