#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    TempDir dir("cfg_yaml");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "interval: 42m\n"
                    "single-run: true\n"
                    "cache-file: ~\n"
                    "scan-exclude:\n  - build\n  - dist\n");
    ConfigValues vals;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), vals, err));
    REQUIRE(vals.opts["--interval"] == "42m");
    REQUIRE(vals.opts["--single-run"] == "true");
    REQUIRE(vals.opts["--cache-file"].empty());
    REQUIRE(vals.list_opts["--scan-exclude"] == std::vector<std::string>{"build", "dist"});
    REQUIRE(vals.has("--scan-exclude"));
    REQUIRE_FALSE(vals.has("--remote"));
}

TEST_CASE("YAML config categories") {
    TempDir dir("cfg_yaml_cat");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "General:\n  root: /srv/code\n  interval: 10\n"
                    "Logging:\n  log-level: DEBUG\n  json-log: true\n");
    ConfigValues vals;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), vals, err));
    REQUIRE(vals.opts["--root"] == "/srv/code");
    REQUIRE(vals.opts["--interval"] == "10");
    REQUIRE(vals.opts["--log-level"] == "DEBUG");
    REQUIRE(vals.opts["--json-log"] == "true");
}

TEST_CASE("YAML repository settings") {
    TempDir dir("cfg_yaml_repos");
    fs::path cfg = dir / "cfg.yaml";
    write_file(cfg, "root: /srv\n"
                    "repositories:\n"
                    "  /srv/site:\n    alternative-remote: backup\n"
                    "  tools:\n    exclude-from-checks: true\n"
                    "  empty: ~\n");
    ConfigValues vals;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), vals, err));
    REQUIRE(vals.repo_opts.size() == 3);
    REQUIRE(vals.repo_opts["/srv/site"]["--alternative-remote"] == "backup");
    REQUIRE(vals.repo_opts["tools"]["--exclude-from-checks"] == "true");
    REQUIRE(vals.repo_opts["empty"].empty());
    REQUIRE_FALSE(vals.opts.count("--repositories"));
}

TEST_CASE("YAML config errors") {
    TempDir dir("cfg_yaml_err");
    ConfigValues vals;
    std::string err;

    SECTION("missing file") {
        REQUIRE_FALSE(load_yaml_config((dir / "none.yaml").string(), vals, err));
        REQUIRE_FALSE(err.empty());
    }
    SECTION("root is not a map") {
        write_file(dir / "list.yaml", "- a\n- b\n");
        REQUIRE_FALSE(load_yaml_config((dir / "list.yaml").string(), vals, err));
    }
    SECTION("malformed yaml") {
        write_file(dir / "bad.yaml", "root: [unclosed\n");
        REQUIRE_FALSE(load_yaml_config((dir / "bad.yaml").string(), vals, err));
        REQUIRE_FALSE(err.empty());
    }
    SECTION("repositories must be a map") {
        write_file(dir / "repos.yaml", "repositories:\n  - a\n");
        REQUIRE_FALSE(load_yaml_config((dir / "repos.yaml").string(), vals, err));
    }
    SECTION("repository entry must be a map") {
        write_file(dir / "entry.yaml", "repositories:\n  a: yes\n");
        REQUIRE_FALSE(load_yaml_config((dir / "entry.yaml").string(), vals, err));
    }
}

TEST_CASE("JSON config loading") {
    TempDir dir("cfg_json");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, R"({
  "interval": 42,
  "single-run": true,
  "summary-timeout": 2.5,
  "log-file": null,
  "check-exclude": ["archive", "old"]
})");
    ConfigValues vals;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), vals, err));
    REQUIRE(vals.opts["--interval"] == "42");
    REQUIRE(vals.opts["--single-run"] == "true");
    REQUIRE(vals.opts["--summary-timeout"] == "2.5");
    REQUIRE(vals.opts["--log-file"].empty());
    REQUIRE(vals.list_opts["--check-exclude"] == std::vector<std::string>{"archive", "old"});
}

TEST_CASE("JSON config categories and repositories") {
    TempDir dir("cfg_json_cat");
    fs::path cfg = dir / "cfg.json";
    write_file(cfg, R"({
  "General": {"root": "/srv", "interval": 10},
  "Git": {"remote": "upstream"},
  "repositories": {
    "web": {"alternative-remote": "mirror", "exclude-from-checks": false}
  }
})");
    ConfigValues vals;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), vals, err));
    REQUIRE(vals.opts["--root"] == "/srv");
    REQUIRE(vals.opts["--interval"] == "10");
    REQUIRE(vals.opts["--remote"] == "upstream");
    REQUIRE(vals.repo_opts["web"]["--alternative-remote"] == "mirror");
    REQUIRE(vals.repo_opts["web"]["--exclude-from-checks"] == "false");
}

TEST_CASE("JSON config errors") {
    TempDir dir("cfg_json_err");
    ConfigValues vals;
    std::string err;

    SECTION("malformed json") {
        write_file(dir / "bad.json", "{\"root\": ");
        REQUIRE_FALSE(load_json_config((dir / "bad.json").string(), vals, err));
        REQUIRE_FALSE(err.empty());
    }
    SECTION("root is not an object") {
        write_file(dir / "arr.json", "[1, 2]");
        REQUIRE_FALSE(load_json_config((dir / "arr.json").string(), vals, err));
    }
    SECTION("nested list item") {
        write_file(dir / "nested.json", R"({"scan-exclude": [["x"]]})");
        REQUIRE_FALSE(load_json_config((dir / "nested.json").string(), vals, err));
    }
    SECTION("repositories must be an object") {
        write_file(dir / "repos.json", R"({"repositories": ["a"]})");
        REQUIRE_FALSE(load_json_config((dir / "repos.json").string(), vals, err));
    }
}
