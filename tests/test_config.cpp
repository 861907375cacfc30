#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>

using namespace ghv;

namespace {

Config::EnvLookup env_of(std::map<std::string, std::string> &values) {
  return [&values](const char *name) -> const char * {
    auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

} // namespace

TEST_CASE("test config") {
  // YAML config grouped in sections
  {
    std::ofstream f("cfg.yaml");
    f << "core:\n";
    f << "  verbose: true\n";
    f << "  concurrency: 5\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 5\n";
    f << "  log_compress: true\n";
    f << "  log_categories:\n";
    f << "    coordinator: trace\n";
    f << "    github.client: debug\n";
    f << "github:\n";
    f << "  api_keys:\n";
    f << "    - a\n";
    f << "    - b\n";
    f << "  username: octocat\n";
    f << "  org: acme\n";
    f << "network:\n";
    f << "  http_timeout: 12\n";
    f << "  rate_limit_threshold: 250\n";
    f << "  retry_attempts: 4\n";
    f << "backup:\n";
    f << "  backup_dir: /srv/backups\n";
    f << "  page_cap: 0\n";
    f << "  per_page: 50\n";
    f << "  metadata_classes: [issues, releases]\n";
    f << "  fetch_issue_comments: true\n";
    f << "  parallel_metadata: true\n";
    f << "workspace:\n";
    f << "  workspace_dir: /srv/work\n";
    f << "repositories:\n";
    f << "  include_repos:\n";
    f << "    - widgets\n";
    f << "  exclude_repos:\n";
    f << "    - legacy-*\n";
    f.close();
    Config cfg = Config::from_file("cfg.yaml");
    REQUIRE(cfg.verbose());
    REQUIRE(cfg.concurrency() == 5);
    REQUIRE(cfg.log_level() == "debug");
    REQUIRE(cfg.log_rotate() == 5);
    REQUIRE(cfg.log_compress());
    REQUIRE(cfg.log_categories().at("coordinator") == "trace");
    REQUIRE(cfg.log_categories().at("github.client") == "debug");
    REQUIRE(cfg.api_keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(cfg.username() == "octocat");
    REQUIRE(cfg.org() == "acme");
    REQUIRE(cfg.http_timeout() == 12);
    REQUIRE(cfg.rate_limit_threshold() == 250);
    REQUIRE(cfg.retry_attempts() == 4);
    REQUIRE(cfg.backup_dir() == "/srv/backups");
    REQUIRE(cfg.page_cap() == 0);
    REQUIRE(cfg.per_page() == 50);
    REQUIRE(cfg.metadata_classes() ==
            std::vector<EntityClass>{EntityClass::Issues,
                                     EntityClass::Releases});
    REQUIRE(cfg.fetch_issue_comments());
    REQUIRE(cfg.parallel_metadata());
    REQUIRE(cfg.workspace_dir() == "/srv/work");
    REQUIRE(cfg.include_repos() == std::vector<std::string>{"widgets"});
    REQUIRE(cfg.exclude_repos() == std::vector<std::string>{"legacy-*"});
    std::remove("cfg.yaml");
  }

  // JSON config with flat keys
  {
    std::ofstream f("cfg.json");
    f << R"({"concurrency": 0, "per_page": 500, "log_rotate": -2,
            "api_keys": "single", "include_metadata": false})";
    f.close();
    Config cfg = Config::from_file("cfg.json");
    REQUIRE(cfg.concurrency() == 1);
    REQUIRE(cfg.per_page() == 100);
    REQUIRE(cfg.log_rotate() == 0);
    REQUIRE(cfg.api_keys() == std::vector<std::string>{"single"});
    REQUIRE_FALSE(cfg.include_metadata());
    std::remove("cfg.json");
  }

  // TOML config
  {
    std::ofstream f("cfg.toml");
    f << "[backup]\n";
    f << "backup_dir = \"/data/gh\"\n";
    f << "concurrency = 8\n";
    f << "fetch_release_assets = false\n";
    f << "[logging]\n";
    f << "log_categories = [\"restore=warn\", \"catalog\"]\n";
    f.close();
    Config cfg = Config::from_file("cfg.toml");
    REQUIRE(cfg.backup_dir() == "/data/gh");
    REQUIRE(cfg.concurrency() == 8);
    REQUIRE_FALSE(cfg.fetch_release_assets());
    REQUIRE(cfg.log_categories().at("restore") == "warn");
    REQUIRE(cfg.log_categories().at("catalog") == "debug");
    std::remove("cfg.toml");
  }
}

TEST_CASE("config defaults") {
  Config cfg;
  REQUIRE(cfg.concurrency() == 3);
  REQUIRE(cfg.page_cap() == 10);
  REQUIRE(cfg.rate_limit_threshold() == 100);
  REQUIRE(cfg.api_base() == "https://api.github.com");
  REQUIRE(cfg.include_metadata());
  REQUIRE(cfg.metadata_classes().empty());
  const char *home = std::getenv("HOME");
  if (home != nullptr && *home != '\0') {
    REQUIRE(cfg.backup_dir() == std::string(home) + "/backups/github");
    REQUIRE(cfg.workspace_dir() == std::string(home) + "/workspace");
  }
}

TEST_CASE("config rejects unknown metadata classes") {
  nlohmann::json j = {{"metadata_classes", {"issues", "wiki"}}};
  try {
    Config::from_json(j);
    FAIL("expected BackupError");
  } catch (const BackupError &e) {
    REQUIRE(e.kind() == ErrorKind::Configuration);
  }
}

TEST_CASE("config rejects unsupported files") {
  {
    std::ofstream f("cfg.ini");
    f << "x=1\n";
  }
  REQUIRE_THROWS_AS(Config::from_file("cfg.ini"), std::runtime_error);
  std::remove("cfg.ini");
  REQUIRE_THROWS(Config::from_file("missing-config.json"));
}

TEST_CASE("config environment fallbacks") {
  std::map<std::string, std::string> env{
      {"GITHUB_TOKEN", "envtoken"},     {"GITHUB_USERNAME", "envuser"},
      {"GITHUB_ORG", "envorg"},         {"BACKUP_DIR", "/env/backups"},
      {"WORKSPACE_DIR", "/env/work"},   {"RATE_LIMIT_THRESHOLD", "42"}};

  Config blank;
  blank.apply_environment(env_of(env));
  REQUIRE(blank.api_keys() == std::vector<std::string>{"envtoken"});
  REQUIRE(blank.username() == "envuser");
  REQUIRE(blank.org() == "envorg");
  REQUIRE(blank.backup_dir() == "/env/backups");
  REQUIRE(blank.workspace_dir() == "/env/work");
  REQUIRE(blank.rate_limit_threshold() == 42);

  Config explicit_cfg;
  explicit_cfg.set_api_keys({"filetoken"});
  explicit_cfg.set_username("fileuser");
  explicit_cfg.set_backup_dir("/file/backups");
  explicit_cfg.set_rate_limit_threshold(7);
  explicit_cfg.apply_environment(env_of(env));
  REQUIRE(explicit_cfg.api_keys() ==
          std::vector<std::string>{"filetoken", "envtoken"});
  REQUIRE(explicit_cfg.username() == "fileuser");
  REQUIRE(explicit_cfg.backup_dir() == "/file/backups");
  REQUIRE(explicit_cfg.rate_limit_threshold() == 7);

  env["RATE_LIMIT_THRESHOLD"] = "lots";
  Config malformed;
  try {
    malformed.apply_environment(env_of(env));
    FAIL("expected BackupError");
  } catch (const BackupError &e) {
    REQUIRE(e.kind() == ErrorKind::Configuration);
  }
}

TEST_CASE("home expansion") {
  REQUIRE(expand_home("/abs/path") == "/abs/path");
  REQUIRE(expand_home("") == "");
  const char *home = std::getenv("HOME");
  if (home != nullptr && *home != '\0') {
    REQUIRE(expand_home("~/x") == std::string(home) + "/x");
  }
}
