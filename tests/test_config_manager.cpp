#include "config_manager.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>

TEST_CASE("test config manager") {
  std::map<std::string, std::string> env{{"GITHUB_TOKEN", "envtoken"},
                                         {"BACKUP_DIR", "/env/backups"}};
  ghv::ConfigManager mgr([&env](const char *name) -> const char * {
    auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  });

  {
    std::ofstream f("tokens.yaml");
    f << "tokens:\n";
    f << "  - filetoken\n";
    f << "  - \" cfgtoken \"\n";
  }
  {
    nlohmann::json doc;
    doc["core"] = {{"concurrency", 2}};
    doc["github"] = {{"api_keys", {"cfgtoken"}},
                     {"api_key_files", {"tokens.yaml"}}};
    doc["logging"] = {{"log_level", "error"}};
    std::ofstream f("cfg.json");
    f << doc.dump();
  }
  ghv::Config cfg = mgr.load("cfg.json");
  REQUIRE(cfg.concurrency() == 2);
  REQUIRE(cfg.log_level() == "error");
  REQUIRE(cfg.api_keys() ==
          std::vector<std::string>{"cfgtoken", "filetoken", "envtoken"});
  REQUIRE(cfg.backup_dir() == "/env/backups");

  ghv::Config defaults = mgr.load("");
  REQUIRE(defaults.concurrency() == 3);
  REQUIRE(defaults.api_keys() == std::vector<std::string>{"envtoken"});

  {
    nlohmann::json doc;
    doc["api_key_files"] = {"missing.json"};
    std::ofstream f("cfg_missing.json");
    f << doc.dump();
  }
  REQUIRE_THROWS(mgr.load("cfg_missing.json"));

  std::remove("tokens.yaml");
  std::remove("cfg.json");
  std::remove("cfg_missing.json");
}
