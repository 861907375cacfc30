#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 0);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
      // not an integer
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
      // not a number
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys as legacy flat files.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"core", "github", "network", "logging", "backup", "restore",
        "workspace", "repositories"}) {
    merge_section(section);
  }

  return normalized;
}

std::vector<std::string> string_list(const nlohmann::json &value) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  return value.get<std::vector<std::string>>();
}

long parse_env_number(const char *name, const std::string &raw) {
  try {
    size_t idx = 0;
    long value = std::stol(raw, &idx);
    if (idx == raw.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw BackupError(ErrorKind::Configuration,
                    std::string(name) + " must be an integer, got '" + raw +
                        "'");
}

} // namespace

std::string expand_home(const std::string &path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return path;
  }
  return std::string(home) + path.substr(1);
}

std::string Config::backup_dir() const {
  return expand_home(backup_dir_.empty() ? "~/backups/github" : backup_dir_);
}

std::string Config::workspace_dir() const {
  return expand_home(workspace_dir_.empty() ? "~/workspace" : workspace_dir_);
}

void Config::apply_environment(const EnvLookup &lookup) {
  auto env = [&lookup](const char *name) -> std::string {
    const char *value = lookup(name);
    return value != nullptr ? std::string(value) : std::string();
  };
  if (auto token = env("GITHUB_TOKEN"); !token.empty()) {
    if (std::find(api_keys_.begin(), api_keys_.end(), token) ==
        api_keys_.end()) {
      api_keys_.push_back(token);
    }
  }
  if (auto user = env("GITHUB_USERNAME"); !user.empty() && username_.empty()) {
    username_ = user;
  }
  if (auto org = env("GITHUB_ORG"); !org.empty() && org_.empty()) {
    org_ = org;
  }
  if (auto dir = env("BACKUP_DIR"); !dir.empty() && backup_dir_.empty()) {
    backup_dir_ = dir;
  }
  if (auto dir = env("WORKSPACE_DIR"); !dir.empty() && workspace_dir_.empty()) {
    workspace_dir_ = dir;
  }
  if (auto raw = env("RATE_LIMIT_THRESHOLD");
      !raw.empty() && !rate_limit_threshold_set_) {
    rate_limit_threshold_ =
        std::max(0L, parse_env_number("RATE_LIMIT_THRESHOLD", raw));
  }
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 * @throws BackupError Configuration for unknown metadata classes.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    auto assign_category = [&categories](std::string name, std::string level) {
      if (name.empty()) {
        return;
      }
      if (level.empty()) {
        level = "debug";
      }
      categories[std::move(name)] = std::move(level);
    };
    auto assign_raw = [&assign_category](const std::string &raw) {
      auto pos = raw.find('=');
      assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                      pos == std::string::npos ? std::string{"debug"}
                                               : raw.substr(pos + 1));
    };
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_raw(item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_raw(value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("max_request_rate")) {
    set_max_request_rate(cfg["max_request_rate"].get<int>());
  }
  if (cfg.contains("rate_limit_threshold")) {
    set_rate_limit_threshold(cfg["rate_limit_threshold"].get<long>());
  }
  if (cfg.contains("rate_limit_max_wait")) {
    set_rate_limit_max_wait(cfg["rate_limit_max_wait"].get<int>());
  }
  if (cfg.contains("api_keys")) {
    set_api_keys(string_list(cfg["api_keys"]));
  }
  if (cfg.contains("api_key_files")) {
    set_api_key_files(string_list(cfg["api_key_files"]));
  }
  if (cfg.contains("username")) {
    set_username(cfg["username"].get<std::string>());
  }
  if (cfg.contains("org")) {
    set_org(cfg["org"].get<std::string>());
  }
  if (cfg.contains("backup_dir")) {
    set_backup_dir(cfg["backup_dir"].get<std::string>());
  }
  if (cfg.contains("workspace_dir")) {
    set_workspace_dir(cfg["workspace_dir"].get<std::string>());
  }
  if (cfg.contains("concurrency")) {
    set_concurrency(cfg["concurrency"].get<int>());
  }
  if (cfg.contains("page_cap")) {
    set_page_cap(cfg["page_cap"].get<int>());
  }
  if (cfg.contains("per_page")) {
    set_per_page(cfg["per_page"].get<int>());
  }
  if (cfg.contains("retry_attempts")) {
    set_retry_attempts(cfg["retry_attempts"].get<int>());
  }
  if (cfg.contains("retry_backoff_ms")) {
    set_retry_backoff_ms(cfg["retry_backoff_ms"].get<int>());
  }
  if (cfg.contains("retry_max_backoff_ms")) {
    set_retry_max_backoff_ms(cfg["retry_max_backoff_ms"].get<int>());
  }
  if (cfg.contains("include_metadata")) {
    set_include_metadata(cfg["include_metadata"].get<bool>());
  }
  if (cfg.contains("metadata_classes")) {
    std::vector<EntityClass> classes;
    for (const auto &name : string_list(cfg["metadata_classes"])) {
      auto cls = entity_class_from_string(name);
      if (!cls) {
        throw BackupError(ErrorKind::Configuration,
                          "Unknown metadata class '" + name + "'");
      }
      if (std::find(classes.begin(), classes.end(), *cls) == classes.end()) {
        classes.push_back(*cls);
      }
    }
    set_metadata_classes(classes);
  }
  if (cfg.contains("fetch_issue_comments")) {
    set_fetch_issue_comments(cfg["fetch_issue_comments"].get<bool>());
  }
  if (cfg.contains("fetch_release_assets")) {
    set_fetch_release_assets(cfg["fetch_release_assets"].get<bool>());
  }
  if (cfg.contains("fetch_pull_request_details")) {
    set_fetch_pull_request_details(
        cfg["fetch_pull_request_details"].get<bool>());
  }
  if (cfg.contains("parallel_metadata")) {
    set_parallel_metadata(cfg["parallel_metadata"].get<bool>());
  }
  if (cfg.contains("include_repos")) {
    set_include_repos(string_list(cfg["include_repos"]));
  }
  if (cfg.contains("exclude_repos")) {
    set_exclude_repos(string_list(cfg["exclude_repos"]));
  }

  // Warn on repositories appearing in both include and exclude lists.
  if (!include_repos_.empty() && !exclude_repos_.empty()) {
    std::unordered_set<std::string> exclude(exclude_repos_.begin(),
                                            exclude_repos_.end());
    for (const auto &r : include_repos_) {
      if (exclude.count(r) > 0) {
        config_log()->warn(
            "Repository '{}' listed in both include_repos and exclude_repos;"
            " exclusion takes precedence",
            r);
      }
    }
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = to_lower_copy(path.substr(pos + 1));
  config_log()->debug("Detected config file type: {}", ext);
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  if (j.is_null()) {
    j = nlohmann::json::object();
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace ghv
