#ifndef GHVAULT_CONFIG_HPP
#define GHVAULT_CONFIG_HPP

#include "manifest.hpp"
#include <cstdlib>
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghv {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Lookup function used to read environment variables.
  using EnvLookup = std::function<const char *(const char *)>;

  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Set or update a single log category override.
  void set_log_category(const std::string &name, const std::string &level) {
    log_categories_[name] = level;
  }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t < 1 ? 1 : t; }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Maximum requests per minute (0 = unlimited).
  int max_request_rate() const { return max_request_rate_; }

  /// Set maximum request rate.
  void set_max_request_rate(int rate) {
    max_request_rate_ = rate < 0 ? 0 : rate;
  }

  /// Remaining request budget below which batch runs warn.
  long rate_limit_threshold() const { return rate_limit_threshold_; }

  /// Set the rate limit warning threshold.
  void set_rate_limit_threshold(long threshold) {
    rate_limit_threshold_ = threshold < 0 ? 0 : threshold;
    rate_limit_threshold_set_ = true;
  }

  /// Longest rate limit reset the client waits for, in seconds.
  int rate_limit_max_wait() const { return rate_limit_max_wait_; }

  /// Set the longest rate limit wait.
  void set_rate_limit_max_wait(int seconds) {
    rate_limit_max_wait_ = seconds < 0 ? 0 : seconds;
  }

  /// Personal access tokens.
  const std::vector<std::string> &api_keys() const { return api_keys_; }

  /// Set personal access tokens.
  void set_api_keys(const std::vector<std::string> &keys) { api_keys_ = keys; }

  /// Files holding additional tokens.
  const std::vector<std::string> &api_key_files() const {
    return api_key_files_;
  }

  /// Set token files.
  void set_api_key_files(const std::vector<std::string> &paths) {
    api_key_files_ = paths;
  }

  /// Account whose repositories are backed up.
  const std::string &username() const { return username_; }

  /// Set the account name.
  void set_username(const std::string &name) { username_ = name; }

  /// Organization whose repositories are backed up.
  const std::string &org() const { return org_; }

  /// Set the organization name.
  void set_org(const std::string &org) { org_ = org; }

  /// Root directory of the snapshot tree, `~` expanded.
  std::string backup_dir() const;

  /// Set the backup root.
  void set_backup_dir(const std::string &dir) { backup_dir_ = dir; }

  /// Directory receiving restored checkouts, `~` expanded.
  std::string workspace_dir() const;

  /// Set the workspace directory.
  void set_workspace_dir(const std::string &dir) { workspace_dir_ = dir; }

  /// Number of repositories backed up concurrently.
  int concurrency() const { return concurrency_; }

  /// Set concurrency (minimum 1).
  void set_concurrency(int c) { concurrency_ = c < 1 ? 1 : c; }

  /// Maximum pages fetched per metadata class (0 = unlimited).
  int page_cap() const { return page_cap_; }

  /// Set the page cap.
  void set_page_cap(int cap) { page_cap_ = cap < 0 ? 0 : cap; }

  /// Page size requested from the provider.
  int per_page() const { return per_page_; }

  /// Set the page size (1-100).
  void set_per_page(int n) { per_page_ = n < 1 ? 1 : (n > 100 ? 100 : n); }

  /// Attempts for retryable failures.
  int retry_attempts() const { return retry_attempts_; }

  /// Set retry attempts (minimum 1).
  void set_retry_attempts(int n) { retry_attempts_ = n < 1 ? 1 : n; }

  /// Initial retry backoff in milliseconds.
  int retry_backoff_ms() const { return retry_backoff_ms_; }

  /// Set the initial retry backoff.
  void set_retry_backoff_ms(int ms) { retry_backoff_ms_ = ms < 0 ? 0 : ms; }

  /// Upper bound of the retry backoff in milliseconds.
  int retry_max_backoff_ms() const { return retry_max_backoff_ms_; }

  /// Set the retry backoff cap.
  void set_retry_max_backoff_ms(int ms) {
    retry_max_backoff_ms_ = ms < 0 ? 0 : ms;
  }

  /// Whether metadata is captured at all.
  bool include_metadata() const { return include_metadata_; }

  /// Enable or disable metadata capture.
  void set_include_metadata(bool v) { include_metadata_ = v; }

  /// Metadata classes to capture, empty for all.
  const std::vector<EntityClass> &metadata_classes() const {
    return metadata_classes_;
  }

  /// Set metadata classes.
  void set_metadata_classes(const std::vector<EntityClass> &classes) {
    metadata_classes_ = classes;
  }

  /// Whether issue comments are fetched per issue.
  bool fetch_issue_comments() const { return fetch_issue_comments_; }

  /// Enable or disable per-issue comment fetches.
  void set_fetch_issue_comments(bool v) { fetch_issue_comments_ = v; }

  /// Whether release assets are fetched per release.
  bool fetch_release_assets() const { return fetch_release_assets_; }

  /// Enable or disable per-release asset fetches.
  void set_fetch_release_assets(bool v) { fetch_release_assets_ = v; }

  /// Whether pull request details are fetched per pull request.
  bool fetch_pull_request_details() const {
    return fetch_pull_request_details_;
  }

  /// Enable or disable per-pull-request detail fetches.
  void set_fetch_pull_request_details(bool v) {
    fetch_pull_request_details_ = v;
  }

  /// Whether metadata classes are fetched concurrently.
  bool parallel_metadata() const { return parallel_metadata_; }

  /// Enable or disable concurrent metadata fetches.
  void set_parallel_metadata(bool v) { parallel_metadata_ = v; }

  /// Repositories to include.
  const std::vector<std::string> &include_repos() const {
    return include_repos_;
  }

  /// Set repositories to include.
  void set_include_repos(const std::vector<std::string> &repos) {
    include_repos_ = repos;
  }

  /// Repositories to exclude.
  const std::vector<std::string> &exclude_repos() const {
    return exclude_repos_;
  }

  /// Set repositories to exclude.
  void set_exclude_repos(const std::vector<std::string> &repos) {
    exclude_repos_ = repos;
  }

  /**
   * Fill unset values from `GITHUB_TOKEN`, `GITHUB_USERNAME`, `GITHUB_ORG`,
   * `BACKUP_DIR`, `WORKSPACE_DIR` and `RATE_LIMIT_THRESHOLD`.
   *
   * @param lookup Environment accessor, `std::getenv` by default.
   * @throws BackupError Configuration when a numeric variable is malformed.
   */
  void apply_environment(const EnvLookup &lookup = &std::getenv);

  /// Load configuration from a file. Supports YAML, TOML, and JSON.
  static Config from_file(const std::string &path);

  /// Create configuration from a parsed JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate fields from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;

  std::string api_base_ = "https://api.github.com";
  int http_timeout_ = 30;
  std::string http_proxy_;
  std::string https_proxy_;
  int max_request_rate_ = 0;
  long rate_limit_threshold_ = 100;
  bool rate_limit_threshold_set_ = false;
  int rate_limit_max_wait_ = 60;
  std::vector<std::string> api_keys_;
  std::vector<std::string> api_key_files_;
  std::string username_;
  std::string org_;

  std::string backup_dir_;
  std::string workspace_dir_;
  int concurrency_ = 3;
  int page_cap_ = 10;
  int per_page_ = 100;
  int retry_attempts_ = 3;
  int retry_backoff_ms_ = 500;
  int retry_max_backoff_ms_ = 30000;
  bool include_metadata_ = true;
  std::vector<EntityClass> metadata_classes_;
  bool fetch_issue_comments_ = false;
  bool fetch_release_assets_ = true;
  bool fetch_pull_request_details_ = true;
  bool parallel_metadata_ = false;
  std::vector<std::string> include_repos_;
  std::vector<std::string> exclude_repos_;
};

/// Replace a leading `~` with `$HOME`.
std::string expand_home(const std::string &path);

} // namespace ghv

#endif // GHVAULT_CONFIG_HPP
