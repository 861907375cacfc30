#include "app.hpp"
#include "backup_catalog.hpp"
#include "config_manager.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "restore_engine.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace ghv {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

int exit_code_for(const BackupError &e) {
  switch (e.kind()) {
  case ErrorKind::InvalidIdentifier:
  case ErrorKind::Configuration:
  case ErrorKind::TargetNotEmpty:
  case ErrorKind::InvalidPath:
  case ErrorKind::NotFound:
  case ErrorKind::Conflict:
    return 1;
  default:
    return 3;
  }
}

std::string describe_class(const EntitySummary &summary) {
  std::string text = to_string(summary.state);
  if (summary.state == MetadataState::Complete) {
    text += " (" + std::to_string(summary.fetched_count);
    if (summary.truncated) {
      text += ", truncated";
    }
    if (summary.skipped_entities > 0) {
      text += ", " + std::to_string(summary.skipped_entities) + " degraded";
    }
    text += ")";
  } else if (!summary.error.empty()) {
    text += ": " + summary.error;
  }
  return text;
}

void print_manifest(std::ostream &out, const SnapshotManifest &manifest) {
  out << "  content: " << to_string(manifest.content_state);
  if (manifest.content_state == ContentState::Complete) {
    out << " (" << manifest.ref_count << " refs)";
  } else if (!manifest.content_error.empty()) {
    out << ": " << manifest.content_error;
  }
  out << '\n';
  for (const auto &[cls, summary] : manifest.metadata) {
    out << "  " << to_string(cls) << ": " << describe_class(summary) << '\n';
  }
}

void print_result(std::ostream &out, const BackupResult &result) {
  out << (result.snapshot ? result.snapshot->to_string()
                          : result.repository.qualified_name())
      << ' ' << to_string(result.outcome);
  if (!result.error.empty()) {
    out << ": " << result.error;
  }
  out << '\n';
  if (result.manifest) {
    print_manifest(out, *result.manifest);
  }
}

} // namespace

Services make_github_services(const Config &cfg) {
  Services services;
  const int timeout_ms = cfg.http_timeout() * 1000;
  auto http = std::make_unique<CurlHttpClient>(timeout_ms, 0, 0,
                                               cfg.http_proxy(),
                                               cfg.https_proxy());
  const int delay_ms =
      cfg.max_request_rate() > 0 ? 60000 / cfg.max_request_rate() : 0;
  services.client = std::make_unique<GitHubClient>(
      cfg.api_keys(), std::move(http), delay_ms, timeout_ms, cfg.api_base(),
      std::chrono::seconds(cfg.rate_limit_max_wait()));
  services.provider = std::make_unique<GitHubProvider>(*services.client);
  services.workspace = std::make_unique<GitWorkspace>(
      cfg.api_keys().empty() ? std::string() : cfg.api_keys().front());
  return services;
}

int exit_code_for(BackupOutcome outcome) {
  switch (outcome) {
  case BackupOutcome::Committed:
    return 0;
  case BackupOutcome::PartiallyCommitted:
    return 2;
  case BackupOutcome::Rejected:
    return 1;
  case BackupOutcome::Aborted:
  case BackupOutcome::NotStarted:
    return 3;
  }
  return 3;
}

int exit_code_for(const BatchResult &batch) {
  if (batch.results.empty() || batch.all_committed()) {
    return 0;
  }
  if (batch.count(BackupOutcome::Committed) +
          batch.count(BackupOutcome::PartiallyCommitted) ==
      0) {
    return 3;
  }
  return 2;
}

App::App() : App(make_github_services) {}

App::App(ServiceFactory factory, std::ostream &out)
    : factory_(std::move(factory)), out_(out) {}

/**
 * Execute the main application flow.
 *
 * This routine orchestrates CLI parsing, configuration loading, logger
 * initialization and command dispatch. Errors are formatted here and mapped
 * to exit codes.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  try {
    config_ = ConfigManager().load(options_.config_file);
    merge_options();
  } catch (const std::exception &e) {
    app_log()->error("Invalid configuration: {}", e.what());
    return 1;
  }
  init_logging();
  try {
    return dispatch();
  } catch (const BackupError &e) {
    app_log()->error("{} ({})", e.what(), to_string(e.kind()));
    return exit_code_for(e);
  } catch (const std::exception &e) {
    app_log()->error("Unexpected failure: {}", e.what());
    return 3;
  }
}

void App::merge_options() {
  if (options_.verbose) {
    config_.set_verbose(true);
  }
  if (options_.log_level_explicit) {
    config_.set_log_level(options_.log_level);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  for (const auto &[category, level] : options_.log_categories) {
    config_.set_log_category(category, level);
  }
  if (!options_.api_keys.empty()) {
    auto keys = options_.api_keys;
    for (const auto &key : config_.api_keys()) {
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(key);
      }
    }
    config_.set_api_keys(keys);
  }
  if (!options_.api_key_files.empty()) {
    config_.set_api_key_files(options_.api_key_files);
    ConfigManager().load_token_files(config_);
  }
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (!options_.backup_dir.empty()) {
    config_.set_backup_dir(options_.backup_dir);
  }
  if (!options_.workspace_dir.empty()) {
    config_.set_workspace_dir(options_.workspace_dir);
  }
  if (options_.concurrency > 0) {
    config_.set_concurrency(options_.concurrency);
  }
  if (options_.page_cap >= 0) {
    config_.set_page_cap(options_.page_cap);
  }
  if (options_.http_timeout > 0) {
    config_.set_http_timeout(options_.http_timeout);
  }
  if (!options_.include_repos.empty()) {
    config_.set_include_repos(options_.include_repos);
  }
  if (!options_.exclude_repos.empty()) {
    config_.set_exclude_repos(options_.exclude_repos);
  }
}

void App::init_logging() {
  std::string level_str = config_.log_level();
  if (config_.verbose() && level_str == "info") {
    level_str = "debug";
  }
  spdlog::level::level_enum lvl = spdlog::level::info;
  try {
    lvl = spdlog::level::from_str(level_str);
  } catch (const spdlog::spdlog_ex &) {
    // keep default
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    try {
      category_levels[category] = spdlog::level::from_str(category_level);
    } catch (const spdlog::spdlog_ex &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
    }
  }
  configure_log_categories(category_levels);
  app_log()->debug("Backup root {}", config_.backup_dir());
}

Services &App::services() {
  if (!services_) {
    services_ = factory_(config_);
  }
  return *services_;
}

CoordinatorSettings App::coordinator_settings() const {
  CoordinatorSettings settings;
  settings.concurrency = config_.concurrency();
  settings.limits.page_cap = config_.page_cap();
  settings.limits.per_page = config_.per_page();
  settings.limits.fetch_issue_comments = config_.fetch_issue_comments();
  settings.limits.fetch_pull_request_details =
      config_.fetch_pull_request_details();
  settings.limits.fetch_release_assets = config_.fetch_release_assets();
  settings.retry.max_attempts = config_.retry_attempts();
  settings.retry.initial_backoff =
      std::chrono::milliseconds(config_.retry_backoff_ms());
  settings.retry.max_backoff =
      std::chrono::milliseconds(config_.retry_max_backoff_ms());
  return settings;
}

BackupOptions App::backup_options() const {
  BackupOptions backup;
  backup.include_content = !options_.no_content;
  backup.include_metadata = config_.include_metadata() && !options_.no_metadata;
  backup.classes =
      options_.classes.empty() ? config_.metadata_classes() : options_.classes;
  backup.parallel_metadata = config_.parallel_metadata();
  return backup;
}

int App::dispatch() {
  switch (options_.command) {
  case Command::Backup:
    return run_backup();
  case Command::BackupAll:
    return run_backup_all();
  case Command::List:
    return run_list();
  case Command::Restore:
    return run_restore();
  case Command::RateLimit:
    return run_rate_limit();
  case Command::None:
    break;
  }
  app_log()->error("No command given");
  return 1;
}

int App::run_backup() {
  auto ref = RepositoryRef::parse(options_.repository);
  auto &svc = services();
  SnapshotCoordinator coordinator(PathResolver(config_.backup_dir()),
                                  *svc.provider, *svc.workspace,
                                  coordinator_settings());
  BackupResult result =
      options_.resume.empty()
          ? coordinator.backup(ref, backup_options(), &cancel_)
          : coordinator.resume(SnapshotId{ref, options_.resume},
                               backup_options(), &cancel_);
  print_result(out_, result);
  return exit_code_for(result.outcome);
}

int App::run_backup_all() {
  auto &svc = services();
  SnapshotCoordinator coordinator(PathResolver(config_.backup_dir()),
                                  *svc.provider, *svc.workspace,
                                  coordinator_settings());
  BatchOptions batch_options;
  batch_options.owner = options_.owner;
  if (batch_options.owner.empty()) {
    batch_options.owner =
        !config_.org().empty() ? config_.org() : config_.username();
  }
  batch_options.include = config_.include_repos();
  batch_options.exclude = config_.exclude_repos();
  batch_options.rate_limit_threshold = config_.rate_limit_threshold();
  batch_options.backup = backup_options();
  BatchResult batch = coordinator.backup_all(batch_options, &cancel_);
  for (const auto &[name, result] : batch.results) {
    print_result(out_, result);
  }
  out_ << batch.results.size() << " repositories: "
       << batch.count(BackupOutcome::Committed) << " committed, "
       << batch.count(BackupOutcome::PartiallyCommitted) << " partial, "
       << batch.count(BackupOutcome::Aborted) << " aborted, "
       << batch.count(BackupOutcome::NotStarted) << " not started, "
       << batch.count(BackupOutcome::Rejected) << " rejected\n";
  return exit_code_for(batch);
}

int App::run_list() {
  BackupCatalog catalog{PathResolver(config_.backup_dir())};
  if (options_.repository.empty()) {
    auto repos = catalog.repositories();
    if (options_.json) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto &repo : repos) {
        list.push_back({{"repository", repo.repository.qualified_name()},
                        {"snapshots", repo.snapshots},
                        {"incomplete", repo.incomplete},
                        {"latest", repo.latest}});
      }
      out_ << list.dump(2) << '\n';
      return 0;
    }
    if (repos.empty()) {
      out_ << "No backups under " << catalog.paths().root().string() << '\n';
    }
    for (const auto &repo : repos) {
      out_ << repo.repository.qualified_name() << ": " << repo.snapshots
           << " snapshots";
      if (!repo.latest.empty()) {
        out_ << ", latest " << repo.latest;
      }
      if (repo.incomplete > 0) {
        out_ << ", " << repo.incomplete << " incomplete";
      }
      out_ << '\n';
    }
    return 0;
  }

  auto ref = RepositoryRef::parse(options_.repository);
  auto manifests = catalog.list(ref);
  if (options_.json) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &manifest : manifests) {
      list.push_back(to_json(manifest));
    }
    out_ << list.dump(2) << '\n';
  } else {
    if (manifests.empty()) {
      out_ << "No valid snapshots of " << ref.qualified_name() << '\n';
    }
    for (const auto &manifest : manifests) {
      out_ << manifest.id.to_string()
           << (manifest.fully_successful() ? "" : " (partial)") << '\n';
      print_manifest(out_, manifest);
    }
  }
  if (options_.show_incomplete) {
    for (const auto &entry : catalog.incomplete(ref)) {
      out_ << "incomplete " << entry.path.string() << ": " << entry.reason
           << '\n';
    }
  }
  return 0;
}

int App::run_restore() {
  BackupCatalog catalog{PathResolver(config_.backup_dir())};
  SnapshotId id;
  if (options_.snapshot.find('@') != std::string::npos) {
    id = SnapshotId::parse(options_.snapshot);
  } else {
    auto ref = RepositoryRef::parse(options_.snapshot);
    auto newest = catalog.latest(ref);
    if (!newest) {
      throw BackupError(ErrorKind::NotFound,
                        "No valid snapshot of " + ref.qualified_name());
    }
    id = newest->id;
  }
  std::filesystem::path target =
      options_.target.empty()
          ? std::filesystem::path(config_.workspace_dir()) / id.repository.name
          : std::filesystem::path(options_.target);

  RestoreOptions restore_options;
  restore_options.overwrite = options_.overwrite;
  restore_options.restore_content = !options_.no_content;
  restore_options.replay_metadata = options_.replay_metadata;
  restore_options.dry_run = options_.dry_run;
  if (!options_.into.empty()) {
    restore_options.target_repository = RepositoryRef::parse(options_.into);
  }

  auto &svc = services();
  RestoreEngine engine(catalog, *svc.workspace, svc.provider.get());
  RestoreReport report = engine.restore(id, target, restore_options);
  if (options_.json) {
    out_ << report.to_json().dump(2) << '\n';
  } else {
    out_ << report.to_text();
  }
  return report.partial() ? 2 : 0;
}

int App::run_rate_limit() {
  auto budget = services().provider->rate_limit();
  out_ << "limit " << budget.limit << ", remaining " << budget.remaining
       << ", resets in " << budget.reset_after.count() << "s\n";
  return 0;
}

} // namespace ghv
