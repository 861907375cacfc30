#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ghv {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 15> categories = {
      "app",      "catalog",     "cli",      "config",   "content",
      "coordinator", "github.client", "logging", "manifest", "metadata",
      "paths",    "pool",        "provider", "restore",  "workspace"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "coordinator=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'."
      << "\nExit codes: 0 committed, 1 invalid input, 2 partial failure but "
         "committed, 3 aborted.";
  return oss.str();
}

void add_category(CliOptions &options, const std::string &value) {
  auto pos = value.find('=');
  std::string name = pos == std::string::npos ? value : value.substr(0, pos);
  std::string level =
      pos == std::string::npos ? std::string{"debug"} : value.substr(pos + 1);
  if (name.empty()) {
    throw CLI::ValidationError("--log-category",
                               "category name must not be empty");
  }
  if (level.empty()) {
    level = "debug";
  }
  options.log_categories[name] = level;
}

} // namespace

/**
 * Parse command line arguments into the internal option structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"ghvault: crash-safe backup and restore of GitHub repositories"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "ghvault " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  auto *log_level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  auto *log_rotate_opt =
      app.add_option("--log-rotate", options.log_rotate,
                     "Number of rotated log files to retain (0 disables "
                     "rotation)")
          ->type_name("N")
          ->check(CLI::NonNegativeNumber)
          ->group("Logging");
  auto *log_compress_opt =
      app.add_flag("--log-compress", options.log_compress,
                   "Compress rotated log files")
          ->group("Logging");
  std::vector<std::string> categories;
  app.add_option("--log-category", categories,
                 "Enable a logging category (NAME or NAME=LEVEL). See help "
                 "footer for available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-k,--api-key", options.api_keys,
                 "Personal access token (repeatable)")
      ->type_name("TOKEN")
      ->group("GitHub");
  app.add_option("-f,--api-key-file", options.api_key_files,
                 "File containing tokens (JSON, YAML or TOML)")
      ->type_name("FILE")
      ->group("GitHub");
  app.add_option("-A,--api-base", options.api_base,
                 "Base URL of the GitHub API")
      ->type_name("URL")
      ->group("GitHub");
  app.add_option("--http-timeout", options.http_timeout,
                 "HTTP timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::PositiveNumber)
      ->group("GitHub");

  app.add_option("-d,--backup-dir", options.backup_dir,
                 "Root directory of the snapshot tree")
      ->type_name("DIR")
      ->group("Storage");
  app.add_option("-w,--workspace-dir", options.workspace_dir,
                 "Directory receiving restored checkouts")
      ->type_name("DIR")
      ->group("Storage");
  app.add_option("-j,--concurrency", options.concurrency,
                 "Repositories backed up in parallel")
      ->type_name("N")
      ->check(CLI::PositiveNumber)
      ->group("Backup");
  app.add_option("--page-cap", options.page_cap,
                 "Maximum pages per metadata class (0 = unlimited)")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Backup");

  std::vector<std::string> class_names;
  auto *backup = app.add_subcommand("backup", "Back up one repository");
  backup->fallthrough();
  backup->add_option("repository", options.repository, "OWNER/NAME")
      ->required();
  backup->add_flag("--no-metadata", options.no_metadata,
                   "Skip issues, pull requests and releases");
  backup->add_flag("--no-content", options.no_content,
                   "Skip the mirror clone");
  backup->add_option("--class", class_names,
                     "Metadata class to capture (repeatable): repository, "
                     "issues, pull_requests, releases")
      ->type_name("CLASS");
  backup->add_option("--resume", options.resume,
                     "Resume an incomplete snapshot with this timestamp")
      ->type_name("TIMESTAMP");

  auto *backup_all =
      app.add_subcommand("backup-all", "Back up every repository of an owner");
  backup_all->fallthrough();
  backup_all->add_option("owner", options.owner,
                         "User or organization (default: token owner)");
  backup_all->add_flag("--no-metadata", options.no_metadata,
                       "Skip issues, pull requests and releases");
  backup_all->add_flag("--no-content", options.no_content,
                       "Skip the mirror clones");
  backup_all->add_option("-I,--include", options.include_repos,
                         "Repository name or glob to include (repeatable)");
  backup_all->add_option("-X,--exclude", options.exclude_repos,
                         "Repository name or glob to exclude (repeatable)");

  auto *list = app.add_subcommand("list", "List valid snapshots");
  list->fallthrough();
  list->add_option("repository", options.repository,
                   "OWNER/NAME (default: every repository)");
  list->add_flag("--json", options.json, "Print JSON");
  list->add_flag("--show-incomplete", options.show_incomplete,
                 "Also print directories without a valid manifest");

  auto *restore = app.add_subcommand("restore", "Restore a snapshot");
  restore->fallthrough();
  restore->add_option("snapshot", options.snapshot,
                      "OWNER/NAME@TIMESTAMP, or OWNER/NAME for the newest")
      ->required();
  restore->add_option("target", options.target,
                      "Target directory (default: <workspace_dir>/<name>)");
  restore->add_flag("--overwrite", options.overwrite,
                    "Replace a non-empty target directory");
  restore->add_flag("--no-content", options.no_content,
                    "Skip the working checkout");
  restore->add_flag("--replay-metadata", options.replay_metadata,
                    "Recreate labels, issues and releases");
  restore->add_flag("--dry-run", options.dry_run,
                    "Plan the metadata replay without remote changes");
  restore->add_option("--into", options.into,
                      "Replay into OWNER/NAME instead of the source");
  restore->add_flag("--json", options.json, "Print the report as JSON");

  auto *rate_limit =
      app.add_subcommand("rate-limit", "Show the GitHub API request budget");
  rate_limit->fallthrough();

  try {
    app.parse(argc, argv);
    for (const auto &value : categories) {
      add_category(options, value);
    }
    for (const auto &name : class_names) {
      auto cls = entity_class_from_string(name);
      if (!cls) {
        throw CLI::ValidationError("--class", "unknown metadata class '" +
                                                  name + "'");
      }
      options.classes.push_back(*cls);
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code == 0 ? 0 : 1);
  }
  options.log_level_explicit = log_level_opt->count() > 0U;
  options.log_rotate_explicit = log_rotate_opt->count() > 0U;
  options.log_compress_explicit = log_compress_opt->count() > 0U;

  if (backup->parsed()) {
    options.command = Command::Backup;
  } else if (backup_all->parsed()) {
    options.command = Command::BackupAll;
  } else if (list->parsed()) {
    options.command = Command::List;
  } else if (restore->parsed()) {
    options.command = Command::Restore;
  } else if (rate_limit->parsed()) {
    options.command = Command::RateLimit;
  }
  cli_log()->debug("Parsed command line ({} tokens, {} token files)",
                   options.api_keys.size(), options.api_key_files.size());
  return options;
}

} // namespace ghv
