/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for ghvault.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */
#ifndef GHVAULT_CLI_HPP
#define GHVAULT_CLI_HPP

#include "manifest.hpp"
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghv {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command { None, Backup, BackupAll, List, Restore, RateLimit };

/**
 * Parsed command line options supplied via the CLI.
 *
 * Values flagged `*_explicit` override the configuration file only when the
 * corresponding option appeared on the command line.
 */
struct CliOptions {
  Command command{Command::None};

  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false};
  std::string log_file; ///< Optional path to rotating log file
  int log_rotate{3};    ///< Number of rotated log files to keep (0 disables)
  bool log_compress{false};          ///< Compress rotated log files
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI

  std::vector<std::string> api_keys;      ///< Personal access tokens
  std::vector<std::string> api_key_files; ///< Files containing tokens
  std::string api_base;                   ///< Base URL for GitHub API
  std::string backup_dir;                 ///< Backup root override
  std::string workspace_dir;              ///< Workspace override
  int concurrency{0};                     ///< Parallel backups (0 = config)
  int page_cap{-1};                       ///< Page cap (-1 = config)
  int http_timeout{0};                    ///< HTTP timeout (0 = config)

  // backup / backup-all
  std::string repository; ///< OWNER/NAME for backup, list, restore
  std::string owner;      ///< User or organization for backup-all
  bool no_metadata{false};
  bool no_content{false};
  std::vector<EntityClass> classes; ///< --class selections
  std::string resume;               ///< Timestamp to resume
  std::vector<std::string> include_repos;
  std::vector<std::string> exclude_repos;

  // list
  bool json{false};
  bool show_incomplete{false};

  // restore
  std::string snapshot; ///< OWNER/NAME[@TIMESTAMP]
  std::string target;   ///< Restore target directory
  bool overwrite{false};
  bool replay_metadata{false};
  bool dry_run{false};
  std::string into; ///< Replay target repository
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters non-error conditions such as
 *         `--help` or `--version`, or invalid arguments.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace ghv

#endif // GHVAULT_CLI_HPP
