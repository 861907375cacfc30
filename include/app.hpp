/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for ghvault.
 *
 * Declares the App class, which merges command line options with the
 * configuration, initialises logging, and dispatches the backup, listing and
 * restore commands.
 */
#ifndef GHVAULT_APP_HPP
#define GHVAULT_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "github_client.hpp"
#include "provider.hpp"
#include "snapshot_coordinator.hpp"
#include "workspace.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>

namespace ghv {

/// Remote and local handles used by the commands.
struct Services {
  std::unique_ptr<GitHubClient> client; ///< Owns the provider's transport
  std::unique_ptr<RepositoryProvider> provider;
  std::unique_ptr<LocalWorkspace> workspace;
};

/// Builds Services from the effective configuration.
using ServiceFactory = std::function<Services(const Config &)>;

/// Services talking to GitHub through libcurl and to git through libgit2.
Services make_github_services(const Config &cfg);

/// Process exit code of a single repository backup.
int exit_code_for(BackupOutcome outcome);

/// Process exit code of a batch backup.
int exit_code_for(const BatchResult &batch);

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  App();

  /**
   * @param factory Builds provider and workspace handles once the
   *        configuration is known.
   * @param out Stream receiving command output.
   */
  explicit App(ServiceFactory factory, std::ostream &out = std::cout);

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return 0 on success, 1 for invalid input, 2 for a partial failure that
   *         still committed, 3 when the operation aborted.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Effective configuration.
  const Config &config() const { return config_; }

  /// Cancellation flag observed by running backups.
  CancellationToken &cancellation() { return cancel_; }

private:
  int dispatch();
  int run_backup();
  int run_backup_all();
  int run_list();
  int run_restore();
  int run_rate_limit();

  void merge_options();
  void init_logging();
  Services &services();
  CoordinatorSettings coordinator_settings() const;
  BackupOptions backup_options() const;

  ServiceFactory factory_;
  std::ostream &out_;
  CliOptions options_;
  Config config_;
  std::optional<Services> services_;
  CancellationToken cancel_;
};

} // namespace ghv

#endif // GHVAULT_APP_HPP
