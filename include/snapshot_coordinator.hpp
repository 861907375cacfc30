/**
 * @file snapshot_coordinator.hpp
 * @brief Per-repository backup state machine and bounded batch fan-out.
 *
 * Each backup runs `Created -> ContentInFlight -> MetadataInFlight ->
 * Finalizing -> Committed`, or ends in `Aborted` for cancelled and
 * catastrophic runs. The manifest write in `Finalizing` is the commit point;
 * aborted directories are removed.
 */

#ifndef GHVAULT_SNAPSHOT_COORDINATOR_HPP
#define GHVAULT_SNAPSHOT_COORDINATOR_HPP

#include "content_snapshotter.hpp"
#include "manifest.hpp"
#include "metadata_snapshotter.hpp"
#include "path_resolver.hpp"
#include "provider.hpp"
#include "retry.hpp"
#include "workspace.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghv {

/// States of one backup pipeline.
enum class SnapshotPhase {
  Created,
  ContentInFlight,
  MetadataInFlight,
  Finalizing,
  Committed,
  Aborted
};

std::string to_string(SnapshotPhase phase);

/// Outcome recorded for one repository.
enum class BackupOutcome {
  Committed,          ///< Manifest written, complete export
  PartiallyCommitted, ///< Manifest written, something failed or truncated
  Aborted,            ///< Cancelled or catastrophic, directory removed
  NotStarted,         ///< Skipped because the batch was cancelled
  Rejected            ///< Invalid identifier or already running
};

std::string to_string(BackupOutcome outcome);

/// Cooperative cancellation flag shared with running pipelines.
class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true); }
  bool cancelled() const noexcept { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

/// What a single backup captures.
struct BackupOptions {
  bool include_content{true};
  bool include_metadata{true};
  std::vector<EntityClass> classes; ///< Empty captures every class
  bool parallel_metadata{false};    ///< Fetch classes concurrently
};

/// Structured result of one repository's pipeline.
struct BackupResult {
  RepositoryRef repository;
  std::optional<SnapshotId> snapshot;
  BackupOutcome outcome{BackupOutcome::NotStarted};
  SnapshotPhase final_phase{SnapshotPhase::Created};
  std::optional<SnapshotManifest> manifest;
  std::string error;
  std::filesystem::path path;

  /// Whether a manifest was committed.
  bool committed() const {
    return outcome == BackupOutcome::Committed ||
           outcome == BackupOutcome::PartiallyCommitted;
  }
};

/// Per-repository results of a batch, keyed by `owner/name`.
struct BatchResult {
  std::map<std::string, BackupResult> results;
  std::size_t peak_concurrency{0}; ///< Most pipelines that ran at once

  std::size_t count(BackupOutcome outcome) const;
  /// Whether every repository committed a complete export.
  bool all_committed() const;
};

/// Selection of repositories for a batch run.
struct BatchOptions {
  std::string owner; ///< User or organization, empty for the token owner
  std::vector<std::string> include; ///< Exact names or globs, empty = all
  std::vector<std::string> exclude; ///< Exact names or globs
  long rate_limit_threshold{100};   ///< Warn below this remaining budget
  BackupOptions backup;
};

/// Tunables of the coordinator.
struct CoordinatorSettings {
  int concurrency{3};
  SnapshotLimits limits;
  RetryPolicy retry;
};

/**
 * Runs backups against injected provider and workspace handles.
 *
 * Backups of the same repository are serialized; different repositories
 * proceed independently.
 */
class SnapshotCoordinator {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using PhaseObserver =
      std::function<void(const SnapshotId &, SnapshotPhase)>;

  SnapshotCoordinator(PathResolver paths, RepositoryProvider &provider,
                      LocalWorkspace &workspace,
                      CoordinatorSettings settings = {});

  /// Replace the wall clock used to allocate snapshot timestamps.
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  /// Observe phase transitions (invoked on the pipeline's thread).
  void set_phase_observer(PhaseObserver observer) {
    observer_ = std::move(observer);
  }

  /**
   * Back up one repository.
   *
   * @throws BackupError InvalidIdentifier for hostile or malformed refs.
   */
  BackupResult backup(const RepositoryRef &repository,
                      const BackupOptions &options = {},
                      const CancellationToken *cancel = nullptr);

  /**
   * Re-run the pipeline for a snapshot directory left without a valid
   * manifest, reusing its id.
   *
   * @throws BackupError NotFound when the directory does not exist,
   *         Conflict when it is already committed.
   */
  BackupResult resume(const SnapshotId &id, const BackupOptions &options = {},
                      const CancellationToken *cancel = nullptr);

  /**
   * Back up every repository of an owner selected by @p options.
   *
   * @throws BackupError when the repository listing itself fails.
   */
  BatchResult backup_all(const BatchOptions &options,
                         const CancellationToken *cancel = nullptr);

  /// Back up @p repositories on the worker pool.
  BatchResult backup_many(const std::vector<RepositoryRef> &repositories,
                          const BackupOptions &options = {},
                          const CancellationToken *cancel = nullptr);

  /// Whether @p name passes include/exclude patterns.
  static bool selected(const std::string &name,
                       const std::vector<std::string> &include,
                       const std::vector<std::string> &exclude);

  const PathResolver &paths() const { return paths_; }

private:
  SnapshotId allocate(const RepositoryRef &repository);
  BackupResult run_pipeline(const SnapshotId &id, const BackupOptions &options,
                            const CancellationToken *cancel);
  void notify(const SnapshotId &id, SnapshotPhase phase);
  std::shared_ptr<std::mutex> writer_lock(const RepositoryRef &repository);

  PathResolver paths_;
  RepositoryProvider &provider_;
  CoordinatorSettings settings_;
  ContentSnapshotter content_;
  MetadataSnapshotter metadata_;
  Clock clock_;
  PhaseObserver observer_;
  std::mutex locks_mutex_;
  std::unordered_map<RepositoryRef, std::shared_ptr<std::mutex>> locks_;
};

} // namespace ghv

#endif // GHVAULT_SNAPSHOT_COORDINATOR_HPP
