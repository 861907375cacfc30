/**
 * @file restore_engine.hpp
 * @brief Reconstruct a working checkout and replay metadata from a snapshot.
 */

#ifndef GHVAULT_RESTORE_ENGINE_HPP
#define GHVAULT_RESTORE_ENGINE_HPP

#include "backup_catalog.hpp"
#include "manifest.hpp"
#include "provider.hpp"
#include "workspace.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ghv {

/// Which restore steps run and how.
struct RestoreOptions {
  bool overwrite{false};       ///< Allow a non-empty target directory
  bool restore_content{true};  ///< Materialize a checkout from the mirror
  bool replay_metadata{false}; ///< Recreate entities through the provider
  bool dry_run{false};         ///< Plan the replay without remote writes
  /// Replay target, defaults to the snapshot's repository.
  std::optional<RepositoryRef> target_repository;
  std::vector<EntityClass> classes; ///< Classes to replay, empty = all
};

/// Status of one restore step or replayed entity.
enum class StepStatus { Done, Skipped, Failed, Planned };

std::string to_string(StepStatus status);

/// Result of replaying one entity.
struct EntityRestore {
  EntityClass entity_class{EntityClass::Issues};
  std::string entity; ///< e.g. "issue #3 Fix crash", "label bug"
  StepStatus status{StepStatus::Planned};
  std::string detail;
};

/// Structured report of a restore.
struct RestoreReport {
  SnapshotId snapshot;
  std::filesystem::path target;
  bool dry_run{false};

  StepStatus content{StepStatus::Skipped};
  std::string content_detail;
  std::vector<std::string> restored_refs; ///< Branches and tags in the target
  bool refs_match{false};                 ///< Target refs equal the mirror's
  std::string active_branch;
  bool clean{false};

  StepStatus metadata{StepStatus::Skipped};
  std::vector<EntityRestore> entities;

  /// Whether any step or entity failed.
  bool partial() const;
  /// Number of entities with @p status.
  std::size_t count(StepStatus status) const;

  /// Human-readable multi-line rendering.
  std::string to_text() const;
  nlohmann::json to_json() const;
};

/**
 * Restores snapshots listed by a BackupCatalog.
 *
 * The provider is optional; without one, metadata replay is only planned.
 */
class RestoreEngine {
public:
  RestoreEngine(const BackupCatalog &catalog, LocalWorkspace &workspace,
                RepositoryProvider *provider = nullptr);

  /**
   * Restore @p id into @p target.
   *
   * @throws BackupError NotFound for unknown or invalid snapshots. When
   *         content is restored: InvalidPath when @p target overlaps the
   *         backup root, TargetNotEmpty when @p target has content and
   *         overwrite is off.
   *         Per-step and per-entity failures are recorded in the report.
   */
  RestoreReport restore(const SnapshotId &id,
                        const std::filesystem::path &target,
                        const RestoreOptions &options = {});

private:
  void restore_content(const SnapshotManifest &manifest,
                       const std::filesystem::path &dir,
                       const std::filesystem::path &target,
                       const RestoreOptions &options, RestoreReport &report);
  void replay_metadata(const std::filesystem::path &dir,
                       const SnapshotId &id, const RestoreOptions &options,
                       RestoreReport &report);

  const BackupCatalog &catalog_;
  LocalWorkspace &workspace_;
  RepositoryProvider *provider_;
};

} // namespace ghv

#endif // GHVAULT_RESTORE_ENGINE_HPP
