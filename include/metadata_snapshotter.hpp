/**
 * @file metadata_snapshotter.hpp
 * @brief Paginated export of repository metadata into artifacts.
 */

#ifndef GHVAULT_METADATA_SNAPSHOTTER_HPP
#define GHVAULT_METADATA_SNAPSHOTTER_HPP

#include "manifest.hpp"
#include "provider.hpp"
#include "retry.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ghv {

/// A per-entity sub-fetch that failed and was recorded instead of thrown.
struct SkippedEntity {
  std::string entity; ///< e.g. "issue #12"
  std::string part;   ///< e.g. "comments"
  std::string reason; ///< Error message
};

/// Serialized export of one entity class.
struct MetadataArtifact {
  EntityClass entity_class{EntityClass::Repository};
  std::vector<nlohmann::json> records; ///< Provider order, never re-sorted
  std::vector<SkippedEntity> skipped;
  std::size_t fetched_count{0};
  std::optional<std::size_t> total_count;
  bool truncated{false};

  /// Whether this artifact is a full export of its class.
  bool complete_export() const { return !truncated && skipped.empty(); }

  /// Manifest summary for a successfully captured artifact.
  EntitySummary summary() const;
};

nlohmann::json to_json(const MetadataArtifact &artifact);
MetadataArtifact artifact_from_json(const nlohmann::json &j);

/// Pagination bounds and optional sub-fetches.
struct SnapshotLimits {
  int page_cap{10};  ///< Maximum pages per class, 0 for unlimited
  int per_page{100}; ///< Page size requested from the provider
  bool fetch_issue_comments{false};
  bool fetch_pull_request_details{true};
  bool fetch_release_assets{true};
};

/**
 * Captures metadata classes through a RepositoryProvider.
 *
 * Per-entity sub-fetch failures are recorded in the artifact. A class-level
 * failure throws BackupError and leaves no artifact behind.
 */
class MetadataSnapshotter {
public:
  MetadataSnapshotter(RepositoryProvider &provider, SnapshotLimits limits = {},
                      RetryPolicy retry = {});

  /**
   * Capture one entity class of @p repository.
   *
   * @throws BackupError when the class as a whole cannot be fetched.
   * Malformed provider payloads surface as SourceUnavailable.
   */
  MetadataArtifact snapshot(EntityClass cls, const RepositoryRef &repository);

  /**
   * Write @p artifact to `<metadata_dir>/<class>.json`.
   *
   * @throws BackupError Storage on filesystem failures and SourceUnavailable
   * when the records cannot be serialized.
   */
  static void write_artifact(const std::filesystem::path &metadata_dir,
                             const MetadataArtifact &artifact);

  /// Load an artifact; `std::nullopt` when missing or unparseable.
  static std::optional<MetadataArtifact>
  read_artifact(const std::filesystem::path &metadata_dir, EntityClass cls);

  const SnapshotLimits &limits() const { return limits_; }

private:
  MetadataArtifact snapshot_repository(const RepositoryRef &repository);
  MetadataArtifact paginate(EntityClass cls, const RepositoryRef &repository);
  void enrich(MetadataArtifact &artifact, const RepositoryRef &repository);

  RepositoryProvider &provider_;
  SnapshotLimits limits_;
  RetryPolicy retry_;
};

} // namespace ghv

#endif // GHVAULT_METADATA_SNAPSHOTTER_HPP
