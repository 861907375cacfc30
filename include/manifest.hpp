/**
 * @file manifest.hpp
 * @brief Snapshot manifest: the commit record of a backup.
 *
 * A snapshot directory is valid only when its manifest exists, parses, and
 * records terminal states for content and every metadata class. The manifest
 * is written last and atomically (temporary file plus rename).
 */

#ifndef GHVAULT_MANIFEST_HPP
#define GHVAULT_MANIFEST_HPP

#include "snapshot_id.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ghv {

/// Metadata entity classes captured per snapshot.
enum class EntityClass { Repository, Issues, PullRequests, Releases };

/// All entity classes in capture order.
const std::vector<EntityClass> &all_entity_classes();

/// Manifest key of an entity class ("repository", "issues", ...).
std::string to_string(EntityClass cls);

/// Parse a manifest key; `std::nullopt` for unknown names.
std::optional<EntityClass> entity_class_from_string(const std::string &name);

/// Artifact file name of an entity class ("issues.json", ...).
std::string artifact_file_name(EntityClass cls);

/// Outcome of the content (mirror clone) phase.
enum class ContentState { Pending, Complete, Failed, Skipped };

/// Outcome of one metadata class.
enum class MetadataState { Pending, Complete, Failed, Skipped };

std::string to_string(ContentState state);
std::string to_string(MetadataState state);

/// Per-class record stored in the manifest.
struct EntitySummary {
  MetadataState state{MetadataState::Pending};
  std::size_t fetched_count{0};
  std::optional<std::size_t> total_count; ///< Known total, if reported
  bool truncated{false};                  ///< Page cap reached
  std::size_t skipped_entities{0};        ///< Degraded per-entity fetches
  std::string error;                      ///< Failure reason when Failed
};

/// Commit record of one snapshot.
struct SnapshotManifest {
  static constexpr int kFormatVersion = 1;

  int format_version{kFormatVersion};
  SnapshotId id;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point completed_at{};
  ContentState content_state{ContentState::Pending};
  std::string content_error;
  std::map<EntityClass, EntitySummary> metadata;
  std::string source_default_branch;
  std::string clone_url;
  std::size_t ref_count{0};

  /// Whether content and every recorded class reached a terminal state.
  bool terminal() const;

  /**
   * Whether the snapshot is a complete export: nothing failed, nothing
   * truncated, and no entity was degraded. Classes skipped on request do
   * not count against completeness.
   */
  bool fully_successful() const;

  /// Per-class entity counts keyed by class name.
  std::map<std::string, std::size_t> entity_counts() const;
};

nlohmann::json to_json(const SnapshotManifest &manifest);

/**
 * Parse a manifest document.
 *
 * @throws nlohmann::json::exception or BackupError (InvalidIdentifier) when
 *         the document is malformed.
 */
SnapshotManifest manifest_from_json(const nlohmann::json &j);

/**
 * Replace @p target with @p content durably: the data goes to `<target>.tmp`,
 * is fsynced, renamed over @p target, and the parent directory is fsynced.
 *
 * @param what Label used in error messages ("manifest", "artifact").
 * @throws BackupError Storage on filesystem failures; the temporary file is
 *         removed.
 */
void commit_file(const std::filesystem::path &target,
                 const std::string &content, const std::string &what);

/**
 * Write @p manifest to `<dir>/manifest.json` through commit_file().
 *
 * @throws BackupError Storage on filesystem failures.
 */
void write_manifest(const std::filesystem::path &dir,
                    const SnapshotManifest &manifest);

/**
 * Read `<dir>/manifest.json`.
 *
 * @return `std::nullopt` when the file is missing or unparseable.
 */
std::optional<SnapshotManifest>
read_manifest(const std::filesystem::path &dir);

/// ISO-8601 UTC rendering (`2024-01-01T00:00:00Z`).
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Parse the ISO-8601 UTC rendering produced by format_iso8601().
std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string &value);

} // namespace ghv

#endif // GHVAULT_MANIFEST_HPP
