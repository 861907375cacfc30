/**
 * @file path_resolver.hpp
 * @brief Maps repositories and snapshots to directories below the backup
 * root.
 *
 * Layout produced for every snapshot:
 *
 *     <root>/<owner>/<name>/<timestamp>/
 *       manifest.json
 *       content/
 *       metadata/{repository,issues,pull_requests,releases}.json
 */

#ifndef GHVAULT_PATH_RESOLVER_HPP
#define GHVAULT_PATH_RESOLVER_HPP

#include "snapshot_id.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace ghv {

/**
 * Resolves on-disk locations and guarantees every result is a descendant of
 * the backup root.
 */
class PathResolver {
public:
  /**
   * @param backup_root Root directory for all backups. Relative paths are
   *        made absolute against the current directory.
   * @throws BackupError Configuration when @p backup_root is empty.
   */
  explicit PathResolver(std::filesystem::path backup_root);

  /// Absolute, normalized backup root.
  const std::filesystem::path &root() const { return root_; }

  /**
   * Resolve the directory of a repository, or of one of its snapshots when
   * @p timestamp is provided.
   *
   * @throws BackupError InvalidIdentifier when owner, name or timestamp
   *         contain separators, traversal sequences or characters outside
   *         `[A-Za-z0-9._-]`, or when the result would escape the root.
   */
  std::filesystem::path
  resolve(const RepositoryRef &repository,
          const std::optional<std::string> &timestamp = std::nullopt) const;

  /// `<root>/<owner>/<name>`.
  std::filesystem::path repository_dir(const RepositoryRef &repository) const {
    return resolve(repository);
  }

  /// `<root>/<owner>/<name>/<timestamp>`.
  std::filesystem::path snapshot_dir(const SnapshotId &id) const {
    return resolve(id.repository, id.timestamp);
  }

  /**
   * Validate a single path component supplied by a user or the remote
   * provider.
   *
   * @param value Component to check.
   * @param what Label used in the error message ("owner", "name", ...).
   * @throws BackupError InvalidIdentifier on rejection.
   */
  static void validate_component(const std::string &value, const char *what);

  /// Whether @p candidate lies strictly below @p root after normalization.
  static bool is_descendant(const std::filesystem::path &root,
                            const std::filesystem::path &candidate);

private:
  std::filesystem::path root_;
};

/// Name of the manifest file inside a snapshot directory.
inline constexpr const char *kManifestFile = "manifest.json";
/// Mirror clone directory inside a snapshot directory.
inline constexpr const char *kContentDir = "content";
/// Metadata artifact directory inside a snapshot directory.
inline constexpr const char *kMetadataDir = "metadata";

inline std::filesystem::path manifest_path(const std::filesystem::path &dir) {
  return dir / kManifestFile;
}
inline std::filesystem::path content_path(const std::filesystem::path &dir) {
  return dir / kContentDir;
}
inline std::filesystem::path metadata_path(const std::filesystem::path &dir) {
  return dir / kMetadataDir;
}

} // namespace ghv

#endif // GHVAULT_PATH_RESOLVER_HPP
