/**
 * @file backup_catalog.hpp
 * @brief Enumeration of valid snapshots under the backup root.
 */

#ifndef GHVAULT_BACKUP_CATALOG_HPP
#define GHVAULT_BACKUP_CATALOG_HPP

#include "manifest.hpp"
#include "path_resolver.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ghv {

/// Per-repository summary used by listings without a repository filter.
struct RepositoryBackups {
  RepositoryRef repository;
  std::size_t snapshots{0};   ///< Valid snapshots
  std::size_t incomplete{0};  ///< Directories excluded from listings
  std::string latest;         ///< Timestamp of the newest valid snapshot
};

/// Snapshot directory excluded from listings, with the reason.
struct IncompleteSnapshot {
  std::filesystem::path path;
  std::string timestamp;
  std::string reason;
};

/**
 * Read-only view of the snapshots stored under a backup root.
 *
 * A directory is listed only when its manifest exists, parses, is terminal,
 * and names the directory's own repository and timestamp. Invalid
 * directories are skipped and never deleted.
 */
class BackupCatalog {
public:
  explicit BackupCatalog(PathResolver paths);

  /// Valid manifests of @p repository, newest first.
  std::vector<SnapshotManifest> list(const RepositoryRef &repository) const;

  /// Manifest of @p id when it is a valid snapshot.
  std::optional<SnapshotManifest> find(const SnapshotId &id) const;

  /**
   * Manifest of @p id.
   *
   * @throws BackupError NotFound when no valid snapshot has that id.
   */
  SnapshotManifest get(const SnapshotId &id) const;

  /// Newest valid snapshot of @p repository, if any.
  std::optional<SnapshotManifest> latest(const RepositoryRef &repository) const;

  /// Every repository under the root that has at least one snapshot
  /// directory, sorted by `owner/name`.
  std::vector<RepositoryBackups> repositories() const;

  /// Directories of @p repository excluded from list(), newest first.
  std::vector<IncompleteSnapshot>
  incomplete(const RepositoryRef &repository) const;

  const PathResolver &paths() const { return paths_; }

private:
  /// Cached verdicts are reused only while mtime, size and inode all match.
  struct CacheEntry {
    std::filesystem::file_time_type mtime;
    std::uintmax_t size{0};
    std::uintmax_t inode{0};
    std::optional<SnapshotManifest> manifest;
    std::string reason;
  };

  /// Validate one snapshot directory, consulting the manifest cache.
  CacheEntry inspect(const RepositoryRef &repository,
                     const std::string &timestamp,
                     const std::filesystem::path &dir) const;
  std::vector<std::string> timestamps(const RepositoryRef &repository) const;

  PathResolver paths_;
  mutable std::mutex cache_mutex_;
  mutable std::unordered_map<std::string, CacheEntry> cache_;
};

} // namespace ghv

#endif // GHVAULT_BACKUP_CATALOG_HPP
