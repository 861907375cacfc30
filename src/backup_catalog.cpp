#include "backup_catalog.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <sys/stat.h>
#include <system_error>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> catalog_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("catalog");
  }();
  return logger;
}

std::vector<std::string> subdirectories(const std::filesystem::path &dir) {
  std::vector<std::string> names;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return names;
  }
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    catalog_log()->warn("Cannot read {}: {}", dir.string(), ec.message());
  }
  return names;
}

bool newest_first(const std::string &a, const std::string &b) {
  return timestamp_less(b, a);
}

} // namespace

BackupCatalog::BackupCatalog(PathResolver paths) : paths_(std::move(paths)) {}

BackupCatalog::CacheEntry
BackupCatalog::inspect(const RepositoryRef &repository,
                       const std::string &timestamp,
                       const std::filesystem::path &dir) const {
  CacheEntry entry;
  const auto file = manifest_path(dir);
  std::error_code ec;
  entry.mtime = std::filesystem::last_write_time(file, ec);
  struct stat st {};
  if (ec || ::stat(file.c_str(), &st) != 0) {
    entry.reason = "no manifest";
    return entry;
  }
  entry.size = static_cast<std::uintmax_t>(st.st_size);
  entry.inode = static_cast<std::uintmax_t>(st.st_ino);
  const std::string key = file.string();
  {
    std::scoped_lock lock(cache_mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.mtime == entry.mtime &&
        it->second.size == entry.size && it->second.inode == entry.inode) {
      return it->second;
    }
  }
  auto manifest = read_manifest(dir);
  if (!manifest) {
    entry.reason = "unreadable manifest";
  } else if (!manifest->terminal()) {
    entry.reason = "manifest has pending states";
  } else if (manifest->id.repository != repository ||
             manifest->id.timestamp != timestamp) {
    entry.reason = "manifest names " + manifest->id.to_string();
  } else {
    entry.manifest = std::move(manifest);
  }
  std::scoped_lock lock(cache_mutex_);
  cache_[key] = entry;
  return entry;
}

std::vector<std::string>
BackupCatalog::timestamps(const RepositoryRef &repository) const {
  std::vector<std::string> result;
  for (auto &name : subdirectories(paths_.repository_dir(repository))) {
    if (parse_snapshot_timestamp(name)) {
      result.push_back(std::move(name));
    }
  }
  std::sort(result.begin(), result.end(), newest_first);
  return result;
}

std::vector<SnapshotManifest>
BackupCatalog::list(const RepositoryRef &repository) const {
  std::vector<SnapshotManifest> manifests;
  for (const auto &ts : timestamps(repository)) {
    auto entry = inspect(repository, ts, paths_.resolve(repository, ts));
    if (entry.manifest) {
      manifests.push_back(std::move(*entry.manifest));
    } else {
      catalog_log()->debug("Excluding {}@{}: {}", repository.qualified_name(),
                           ts, entry.reason);
    }
  }
  return manifests;
}

std::optional<SnapshotManifest>
BackupCatalog::find(const SnapshotId &id) const {
  auto dir = paths_.snapshot_dir(id);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return std::nullopt;
  }
  return inspect(id.repository, id.timestamp, dir).manifest;
}

SnapshotManifest BackupCatalog::get(const SnapshotId &id) const {
  auto manifest = find(id);
  if (!manifest) {
    throw BackupError(ErrorKind::NotFound,
                      "No valid snapshot " + id.to_string());
  }
  return *manifest;
}

std::optional<SnapshotManifest>
BackupCatalog::latest(const RepositoryRef &repository) const {
  for (const auto &ts : timestamps(repository)) {
    auto entry = inspect(repository, ts, paths_.resolve(repository, ts));
    if (entry.manifest) {
      return entry.manifest;
    }
  }
  return std::nullopt;
}

std::vector<RepositoryBackups> BackupCatalog::repositories() const {
  std::vector<RepositoryBackups> result;
  for (const auto &owner : subdirectories(paths_.root())) {
    for (const auto &name : subdirectories(paths_.root() / owner)) {
      RepositoryRef ref{owner, name};
      try {
        paths_.repository_dir(ref);
      } catch (const BackupError &e) {
        catalog_log()->debug("Ignoring {}/{}: {}", owner, name, e.what());
        continue;
      }
      RepositoryBackups summary;
      summary.repository = ref;
      for (const auto &ts : timestamps(ref)) {
        auto entry = inspect(ref, ts, paths_.resolve(ref, ts));
        if (!entry.manifest) {
          ++summary.incomplete;
          continue;
        }
        if (summary.snapshots++ == 0) {
          summary.latest = ts;
        }
      }
      if (summary.snapshots + summary.incomplete > 0) {
        result.push_back(std::move(summary));
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const RepositoryBackups &a, const RepositoryBackups &b) {
              return a.repository < b.repository;
            });
  return result;
}

std::vector<IncompleteSnapshot>
BackupCatalog::incomplete(const RepositoryRef &repository) const {
  std::vector<IncompleteSnapshot> result;
  for (const auto &ts : timestamps(repository)) {
    auto dir = paths_.resolve(repository, ts);
    auto entry = inspect(repository, ts, dir);
    if (!entry.manifest) {
      result.push_back({dir, ts, entry.reason});
    }
  }
  return result;
}

} // namespace ghv
