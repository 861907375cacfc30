/**
 * @file content_snapshotter.hpp
 * @brief Full mirror capture of repository content.
 */

#ifndef GHVAULT_CONTENT_SNAPSHOTTER_HPP
#define GHVAULT_CONTENT_SNAPSHOTTER_HPP

#include "repository_ref.hpp"
#include "retry.hpp"
#include "workspace.hpp"
#include <filesystem>
#include <string>

namespace ghv {

/// Result of a mirror clone.
struct ContentMirror {
  std::filesystem::path path; ///< Bare mirror location
  RefMap refs;                ///< All refs captured
};

/**
 * Produces a bare mirror of every ref of a repository.
 *
 * Leftovers from an interrupted attempt are never trusted: a non-empty
 * destination is wiped unless the enclosing snapshot is already committed.
 */
class ContentSnapshotter {
public:
  explicit ContentSnapshotter(LocalWorkspace &workspace, RetryPolicy retry = {});

  /**
   * Mirror @p clone_url into @p dest.
   *
   * @param repository Repository being captured (for logging).
   * @param clone_url Remote URL to fetch.
   * @param dest Destination directory `<snapshot>/content`.
   * @throws BackupError NetworkError after exhausting retries, AuthError,
   *         RepositoryGone, or Storage. Conflict when @p dest belongs to a
   *         committed snapshot.
   */
  ContentMirror mirror_clone(const RepositoryRef &repository,
                             const std::string &clone_url,
                             const std::filesystem::path &dest);

private:
  void discard(const std::filesystem::path &dest);

  LocalWorkspace &workspace_;
  RetryPolicy retry_;
};

} // namespace ghv

#endif // GHVAULT_CONTENT_SNAPSHOTTER_HPP
