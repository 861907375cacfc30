/**
 * @file workspace.hpp
 * @brief Local version-control workspace operations used for content
 * snapshots and restores.
 */

#ifndef GHVAULT_WORKSPACE_HPP
#define GHVAULT_WORKSPACE_HPP

#include <filesystem>
#include <map>
#include <string>

namespace ghv {

/// Mapping of full reference names (`refs/heads/main`) to object ids.
using RefMap = std::map<std::string, std::string>;

/**
 * Clone and inspect local git repositories.
 *
 * Implementations report failures as BackupError with AuthError,
 * NetworkError, RepositoryGone or Storage.
 */
class LocalWorkspace {
public:
  virtual ~LocalWorkspace() = default;

  /**
   * Fetch every ref of @p url into a new bare mirror at @p dest.
   *
   * @return References present in the mirror after the fetch.
   */
  virtual RefMap mirror_clone(const std::string &url,
                              const std::filesystem::path &dest) = 0;

  /**
   * Create a working checkout at @p dest from a bare mirror, with a local
   * branch for every mirrored branch and every tag.
   */
  virtual void clone_from_mirror(const std::filesystem::path &mirror,
                                 const std::filesystem::path &dest) = 0;

  /// All references of the repository at @p repo.
  virtual RefMap list_refs(const std::filesystem::path &repo) = 0;

  /// Short name of the checked out branch, empty when detached or unborn.
  virtual std::string active_branch(const std::filesystem::path &repo) = 0;

  /// Whether the working tree has modified, staged or untracked files.
  virtual bool is_dirty(const std::filesystem::path &repo) = 0;
};

/**
 * LocalWorkspace implemented with libgit2.
 *
 * HTTPS credentials are supplied as `x-access-token:<token>` when a token is
 * configured.
 */
class GitWorkspace : public LocalWorkspace {
public:
  explicit GitWorkspace(std::string token = {});
  ~GitWorkspace() override;
  GitWorkspace(const GitWorkspace &) = delete;
  GitWorkspace &operator=(const GitWorkspace &) = delete;

  RefMap mirror_clone(const std::string &url,
                      const std::filesystem::path &dest) override;
  void clone_from_mirror(const std::filesystem::path &mirror,
                         const std::filesystem::path &dest) override;
  RefMap list_refs(const std::filesystem::path &repo) override;
  std::string active_branch(const std::filesystem::path &repo) override;
  bool is_dirty(const std::filesystem::path &repo) override;

private:
  std::string token_;
};

} // namespace ghv

#endif // GHVAULT_WORKSPACE_HPP
