/**
 * @file provider.hpp
 * @brief Abstract remote repository provider used by the backup engine.
 *
 * The snapshotters and the restore engine talk to the remote side only
 * through RepositoryProvider so tests can substitute an in-memory fake.
 */

#ifndef GHVAULT_PROVIDER_HPP
#define GHVAULT_PROVIDER_HPP

#include "repository_ref.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ghv {

/// Normalized description of a remote repository.
struct RepoDescriptor {
  RepositoryRef ref;
  std::string clone_url;      ///< HTTPS clone URL
  std::string ssh_url;        ///< SSH clone URL
  std::string default_branch; ///< Default branch name, may be empty
  bool is_private{false};
  bool archived{false};
  nlohmann::json raw; ///< Normalized repository record
};

/// One page of provider records.
struct ProviderPage {
  std::vector<nlohmann::json> items; ///< Records in provider order
  bool has_next{false};              ///< Whether another page exists
};

/// Remaining request budget reported by the provider.
struct RateLimitInfo {
  long limit{0};
  long remaining{0};
  std::chrono::seconds reset_after{0};
};

/**
 * Remote read and write operations required for backup and metadata replay.
 *
 * Implementations report failures as BackupError with AuthError,
 * NetworkError, SourceUnavailable or Conflict.
 */
class RepositoryProvider {
public:
  virtual ~RepositoryProvider() = default;

  /**
   * List repositories owned by @p owner, or by the authenticated user when
   * @p owner is empty.
   */
  virtual std::vector<RepoDescriptor>
  list_repositories(const std::string &owner) = 0;

  /// Fetch the descriptor of one repository.
  virtual RepoDescriptor get_repository(const RepositoryRef &ref) = 0;

  /// Fetch one page (1-based) of issues, excluding pull requests.
  virtual ProviderPage list_issues(const RepositoryRef &ref, int page,
                                   int per_page) = 0;

  /// Fetch one page (1-based) of pull requests in any state.
  virtual ProviderPage list_pull_requests(const RepositoryRef &ref, int page,
                                          int per_page) = 0;

  /// Fetch one page (1-based) of releases.
  virtual ProviderPage list_releases(const RepositoryRef &ref, int page,
                                     int per_page) = 0;

  /// Fetch all comments of one issue.
  virtual std::vector<nlohmann::json>
  list_issue_comments(const RepositoryRef &ref, int number) = 0;

  /// Fetch all assets of one release.
  virtual std::vector<nlohmann::json>
  list_release_assets(const RepositoryRef &ref, long release_id) = 0;

  /// Fetch the detail record of one pull request.
  virtual nlohmann::json get_pull_request(const RepositoryRef &ref,
                                          int number) = 0;

  /// Create an issue; returns the created record.
  virtual nlohmann::json create_issue(const RepositoryRef &ref,
                                      const nlohmann::json &issue) = 0;

  /// Close an existing issue.
  virtual void close_issue(const RepositoryRef &ref, int number) = 0;

  /// Create a release; returns the created record.
  virtual nlohmann::json create_release(const RepositoryRef &ref,
                                        const nlohmann::json &release) = 0;

  /// Create a label.
  virtual void create_label(const RepositoryRef &ref, const std::string &name,
                            const std::string &color) = 0;

  /// Current request budget.
  virtual RateLimitInfo rate_limit() = 0;
};

class GitHubClient;

/**
 * RepositoryProvider backed by the GitHub REST API.
 *
 * Records are normalized to a stable subset of fields so metadata artifacts
 * do not depend on the full API payload.
 */
class GitHubProvider : public RepositoryProvider {
public:
  explicit GitHubProvider(GitHubClient &client);

  std::vector<RepoDescriptor>
  list_repositories(const std::string &owner) override;
  RepoDescriptor get_repository(const RepositoryRef &ref) override;
  ProviderPage list_issues(const RepositoryRef &ref, int page,
                           int per_page) override;
  ProviderPage list_pull_requests(const RepositoryRef &ref, int page,
                                  int per_page) override;
  ProviderPage list_releases(const RepositoryRef &ref, int page,
                             int per_page) override;
  std::vector<nlohmann::json> list_issue_comments(const RepositoryRef &ref,
                                                  int number) override;
  std::vector<nlohmann::json> list_release_assets(const RepositoryRef &ref,
                                                  long release_id) override;
  nlohmann::json get_pull_request(const RepositoryRef &ref,
                                  int number) override;
  nlohmann::json create_issue(const RepositoryRef &ref,
                              const nlohmann::json &issue) override;
  void close_issue(const RepositoryRef &ref, int number) override;
  nlohmann::json create_release(const RepositoryRef &ref,
                                const nlohmann::json &release) override;
  void create_label(const RepositoryRef &ref, const std::string &name,
                    const std::string &color) override;
  RateLimitInfo rate_limit() override;

  /// Normalize a raw repository payload.
  static RepoDescriptor normalize_repository(const nlohmann::json &raw);
  /// Normalize a raw issue payload.
  static nlohmann::json normalize_issue(const nlohmann::json &raw);
  /// Normalize a raw pull request payload.
  static nlohmann::json normalize_pull_request(const nlohmann::json &raw);
  /// Normalize a raw release payload.
  static nlohmann::json normalize_release(const nlohmann::json &raw);

private:
  GitHubClient &client_;
};

} // namespace ghv

#endif // GHVAULT_PROVIDER_HPP
