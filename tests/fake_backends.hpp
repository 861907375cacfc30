/**
 * @file fake_backends.hpp
 * @brief In-memory RepositoryProvider and LocalWorkspace used by the tests.
 */

#ifndef GHVAULT_TESTS_FAKE_BACKENDS_HPP
#define GHVAULT_TESTS_FAKE_BACKENDS_HPP

#include "errors.hpp"
#include "provider.hpp"
#include "workspace.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ghv::testing {

/// Fresh, empty directory below the system temporary directory.
inline std::filesystem::path scratch_dir(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / ("ghvault-" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

/// 2024-01-01T00:00:00Z.
inline std::chrono::system_clock::time_point new_year_2024() {
  return std::chrono::system_clock::from_time_t(1704067200);
}

inline nlohmann::json issue(int number, const std::string &title,
                            const std::string &state = "open",
                            int comments = 0) {
  return {{"number", number},
          {"title", title},
          {"body", "body of " + title},
          {"state", state},
          {"comments", comments},
          {"labels", nlohmann::json::array({"bug"})}};
}

inline nlohmann::json release(long id, const std::string &tag) {
  return {{"id", id},
          {"tag_name", tag},
          {"name", "Release " + tag},
          {"body", "notes"},
          {"draft", false},
          {"prerelease", false}};
}

/**
 * Provider serving canned records. Failures are injected per operation and
 * repository with fail("issues", ref, kind).
 */
class FakeProvider : public RepositoryProvider {
public:
  void add_repository(const RepositoryRef &ref) {
    std::scoped_lock lock(mutex_);
    RepoDescriptor desc;
    desc.ref = ref;
    desc.clone_url = "https://example.test/" + ref.qualified_name() + ".git";
    desc.default_branch = "main";
    desc.raw = {{"name", ref.name},
                {"owner", ref.owner},
                {"full_name", ref.qualified_name()},
                {"default_branch", "main"}};
    repos_[ref.qualified_name()] = desc;
  }

  void set_issues(const RepositoryRef &ref, std::vector<nlohmann::json> v) {
    std::scoped_lock lock(mutex_);
    issues_[ref.qualified_name()] = std::move(v);
  }

  void set_pull_requests(const RepositoryRef &ref,
                         std::vector<nlohmann::json> v) {
    std::scoped_lock lock(mutex_);
    pulls_[ref.qualified_name()] = std::move(v);
  }

  void set_releases(const RepositoryRef &ref, std::vector<nlohmann::json> v) {
    std::scoped_lock lock(mutex_);
    releases_[ref.qualified_name()] = std::move(v);
  }

  void fail(const std::string &operation, const RepositoryRef &ref,
            ErrorKind kind) {
    std::scoped_lock lock(mutex_);
    failures_[operation + ":" + ref.qualified_name()] = kind;
  }

  void add_existing_label(const std::string &name) {
    std::scoped_lock lock(mutex_);
    existing_labels_.insert(name);
  }

  long remaining_budget{5000};

  std::vector<RepoDescriptor>
  list_repositories(const std::string &owner) override {
    std::scoped_lock lock(mutex_);
    std::vector<RepoDescriptor> out;
    for (const auto &[key, desc] : repos_) {
      if (owner.empty() || desc.ref.owner == owner) {
        out.push_back(desc);
      }
    }
    return out;
  }

  RepoDescriptor get_repository(const RepositoryRef &ref) override {
    std::scoped_lock lock(mutex_);
    check("repository", ref);
    auto it = repos_.find(ref.qualified_name());
    if (it == repos_.end()) {
      throw BackupError(ErrorKind::SourceUnavailable,
                        "no such repository " + ref.qualified_name());
    }
    return it->second;
  }

  ProviderPage list_issues(const RepositoryRef &ref, int page,
                           int per_page) override {
    std::scoped_lock lock(mutex_);
    ++issue_pages_fetched;
    check("issues", ref);
    return slice(issues_[ref.qualified_name()], page, per_page);
  }

  ProviderPage list_pull_requests(const RepositoryRef &ref, int page,
                                  int per_page) override {
    std::scoped_lock lock(mutex_);
    check("pull_requests", ref);
    return slice(pulls_[ref.qualified_name()], page, per_page);
  }

  ProviderPage list_releases(const RepositoryRef &ref, int page,
                             int per_page) override {
    std::scoped_lock lock(mutex_);
    check("releases", ref);
    return slice(releases_[ref.qualified_name()], page, per_page);
  }

  std::vector<nlohmann::json> list_issue_comments(const RepositoryRef &ref,
                                                  int number) override {
    std::scoped_lock lock(mutex_);
    check("comments", ref);
    return {{{"issue", number}, {"body", "a comment"}}};
  }

  std::vector<nlohmann::json> list_release_assets(const RepositoryRef &ref,
                                                  long release_id) override {
    std::scoped_lock lock(mutex_);
    check("assets", ref);
    return {{{"release", release_id}, {"name", "bundle.tar.gz"}}};
  }

  nlohmann::json get_pull_request(const RepositoryRef &ref,
                                  int number) override {
    std::scoped_lock lock(mutex_);
    check("pull_request", ref);
    return {{"number", number}, {"merged", false}, {"commits", 1}};
  }

  nlohmann::json create_issue(const RepositoryRef &ref,
                              const nlohmann::json &payload) override {
    std::scoped_lock lock(mutex_);
    check("create_issue", ref);
    created_issues.push_back(payload);
    return {{"number", static_cast<int>(created_issues.size())},
            {"title", payload.value("title", "")}};
  }

  void close_issue(const RepositoryRef &ref, int number) override {
    std::scoped_lock lock(mutex_);
    check("close_issue", ref);
    closed_issues.push_back(number);
  }

  nlohmann::json create_release(const RepositoryRef &ref,
                                const nlohmann::json &payload) override {
    std::scoped_lock lock(mutex_);
    check("create_release", ref);
    created_releases.push_back(payload);
    return payload;
  }

  void create_label(const RepositoryRef &ref, const std::string &name,
                    const std::string &color) override {
    std::scoped_lock lock(mutex_);
    (void)color;
    check("create_label", ref);
    if (existing_labels_.count(name) != 0) {
      throw BackupError(ErrorKind::Conflict, "label " + name + " exists");
    }
    created_labels.push_back(name);
  }

  RateLimitInfo rate_limit() override {
    return {5000, remaining_budget, std::chrono::seconds(60)};
  }

  std::vector<nlohmann::json> created_issues;
  std::vector<nlohmann::json> created_releases;
  std::vector<std::string> created_labels;
  std::vector<int> closed_issues;
  int issue_pages_fetched{0};

private:
  void check(const std::string &operation, const RepositoryRef &ref) {
    auto it = failures_.find(operation + ":" + ref.qualified_name());
    if (it != failures_.end()) {
      throw BackupError(it->second, operation + " of " + ref.qualified_name() +
                                        " failed");
    }
  }

  static ProviderPage slice(const std::vector<nlohmann::json> &all, int page,
                            int per_page) {
    ProviderPage out;
    std::size_t begin = static_cast<std::size_t>(page - 1) * per_page;
    std::size_t end = std::min(all.size(), begin + per_page);
    for (std::size_t i = begin; i < end; ++i) {
      out.items.push_back(all[i]);
    }
    out.has_next = end < all.size();
    return out;
  }

  std::mutex mutex_;
  std::map<std::string, RepoDescriptor> repos_;
  std::map<std::string, std::vector<nlohmann::json>> issues_;
  std::map<std::string, std::vector<nlohmann::json>> pulls_;
  std::map<std::string, std::vector<nlohmann::json>> releases_;
  std::map<std::string, ErrorKind> failures_;
  std::set<std::string> existing_labels_;
};

/**
 * Workspace that writes its ref table to `refs.json` instead of running
 * git. Clone failures are injected per URL.
 */
class FakeWorkspace : public LocalWorkspace {
public:
  RefMap refs{{"refs/heads/main", "1111111111111111111111111111111111111111"},
              {"refs/heads/dev", "2222222222222222222222222222222222222222"},
              {"refs/tags/v1.0", "3333333333333333333333333333333333333333"}};

  void fail_url(const std::string &url, ErrorKind kind) {
    std::scoped_lock lock(mutex_);
    failures_[url] = kind;
  }

  int mirror_calls() const {
    std::scoped_lock lock(mutex_);
    return mirror_calls_;
  }

  RefMap mirror_clone(const std::string &url,
                      const std::filesystem::path &dest) override {
    RefMap snapshot;
    {
      std::scoped_lock lock(mutex_);
      ++mirror_calls_;
      std::filesystem::create_directories(dest);
      auto it = failures_.find(url);
      if (it != failures_.end()) {
        std::ofstream(dest / "partial.pack") << "half a pack";
        throw BackupError(it->second, "clone of " + url + " failed");
      }
      snapshot = refs;
    }
    write_refs(dest, snapshot);
    return snapshot;
  }

  void clone_from_mirror(const std::filesystem::path &mirror,
                         const std::filesystem::path &dest) override {
    auto mirrored = list_refs(mirror);
    std::filesystem::create_directories(dest);
    std::ofstream(dest / "README.md") << "restored\n";
    write_refs(dest, mirrored);
  }

  RefMap list_refs(const std::filesystem::path &repo) override {
    std::ifstream in(repo / "refs.json");
    if (!in) {
      throw BackupError(ErrorKind::Storage,
                        "not a repository: " + repo.string());
    }
    nlohmann::json j;
    in >> j;
    return j.get<RefMap>();
  }

  std::string active_branch(const std::filesystem::path &repo) override {
    (void)repo;
    return "main";
  }

  bool is_dirty(const std::filesystem::path &repo) override {
    (void)repo;
    return false;
  }

private:
  static void write_refs(const std::filesystem::path &dir, const RefMap &map) {
    std::ofstream(dir / "refs.json") << nlohmann::json(map).dump();
  }

  mutable std::mutex mutex_;
  std::map<std::string, ErrorKind> failures_;
  int mirror_calls_{0};
};

/// ErrorKind thrown by @p fn, or `std::nullopt` when it does not throw.
template <typename F> std::optional<ErrorKind> error_kind_of(F fn) {
  try {
    fn();
  } catch (const BackupError &e) {
    return e.kind();
  }
  return std::nullopt;
}

} // namespace ghv::testing

#endif // GHVAULT_TESTS_FAKE_BACKENDS_HPP
