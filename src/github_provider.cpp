/**
 * @file github_provider.cpp
 * @brief RepositoryProvider implementation over the GitHub REST API.
 */

#include "errors.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "provider.hpp"
#include <initializer_list>

namespace ghv {

namespace {

/// Page bound for listings that are fetched in full.
constexpr int kFullListingPageCap = 100;

std::shared_ptr<spdlog::logger> provider_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("provider");
  }();
  return logger;
}

ErrorKind kind_for_status(int status) {
  switch (status) {
  case 401:
    return ErrorKind::AuthError;
  case 403:
  case 404:
  case 410:
    return ErrorKind::SourceUnavailable;
  case 409:
  case 422:
    return ErrorKind::Conflict;
  case 429:
    return ErrorKind::NetworkError;
  default:
    return status >= 500 ? ErrorKind::NetworkError
                         : ErrorKind::SourceUnavailable;
  }
}

/**
 * Run a client call and translate transport exceptions into BackupError.
 */
template <typename F>
auto guarded(const std::string &what, F fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const HttpStatusError &e) {
    provider_log()->warn("{} failed: HTTP {}", what, e.status());
    throw BackupError(kind_for_status(e.status()), what + ": " + e.what());
  } catch (const TransientNetworkError &e) {
    provider_log()->warn("{} failed: {}", what, e.what());
    throw BackupError(ErrorKind::NetworkError, what + ": " + e.what());
  } catch (const nlohmann::json::exception &e) {
    provider_log()->warn("{} returned malformed JSON: {}", what, e.what());
    throw BackupError(ErrorKind::NetworkError,
                      what + ": malformed response: " + e.what());
  }
}

std::string repo_path(const RepositoryRef &ref) {
  return "/repos/" + ref.owner + "/" + ref.name;
}

std::string page_query(int page, int per_page) {
  return "per_page=" + std::to_string(per_page) +
         "&page=" + std::to_string(page);
}

/// Copy the listed keys that are present in @p raw.
nlohmann::json pick(const nlohmann::json &raw,
                    std::initializer_list<const char *> keys) {
  nlohmann::json out = nlohmann::json::object();
  for (const char *key : keys) {
    auto it = raw.find(key);
    if (it != raw.end()) {
      out[key] = *it;
    }
  }
  return out;
}

nlohmann::json login_of(const nlohmann::json &raw, const char *key) {
  auto it = raw.find(key);
  if (it != raw.end() && it->is_object() && it->contains("login")) {
    return (*it)["login"];
  }
  return nullptr;
}

nlohmann::json names_of(const nlohmann::json &raw, const char *key,
                        const char *field) {
  nlohmann::json out = nlohmann::json::array();
  auto it = raw.find(key);
  if (it == raw.end() || !it->is_array()) {
    return out;
  }
  for (const auto &entry : *it) {
    if (entry.is_object() && entry.contains(field)) {
      out.push_back(entry[field]);
    } else if (entry.is_string()) {
      out.push_back(entry);
    }
  }
  return out;
}

ProviderPage to_page(const GitHubClient::JsonPage &page, bool drop_pulls) {
  ProviderPage out;
  out.has_next = !page.next_url.empty();
  if (!page.items.is_array()) {
    throw BackupError(ErrorKind::NetworkError,
                      "Listing response is not an array");
  }
  for (const auto &item : page.items) {
    if (drop_pulls && item.contains("pull_request")) {
      continue;
    }
    out.items.push_back(item);
  }
  return out;
}

/// Follow `next` links up to kFullListingPageCap pages. Hitting the cap with
/// a `next` link pending is logged as a warning.
std::vector<nlohmann::json> collect_all(GitHubClient &client,
                                        std::string path) {
  std::vector<nlohmann::json> items;
  for (int page = 0; page < kFullListingPageCap && !path.empty(); ++page) {
    auto result = client.get_page(path);
    if (!result.items.is_array()) {
      throw BackupError(ErrorKind::NetworkError,
                        "Listing response is not an array");
    }
    for (auto &item : result.items) {
      items.push_back(std::move(item));
    }
    path = result.next_url;
  }
  if (!path.empty()) {
    provider_log()->warn("Listing stopped after {} pages with {} items; "
                         "further pages were not fetched",
                         kFullListingPageCap, items.size());
  }
  return items;
}

} // namespace

GitHubProvider::GitHubProvider(GitHubClient &client) : client_(client) {}

RepoDescriptor GitHubProvider::normalize_repository(const nlohmann::json &raw) {
  RepoDescriptor desc;
  desc.ref.owner = login_of(raw, "owner").is_string()
                       ? login_of(raw, "owner").get<std::string>()
                       : std::string{};
  desc.ref.name = raw.value("name", "");
  desc.clone_url = raw.value("clone_url", "");
  desc.ssh_url = raw.value("ssh_url", "");
  if (raw.contains("default_branch") && raw["default_branch"].is_string()) {
    desc.default_branch = raw["default_branch"].get<std::string>();
  }
  desc.is_private = raw.value("private", false);
  desc.archived = raw.value("archived", false);
  desc.raw = pick(raw, {"name", "full_name", "description", "html_url",
                        "clone_url", "ssh_url", "created_at", "updated_at",
                        "pushed_at", "size", "language", "default_branch",
                        "private", "archived"});
  desc.raw["owner"] = login_of(raw, "owner");
  desc.raw["stars"] = raw.value("stargazers_count", 0);
  desc.raw["forks"] = raw.value("forks_count", 0);
  desc.raw["watchers"] = raw.value("watchers_count", 0);
  desc.raw["open_issues"] = raw.value("open_issues_count", 0);
  desc.raw["topics"] = raw.contains("topics") && raw["topics"].is_array()
                           ? raw["topics"]
                           : nlohmann::json::array();
  return desc;
}

nlohmann::json GitHubProvider::normalize_issue(const nlohmann::json &raw) {
  auto out = pick(raw, {"number", "title", "body", "state", "created_at",
                        "updated_at", "closed_at", "comments"});
  out["labels"] = names_of(raw, "labels", "name");
  out["assignees"] = names_of(raw, "assignees", "login");
  out["user"] = login_of(raw, "user");
  return out;
}

nlohmann::json
GitHubProvider::normalize_pull_request(const nlohmann::json &raw) {
  auto out = pick(raw, {"number", "title", "body", "state", "created_at",
                        "updated_at", "closed_at", "merged_at", "draft",
                        "merged", "mergeable", "commits", "comments",
                        "additions", "deletions", "changed_files"});
  auto ref_of = [&raw](const char *key) -> nlohmann::json {
    auto it = raw.find(key);
    if (it != raw.end() && it->is_object() && it->contains("ref")) {
      return (*it)["ref"];
    }
    return nullptr;
  };
  out["head"] = ref_of("head");
  out["base"] = ref_of("base");
  out["user"] = login_of(raw, "user");
  return out;
}

nlohmann::json GitHubProvider::normalize_release(const nlohmann::json &raw) {
  auto out = pick(raw, {"id", "tag_name", "name", "body", "draft",
                        "prerelease", "created_at", "published_at",
                        "target_commitish"});
  out["author"] = login_of(raw, "author");
  return out;
}

std::vector<RepoDescriptor>
GitHubProvider::list_repositories(const std::string &owner) {
  return guarded("list repositories", [&] {
    std::vector<nlohmann::json> raw;
    if (owner.empty()) {
      raw = collect_all(client_, "/user/repos?per_page=100");
    } else {
      try {
        raw = collect_all(client_, "/orgs/" + owner + "/repos?per_page=100");
      } catch (const HttpStatusError &e) {
        if (e.status() != 404) {
          throw;
        }
        provider_log()->debug("{} is not an organization, listing user repos",
                              owner);
        raw = collect_all(client_, "/users/" + owner + "/repos?per_page=100");
      }
    }
    std::vector<RepoDescriptor> repos;
    repos.reserve(raw.size());
    for (const auto &item : raw) {
      if (!item.contains("name") || !item.contains("owner")) {
        continue;
      }
      repos.push_back(normalize_repository(item));
    }
    provider_log()->info("Found {} repositories", repos.size());
    return repos;
  });
}

RepoDescriptor GitHubProvider::get_repository(const RepositoryRef &ref) {
  return guarded("get repository " + ref.qualified_name(), [&] {
    auto desc = normalize_repository(client_.get_json(repo_path(ref)));
    if (desc.ref.owner.empty() || desc.ref.name.empty()) {
      desc.ref = ref;
    }
    return desc;
  });
}

ProviderPage GitHubProvider::list_issues(const RepositoryRef &ref, int page,
                                         int per_page) {
  return guarded("list issues of " + ref.qualified_name(), [&] {
    auto result = to_page(client_.get_page(repo_path(ref) + "/issues?state=all&" +
                                           page_query(page, per_page)),
                          true);
    for (auto &item : result.items) {
      item = normalize_issue(item);
    }
    return result;
  });
}

ProviderPage GitHubProvider::list_pull_requests(const RepositoryRef &ref,
                                                int page, int per_page) {
  return guarded("list pull requests of " + ref.qualified_name(), [&] {
    auto result = to_page(client_.get_page(repo_path(ref) + "/pulls?state=all&" +
                                           page_query(page, per_page)),
                          false);
    for (auto &item : result.items) {
      item = normalize_pull_request(item);
    }
    return result;
  });
}

ProviderPage GitHubProvider::list_releases(const RepositoryRef &ref, int page,
                                           int per_page) {
  return guarded("list releases of " + ref.qualified_name(), [&] {
    auto result = to_page(
        client_.get_page(repo_path(ref) + "/releases?" +
                         page_query(page, per_page)),
        false);
    for (auto &item : result.items) {
      item = normalize_release(item);
    }
    return result;
  });
}

std::vector<nlohmann::json>
GitHubProvider::list_issue_comments(const RepositoryRef &ref, int number) {
  return guarded("list comments of issue #" + std::to_string(number), [&] {
    auto raw = collect_all(client_, repo_path(ref) + "/issues/" +
                                        std::to_string(number) +
                                        "/comments?per_page=100");
    std::vector<nlohmann::json> out;
    out.reserve(raw.size());
    for (const auto &c : raw) {
      auto comment = pick(c, {"id", "body", "created_at", "updated_at"});
      comment["user"] = login_of(c, "user");
      out.push_back(std::move(comment));
    }
    return out;
  });
}

std::vector<nlohmann::json>
GitHubProvider::list_release_assets(const RepositoryRef &ref,
                                    long release_id) {
  return guarded("list assets of release " + std::to_string(release_id), [&] {
    auto raw = collect_all(client_, repo_path(ref) + "/releases/" +
                                        std::to_string(release_id) +
                                        "/assets?per_page=100");
    std::vector<nlohmann::json> out;
    out.reserve(raw.size());
    for (const auto &a : raw) {
      auto asset = pick(a, {"name", "size", "download_count"});
      asset["url"] = a.value("browser_download_url", "");
      out.push_back(std::move(asset));
    }
    return out;
  });
}

nlohmann::json GitHubProvider::get_pull_request(const RepositoryRef &ref,
                                                int number) {
  return guarded("get pull request #" + std::to_string(number), [&] {
    return normalize_pull_request(client_.get_json(
        repo_path(ref) + "/pulls/" + std::to_string(number)));
  });
}

nlohmann::json GitHubProvider::create_issue(const RepositoryRef &ref,
                                            const nlohmann::json &issue) {
  return guarded("create issue in " + ref.qualified_name(), [&] {
    nlohmann::json body = {{"title", issue.value("title", "")}};
    if (issue.contains("body") && issue["body"].is_string()) {
      body["body"] = issue["body"];
    }
    if (issue.contains("labels") && issue["labels"].is_array()) {
      body["labels"] = issue["labels"];
    }
    return normalize_issue(client_.post_json(repo_path(ref) + "/issues", body));
  });
}

void GitHubProvider::close_issue(const RepositoryRef &ref, int number) {
  guarded("close issue #" + std::to_string(number), [&] {
    client_.patch_json(repo_path(ref) + "/issues/" + std::to_string(number),
                       {{"state", "closed"}});
  });
}

nlohmann::json GitHubProvider::create_release(const RepositoryRef &ref,
                                              const nlohmann::json &release) {
  return guarded("create release in " + ref.qualified_name(), [&] {
    nlohmann::json body = {{"tag_name", release.value("tag_name", "")},
                           {"draft", release.value("draft", false)},
                           {"prerelease", release.value("prerelease", false)}};
    for (const char *key : {"name", "body", "target_commitish"}) {
      if (release.contains(key) && release[key].is_string()) {
        body[key] = release[key];
      }
    }
    return normalize_release(
        client_.post_json(repo_path(ref) + "/releases", body));
  });
}

void GitHubProvider::create_label(const RepositoryRef &ref,
                                  const std::string &name,
                                  const std::string &color) {
  guarded("create label " + name, [&] {
    client_.post_json(repo_path(ref) + "/labels",
                      {{"name", name}, {"color", color}});
  });
}

RateLimitInfo GitHubProvider::rate_limit() {
  auto status = client_.rate_limit_status(2);
  if (!status) {
    throw BackupError(ErrorKind::NetworkError,
                      "Rate limit status is unavailable");
  }
  return {status->limit, status->remaining, status->reset_after};
}

} // namespace ghv
