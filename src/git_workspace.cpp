/**
 * @file git_workspace.cpp
 * @brief libgit2 implementation of the local workspace.
 */

#include "errors.hpp"
#include "log.hpp"
#include "workspace.hpp"
#include <algorithm>
#include <cctype>
#include <git2.h>
#include <memory>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> workspace_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("workspace");
  }();
  return logger;
}

void repository_closer(git_repository *repo) { git_repository_free(repo); }
void remote_closer(git_remote *remote) { git_remote_free(remote); }
void reference_closer(git_reference *ref) { git_reference_free(ref); }
void object_closer(git_object *obj) { git_object_free(obj); }

using RepoPtr = std::unique_ptr<git_repository, decltype(&repository_closer)>;
using RemotePtr = std::unique_ptr<git_remote, decltype(&remote_closer)>;
using RefPtr = std::unique_ptr<git_reference, decltype(&reference_closer)>;
using ObjectPtr = std::unique_ptr<git_object, decltype(&object_closer)>;

std::string last_git_error() {
  const git_error *err = git_error_last();
  if (err == nullptr || err->message == nullptr) {
    return "unknown libgit2 error";
  }
  return err->message;
}

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

/**
 * Classify the last libgit2 error of a remote operation.
 */
ErrorKind classify_remote_error() {
  const git_error *err = git_error_last();
  std::string msg = last_git_error();
  std::transform(msg.begin(), msg.end(), msg.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (contains(msg, "authentication") || contains(msg, "credentials") ||
      contains(msg, "401") || contains(msg, "403")) {
    return ErrorKind::AuthError;
  }
  if (contains(msg, "404") || contains(msg, "not found") ||
      contains(msg, "could not find repository") ||
      contains(msg, "failed to resolve path")) {
    return ErrorKind::RepositoryGone;
  }
  if (err != nullptr &&
      (err->klass == GIT_ERROR_NET || err->klass == GIT_ERROR_HTTP ||
       err->klass == GIT_ERROR_SSH || err->klass == GIT_ERROR_SSL)) {
    return ErrorKind::NetworkError;
  }
  return ErrorKind::Storage;
}

/// Credential callback state; a token is offered once per operation.
struct CredentialState {
  const std::string *token{nullptr};
  int offered{0};
  bool rejected{false};
};

int credentials_cb(git_credential **out, const char *url,
                   const char *username_from_url, unsigned int allowed_types,
                   void *payload) {
  (void)url;
  (void)username_from_url;
  auto *state = static_cast<CredentialState *>(payload);
  if (state == nullptr || state->token == nullptr || state->token->empty() ||
      (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) == 0) {
    return GIT_PASSTHROUGH;
  }
  if (state->offered++ > 0) {
    state->rejected = true;
    return GIT_EUSER;
  }
  return git_credential_userpass_plaintext_new(out, "x-access-token",
                                               state->token->c_str());
}

RepoPtr open_repository(const std::filesystem::path &path) {
  git_repository *raw = nullptr;
  if (git_repository_open(&raw, path.c_str()) != 0) {
    throw BackupError(ErrorKind::Storage, "Cannot open repository " +
                                              path.string() + ": " +
                                              last_git_error());
  }
  return RepoPtr(raw, repository_closer);
}

RefMap collect_refs(git_repository *repo) {
  RefMap refs;
  git_reference_iterator *iter = nullptr;
  if (git_reference_iterator_new(&iter, repo) != 0) {
    throw BackupError(ErrorKind::Storage,
                      "Cannot list references: " + last_git_error());
  }
  git_reference *ref = nullptr;
  int rc = 0;
  while ((rc = git_reference_next(&ref, iter)) == 0) {
    RefPtr guard(ref, reference_closer);
    if (git_reference_type(ref) != GIT_REFERENCE_DIRECT) {
      continue;
    }
    const git_oid *target = git_reference_target(ref);
    if (target != nullptr) {
      refs[git_reference_name(ref)] = git_oid_tostr_s(target);
    }
  }
  git_reference_iterator_free(iter);
  if (rc != GIT_ITEROVER) {
    throw BackupError(ErrorKind::Storage,
                      "Failed while listing references: " + last_git_error());
  }
  return refs;
}

/// Point HEAD of a fresh mirror at the remote default branch.
void set_mirror_head(git_repository *repo, git_remote *remote,
                     const RefMap &refs) {
  git_buf buf{};
  if (git_remote_default_branch(&buf, remote) == 0 && buf.ptr != nullptr) {
    std::string head(buf.ptr, buf.size);
    git_buf_dispose(&buf);
    if (git_repository_set_head(repo, head.c_str()) == 0) {
      return;
    }
  } else {
    git_buf_dispose(&buf);
  }
  for (const char *candidate : {"refs/heads/main", "refs/heads/master"}) {
    if (refs.count(candidate) != 0 &&
        git_repository_set_head(repo, candidate) == 0) {
      return;
    }
  }
  auto first_branch =
      std::find_if(refs.begin(), refs.end(), [](const auto &entry) {
        return entry.first.rfind("refs/heads/", 0) == 0;
      });
  if (first_branch != refs.end()) {
    if (git_repository_set_head(repo, first_branch->first.c_str()) != 0) {
      workspace_log()->warn("Cannot set mirror HEAD: {}", last_git_error());
    }
  }
}

} // namespace

GitWorkspace::GitWorkspace(std::string token) : token_(std::move(token)) {
  git_libgit2_init();
}

GitWorkspace::~GitWorkspace() { git_libgit2_shutdown(); }

RefMap GitWorkspace::mirror_clone(const std::string &url,
                                  const std::filesystem::path &dest) {
  workspace_log()->info("Mirroring {} into {}", url, dest.string());
  git_repository *raw_repo = nullptr;
  if (git_repository_init(&raw_repo, dest.c_str(), 1) != 0) {
    throw BackupError(ErrorKind::Storage, "Cannot initialize mirror at " +
                                              dest.string() + ": " +
                                              last_git_error());
  }
  RepoPtr repo(raw_repo, repository_closer);

  git_remote *raw_remote = nullptr;
  if (git_remote_create_with_fetchspec(&raw_remote, repo.get(), "origin",
                                       url.c_str(), "+refs/*:refs/*") != 0) {
    throw BackupError(ErrorKind::Storage,
                      "Cannot configure mirror remote: " + last_git_error());
  }
  RemotePtr remote(raw_remote, remote_closer);

  git_config *cfg = nullptr;
  if (git_repository_config(&cfg, repo.get()) == 0) {
    if (git_config_set_bool(cfg, "remote.origin.mirror", 1) != 0) {
      workspace_log()->warn("Cannot mark remote as mirror: {}",
                            last_git_error());
    }
    git_config_free(cfg);
  }

  CredentialState creds{&token_};
  git_fetch_options opts;
  git_fetch_options_init(&opts, GIT_FETCH_OPTIONS_VERSION);
  opts.download_tags = GIT_REMOTE_DOWNLOAD_TAGS_ALL;
  opts.callbacks.credentials = credentials_cb;
  opts.callbacks.payload = &creds;
  if (git_remote_fetch(remote.get(), nullptr, &opts, "mirror") != 0) {
    ErrorKind kind =
        creds.rejected ? ErrorKind::AuthError : classify_remote_error();
    std::string msg = last_git_error();
    workspace_log()->error("Mirror fetch of {} failed ({}): {}", url,
                           to_string(kind), msg);
    throw BackupError(kind, "Mirror fetch of " + url + " failed: " + msg);
  }
  RefMap refs = collect_refs(repo.get());
  set_mirror_head(repo.get(), remote.get(), refs);
  workspace_log()->info("Mirrored {} references from {}", refs.size(), url);
  return refs;
}

void GitWorkspace::clone_from_mirror(const std::filesystem::path &mirror,
                                     const std::filesystem::path &dest) {
  workspace_log()->info("Checking out {} into {}", mirror.string(),
                        dest.string());
  git_clone_options opts;
  git_clone_options_init(&opts, GIT_CLONE_OPTIONS_VERSION);
  opts.checkout_opts.checkout_strategy = GIT_CHECKOUT_SAFE;
  opts.fetch_opts.download_tags = GIT_REMOTE_DOWNLOAD_TAGS_ALL;
  git_repository *raw_repo = nullptr;
  if (git_clone(&raw_repo, mirror.c_str(), dest.c_str(), &opts) != 0) {
    throw BackupError(ErrorKind::Storage, "Cannot clone mirror " +
                                              mirror.string() + ": " +
                                              last_git_error());
  }
  RepoPtr repo(raw_repo, repository_closer);

  git_branch_iterator *iter = nullptr;
  if (git_branch_iterator_new(&iter, repo.get(), GIT_BRANCH_REMOTE) != 0) {
    throw BackupError(ErrorKind::Storage,
                      "Cannot list mirrored branches: " + last_git_error());
  }
  git_reference *ref = nullptr;
  git_branch_t type;
  int rc = 0;
  int created = 0;
  while ((rc = git_branch_next(&ref, &type, iter)) == 0) {
    RefPtr guard(ref, reference_closer);
    if (git_reference_type(ref) != GIT_REFERENCE_DIRECT) {
      continue;
    }
    const char *remote_name = nullptr;
    if (git_branch_name(&remote_name, ref) != 0 || remote_name == nullptr) {
      continue;
    }
    std::string upstream(remote_name);
    auto slash = upstream.find('/');
    if (slash == std::string::npos) {
      continue;
    }
    std::string local = upstream.substr(slash + 1);
    git_reference *existing = nullptr;
    if (git_branch_lookup(&existing, repo.get(), local.c_str(),
                          GIT_BRANCH_LOCAL) == 0) {
      git_reference_free(existing);
      continue;
    }
    git_object *target = nullptr;
    if (git_reference_peel(&target, ref, GIT_OBJECT_COMMIT) != 0) {
      workspace_log()->warn("Skipping branch {}: {}", upstream,
                            last_git_error());
      continue;
    }
    ObjectPtr commit(target, object_closer);
    git_reference *branch = nullptr;
    if (git_branch_create(&branch, repo.get(), local.c_str(),
                          reinterpret_cast<git_commit *>(commit.get()),
                          0) != 0) {
      git_branch_iterator_free(iter);
      throw BackupError(ErrorKind::Storage, "Cannot create branch " + local +
                                                ": " + last_git_error());
    }
    RefPtr branch_guard(branch, reference_closer);
    if (git_branch_set_upstream(branch, upstream.c_str()) != 0) {
      workspace_log()->debug("No upstream for {}: {}", local,
                             last_git_error());
    }
    ++created;
  }
  git_branch_iterator_free(iter);
  if (rc != GIT_ITEROVER) {
    throw BackupError(ErrorKind::Storage,
                      "Failed while listing branches: " + last_git_error());
  }
  workspace_log()->debug("Created {} local branches in {}", created,
                         dest.string());
}

RefMap GitWorkspace::list_refs(const std::filesystem::path &repo) {
  auto handle = open_repository(repo);
  return collect_refs(handle.get());
}

std::string GitWorkspace::active_branch(const std::filesystem::path &repo) {
  auto handle = open_repository(repo);
  if (git_repository_head_detached(handle.get()) == 1) {
    return {};
  }
  git_reference *head = nullptr;
  int rc = git_repository_head(&head, handle.get());
  if (rc == GIT_EUNBORNBRANCH || rc == GIT_ENOTFOUND) {
    return {};
  }
  if (rc != 0) {
    throw BackupError(ErrorKind::Storage,
                      "Cannot resolve HEAD of " + repo.string() + ": " +
                          last_git_error());
  }
  RefPtr guard(head, reference_closer);
  return git_reference_shorthand(head);
}

bool GitWorkspace::is_dirty(const std::filesystem::path &repo) {
  auto handle = open_repository(repo);
  git_status_options opts;
  git_status_options_init(&opts, GIT_STATUS_OPTIONS_VERSION);
  opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
  opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED |
               GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS;
  git_status_list *list = nullptr;
  if (git_status_list_new(&list, handle.get(), &opts) != 0) {
    throw BackupError(ErrorKind::Storage,
                      "Cannot read status of " + repo.string() + ": " +
                          last_git_error());
  }
  bool dirty = git_status_list_entrycount(list) > 0;
  git_status_list_free(list);
  return dirty;
}

} // namespace ghv
