#include "snapshot_coordinator.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <future>
#include <regex>
#include <system_error>

namespace ghv {

namespace {

/// Same-second snapshots allowed per repository before allocation fails.
constexpr int kMaxSameSecondSnapshots = 1000;

std::shared_ptr<spdlog::logger> coordinator_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("coordinator");
  }();
  return logger;
}

/**
 * Convert a shell-style glob pattern to a regular expression.
 *
 * @param glob Glob expression containing '*' and '?' wildcards.
 * @return std::regex equivalent capturing the same matching semantics.
 */
std::regex glob_to_regex(const std::string &glob) {
  std::string rx = "^";
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx);
}

bool matches_any(const std::string &name,
                 const std::vector<std::string> &patterns) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&name](const std::string &pattern) {
                       if (pattern.find_first_of("*?") == std::string::npos) {
                         return name == pattern;
                       }
                       return std::regex_match(name, glob_to_regex(pattern));
                     });
}

std::vector<EntityClass> requested_classes(const BackupOptions &options) {
  if (!options.include_metadata) {
    return {};
  }
  return options.classes.empty() ? all_entity_classes() : options.classes;
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    coordinator_log()->error("Cannot remove {}: {}", path.string(),
                             ec.message());
  }
}

} // namespace

std::string to_string(SnapshotPhase phase) {
  switch (phase) {
  case SnapshotPhase::Created:
    return "created";
  case SnapshotPhase::ContentInFlight:
    return "content_in_flight";
  case SnapshotPhase::MetadataInFlight:
    return "metadata_in_flight";
  case SnapshotPhase::Finalizing:
    return "finalizing";
  case SnapshotPhase::Committed:
    return "committed";
  case SnapshotPhase::Aborted:
    return "aborted";
  }
  return "unknown";
}

std::string to_string(BackupOutcome outcome) {
  switch (outcome) {
  case BackupOutcome::Committed:
    return "committed";
  case BackupOutcome::PartiallyCommitted:
    return "partially_committed";
  case BackupOutcome::Aborted:
    return "aborted";
  case BackupOutcome::NotStarted:
    return "not_started";
  case BackupOutcome::Rejected:
    return "rejected";
  }
  return "unknown";
}

std::size_t BatchResult::count(BackupOutcome outcome) const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(), [outcome](const auto &r) {
        return r.second.outcome == outcome;
      }));
}

bool BatchResult::all_committed() const {
  return std::all_of(results.begin(), results.end(), [](const auto &r) {
    return r.second.outcome == BackupOutcome::Committed;
  });
}

SnapshotCoordinator::SnapshotCoordinator(PathResolver paths,
                                         RepositoryProvider &provider,
                                         LocalWorkspace &workspace,
                                         CoordinatorSettings settings)
    : paths_(std::move(paths)), provider_(provider), settings_(settings),
      content_(workspace, settings.retry),
      metadata_(provider, settings.limits, settings.retry),
      clock_([] { return std::chrono::system_clock::now(); }) {
  if (settings_.concurrency < 1) {
    throw BackupError(ErrorKind::Configuration,
                      "concurrency must be at least 1");
  }
}

bool SnapshotCoordinator::selected(const std::string &name,
                                   const std::vector<std::string> &include,
                                   const std::vector<std::string> &exclude) {
  if (!include.empty() && !matches_any(name, include)) {
    return false;
  }
  return !matches_any(name, exclude);
}

std::shared_ptr<std::mutex>
SnapshotCoordinator::writer_lock(const RepositoryRef &repository) {
  std::scoped_lock lock(locks_mutex_);
  auto &slot = locks_[repository];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

void SnapshotCoordinator::notify(const SnapshotId &id, SnapshotPhase phase) {
  coordinator_log()->debug("{} -> {}", id.to_string(), to_string(phase));
  if (observer_) {
    observer_(id, phase);
  }
}

SnapshotId SnapshotCoordinator::allocate(const RepositoryRef &repository) {
  auto repo_dir = paths_.repository_dir(repository);
  std::error_code ec;
  std::filesystem::create_directories(repo_dir, ec);
  if (ec) {
    throw BackupError(ErrorKind::Storage, "Cannot create " +
                                              repo_dir.string() + ": " +
                                              ec.message());
  }
  const std::string base = format_snapshot_timestamp(clock_());
  for (int counter = 0; counter < kMaxSameSecondSnapshots; ++counter) {
    SnapshotId id{repository, timestamp_with_counter(base, counter)};
    auto dir = paths_.snapshot_dir(id);
    if (std::filesystem::create_directory(dir, ec)) {
      return id;
    }
    if (ec) {
      throw BackupError(ErrorKind::Storage, "Cannot create " + dir.string() +
                                                ": " + ec.message());
    }
  }
  throw BackupError(ErrorKind::Storage,
                    "Too many snapshots of " + repository.qualified_name() +
                        " within one second");
}

BackupResult SnapshotCoordinator::backup(const RepositoryRef &repository,
                                         const BackupOptions &options,
                                         const CancellationToken *cancel) {
  paths_.repository_dir(repository);
  BackupResult result;
  result.repository = repository;
  if (cancel && cancel->cancelled()) {
    coordinator_log()->info("Skipping {}: cancelled",
                            repository.qualified_name());
    return result;
  }
  auto lock = writer_lock(repository);
  std::scoped_lock guard(*lock);
  SnapshotId id;
  try {
    id = allocate(repository);
  } catch (const BackupError &e) {
    coordinator_log()->error("Cannot allocate snapshot of {}: {}",
                             repository.qualified_name(), e.what());
    result.outcome = BackupOutcome::Aborted;
    result.final_phase = SnapshotPhase::Aborted;
    result.error = e.what();
    return result;
  }
  coordinator_log()->info("Backing up {} as {}", repository.qualified_name(),
                          id.to_string());
  return run_pipeline(id, options, cancel);
}

BackupResult SnapshotCoordinator::resume(const SnapshotId &id,
                                         const BackupOptions &options,
                                         const CancellationToken *cancel) {
  auto dir = paths_.snapshot_dir(id);
  auto lock = writer_lock(id.repository);
  std::scoped_lock guard(*lock);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    throw BackupError(ErrorKind::NotFound,
                      "No snapshot directory for " + id.to_string());
  }
  auto existing = read_manifest(dir);
  if (existing && existing->terminal()) {
    throw BackupError(ErrorKind::Conflict,
                      "Snapshot " + id.to_string() + " is already committed");
  }
  std::filesystem::remove(manifest_path(dir), ec);
  remove_quietly(metadata_path(dir));
  coordinator_log()->info("Resuming {}", id.to_string());
  return run_pipeline(id, options, cancel);
}

BackupResult SnapshotCoordinator::run_pipeline(const SnapshotId &id,
                                               const BackupOptions &options,
                                               const CancellationToken *cancel) {
  const auto dir = paths_.snapshot_dir(id);
  BackupResult result;
  result.repository = id.repository;
  result.snapshot = id;
  result.path = dir;

  SnapshotManifest manifest;
  manifest.id = id;
  manifest.started_at = clock_();

  auto cancelled = [cancel] { return cancel && cancel->cancelled(); };
  auto abort = [&](const std::string &reason) {
    coordinator_log()->warn("Aborting {}: {}", id.to_string(), reason);
    notify(id, SnapshotPhase::Aborted);
    remove_quietly(dir);
    result.outcome = BackupOutcome::Aborted;
    result.final_phase = SnapshotPhase::Aborted;
    result.error = reason;
    return result;
  };

  notify(id, SnapshotPhase::Created);
  try {
    std::optional<RepoDescriptor> descriptor;
    std::string descriptor_error;
    if (options.include_content) {
      try {
        descriptor = retry_call(settings_.retry, [&] {
          return provider_.get_repository(id.repository);
        });
      } catch (const BackupError &e) {
        descriptor_error = e.what();
      }
    }
    if (cancelled()) {
      return abort("cancelled");
    }

    notify(id, SnapshotPhase::ContentInFlight);
    if (!options.include_content) {
      manifest.content_state = ContentState::Skipped;
    } else if (!descriptor) {
      manifest.content_state = ContentState::Failed;
      manifest.content_error = descriptor_error;
    } else {
      manifest.clone_url = descriptor->clone_url;
      manifest.source_default_branch = descriptor->default_branch;
      try {
        auto mirror = content_.mirror_clone(id.repository,
                                            descriptor->clone_url,
                                            content_path(dir));
        manifest.content_state = ContentState::Complete;
        manifest.ref_count = mirror.refs.size();
      } catch (const BackupError &e) {
        if (e.kind() == ErrorKind::Storage) {
          return abort(e.what());
        }
        coordinator_log()->warn("Content of {} failed: {}",
                                id.repository.qualified_name(), e.what());
        manifest.content_state = ContentState::Failed;
        manifest.content_error = e.what();
        remove_quietly(content_path(dir));
      }
    }
    if (cancelled()) {
      return abort("cancelled");
    }

    notify(id, SnapshotPhase::MetadataInFlight);
    const auto wanted = requested_classes(options);
    auto capture = [this, &id, &dir](EntityClass cls) {
      try {
        auto artifact = metadata_.snapshot(cls, id.repository);
        MetadataSnapshotter::write_artifact(metadata_path(dir), artifact);
        return artifact.summary();
      } catch (const BackupError &e) {
        if (e.kind() == ErrorKind::Storage) {
          throw;
        }
        coordinator_log()->warn("{} of {} failed: {}", to_string(cls),
                                id.repository.qualified_name(), e.what());
        EntitySummary failed;
        failed.state = MetadataState::Failed;
        failed.error = e.what();
        return failed;
      }
    };
    for (EntityClass cls : all_entity_classes()) {
      if (std::find(wanted.begin(), wanted.end(), cls) == wanted.end()) {
        manifest.metadata[cls].state = MetadataState::Skipped;
      }
    }
    if (options.parallel_metadata && wanted.size() > 1) {
      std::vector<std::pair<EntityClass, std::future<EntitySummary>>> running;
      for (EntityClass cls : wanted) {
        running.emplace_back(cls, std::async(std::launch::async, capture, cls));
      }
      for (auto &[cls, fut] : running) {
        fut.wait();
      }
      for (auto &[cls, fut] : running) {
        manifest.metadata[cls] = fut.get();
      }
    } else {
      for (EntityClass cls : wanted) {
        if (cancelled()) {
          return abort("cancelled");
        }
        manifest.metadata[cls] = capture(cls);
      }
    }
    if (cancelled()) {
      return abort("cancelled");
    }

    notify(id, SnapshotPhase::Finalizing);
    manifest.completed_at = clock_();
    write_manifest(dir, manifest);
  } catch (const BackupError &e) {
    return abort(e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    return abort(e.what());
  } catch (const std::exception &e) {
    return abort(std::string("unexpected failure: ") + e.what());
  }

  notify(id, SnapshotPhase::Committed);
  result.final_phase = SnapshotPhase::Committed;
  result.outcome = manifest.fully_successful()
                       ? BackupOutcome::Committed
                       : BackupOutcome::PartiallyCommitted;
  result.manifest = manifest;
  coordinator_log()->info("{} {}", id.to_string(), to_string(result.outcome));
  return result;
}

BatchResult
SnapshotCoordinator::backup_many(const std::vector<RepositoryRef> &repositories,
                                 const BackupOptions &options,
                                 const CancellationToken *cancel) {
  BatchResult batch;
  std::vector<RepositoryRef> unique;
  for (const auto &ref : repositories) {
    if (batch.results.emplace(ref.qualified_name(), BackupResult{ref}).second) {
      unique.push_back(ref);
    }
  }
  std::mutex results_mutex;
  WorkerPool pool(settings_.concurrency);
  pool.start();
  std::vector<std::pair<std::string, std::future<void>>> pending;
  pending.reserve(unique.size());
  for (const auto &ref : unique) {
    auto key = ref.qualified_name();
    pending.emplace_back(key, pool.submit(key, [&, ref, key] {
      BackupResult result;
      result.repository = ref;
      try {
        result = backup(ref, options, cancel);
      } catch (const BackupError &e) {
        coordinator_log()->warn("Rejected {}: {}", key, e.what());
        result.outcome = BackupOutcome::Rejected;
        result.error = e.what();
      } catch (const std::exception &e) {
        coordinator_log()->error("Backup of {} failed: {}", key, e.what());
        result.outcome = BackupOutcome::Aborted;
        result.final_phase = SnapshotPhase::Aborted;
        result.error = e.what();
      }
      std::scoped_lock lock(results_mutex);
      batch.results[key] = std::move(result);
    }));
  }
  for (auto &[key, fut] : pending) {
    try {
      fut.get();
    } catch (const std::exception &e) {
      coordinator_log()->error("Worker for {} failed: {}", key, e.what());
      std::scoped_lock lock(results_mutex);
      auto &slot = batch.results[key];
      slot.outcome = BackupOutcome::Aborted;
      slot.error = e.what();
    }
    auto stats = pool.stats();
    coordinator_log()->debug("Batch progress: {}/{} done, {} running, {} queued",
                             stats.completed + stats.failed, unique.size(),
                             stats.running, stats.queued);
  }
  batch.peak_concurrency = pool.stats().peak_running;
  pool.stop();
  coordinator_log()->info(
      "Batch finished: {} committed, {} partial, {} aborted, {} not started, "
      "{} rejected",
      batch.count(BackupOutcome::Committed),
      batch.count(BackupOutcome::PartiallyCommitted),
      batch.count(BackupOutcome::Aborted),
      batch.count(BackupOutcome::NotStarted),
      batch.count(BackupOutcome::Rejected));
  return batch;
}

BatchResult SnapshotCoordinator::backup_all(const BatchOptions &options,
                                            const CancellationToken *cancel) {
  try {
    auto budget = provider_.rate_limit();
    if (budget.remaining < options.rate_limit_threshold) {
      coordinator_log()->warn(
          "Only {} of {} API requests remaining (resets in {}s); the batch "
          "may stall on rate limits",
          budget.remaining, budget.limit, budget.reset_after.count());
    }
  } catch (const BackupError &e) {
    coordinator_log()->warn("Cannot check rate limit: {}", e.what());
  }
  auto listed = retry_call(settings_.retry, [&] {
    return provider_.list_repositories(options.owner);
  });
  std::vector<RepositoryRef> refs;
  for (const auto &desc : listed) {
    const auto &name = desc.ref.name;
    const auto full = desc.ref.qualified_name();
    bool included = options.include.empty() ||
                    matches_any(name, options.include) ||
                    matches_any(full, options.include);
    bool excluded = matches_any(name, options.exclude) ||
                    matches_any(full, options.exclude);
    if (included && !excluded) {
      refs.push_back(desc.ref);
    } else {
      coordinator_log()->debug("Filtered out {}", full);
    }
  }
  coordinator_log()->info("Backing up {} of {} repositories", refs.size(),
                          listed.size());
  return backup_many(refs, options.backup, cancel);
}

} // namespace ghv
