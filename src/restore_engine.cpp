#include "restore_engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "metadata_snapshotter.hpp"
#include <algorithm>
#include <functional>
#include <set>
#include <sstream>
#include <system_error>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> restore_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("restore");
  }();
  return logger;
}

constexpr int kReplayPageSize = 100;
constexpr const char *kDefaultLabelColor = "ededed";

bool has_content(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return false;
  }
  return !std::filesystem::is_directory(dir, ec) ||
         !std::filesystem::is_empty(dir, ec);
}

/// Absolute, normalized form of @p path without a trailing separator.
std::filesystem::path normalized(const std::filesystem::path &path) {
  std::error_code ec;
  auto out = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    out = std::filesystem::absolute(path, ec).lexically_normal();
  }
  if (!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
    out = out.parent_path();
  }
  return out;
}

/// Whether @p a and @p b are the same directory or one contains the other.
bool overlaps(const std::filesystem::path &a, const std::filesystem::path &b) {
  auto left = normalized(a);
  auto right = normalized(b);
  return left == right || PathResolver::is_descendant(left, right) ||
         PathResolver::is_descendant(right, left);
}

/// Branches and tags only; remote-tracking refs of the checkout are ignored.
RefMap branches_and_tags(const RefMap &refs) {
  RefMap result;
  for (const auto &[name, oid] : refs) {
    if (name.rfind("refs/heads/", 0) == 0 || name.rfind("refs/tags/", 0) == 0) {
      result.emplace(name, oid);
    }
  }
  return result;
}

std::string string_field(const nlohmann::json &record, const char *key) {
  auto it = record.find(key);
  if (it == record.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool bool_field(const nlohmann::json &record, const char *key) {
  auto it = record.find(key);
  return it != record.end() && it->is_boolean() && it->get<bool>();
}

bool wanted(const RestoreOptions &options, EntityClass cls) {
  return options.classes.empty() ||
         std::find(options.classes.begin(), options.classes.end(), cls) !=
             options.classes.end();
}

/**
 * Collect the values of @p key across every page of a provider listing.
 */
template <typename Lister>
std::set<std::string> existing_values(Lister list, const char *key) {
  std::set<std::string> values;
  for (int page = 1;; ++page) {
    ProviderPage listing = list(page);
    for (const auto &item : listing.items) {
      auto value = string_field(item, key);
      if (!value.empty()) {
        values.insert(value);
      }
    }
    if (!listing.has_next || listing.items.empty()) {
      break;
    }
  }
  return values;
}

} // namespace

std::string to_string(StepStatus status) {
  switch (status) {
  case StepStatus::Done:
    return "done";
  case StepStatus::Skipped:
    return "skipped";
  case StepStatus::Failed:
    return "failed";
  case StepStatus::Planned:
    return "planned";
  }
  return "unknown";
}

bool RestoreReport::partial() const {
  return content == StepStatus::Failed || metadata == StepStatus::Failed ||
         count(StepStatus::Failed) > 0;
}

std::size_t RestoreReport::count(StepStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(entities.begin(), entities.end(),
                    [status](const EntityRestore &e) {
                      return e.status == status;
                    }));
}

std::string RestoreReport::to_text() const {
  std::ostringstream out;
  out << "Restore of " << snapshot.to_string() << " into " << target.string()
      << (dry_run ? " (dry run)" : "") << '\n';
  out << "  content: " << to_string(content);
  if (!content_detail.empty()) {
    out << " (" << content_detail << ')';
  }
  out << '\n';
  if (content == StepStatus::Done || !restored_refs.empty()) {
    out << "    refs: " << restored_refs.size()
        << (refs_match ? " (match mirror)" : " (differ from mirror)") << '\n';
    out << "    active branch: "
        << (active_branch.empty() ? "(detached)" : active_branch) << '\n';
    out << "    working tree: " << (clean ? "clean" : "dirty") << '\n';
  }
  out << "  metadata: " << to_string(metadata) << '\n';
  for (const auto &e : entities) {
    out << "    [" << to_string(e.status) << "] " << e.entity;
    if (!e.detail.empty()) {
      out << ": " << e.detail;
    }
    out << '\n';
  }
  if (!entities.empty()) {
    out << "  " << count(StepStatus::Done) << " done, "
        << count(StepStatus::Planned) << " planned, "
        << count(StepStatus::Skipped) << " skipped, "
        << count(StepStatus::Failed) << " failed\n";
  }
  return out.str();
}

nlohmann::json RestoreReport::to_json() const {
  nlohmann::json j;
  j["snapshot_id"] = snapshot.to_string();
  j["target"] = target.string();
  j["dry_run"] = dry_run;
  j["partial"] = partial();
  j["content"] = {{"status", to_string(content)},
                  {"detail", content_detail},
                  {"refs", restored_refs},
                  {"refs_match", refs_match},
                  {"active_branch", active_branch},
                  {"clean", clean}};
  nlohmann::json list = nlohmann::json::array();
  for (const auto &e : entities) {
    list.push_back({{"class", to_string(e.entity_class)},
                    {"entity", e.entity},
                    {"status", to_string(e.status)},
                    {"detail", e.detail}});
  }
  j["metadata"] = {{"status", to_string(metadata)}, {"entities", list}};
  return j;
}

RestoreEngine::RestoreEngine(const BackupCatalog &catalog,
                             LocalWorkspace &workspace,
                             RepositoryProvider *provider)
    : catalog_(catalog), workspace_(workspace), provider_(provider) {}

RestoreReport RestoreEngine::restore(const SnapshotId &id,
                                     const std::filesystem::path &target,
                                     const RestoreOptions &options) {
  SnapshotManifest manifest = catalog_.get(id);
  const auto dir = catalog_.paths().snapshot_dir(id);
  if (options.restore_content) {
    if (overlaps(target, catalog_.paths().root())) {
      throw BackupError(ErrorKind::InvalidPath,
                        "Target " + target.string() +
                            " overlaps the backup root " +
                            catalog_.paths().root().string());
    }
    if (has_content(target) && !options.overwrite) {
      throw BackupError(ErrorKind::TargetNotEmpty,
                        "Target " + target.string() +
                            " is not empty; use --overwrite to replace it");
    }
  }
  RestoreReport report;
  report.snapshot = id;
  report.target = target;
  report.dry_run = options.dry_run;
  restore_log()->info("Restoring {} into {}", id.to_string(), target.string());

  if (options.restore_content) {
    restore_content(manifest, dir, target, options, report);
  } else {
    report.content_detail = "not requested";
  }
  if (options.replay_metadata) {
    replay_metadata(dir, id, options, report);
  }
  restore_log()->info("Restore of {} finished: content {}, metadata {}",
                      id.to_string(), to_string(report.content),
                      to_string(report.metadata));
  return report;
}

void RestoreEngine::restore_content(const SnapshotManifest &manifest,
                                    const std::filesystem::path &dir,
                                    const std::filesystem::path &target,
                                    const RestoreOptions &options,
                                    RestoreReport &report) {
  if (manifest.content_state != ContentState::Complete) {
    report.content = StepStatus::Skipped;
    report.content_detail =
        "snapshot content is " + to_string(manifest.content_state);
    return;
  }
  if (options.overwrite && has_content(target)) {
    std::error_code ec;
    std::filesystem::remove_all(target, ec);
    if (ec) {
      report.content = StepStatus::Failed;
      report.content_detail = "cannot clear target: " + ec.message();
      return;
    }
  }
  const auto mirror = content_path(dir);
  try {
    workspace_.clone_from_mirror(mirror, target);
    auto expected = branches_and_tags(workspace_.list_refs(mirror));
    auto restored = branches_and_tags(workspace_.list_refs(target));
    for (const auto &entry : restored) {
      report.restored_refs.push_back(entry.first);
    }
    report.refs_match = expected == restored;
    report.active_branch = workspace_.active_branch(target);
    report.clean = !workspace_.is_dirty(target);
    if (report.refs_match) {
      report.content = StepStatus::Done;
    } else {
      report.content = StepStatus::Failed;
      report.content_detail = "restored refs differ from the mirror (" +
                              std::to_string(restored.size()) + " vs " +
                              std::to_string(expected.size()) + ")";
    }
  } catch (const BackupError &e) {
    restore_log()->error("Checkout of {} failed: {}", mirror.string(),
                         e.what());
    report.content = StepStatus::Failed;
    report.content_detail = e.what();
  }
}

void RestoreEngine::replay_metadata(const std::filesystem::path &dir,
                                    const SnapshotId &id,
                                    const RestoreOptions &options,
                                    RestoreReport &report) {
  const RepositoryRef target = options.target_repository.value_or(id.repository);
  const bool planned = options.dry_run || provider_ == nullptr;
  const auto metadata_dir = metadata_path(dir);
  auto &entities = report.entities;

  auto record = [&entities](EntityClass cls, std::string entity,
                            StepStatus status, std::string detail = {}) {
    entities.push_back({cls, std::move(entity), status, std::move(detail)});
  };
  // Runs one remote write, mapping provider conflicts to Skipped.
  auto apply = [&](EntityClass cls, const std::string &entity,
                   const std::set<std::string> &existing,
                   const std::string &key, const std::function<void()> &write) {
    if (existing.count(key) != 0) {
      record(cls, entity, StepStatus::Skipped, "already exists");
    } else if (planned) {
      record(cls, entity, StepStatus::Planned);
    } else {
      try {
        write();
        record(cls, entity, StepStatus::Done);
      } catch (const BackupError &e) {
        if (e.kind() == ErrorKind::Conflict) {
          record(cls, entity, StepStatus::Skipped, e.what());
        } else {
          restore_log()->warn("Replay of {} failed: {}", entity, e.what());
          record(cls, entity, StepStatus::Failed, e.what());
        }
      }
    }
  };
  auto scan = [&](EntityClass cls, const char *key, auto lister) {
    std::set<std::string> existing;
    if (planned) {
      return existing;
    }
    try {
      existing = existing_values(lister, key);
    } catch (const BackupError &e) {
      record(cls, "existing " + to_string(cls) + " of " +
                      target.qualified_name(),
             StepStatus::Failed, e.what());
    }
    return existing;
  };

  for (EntityClass cls : {EntityClass::Repository, EntityClass::PullRequests}) {
    if (wanted(options, cls)) {
      record(cls, to_string(cls), StepStatus::Skipped, "not replayable");
    }
  }

  if (wanted(options, EntityClass::Issues)) {
    auto artifact =
        MetadataSnapshotter::read_artifact(metadata_dir, EntityClass::Issues);
    if (!artifact) {
      record(EntityClass::Issues, "issues", StepStatus::Skipped,
             "not in snapshot");
    } else {
      std::set<std::string> labels;
      for (const auto &issue : artifact->records) {
        if (issue.contains("labels") && issue["labels"].is_array()) {
          for (const auto &label : issue["labels"]) {
            if (label.is_string()) {
              labels.insert(label.get<std::string>());
            }
          }
        }
      }
      const std::set<std::string> no_existing;
      for (const auto &label : labels) {
        apply(EntityClass::Issues, "label " + label, no_existing, label,
              [&] { provider_->create_label(target, label, kDefaultLabelColor); });
      }
      auto titles = scan(EntityClass::Issues, "title", [&](int page) {
        return provider_->list_issues(target, page, kReplayPageSize);
      });
      // Oldest first so recreated numbers follow the original order.
      for (auto it = artifact->records.rbegin(); it != artifact->records.rend();
           ++it) {
        const auto &issue = *it;
        const auto title = string_field(issue, "title");
        const std::string entity =
            (issue.contains("number") && issue["number"].is_number_integer()
                 ? "issue #" + std::to_string(issue["number"].get<long>())
                 : std::string("issue")) +
            " " + title;
        apply(EntityClass::Issues, entity, titles, title, [&] {
          nlohmann::json payload{{"title", title},
                                 {"body", string_field(issue, "body")}};
          if (issue.contains("labels")) {
            payload["labels"] = issue["labels"];
          }
          auto created = provider_->create_issue(target, payload);
          if (string_field(issue, "state") == "closed" &&
              created.contains("number") &&
              created["number"].is_number_integer()) {
            provider_->close_issue(target, created["number"].get<int>());
          }
        });
      }
    }
  }

  if (wanted(options, EntityClass::Releases)) {
    auto artifact =
        MetadataSnapshotter::read_artifact(metadata_dir, EntityClass::Releases);
    if (!artifact) {
      record(EntityClass::Releases, "releases", StepStatus::Skipped,
             "not in snapshot");
    } else {
      auto tags = scan(EntityClass::Releases, "tag_name", [&](int page) {
        return provider_->list_releases(target, page, kReplayPageSize);
      });
      for (auto it = artifact->records.rbegin(); it != artifact->records.rend();
           ++it) {
        const auto &release = *it;
        const auto tag = string_field(release, "tag_name");
        apply(EntityClass::Releases, "release " + tag, tags, tag, [&] {
          nlohmann::json payload{
              {"tag_name", tag},
              {"name", string_field(release, "name")},
              {"body", string_field(release, "body")},
              {"draft", bool_field(release, "draft")},
              {"prerelease", bool_field(release, "prerelease")}};
          auto commitish = string_field(release, "target_commitish");
          if (!commitish.empty()) {
            payload["target_commitish"] = commitish;
          }
          provider_->create_release(target, payload);
        });
      }
    }
  }

  if (planned) {
    report.metadata = StepStatus::Planned;
  } else {
    report.metadata =
        report.count(StepStatus::Failed) > 0 ? StepStatus::Failed
                                             : StepStatus::Done;
  }
}

} // namespace ghv
