#include "metadata_snapshotter.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <fstream>
#include <string>
#include <system_error>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> metadata_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("metadata");
  }();
  return logger;
}

std::string entity_label(const char *kind, const nlohmann::json &record,
                         const char *key) {
  auto it = record.find(key);
  if (it == record.end()) {
    return kind;
  }
  return std::string(kind) + " " +
         (it->is_string() ? it->get<std::string>() : it->dump());
}

} // namespace

EntitySummary MetadataArtifact::summary() const {
  EntitySummary s;
  s.state = MetadataState::Complete;
  s.fetched_count = fetched_count;
  s.total_count = total_count;
  s.truncated = truncated;
  s.skipped_entities = skipped.size();
  return s;
}

nlohmann::json to_json(const MetadataArtifact &artifact) {
  nlohmann::json skipped = nlohmann::json::array();
  for (const auto &s : artifact.skipped) {
    skipped.push_back(
        {{"entity", s.entity}, {"part", s.part}, {"reason", s.reason}});
  }
  return {{"entity_class", to_string(artifact.entity_class)},
          {"fetched_count", artifact.fetched_count},
          {"total_count", artifact.total_count
                              ? nlohmann::json(*artifact.total_count)
                              : nlohmann::json(nullptr)},
          {"truncated", artifact.truncated},
          {"complete_export", artifact.complete_export()},
          {"skipped", std::move(skipped)},
          {"records", artifact.records}};
}

MetadataArtifact artifact_from_json(const nlohmann::json &j) {
  MetadataArtifact artifact;
  auto cls = entity_class_from_string(j.at("entity_class").get<std::string>());
  if (!cls) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Unknown entity class in artifact");
  }
  artifact.entity_class = *cls;
  artifact.fetched_count = j.value("fetched_count", std::size_t{0});
  if (j.contains("total_count") && !j["total_count"].is_null()) {
    artifact.total_count = j["total_count"].get<std::size_t>();
  }
  artifact.truncated = j.value("truncated", false);
  for (const auto &s : j.value("skipped", nlohmann::json::array())) {
    artifact.skipped.push_back({s.value("entity", ""), s.value("part", ""),
                                s.value("reason", "")});
  }
  for (const auto &r : j.at("records")) {
    artifact.records.push_back(r);
  }
  return artifact;
}

MetadataSnapshotter::MetadataSnapshotter(RepositoryProvider &provider,
                                         SnapshotLimits limits,
                                         RetryPolicy retry)
    : provider_(provider), limits_(limits), retry_(retry) {
  if (limits_.per_page <= 0 || limits_.per_page > 100) {
    throw BackupError(ErrorKind::Configuration,
                      "per_page must be between 1 and 100");
  }
  if (limits_.page_cap < 0) {
    throw BackupError(ErrorKind::Configuration, "page_cap must not be negative");
  }
}

MetadataArtifact MetadataSnapshotter::snapshot(EntityClass cls,
                                               const RepositoryRef &repository) {
  metadata_log()->debug("Capturing {} of {}", to_string(cls),
                        repository.qualified_name());
  MetadataArtifact artifact;
  try {
    artifact = cls == EntityClass::Repository ? snapshot_repository(repository)
                                              : paginate(cls, repository);
    enrich(artifact, repository);
  } catch (const nlohmann::json::exception &e) {
    throw BackupError(ErrorKind::SourceUnavailable,
                      "Malformed " + to_string(cls) + " payload: " + e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    throw BackupError(ErrorKind::Storage, e.what());
  }
  if (artifact.truncated) {
    metadata_log()->warn("{} of {} truncated after {} records (page cap {})",
                         to_string(cls), repository.qualified_name(),
                         artifact.fetched_count, limits_.page_cap);
  }
  if (!artifact.skipped.empty()) {
    metadata_log()->warn("{} of {}: {} entities degraded", to_string(cls),
                         repository.qualified_name(), artifact.skipped.size());
  }
  metadata_log()->info("Captured {} {} of {}", artifact.fetched_count,
                       to_string(cls), repository.qualified_name());
  return artifact;
}

MetadataArtifact
MetadataSnapshotter::snapshot_repository(const RepositoryRef &repository) {
  auto desc = retry_call(retry_,
                         [&] { return provider_.get_repository(repository); });
  MetadataArtifact artifact;
  artifact.entity_class = EntityClass::Repository;
  artifact.records.push_back(desc.raw);
  artifact.fetched_count = 1;
  artifact.total_count = 1;
  return artifact;
}

MetadataArtifact MetadataSnapshotter::paginate(EntityClass cls,
                                               const RepositoryRef &repository) {
  MetadataArtifact artifact;
  artifact.entity_class = cls;
  for (int page = 1;; ++page) {
    ProviderPage result = retry_call(retry_, [&] {
      switch (cls) {
      case EntityClass::Issues:
        return provider_.list_issues(repository, page, limits_.per_page);
      case EntityClass::PullRequests:
        return provider_.list_pull_requests(repository, page,
                                            limits_.per_page);
      case EntityClass::Releases:
        return provider_.list_releases(repository, page, limits_.per_page);
      case EntityClass::Repository:
        break;
      }
      throw BackupError(ErrorKind::Configuration,
                        "Entity class is not paginated");
    });
    for (auto &item : result.items) {
      artifact.records.push_back(std::move(item));
    }
    if (!result.has_next) {
      break;
    }
    if (limits_.page_cap > 0 && page >= limits_.page_cap) {
      artifact.truncated = true;
      break;
    }
  }
  artifact.fetched_count = artifact.records.size();
  if (!artifact.truncated) {
    artifact.total_count = artifact.fetched_count;
  }
  return artifact;
}

void MetadataSnapshotter::enrich(MetadataArtifact &artifact,
                                 const RepositoryRef &repository) {
  auto degrade = [&artifact](std::string entity, const char *part,
                             const BackupError &e) {
    metadata_log()->warn("Skipping {} of {}: {}", part, entity, e.what());
    artifact.skipped.push_back({std::move(entity), part, e.what()});
  };
  switch (artifact.entity_class) {
  case EntityClass::Issues:
    if (!limits_.fetch_issue_comments) {
      return;
    }
    for (auto &record : artifact.records) {
      auto comments = record.find("comments");
      if (!record.contains("number") || !record["number"].is_number() ||
          comments == record.end() || !comments->is_number() ||
          comments->get<int>() == 0) {
        continue;
      }
      int number = record["number"].get<int>();
      try {
        auto list = retry_call(retry_, [&] {
          return provider_.list_issue_comments(repository, number);
        });
        record["comment_list"] = list;
      } catch (const BackupError &e) {
        degrade(entity_label("issue", record, "number"), "comments", e);
      }
    }
    break;
  case EntityClass::PullRequests:
    if (!limits_.fetch_pull_request_details) {
      return;
    }
    for (auto &record : artifact.records) {
      if (!record.contains("number") || !record["number"].is_number()) {
        continue;
      }
      int number = record["number"].get<int>();
      try {
        auto detail = retry_call(retry_, [&] {
          return provider_.get_pull_request(repository, number);
        });
        for (const char *key : {"merged", "mergeable", "commits", "comments",
                                "additions", "deletions", "changed_files"}) {
          if (detail.contains(key)) {
            record[key] = detail[key];
          }
        }
      } catch (const BackupError &e) {
        degrade(entity_label("pull request", record, "number"), "details", e);
      }
    }
    break;
  case EntityClass::Releases:
    if (!limits_.fetch_release_assets) {
      return;
    }
    for (auto &record : artifact.records) {
      if (!record.contains("id") || !record["id"].is_number()) {
        continue;
      }
      long id = record["id"].get<long>();
      try {
        auto assets = retry_call(retry_, [&] {
          return provider_.list_release_assets(repository, id);
        });
        record["assets"] = assets;
      } catch (const BackupError &e) {
        degrade(entity_label("release", record, "tag_name"), "assets", e);
      }
    }
    break;
  case EntityClass::Repository:
    break;
  }
}

void MetadataSnapshotter::write_artifact(
    const std::filesystem::path &metadata_dir,
    const MetadataArtifact &artifact) {
  std::error_code ec;
  std::filesystem::create_directories(metadata_dir, ec);
  if (ec) {
    throw BackupError(ErrorKind::Storage, "Cannot create " +
                                              metadata_dir.string() + ": " +
                                              ec.message());
  }
  std::string text;
  try {
    text = to_json(artifact).dump(2) + "\n";
  } catch (const nlohmann::json::exception &e) {
    throw BackupError(ErrorKind::SourceUnavailable,
                      "Cannot serialize " + to_string(artifact.entity_class) +
                          ": " + e.what());
  }
  commit_file(metadata_dir / artifact_file_name(artifact.entity_class), text,
              "artifact");
}

std::optional<MetadataArtifact>
MetadataSnapshotter::read_artifact(const std::filesystem::path &metadata_dir,
                                   EntityClass cls) {
  auto path = metadata_dir / artifact_file_name(cls);
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  try {
    nlohmann::json j;
    in >> j;
    return artifact_from_json(j);
  } catch (const nlohmann::json::exception &e) {
    metadata_log()->warn("Unreadable artifact {}: {}", path.string(), e.what());
  } catch (const BackupError &e) {
    metadata_log()->warn("Invalid artifact {}: {}", path.string(), e.what());
  }
  return std::nullopt;
}

} // namespace ghv
