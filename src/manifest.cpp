#include "manifest.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "path_resolver.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> manifest_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("manifest");
  }();
  return logger;
}

template <typename State>
State state_from_string(const std::string &value, const char *what) {
  for (State s : {State::Pending, State::Complete, State::Failed,
                  State::Skipped}) {
    if (to_string(s) == value) {
      return s;
    }
  }
  throw BackupError(ErrorKind::InvalidIdentifier,
                    std::string("Unknown ") + what + " state '" + value + "'");
}

/// fsync the file or directory at @p path.
bool sync_path(const std::filesystem::path &path, int flags) {
  int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

std::string optional_string(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

} // namespace

const std::vector<EntityClass> &all_entity_classes() {
  static const std::vector<EntityClass> classes{
      EntityClass::Repository, EntityClass::Issues, EntityClass::PullRequests,
      EntityClass::Releases};
  return classes;
}

std::string to_string(EntityClass cls) {
  switch (cls) {
  case EntityClass::Repository:
    return "repository";
  case EntityClass::Issues:
    return "issues";
  case EntityClass::PullRequests:
    return "pull_requests";
  case EntityClass::Releases:
    return "releases";
  }
  return "unknown";
}

std::optional<EntityClass> entity_class_from_string(const std::string &name) {
  for (EntityClass cls : all_entity_classes()) {
    if (to_string(cls) == name) {
      return cls;
    }
  }
  // Accept the singular/short forms used on the command line.
  if (name == "repo" || name == "descriptor") {
    return EntityClass::Repository;
  }
  if (name == "pulls" || name == "prs") {
    return EntityClass::PullRequests;
  }
  return std::nullopt;
}

std::string artifact_file_name(EntityClass cls) {
  return to_string(cls) + ".json";
}

std::string to_string(ContentState state) {
  switch (state) {
  case ContentState::Pending:
    return "pending";
  case ContentState::Complete:
    return "complete";
  case ContentState::Failed:
    return "failed";
  case ContentState::Skipped:
    return "skipped";
  }
  return "pending";
}

std::string to_string(MetadataState state) {
  switch (state) {
  case MetadataState::Pending:
    return "pending";
  case MetadataState::Complete:
    return "complete";
  case MetadataState::Failed:
    return "failed";
  case MetadataState::Skipped:
    return "skipped";
  }
  return "pending";
}

bool SnapshotManifest::terminal() const {
  if (content_state == ContentState::Pending) {
    return false;
  }
  for (const auto &[cls, summary] : metadata) {
    if (summary.state == MetadataState::Pending) {
      return false;
    }
  }
  return true;
}

bool SnapshotManifest::fully_successful() const {
  if (content_state != ContentState::Complete &&
      content_state != ContentState::Skipped) {
    return false;
  }
  for (const auto &[cls, summary] : metadata) {
    if (summary.state == MetadataState::Skipped) {
      continue;
    }
    if (summary.state != MetadataState::Complete || summary.truncated ||
        summary.skipped_entities > 0) {
      return false;
    }
  }
  return true;
}

std::map<std::string, std::size_t> SnapshotManifest::entity_counts() const {
  std::map<std::string, std::size_t> counts;
  for (const auto &[cls, summary] : metadata) {
    counts[to_string(cls)] = summary.fetched_count;
  }
  return counts;
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string &value) {
  std::tm tm{};
  std::istringstream ss(value);
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

nlohmann::json to_json(const SnapshotManifest &manifest) {
  nlohmann::json metadata = nlohmann::json::object();
  for (const auto &[cls, summary] : manifest.metadata) {
    nlohmann::json entry{{"state", to_string(summary.state)},
                         {"fetched_count", summary.fetched_count},
                         {"truncated", summary.truncated},
                         {"skipped_entities", summary.skipped_entities}};
    entry["total_count"] = summary.total_count
                               ? nlohmann::json(*summary.total_count)
                               : nlohmann::json(nullptr);
    if (!summary.error.empty()) {
      entry["error"] = summary.error;
    }
    metadata[to_string(cls)] = std::move(entry);
  }
  nlohmann::json content{{"state", to_string(manifest.content_state)},
                         {"default_branch", manifest.source_default_branch},
                         {"clone_url", manifest.clone_url},
                         {"ref_count", manifest.ref_count}};
  if (!manifest.content_error.empty()) {
    content["error"] = manifest.content_error;
  }
  return {{"format_version", manifest.format_version},
          {"snapshot_id", manifest.id.to_string()},
          {"repository", manifest.id.repository.qualified_name()},
          {"timestamp", manifest.id.timestamp},
          {"started_at", format_iso8601(manifest.started_at)},
          {"completed_at", format_iso8601(manifest.completed_at)},
          {"content", std::move(content)},
          {"metadata", std::move(metadata)},
          {"entity_counts", manifest.entity_counts()}};
}

SnapshotManifest manifest_from_json(const nlohmann::json &j) {
  SnapshotManifest m;
  m.format_version = j.at("format_version").get<int>();
  if (m.format_version != SnapshotManifest::kFormatVersion) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Unsupported manifest version " +
                          std::to_string(m.format_version));
  }
  m.id.repository = RepositoryRef::parse(j.at("repository").get<std::string>());
  m.id.timestamp = j.at("timestamp").get<std::string>();
  if (auto started = parse_iso8601(optional_string(j, "started_at"))) {
    m.started_at = *started;
  }
  if (auto completed = parse_iso8601(optional_string(j, "completed_at"))) {
    m.completed_at = *completed;
  }
  const auto &content = j.at("content");
  m.content_state = state_from_string<ContentState>(
      content.at("state").get<std::string>(), "content");
  m.content_error = optional_string(content, "error");
  m.source_default_branch = optional_string(content, "default_branch");
  m.clone_url = optional_string(content, "clone_url");
  m.ref_count = content.value("ref_count", std::size_t{0});
  for (const auto &[key, entry] : j.at("metadata").items()) {
    auto cls = entity_class_from_string(key);
    if (!cls) {
      throw BackupError(ErrorKind::InvalidIdentifier,
                        "Unknown entity class '" + key + "' in manifest");
    }
    EntitySummary summary;
    summary.state = state_from_string<MetadataState>(
        entry.at("state").get<std::string>(), "metadata");
    summary.fetched_count = entry.value("fetched_count", std::size_t{0});
    if (entry.contains("total_count") && !entry["total_count"].is_null()) {
      summary.total_count = entry["total_count"].get<std::size_t>();
    }
    summary.truncated = entry.value("truncated", false);
    summary.skipped_entities = entry.value("skipped_entities", std::size_t{0});
    summary.error = optional_string(entry, "error");
    m.metadata[*cls] = summary;
  }
  return m;
}

void commit_file(const std::filesystem::path &target,
                 const std::string &content, const std::string &what) {
  auto temp = target;
  temp += ".tmp";
  auto discard = [&temp](const std::string &message) {
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    throw BackupError(ErrorKind::Storage, message);
  };
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      discard("Cannot open " + what + " for writing: " + temp.string());
    }
    out << content;
    out.flush();
    if (!out) {
      discard("Failed to write " + what + ": " + temp.string());
    }
  }
  if (!sync_path(temp, O_RDONLY)) {
    discard("Failed to sync " + what + " " + temp.string() + ": " +
            std::strerror(errno));
  }
  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    discard("Failed to commit " + what + " " + target.string() + ": " +
            ec.message());
  }
  if (!sync_path(target.parent_path(), O_RDONLY | O_DIRECTORY)) {
    throw BackupError(ErrorKind::Storage,
                      "Failed to sync directory of " + target.string() + ": " +
                          std::strerror(errno));
  }
}

void write_manifest(const std::filesystem::path &dir,
                    const SnapshotManifest &manifest) {
  commit_file(manifest_path(dir), to_json(manifest).dump(2) + "\n",
              "manifest");
  manifest_log()->debug("Manifest committed for {}", manifest.id.to_string());
}

std::optional<SnapshotManifest>
read_manifest(const std::filesystem::path &dir) {
  auto path = manifest_path(dir);
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  try {
    nlohmann::json j;
    in >> j;
    return manifest_from_json(j);
  } catch (const nlohmann::json::exception &e) {
    manifest_log()->warn("Ignoring unreadable manifest {}: {}", path.string(),
                         e.what());
  } catch (const BackupError &e) {
    manifest_log()->warn("Ignoring invalid manifest {}: {}", path.string(),
                         e.what());
  }
  return std::nullopt;
}

} // namespace ghv
