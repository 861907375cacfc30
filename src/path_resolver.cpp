#include "path_resolver.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> paths_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("paths");
  }();
  return logger;
}

bool allowed_char(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

} // namespace

PathResolver::PathResolver(std::filesystem::path backup_root) {
  if (backup_root.empty()) {
    throw BackupError(ErrorKind::Configuration, "Backup root is not set");
  }
  std::error_code ec;
  auto absolute = std::filesystem::absolute(backup_root, ec);
  if (ec) {
    throw BackupError(ErrorKind::Configuration,
                      "Cannot resolve backup root '" + backup_root.string() +
                          "': " + ec.message());
  }
  root_ = absolute.lexically_normal();
  // Drop a trailing separator so component-wise comparison is exact.
  if (!root_.has_filename() && root_.has_parent_path() &&
      root_ != root_.root_path()) {
    root_ = root_.parent_path();
  }
}

void PathResolver::validate_component(const std::string &value,
                                      const char *what) {
  auto reject = [&](const std::string &reason) {
    paths_log()->warn("Rejected {} '{}': {}", what, value, reason);
    throw BackupError(ErrorKind::InvalidIdentifier,
                      std::string("Invalid ") + what + " '" + value +
                          "': " + reason);
  };
  if (value.empty()) {
    reject("empty");
  }
  if (value.find("..") != std::string::npos) {
    reject("contains '..'");
  }
  if (value == ".") {
    reject("refers to the current directory");
  }
  if (!std::all_of(value.begin(), value.end(), [](char c) {
        return allowed_char(static_cast<unsigned char>(c));
      })) {
    reject("contains separators or unsupported characters");
  }
}

bool PathResolver::is_descendant(const std::filesystem::path &root,
                                 const std::filesystem::path &candidate) {
  auto base = root.lexically_normal();
  auto target = candidate.lexically_normal();
  auto [root_end, target_it] =
      std::mismatch(base.begin(), base.end(), target.begin(), target.end());
  if (root_end != base.end()) {
    // Tolerate the empty trailing element of "dir/".
    if (!(std::next(root_end) == base.end() && root_end->empty())) {
      return false;
    }
  }
  for (; target_it != target.end(); ++target_it) {
    if (!target_it->empty() && *target_it != "." && *target_it != "..") {
      return true;
    }
    if (*target_it == "..") {
      return false;
    }
  }
  return false;
}

std::filesystem::path
PathResolver::resolve(const RepositoryRef &repository,
                      const std::optional<std::string> &timestamp) const {
  validate_component(repository.owner, "owner");
  validate_component(repository.name, "name");
  std::filesystem::path out = root_ / repository.owner / repository.name;
  if (timestamp) {
    if (!parse_snapshot_timestamp(*timestamp)) {
      throw BackupError(ErrorKind::InvalidIdentifier,
                        "Malformed snapshot timestamp '" + *timestamp + "'");
    }
    out /= *timestamp;
  }
  if (!is_descendant(root_, out)) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Resolved path escapes backup root: " + out.string());
  }
  return out;
}

} // namespace ghv
