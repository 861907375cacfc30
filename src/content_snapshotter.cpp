#include "content_snapshotter.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include <system_error>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> content_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("content");
  }();
  return logger;
}

bool non_empty_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return false;
  }
  return !std::filesystem::is_directory(dir, ec) ||
         !std::filesystem::is_empty(dir, ec);
}

} // namespace

ContentSnapshotter::ContentSnapshotter(LocalWorkspace &workspace,
                                       RetryPolicy retry)
    : workspace_(workspace), retry_(retry) {}

void ContentSnapshotter::discard(const std::filesystem::path &dest) {
  std::error_code ec;
  std::filesystem::remove_all(dest, ec);
  if (ec) {
    throw BackupError(ErrorKind::Storage, "Cannot discard partial mirror " +
                                              dest.string() + ": " +
                                              ec.message());
  }
}

ContentMirror ContentSnapshotter::mirror_clone(const RepositoryRef &repository,
                                               const std::string &clone_url,
                                               const std::filesystem::path &dest) {
  if (clone_url.empty()) {
    throw BackupError(ErrorKind::SourceUnavailable,
                      "No clone URL for " + repository.qualified_name());
  }
  if (non_empty_dir(dest)) {
    auto manifest = read_manifest(dest.parent_path());
    if (manifest && manifest->terminal()) {
      throw BackupError(ErrorKind::Conflict,
                        "Refusing to overwrite content of committed snapshot " +
                            manifest->id.to_string());
    }
    content_log()->warn("Discarding unmanifested content at {}",
                        dest.string());
    discard(dest);
  }
  ContentMirror mirror;
  mirror.path = dest;
  mirror.refs = retry_call(
      retry_, [&] { return workspace_.mirror_clone(clone_url, dest); },
      [&](int attempt, const BackupError &e) {
        content_log()->warn("Mirror of {} failed (attempt {}): {}",
                            repository.qualified_name(), attempt + 1,
                            e.what());
        discard(dest);
      });
  content_log()->info("Mirrored {} ({} refs)", repository.qualified_name(),
                      mirror.refs.size());
  return mirror;
}

} // namespace ghv
