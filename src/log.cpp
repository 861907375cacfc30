/**
 * @file log.cpp
 * @brief spdlog based logger setup with gzip compressed rotations.
 */

#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLogger = "ghvault";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;

/// (Re)create the shared async pool, which spdlog::shutdown() discards.
void ensure_thread_pool() {
  std::lock_guard<std::mutex> lock(g_thread_pool_mutex);
  if (!spdlog::thread_pool()) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  }
}

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Path of the @p index-th rotation of @p base (`app.log` -> `app.2.log`).
 * Index 0 names the live file.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  fs::path name = stem.string() + "." + std::to_string(index) + ext.string();
  return base_path.has_parent_path() ? base_path.parent_path() / name : name;
}

fs::path gz_path(const fs::path &path) { return fs::path(path.string() + ".gz"); }

/**
 * Shift `*.N.gz` archives one slot up, dropping the oldest one so at most
 * @p max_files archives remain after the next compression.
 */
void shift_archives(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  auto log = ghv::category_logger("logging");
  std::error_code ec;
  fs::remove(gz_path(rotated_path(base, max_files)), ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from = gz_path(rotated_path(base, i - 1));
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = gz_path(rotated_path(base, i));
    fs::remove(to, ec);
    fs::rename(from, to, ec);
    if (ec) {
      log->warn("Failed to shift log archive {}: {}", from.string(),
                ec.message());
    }
  }
}

/**
 * Gzip @p path into `<path>.gz` and remove the original on success.
 *
 * @return `true` when the archive was written completely.
 */
bool gzip_file(const fs::path &path) {
  auto log = ghv::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Cannot open {} for compression", path.string());
    return false;
  }
  const fs::path target = gz_path(path);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (gz == nullptr) {
    log->warn("Cannot create archive {}", target.string());
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (ok && input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize got = input.gcount();
    if (got <= 0) {
      break;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(got));
    if (written != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Compression of {} failed: {}", path.string(),
                msg != nullptr ? msg : "unknown");
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  if (ec) {
    log->warn("Compressed {} but could not remove it: {}", path.string(),
              ec.message());
  }
  log->debug("Archived rotated log {}", target.string());
  return true;
}

spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files,
                                bool compress_rotations) {
  if (rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false);
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        shift_archives(base, rotate_files);
        gzip_file(newest);
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileSize, rotate_files, false, handlers);
}

} // namespace

namespace ghv {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
      sinks.push_back(make_file_sink(file, rotate_files, compress_rotations));
    }
    logger = std::make_shared<spdlog::async_logger>(
        kRootLogger, sinks.begin(), sinks.end(), shared_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger ready (level={}, file='{}', rotate={}, compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto owned = g_logger.lock();
  if (!logger || !owned || logger.get() != owned.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLogger) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = spdlog::default_logger();
  if (!root || root->name() != kRootLogger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks = root->sinks();
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_level(root->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

} // namespace ghv
