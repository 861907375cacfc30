/**
 * @file snapshot_id.hpp
 * @brief Primary key of a backup: repository plus a sortable UTC timestamp.
 */

#ifndef GHVAULT_SNAPSHOT_ID_HPP
#define GHVAULT_SNAPSHOT_ID_HPP

#include "repository_ref.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace ghv {

/// Parsed form of a snapshot timestamp `YYYYMMDD-HHMMSS[-N]`.
struct TimestampKey {
  std::string base; ///< `YYYYMMDD-HHMMSS`
  int counter{0};   ///< Same-second disambiguation suffix, 0 when absent
};

/**
 * Format @p tp as the UTC token `YYYYMMDD-HHMMSS`.
 */
std::string format_snapshot_timestamp(std::chrono::system_clock::time_point tp);

/**
 * Append a same-second disambiguation counter (`base-N`); counter 0 returns
 * @p base unchanged.
 */
std::string timestamp_with_counter(const std::string &base, int counter);

/// Parse a timestamp token; `std::nullopt` when it is not well formed.
std::optional<TimestampKey> parse_snapshot_timestamp(const std::string &value);

/**
 * Strict ordering of timestamp tokens: by second, then by counter compared
 * numerically (`-10` sorts after `-9`). Malformed tokens sort first.
 */
bool timestamp_less(const std::string &a, const std::string &b);

/// Convert the second part of a timestamp token back to a time point.
std::optional<std::chrono::system_clock::time_point>
timestamp_to_time_point(const std::string &value);

/// Identifies one snapshot of one repository.
struct SnapshotId {
  RepositoryRef repository;
  std::string timestamp;

  /// `owner/name@timestamp`.
  std::string to_string() const {
    return repository.qualified_name() + "@" + timestamp;
  }

  /**
   * Parse `owner/name@timestamp`.
   *
   * @throws BackupError InvalidIdentifier when malformed.
   */
  static SnapshotId parse(const std::string &value);

  bool operator==(const SnapshotId &other) const {
    return repository == other.repository && timestamp == other.timestamp;
  }
  bool operator!=(const SnapshotId &other) const { return !(*this == other); }
};

} // namespace ghv

#endif // GHVAULT_SNAPSHOT_ID_HPP
