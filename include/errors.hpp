/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the backup and restore engine.
 */

#ifndef GHVAULT_ERRORS_HPP
#define GHVAULT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ghv {

/// Classification of failures surfaced by the backup engine.
enum class ErrorKind {
  InvalidIdentifier, ///< Malformed or hostile repository/snapshot identifier.
  AuthError,         ///< Credentials rejected or expired.
  NetworkError,      ///< Transient transport failure, retryable.
  SourceUnavailable, ///< Remote resource missing or not readable.
  RepositoryGone,    ///< Upstream repository deleted.
  TargetNotEmpty,    ///< Restore destination already holds data.
  InvalidPath,       ///< Restore destination overlaps the backup tree.
  NotFound,          ///< Requested snapshot does not exist or is invalid.
  Conflict,          ///< Provider rejected a write as a duplicate/invalid.
  Storage,           ///< Local filesystem failure (disk full, permissions).
  Configuration      ///< Missing or inconsistent configuration.
};

/// Lowercase identifier used in reports and logs (e.g. "network_error").
std::string to_string(ErrorKind kind);

/// Whether an operation failing with @p kind may be retried.
bool is_retryable(ErrorKind kind);

/**
 * Exception carrying an ErrorKind. Thrown across component boundaries and
 * converted to recorded outcomes by the snapshotters and the coordinator.
 */
class BackupError : public std::runtime_error {
public:
  BackupError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

  bool retryable() const noexcept { return is_retryable(kind_); }

private:
  ErrorKind kind_;
};

} // namespace ghv

#endif // GHVAULT_ERRORS_HPP
