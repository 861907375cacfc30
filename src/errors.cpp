#include "errors.hpp"

namespace ghv {

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidIdentifier:
    return "invalid_identifier";
  case ErrorKind::AuthError:
    return "auth_error";
  case ErrorKind::NetworkError:
    return "network_error";
  case ErrorKind::SourceUnavailable:
    return "source_unavailable";
  case ErrorKind::RepositoryGone:
    return "repository_gone";
  case ErrorKind::TargetNotEmpty:
    return "target_not_empty";
  case ErrorKind::InvalidPath:
    return "invalid_path";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Conflict:
    return "conflict";
  case ErrorKind::Storage:
    return "storage";
  case ErrorKind::Configuration:
    return "configuration";
  }
  return "unknown";
}

bool is_retryable(ErrorKind kind) { return kind == ErrorKind::NetworkError; }

} // namespace ghv
