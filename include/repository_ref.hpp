/**
 * @file repository_ref.hpp
 * @brief Immutable owner/name identifier of a remote repository.
 */

#ifndef GHVAULT_REPOSITORY_REF_HPP
#define GHVAULT_REPOSITORY_REF_HPP

#include <functional>
#include <string>

namespace ghv {

/// Identifies a remote repository and its local snapshot namespace.
struct RepositoryRef {
  std::string owner; ///< Account or organization login
  std::string name;  ///< Repository name

  /// `owner/name`.
  std::string qualified_name() const { return owner + "/" + name; }

  /**
   * Parse an `owner/name` string.
   *
   * Only the shape is checked here; hostile path components are rejected by
   * PathResolver.
   *
   * @throws BackupError with ErrorKind::InvalidIdentifier when either part is
   *         missing.
   */
  static RepositoryRef parse(const std::string &value);

  bool operator==(const RepositoryRef &other) const {
    return owner == other.owner && name == other.name;
  }
  bool operator!=(const RepositoryRef &other) const {
    return !(*this == other);
  }
  bool operator<(const RepositoryRef &other) const {
    return owner != other.owner ? owner < other.owner : name < other.name;
  }
};

} // namespace ghv

template <> struct std::hash<ghv::RepositoryRef> {
  std::size_t operator()(const ghv::RepositoryRef &ref) const noexcept {
    return std::hash<std::string>{}(ref.qualified_name());
  }
};

#endif // GHVAULT_REPOSITORY_REF_HPP
