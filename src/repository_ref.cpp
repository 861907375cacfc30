#include "repository_ref.hpp"
#include "errors.hpp"

namespace ghv {

RepositoryRef RepositoryRef::parse(const std::string &value) {
  auto pos = value.find('/');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= value.size()) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Repository must be given as OWNER/NAME: '" + value +
                          "'");
  }
  RepositoryRef ref{value.substr(0, pos), value.substr(pos + 1)};
  if (ref.name.find('/') != std::string::npos) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Repository name must not contain '/': '" + value + "'");
  }
  return ref;
}

} // namespace ghv
