#include "snapshot_id.hpp"
#include "errors.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ghv {

namespace {

bool all_digits(const std::string &value, std::size_t pos, std::size_t len) {
  if (pos + len > value.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string format_snapshot_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
  return oss.str();
}

std::string timestamp_with_counter(const std::string &base, int counter) {
  if (counter <= 0) {
    return base;
  }
  return base + "-" + std::to_string(counter);
}

std::optional<TimestampKey> parse_snapshot_timestamp(const std::string &value) {
  // YYYYMMDD-HHMMSS is 15 characters.
  if (value.size() < 15 || !all_digits(value, 0, 8) || value[8] != '-' ||
      !all_digits(value, 9, 6)) {
    return std::nullopt;
  }
  TimestampKey key;
  key.base = value.substr(0, 15);
  if (value.size() == 15) {
    return key;
  }
  if (value[15] != '-' || value.size() == 16 || value.size() > 25 ||
      !all_digits(value, 16, value.size() - 16) || value[16] == '0') {
    return std::nullopt;
  }
  key.counter = std::stoi(value.substr(16));
  return key;
}

bool timestamp_less(const std::string &a, const std::string &b) {
  auto ka = parse_snapshot_timestamp(a);
  auto kb = parse_snapshot_timestamp(b);
  if (!ka || !kb) {
    if (!ka && !kb) {
      return a < b;
    }
    return !ka;
  }
  if (ka->base != kb->base) {
    return ka->base < kb->base;
  }
  return ka->counter < kb->counter;
}

std::optional<std::chrono::system_clock::time_point>
timestamp_to_time_point(const std::string &value) {
  auto key = parse_snapshot_timestamp(value);
  if (!key) {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream ss(key->base);
  ss >> std::get_time(&tm, "%Y%m%d-%H%M%S");
  if (ss.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

SnapshotId SnapshotId::parse(const std::string &value) {
  auto at = value.rfind('@');
  if (at == std::string::npos) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Snapshot must be given as OWNER/NAME@TIMESTAMP: '" +
                          value + "'");
  }
  SnapshotId id{RepositoryRef::parse(value.substr(0, at)),
                value.substr(at + 1)};
  if (!parse_snapshot_timestamp(id.timestamp)) {
    throw BackupError(ErrorKind::InvalidIdentifier,
                      "Malformed snapshot timestamp '" + id.timestamp + "'");
  }
  return id;
}

} // namespace ghv
