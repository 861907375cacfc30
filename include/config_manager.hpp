#ifndef GHVAULT_CONFIG_MANAGER_HPP
#define GHVAULT_CONFIG_MANAGER_HPP

#include "config.hpp"
#include <string>

namespace ghv {

/// Assembles the effective configuration from a file and the environment.
class ConfigManager {
public:
  explicit ConfigManager(Config::EnvLookup lookup = &std::getenv)
      : lookup_(std::move(lookup)) {}

  /**
   * Load a configuration from a YAML, TOML, or JSON file and fill unset
   * values from the environment.
   *
   * @param path Path to the configuration file, empty for defaults only.
   * @return Effective configuration.
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  Config load(const std::string &path) const;

  /**
   * Append the tokens of every configured token file to the token list,
   * skipping duplicates.
   */
  void load_token_files(Config &cfg) const;

private:
  Config::EnvLookup lookup_;
};

} // namespace ghv

#endif // GHVAULT_CONFIG_MANAGER_HPP
