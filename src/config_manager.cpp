/**
 * @file config_manager.cpp
 * @brief Effective configuration assembly for ghvault.
 */

#include "config_manager.hpp"
#include "token_loader.hpp"
#include <algorithm>

namespace ghv {

/**
 * Load configuration data from disk using the Config factory helpers, then
 * apply environment fallbacks.
 *
 * @param path Filesystem path to the configuration file.
 * @return Effective configuration instance.
 * @throws std::runtime_error When the file cannot be read or parsed.
 */
Config ConfigManager::load(const std::string &path) const {
  Config cfg = path.empty() ? Config{} : Config::from_file(path);
  load_token_files(cfg);
  cfg.apply_environment(lookup_);
  return cfg;
}

void ConfigManager::load_token_files(Config &cfg) const {
  auto keys = cfg.api_keys();
  for (const auto &file : cfg.api_key_files()) {
    for (auto &token : load_tokens_from_file(file)) {
      if (std::find(keys.begin(), keys.end(), token) == keys.end()) {
        keys.push_back(std::move(token));
      }
    }
  }
  cfg.set_api_keys(keys);
}

} // namespace ghv
