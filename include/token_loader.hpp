/**
 * @file token_loader.hpp
 * @brief GitHub token file loader utilities.
 *
 * Loads GitHub access tokens used for API calls and HTTPS clones from
 * JSON, YAML, or TOML files.
 */
#ifndef GHVAULT_TOKEN_LOADER_HPP
#define GHVAULT_TOKEN_LOADER_HPP

#include <string>
#include <vector>

namespace ghv {

/**
 * Load GitHub access tokens from a configuration file.
 *
 * Supported formats are JSON, YAML, and TOML. Files may contain a flat array
 * of tokens or an object/table with either a single `token` string or a
 * `tokens` array of strings. Surrounding whitespace is trimmed, blank and
 * repeated tokens are dropped.
 *
 * @param path Filesystem path to the token file
 * @return Tokens in file order
 * @throws std::runtime_error on unsupported formats or read errors
 */
std::vector<std::string> load_tokens_from_file(const std::string &path);

} // namespace ghv

#endif // GHVAULT_TOKEN_LOADER_HPP
