#include "token_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghv {

namespace {

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string> yaml_tokens(const std::string &path) {
  std::vector<std::string> raw;
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsSequence()) {
    for (const auto &item : node) {
      raw.push_back(item.as<std::string>());
    }
  } else if (node.IsScalar()) {
    raw.push_back(node.as<std::string>());
  } else if (node.IsMap()) {
    if (node["token"]) {
      raw.push_back(node["token"].as<std::string>());
    }
    if (const YAML::Node list = node["tokens"]) {
      if (!list.IsSequence()) {
        throw std::runtime_error("YAML tokens entry must be a sequence");
      }
      for (const auto &item : list) {
        raw.push_back(item.as<std::string>());
      }
    }
  }
  return raw;
}

std::vector<std::string> json_tokens(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  nlohmann::json j;
  f >> j;
  if (j.is_string()) {
    return {j.get<std::string>()};
  }
  if (j.is_array()) {
    return j.get<std::vector<std::string>>();
  }
  std::vector<std::string> raw;
  if (j.is_object()) {
    if (j.contains("token")) {
      raw.push_back(j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      if (!j["tokens"].is_array()) {
        throw std::runtime_error("JSON tokens entry must be an array");
      }
      auto list = j["tokens"].get<std::vector<std::string>>();
      raw.insert(raw.end(), list.begin(), list.end());
    }
  }
  return raw;
}

std::vector<std::string> toml_tokens(const std::string &path) {
  std::vector<std::string> raw;
  toml::table tbl = toml::parse_file(path);
  if (auto single = tbl["token"].value<std::string>()) {
    raw.push_back(*single);
  }
  if (auto arr = tbl["tokens"].as_array()) {
    for (const auto &item : *arr) {
      auto value = item.value<std::string>();
      if (!value) {
        throw std::runtime_error("TOML tokens array must contain strings");
      }
      raw.push_back(*value);
    }
  }
  return raw;
}

} // namespace

/**
 * Load personal access tokens from a supported configuration file.
 *
 * @param path Filesystem path to the token file.
 * @return Ordered, de-duplicated list of tokens discovered in the file.
 * @throws std::runtime_error When the file cannot be parsed or the extension
 *         is unknown.
 */
std::vector<std::string> load_tokens_from_file(const std::string &path) {
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw std::runtime_error("Unknown token file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  std::vector<std::string> raw;
  if (ext == "yaml" || ext == "yml") {
    raw = yaml_tokens(path);
  } else if (ext == "json") {
    raw = json_tokens(path);
  } else if (ext == "toml" || ext == "tml") {
    raw = toml_tokens(path);
  } else {
    throw std::runtime_error("Unsupported token file format");
  }

  std::vector<std::string> tokens;
  for (const auto &entry : raw) {
    auto token = trim(entry);
    if (!token.empty() &&
        std::find(tokens.begin(), tokens.end(), token) == tokens.end()) {
      tokens.push_back(std::move(token));
    }
  }
  return tokens;
}

} // namespace ghv
