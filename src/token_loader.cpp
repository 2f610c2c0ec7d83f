#include "token_loader.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

std::string file_extension(const std::string &path) {
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw std::runtime_error("Unknown token file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

void add_token(std::vector<std::string> &tokens, std::string value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return;
  }
  auto end = value.find_last_not_of(" \t\r\n");
  tokens.push_back(value.substr(begin, end - begin + 1));
}

void read_yaml_tokens(const std::string &path,
                      std::vector<std::string> &tokens) {
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsScalar()) {
    add_token(tokens, node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto &item : node) {
      add_token(tokens, item.as<std::string>());
    }
  } else if (node.IsMap()) {
    if (node["token"]) {
      add_token(tokens, node["token"].as<std::string>());
    }
    if (node["tokens"]) {
      const YAML::Node list = node["tokens"];
      if (!list.IsSequence()) {
        throw std::runtime_error("YAML tokens entry must be a sequence");
      }
      for (const auto &item : list) {
        add_token(tokens, item.as<std::string>());
      }
    }
  }
}

void read_json_tokens(const std::string &path,
                      std::vector<std::string> &tokens) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  nlohmann::json j;
  f >> j;
  if (j.is_string()) {
    add_token(tokens, j.get<std::string>());
  } else if (j.is_array()) {
    for (const auto &item : j) {
      add_token(tokens, item.get<std::string>());
    }
  } else if (j.is_object()) {
    if (j.contains("token")) {
      add_token(tokens, j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      const auto &list = j["tokens"];
      if (!list.is_array()) {
        throw std::runtime_error("JSON tokens entry must be an array");
      }
      for (const auto &item : list) {
        add_token(tokens, item.get<std::string>());
      }
    }
  }
}

void read_toml_tokens(const std::string &path,
                      std::vector<std::string> &tokens) {
  toml::table tbl = toml::parse_file(path);
  if (auto single = tbl["token"].value<std::string>()) {
    add_token(tokens, *single);
  }
  if (auto arr = tbl["tokens"].as_array()) {
    for (const auto &item : *arr) {
      auto value = item.value<std::string>();
      if (!value) {
        throw std::runtime_error("TOML tokens array must contain strings");
      }
      add_token(tokens, *value);
    }
  }
}

} // namespace

std::vector<std::string> load_tokens_from_file(const std::string &path) {
  std::string ext = file_extension(path);
  std::vector<std::string> tokens;
  if (ext == "yaml" || ext == "yml") {
    read_yaml_tokens(path, tokens);
  } else if (ext == "json") {
    read_json_tokens(path, tokens);
  } else if (ext == "toml" || ext == "tml") {
    read_toml_tokens(path, tokens);
  } else {
    throw std::runtime_error("Unsupported token file format: " + ext);
  }
  auth_log()->debug("Loaded {} token(s) from {}", tokens.size(), path);
  return tokens;
}

std::string load_token_from_file(const std::string &path) {
  auto tokens = load_tokens_from_file(path);
  if (tokens.empty()) {
    throw std::runtime_error("No token found in " + path);
  }
  if (tokens.size() > 1) {
    auth_log()->info("{} holds {} tokens; using the first", path,
                     tokens.size());
  }
  return tokens.front();
}

} // namespace ghtp
