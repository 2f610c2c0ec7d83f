#include "config.hpp"
#include "log.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace ghtp {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Interpret a YAML scalar as bool, integer, float or string.
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (s.empty())
    return s;
  try {
    size_t idx = 0;
    long long i = std::stoll(s, &idx, 10);
    if (idx == s.size())
      return i;
  } catch (const std::invalid_argument &) {
  } catch (const std::out_of_range &) {
  }
  try {
    size_t idx = 0;
    double d = std::stod(s, &idx);
    if (idx == s.size())
      return d;
  } catch (const std::invalid_argument &) {
  } catch (const std::out_of_range &) {
  }
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Scalar:
    return yaml_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a parsed TOML node to JSON.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/**
 * Lift the keys of the recognised sections to the root so grouped and flat
 * files are read the same way. Root keys win over section keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  if (source.is_null()) {
    return nlohmann::json::object();
  }
  if (!source.is_object()) {
    throw std::runtime_error("Configuration root must be an object");
  }
  nlohmann::json normalized = nlohmann::json::object();
  for (std::string_view name :
       {"network", "search", "export", "logging", "auth"}) {
    auto it = source.find(std::string{name});
    if (it == source.end()) {
      continue;
    }
    if (!it->is_object()) {
      config_log()->warn("Ignoring config section '{}': not a table", name);
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      normalized[key] = value;
    }
  }
  for (const auto &[key, value] : source.items()) {
    if (!value.is_object()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

/// Column lists may be written as an array or a comma separated string.
std::vector<std::string> read_columns(const nlohmann::json &value) {
  std::vector<std::string> columns;
  if (value.is_array()) {
    for (const auto &item : value) {
      columns.push_back(item.get<std::string>());
    }
    return columns;
  }
  std::stringstream ss(value.get<std::string>());
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) {
      columns.push_back(part);
    }
  }
  return columns;
}

/// Durations may be written as seconds or as strings such as `90d`.
std::chrono::seconds read_duration(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  return parse_duration(value.get<std::string>());
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("max_pages")) {
    set_max_pages(cfg["max_pages"].get<int>());
  }
  if (cfg.contains("commit_window")) {
    set_commit_window(read_duration(cfg["commit_window"]));
  }
  if (cfg.contains("enrich")) {
    set_enrich(cfg["enrich"].get<bool>());
  }
  if (cfg.contains("columns")) {
    set_columns(read_columns(cfg["columns"]));
  }
  if (cfg.contains("format")) {
    set_format(to_lower_copy(cfg["format"].get<std::string>()));
  }
  if (cfg.contains("token")) {
    set_token(cfg["token"].get<std::string>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension. Errors during parsing are
 * logged and rethrown.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace ghtp
