#include "config.hpp"
#include "log.hpp"
#include "output_layout.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace wfh {

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

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::exception &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::exception &) {
    }
    return s;
  }
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

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[kv.first.str()] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
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

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"core", "github", "crawl", "network", "output", "logging"}) {
    merge_section(section);
  }

  return normalized;
}

/// Durations are either a number of seconds or a string such as `30m`.
std::chrono::seconds duration_value(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_number()) {
    return std::chrono::seconds(static_cast<long long>(value.get<double>()));
  }
  return parse_duration(value.get<std::string>());
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  auto assign_raw = [&assign_category](const std::string &raw) {
    auto pos = raw.find('=');
    assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                    pos == std::string::npos ? std::string{"debug"}
                                             : raw.substr(pos + 1));
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign_category(key, v.get<std::string>());
      } else if (v.is_null()) {
        assign_category(key, "debug");
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        assign_raw(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    assign_raw(value.get<std::string>());
  }
  return categories;
}

} // namespace

void Config::set_snapshot_layout(const std::string &layout) {
  snapshot_layout_ = to_string(parse_snapshot_layout(layout));
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("out_dir")) {
    set_out_dir(cfg["out_dir"].get<std::string>());
  }
  if (cfg.contains("git_cache_dir")) {
    set_git_cache_dir(cfg["git_cache_dir"].get<std::string>());
  }
  if (cfg.contains("orgs_file")) {
    set_orgs_file(cfg["orgs_file"].get<std::string>());
  }
  if (cfg.contains("github_token")) {
    set_github_token(cfg["github_token"].get<std::string>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("per_page")) {
    set_per_page(cfg["per_page"].get<int>());
  }
  if (cfg.contains("max_workers")) {
    set_max_workers(cfg["max_workers"].get<int>());
  }
  if (cfg.contains("max_clones")) {
    set_max_clones(cfg["max_clones"].get<int>());
  }
  if (cfg.contains("workflow_workers")) {
    set_workflow_workers(cfg["workflow_workers"].get<int>());
  }
  if (cfg.contains("task_timeout")) {
    set_task_timeout(duration_value(cfg["task_timeout"]));
  }
  if (cfg.contains("poll_interval_ms")) {
    set_poll_interval_ms(cfg["poll_interval_ms"].get<int>());
  }
  if (cfg.contains("heartbeat_interval")) {
    set_heartbeat_interval(duration_value(cfg["heartbeat_interval"]));
  }
  if (cfg.contains("log_every")) {
    set_log_every(cfg["log_every"].get<int>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("server_backoff_ms")) {
    set_server_backoff_ms(cfg["server_backoff_ms"].get<int>());
  }
  if (cfg.contains("secondary_backoff_ms")) {
    set_secondary_backoff_ms(cfg["secondary_backoff_ms"].get<int>());
  }
  if (cfg.contains("rate_limit_margin_ms")) {
    set_rate_limit_margin_ms(cfg["rate_limit_margin_ms"].get<int>());
  }
  if (cfg.contains("max_attempts")) {
    set_max_attempts(cfg["max_attempts"].get<int>());
  }
  if (cfg.contains("snapshot_layout")) {
    set_snapshot_layout(cfg["snapshot_layout"].get<std::string>());
  }
  if (cfg.contains("compress_snapshots")) {
    set_compress_snapshots(cfg["compress_snapshots"].get<bool>());
  }
  if (cfg.contains("keep_clone")) {
    set_keep_clone(cfg["keep_clone"].get<bool>());
  }
  if (cfg.contains("git_binary")) {
    set_git_binary(cfg["git_binary"].get<std::string>());
  }
  if (cfg.contains("git_timeout")) {
    set_git_timeout(duration_value(cfg["git_timeout"]));
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
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported, or when a value is invalid.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  std::string ext_lower = to_lower_copy(path.substr(pos + 1));
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext_lower);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error("Failed to load config " + path + ": " +
                             e.what());
  }
  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const std::exception &e) {
    config_log()->error("Invalid value in config {}: {}", path, e.what());
    throw std::runtime_error("Invalid value in config " + path + ": " +
                             e.what());
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace wfh
