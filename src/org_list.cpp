#include "org_list.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <toml++/toml.h>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace wfh {

namespace {

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string{};
}

std::string extension_of(const std::string &path) {
  auto slash = path.find_last_of('/');
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) {
    return {};
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

std::vector<std::string> from_yaml(const std::string &path) {
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsMap() && node["orgs"]) {
    node = node["orgs"];
  }
  if (!node.IsSequence()) {
    throw std::runtime_error("YAML organizations file must be a sequence or "
                             "contain an orgs sequence");
  }
  std::vector<std::string> orgs;
  orgs.reserve(node.size());
  std::transform(node.begin(), node.end(), std::back_inserter(orgs),
                 [](const YAML::Node &n) { return n.as<std::string>(); });
  return orgs;
}

std::vector<std::string> from_json(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open organizations file " + path);
  }
  nlohmann::json j;
  f >> j;
  if (j.is_object() && j.contains("orgs")) {
    j = j["orgs"];
  }
  if (!j.is_array()) {
    throw std::runtime_error("JSON organizations file must be an array or "
                             "contain an orgs array");
  }
  std::vector<std::string> orgs;
  orgs.reserve(j.size());
  std::transform(j.begin(), j.end(), std::back_inserter(orgs),
                 [](const nlohmann::json &item) {
                   return item.get<std::string>();
                 });
  return orgs;
}

std::vector<std::string> from_toml(const std::string &path) {
  toml::table tbl = toml::parse_file(path);
  auto arr = tbl["orgs"].as_array();
  if (arr == nullptr) {
    throw std::runtime_error("TOML organizations file must contain an orgs "
                             "array");
  }
  std::vector<std::string> orgs;
  orgs.reserve(arr->size());
  for (const auto &item : *arr) {
    if (auto value = item.value<std::string>()) {
      orgs.push_back(*value);
    } else {
      throw std::runtime_error("TOML orgs array must contain strings");
    }
  }
  return orgs;
}

std::vector<std::string> from_text(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open organizations file " + path);
  }
  std::vector<std::string> orgs;
  std::string line;
  while (std::getline(f, line)) {
    auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    orgs.push_back(line);
  }
  return orgs;
}

} // namespace

std::vector<std::string> load_orgs_from_file(const std::string &path) {
  const std::string ext = extension_of(path);
  std::vector<std::string> raw;
  try {
    if (ext == "yaml" || ext == "yml") {
      raw = from_yaml(path);
    } else if (ext == "json") {
      raw = from_json(path);
    } else if (ext == "toml" || ext == "tml") {
      raw = from_toml(path);
    } else {
      raw = from_text(path);
    }
  } catch (const std::runtime_error &) {
    throw;
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to parse organizations file " + path +
                             ": " + e.what());
  }

  std::vector<std::string> orgs;
  std::unordered_set<std::string> seen;
  for (const auto &entry : raw) {
    std::string org = trim(entry);
    if (org.empty() || !seen.insert(org).second) {
      continue;
    }
    orgs.push_back(std::move(org));
  }
  category_logger("orgs")->debug("Loaded {} organizations from {}",
                                 orgs.size(), path);
  return orgs;
}

} // namespace wfh
