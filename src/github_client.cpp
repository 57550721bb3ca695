/**
 * @file github_client.cpp
 * @brief Organization repository listing and workflow directory lookups.
 */

#include "github_client.hpp"
#include "log.hpp"
#include <algorithm>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace wfh {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::string string_or(const nlohmann::json &j, const char *field,
                      const std::string &fallback) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

bool bool_or(const nlohmann::json &j, const char *field, bool fallback) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

bool is_success(long status) { return status >= 200 && status < 300; }

} // namespace

Repository Repository::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Repository entry is not an object");
  }
  auto name_it = j.find("name");
  if (name_it == j.end() || !name_it->is_string()) {
    throw std::runtime_error("Repository entry has no name");
  }
  Repository repo;
  repo.name = name_it->get<std::string>();
  repo.full_name = string_or(j, "full_name", repo.name);
  repo.clone_url = string_or(j, "clone_url", "");
  if (repo.clone_url.empty()) {
    repo.clone_url = "https://github.com/" + repo.full_name + ".git";
  }
  repo.default_branch = string_or(j, "default_branch", "main");
  if (repo.default_branch.empty()) {
    repo.default_branch = "main";
  }
  repo.archived = bool_or(j, "archived", false);
  repo.fork = bool_or(j, "fork", false);
  return repo;
}

bool is_crawl_target(const Repository &repo) {
  return !repo.archived && !repo.fork;
}

GitHubClient::GitHubClient(std::string token, std::unique_ptr<HttpClient> http,
                           std::string api_base, int per_page)
    : token_(std::move(token)),
      http_(http ? std::move(http) : std::make_unique<CurlHttpClient>()),
      api_base_(std::move(api_base)),
      per_page_(std::clamp(per_page, 1, 100)) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::vector<std::string> GitHubClient::request_headers() const {
  std::vector<std::string> headers;
  if (!token_.empty()) {
    headers.push_back("Authorization: Bearer " + token_);
  }
  headers.push_back("Accept: application/vnd.github+json");
  headers.push_back("X-GitHub-Api-Version: 2022-11-28");
  return headers;
}

std::string GitHubClient::url_encode(const std::string &value) const {
  static CurlHandle curl;
  char *escaped = curl_easy_escape(curl.get(), value.c_str(),
                                   static_cast<int>(value.size()));
  if (escaped == nullptr) {
    throw std::runtime_error("Failed to percent-encode " + value);
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

std::vector<Repository>
GitHubClient::list_org_repositories(const std::string &org) {
  std::vector<Repository> repos;
  const auto headers = request_headers();
  github_client_log()->debug("Listing repositories of {}", org);
  for (int page = 1;; ++page) {
    std::string url = api_base_ + "/orgs/" + url_encode(org) +
                      "/repos?type=public&per_page=" +
                      std::to_string(per_page_) +
                      "&page=" + std::to_string(page);
    HttpResponse res = http_->get(url, headers);
    if (!is_success(res.status_code)) {
      github_client_log()->error("GET {} failed with HTTP code {}", url,
                                 res.status_code);
      throw HttpStatusError(res.status_code,
                            "Listing repositories of " + org +
                                " failed with HTTP code " +
                                std::to_string(res.status_code));
    }
    nlohmann::json j;
    try {
      j = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error("Failed to parse repository list of " + org +
                               ": " + e.what());
    }
    if (!j.is_array()) {
      throw std::runtime_error("Repository list of " + org +
                               " is not an array");
    }
    if (j.empty()) {
      break;
    }
    for (const auto &item : j) {
      try {
        repos.push_back(Repository::from_json(item));
      } catch (const std::exception &e) {
        github_client_log()->warn("Skipping malformed repository entry in {}: {}",
                                  org, e.what());
      }
    }
  }
  github_client_log()->info("Found {} repositories in {}", repos.size(), org);
  return repos;
}

std::vector<ContentEntry>
GitHubClient::list_workflow_dir(const std::string &org,
                                const std::string &repo) {
  std::string url = api_base_ + "/repos/" + url_encode(org) + "/" +
                    url_encode(repo) + "/contents/.github/workflows";
  HttpResponse res = http_->get(url, request_headers());
  if (res.status_code == 404) {
    return {};
  }
  if (!is_success(res.status_code)) {
    throw HttpStatusError(res.status_code,
                          "Listing workflows of " + org + "/" + repo +
                              " failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  std::vector<ContentEntry> entries;
  nlohmann::json j = nlohmann::json::parse(res.body);
  if (!j.is_array()) {
    return entries;
  }
  for (const auto &item : j) {
    if (!item.is_object()) {
      continue;
    }
    ContentEntry entry;
    entry.name = string_or(item, "name", "");
    entry.path = string_or(item, "path", "");
    entry.type = string_or(item, "type", "file");
    if (!entry.path.empty()) {
      entries.push_back(std::move(entry));
    }
  }
  return entries;
}

} // namespace wfh
