/**
 * @file github_client.hpp
 * @brief Minimal GitHub REST client used for repository discovery.
 */
#ifndef WORKFLOWHARVEST_GITHUB_CLIENT_HPP
#define WORKFLOWHARVEST_GITHUB_CLIENT_HPP

#include "http_client.hpp"
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace wfh {

/// Repository record as returned by the organization listing endpoint.
struct Repository {
  std::string name;                    ///< Repository name
  std::string full_name;               ///< `owner/name`
  std::string clone_url;               ///< HTTPS clone locator
  std::string default_branch{"main"};  ///< Defaults to `main` when absent
  bool archived{false};                ///< Archived repositories are skipped
  bool fork{false};                    ///< Forks are skipped

  /**
   * Build a repository from one element of the listing payload.
   *
   * `name` is required; `clone_url` falls back to the GitHub URL derived
   * from `full_name`, booleans default to false and `default_branch` to
   * `main` when missing or null.
   *
   * @throws std::runtime_error When the element is not an object or has no
   *         string `name`.
   */
  static Repository from_json(const nlohmann::json &j);
};

/// Entry of a repository contents listing.
struct ContentEntry {
  std::string name; ///< File name
  std::string path; ///< Path relative to the repository root
  std::string type; ///< `file`, `dir`, `symlink` or `submodule`
};

/// Whether a repository should be crawled (neither archived nor a fork).
bool is_crawl_target(const Repository &repo);

/**
 * GitHub REST API client covering the listing calls the crawler needs.
 *
 * Retrying and rate limit handling belong to the HttpClient passed in; the
 * application wires a RetryingHttpClient around the libcurl transport.
 */
class GitHubClient {
public:
  /**
   * @param token Bearer token sent with every request; may be empty.
   * @param http Transport; a CurlHttpClient is created when `nullptr`.
   * @param api_base Base URL of the REST API.
   * @param per_page Page size for paginated listings (1-100).
   */
  explicit GitHubClient(std::string token,
                        std::unique_ptr<HttpClient> http = nullptr,
                        std::string api_base = "https://api.github.com",
                        int per_page = 100);

  /**
   * List every repository of an organization.
   *
   * Pages are requested with `page=1,2,...` until an empty page comes back.
   * No filtering is applied.
   *
   * @throws HttpStatusError On any non-2xx response, 404 included.
   * @throws RetriesExhausted Propagated from the transport.
   * @throws std::runtime_error When a page is not a JSON array.
   */
  std::vector<Repository> list_org_repositories(const std::string &org);

  /**
   * List the `.github/workflows` directory of a repository.
   *
   * @return Directory entries; empty when the directory or the repository
   *         does not exist (404).
   * @throws HttpStatusError On other non-2xx responses.
   */
  std::vector<ContentEntry> list_workflow_dir(const std::string &org,
                                              const std::string &repo);

  const std::string &api_base() const { return api_base_; }

private:
  std::vector<std::string> request_headers() const;
  std::string url_encode(const std::string &value) const;

  std::string token_;
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  int per_page_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_GITHUB_CLIENT_HPP
