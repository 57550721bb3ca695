/**
 * @file http_client.hpp
 * @brief HTTP transport abstractions and the libcurl implementation.
 *
 * The crawler only issues GET requests against the GitHub REST API, so the
 * transport interface is limited to a single verb returning the status code,
 * the raw response headers and the body.
 */
#ifndef WORKFLOWHARVEST_HTTP_CLIENT_HPP
#define WORKFLOWHARVEST_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wfh {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Raw `Name: value` header lines
  long status_code = 0;             ///< HTTP status code
};

/**
 * Look up a response header by name, ignoring case.
 *
 * @param resp Response to inspect.
 * @param name Header name without the trailing colon.
 * @return Trimmed header value of the last matching line, if any.
 */
std::optional<std::string> header_value(const HttpResponse &resp,
                                        const std::string &name);

/// Raised when the transport fails before an HTTP status is available.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised when a response carries a status the caller cannot handle.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(long status, const std::string &msg)
      : std::runtime_error(msg), status(status) {}

  long status; ///< HTTP status code of the failed response
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * Implementations return every response that carries an HTTP status,
   * successful or not; interpreting the status is the caller's job.
   *
   * @param url Absolute request URL.
   * @param headers Request headers expressed as `Header: value` strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransientNetworkError On transport failures.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note Requests are serialized on an internal mutex, so one instance may be
 *       shared between threads.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Request timeout in milliseconds.
   * @param user_agent Value of the `User-Agent` header.
   */
  explicit CurlHttpClient(long timeout_ms = 60000,
                          std::string user_agent = "workflowharvest");

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

private:
  CurlHandle curl_;
  long timeout_ms_;
  std::string user_agent_;
  std::mutex mutex_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_HTTP_CLIENT_HPP
