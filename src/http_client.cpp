/**
 * @file http_client.cpp
 * @brief libcurl transport used by the GitHub client.
 */

#include "http_client.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace wfh {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string{};
}

/**
 * Create a human readable error message for a failed CURL transfer.
 */
std::string format_curl_error(const std::string &url, CURLcode code,
                              const char *errbuf) {
  std::ostringstream oss;
  oss << "curl GET " << url << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  // A redirect or 100-continue starts a new header block; keep the last one.
  if (line.rfind("HTTP/", 0) == 0) {
    hdrs->clear();
  }
  if (!line.empty()) {
    hdrs->push_back(line);
  }
  return total;
}

} // namespace

std::optional<std::string> header_value(const HttpResponse &resp,
                                        const std::string &name) {
  const std::string wanted = to_lower_copy(name);
  std::optional<std::string> found;
  for (const auto &h : resp.headers) {
    auto colon = h.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (to_lower_copy(trim(h.substr(0, colon))) == wanted) {
      found = trim(h.substr(colon + 1));
    }
  }
  return found;
}

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  std::scoped_lock lock(mutex_);
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse out;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms_, 20000L));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(url, res, errbuf);
    http_log()->warn(msg);
    throw TransientNetworkError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status_code);
  http_log()->debug("GET {} -> {} ({} bytes)", url, out.status_code,
                    out.body.size());
  return out;
}

} // namespace wfh
