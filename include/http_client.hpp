#ifndef GH_TOP_PROJECTS_HTTP_CLIENT_HPP
#define GH_TOP_PROJECTS_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <string>
#include <vector>

namespace ghtp {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers (`Name: value`)
  long status_code = 0;             ///< HTTP status code

  /// True for 2xx responses.
  bool ok() const { return status_code >= 200 && status_code < 300; }
};

/** Interface for performing HTTP GET requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request returning body, headers and status.
   *
   * Non-2xx statuses are not errors at this layer; they are returned to the
   * caller, which decides between partial results and defaults.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransientNetworkError On transport failures, including timeouts.
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

  /// Borrowed pointer to the CURL easy handle managed by the wrapper.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * Percent-encode a single query component with libcurl.
 *
 * @param value Raw component text.
 * @return Encoded text safe to place after `=` in a query string.
 */
std::string url_encode(const std::string &value);

/**
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; the tool issues one request at a
 *       time from a single thread.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Total timeout in milliseconds for each request.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   * @param user_agent Value sent in the `User-Agent` header, which GitHub
   *        requires on every request.
   */
  explicit CurlHttpClient(long timeout_ms = 10000, std::string http_proxy = {},
                          std::string https_proxy = {},
                          std::string user_agent = "gh-top-projects");

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url);
  CurlHandle curl_;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string user_agent_;
};

} // namespace ghtp

#endif // GH_TOP_PROJECTS_HTTP_CLIENT_HPP
