#ifndef GHVAULT_GITHUB_CLIENT_HPP
#define GHVAULT_GITHUB_CLIENT_HPP

#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ghv {

/**
 * Raised when the remote answered with a non-success HTTP status code.
 */
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status, const std::string &message)
      : std::runtime_error(message), status_(status) {}

  /// HTTP status code returned by the server.
  int status() const noexcept { return status_; }

private:
  int status_;
};

/**
 * Raised for transport level failures (DNS, TLS, timeouts) and for rate limit
 * windows that exceed the configured wait budget.
 */
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request returning both body and response headers.
   *
   * Responses with status 403 and 429 are returned to the caller so rate
   * limit headers can be inspected; other non-success codes throw.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws HttpStatusError On non-success HTTP status codes.
   * @throws TransientNetworkError On transport failures.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP GET request returning only the body.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) {
    return get_with_headers(url, headers).body;
  }

  /**
   * Perform a HTTP POST request.
   *
   * The base implementation throws to signal transports that are read-only.
   *
   * @throws HttpStatusError On non-success HTTP status codes.
   */
  virtual std::string post(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("POST not implemented");
  }

  /**
   * Perform a HTTP PATCH request.
   *
   * Subclasses overriding this method should issue a PATCH call with the
   * provided payload. The base implementation throws to signal unsupported
   * transports.
   */
  virtual std::string patch(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("PATCH not implemented");
  }
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
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; GitHubClient serializes access.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Request timeout in milliseconds.
   * @param download_limit Maximum download rate in bytes per second (0 =
   *        unlimited).
   * @param upload_limit Maximum upload rate in bytes per second (0 =
   *        unlimited).
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000,
                          curl_off_t download_limit = 0,
                          curl_off_t upload_limit = 0,
                          std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::patch()
  std::string patch(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  /// Total bytes downloaded so far.
  curl_off_t total_downloaded() const { return total_downloaded_; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

private:
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::string *data,
                       const std::vector<std::string> &headers);
  void apply_proxy(CURL *curl, const std::string &url);
  CurlHandle curl_;
  long timeout_ms_;
  curl_off_t download_limit_;
  curl_off_t upload_limit_;
  std::string http_proxy_;
  std::string https_proxy_;
  curl_off_t total_downloaded_{0};
};

/**
 * GitHub REST API client handling authentication, token rotation, request
 * pacing, pagination links and rate limit windows.
 *
 * Paths passed to the request helpers may be absolute URLs or paths relative
 * to the configured API base (e.g. `/repos/acme/widgets`).
 */
class GitHubClient {
public:
  /// One page of a paginated JSON listing.
  struct JsonPage {
    nlohmann::json items;  ///< Parsed page body
    std::string next_url;  ///< `rel="next"` link, empty on the last page
  };

  /// Snapshot of GitHub rate limit information for the authenticated token.
  struct RateLimitStatus {
    long limit{0};
    long remaining{0};
    long used{0};
    std::chrono::seconds reset_after{0};
  };

  /**
   * Construct a GitHub API client.
   *
   * @param tokens Personal access tokens used for authenticated requests. The
   *        client rotates through them when a rate limit window is hit.
   * @param http Optional HTTP client implementation. A default CURL-backed
   *        implementation is constructed when `nullptr` is supplied.
   * @param delay_ms Minimum delay between requests in milliseconds.
   * @param timeout_ms HTTP request timeout for the internally created client.
   * @param api_base Base URL for the GitHub API endpoints.
   * @param rate_limit_max_wait Longest rate limit window the client sleeps
   *        through before failing the request as a network error.
   */
  explicit GitHubClient(
      std::vector<std::string> tokens,
      std::unique_ptr<HttpClient> http = nullptr, int delay_ms = 0,
      int timeout_ms = 30000, std::string api_base = "https://api.github.com",
      std::chrono::seconds rate_limit_max_wait = std::chrono::seconds(60));

  /// Set minimum delay between HTTP requests in milliseconds.
  void set_delay_ms(int delay_ms);

  /// Base URL used for relative request paths.
  const std::string &api_base() const { return api_base_; }

  /// Token currently used for requests, empty when unauthenticated.
  std::string current_token() const;

  /**
   * GET a JSON document.
   *
   * @throws HttpStatusError On non-success HTTP status codes.
   * @throws TransientNetworkError On transport failures or exhausted rate
   *         limit waits.
   * @throws nlohmann::json::exception When the body is not valid JSON.
   */
  nlohmann::json get_json(const std::string &path);

  /**
   * GET one page of a listing, following the `Link` header for the next
   * page URL.
   */
  JsonPage get_page(const std::string &path);

  /// POST a JSON body and parse the JSON response.
  nlohmann::json post_json(const std::string &path,
                           const nlohmann::json &body);

  /// PATCH a JSON body and parse the JSON response.
  nlohmann::json patch_json(const std::string &path,
                            const nlohmann::json &body);

  /**
   * Retrieve the current GitHub rate limit status for the core REST resource.
   *
   * @param max_attempts Number of attempts to query `/rate_limit` before
   *        giving up (minimum of one).
   * @return Populated status snapshot when the endpoint succeeds;
   *         `std::nullopt` if the request fails or returns malformed data.
   */
  std::optional<RateLimitStatus> rate_limit_status(int max_attempts = 1);

  /// Extract the `rel="next"` URL from response headers.
  static std::string next_link(const std::vector<std::string> &headers);

private:
  mutable std::mutex state_mutex_;
  std::mutex http_mutex_;
  std::vector<std::string> tokens_;
  size_t token_index_{0};
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  int delay_ms_;
  std::chrono::steady_clock::time_point last_request_{};
  std::chrono::seconds rate_limit_max_wait_;

  std::string url_for(const std::string &path) const;
  std::vector<std::string> request_headers() const;
  void enforce_delay();
  HttpResponse get_locked(const std::string &url);
  std::optional<std::chrono::milliseconds>
  rate_limit_wait(const HttpResponse &resp) const;
  bool rotate_token();
};

} // namespace ghv

#endif // GHVAULT_GITHUB_CLIENT_HPP
