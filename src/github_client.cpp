/**
 * @file github_client.cpp
 * @brief Implementation of the GitHub REST client and HTTP transport.
 *
 * Contains the CURL-based HTTP transport and the GitHubClient request loop
 * with token rotation, request pacing and rate limit handling.
 */

#include "github_client.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <thread>

namespace ghv {

namespace {

/// Upper bound on consecutive rate limit sleeps for a single request.
constexpr int kMaxRateLimitWaits = 3;

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/// Case-insensitive header prefix match returning the trimmed value.
std::optional<std::string> header_value(const std::string &line,
                                        const std::string &name) {
  if (line.size() <= name.size() || line[name.size()] != ':') {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < name.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(line[i])) !=
        std::tolower(static_cast<unsigned char>(name[i]))) {
      return std::nullopt;
    }
  }
  std::string value = line.substr(name.size() + 1);
  auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string{};
  }
  auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<long> header_number(const std::vector<std::string> &headers,
                                  const std::string &name) {
  for (const auto &h : headers) {
    auto value = header_value(h, name);
    if (!value) {
      continue;
    }
    try {
      return std::stol(*value);
    } catch (const std::exception &) {
      github_client_log()->debug("Ignoring malformed {} header '{}'", name,
                                 *value);
      return std::nullopt;
    }
  }
  return std::nullopt;
}

nlohmann::json parse_body(const std::string &body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  return nlohmann::json::parse(body);
}

} // namespace

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

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, curl_off_t download_limit,
                               curl_off_t upload_limit, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), download_limit_(download_limit),
      upload_limit_(upload_limit), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

/**
 * libcurl write callback capturing response bodies into a string.
 */
static size_t write_callback(void *contents, size_t size, size_t nmemb,
                             void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * libcurl header callback collecting response headers.
 */
static size_t header_callback(char *buffer, size_t size, size_t nitems,
                              void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  hdrs->push_back(line);
  return total;
}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    proxy = !https_proxy_.empty()  ? &https_proxy_
            : !http_proxy_.empty() ? &http_proxy_
                                   : nullptr;
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
    curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 0L);
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

/**
 * Shared request routine for all verbs. @p data is sent as the request body
 * when non-null.
 */
HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::string *data,
                                     const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  HttpResponse out;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  if (data != nullptr) {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(data->size()));
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  if (download_limit_ > 0)
    curl_easy_setopt(curl, CURLOPT_MAX_RECV_SPEED_LARGE, download_limit_);
  if (upload_limit_ > 0)
    curl_easy_setopt(curl, CURLOPT_MAX_SEND_SPEED_LARGE, upload_limit_);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: ghvault");
  if (data != nullptr) {
    header_list.append("Content-Type: application/json");
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status_code);
  curl_off_t dl = 0;
  curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &dl);
  total_downloaded_ += dl;
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    github_client_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  return out;
}

HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  HttpResponse res = perform("GET", url, nullptr, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    if (res.status_code == 403 || res.status_code == 429) {
      // Let caller handle rate limiting
      return res;
    }
    github_client_log()->error("curl GET {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "curl GET failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res;
}

std::string CurlHttpClient::post(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  HttpResponse res = perform("POST", url, &data, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    github_client_log()->error("curl POST {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "curl POST failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res.body;
}

std::string CurlHttpClient::patch(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  HttpResponse res = perform("PATCH", url, &data, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    github_client_log()->error("curl PATCH {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "curl PATCH failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res.body;
}

GitHubClient::GitHubClient(std::vector<std::string> tokens,
                           std::unique_ptr<HttpClient> http, int delay_ms,
                           int timeout_ms, std::string api_base,
                           std::chrono::seconds rate_limit_max_wait)
    : tokens_(std::move(tokens)),
      http_(http ? std::move(http)
                 : std::make_unique<CurlHttpClient>(timeout_ms)),
      api_base_(std::move(api_base)), delay_ms_(delay_ms),
      rate_limit_max_wait_(rate_limit_max_wait) {
  ensure_default_logger();
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

void GitHubClient::set_delay_ms(int delay_ms) {
  std::scoped_lock lock(state_mutex_);
  delay_ms_ = delay_ms;
}

std::string GitHubClient::current_token() const {
  std::scoped_lock lock(state_mutex_);
  return tokens_.empty() ? std::string{} : tokens_[token_index_];
}

std::string GitHubClient::url_for(const std::string &path) const {
  if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
    return path;
  }
  if (!path.empty() && path.front() != '/') {
    return api_base_ + "/" + path;
  }
  return api_base_ + path;
}

std::vector<std::string> GitHubClient::request_headers() const {
  std::vector<std::string> headers;
  {
    std::scoped_lock lock(state_mutex_);
    if (!tokens_.empty()) {
      headers.push_back("Authorization: token " + tokens_[token_index_]);
    }
  }
  headers.push_back("Accept: application/vnd.github+json");
  return headers;
}

/**
 * Ensure the minimum delay between successive HTTP requests is respected.
 */
void GitHubClient::enforce_delay() {
  std::chrono::steady_clock::time_point last;
  int delay_ms;
  {
    std::scoped_lock lock(state_mutex_);
    last = last_request_;
    delay_ms = delay_ms_;
  }
  if (delay_ms > 0) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - last)
                       .count();
    if (elapsed < delay_ms) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms - elapsed));
    }
  }
  std::scoped_lock lock(state_mutex_);
  last_request_ = std::chrono::steady_clock::now();
}

/**
 * Decide whether a 403/429 response signals an exhausted rate limit window
 * and, if so, how long to wait. A 403 without rate limit headers is a
 * permission failure and yields `std::nullopt`.
 */
std::optional<std::chrono::milliseconds>
GitHubClient::rate_limit_wait(const HttpResponse &resp) const {
  auto remaining = header_number(resp.headers, "X-RateLimit-Remaining");
  auto reset = header_number(resp.headers, "X-RateLimit-Reset");
  auto retry_after = header_number(resp.headers, "Retry-After");
  bool limited = resp.status_code == 429 || (remaining && *remaining == 0) ||
                 retry_after.has_value();
  if (!limited) {
    return std::nullopt;
  }
  if (retry_after) {
    return std::chrono::seconds(std::max(0L, *retry_after));
  }
  if (reset && *reset > 0) {
    auto reset_time =
        std::chrono::system_clock::time_point(std::chrono::seconds(*reset));
    auto now = std::chrono::system_clock::now();
    if (reset_time > now) {
      return std::chrono::duration_cast<std::chrono::milliseconds>(reset_time -
                                                                   now);
    }
  }
  return std::chrono::milliseconds(0);
}

bool GitHubClient::rotate_token() {
  std::scoped_lock lock(state_mutex_);
  if (tokens_.size() < 2) {
    return false;
  }
  token_index_ = (token_index_ + 1) % tokens_.size();
  github_client_log()->warn(
      "Rate limit hit, switching to next token (index {})", token_index_);
  return true;
}

HttpResponse GitHubClient::get_locked(const std::string &url) {
  std::size_t rotations = 0;
  int waits = 0;
  while (true) {
    enforce_delay();
    HttpResponse res = http_->get_with_headers(url, request_headers());
    if (res.status_code >= 200 && res.status_code < 300) {
      return res;
    }
    if (res.status_code != 403 && res.status_code != 429) {
      throw HttpStatusError(static_cast<int>(res.status_code),
                            "GET " + url + " failed with HTTP code " +
                                std::to_string(res.status_code));
    }
    auto wait = rate_limit_wait(res);
    if (!wait) {
      github_client_log()->warn("GET {} forbidden", url);
      throw HttpStatusError(static_cast<int>(res.status_code),
                            "GET " + url + " forbidden (HTTP " +
                                std::to_string(res.status_code) + ")");
    }
    if (rotations + 1 < tokens_.size() && rotate_token()) {
      ++rotations;
      continue;
    }
    if (*wait > rate_limit_max_wait_ || waits >= kMaxRateLimitWaits) {
      throw TransientNetworkError("Rate limit exhausted for " + url);
    }
    github_client_log()->warn("Rate limit reached, waiting {} ms",
                              wait->count());
    std::this_thread::sleep_for(*wait);
    ++waits;
    rotations = 0;
  }
}

nlohmann::json GitHubClient::get_json(const std::string &path) {
  std::string url = url_for(path);
  github_client_log()->debug("GET {}", url);
  std::scoped_lock lock(http_mutex_);
  return parse_body(get_locked(url).body);
}

GitHubClient::JsonPage GitHubClient::get_page(const std::string &path) {
  std::string url = url_for(path);
  github_client_log()->debug("GET page {}", url);
  std::scoped_lock lock(http_mutex_);
  HttpResponse res = get_locked(url);
  return {parse_body(res.body), next_link(res.headers)};
}

nlohmann::json GitHubClient::post_json(const std::string &path,
                                       const nlohmann::json &body) {
  std::string url = url_for(path);
  github_client_log()->debug("POST {}", url);
  std::scoped_lock lock(http_mutex_);
  enforce_delay();
  return parse_body(http_->post(url, body.dump(), request_headers()));
}

nlohmann::json GitHubClient::patch_json(const std::string &path,
                                        const nlohmann::json &body) {
  std::string url = url_for(path);
  github_client_log()->debug("PATCH {}", url);
  std::scoped_lock lock(http_mutex_);
  enforce_delay();
  return parse_body(http_->patch(url, body.dump(), request_headers()));
}

std::string GitHubClient::next_link(const std::vector<std::string> &headers) {
  for (const auto &h : headers) {
    auto links = header_value(h, "Link");
    if (!links) {
      continue;
    }
    std::stringstream ss(*links);
    std::string part;
    while (std::getline(ss, part, ',')) {
      if (part.find("rel=\"next\"") == std::string::npos) {
        continue;
      }
      auto start = part.find('<');
      auto end = part.find('>', start);
      if (start != std::string::npos && end != std::string::npos) {
        return part.substr(start + 1, end - start - 1);
      }
    }
  }
  return {};
}

std::optional<GitHubClient::RateLimitStatus>
GitHubClient::rate_limit_status(int max_attempts) {
  std::string url = url_for("/rate_limit");
  int attempts = std::max(1, max_attempts);
  for (int attempt = 0; attempt < attempts; ++attempt) {
    nlohmann::json j;
    try {
      std::scoped_lock lock(http_mutex_);
      j = parse_body(get_locked(url).body);
    } catch (const std::exception &e) {
      github_client_log()->warn("Failed to query rate limit: {}", e.what());
      continue;
    }
    const nlohmann::json *core = nullptr;
    if (j.contains("resources") && j["resources"].is_object() &&
        j["resources"].contains("core") && j["resources"]["core"].is_object()) {
      core = &j["resources"]["core"];
    }
    if (!core && j.contains("rate") && j["rate"].is_object()) {
      core = &j["rate"];
    }
    if (!core) {
      github_client_log()->warn("Unexpected rate limit payload");
      return std::nullopt;
    }
    RateLimitStatus status;
    status.limit = core->value("limit", 0L);
    status.remaining = core->value("remaining", 0L);
    status.used = core->value("used", status.limit - status.remaining);
    long reset_epoch = core->value("reset", 0L);
    if (reset_epoch > 0) {
      auto now = std::chrono::system_clock::now();
      auto reset_time = std::chrono::system_clock::time_point(
          std::chrono::seconds(reset_epoch));
      if (reset_time > now) {
        status.reset_after =
            std::chrono::duration_cast<std::chrono::seconds>(reset_time - now);
      }
    }
    return status;
  }
  return std::nullopt;
}

} // namespace ghv
