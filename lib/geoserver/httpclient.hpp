/**
 * @file httpclient.hpp
 * @brief Minimal blocking HTTP client on top of libcurl
 */

#ifndef HTTPCLIENT_HPP
#define HTTPCLIENT_HPP

#include <string>

/**
 * @struct HttpResponse
 * @brief Status, body and transport error of one request
 *
 * @ref error is set only when no HTTP response was received at all
 * (DNS failure, refused connection, timeout).
 */
struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error;
  long latency_ms = 0;

  bool ok() const { return error.empty() && status >= 200 && status < 300; }

  /** @brief Operator-facing description of a failed request */
  std::string describe(const std::string &what) const;
};

/**
 * @class CurlGlobal
 * @brief RAII guard for curl_global_init / curl_global_cleanup
 *
 * Create exactly one instance in main() before any thread issues requests.
 */
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal &) = delete;
  CurlGlobal &operator=(const CurlGlobal &) = delete;

  bool ok() const { return m_ok; }

private:
  bool m_ok = false;
};

/**
 * @class HttpClient
 * @brief Issues requests with HTTP basic authentication
 *
 * Each request uses its own curl easy handle, so one HttpClient can be
 * shared by concurrent background tasks.
 */
class HttpClient {
private:
  std::string m_username;
  std::string m_password;
  long m_timeout_ms;

public:
  HttpClient(std::string username, std::string password,
             long timeout_ms = 30000)
      : m_username(std::move(username)), m_password(std::move(password)),
        m_timeout_ms(timeout_ms) {}

  HttpResponse request(const std::string &method, const std::string &url,
                       const std::string &body = "",
                       const std::string &content_type = "",
                       const std::string &accept = "application/json") const;

  /** @brief PUTs the raw bytes of @p path as the request body */
  HttpResponse putFile(const std::string &url, const std::string &path,
                       const std::string &content_type) const;

  /** @brief Percent-encodes one path segment or query value */
  static std::string escape(const std::string &value);
};

#endif // HTTPCLIENT_HPP
