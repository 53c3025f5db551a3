#ifndef MAGENC_NETWORK_HTTP_CLIENT_HPP
#define MAGENC_NETWORK_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include "network/network_error.hpp"

namespace magenc {
namespace network {

using Headers = std::map<std::string, std::string>;

// Outcome of one request. Transport failures are reported through error,
// never thrown.
struct HttpResult {
  NetworkError error{NetworkError::SUCCESS};
  unsigned status{0};
  std::string body;
  Headers headers;    // names lowercased

  bool ok() const { return error == NetworkError::SUCCESS && status >= 200 && status < 300; }
  std::optional<std::string> header(const std::string& name) const;
  // One-line summary for logs and failure records
  std::string describe() const;
};

// Target of a Location header relative to the URL that returned it.
// Returns nullopt when the result is not an http(s) URL.
std::optional<std::string> resolve_redirect(const std::string& url, const std::string& location);

class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResult get(const std::string& url) = 0;
  virtual HttpResult head(const std::string& url) = 0;
  virtual HttpResult post(const std::string& url, const std::string& body,
                          const Headers& headers = {}) = 0;
};

// Blocking client over Boost.Beast. Each request gets its own io_context
// and connection; the whole exchange is bounded by the timeout. GET and HEAD
// follow up to MAX_REDIRECTS redirects within that same timeout.
class BeastHttpClient : public HttpClient {
public:
  static constexpr int MAX_REDIRECTS = 5;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeastHttpClient(std::chrono::milliseconds timeout, std::size_t max_body);
  ~BeastHttpClient() override = default;

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;


  // ---- REQUESTS ----
  HttpResult get(const std::string& url) override;
  HttpResult head(const std::string& url) override;
  HttpResult post(const std::string& url, const std::string& body,
                  const Headers& headers = {}) override;

private:
  using Clock = std::chrono::steady_clock;

  HttpResult perform(boost::beast::http::verb method, const std::string& url,
                     const std::string& body, const Headers& headers);
  // One request and response on a fresh connection, bounded by deadline
  HttpResult exchange_once(boost::beast::http::verb method, const std::string& url,
                           const std::string& body, const Headers& headers,
                           Clock::time_point deadline);

  // ---- PARAMETERS ----
  const std::chrono::milliseconds timeout_;
  const std::size_t max_body_;
  boost::asio::ssl::context tls_context_;
};

} // namespace network
} // namespace magenc

#endif // MAGENC_NETWORK_HTTP_CLIENT_HPP
