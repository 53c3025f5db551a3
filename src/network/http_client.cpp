#include "network/http_client.hpp"
#include <algorithm>
#include <cctype>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include "network/url.hpp"

namespace magenc {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

const char* USER_AGENT = "magenc/1.0";

enum class Stage {
  Resolve,
  Connect,
  Handshake,
  Transfer
};

struct Exchange {
  http::request<http::string_body> request;
  http::response_parser<http::string_body> parser;
  beast::flat_buffer buffer;
  Stage stage{Stage::Resolve};
  beast::error_code error;
  bool done{false};
};

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool is_redirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

NetworkError classify(const beast::error_code& ec, Stage stage) {
  if (ec == beast::error::timeout || ec == net::error::timed_out) {
    return NetworkError::TIMEOUT;
  }
  if (ec == http::error::body_limit) {
    return NetworkError::BODY_TOO_LARGE;
  }
  switch (stage) {
    case Stage::Resolve:   return NetworkError::RESOLVE_FAILED;
    case Stage::Connect:   return NetworkError::CONNECTION_FAILED;
    case Stage::Handshake: return NetworkError::TLS_HANDSHAKE_FAILED;
    case Stage::Transfer:  return NetworkError::TRANSFER_FAILED;
  }
  return NetworkError::UNKNOWN_ERROR;
}

// Writes the request then reads the response; completion is recorded in
// the exchange
template <class Stream>
void send_and_receive(Stream& stream, Exchange& exchange) {
  exchange.stage = Stage::Transfer;
  http::async_write(stream, exchange.request,
    [&stream, &exchange](beast::error_code ec, std::size_t) {
      if (ec) {
        exchange.error = ec;
        exchange.done = true;
        return;
      }
      http::async_read(stream, exchange.buffer, exchange.parser,
        [&exchange](beast::error_code ec, std::size_t) {
          // Servers that close TLS without close_notify after a complete
          // message are tolerated
          if (ec == ssl::error::stream_truncated && exchange.parser.is_done()) {
            ec = {};
          }
          exchange.error = ec;
          exchange.done = true;
        });
    });
}

} // namespace

//==============================================
// RESULT HELPERS
//==============================================

std::optional<std::string> HttpResult::header(const std::string& name) const {
  auto it = headers.find(lowercase(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string HttpResult::describe() const {
  if (error != NetworkError::SUCCESS) {
    return network_error_to_string(error);
  }
  return "HTTP " + std::to_string(status);
}


//==============================================
// CONSTRUCTOR
//==============================================

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds timeout, std::size_t max_body)
  : timeout_(timeout)
  , max_body_(max_body)
  , tls_context_(ssl::context::tls_client) {
  boost::system::error_code ec;
  tls_context_.set_default_verify_paths(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: Could not load default CA paths: " << ec.message();
  }
  tls_context_.set_verify_mode(ssl::verify_peer);
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Timeout " << timeout_.count() << " ms, body limit " << max_body_;
}


//==============================================
// REQUESTS
//==============================================

HttpResult BeastHttpClient::get(const std::string& url) {
  return perform(http::verb::get, url, "", {});
}

HttpResult BeastHttpClient::head(const std::string& url) {
  return perform(http::verb::head, url, "", {});
}

HttpResult BeastHttpClient::post(const std::string& url, const std::string& body,
                                 const Headers& headers) {
  return perform(http::verb::post, url, body, headers);
}

HttpResult BeastHttpClient::perform(http::verb method, const std::string& url,
                                    const std::string& body, const Headers& headers) {
  const auto deadline = Clock::now() + timeout_;
  std::string current = url;
  HttpResult result = exchange_once(method, current, body, headers, deadline);
  if (method == http::verb::post) {
    return result;
  }

  for (int hops = 0; result.error == NetworkError::SUCCESS && is_redirect(result.status); ++hops) {
    const auto location = result.header("location");
    if (!location) {
      return result;
    }
    const auto next = resolve_redirect(current, *location);
    if (!next) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP client: Not following redirect from " << current << " to " << *location;
      return result;
    }
    if (hops == MAX_REDIRECTS) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << url << " redirected more than " << MAX_REDIRECTS << " times";
      HttpResult exhausted;
      exhausted.error = NetworkError::TOO_MANY_REDIRECTS;
      return exhausted;
    }
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << current << " redirects to " << *next;
    current = *next;
    result = exchange_once(method, current, body, headers, deadline);
  }
  return result;
}

HttpResult BeastHttpClient::exchange_once(http::verb method, const std::string& url,
                                          const std::string& body, const Headers& headers,
                                          Clock::time_point deadline) {
  HttpResult result;

  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if (remaining <= std::chrono::milliseconds::zero()) {
    result.error = NetworkError::TIMEOUT;
    return result;
  }

  const auto parsed = Url::parse(url);
  if (!parsed) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: Refusing malformed URL " << url;
    result.error = NetworkError::INVALID_URL;
    return result;
  }

  net::io_context io_context;
  Exchange exchange;

  exchange.request.method(method);
  exchange.request.target(parsed->target);
  exchange.request.version(11);
  exchange.request.set(http::field::host, parsed->authority());
  exchange.request.set(http::field::user_agent, USER_AGENT);
  for (const auto& [name, value] : headers) {
    exchange.request.set(name, value);
  }
  if (method == http::verb::post) {
    exchange.request.set(http::field::content_type, "application/octet-stream");
    exchange.request.body() = body;
    exchange.request.prepare_payload();
  }
  exchange.parser.body_limit(max_body_);
  if (method == http::verb::head) {
    exchange.parser.skip(true);
  }

  tcp::resolver resolver(io_context);
  beast::tcp_stream plain(io_context);
  beast::ssl_stream<beast::tcp_stream> secure(io_context, tls_context_);
  const bool tls = parsed->is_tls();

  if (tls) {
    if (!SSL_set_tlsext_host_name(secure.native_handle(), parsed->host.c_str())) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP client: Could not set SNI for " << parsed->host;
      result.error = NetworkError::TLS_HANDSHAKE_FAILED;
      return result;
    }
    secure.set_verify_callback(ssl::host_name_verification(parsed->host));
  }

  beast::tcp_stream& lowest = tls ? beast::get_lowest_layer(secure) : plain;
  auto fail = [&exchange](beast::error_code ec) {
    exchange.error = ec;
    exchange.done = true;
  };

  // The deadline covers connect, handshake and transfer
  lowest.expires_after(remaining);

  resolver.async_resolve(parsed->host, std::to_string(parsed->port),
    [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
      if (ec) {
        return fail(ec);
      }
      exchange.stage = Stage::Connect;
      lowest.async_connect(endpoints,
        [&](beast::error_code ec, const tcp::endpoint&) {
          if (ec) {
            return fail(ec);
          }
          if (!tls) {
            return send_and_receive(plain, exchange);
          }
          exchange.stage = Stage::Handshake;
          secure.async_handshake(ssl::stream_base::client,
            [&](beast::error_code ec) {
              if (ec) {
                return fail(ec);
              }
              send_and_receive(secure, exchange);
            });
        });
    });

  io_context.run_for(remaining);

  if (!exchange.done) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << method << " " << url << " timed out";
    result.error = NetworkError::TIMEOUT;
    return result;
  }

  if (exchange.error) {
    result.error = classify(exchange.error, exchange.stage);
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << method << " " << url << " failed: "
                             << exchange.error.message();
    return result;
  }

  auto& response = exchange.parser.get();
  result.status = response.result_int();
  result.body = std::move(response.body());
  for (const auto& field : response) {
    const auto name = field.name_string();
    const auto value = field.value();
    result.headers[lowercase(std::string(name.data(), name.size()))] =
      std::string(value.data(), value.size());
  }

  if (!tls) {
    beast::error_code ignored;
    plain.socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << method << " " << url << " -> " << result.status
                           << " (" << result.body.size() << " bytes)";
  return result;
}

std::optional<std::string> resolve_redirect(const std::string& url, const std::string& location) {
  const auto base = Url::parse(url);
  if (!base || location.empty()) {
    return std::nullopt;
  }

  std::string target;
  if (location.find("://") != std::string::npos) {
    target = location;
  } else if (location.compare(0, 2, "//") == 0) {
    target = base->scheme + ":" + location;
  } else if (location[0] == '/') {
    target = base->origin() + location;
  } else {
    // Relative to the directory of the current path
    std::string path = base->target.substr(0, base->target.find_first_of("?#"));
    path = path.substr(0, path.rfind('/') + 1);
    target = base->origin() + path + location;
  }

  const auto parsed = Url::parse(target);
  if (!parsed) {
    return std::nullopt;
  }
  return parsed->to_string();
}

} // namespace network
} // namespace magenc
