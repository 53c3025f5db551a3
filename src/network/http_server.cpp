#include "network/http_server.hpp"
#include <algorithm>
#include <cctype>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace magenc {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

const char* SERVER_NAME = "magenc";

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// One connection. Reads requests until the peer closes or asks to close.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, const HttpServer::Handler& handler, net::thread_pool& workers,
              std::size_t max_body, std::chrono::milliseconds timeout)
    : remote_host_(remote_host_of(socket))
    , stream_(std::move(socket))
    , handler_(handler)
    , workers_(workers)
    , max_body_(max_body)
    , timeout_(timeout) {}

  void run() {
    net::dispatch(stream_.get_executor(),
                  [self = shared_from_this()]() { self->do_read(); });
  }

private:
  static std::string remote_host_of(const tcp::socket& socket) {
    beast::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    return ec ? std::string() : endpoint.address().to_string();
  }

  void do_read() {
    parser_.emplace();
    parser_->body_limit(max_body_);
    stream_.expires_after(timeout_);
    http::async_read(stream_, buffer_, *parser_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->on_read(ec);
      });
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::end_of_stream) {
      return do_close();
    }
    if (ec == http::error::body_limit) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Request body from " << remote_host_
                                 << " exceeds " << max_body_ << " bytes";
      http::response<http::string_body> response{http::status::payload_too_large, 11};
      response.set(http::field::server, SERVER_NAME);
      response.set(http::field::content_type, "text/plain; charset=utf-8");
      response.body() = "Request body too large\n";
      response.keep_alive(false);
      response.prepare_payload();
      return send(std::move(response));
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read from " << remote_host_ << " ended: " << ec.message();
      return;
    }

    auto& message = parser_->get();
    file_server::Request request;
    request.method = std::string(message.method_string().data(), message.method_string().size());
    request.target = std::string(message.target().data(), message.target().size());
    request.body = std::move(message.body());
    request.remote_host = remote_host_;
    for (const auto& field : message) {
      const auto name = field.name_string();
      const auto value = field.value();
      request.headers[lowercase(std::string(name.data(), name.size()))] =
        std::string(value.data(), value.size());
    }

    const unsigned version = message.version();
    const bool keep_alive = message.keep_alive();

    // The IO threads never wait on a handler
    net::post(workers_, [self = shared_from_this(), request = std::move(request), version, keep_alive]() {
      file_server::Response answer = self->invoke_handler(request);
      BOOST_LOG_TRIVIAL(info) << "HTTP server: " << self->remote_host_ << " " << request.method << " "
                              << request.target << " -> " << answer.status;
      net::post(self->stream_.get_executor(),
                [self, answer = std::move(answer), version, keep_alive]() mutable {
                  self->respond(std::move(answer), version, keep_alive);
                });
    });
  }

  file_server::Response invoke_handler(const file_server::Request& request) const {
    try {
      return handler_(request);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Handler failed for " << request.method << " "
                               << request.target << ": " << e.what();
      return file_server::make_error(500, "Internal server error");
    }
  }

  void respond(file_server::Response answer, unsigned version, bool keep_alive) {
    if (answer.content_length) {
      http::response<http::empty_body> response{static_cast<http::status>(answer.status), version};
      response.set(http::field::server, SERVER_NAME);
      for (const auto& [name, value] : answer.headers) {
        response.set(name, value);
      }
      response.content_length(*answer.content_length);
      response.keep_alive(keep_alive);
      return send(std::move(response));
    }

    http::response<http::string_body> response{static_cast<http::status>(answer.status), version};
    response.set(http::field::server, SERVER_NAME);
    for (const auto& [name, value] : answer.headers) {
      response.set(name, value);
    }
    response.body() = std::move(answer.body);
    response.keep_alive(keep_alive);
    response.prepare_payload();
    send(std::move(response));
  }

  template <class Body>
  void send(http::response<Body>&& message) {
    auto response = std::make_shared<http::response<Body>>(std::move(message));
    response_ = response;
    stream_.expires_after(timeout_);
    http::async_write(stream_, *response,
      [self = shared_from_this(), close = response->need_eof()](beast::error_code ec, std::size_t) {
        self->on_write(ec, close);
      });
  }

  void on_write(beast::error_code ec, bool close) {
    response_.reset();
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write to " << remote_host_ << " failed: " << ec.message();
      return;
    }
    if (close) {
      return do_close();
    }
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  const std::string remote_host_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<void> response_;
  const HttpServer::Handler& handler_;
  net::thread_pool& workers_;
  const std::size_t max_body_;
  const std::chrono::milliseconds timeout_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, std::size_t threads,
                       std::size_t max_body, std::chrono::milliseconds timeout, Handler handler)
  : address_(address)
  , port_(port)
  , thread_count_(threads > 0 ? threads : 1)
  , worker_count_(thread_count_ * WORKERS_PER_IO_THREAD)
  , max_body_(max_body)
  , timeout_(timeout)
  , is_running_(false)
  , handler_(std::move(handler)) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing on " << address << ":" << port
                          << " with " << thread_count_ << " IO thread(s) and "
                          << worker_count_ << " handler thread(s)";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    // A previous shutdown leaves the context stopped
    io_context_.restart();
    tcp::endpoint endpoint(net::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, endpoint);
    port_ = acceptor_->local_endpoint().port();

    workers_ = std::make_unique<net::thread_pool>(worker_count_);
    is_running_ = true;
    work_.emplace(net::make_work_guard(io_context_));

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    for (std::size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_.run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    acceptor_.reset();
    workers_.reset();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(net::make_strand(io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!error) {
        std::make_shared<HttpSession>(std::move(socket), handler_, *workers_, max_body_, timeout_)->run();
      } else if (error != net::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Let running handlers finish while the IO threads can still deliver their answers
  if (workers_) {
    workers_->join();
    workers_.reset();
  }

  work_.reset();
  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

} // namespace network
} // namespace magenc
