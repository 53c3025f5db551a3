#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "file_server/file_server.hpp"

namespace magenc {
namespace network {

// HTTP/1.1 listener over Boost.Beast. Each accepted connection becomes a
// session on its own strand. The IO threads only move bytes; requests are
// answered by the handler on a separate worker pool.
class HttpServer {
public:
  using Handler = std::function<file_server::Response(const file_server::Request&)>;

  static constexpr std::size_t WORKERS_PER_IO_THREAD = 4;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see port()
  HttpServer(const std::string& address, uint16_t port, std::size_t threads,
             std::size_t max_body, std::chrono::milliseconds timeout, Handler handler);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  uint16_t port() const { return port_; }
  const std::string& address() const { return address_; }
  bool is_running() const { return is_running_; }

private:

  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  uint16_t port_;
  const std::size_t thread_count_;
  const std::size_t worker_count_;
  const std::size_t max_body_;
  const std::chrono::milliseconds timeout_;

  // Server state
  std::vector<std::thread> io_threads_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  // Request handlers
  std::unique_ptr<boost::asio::thread_pool> workers_;

  Handler handler_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that hands each connection to a session
  void start_accept();
};

} // namespace network
} // namespace magenc
