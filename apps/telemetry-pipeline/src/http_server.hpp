#ifndef TELEMETRY_PIPELINE_HTTP_SERVER_HPP
#define TELEMETRY_PIPELINE_HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "gateway.hpp"

namespace telemetry {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

struct HttpServerConfig {
  std::string address = "0.0.0.0";
  unsigned short port = 8080;
  std::string path = "/events";
  std::size_t max_body_bytes = 10 * 1024 * 1024;
  // Upper bound on the time a connection may spend on one request, idle
  // keep-alive time included.
  std::chrono::milliseconds read_timeout{30000};
  std::size_t max_sessions = 256;
};

// Maps one request to a response: POST <path> submits to the gateway, /health
// always answers ok.
HttpResponse routeRequest(const HttpServerConfig& config, IngestionGateway& gateway, const HttpRequest& request);

// Blocking accept loop on its own thread, one thread per connection.
class HttpServer {
 public:
  HttpServer(HttpServerConfig config, IngestionGateway& gateway);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  bool start(std::string& error);
  // Stops accepting, interrupts open connections and waits for their threads.
  void stop();

  // Port actually bound; differs from the configured one when that was 0.
  unsigned short port() const { return bound_port_; }

 private:
  void acceptLoop();
  // Takes ownership of the socket.
  void session(std::unique_ptr<boost::asio::ip::tcp::socket> socket);
  void serve(boost::asio::ip::tcp::socket& socket, int fd);
  void expireIdleSessions();
  bool registerSession(int fd);
  void unregisterSession(int fd);
  void touchSession(int fd);

  HttpServerConfig config_;
  IngestionGateway& gateway_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::mutex sessions_mutex_;
  std::condition_variable sessions_done_;
  // native handle -> read deadline
  std::map<int, std::chrono::steady_clock::time_point> sessions_;
  unsigned short bound_port_ = 0;
};

} // namespace telemetry

#endif
