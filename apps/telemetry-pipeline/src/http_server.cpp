#include "http_server.hpp"

#include <sys/socket.h>

#include <exception>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>

#include "log.hpp"

namespace telemetry {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kComponent = "http";
constexpr const char* kServerName = "telemetry-pipeline";
constexpr const char* kHealthPath = "/health";

HttpResponse makeResponse(const HttpRequest& request, http::status status, const char* content_type, std::string body) {
  HttpResponse response{status, request.version()};
  response.set(http::field::server, kServerName);
  response.set(http::field::content_type, content_type);
  response.set("X-Content-Type-Options", "nosniff");
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

HttpResponse textResponse(const HttpRequest& request, http::status status, const std::string& message) {
  return makeResponse(request, status, "text/plain; charset=utf-8", message + "\n");
}

HttpResponse jsonResponse(const HttpRequest& request, http::status status, std::string body) {
  return makeResponse(request, status, "application/json", std::move(body));
}

std::string requestPath(const HttpRequest& request) {
  const auto target = request.target();
  std::string path(target.data(), target.size());
  const auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }
  return path;
}

http::status statusFor(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::kAccepted:
      return http::status::accepted;
    case SubmitStatus::kMalformedInput:
      return http::status::bad_request;
    case SubmitStatus::kBatchTooLarge:
      return http::status::payload_too_large;
    case SubmitStatus::kQueueFull:
    case SubmitStatus::kShuttingDown:
      return http::status::service_unavailable;
  }
  return http::status::internal_server_error;
}

} // namespace

HttpResponse routeRequest(const HttpServerConfig& config, IngestionGateway& gateway, const HttpRequest& request) {
  const std::string path = requestPath(request);

  if (path == kHealthPath) {
    return jsonResponse(request, http::status::ok, "{\"status\":\"ok\"}");
  }
  if (path != config.path) {
    return textResponse(request, http::status::not_found, "Not found");
  }
  if (request.method() != http::verb::post) {
    HttpResponse response = textResponse(request, http::status::method_not_allowed, "Method not allowed");
    response.set(http::field::allow, "POST");
    return response;
  }

  const SubmissionResult result = gateway.submit(request.body());
  if (result.status != SubmitStatus::kAccepted) {
    return textResponse(request, statusFor(result.status), result.error);
  }

  std::ostringstream body;
  body << "{\"status\":\"accepted\",\"count\":" << result.accepted << ",\"received\":\"" << rfc3339Now() << "\"}";
  return jsonResponse(request, http::status::accepted, body.str());
}

HttpServer::HttpServer(HttpServerConfig config, IngestionGateway& gateway)
    : config_(std::move(config)), gateway_(gateway), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
  stop();
}

bool HttpServer::start(std::string& error) {
  beast::error_code ec;
  const auto address = asio::ip::make_address(config_.address, ec);
  if (ec) {
    error = "invalid listen address '" + config_.address + "': " + ec.message();
    return false;
  }

  const tcp::endpoint endpoint(address, config_.port);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (!ec) {
    acceptor_.non_blocking(true, ec);
  }
  if (ec) {
    error = "failed to listen on " + config_.address + ":" + std::to_string(config_.port) + ": " + ec.message();
    beast::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }

  bound_port_ = acceptor_.local_endpoint(ec).port();
  running_.store(true);
  accept_thread_ = std::thread(&HttpServer::acceptLoop, this);
  logInfo(kComponent) << "Listening on " << config_.address << ":" << bound_port_ << config_.path;
  return true;
}

void HttpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  beast::error_code ec;
  acceptor_.close(ec);

  std::unique_lock<std::mutex> lock(sessions_mutex_);
  for (const auto& entry : sessions_) {
    ::shutdown(entry.first, SHUT_RDWR);
  }
  sessions_done_.wait(lock, [this]() { return sessions_.empty(); });
  logInfo(kComponent) << "Server stopped";
}

void HttpServer::acceptLoop() {
  while (running_.load()) {
    expireIdleSessions();

    tcp::socket socket(ioc_);
    beast::error_code ec;
    acceptor_.accept(socket, ec);

    if (ec == asio::error::would_block || ec == asio::error::try_again) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }
    if (ec) {
      logWarn(kComponent) << "Accept failed: " << ec.message();
      continue;
    }

    const int fd = socket.native_handle();
    if (!registerSession(fd)) {
      logWarn(kComponent) << "Connection limit " << config_.max_sessions << " reached, refusing client";
      socket.shutdown(tcp::socket::shutdown_both, ec);
      continue;
    }
    try {
      std::thread(&HttpServer::session, this, std::make_unique<tcp::socket>(std::move(socket))).detach();
    } catch (const std::system_error& e) {
      // The socket was handed to the failed thread and is already closed.
      logWarn(kComponent) << "Failed to start session thread: " << e.what();
      unregisterSession(fd);
    }
  }
}

void HttpServer::session(std::unique_ptr<tcp::socket> socket) {
  const int fd = socket->native_handle();

  try {
    serve(*socket, fd);
  } catch (const std::exception& e) {
    logError(kComponent) << "Session failed: " << e.what();
  }

  beast::error_code ec;
  socket->shutdown(tcp::socket::shutdown_send, ec);

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  // Closed while registered so the descriptor cannot be handed to a new
  // connection before its entry is gone.
  socket.reset();
  sessions_.erase(fd);
  sessions_done_.notify_all();
}

void HttpServer::serve(tcp::socket& socket, int fd) {
  beast::flat_buffer buffer;
  beast::error_code ec;

  while (running_.load()) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(config_.max_body_bytes);
    http::read(socket, buffer, parser, ec);

    if (ec == http::error::body_limit) {
      HttpRequest head;
      head.version(parser.get().version());
      HttpResponse response = textResponse(
        head,
        http::status::payload_too_large,
        "Request body exceeds " + std::to_string(config_.max_body_bytes) + " bytes"
      );
      response.keep_alive(false);
      http::write(socket, response, ec);
      return;
    }
    if (ec) {
      if (ec != http::error::end_of_stream && ec != asio::error::connection_reset) {
        logDebug(kComponent) << "Connection closed: " << ec.message();
      }
      return;
    }

    HttpRequest request = parser.release();
    HttpResponse response = routeRequest(config_, gateway_, request);
    response.keep_alive(request.keep_alive() && running_.load());
    http::write(socket, response, ec);
    if (ec || !response.keep_alive()) {
      return;
    }
    touchSession(fd);
  }
}

void HttpServer::expireIdleSessions() {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  for (auto& entry : sessions_) {
    if (entry.second <= now) {
      // The blocked read returns end of stream and the session thread exits.
      ::shutdown(entry.first, SHUT_RDWR);
      entry.second = std::chrono::steady_clock::time_point::max();
    }
  }
}

bool HttpServer::registerSession(int fd) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (config_.max_sessions > 0 && sessions_.size() >= config_.max_sessions) {
    return false;
  }
  sessions_[fd] = std::chrono::steady_clock::now() + config_.read_timeout;
  return true;
}

void HttpServer::unregisterSession(int fd) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(fd);
  sessions_done_.notify_all();
}

void HttpServer::touchSession(int fd) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(fd);
  if (it != sessions_.end() && it->second != std::chrono::steady_clock::time_point::max()) {
    it->second = std::chrono::steady_clock::now() + config_.read_timeout;
  }
}

} // namespace telemetry
