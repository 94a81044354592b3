#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "a2a/core/types.hpp"

namespace a2a::net {

// Parsed inbound request
struct HttpRequest {
  std::string method;
  std::string path;  // query string stripped
  std::string query;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;

  std::string header(const std::string& name) const;
};

// Response channel for one request. Either respond() once, or
// start_stream() followed by any number of write() calls.
class HttpExchange {
 public:
  virtual ~HttpExchange() = default;

  virtual void respond(int status, const std::string& content_type, const std::string& body) = 0;

  // Sends the status line and headers of an open-ended response
  virtual bool start_stream(const std::string& content_type) = 0;

  // Blocks until the chunk is flushed; false once the peer is gone
  virtual bool write(const std::string& chunk) = 0;

  virtual bool responded() const = 0;
};

using RequestHandler = std::function<void(const HttpRequest&, HttpExchange&)>;

struct HttpServerOptions {
  std::string host = "0.0.0.0";
  uint16_t port = 8000;  // 0 picks an ephemeral port
  size_t io_threads = 1;
  size_t handler_threads = 4;
  size_t max_body_bytes = 1024 * 1024;
  std::chrono::milliseconds read_timeout{30000};
};

// Minimal HTTP/1.1 server over ASIO. One request per connection
// (Connection: close). Socket I/O runs on the io threads, handlers run on a
// separate thread pool so a blocking handler never stalls the acceptor.
class HttpServer {
 public:
  HttpServer(HttpServerOptions options, RequestHandler handler);

  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts serving; returns the bound port
  Result<uint16_t> start();

  void stop();

  bool is_running() const;

  uint16_t port() const;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

std::string status_reason(int status);

}  // namespace a2a::net
