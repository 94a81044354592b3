#include "a2a/net/http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

namespace a2a::net {

namespace {

// Request line and header block are capped separately from the body
constexpr size_t kMaxHeaderBytes = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool parse_request_head(const std::string& head, HttpRequest& request) {
  std::istringstream stream(head);
  std::string request_line;
  if (!std::getline(stream, request_line)) return false;

  std::istringstream parts(trim(request_line));
  std::string target, version;
  if (!(parts >> request.method >> target >> version)) return false;
  if (!version.starts_with("HTTP/")) return false;

  auto q = target.find('?');
  request.path = target.substr(0, q);
  request.query = q == std::string::npos ? "" : target.substr(q + 1);

  std::string line;
  while (std::getline(stream, line)) {
    line = trim(line);
    if (line.empty()) break;
    auto colon = line.find(':');
    if (colon == std::string::npos) return false;
    request.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return true;
}

// The socket is bound to a strand, so the read timer and the read handlers
// never run concurrently. Once dispatched the socket belongs to the handler
// pool and the timer no longer touches it.
class Session : public HttpExchange, public std::enable_shared_from_this<Session> {
 public:
  Session(asio::ip::tcp::socket socket, const HttpServerOptions& options, asio::thread_pool& pool, const RequestHandler& handler)
      : socket_(std::move(socket)),
        options_(options),
        pool_(pool),
        handler_(handler),
        buffer_(kMaxHeaderBytes + options.max_body_bytes),
        timer_(socket_.get_executor()) {}

  void start() {
    timer_.expires_after(options_.read_timeout);
    timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
      if (!ec && !self->dispatched_) {
        spdlog::debug("[HttpServer] Read timeout, closing connection");
        self->close();
      }
    });
    read_head();
  }

  void respond(int status, const std::string& content_type, const std::string& body) override {
    if (responded_) return;
    responded_ = true;

    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Content-Length: " << body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << body;
    send(out.str());
  }

  bool start_stream(const std::string& content_type) override {
    if (responded_) return false;
    responded_ = true;

    std::ostringstream out;
    out << "HTTP/1.1 200 OK\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Cache-Control: no-cache\r\n";
    out << "Connection: close\r\n\r\n";
    return send(out.str());
  }

  bool write(const std::string& chunk) override {
    return send(chunk);
  }

  bool responded() const override {
    return responded_;
  }

 private:
  void read_head() {
    asio::async_read_until(socket_, buffer_, "\r\n\r\n", [self = shared_from_this()](const asio::error_code& ec, size_t head_bytes) {
      if (ec) {
        // Incomplete header block: nothing to answer
        spdlog::debug("[HttpServer] Connection closed before headers: {}", ec.message());
        self->close();
        return;
      }

      std::string head(asio::buffers_begin(self->buffer_.data()), asio::buffers_begin(self->buffer_.data()) + head_bytes);
      self->buffer_.consume(head_bytes);

      if (!parse_request_head(head, self->request_)) {
        self->finish_early(400, "Malformed request");
        return;
      }

      size_t length = 0;
      auto cl = self->request_.header("content-length");
      if (!cl.empty()) {
        try {
          length = std::stoull(cl);
        } catch (const std::exception&) {
          self->finish_early(400, "Invalid Content-Length");
          return;
        }
      }

      if (length > self->options_.max_body_bytes) {
        spdlog::warn("[HttpServer] Rejected {} {}: body of {} bytes exceeds {}", self->request_.method, self->request_.path, length,
                     self->options_.max_body_bytes);
        self->finish_early(413, "Request body too large");
        return;
      }

      self->read_body(length);
    });
  }

  void read_body(size_t length) {
    if (buffer_.size() >= length) {
      request_.body.assign(asio::buffers_begin(buffer_.data()), asio::buffers_begin(buffer_.data()) + length);
      buffer_.consume(length);
      dispatch();
      return;
    }

    asio::async_read(socket_, buffer_, asio::transfer_exactly(length - buffer_.size()),
                     [self = shared_from_this(), length](const asio::error_code& ec, size_t) {
                       if (ec) {
                         spdlog::debug("[HttpServer] Connection closed while reading body: {}", ec.message());
                         self->close();
                         return;
                       }
                       self->read_body(length);
                     });
  }

  void dispatch() {
    dispatched_ = true;
    timer_.cancel();
    asio::post(pool_, [self = shared_from_this()] {
      self->run_handler();
    });
  }

  void run_handler() {
    try {
      handler_(request_, *this);
    } catch (const std::exception& e) {
      spdlog::error("[HttpServer] Handler for {} {} threw: {}", request_.method, request_.path, e.what());
    }

    if (!responded_) {
      respond(500, "application/json", R"({"error":"Internal server error"})");
    }
    close();
  }

  // Answers before the body is read, then drains whatever the peer still sends
  void finish_early(int status, const std::string& reason) {
    json body = {{"error", reason}};
    respond(status, "application/json", body.dump());

    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
    buffer_.consume(buffer_.size());
    drain();
  }

  void drain() {
    socket_.async_read_some(asio::buffer(scratch_), [self = shared_from_this()](const asio::error_code& ec, size_t) {
      if (ec) {
        self->timer_.cancel();
        self->close();
        return;
      }
      self->drain();
    });
  }

  bool send(const std::string& data) {
    asio::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    if (ec) {
      spdlog::debug("[HttpServer] Write failed: {}", ec.message());
      return false;
    }
    return true;
  }

  void close() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  const HttpServerOptions& options_;
  asio::thread_pool& pool_;
  const RequestHandler& handler_;
  asio::streambuf buffer_;
  asio::steady_timer timer_;
  std::array<char, 4096> scratch_{};
  HttpRequest request_;
  bool dispatched_ = false;
  std::atomic<bool> responded_{false};
};

}  // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it != headers.end() ? it->second : "";
}

class HttpServer::Impl {
 public:
  Impl(HttpServerOptions options, RequestHandler handler)
      : options_(std::move(options)), handler_(std::move(handler)), acceptor_(io_ctx_), pool_(std::max<size_t>(1, options_.handler_threads)) {}

  ~Impl() {
    stop();
  }

  Result<uint16_t> start() {
    if (running_) {
      return Result<uint16_t>::failure("Server already running");
    }

    asio::error_code ec;
    auto address = asio::ip::make_address(options_.host, ec);
    if (ec) {
      return Result<uint16_t>::failure("Invalid listen address " + options_.host + ": " + ec.message());
    }

    asio::ip::tcp::endpoint endpoint(address, options_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
      asio::error_code ignored;
      acceptor_.close(ignored);
      return Result<uint16_t>::failure("Failed to listen on " + options_.host + ":" + std::to_string(options_.port) + ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    do_accept();

    auto io_threads = std::max<size_t>(1, options_.io_threads);
    for (size_t i = 0; i < io_threads; ++i) {
      io_threads_.emplace_back([this] {
        io_ctx_.run();
      });
    }

    spdlog::info("[HttpServer] Listening on {}:{} ({} io threads, {} handler threads)", options_.host, port_, io_threads, options_.handler_threads);
    return Result<uint16_t>::success(port_);
  }

  void stop() {
    if (!running_.exchange(false)) return;

    io_ctx_.stop();
    for (auto& t : io_threads_) {
      if (t.joinable()) t.join();
    }
    io_threads_.clear();

    asio::error_code ignored;
    acceptor_.close(ignored);

    // Let in-flight handlers run to completion
    pool_.join();
    spdlog::info("[HttpServer] Stopped (port {})", port_);
  }

  bool is_running() const {
    return running_;
  }

  uint16_t port() const {
    return port_;
  }

 private:
  void do_accept() {
    acceptor_.async_accept(asio::make_strand(io_ctx_), [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
      if (ec == asio::error::operation_aborted || !running_) return;

      if (ec) {
        spdlog::warn("[HttpServer] Accept failed: {}", ec.message());
      } else {
        std::make_shared<Session>(std::move(socket), options_, pool_, handler_)->start();
      }
      do_accept();
    });
  }

  HttpServerOptions options_;
  RequestHandler handler_;
  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  asio::thread_pool pool_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  uint16_t port_ = 0;
};

HttpServer::HttpServer(HttpServerOptions options, RequestHandler handler) : impl_(std::make_unique<Impl>(std::move(options), std::move(handler))) {}

HttpServer::~HttpServer() = default;

Result<uint16_t> HttpServer::start() {
  return impl_->start();
}

void HttpServer::stop() {
  impl_->stop();
}

bool HttpServer::is_running() const {
  return impl_->is_running();
}

uint16_t HttpServer::port() const {
  return impl_->port();
}

std::string status_reason(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

}  // namespace a2a::net
