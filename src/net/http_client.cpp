#include "a2a/net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

namespace a2a::net {

namespace {

using TcpSocket = asio::ip::tcp::socket;
using SslSocket = asio::ssl::stream<asio::ip::tcp::socket>;
using CompleteCallback = std::function<void(int, const std::string&)>;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host << ":" << url.port_or_default() << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// Parses the status line and header block already sitting in the buffer.
// Returns false when the status line is not HTTP.
bool parse_head(asio::streambuf& buffer, int& status_code, std::map<std::string, std::string>& headers) {
  std::istream stream(&buffer);
  std::string status_line;
  std::getline(stream, status_line);

  static const std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
  std::smatch match;
  if (!std::regex_search(status_line, match, status_regex)) {
    return false;
  }
  try {
    status_code = std::stoi(match[1].str());
  } catch (const std::exception&) {
    return false;
  }

  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r") {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) continue;
    std::string value = header_line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    headers[to_lower(header_line.substr(0, colon))] = value;
  }
  return true;
}

std::string drain(asio::streambuf& buffer) {
  std::string out(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  buffer.consume(buffer.size());
  return out;
}

// SSL peers frequently close without close_notify
bool is_eof(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

std::optional<size_t> content_length(const std::map<std::string, std::string>& headers) {
  auto it = headers.find("content-length");
  if (it == headers.end()) return std::nullopt;
  try {
    return std::stoull(it->second);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  static const std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL: " + url});
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<SslSocket>(io_ctx_, ssl_ctx_);
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start_request(socket, *parsed, options, std::move(callback));
    } else {
      start_request(std::make_shared<TcpSocket>(io_ctx_), *parsed, options, std::move(callback));
    }
  }

  void request_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data, CompleteCallback on_complete) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      on_complete(0, "Invalid URL: " + url);
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<SslSocket>(io_ctx_, ssl_ctx_);
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start_stream(socket, *parsed, options, std::move(on_data), std::move(on_complete));
    } else {
      start_stream(std::make_shared<TcpSocket>(io_ctx_), *parsed, options, std::move(on_data), std::move(on_complete));
    }
  }

 private:
  static void close_socket(const std::shared_ptr<SslSocket>& socket) {
    asio::error_code ignored;
    socket->lowest_layer().close(ignored);
  }

  static void close_socket(const std::shared_ptr<TcpSocket>& socket) {
    asio::error_code ignored;
    socket->close(ignored);
  }

  // When the timer fires, set the timed_out flag and close the socket
  template <typename Socket>
  std::shared_ptr<asio::steady_timer> start_timeout(std::chrono::milliseconds timeout, std::shared_ptr<Socket> socket,
                                                    std::shared_ptr<bool> timed_out) {
    auto timer = std::make_shared<asio::steady_timer>(io_ctx_);
    timer->expires_after(timeout);
    timer->async_wait([socket, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        close_socket(socket);
      }
    });
    return timer;
  }

  // Resolve, connect and (for TLS) handshake; on_ready receives an empty
  // string on success or the failure description. Requests may start on any
  // thread, so each one owns its resolver.
  template <typename Socket>
  void connect(std::shared_ptr<Socket> socket, const ParsedUrl& url, std::function<void(const std::string&)> on_ready) {
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);
    resolver->async_resolve(url.host, url.port_or_default(),
                            [resolver, socket, on_ready](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                              if (ec) {
                                on_ready("DNS resolution failed: " + ec.message());
                                return;
                              }

                              asio::async_connect(socket->lowest_layer(), results,
                                                  [socket, on_ready](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                                                    if (ec) {
                                                      on_ready("Connection failed: " + ec.message());
                                                      return;
                                                    }

                                                    if constexpr (std::is_same_v<Socket, SslSocket>) {
                                                      socket->async_handshake(asio::ssl::stream_base::client,
                                                                              [on_ready](const asio::error_code& ec) {
                                                                                on_ready(ec ? "SSL handshake failed: " + ec.message() : "");
                                                                              });
                                                    } else {
                                                      on_ready("");
                                                    }
                                                  });
                            });
  }

  template <typename Socket>
  void start_request(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto timed_out = std::make_shared<bool>(false);
    auto timer = start_timeout(options.timeout, socket, timed_out);

    // Cancel the timer and report a timeout in place of whatever error it caused
    std::function<void(HttpResponse)> done = [timer, timed_out, callback](HttpResponse resp) {
      timer->cancel();
      if (*timed_out) {
        resp.error = "Request timed out";
        resp.status_code = 0;
      }
      callback(std::move(resp));
    };

    connect(socket, url, [this, socket, request_str, response, buffer, done](const std::string& error) {
      if (!error.empty()) {
        response->error = error;
        done(*response);
        return;
      }

      asio::async_write(*socket, asio::buffer(*request_str), [this, socket, response, buffer, done](const asio::error_code& ec, size_t) {
        if (ec) {
          response->error = "Write failed: " + ec.message();
          done(*response);
          return;
        }
        read_response(socket, response, buffer, done);
      });
    });
  }

  template <typename Socket>
  void read_response(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                     std::function<void(HttpResponse)> callback) {
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      if (ec && !is_eof(ec)) {
        response->error = "Read headers failed: " + ec.message();
        callback(*response);
        return;
      }

      if (!parse_head(*buffer, response->status_code, response->headers)) {
        response->error = "Invalid HTTP response";
        callback(*response);
        return;
      }

      response->body = drain(*buffer);
      read_body(socket, response, buffer, callback);
    });
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                 std::function<void(HttpResponse)> callback) {
    auto expected = content_length(response->headers);
    if (expected && response->body.size() >= *expected) {
      callback(*response);
      return;
    }

    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [this, socket, response, buffer, callback, expected](const asio::error_code& ec, size_t) {
      response->body += drain(*buffer);

      if (ec && is_eof(ec)) {
        if (expected && response->body.size() < *expected) {
          response->error = "Response body truncated: got " + std::to_string(response->body.size()) + " of " + std::to_string(*expected) + " bytes";
        }
        callback(*response);
        return;
      }
      if (ec) {
        response->error = "Read body failed: " + ec.message();
        callback(*response);
        return;
      }
      read_body(socket, response, buffer, callback);
    });
  }

  template <typename Socket>
  void start_stream(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, StreamDataCallback on_data,
                    CompleteCallback on_complete) {
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto shared_on_data = std::make_shared<StreamDataCallback>(std::move(on_data));
    auto timed_out = std::make_shared<bool>(false);
    auto timer = start_timeout(options.timeout, socket, timed_out);

    auto done = std::make_shared<CompleteCallback>([timer, timed_out, on_complete = std::move(on_complete)](int code, const std::string& err) {
      timer->cancel();
      if (*timed_out) {
        on_complete(0, "Request timed out");
      } else {
        on_complete(code, err);
      }
    });

    connect(socket, url, [this, socket, request_str, buffer, shared_on_data, done](const std::string& error) {
      if (!error.empty()) {
        (*done)(0, error);
        return;
      }

      asio::async_write(*socket, asio::buffer(*request_str), [this, socket, buffer, shared_on_data, done](const asio::error_code& ec, size_t) {
        if (ec) {
          (*done)(0, "Write failed: " + ec.message());
          return;
        }
        read_stream_head(socket, buffer, shared_on_data, done);
      });
    });
  }

  template <typename Socket>
  void read_stream_head(std::shared_ptr<Socket> socket, std::shared_ptr<asio::streambuf> buffer, std::shared_ptr<StreamDataCallback> on_data,
                        std::shared_ptr<CompleteCallback> on_complete) {
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, buffer, on_data, on_complete](const asio::error_code& ec, size_t) {
      if (ec && !is_eof(ec)) {
        (*on_complete)(0, "Read headers failed: " + ec.message());
        return;
      }

      int status_code = 0;
      std::map<std::string, std::string> headers;
      if (!parse_head(*buffer, status_code, headers)) {
        (*on_complete)(0, "Invalid HTTP response");
        return;
      }

      if (status_code < 200 || status_code >= 300) {
        (*on_complete)(status_code, "HTTP error " + std::to_string(status_code) + ": " + drain(*buffer));
        return;
      }

      auto first = drain(*buffer);
      if (!first.empty()) {
        (*on_data)(first);
      }
      read_stream_data(socket, buffer, status_code, on_data, on_complete);
    });
  }

  template <typename Socket>
  void read_stream_data(std::shared_ptr<Socket> socket, std::shared_ptr<asio::streambuf> buffer, int status_code,
                        std::shared_ptr<StreamDataCallback> on_data, std::shared_ptr<CompleteCallback> on_complete) {
    asio::async_read(*socket, *buffer, asio::transfer_at_least(1),
                     [this, socket, buffer, status_code, on_data, on_complete](const asio::error_code& ec, size_t) {
                       auto chunk = drain(*buffer);
                       if (!chunk.empty()) {
                         (*on_data)(chunk);
                       }

                       if (ec && is_eof(ec)) {
                         (*on_complete)(status_code, "");
                       } else if (ec) {
                         (*on_complete)(status_code, "Read failed: " + ec.message());
                       } else {
                         read_stream_data(socket, buffer, status_code, on_data, on_complete);
                       }
                     });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

void HttpClient::request_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                std::function<void(int status_code, const std::string& error)> on_complete) {
  impl_->request_stream(url, options, std::move(on_data), std::move(on_complete));
}

}  // namespace a2a::net
