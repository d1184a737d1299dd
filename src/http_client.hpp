#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "errors.hpp"
#include "http_message.hpp"

class Logger;

// Plain TCP or TLS client connection behind one interface.
class ClientStream {
public:
  ClientStream(asio::io_context& io, asio::ssl::context* tls);

  asio::ip::tcp::socket& socket();
  bool secure() const { return tls_.has_value(); }

  template<typename Handler>
  void async_handshake(const std::string& host, Handler&& handler) {
    if(!tls_) {
      asio::post(socket().get_executor(), [h = std::forward<Handler>(handler)]() mutable { h(std::error_code()); });
      return;
    }
    SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str());
    tls_->async_handshake(asio::ssl::stream_base::client, std::forward<Handler>(handler));
  }

  template<typename Buffers, typename Handler>
  void async_write(const Buffers& buffers, Handler&& handler) {
    if(tls_) asio::async_write(*tls_, buffers, std::forward<Handler>(handler));
    else asio::async_write(*plain_, buffers, std::forward<Handler>(handler));
  }

  template<typename Handler>
  void async_read_until(asio::streambuf& buf, const std::string& delim, Handler&& handler) {
    if(tls_) asio::async_read_until(*tls_, buf, delim, std::forward<Handler>(handler));
    else asio::async_read_until(*plain_, buf, delim, std::forward<Handler>(handler));
  }

  template<typename Buffers, typename Handler>
  void async_read_some(const Buffers& buffers, Handler&& handler) {
    if(tls_) tls_->async_read_some(buffers, std::forward<Handler>(handler));
    else plain_->async_read_some(buffers, std::forward<Handler>(handler));
  }

  void close();

private:
  std::optional<asio::ip::tcp::socket> plain_;
  std::optional<asio::ssl::stream<asio::ip::tcp::socket>> tls_;
};

struct HttpResult {
  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  int status = 0;
  uint64_t bytes = 0;       // body bytes moved (file bytes for upload/download)
  HttpResponseHead head;
  std::string body;         // response body unless streamed to a file
};

struct HttpCallOptions {
  HttpHeaders headers;
  std::string user;
  std::string secret;
  std::function<void(uint64_t transferred, uint64_t total)> on_progress;
  std::function<bool()> cancelled;
};

class HttpClient {
public:
  using Completion = std::function<void(const HttpResult&)>;

  static constexpr std::size_t kMaxBufferedBody = 4 * 1024 * 1024;

  HttpClient(asio::io_context& io,
             std::chrono::milliseconds connect_timeout,
             std::chrono::milliseconds io_timeout,
             std::shared_ptr<Logger> logger = nullptr);

  // TLS peer verification against the system trust store; on by default.
  void set_verify_peer(bool enabled);

  void head(const std::string& url, HttpCallOptions options, Completion done);
  void get(const std::string& url, HttpCallOptions options, Completion done);
  void download(const std::string& url,
                const std::filesystem::path& dest,
                HttpCallOptions options,
                Completion done);
  void upload(const std::string& url,
              const std::filesystem::path& source,
              const std::string& field_name,
              HttpCallOptions options,
              Completion done);

  asio::io_context& io() { return io_; }

private:
  asio::io_context& io_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<asio::ssl::context> tls_;
};
