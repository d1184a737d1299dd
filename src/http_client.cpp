#include "http_client.hpp"

#include <array>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using tcp = asio::ip::tcp;

ClientStream::ClientStream(asio::io_context& io, asio::ssl::context* tls) {
  if(tls) {
    tls_.emplace(io, *tls);
  } else {
    plain_.emplace(io);
  }
}

tcp::socket& ClientStream::socket() {
  if(tls_) return tls_->next_layer();
  return *plain_;
}

void ClientStream::close() {
  std::error_code ec;
  socket().shutdown(tcp::socket::shutdown_both, ec);
  socket().close(ec);
}

namespace {

constexpr std::size_t kIoChunk = 64 * 1024;

class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
  enum class Mode { Head, Buffered, Download, Upload };

  HttpExchange(asio::io_context& io,
               asio::ssl::context* tls,
               Url url,
               Mode mode,
               HttpCallOptions options,
               std::chrono::milliseconds connect_timeout,
               std::chrono::milliseconds io_timeout,
               std::shared_ptr<Logger> logger,
               HttpClient::Completion done)
    : url_(std::move(url)),
      mode_(mode),
      options_(std::move(options)),
      connect_timeout_(connect_timeout),
      io_timeout_(io_timeout),
      logger_(std::move(logger)),
      done_(std::move(done)),
      resolver_(io),
      stream_(io, url_.secure() ? tls : nullptr),
      timer_(io),
      decoder_([this](const char* data, std::size_t size){ sink(data, size); }) {}

  void set_download_target(fs::path dest) { file_path_ = std::move(dest); }

  void set_upload_source(fs::path source, std::string field_name) {
    file_path_ = std::move(source);
    field_name_ = std::move(field_name);
  }

  void start() {
    if(mode_ == Mode::Upload) {
      std::error_code ec;
      upload_size_ = fs::file_size(file_path_, ec);
      if(ec) {
        fail(ErrorKind::NotFound, "cannot read " + file_path_.string() + ": " + ec.message());
        return;
      }
      in_.open(file_path_, std::ios::binary);
      if(!in_) {
        fail(ErrorKind::NotFound, "cannot open " + file_path_.string());
        return;
      }
    }
    auto self = shared_from_this();
    arm(connect_timeout_);
    resolver_.async_resolve(url_.host, std::to_string(url_.port),
      [this, self](std::error_code ec, tcp::resolver::results_type results){
        if(ec) {
          fail(ErrorKind::Connectivity, "resolve " + url_.host + " failed: " + ec.message());
          return;
        }
        asio::async_connect(stream_.socket(), results,
          [this, self](std::error_code ec, const tcp::endpoint&){
            if(ec) {
              fail(ErrorKind::Connectivity, connect_error(ec));
              return;
            }
            stream_.async_handshake(url_.host, [this, self](std::error_code ec){
              if(ec) {
                fail(ErrorKind::Connectivity, "TLS handshake with " + url_.host + " failed: " + ec.message());
                return;
              }
              send_head();
            });
          });
      });
  }

private:
  std::string method() const {
    switch(mode_) {
      case Mode::Head: return "HEAD";
      case Mode::Upload: return "POST";
      default: return "GET";
    }
  }

  std::string connect_error(const std::error_code& ec) const {
    if(timed_out_) return "connection to " + url_.host_header() + " timed out";
    return "connection to " + url_.host_header() + " failed: " + ec.message();
  }

  void arm(std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    auto self = shared_from_this();
    timer_.async_wait([this, self](const std::error_code& ec){
      if(ec || finished_) return;
      timed_out_ = true;
      stream_.close();
    });
  }

  bool check_cancelled() {
    if(options_.cancelled && options_.cancelled()) {
      fail(ErrorKind::None, "cancelled");
      return true;
    }
    return false;
  }

  void send_head() {
    std::string head = method() + " " + url_.target + " HTTP/1.1\r\n";
    head += "Host: " + url_.host_header() + "\r\n";
    head += "User-Agent: lanshare\r\n";
    head += "Accept: */*\r\n";
    head += "Connection: close\r\n";
    if(!options_.user.empty()) {
      head += "Authorization: Basic " + base64_encode(options_.user + ":" + options_.secret) + "\r\n";
    }
    for(const auto& [name, value] : options_.headers) {
      head += name + ": " + value + "\r\n";
    }
    if(mode_ == Mode::Upload) {
      envelope_ = MultipartEnvelope::for_file(field_name_,
                                              file_path_.filename().string(),
                                              mime_type_for(file_path_.string()));
      uint64_t length = envelope_.prefix.size() + upload_size_ + envelope_.suffix.size();
      head += "Content-Type: " + envelope_.content_type() + "\r\n";
      head += "Content-Length: " + std::to_string(length) + "\r\n\r\n";
      head += envelope_.prefix;
    } else {
      head += "\r\n";
    }
    write_buf_ = std::move(head);
    auto self = shared_from_this();
    arm(io_timeout_);
    stream_.async_write(asio::buffer(write_buf_), [this, self](std::error_code ec, std::size_t){
      if(ec) {
        fail(ErrorKind::Connectivity, io_error("send request", ec));
        return;
      }
      if(mode_ == Mode::Upload) {
        report_progress(0, upload_size_);
        send_upload_chunk();
      } else {
        read_head();
      }
    });
  }

  void send_upload_chunk() {
    if(check_cancelled()) return;
    auto self = shared_from_this();
    if(sent_ >= upload_size_) {
      write_buf_ = envelope_.suffix;
      arm(io_timeout_);
      stream_.async_write(asio::buffer(write_buf_), [this, self](std::error_code ec, std::size_t){
        if(ec) {
          fail(ErrorKind::Connectivity, io_error("finish upload", ec));
          return;
        }
        read_head();
      });
      return;
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(kIoChunk, upload_size_ - sent_));
    write_buf_.resize(want);
    in_.read(&write_buf_[0], static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(in_.gcount()) != want) {
      fail(ErrorKind::NotFound, "short read from " + file_path_.string());
      return;
    }
    arm(io_timeout_);
    stream_.async_write(asio::buffer(write_buf_), [this, self](std::error_code ec, std::size_t n){
      if(ec) {
        fail(ErrorKind::Connectivity, io_error("upload", ec));
        return;
      }
      sent_ += n;
      report_progress(sent_, upload_size_);
      send_upload_chunk();
    });
  }

  void read_head() {
    auto self = shared_from_this();
    arm(io_timeout_);
    stream_.async_read_until(buf_, "\r\n\r\n", [this, self](std::error_code ec, std::size_t n){
      if(ec) {
        fail(ErrorKind::Connectivity, io_error("read response", ec));
        return;
      }
      std::string head(asio::buffers_begin(buf_.data()), asio::buffers_begin(buf_.data()) + n);
      buf_.consume(n);
      auto parsed = parse_response_head(head);
      if(!parsed) {
        fail(ErrorKind::Protocol, "malformed HTTP response from " + url_.host_header());
        return;
      }
      result_.head = std::move(*parsed);
      result_.status = result_.head.status;
      on_head();
    });
  }

  void on_head() {
    int status = result_.status;
    ok_status_ = status >= 200 && status < 300;
    if(mode_ == Mode::Download && ok_status_) {
      out_.open(file_path_, std::ios::binary | std::ios::trunc);
      if(!out_) {
        fail(ErrorKind::NotFound, "cannot write " + file_path_.string());
        return;
      }
      writing_file_ = true;
    }

    bool no_body = mode_ == Mode::Head || status == 204 || status == 304 || (status >= 100 && status < 200);
    if(no_body) {
      complete();
      return;
    }
    chunked_ = to_lower(result_.head.header("transfer-encoding")).find("chunked") != std::string::npos;
    if(!chunked_) {
      auto length = result_.head.header("content-length");
      if(!length.empty()) {
        try {
          content_length_ = std::stoull(length);
        } catch(const std::exception&) {
          fail(ErrorKind::Protocol, "invalid Content-Length '" + length + "'");
          return;
        }
      }
    }
    if(buf_.size() > 0) {
      std::string pending(asio::buffers_begin(buf_.data()), asio::buffers_end(buf_.data()));
      buf_.consume(buf_.size());
      if(!consume(pending.data(), pending.size())) return;
    }
    if(body_complete()) {
      complete();
      return;
    }
    read_body();
  }

  bool body_complete() const {
    if(chunked_) return decoder_.done();
    if(content_length_) return received_ >= *content_length_;
    return false;
  }

  void read_body() {
    if(check_cancelled()) return;
    auto self = shared_from_this();
    arm(io_timeout_);
    stream_.async_read_some(asio::buffer(chunk_), [this, self](std::error_code ec, std::size_t n){
      if(n > 0 && !consume(chunk_.data(), n)) return;
      if(ec) {
        bool eof = ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
        if(eof && !chunked_ && !content_length_) {
          complete();
          return;
        }
        fail(ErrorKind::Connectivity, io_error("read body", ec));
        return;
      }
      if(body_complete()) {
        complete();
        return;
      }
      read_body();
    });
  }

  bool consume(const char* data, std::size_t size) {
    if(chunked_) {
      if(!decoder_.feed(data, size)) {
        fail(ErrorKind::Protocol, "malformed chunked response body");
        return false;
      }
    } else {
      if(content_length_) {
        size = static_cast<std::size_t>(std::min<uint64_t>(size, *content_length_ - received_));
      }
      sink(data, size);
    }
    if(sink_failed_) {
      fail(sink_error_kind_, sink_error_);
      return false;
    }
    return true;
  }

  void sink(const char* data, std::size_t size) {
    received_ += size;
    if(writing_file_) {
      out_.write(data, static_cast<std::streamsize>(size));
      if(!out_) {
        sink_failed_ = true;
        sink_error_kind_ = ErrorKind::NotFound;
        sink_error_ = "write to " + file_path_.string() + " failed";
        return;
      }
      result_.bytes = received_;
      report_progress(received_, content_length_.value_or(0));
      return;
    }
    if(result_.body.size() + size > HttpClient::kMaxBufferedBody) {
      sink_failed_ = true;
      sink_error_kind_ = ErrorKind::Protocol;
      sink_error_ = "response body too large";
      return;
    }
    result_.body.append(data, size);
  }

  void report_progress(uint64_t done, uint64_t total) {
    if(options_.on_progress) options_.on_progress(done, total);
  }

  std::string io_error(const char* what, const std::error_code& ec) const {
    if(timed_out_) return std::string(what) + " timed out";
    return std::string(what) + " failed: " + ec.message();
  }

  void complete() {
    if(mode_ == Mode::Upload) result_.bytes = sent_;
    if(writing_file_) {
      out_.close();
      if(!out_) {
        fail(ErrorKind::NotFound, "write to " + file_path_.string() + " failed");
        return;
      }
    }
    if(!ok_status_) {
      int status = result_.status;
      std::string text = "HTTP " + std::to_string(status) + " " + result_.head.reason;
      if(status == 401 || status == 403) text += " (authentication rejected)";
      fail(ErrorKind::Protocol, text);
      return;
    }
    result_.success = true;
    finish();
  }

  void fail(ErrorKind kind, const std::string& message) {
    if(finished_) return;
    result_.success = false;
    result_.error_kind = kind;
    result_.error = message;
    if(writing_file_) {
      out_.close();
      std::error_code ec;
      fs::remove(file_path_, ec);
      writing_file_ = false;
    }
    log_info(logger_.get(), "{} {} failed: {}", method(), url_.host_header() + url_.target, message);
    finish();
  }

  void finish() {
    if(finished_) return;
    finished_ = true;
    timer_.cancel();
    stream_.close();
    auto done = std::move(done_);
    if(done) done(result_);
  }

  Url url_;
  Mode mode_;
  HttpCallOptions options_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  std::shared_ptr<Logger> logger_;
  HttpClient::Completion done_;

  tcp::resolver resolver_;
  ClientStream stream_;
  asio::steady_timer timer_;
  asio::streambuf buf_;
  std::array<char, kIoChunk> chunk_{};
  std::string write_buf_;

  fs::path file_path_;
  std::string field_name_;
  std::ifstream in_;
  std::ofstream out_;
  MultipartEnvelope envelope_;
  uint64_t upload_size_ = 0;
  uint64_t sent_ = 0;

  HttpResult result_;
  ChunkedDecoder decoder_;
  bool chunked_ = false;
  std::optional<uint64_t> content_length_;
  uint64_t received_ = 0;
  bool ok_status_ = false;
  bool writing_file_ = false;
  bool sink_failed_ = false;
  ErrorKind sink_error_kind_ = ErrorKind::None;
  std::string sink_error_;
  bool timed_out_ = false;
  bool finished_ = false;
};

} // namespace

HttpClient::HttpClient(asio::io_context& io,
                       std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds io_timeout,
                       std::shared_ptr<Logger> logger)
  : io_(io),
    connect_timeout_(connect_timeout),
    io_timeout_(io_timeout),
    logger_(std::move(logger)),
    tls_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
  std::error_code ec;
  tls_->set_default_verify_paths(ec);
  if(ec) {
    log_warn(logger_.get(), "TLS trust store unavailable: {}", ec.message());
  }
  tls_->set_verify_mode(asio::ssl::verify_peer);
}

void HttpClient::set_verify_peer(bool enabled) {
  tls_->set_verify_mode(enabled ? asio::ssl::verify_peer : asio::ssl::verify_none);
}

namespace {

template<typename Setup>
void launch(asio::io_context& io,
            asio::ssl::context* tls,
            const std::string& url,
            HttpExchange::Mode mode,
            HttpCallOptions options,
            std::chrono::milliseconds connect_timeout,
            std::chrono::milliseconds io_timeout,
            std::shared_ptr<Logger> logger,
            HttpClient::Completion done,
            Setup setup) {
  auto parsed = parse_url(url);
  if(!parsed) {
    HttpResult result;
    result.error_kind = ErrorKind::Protocol;
    result.error = "invalid URL '" + url + "'";
    asio::post(io, [done = std::move(done), result](){ if(done) done(result); });
    return;
  }
  auto exchange = std::make_shared<HttpExchange>(io, tls, std::move(*parsed), mode, std::move(options),
                                                 connect_timeout, io_timeout, std::move(logger), std::move(done));
  setup(*exchange);
  // Start on the I/O thread; callers may be anywhere.
  asio::post(io, [exchange](){ exchange->start(); });
}

} // namespace

void HttpClient::head(const std::string& url, HttpCallOptions options, Completion done) {
  launch(io_, tls_.get(), url, HttpExchange::Mode::Head, std::move(options),
         connect_timeout_, io_timeout_, logger_, std::move(done), [](HttpExchange&){});
}

void HttpClient::get(const std::string& url, HttpCallOptions options, Completion done) {
  launch(io_, tls_.get(), url, HttpExchange::Mode::Buffered, std::move(options),
         connect_timeout_, io_timeout_, logger_, std::move(done), [](HttpExchange&){});
}

void HttpClient::download(const std::string& url,
                          const fs::path& dest,
                          HttpCallOptions options,
                          Completion done) {
  launch(io_, tls_.get(), url, HttpExchange::Mode::Download, std::move(options),
         connect_timeout_, io_timeout_, logger_, std::move(done),
         [&dest](HttpExchange& ex){ ex.set_download_target(dest); });
}

void HttpClient::upload(const std::string& url,
                        const fs::path& source,
                        const std::string& field_name,
                        HttpCallOptions options,
                        Completion done) {
  launch(io_, tls_.get(), url, HttpExchange::Mode::Upload, std::move(options),
         connect_timeout_, io_timeout_, logger_, std::move(done),
         [&source, &field_name](HttpExchange& ex){ ex.set_upload_source(source, field_name); });
}
