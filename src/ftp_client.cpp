#include "ftp_client.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

#include "log.hpp"

namespace fs = std::filesystem;
using tcp = asio::ip::tcp;

std::optional<uint16_t> parse_pasv_port(const std::string& reply_text) {
  auto open = reply_text.find('(');
  std::size_t pos = open == std::string::npos ? 4 : open + 1;
  while(pos < reply_text.size() && !std::isdigit(static_cast<unsigned char>(reply_text[pos]))) ++pos;

  std::vector<int> fields;
  std::string current;
  for(; pos < reply_text.size() && fields.size() < 6; ++pos) {
    char ch = reply_text[pos];
    if(std::isdigit(static_cast<unsigned char>(ch))) {
      current.push_back(ch);
      if(current.size() > 3) return std::nullopt;
    } else if(ch == ',' || ch == ')' || ch == ' ' || ch == '\r' || ch == '\n') {
      if(current.empty()) {
        if(ch == ',') return std::nullopt;
        break;
      }
      fields.push_back(std::stoi(current));
      current.clear();
      if(ch != ',') break;
    } else {
      return std::nullopt;
    }
  }
  if(!current.empty() && fields.size() < 6) fields.push_back(std::stoi(current));
  if(fields.size() != 6) return std::nullopt;
  for(int f : fields) {
    if(f < 0 || f > 255) return std::nullopt;
  }
  int port = fields[4] * 256 + fields[5];
  if(port == 0) return std::nullopt;
  return static_cast<uint16_t>(port);
}

namespace {

constexpr std::size_t kDataChunk = 64 * 1024;

bool is_positive_completion(int code) { return code >= 200 && code < 300; }
bool is_preliminary(int code) { return code == 125 || code == 150; }

class FtpSession : public std::enable_shared_from_this<FtpSession> {
public:
  enum class Op { Probe, Upload, Download, List, MakeDir };

  FtpSession(asio::io_context& io,
             Op op,
             FtpEndpoint endpoint,
             std::chrono::milliseconds connect_timeout,
             std::chrono::milliseconds io_timeout,
             std::shared_ptr<Logger> logger,
             FtpClient::Completion done)
    : op_(op),
      endpoint_(std::move(endpoint)),
      connect_timeout_(connect_timeout),
      io_timeout_(io_timeout),
      logger_(std::move(logger)),
      done_(std::move(done)),
      resolver_(io),
      control_(io),
      data_(io),
      timer_(io) {}

  fs::path local_path;
  std::string remote_path;
  FtpTransferOptions options;

  void start() {
    auto self = shared_from_this();
    arm(connect_timeout_);
    resolver_.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
      [this, self](std::error_code ec, tcp::resolver::results_type results){
        if(ec) {
          fail(ErrorKind::Connectivity, "resolve " + endpoint_.host + " failed: " + ec.message());
          return;
        }
        asio::async_connect(control_, results, [this, self](std::error_code ec, const tcp::endpoint&){
          if(ec) {
            fail(ErrorKind::Connectivity, io_error("connect to " + address(), ec));
            return;
          }
          login();
        });
      });
  }

private:
  using ReplyHandler = std::function<void(const FtpReply&)>;

  std::string address() const {
    return endpoint_.host + ":" + std::to_string(endpoint_.port);
  }

  void arm(std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    auto self = shared_from_this();
    timer_.async_wait([this, self](const std::error_code& ec){
      if(ec || finished_) return;
      timed_out_ = true;
      close_sockets();
    });
  }

  std::string io_error(const std::string& what, const std::error_code& ec) const {
    if(timed_out_) return what + " timed out";
    return what + " failed: " + ec.message();
  }

  void read_reply(ReplyHandler handler) {
    auto self = shared_from_this();
    arm(io_timeout_);
    asio::async_read_until(control_, ctrl_buf_, "\r\n",
      [this, self, handler = std::move(handler)](std::error_code ec, std::size_t n) mutable {
        if(ec) {
          fail(ErrorKind::Connectivity, io_error("read reply from " + address(), ec));
          return;
        }
        std::string line(asio::buffers_begin(ctrl_buf_.data()), asio::buffers_begin(ctrl_buf_.data()) + n);
        ctrl_buf_.consume(n);
        while(!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

        if(!in_multiline_) {
          if(line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0]))
             || !std::isdigit(static_cast<unsigned char>(line[1]))
             || !std::isdigit(static_cast<unsigned char>(line[2]))) {
            fail(ErrorKind::Protocol, "malformed FTP reply '" + line + "'");
            return;
          }
          pending_.code = std::stoi(line.substr(0, 3));
          pending_.text = line;
          if(line.size() > 3 && line[3] == '-') {
            in_multiline_ = true;
            read_reply(std::move(handler));
            return;
          }
        } else {
          pending_.text += "\n" + line;
          if(line.size() < 4 || line.compare(0, 3, pending_.text.substr(0, 3)) != 0 || line[3] != ' ') {
            read_reply(std::move(handler));
            return;
          }
          in_multiline_ = false;
        }
        FtpReply reply = std::move(pending_);
        pending_ = FtpReply{};
        result_.last_code = reply.code;
        handler(reply);
      });
  }

  void command(const std::string& line, ReplyHandler handler) {
    if(line.compare(0, 5, "PASS ") == 0) {
      log_debug("> PASS ****");
    } else {
      log_debug("> " + line);
    }
    write_buf_ = line + "\r\n";
    auto self = shared_from_this();
    arm(io_timeout_);
    asio::async_write(control_, asio::buffer(write_buf_),
      [this, self, handler = std::move(handler), verb = line.substr(0, line.find(' '))](std::error_code ec, std::size_t) mutable {
        if(ec) {
          fail(ErrorKind::Connectivity, io_error("send " + verb, ec));
          return;
        }
        read_reply(std::move(handler));
      });
  }

  void log_debug(const std::string& line) {
    if(logger_) logger_->debug("ftp {} {}", address(), line);
  }

  void login() {
    read_reply([this](const FtpReply& greeting){
      if(!is_positive_completion(greeting.code)) {
        fail(ErrorKind::Connectivity, "server not ready: " + greeting.text);
        return;
      }
      auto user = endpoint_.user.empty() ? std::string("anonymous") : endpoint_.user;
      command("USER " + user, [this](const FtpReply& reply){
        if(reply.code == 230) {
          set_binary();
          return;
        }
        if(reply.code != 331 && reply.code != 332) {
          fail(ErrorKind::Protocol, "login rejected: " + reply.text);
          return;
        }
        command("PASS " + endpoint_.secret, [this](const FtpReply& reply){
          if(reply.code != 230 && reply.code != 202) {
            fail(ErrorKind::Protocol, "login rejected: " + reply.text);
            return;
          }
          set_binary();
        });
      });
    });
  }

  void set_binary() {
    command("TYPE I", [this](const FtpReply& reply){
      if(!is_positive_completion(reply.code)) {
        fail(ErrorKind::Protocol, "binary mode refused: " + reply.text);
        return;
      }
      run_operation();
    });
  }

  void run_operation() {
    switch(op_) {
      case Op::Probe: quit(); break;
      case Op::Upload: begin_upload(); break;
      case Op::Download: begin_download(); break;
      case Op::List: begin_list(); break;
      case Op::MakeDir: begin_make_directory(); break;
    }
  }

  void open_data(std::function<void()> next) {
    command("PASV", [this, next = std::move(next)](const FtpReply& reply) mutable {
      if(reply.code != 227) {
        fail(ErrorKind::Protocol, "passive mode refused: " + reply.text);
        return;
      }
      auto port = parse_pasv_port(reply.text);
      if(!port) {
        fail(ErrorKind::Protocol, "unparseable PASV reply: " + reply.text);
        return;
      }
      std::error_code ec;
      auto peer = control_.remote_endpoint(ec);
      if(ec) {
        fail(ErrorKind::Connectivity, "control connection lost: " + ec.message());
        return;
      }
      auto self = shared_from_this();
      arm(connect_timeout_);
      data_.async_connect(tcp::endpoint(peer.address(), *port),
        [this, self, next = std::move(next)](std::error_code ec){
          if(ec) {
            fail(ErrorKind::Connectivity, io_error("data connection", ec));
            return;
          }
          next();
        });
    });
  }

  bool check_cancelled() {
    if(options.cancelled && options.cancelled()) {
      fail(ErrorKind::None, "cancelled");
      return true;
    }
    return false;
  }

  void report_progress() {
    if(options.on_progress) options.on_progress(result_.bytes, total_);
  }

  void close_data() {
    std::error_code ec;
    data_.shutdown(tcp::socket::shutdown_both, ec);
    data_.close(ec);
  }

  void begin_upload() {
    std::error_code ec;
    total_ = fs::file_size(local_path, ec);
    if(ec) {
      fail(ErrorKind::NotFound, "cannot read " + local_path.string() + ": " + ec.message());
      return;
    }
    in_.open(local_path, std::ios::binary);
    if(!in_) {
      fail(ErrorKind::NotFound, "cannot open " + local_path.string());
      return;
    }
    std::string dir = remote_path;
    std::string name = local_path.filename().string();

    auto store = [this, name](){
      open_data([this, name](){
        command("STOR " + name, [this](const FtpReply& reply){
          if(!is_preliminary(reply.code)) {
            fail(ErrorKind::Protocol, "upload refused: " + reply.text);
            return;
          }
          report_progress();
          send_chunk();
        });
      });
    };
    if(dir.empty()) {
      store();
      return;
    }
    command("CWD " + dir, [this, dir, store](const FtpReply& reply){
      if(!is_positive_completion(reply.code)) {
        fail(ErrorKind::Protocol, "cannot change to remote directory " + dir + ": " + reply.text);
        return;
      }
      store();
    });
  }

  void send_chunk() {
    if(check_cancelled()) return;
    if(result_.bytes >= total_) {
      close_data();
      read_reply([this](const FtpReply& reply){
        if(!is_positive_completion(reply.code)) {
          fail(ErrorKind::Protocol, "upload not confirmed: " + reply.text);
          return;
        }
        quit();
      });
      return;
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(kDataChunk, total_ - result_.bytes));
    write_buf_.resize(want);
    in_.read(&write_buf_[0], static_cast<std::streamsize>(want));
    if(static_cast<std::size_t>(in_.gcount()) != want) {
      fail(ErrorKind::NotFound, "short read from " + local_path.string());
      return;
    }
    auto self = shared_from_this();
    arm(io_timeout_);
    asio::async_write(data_, asio::buffer(write_buf_), [this, self](std::error_code ec, std::size_t n){
      if(ec) {
        fail(ErrorKind::Connectivity, io_error("upload data", ec));
        return;
      }
      result_.bytes += n;
      report_progress();
      send_chunk();
    });
  }

  void begin_download() {
    command("SIZE " + remote_path, [this](const FtpReply& reply){
      if(reply.code == 213 && reply.text.size() > 4) {
        try {
          total_ = std::stoull(reply.text.substr(4));
        } catch(const std::exception&) {
          total_ = 0;
        }
      }
      open_data([this](){
        command("RETR " + remote_path, [this](const FtpReply& reply){
          if(!is_preliminary(reply.code)) {
            fail(ErrorKind::Protocol, "download refused: " + reply.text);
            return;
          }
          out_.open(local_path, std::ios::binary | std::ios::trunc);
          if(!out_) {
            fail(ErrorKind::NotFound, "cannot write " + local_path.string());
            return;
          }
          writing_file_ = true;
          report_progress();
          read_data();
        });
      });
    });
  }

  void read_data() {
    if(check_cancelled()) return;
    auto self = shared_from_this();
    arm(io_timeout_);
    data_.async_read_some(asio::buffer(chunk_), [this, self](std::error_code ec, std::size_t n){
      if(n > 0) {
        if(op_ == Op::List) {
          listing_.append(chunk_.data(), n);
        } else {
          out_.write(chunk_.data(), static_cast<std::streamsize>(n));
          if(!out_) {
            fail(ErrorKind::NotFound, "write to " + local_path.string() + " failed");
            return;
          }
          result_.bytes += n;
          report_progress();
        }
      }
      if(ec == asio::error::eof) {
        close_data();
        finish_data();
        return;
      }
      if(ec) {
        fail(ErrorKind::Connectivity, io_error("data transfer", ec));
        return;
      }
      read_data();
    });
  }

  void finish_data() {
    if(op_ == Op::Download) {
      out_.close();
      if(!out_) {
        fail(ErrorKind::NotFound, "write to " + local_path.string() + " failed");
        return;
      }
      writing_file_ = false;
    }
    read_reply([this](const FtpReply& reply){
      if(!is_positive_completion(reply.code)) {
        fail(ErrorKind::Protocol, "transfer not confirmed: " + reply.text);
        return;
      }
      if(op_ == Op::List) {
        std::istringstream in(listing_);
        std::string line;
        while(std::getline(in, line)) {
          if(!line.empty() && line.back() == '\r') line.pop_back();
          if(!line.empty()) result_.names.push_back(line);
        }
      }
      quit();
    });
  }

  void begin_list() {
    open_data([this](){
      std::string cmd = remote_path.empty() ? std::string("NLST") : "NLST " + remote_path;
      command(cmd, [this](const FtpReply& reply){
        if(reply.code == 450) {
          // empty directory on some servers
          close_data();
          quit();
          return;
        }
        if(!is_preliminary(reply.code)) {
          fail(ErrorKind::Protocol, "listing refused: " + reply.text);
          return;
        }
        read_data();
      });
    });
  }

  void begin_make_directory() {
    command("MKD " + remote_path, [this](const FtpReply& reply){
      if(reply.code != 257 && !is_positive_completion(reply.code)) {
        fail(ErrorKind::Protocol, "cannot create " + remote_path + ": " + reply.text);
        return;
      }
      quit();
    });
  }

  // The operation already succeeded; a failing QUIT does not change that.
  void quit() {
    result_.success = true;
    write_buf_ = "QUIT\r\n";
    auto self = shared_from_this();
    arm(io_timeout_);
    asio::async_write(control_, asio::buffer(write_buf_), [this, self](std::error_code ec, std::size_t){
      if(ec) {
        finish();
        return;
      }
      asio::async_read_until(control_, ctrl_buf_, "\r\n", [this, self](std::error_code, std::size_t){
        finish();
      });
    });
  }

  void close_sockets() {
    std::error_code ec;
    control_.close(ec);
    data_.close(ec);
  }

  void fail(ErrorKind kind, const std::string& message) {
    if(finished_) return;
    result_.success = false;
    result_.error_kind = kind;
    result_.error = message;
    if(writing_file_) {
      out_.close();
      std::error_code ec;
      fs::remove(local_path, ec);
      writing_file_ = false;
    }
    log_info(logger_.get(), "ftp {} failed: {}", address(), message);
    finish();
  }

  void finish() {
    if(finished_) return;
    finished_ = true;
    timer_.cancel();
    close_sockets();
    auto done = std::move(done_);
    if(done) done(result_);
  }

  Op op_;
  FtpEndpoint endpoint_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  std::shared_ptr<Logger> logger_;
  FtpClient::Completion done_;

  tcp::resolver resolver_;
  tcp::socket control_;
  tcp::socket data_;
  asio::steady_timer timer_;
  asio::streambuf ctrl_buf_;
  std::string write_buf_;
  std::array<char, kDataChunk> chunk_{};

  FtpReply pending_;
  bool in_multiline_ = false;
  std::ifstream in_;
  std::ofstream out_;
  std::string listing_;
  uint64_t total_ = 0;
  bool writing_file_ = false;
  bool timed_out_ = false;
  bool finished_ = false;
  FtpResult result_;
};

template<typename Setup>
void launch(asio::io_context& io,
            FtpSession::Op op,
            const FtpEndpoint& endpoint,
            std::chrono::milliseconds connect_timeout,
            std::chrono::milliseconds io_timeout,
            std::shared_ptr<Logger> logger,
            FtpClient::Completion done,
            Setup setup) {
  auto session = std::make_shared<FtpSession>(io, op, endpoint, connect_timeout, io_timeout,
                                              std::move(logger), std::move(done));
  setup(*session);
  asio::post(io, [session](){ session->start(); });
}

} // namespace

FtpClient::FtpClient(asio::io_context& io,
                     std::chrono::milliseconds connect_timeout,
                     std::chrono::milliseconds io_timeout,
                     std::shared_ptr<Logger> logger)
  : io_(io),
    connect_timeout_(connect_timeout),
    io_timeout_(io_timeout),
    logger_(std::move(logger)) {}

void FtpClient::probe(const FtpEndpoint& endpoint, Completion done) {
  launch(io_, FtpSession::Op::Probe, endpoint, connect_timeout_, io_timeout_, logger_,
         std::move(done), [](FtpSession&){});
}

void FtpClient::upload(const FtpEndpoint& endpoint,
                       const fs::path& local_path,
                       const std::string& remote_dir,
                       FtpTransferOptions options,
                       Completion done) {
  launch(io_, FtpSession::Op::Upload, endpoint, connect_timeout_, io_timeout_, logger_,
         std::move(done), [&](FtpSession& s){
           s.local_path = local_path;
           s.remote_path = remote_dir;
           s.options = std::move(options);
         });
}

void FtpClient::download(const FtpEndpoint& endpoint,
                         const std::string& remote_path,
                         const fs::path& local_path,
                         FtpTransferOptions options,
                         Completion done) {
  launch(io_, FtpSession::Op::Download, endpoint, connect_timeout_, io_timeout_, logger_,
         std::move(done), [&](FtpSession& s){
           s.local_path = local_path;
           s.remote_path = remote_path;
           s.options = std::move(options);
         });
}

void FtpClient::list(const FtpEndpoint& endpoint, const std::string& remote_dir, Completion done) {
  launch(io_, FtpSession::Op::List, endpoint, connect_timeout_, io_timeout_, logger_,
         std::move(done), [&](FtpSession& s){ s.remote_path = remote_dir; });
}

void FtpClient::make_directory(const FtpEndpoint& endpoint, const std::string& remote_dir, Completion done) {
  launch(io_, FtpSession::Op::MakeDir, endpoint, connect_timeout_, io_timeout_, logger_,
         std::move(done), [&](FtpSession& s){ s.remote_path = remote_dir; });
}
