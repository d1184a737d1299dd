#include "sharing_server.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <vector>

#include "errors.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "net_address.hpp"
#include "share_registry.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kMaxHeadBytes = 64 * 1024;
const std::string kUploadTempPrefix = ".upload-";

bool is_within(const fs::path& root, const fs::path& candidate) {
  auto c = candidate.begin();
  for(auto r = root.begin(); r != root.end(); ++r, ++c) {
    if(c == candidate.end() || *r != *c) return false;
  }
  return true;
}

// Upload file names are reduced to their last path component.
std::string upload_basename(std::string name) {
  std::replace(name.begin(), name.end(), '\\', '/');
  auto slash = name.rfind('/');
  if(slash != std::string::npos) name = name.substr(slash + 1);
  name = trim_copy(name);
  if(name == "." || name == ".." || name.find('\0') != std::string::npos) return std::string();
  return name;
}

void add_cors(HttpResponse& res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(asio::ip::tcp::socket socket, std::shared_ptr<SharingServerContext> ctx)
    : socket_(std::move(socket)),
      timer_(socket_.get_executor()),
      ctx_(std::move(ctx)),
      buf_(kMaxHeadBytes) {
    ctx_->sessions++;
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
  }

  ~HttpSession() {
    discard_upload_temp();
    ctx_->sessions--;
  }

  void start() { read_head(); }

private:
  struct Upload {
    std::unique_ptr<MultipartParser> parser;
    std::unique_ptr<ChunkedDecoder> chunked;
    std::optional<uint64_t> remaining;     // unset for chunked bodies
    uint64_t decoded = 0;
    std::ofstream out;
    fs::path temp_path;
    fs::path final_path;
    std::string part_name;
    uint64_t part_bytes = 0;
    bool skipping = false;
    std::vector<std::string> saved;
    int error_status = 0;
    std::string error;
  };

  Logger& log() { return *ctx_->logger; }

  void arm() {
    timer_.expires_after(ctx_->io_timeout);
    auto self = shared_from_this();
    timer_.async_wait([this, self](std::error_code ec){
      if(ec) return;
      log().debug("Session {} timed out", remote_);
      close();
    });
  }

  void close() {
    std::error_code ignored;
    timer_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  // Half-close, then drain whatever the client still sends so unread
  // request bytes do not turn the close into a reset that eats the response.
  void finish() {
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
    arm();
    drain();
  }

  void drain() {
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(read_chunk_), [this, self](std::error_code ec, std::size_t){
      if(ec) {
        close();
        return;
      }
      drain();
    });
  }

  void read_head() {
    arm();
    auto self = shared_from_this();
    asio::async_read_until(socket_, buf_, "\r\n\r\n",
      [this, self](std::error_code ec, std::size_t head_bytes){
        if(ec) {
          if(ec == asio::error::not_found) {
            send_error(431, "request head too large");
          } else {
            close();
          }
          return;
        }
        std::string head(asio::buffers_begin(buf_.data()),
                         asio::buffers_begin(buf_.data()) + head_bytes);
        buf_.consume(head_bytes);
        auto request = parse_request_head(head);
        if(!request) {
          log().warn("Malformed request from {}", remote_);
          send_error(400, "malformed request");
          return;
        }
        try {
          handle(*request);
        } catch(const std::exception& e) {
          log().error("Handler for {} {} failed: {}", request->method, request->target, e.what());
          send_error(500, "Internal Server Error");
        }
      });
  }

  void handle(const HttpRequest& request) {
    log().debug("{} {} {}", remote_, request.method, request.target);
    head_only_ = request.method == "HEAD";
    if(request.method == "OPTIONS") {
      HttpResponse res;
      res.status = 204;
      send(std::move(res));
      return;
    }
    if(request.method == "POST") {
      if(request.path == "/upload") {
        begin_upload(request);
      } else {
        send_error(404, "Not Found");
      }
      return;
    }
    if(request.method != "GET" && request.method != "HEAD") {
      HttpResponse res;
      res.status = 405;
      res.set_header("Allow", "GET, HEAD, POST, OPTIONS");
      res.set_header("Content-Type", "text/plain; charset=utf-8");
      res.body = "Method Not Allowed\n";
      send(std::move(res));
      return;
    }

    if(ctx_->shares && request.path.rfind("/file/", 0) == 0) {
      serve_single_share(request.path.substr(6));
      return;
    }
    if(ctx_->shares && request.path.rfind("/files/", 0) == 0) {
      serve_multi_share(request.path.substr(7));
      return;
    }

    auto resolved = resolve(request.path);
    std::error_code ec;
    if(!resolved || !fs::exists(*resolved, ec)) {
      send_error(404, "Not Found");
      return;
    }
    if(fs::is_directory(*resolved, ec)) {
      serve_listing(request, *resolved);
      return;
    }
    if(!fs::is_regular_file(*resolved, ec)) {
      send_error(404, "Not Found");
      return;
    }
    serve_file(*resolved, resolved->filename().string(), false, nullptr);
  }

  std::optional<fs::path> resolve(const std::string& url_path) {
    auto rel = url_path;
    while(!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    if(rel.find('\0') != std::string::npos) return std::nullopt;
    if(rel.empty()) return ctx_->root;
    std::error_code ec;
    auto candidate = fs::weakly_canonical(ctx_->root / rel, ec);
    if(ec) return std::nullopt;
    if(!is_within(ctx_->root, candidate)) {
      log().warn("Rejected path outside the served root from {}: {}", remote_, url_path);
      return std::nullopt;
    }
    return candidate;
  }

  void serve_listing(const HttpRequest& request, const fs::path& dir) {
    struct Item { std::string name; bool directory; uint64_t size; };
    std::vector<Item> items;
    std::error_code ec;
    for(fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      auto name = it->path().filename().string();
      if(name.rfind(kUploadTempPrefix, 0) == 0) continue;
      std::error_code entry_ec;
      bool directory = it->is_directory(entry_ec);
      uint64_t size = directory ? 0 : it->file_size(entry_ec);
      items.push_back({name, directory, entry_ec ? 0 : size});
    }
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b){ return a.name < b.name; });

    auto rel = fs::relative(dir, ctx_->root, ec).generic_string();
    std::string prefix = "/";
    if(!ec && rel != ".") prefix += rel + "/";

    bool want_json = request.query_param("format").value_or("") == "json"
                  || request.header("accept").find("application/json") != std::string::npos;
    HttpResponse res;
    if(want_json) {
      json entries = json::array();
      for(const auto& item : items) {
        entries.push_back({
          {"name", item.name},
          {"type", item.directory ? "directory" : "file"},
          {"size", item.size},
          {"href", url_encode(prefix + item.name)},
        });
      }
      res.set_header("Content-Type", "application/json");
      res.body = json{{"path", prefix}, {"entries", entries}}.dump();
    } else {
      std::ostringstream html;
      html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>Index of "
           << html_escape(prefix) << "</title></head>\n<body>\n<h1>Index of "
           << html_escape(prefix) << "</h1>\n"
           << "<form method=\"post\" action=\"/upload\" enctype=\"multipart/form-data\">"
           << "<input type=\"file\" name=\"file\" multiple> <button type=\"submit\">Upload</button></form>\n<ul>\n";
      if(prefix != "/") html << "<li><a href=\"../\">..</a></li>\n";
      for(const auto& item : items) {
        html << "<li><a href=\"" << html_escape(url_encode(prefix + item.name)) << (item.directory ? "/" : "")
             << "\">" << html_escape(item.name) << (item.directory ? "/" : "") << "</a>";
        if(!item.directory) html << " (" << item.size << " bytes)";
        html << "</li>\n";
      }
      html << "</ul>\n</body></html>\n";
      res.set_header("Content-Type", "text/html; charset=utf-8");
      res.body = html.str();
    }
    send(std::move(res));
  }

  void serve_single_share(const std::string& share_id) {
    ShareRecord record;
    if(!open_share(share_id, record)) return;
    if(record.file_paths.empty()) {
      send_error(404, "Not Found");
      return;
    }
    auto name = record.file_names.empty() ? record.file_paths.front().filename().string() : record.file_names.front();
    serve_file(record.file_paths.front(), name, true, [this, share_id](){ count_download(share_id); });
  }

  void serve_multi_share(const std::string& rest) {
    auto slash = rest.find('/');
    auto share_id = rest.substr(0, slash);
    ShareRecord record;
    if(!open_share(share_id, record)) return;

    if(slash == std::string::npos || slash + 1 == rest.size()) {
      json files = json::array();
      for(std::size_t i = 0; i < record.file_paths.size(); ++i) {
        std::error_code ec;
        auto size = fs::file_size(record.file_paths[i], ec);
        files.push_back({
          {"index", i},
          {"name", i < record.file_names.size() ? record.file_names[i] : record.file_paths[i].filename().string()},
          {"size", ec ? 0 : size},
          {"href", "/files/" + share_id + "/" + std::to_string(i)},
        });
      }
      HttpResponse res;
      res.set_header("Content-Type", "application/json");
      res.body = json{{"shareId", share_id}, {"fileSize", record.file_size}, {"files", files}}.dump();
      send(std::move(res));
      return;
    }

    std::size_t index = 0;
    try {
      std::size_t used = 0;
      index = std::stoul(rest.substr(slash + 1), &used);
      if(used != rest.size() - slash - 1) throw std::invalid_argument("trailing characters");
    } catch(const std::logic_error&) {
      send_error(404, "Not Found");
      return;
    }
    if(index >= record.file_paths.size()) {
      send_error(404, "Not Found");
      return;
    }
    auto name = index < record.file_names.size() ? record.file_names[index] : record.file_paths[index].filename().string();
    serve_file(record.file_paths[index], name, true, [this, share_id](){ count_download(share_id); });
  }

  bool open_share(const std::string& share_id, ShareRecord& record) {
    try {
      record = ctx_->shares->open_share(share_id);
      return true;
    } catch(const ShareExpiredError&) {
      send_error(410, "This share link has expired");
    } catch(const NotFoundError&) {
      send_error(404, "Not Found");
    }
    return false;
  }

  void count_download(const std::string& share_id) {
    if(head_only_) return;
    try {
      ctx_->shares->record_download(share_id);
    } catch(const EngineError& e) {
      log().warn("Could not count download of share {}: {}", share_id, e.what());
    }
  }

  void serve_file(const fs::path& path, const std::string& name, bool attachment, std::function<void()> on_complete) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if(ec) {
      send_error(404, "Not Found");
      return;
    }
    HttpResponse res;
    add_cors(res);
    res.set_header("Content-Type", mime_type_for(name));
    res.set_header("Content-Disposition",
                   std::string(attachment ? "attachment" : "inline") + "; filename=\"" + header_safe_filename(name) + "\"");
    res.set_header("Connection", "close");

    if(!head_only_) {
      file_.open(path, std::ios::binary);
      if(!file_) {
        log().error("Cannot open {} for {}", path.string(), remote_);
        send_error(500, "Internal Server Error");
        return;
      }
    }
    file_remaining_ = head_only_ ? 0 : size;
    on_sent_ = std::move(on_complete);
    out_ = res.serialize_head(size);
    log().info("Serving {} ({} bytes) to {}", name, size, remote_);

    arm();
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(out_), [this, self](std::error_code ec, std::size_t){
      if(ec) {
        log().debug("Write to {} failed: {}", remote_, ec.message());
        close();
        return;
      }
      write_file_chunk();
    });
  }

  void write_file_chunk() {
    if(file_remaining_ == 0) {
      if(on_sent_) on_sent_();
      finish();
      return;
    }
    chunk_.resize(kChunkSize);
    auto want = static_cast<std::streamsize>(std::min<uint64_t>(chunk_.size(), file_remaining_));
    file_.read(chunk_.data(), want);
    auto got = file_.gcount();
    if(got <= 0) {
      log().error("File shrank while serving to {}", remote_);
      close();
      return;
    }
    file_remaining_ -= static_cast<uint64_t>(got);
    arm();
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(chunk_.data(), static_cast<std::size_t>(got)),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          log().debug("Write to {} failed: {}", remote_, ec.message());
          close();
          return;
        }
        write_file_chunk();
      });
  }

  void begin_upload(const HttpRequest& request) {
    auto boundary = multipart_boundary(request.header("content-type"));
    if(!boundary) {
      send_json(400, "error", "Content-Type must be multipart/form-data with a boundary");
      return;
    }
    upload_ = std::make_unique<Upload>();
    bool chunked = to_lower(request.header("transfer-encoding")).find("chunked") != std::string::npos;
    if(!chunked) {
      auto length = request.content_length();
      if(!length) {
        send_json(411, "error", "Content-Length required");
        return;
      }
      if(*length > ctx_->max_upload_bytes) {
        log().warn("Rejected {} byte upload from {}", *length, remote_);
        send_json(413, "error", "Upload exceeds the size limit");
        return;
      }
      upload_->remaining = *length;
    }

    MultipartParser::Handler handler;
    handler.on_part_begin = [this](const MultipartParser::Part& part){ on_part_begin(part); };
    handler.on_part_data = [this](const char* data, std::size_t size){ on_part_data(data, size); };
    handler.on_part_end = [this](){ on_part_end(); };
    upload_->parser = std::make_unique<MultipartParser>(*boundary, std::move(handler));
    if(chunked) {
      upload_->chunked = std::make_unique<ChunkedDecoder>([this](const char* data, std::size_t size){
        upload_->decoded += size;
        upload_->parser->feed(data, size);
      });
    }

    // Body bytes that arrived together with the head.
    if(buf_.size() > 0) {
      std::string early(asio::buffers_begin(buf_.data()), asio::buffers_end(buf_.data()));
      buf_.consume(buf_.size());
      if(!consume_body(early.data(), early.size())) return;
    }
    if(body_complete()) {
      finish_upload();
      return;
    }
    read_body();
  }

  bool body_complete() const {
    if(upload_->chunked) return upload_->chunked->done();
    return upload_->remaining && *upload_->remaining == 0;
  }

  // Returns false when a response has already been sent.
  bool consume_body(const char* data, std::size_t size) {
    if(upload_->remaining) {
      size = static_cast<std::size_t>(std::min<uint64_t>(size, *upload_->remaining));
      *upload_->remaining -= size;
      upload_->parser->feed(data, size);
    } else if(!upload_->chunked->feed(data, size)) {
      fail_upload(400, "malformed chunked body");
      return false;
    } else if(upload_->decoded > ctx_->max_upload_bytes) {
      fail_upload(413, "Upload exceeds the size limit");
      return false;
    }
    if(upload_->error_status != 0) {
      fail_upload(upload_->error_status, upload_->error);
      return false;
    }
    if(upload_->parser->failed()) {
      fail_upload(400, upload_->parser->error());
      return false;
    }
    return true;
  }

  void read_body() {
    arm();
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(read_chunk_),
      [this, self](std::error_code ec, std::size_t n){
        if(ec) {
          log().warn("Upload from {} aborted: {}", remote_, ec.message());
          discard_upload_temp();
          close();
          return;
        }
        try {
          if(!consume_body(read_chunk_.data(), n)) return;
          if(body_complete()) {
            finish_upload();
          } else {
            read_body();
          }
        } catch(const std::exception& e) {
          log().error("Upload from {} failed: {}", remote_, e.what());
          discard_upload_temp();
          send_json(500, "error", "Internal server error");
        }
      });
  }

  void on_part_begin(const MultipartParser::Part& part) {
    auto& up = *upload_;
    if(up.error_status != 0) return;
    if(part.filename.empty()) {
      up.skipping = true;
      return;
    }
    auto name = upload_basename(part.filename);
    if(name.empty()) {
      up.error_status = 400;
      up.error = "invalid file name";
      up.skipping = true;
      return;
    }
    up.skipping = false;
    up.part_name = name;
    up.part_bytes = 0;
    up.final_path = ctx_->root / name;
    up.temp_path = ctx_->root / (kUploadTempPrefix + random_hex(6) + ".tmp");
    up.out.open(up.temp_path, std::ios::binary | std::ios::trunc);
    if(!up.out) {
      up.error_status = 500;
      up.error = "cannot store upload";
      up.skipping = true;
    }
  }

  void on_part_data(const char* data, std::size_t size) {
    auto& up = *upload_;
    if(up.skipping || up.error_status != 0) return;
    up.out.write(data, static_cast<std::streamsize>(size));
    up.part_bytes += size;
    if(!up.out) {
      up.error_status = 500;
      up.error = "cannot store upload";
    }
  }

  void on_part_end() {
    auto& up = *upload_;
    if(up.skipping || up.error_status != 0) {
      up.skipping = false;
      return;
    }
    up.out.close();
    std::error_code ec;
    fs::rename(up.temp_path, up.final_path, ec);
    if(ec) {
      up.error_status = 500;
      up.error = "cannot store upload";
      fs::remove(up.temp_path, ec);
      return;
    }
    up.temp_path.clear();
    up.saved.push_back(up.part_name);
    log().info("Received {} ({} bytes) from {}", up.part_name, up.part_bytes, remote_);
  }

  void discard_upload_temp() {
    if(!upload_ || upload_->temp_path.empty()) return;
    if(upload_->out.is_open()) upload_->out.close();
    std::error_code ec;
    fs::remove(upload_->temp_path, ec);
    upload_->temp_path.clear();
  }

  void fail_upload(int status, const std::string& message) {
    discard_upload_temp();
    log().warn("Upload from {} rejected ({}): {}", remote_, status, message);
    send_json(status, "error", message);
  }

  void finish_upload() {
    if(!upload_->parser->done()) {
      fail_upload(400, "incomplete multipart body");
      return;
    }
    if(upload_->saved.empty()) {
      fail_upload(400, "no file parts in upload");
      return;
    }
    HttpResponse res;
    res.set_header("Content-Type", "application/json");
    res.body = json{
      {"status", "success"},
      {"message", "Files uploaded successfully"},
      {"files", upload_->saved},
    }.dump();
    send(std::move(res));
  }

  void send_json(int status, const std::string& outcome, const std::string& message) {
    HttpResponse res;
    res.status = status;
    res.set_header("Content-Type", "application/json");
    res.body = json{{"status", outcome}, {"message", message}}.dump();
    send(std::move(res));
  }

  void send_error(int status, const std::string& message) {
    HttpResponse res;
    res.status = status;
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    res.body = message + "\n";
    send(std::move(res));
  }

  void send(HttpResponse res) {
    add_cors(res);
    res.set_header("Connection", "close");
    out_ = res.serialize_head();
    if(!head_only_) out_ += res.body;
    arm();
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(out_), [this, self](std::error_code ec, std::size_t){
      if(ec) {
        log().debug("Write to {} failed: {}", remote_, ec.message());
        close();
        return;
      }
      finish();
    });
  }

  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  std::shared_ptr<SharingServerContext> ctx_;
  asio::streambuf buf_;
  std::string remote_;
  bool head_only_ = false;

  std::string out_;
  std::ifstream file_;
  uint64_t file_remaining_ = 0;
  std::vector<char> chunk_;
  std::function<void()> on_sent_;

  std::array<char, kChunkSize> read_chunk_{};
  std::unique_ptr<Upload> upload_;
};

} // namespace

const char* to_string(ServerStatus status) {
  switch(status) {
    case ServerStatus::Stopped: return "stopped";
    case ServerStatus::Starting: return "starting";
    case ServerStatus::Running: return "running";
    case ServerStatus::Stopping: return "stopping";
  }
  return "stopped";
}

json ServerState::to_json() const {
  return json{
    {"status", to_string(status)},
    {"isRunning", is_running()},
    {"bindAddress", bind_address},
    {"port", port},
    {"rootPath", root_path.string()},
    {"serverUrl", server_url},
  };
}

LocalSharingServer::LocalSharingServer(asio::io_context& io,
                                       EngineConfig config,
                                       std::shared_ptr<AddressResolver> resolver,
                                       std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    resolver_(std::move(resolver)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sharing-server")) {}

LocalSharingServer::~LocalSharingServer() {
  stop();
}

void LocalSharingServer::attach_share_registry(std::shared_ptr<ShareLinkRegistry> shares) {
  std::lock_guard lg(m_);
  shares_ = std::move(shares);
}

std::string LocalSharingServer::url_host(const std::string& bind_address) const {
  if(bind_address.empty() || bind_address == "0.0.0.0" || bind_address == "::") {
    std::optional<std::string> ip;
    if(resolver_) ip = resolver_->local_ip();
    return ip.value_or("127.0.0.1");
  }
  return bind_address;
}

ServerState LocalSharingServer::start(const fs::path& root, std::optional<uint16_t> port) {
  ServerState starting;
  std::shared_ptr<ShareLinkRegistry> shares;
  {
    std::lock_guard lg(m_);
    if(state_.status != ServerStatus::Stopped) {
      throw ServerError("sharing server is already " + std::string(to_string(state_.status))
                        + " on port " + std::to_string(state_.port));
    }
    std::error_code ec;
    auto canonical = fs::canonical(root, ec);
    if(ec || !fs::is_directory(canonical, ec)) {
      throw ServerError("root is not a directory: " + root.string());
    }
    state_.status = ServerStatus::Starting;
    state_.root_path = canonical;
    state_.bind_address = config_.server_bind_address;
    state_.port = port.value_or(config_.server_port);
    state_.server_url.clear();
    starting = state_;
    shares = shares_;
  }
  state_listeners_.notify(starting);

  auto acceptor = std::make_shared<asio::ip::tcp::acceptor>(io_);
  try {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(starting.bind_address), starting.port);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor->bind(endpoint);
    acceptor->listen();
  } catch(const std::system_error& e) {
    ServerState stopped;
    {
      std::lock_guard lg(m_);
      state_ = ServerState{};
      stopped = state_;
    }
    state_listeners_.notify(stopped);
    logger_->error("Cannot bind {}:{}: {}", starting.bind_address, starting.port, e.what());
    throw ServerError("cannot bind " + starting.bind_address + ":" + std::to_string(starting.port) + ": " + e.what());
  }

  auto ctx = std::make_shared<SharingServerContext>();
  ctx->root = starting.root_path;
  ctx->max_upload_bytes = config_.max_upload_bytes;
  ctx->io_timeout = config_.io_timeout;
  ctx->shares = std::move(shares);
  ctx->logger = logger_;

  ServerState running;
  uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    generation = ++generation_;
    acceptor_ = acceptor;
    context_ = ctx;
    state_.port = acceptor->local_endpoint().port();
    state_.server_url = "http://" + url_host(state_.bind_address) + ":" + std::to_string(state_.port);
    state_.status = ServerStatus::Running;
    running = state_;
    do_accept(acceptor, generation);
  }
  logger_->info("Serving {} at {}", running.root_path.string(), running.server_url);
  state_listeners_.notify(running);
  return running;
}

void LocalSharingServer::do_accept(std::shared_ptr<asio::ip::tcp::acceptor> acceptor, uint64_t generation) {
  acceptor->async_accept([this, acceptor, generation](std::error_code ec, asio::ip::tcp::socket socket){
    if(ec == asio::error::operation_aborted || !acceptor->is_open()) return;
    std::shared_ptr<SharingServerContext> ctx;
    {
      std::lock_guard lg(m_);
      if(generation != generation_ || state_.status != ServerStatus::Running) return;
      ctx = context_;
      if(ec) {
        logger_->warn("Accept failed: {}", ec.message());
      } else {
        std::make_shared<HttpSession>(std::move(socket), ctx)->start();
      }
      do_accept(acceptor, generation);
    }
  });
}

void LocalSharingServer::stop() {
  std::shared_ptr<asio::ip::tcp::acceptor> acceptor;
  ServerState stopping;
  {
    std::lock_guard lg(m_);
    if(state_.status != ServerStatus::Running) return;
    state_.status = ServerStatus::Stopping;
    stopping = state_;
    acceptor = std::move(acceptor_);
    context_.reset();
    ++generation_;
  }
  state_listeners_.notify(stopping);

  if(acceptor) {
    std::error_code ec;
    acceptor->close(ec);
    if(ec) logger_->warn("Closing listener failed: {}", ec.message());
  }

  ServerState stopped;
  {
    std::lock_guard lg(m_);
    state_ = ServerState{};
    stopped = state_;
  }
  logger_->info("Sharing server stopped (was {})", stopping.server_url);
  state_listeners_.notify(stopped);
}

ServerState LocalSharingServer::state() const {
  std::lock_guard lg(m_);
  return state_;
}

bool LocalSharingServer::running() const {
  std::lock_guard lg(m_);
  return state_.status == ServerStatus::Running;
}

std::size_t LocalSharingServer::open_sessions() const {
  std::lock_guard lg(m_);
  return context_ ? context_->sessions.load() : 0;
}

SubscriptionHandle LocalSharingServer::on_server_state_changed(std::function<void(const ServerState&)> listener) {
  return state_listeners_.add(std::move(listener));
}

void LocalSharingServer::remove_state_listener(SubscriptionHandle handle) {
  state_listeners_.remove(handle);
}
