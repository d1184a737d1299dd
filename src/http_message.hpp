#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Header names are stored lowercased.
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string target;   // raw request target, e.g. "/docs/a%20b.txt?format=json"
  std::string path;     // url-decoded path component
  std::string query;    // raw query string without '?'
  std::string version;
  HttpHeaders headers;

  std::string header(const std::string& name) const;
  std::optional<std::string> query_param(const std::string& name) const;
  std::optional<uint64_t> content_length() const;
  bool keep_alive() const;
};

struct HttpResponse {
  int status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  void set_header(const std::string& name, const std::string& value);
  std::optional<std::string> header(const std::string& name) const;

  // Status line and headers. Content-Length is appended from body when
  // content_length is empty.
  std::string serialize_head(std::optional<uint64_t> content_length = std::nullopt) const;
};

// Parsed response head on the client side.
struct HttpResponseHead {
  int status = 0;
  std::string reason;
  HttpHeaders headers;

  std::string header(const std::string& name) const;
};

const char* http_status_text(int status);
std::string mime_type_for(const std::string& path);

// Parses "METHOD target HTTP/1.x\r\nName: value\r\n..." up to but not
// including the blank line. Returns nullopt for malformed input.
std::optional<HttpRequest> parse_request_head(const std::string& head);
std::optional<HttpResponseHead> parse_response_head(const std::string& head);

struct Url {
  std::string scheme;   // "http" or "https"
  std::string host;
  uint16_t port = 0;
  std::string target = "/";

  bool secure() const { return scheme == "https"; }
  std::string host_header() const;
};

std::optional<Url> parse_url(const std::string& url);

// "multipart/form-data; boundary=xyz" -> "xyz".
std::optional<std::string> multipart_boundary(const std::string& content_type);

// key="value" pairs of a header like Content-Disposition.
std::map<std::string, std::string> parse_header_params(const std::string& value);

// Incremental multipart/form-data reader. Part bodies are handed out as they
// arrive so uploads never have to fit in memory.
class MultipartParser {
public:
  struct Part {
    HttpHeaders headers;
    std::string name;
    std::string filename;
    std::string content_type;
  };

  struct Handler {
    std::function<void(const Part&)> on_part_begin;
    std::function<void(const char*, std::size_t)> on_part_data;
    std::function<void()> on_part_end;
  };

  MultipartParser(const std::string& boundary, Handler handler);

  void feed(const char* data, std::size_t size);

  bool done() const { return state_ == State::Done; }
  bool failed() const { return state_ == State::Error; }
  const std::string& error() const { return error_; }

private:
  enum class State { Preamble, AfterBoundary, Headers, Body, Done, Error };

  static constexpr std::size_t kMaxPartHeaderBytes = 16 * 1024;

  void fail(const std::string& message);
  bool parse_part_headers(const std::string& block, Part& part);

  Handler handler_;
  std::string delimiter_;
  std::string buf_;
  State state_ = State::Preamble;
  std::string error_;
};

// Builds the framing around a single streamed file part.
struct MultipartEnvelope {
  std::string boundary;
  std::string prefix;
  std::string suffix;

  static MultipartEnvelope for_file(const std::string& field_name,
                                    const std::string& filename,
                                    const std::string& content_type);
  std::string content_type() const;
};

// Transfer-Encoding: chunked body decoder.
class ChunkedDecoder {
public:
  using Sink = std::function<void(const char*, std::size_t)>;

  explicit ChunkedDecoder(Sink sink) : sink_(std::move(sink)) {}

  // Returns false on malformed framing.
  bool feed(const char* data, std::size_t size);
  bool done() const { return state_ == State::Done; }

private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  Sink sink_;
  State state_ = State::Size;
  std::string line_;
  uint64_t remaining_ = 0;
};
