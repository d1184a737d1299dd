#include "http_message.hpp"

#include <algorithm>
#include <sstream>

#include "utils.hpp"

namespace {

bool parse_header_lines(std::istringstream& in, HttpHeaders& headers) {
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) return false;
    auto name = to_lower(trim_copy(line.substr(0, colon)));
    auto value = trim_copy(line.substr(colon + 1));
    auto it = headers.find(name);
    if(it != headers.end()) {
      it->second += ", " + value;
    } else {
      headers.emplace(std::move(name), std::move(value));
    }
  }
  return true;
}

std::string lookup(const HttpHeaders& headers, const std::string& name) {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
  return lookup(headers, name);
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
  std::stringstream ss(query);
  std::string pair;
  while(std::getline(ss, pair, '&')) {
    auto eq = pair.find('=');
    auto key = url_decode(pair.substr(0, eq));
    if(key != name) continue;
    if(eq == std::string::npos) return std::string();
    return url_decode(pair.substr(eq + 1));
  }
  return std::nullopt;
}

std::optional<uint64_t> HttpRequest::content_length() const {
  auto value = header("content-length");
  if(value.empty()) return std::nullopt;
  try {
    std::size_t consumed = 0;
    auto parsed = std::stoull(value, &consumed);
    if(consumed != value.size()) return std::nullopt;
    return parsed;
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

bool HttpRequest::keep_alive() const {
  auto connection = to_lower(header("connection"));
  if(version == "HTTP/1.0") return connection == "keep-alive";
  return connection != "close";
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
  auto lowered = to_lower(name);
  for(auto& entry : headers) {
    if(to_lower(entry.first) == lowered) {
      entry.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  auto lowered = to_lower(name);
  for(const auto& entry : headers) {
    if(to_lower(entry.first) == lowered) return entry.second;
  }
  return std::nullopt;
}

std::string HttpResponse::serialize_head(std::optional<uint64_t> content_length) const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << ' ' << http_status_text(status) << "\r\n";
  for(const auto& entry : headers) {
    if(to_lower(entry.first) == "content-length") continue;
    out << entry.first << ": " << entry.second << "\r\n";
  }
  out << "Content-Length: " << (content_length ? *content_length : body.size()) << "\r\n";
  out << "\r\n";
  return out.str();
}

std::string HttpResponseHead::header(const std::string& name) const {
  return lookup(headers, name);
}

const char* http_status_text(int status) {
  switch(status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 410: return "Gone";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

std::string mime_type_for(const std::string& path) {
  auto dot = path.rfind('.');
  auto slash = path.find_last_of("/\\");
  if(dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return "application/octet-stream";
  }
  static const std::map<std::string, std::string> kTypes = {
    {"html", "text/html"},
    {"htm", "text/html"},
    {"css", "text/css"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"txt", "text/plain"},
    {"pdf", "application/pdf"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"svg", "image/svg+xml"},
    {"mp4", "video/mp4"},
    {"mp3", "audio/mpeg"},
    {"zip", "application/zip"},
  };
  auto it = kTypes.find(to_lower(path.substr(dot + 1)));
  return it == kTypes.end() ? "application/octet-stream" : it->second;
}

std::optional<HttpRequest> parse_request_head(const std::string& head) {
  std::istringstream in(head);
  std::string request_line;
  if(!std::getline(in, request_line)) return std::nullopt;
  if(!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

  HttpRequest req;
  std::istringstream rl(request_line);
  if(!(rl >> req.method >> req.target >> req.version)) return std::nullopt;
  std::string extra;
  if(rl >> extra) return std::nullopt;
  if(req.version != "HTTP/1.1" && req.version != "HTTP/1.0") return std::nullopt;
  if(req.target.empty() || req.target.front() != '/') return std::nullopt;

  auto qpos = req.target.find('?');
  req.path = url_decode(req.target.substr(0, qpos), false);
  if(qpos != std::string::npos) req.query = req.target.substr(qpos + 1);
  if(!parse_header_lines(in, req.headers)) return std::nullopt;
  return req;
}

std::optional<HttpResponseHead> parse_response_head(const std::string& head) {
  std::istringstream in(head);
  std::string status_line;
  if(!std::getline(in, status_line)) return std::nullopt;
  if(!status_line.empty() && status_line.back() == '\r') status_line.pop_back();
  if(status_line.compare(0, 5, "HTTP/") != 0) return std::nullopt;

  auto sp1 = status_line.find(' ');
  if(sp1 == std::string::npos) return std::nullopt;
  auto sp2 = status_line.find(' ', sp1 + 1);
  HttpResponseHead out;
  try {
    out.status = std::stoi(status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1));
  } catch(const std::exception&) {
    return std::nullopt;
  }
  if(sp2 != std::string::npos) out.reason = status_line.substr(sp2 + 1);
  if(!parse_header_lines(in, out.headers)) return std::nullopt;
  return out;
}

std::string Url::host_header() const {
  bool default_port = (secure() && port == 443) || (!secure() && port == 80);
  return default_port ? host : host + ":" + std::to_string(port);
}

std::optional<Url> parse_url(const std::string& url) {
  auto scheme_end = url.find("://");
  if(scheme_end == std::string::npos) return std::nullopt;
  Url out;
  out.scheme = to_lower(url.substr(0, scheme_end));
  if(out.scheme != "http" && out.scheme != "https") return std::nullopt;
  out.port = out.secure() ? 443 : 80;

  auto rest = url.substr(scheme_end + 3);
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if(slash != std::string::npos) out.target = rest.substr(slash);
  auto at = authority.rfind('@');
  if(at != std::string::npos) authority = authority.substr(at + 1);

  auto colon = authority.rfind(':');
  if(colon != std::string::npos && authority.find(']') == std::string::npos) {
    try {
      int port = std::stoi(authority.substr(colon + 1));
      if(port <= 0 || port > 65535) return std::nullopt;
      out.port = static_cast<uint16_t>(port);
    } catch(const std::exception&) {
      return std::nullopt;
    }
    authority = authority.substr(0, colon);
  }
  if(authority.empty()) return std::nullopt;
  out.host = authority;
  return out;
}

std::map<std::string, std::string> parse_header_params(const std::string& value) {
  std::map<std::string, std::string> params;
  std::size_t pos = 0;
  while(pos <= value.size()) {
    // quoted values may contain ';'
    std::size_t end = pos;
    bool quoted = false;
    while(end < value.size() && (quoted || value[end] != ';')) {
      if(value[end] == '"') quoted = !quoted;
      ++end;
    }
    auto item = trim_copy(value.substr(pos, end - pos));
    auto eq = item.find('=');
    if(eq != std::string::npos) {
      auto key = to_lower(trim_copy(item.substr(0, eq)));
      auto val = trim_copy(item.substr(eq + 1));
      if(val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.size() - 2);
      }
      params[key] = val;
    }
    pos = end + 1;
  }
  return params;
}

std::optional<std::string> multipart_boundary(const std::string& content_type) {
  auto lowered = to_lower(content_type);
  if(lowered.compare(0, 19, "multipart/form-data") != 0) return std::nullopt;
  auto params = parse_header_params(content_type);
  auto it = params.find("boundary");
  if(it == params.end() || it->second.empty() || it->second.size() > 70) return std::nullopt;
  return it->second;
}

MultipartParser::MultipartParser(const std::string& boundary, Handler handler)
  : handler_(std::move(handler)),
    delimiter_("\r\n--" + boundary),
    buf_("\r\n") {}

void MultipartParser::fail(const std::string& message) {
  state_ = State::Error;
  error_ = message;
  buf_.clear();
}

bool MultipartParser::parse_part_headers(const std::string& block, Part& part) {
  std::istringstream in(block);
  if(!parse_header_lines(in, part.headers)) return false;
  auto disposition = lookup(part.headers, "content-disposition");
  if(disposition.empty()) return false;
  auto params = parse_header_params(disposition);
  part.name = params.count("name") ? params["name"] : std::string();
  part.filename = params.count("filename") ? params["filename"] : std::string();
  part.content_type = lookup(part.headers, "content-type");
  return true;
}

void MultipartParser::feed(const char* data, std::size_t size) {
  if(state_ == State::Done || state_ == State::Error) return;
  buf_.append(data, size);

  bool progress = true;
  while(progress) {
    progress = false;
    switch(state_) {
      case State::Preamble: {
        auto pos = buf_.find(delimiter_);
        if(pos == std::string::npos) {
          if(buf_.size() > delimiter_.size()) buf_.erase(0, buf_.size() - delimiter_.size());
          break;
        }
        buf_.erase(0, pos + delimiter_.size());
        state_ = State::AfterBoundary;
        progress = true;
        break;
      }
      case State::AfterBoundary: {
        if(buf_.size() < 2) break;
        if(buf_.compare(0, 2, "--") == 0) {
          state_ = State::Done;
          buf_.clear();
          break;
        }
        if(buf_.compare(0, 2, "\r\n") != 0) {
          fail("malformed multipart boundary line");
          break;
        }
        buf_.erase(0, 2);
        state_ = State::Headers;
        progress = true;
        break;
      }
      case State::Headers: {
        Part part;
        if(buf_.compare(0, 2, "\r\n") == 0) {
          fail("multipart part without headers");
          break;
        }
        auto pos = buf_.find("\r\n\r\n");
        if(pos == std::string::npos) {
          if(buf_.size() > kMaxPartHeaderBytes) fail("multipart part headers too large");
          break;
        }
        if(!parse_part_headers(buf_.substr(0, pos), part)) {
          fail("malformed multipart part headers");
          break;
        }
        buf_.erase(0, pos + 4);
        state_ = State::Body;
        if(handler_.on_part_begin) handler_.on_part_begin(part);
        progress = true;
        break;
      }
      case State::Body: {
        auto pos = buf_.find(delimiter_);
        if(pos == std::string::npos) {
          // hold back a possible partial delimiter
          if(buf_.size() >= delimiter_.size()) {
            auto n = buf_.size() - delimiter_.size() + 1;
            if(handler_.on_part_data) handler_.on_part_data(buf_.data(), n);
            buf_.erase(0, n);
          }
          break;
        }
        if(pos > 0 && handler_.on_part_data) handler_.on_part_data(buf_.data(), pos);
        if(handler_.on_part_end) handler_.on_part_end();
        buf_.erase(0, pos + delimiter_.size());
        state_ = State::AfterBoundary;
        progress = true;
        break;
      }
      case State::Done:
      case State::Error:
        break;
    }
  }
}

MultipartEnvelope MultipartEnvelope::for_file(const std::string& field_name,
                                              const std::string& filename,
                                              const std::string& content_type) {
  MultipartEnvelope env;
  env.boundary = "----lanshare" + random_hex(12);
  env.prefix = "--" + env.boundary + "\r\n"
    "Content-Disposition: form-data; name=\"" + field_name + "\"; filename=\""
    + header_safe_filename(filename) + "\"\r\n"
    "Content-Type: " + content_type + "\r\n\r\n";
  env.suffix = "\r\n--" + env.boundary + "--\r\n";
  return env;
}

std::string MultipartEnvelope::content_type() const {
  return "multipart/form-data; boundary=" + boundary;
}

bool ChunkedDecoder::feed(const char* data, std::size_t size) {
  std::size_t i = 0;
  while(i < size && state_ != State::Done) {
    switch(state_) {
      case State::Size: {
        line_.push_back(data[i++]);
        if(line_.size() > 1024) return false;
        if(line_.size() < 2 || line_.compare(line_.size() - 2, 2, "\r\n") != 0) break;
        auto spec = line_.substr(0, line_.size() - 2);
        line_.clear();
        auto semi = spec.find(';');
        spec = trim_copy(spec.substr(0, semi));
        if(spec.empty()) return false;
        try {
          std::size_t consumed = 0;
          remaining_ = std::stoull(spec, &consumed, 16);
          if(consumed != spec.size()) return false;
        } catch(const std::exception&) {
          return false;
        }
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        auto n = static_cast<std::size_t>(std::min<uint64_t>(remaining_, size - i));
        if(sink_) sink_(data + i, n);
        i += n;
        remaining_ -= n;
        if(remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        line_.push_back(data[i++]);
        if(line_.size() < 2) break;
        if(line_ != "\r\n") return false;
        line_.clear();
        state_ = State::Size;
        break;
      }
      case State::Trailer: {
        line_.push_back(data[i++]);
        if(line_.size() > 8192) return false;
        if(line_.size() < 2 || line_.compare(line_.size() - 2, 2, "\r\n") != 0) break;
        if(line_.size() == 2) state_ = State::Done;
        line_.clear();
        break;
      }
      case State::Done:
        break;
    }
  }
  return true;
}
