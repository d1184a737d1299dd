#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  Connectivity,   // unreachable host, refused, timeout
  Protocol,       // auth rejected, unsupported protocol/operation, bad reply
  Server,         // bind failure, already running, malformed request
  ShareExpired,
  NotFound        // missing local file, unknown share id, unknown task
};

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Connectivity: return "connectivity";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::Server: return "server";
    case ErrorKind::ShareExpired: return "share_expired";
    case ErrorKind::NotFound: return "not_found";
  }
  return "unknown";
}

class EngineError : public std::runtime_error {
public:
  EngineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ConnectivityError : public EngineError {
public:
  explicit ConnectivityError(const std::string& message)
    : EngineError(ErrorKind::Connectivity, message) {}
};

class ProtocolError : public EngineError {
public:
  explicit ProtocolError(const std::string& message)
    : EngineError(ErrorKind::Protocol, message) {}
};

class ServerError : public EngineError {
public:
  explicit ServerError(const std::string& message)
    : EngineError(ErrorKind::Server, message) {}
};

class ShareExpiredError : public EngineError {
public:
  explicit ShareExpiredError(const std::string& message)
    : EngineError(ErrorKind::ShareExpired, message) {}
};

class NotFoundError : public EngineError {
public:
  explicit NotFoundError(const std::string& message)
    : EngineError(ErrorKind::NotFound, message) {}
};
