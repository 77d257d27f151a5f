#pragma once

#include <stdexcept>
#include <string>

namespace cirrus::util {

/*
  Central error types.

  Every gateway failure carries an ErrorKind. The HTTP layer translates the
  kind to a status code (see internal/http/http_error.hpp).
*/

enum class ErrorKind {
  ClientSyntax,
  Unauthorized,
  Forbidden,
  NotFound,
  Conflict,
  DependencyUnavailable,
  Storage,
  Internal
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ClientSyntax:
      return "client_syntax";
    case ErrorKind::Unauthorized:
      return "unauthorized";
    case ErrorKind::Forbidden:
      return "forbidden";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::Conflict:
      return "conflict";
    case ErrorKind::DependencyUnavailable:
      return "dependency_unavailable";
    case ErrorKind::Storage:
      return "storage";
    case ErrorKind::Internal:
      return "internal";
  }
  return "unknown";
}

class GatewayError : public std::runtime_error {
 public:
  GatewayError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Malformed range, timestamp, identifier or request header.
class ClientSyntaxError : public GatewayError {
 public:
  explicit ClientSyntaxError(const std::string& msg) : GatewayError(ErrorKind::ClientSyntax, msg) {
  }
};

class InvalidIdentifier : public ClientSyntaxError {
 public:
  explicit InvalidIdentifier(const std::string& msg) : ClientSyntaxError(msg) {
  }
};

class Unauthorized : public GatewayError {
 public:
  explicit Unauthorized(const std::string& msg) : GatewayError(ErrorKind::Unauthorized, msg) {
  }
};

class Forbidden : public GatewayError {
 public:
  explicit Forbidden(const std::string& msg) : GatewayError(ErrorKind::Forbidden, msg) {
  }
};

class NotFound : public GatewayError {
 public:
  explicit NotFound(const std::string& msg) : GatewayError(ErrorKind::NotFound, msg) {
  }
};

class Conflict : public GatewayError {
 public:
  explicit Conflict(const std::string& msg) : GatewayError(ErrorKind::Conflict, msg) {
  }
};

class DependencyUnavailable : public GatewayError {
 public:
  explicit DependencyUnavailable(const std::string& msg) : GatewayError(ErrorKind::DependencyUnavailable, msg) {
  }
};

class StorageError : public GatewayError {
 public:
  explicit StorageError(const std::string& msg) : GatewayError(ErrorKind::Storage, msg) {
  }
};

// An unexpected failure that has already been handed to the fault reporter.
class InternalError : public GatewayError {
 public:
  explicit InternalError(const std::string& msg) : GatewayError(ErrorKind::Internal, msg) {
  }
};

} // namespace cirrus::util
