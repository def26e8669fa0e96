#pragma once

#include <optional>
#include <string>
#include <utility>

namespace camsync::util {

/*
  Portable outcome codes for operations whose failure is routine
  (probes, command sends, uploads, time queries).

  Transport layers translate gRPC / socket errors into these so that callers
  never depend on the wire library.
*/

enum class ErrorCode {
  OK = 0,

  Timeout,
  Unreachable,
  Rejected,
  InvalidResponse,

  IOError,
  InternalError
};

inline const char* ToString(ErrorCode code);

struct Status {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool ok() const {
    return code == ErrorCode::OK;
  }

  explicit operator bool() const {
    return ok();
  }
};

template <typename T>
class Result {
 public:
  static Result Ok(T value) {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  static Result Err(ErrorCode code, std::string msg = {}) {
    Result r;
    r.status_ = Status::Err(code, std::move(msg));
    return r;
  }

  static Result Err(Status status) {
    Result r;
    r.status_ = std::move(status);
    return r;
  }

  bool ok() const {
    return status_.ok();
  }

  explicit operator bool() const {
    return ok();
  }

  const Status& status() const {
    return status_;
  }

  const T& value() const {
    return *value_;
  }

  T& value() {
    return *value_;
  }

  const T* operator->() const {
    return &*value_;
  }

 private:
  Status           status_;
  std::optional<T> value_;
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Unreachable:
      return "unreachable";
    case ErrorCode::Rejected:
      return "rejected";
    case ErrorCode::InvalidResponse:
      return "invalid_response";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace camsync::util
