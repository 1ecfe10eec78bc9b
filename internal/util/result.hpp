#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace epicflow::util {

/*
  Portable result codes for every public coordinator operation.

  Nothing crosses the public boundary as an exception; callers branch on
  the code and may treat kDuplicate* as "already present".
*/

enum class ErrorCode {
  kOk = 0,

  kDuplicateEpic,
  kDuplicateAgent,

  kUnknownEpic,
  kUnknownSubTask,
  kUnknownAssignment,
  kUnknownAgent,

  kEmptySubTaskList,
  kPermissionDenied,
  kInvalidStatusTransition,
  kCancelled,
  kWorkFunctionFailure,

  kInvalidArgument,
  kResourceExhausted,
  kInvalidSnapshot,
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kDuplicateEpic:
      return "duplicate_epic";
    case ErrorCode::kDuplicateAgent:
      return "duplicate_agent";
    case ErrorCode::kUnknownEpic:
      return "unknown_epic";
    case ErrorCode::kUnknownSubTask:
      return "unknown_sub_task";
    case ErrorCode::kUnknownAssignment:
      return "unknown_assignment";
    case ErrorCode::kUnknownAgent:
      return "unknown_agent";
    case ErrorCode::kEmptySubTaskList:
      return "empty_sub_task_list";
    case ErrorCode::kPermissionDenied:
      return "permission_denied";
    case ErrorCode::kInvalidStatusTransition:
      return "invalid_status_transition";
    case ErrorCode::kCancelled:
      return "cancelled";
    case ErrorCode::kWorkFunctionFailure:
      return "work_function_failure";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kResourceExhausted:
      return "resource_exhausted";
    case ErrorCode::kInvalidSnapshot:
      return "invalid_snapshot";
  }
  return "unknown";
}

struct Error {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;
};

/*
  Value-or-error carrier.

  Holds exactly one of a T or an Error. Accessing the wrong side is a
  programming error; check with operator bool first.
*/
template <typename T>
class Result {
 public:
  static Result Ok(T value) {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    Result r;
    r.error_ = Error{code, std::move(message)};
    return r;
  }

  static Result Err(Error error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  explicit operator bool() const {
    return value_.has_value();
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const Error& error() const {
    return error_;
  }

  ErrorCode code() const {
    return value_ ? ErrorCode::kOk : error_.code;
  }

 private:
  Result() = default;

  std::optional<T> value_;
  Error            error_;
};

/*
  Unit result for operations with nothing to return.
*/
struct Status {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::kOk;
  }
};

} // namespace epicflow::util
