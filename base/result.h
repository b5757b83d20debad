// base/result.h - Value type representing operation success or failure
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_H
#define BASE_RESULT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "base/concat.h"

namespace base {

// ResultCode classifies a failure.  The numeric values are stable and
// appear in stringified Results, e.g. "INVALID_ARGUMENT(10): ...".
//
// A code marked "<: X" is a refinement of X.
enum class ResultCode : uint8_t {
  OK = 0x00,
  UNKNOWN = 0x01,              // no better code applies
  INTERNAL = 0x02,             // a bug, never caused by the caller
  FAILED_PRECONDITION = 0x04,  // the world is in the wrong state
  NOT_FOUND = 0x05,            // <: FAILED_PRECONDITION, e.g. unknown cipher
  WRONG_TYPE = 0x07,           // <: FAILED_PRECONDITION, e.g. EISDIR
  PERMISSION_DENIED = 0x08,    // <: FAILED_PRECONDITION
  INVALID_ARGUMENT = 0x0a,     // e.g. a 15-byte key, a partial block
  OUT_OF_RANGE = 0x0b,         // <: INVALID_ARGUMENT
  NOT_IMPLEMENTED = 0x0c,      // e.g. the AES-192 key schedule
  ABORTED = 0x0e,              // interrupted, e.g. EINTR
  RESOURCE_EXHAUSTED = 0x0f,   // out of memory, descriptors, disk
  DATA_LOSS = 0x11,            // e.g. EIO
};

// Returns "OK", "NOT_FOUND", etc.  Unknown values map to "".
const std::string& resultcode_name(ResultCode code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ResultCode code) {
  return (os << resultcode_name(code));
}

// Result is the success or failure of an operation.
//
// A successful Result holds nothing; a failed one shares an immutable
// record of its code, message and errno(3) value.  Copies are cheap.
//
class Result {
 public:
  using Code = ResultCode;

  static const std::string& code_name(Code code) noexcept {
    return resultcode_name(code);
  }

  template <typename... Args>
  static Result not_found(const Args&... args) {
    return Result(Code::NOT_FOUND, concat(args...));
  }

  template <typename... Args>
  static Result invalid_argument(const Args&... args) {
    return Result(Code::INVALID_ARGUMENT, concat(args...));
  }

  template <typename... Args>
  static Result out_of_range(const Args&... args) {
    return Result(Code::OUT_OF_RANGE, concat(args...));
  }

  template <typename... Args>
  static Result not_implemented(const Args&... args) {
    return Result(Code::NOT_IMPLEMENTED, concat(args...));
  }

  // Maps a nonzero errno(3) value to the closest Code; errno 0 is OK.
  // |what| names the failing call, e.g. "open(2)".
  static Result from_errno(int err_no, std::string what);

  template <typename... Args>
  static Result from_errno(int err_no, const Args&... args) {
    return from_errno(err_no, concat(args...));
  }

  // The default-constructed Result is OK.
  Result() noexcept = default;
  Result(const Result&) noexcept = default;
  Result(Result&&) noexcept = default;
  Result& operator=(const Result&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  // An errno of -1 means "not derived from errno(3)".
  Result(Code code, std::string message = std::string(), int err_no = -1);

  void swap(Result& other) noexcept { rep_.swap(other.rep_); }

  // True iff the operation succeeded.
  explicit operator bool() const noexcept { return !rep_; }

  Code code() const noexcept { return rep_ ? rep_->code : Code::OK; }
  int errno_value() const noexcept { return rep_ ? rep_->err_no : 0; }
  const std::string& message() const noexcept;

  // "CODE(n)", then ": message" if any, then " errno:[ENAME text]" if any.
  std::string as_string() const;
  void append_to(std::string* out) const;

 private:
  struct Rep {
    Code code;
    int err_no;
    std::string message;
  };

  std::shared_ptr<const Rep> rep_;
};

inline void swap(Result& a, Result& b) noexcept { a.swap(b); }

inline std::ostream& operator<<(std::ostream& os, const Result& arg) {
  return (os << arg.as_string());
}

}  // namespace base

#endif  // BASE_RESULT_H
