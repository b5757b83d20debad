// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/result.h"

#include <strings.h>

#include <cerrno>
#include <cstring>
#include <map>

namespace base {

using Code = ResultCode;

namespace {

struct ErrnoInfo {
  const char* name;
  Code code;
};

// Only the errno values that file and memory syscalls can produce.
const std::map<int, ErrnoInfo>& errno_table() {
  static const auto& ref = *new std::map<int, ErrnoInfo>{
#define E(x, y) {x, {#x, Code::y}}
      E(EPERM, PERMISSION_DENIED),    E(EACCES, PERMISSION_DENIED),
      E(ENOENT, NOT_FOUND),           E(ENODEV, NOT_FOUND),
      E(ENOTDIR, WRONG_TYPE),         E(EISDIR, WRONG_TYPE),
      E(EBADF, INVALID_ARGUMENT),     E(EFAULT, INVALID_ARGUMENT),
      E(EINVAL, INVALID_ARGUMENT),    E(ENAMETOOLONG, INVALID_ARGUMENT),
      E(EFBIG, OUT_OF_RANGE),         E(EROFS, FAILED_PRECONDITION),
      E(ELOOP, FAILED_PRECONDITION),  E(EINTR, ABORTED),
      E(EAGAIN, ABORTED),             E(EPIPE, ABORTED),
      E(ENOMEM, RESOURCE_EXHAUSTED),  E(ENFILE, RESOURCE_EXHAUSTED),
      E(EMFILE, RESOURCE_EXHAUSTED),  E(ENOSPC, RESOURCE_EXHAUSTED),
      E(EDQUOT, RESOURCE_EXHAUSTED),  E(EIO, DATA_LOSS),
#undef E
  };
  return ref;
}

const std::map<Code, std::string>& code_table() {
  static const auto& ref = *new std::map<Code, std::string>{
#define C(x) {Code::x, #x}
      C(OK),
      C(UNKNOWN),
      C(INTERNAL),
      C(FAILED_PRECONDITION),
      C(NOT_FOUND),
      C(WRONG_TYPE),
      C(PERMISSION_DENIED),
      C(INVALID_ARGUMENT),
      C(OUT_OF_RANGE),
      C(NOT_IMPLEMENTED),
      C(ABORTED),
      C(RESOURCE_EXHAUSTED),
      C(DATA_LOSS),
#undef C
  };
  return ref;
}

const std::string& empty_string() noexcept {
  static const auto& ref = *new std::string;
  return ref;
}

// GNU strerror_r: may return a static string instead of filling |buf|.
std::string errno_text(int err_no) {
  char buf[256];
  ::bzero(buf, sizeof(buf));
  const char* ptr = ::strerror_r(err_no, buf, sizeof(buf));
  return ptr ? ptr : "<unknown errno code>";
}

}  // anonymous namespace

const std::string& resultcode_name(Code code) noexcept {
  const auto& table = code_table();
  auto it = table.find(code);
  return (it == table.end()) ? empty_string() : it->second;
}

Result::Result(Code code, std::string message, int err_no) {
  if (code != Code::OK)
    rep_ = std::make_shared<const Rep>(Rep{code, err_no, std::move(message)});
}

Result Result::from_errno(int err_no, std::string what) {
  if (err_no == 0) return Result();
  const auto& table = errno_table();
  auto it = table.find(err_no);
  Code code = (it == table.end()) ? Code::UNKNOWN : it->second.code;
  return Result(code, std::move(what), err_no);
}

const std::string& Result::message() const noexcept {
  return rep_ ? rep_->message : empty_string();
}

void Result::append_to(std::string* out) const {
  if (!rep_) {
    out->append("OK(0)");
    return;
  }
  concat_to(out, code_name(rep_->code), '(',
            static_cast<unsigned int>(rep_->code), ')');
  if (!rep_->message.empty()) concat_to(out, ": ", rep_->message);
  if (rep_->err_no > 0) {
    const auto& table = errno_table();
    auto it = table.find(rep_->err_no);
    if (it == table.end())
      concat_to(out, " errno:[#", rep_->err_no);
    else
      concat_to(out, " errno:[", it->second.name);
    concat_to(out, ' ', errno_text(rep_->err_no), ']');
  }
}

std::string Result::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

}  // namespace base
