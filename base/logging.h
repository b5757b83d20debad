// base/logging.h - Facility for logging error messages
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_LOGGING_H
#define BASE_LOGGING_H

#include <sys/time.h>
#include <sys/types.h>

#include <strings.h>

#include <memory>
#include <ostream>
#include <sstream>
#include <string>

// Severities {{{

#define LOG_LEVEL_INFO ::base::level_t(1)
#define LOG_LEVEL_WARN ::base::level_t(2)
#define LOG_LEVEL_ERROR ::base::level_t(3)
#define LOG_LEVEL_DFATAL ::base::level_t(4)
#define LOG_LEVEL_FATAL ::base::level_t(5)
#define LOG_LEVEL(name) LOG_LEVEL_##name

// VLOG(n) logs at severity -n: more verbose messages sort lower.
#define VLOG_LEVEL(vlevel) ::base::level_t(-(vlevel))

// }}}
// Logging {{{

#define LOG(name) ::base::Logger(__FILE__, __LINE__, 1, LOG_LEVEL(name))
#define VLOG(vlevel) ::base::Logger(__FILE__, __LINE__, 1, VLOG_LEVEL(vlevel))

// Logs only the 1st, (n+1)th, (2n+1)th, ... time this line is reached.
#define LOG_EVERY_N(name, n) \
  ::base::Logger(__FILE__, __LINE__, (n), LOG_LEVEL(name))

// }}}
// Assertions {{{
//
// A failed CHECK logs at DFATAL, which terminates the process when
// base::debug() is true.  The DCHECK forms compile to nothing under NDEBUG.
//

#define BASE_CHECK_OP(op, x, y)                                             \
  ::base::internal::log_check_op(__FILE__, __LINE__, ::base::internal::op(), \
                                 #x, (x), #y, (y))

#define CHECK(x) ::base::internal::log_check(__FILE__, __LINE__, #x, !!(x))
#define CHECK_OK(x) ::base::internal::log_check_ok(__FILE__, __LINE__, #x, (x))
#define CHECK_EQ(x, y) BASE_CHECK_OP(OpEQ, x, y)
#define CHECK_NE(x, y) BASE_CHECK_OP(OpNE, x, y)
#define CHECK_LT(x, y) BASE_CHECK_OP(OpLT, x, y)
#define CHECK_LE(x, y) BASE_CHECK_OP(OpLE, x, y)
#define CHECK_GT(x, y) BASE_CHECK_OP(OpGT, x, y)
#define CHECK_GE(x, y) BASE_CHECK_OP(OpGE, x, y)

// Always fatal, regardless of base::debug().  Evaluates to |ptr|.
#define CHECK_NOTNULL(ptr) \
  ::base::internal::log_check_notnull(__FILE__, __LINE__, #ptr, (ptr))

#ifdef NDEBUG
#define DCHECK(x) ::base::Logger()
#define DCHECK_OK(x) ::base::Logger()
#define DCHECK_EQ(x, y) ::base::Logger()
#define DCHECK_NE(x, y) ::base::Logger()
#define DCHECK_LT(x, y) ::base::Logger()
#define DCHECK_LE(x, y) ::base::Logger()
#define DCHECK_GT(x, y) ::base::Logger()
#define DCHECK_GE(x, y) ::base::Logger()
#define DCHECK_NOTNULL(ptr) (ptr)
#else
#define DCHECK(x) CHECK(x)
#define DCHECK_OK(x) CHECK_OK(x)
#define DCHECK_EQ(x, y) CHECK_EQ(x, y)
#define DCHECK_NE(x, y) CHECK_NE(x, y)
#define DCHECK_LT(x, y) CHECK_LT(x, y)
#define DCHECK_LE(x, y) CHECK_LE(x, y)
#define DCHECK_GT(x, y) CHECK_GT(x, y)
#define DCHECK_GE(x, y) CHECK_GE(x, y)
#define DCHECK_NOTNULL(ptr) CHECK_NOTNULL(ptr)
#endif

// }}}

namespace base {

class Result;  // forward declaration

// level_t is a log severity.  Positive values are the named LOG levels;
// zero and below are VLOG levels.
class level_t {
 public:
  constexpr level_t() noexcept : value_(0) {}
  explicit constexpr level_t(signed char value) noexcept : value_(value) {}
  explicit constexpr operator signed char() const noexcept { return value_; }

  friend constexpr bool operator==(level_t a, level_t b) noexcept {
    return a.value_ == b.value_;
  }
  friend constexpr bool operator!=(level_t a, level_t b) noexcept {
    return a.value_ != b.value_;
  }
  friend constexpr bool operator<(level_t a, level_t b) noexcept {
    return a.value_ < b.value_;
  }
  friend constexpr bool operator>(level_t a, level_t b) noexcept {
    return a.value_ > b.value_;
  }
  friend constexpr bool operator<=(level_t a, level_t b) noexcept {
    return a.value_ <= b.value_;
  }
  friend constexpr bool operator>=(level_t a, level_t b) noexcept {
    return a.value_ >= b.value_;
  }

 private:
  signed char value_;
};

// LogEntry represents a single log message.
struct LogEntry {
  struct timeval time;
  pid_t tid;
  const char* file;
  unsigned int line;
  level_t level;
  std::string message;

  LogEntry() noexcept : tid(0), file(nullptr), line(0) {
    ::bzero(&time, sizeof(time));
  }

  // Stamps the entry with the current time and thread ID.
  LogEntry(const char* file, unsigned int line, level_t level,
           std::string message) noexcept;

  explicit operator bool() const noexcept {
    return file != nullptr && line != 0;
  }

  // "[DIWEF]mmdd hh:mm:ss.uuuuuu  <tid> <basename>:<line>] <message>\n"
  void append_to(std::string* out) const;
  std::string as_string() const;
};

// Logger collects a single log message, and logs it when destroyed.
//
// A Logger for a message that no LogTarget wants is inert: it formats
// nothing and logs nothing.
//
class Logger {
 private:
  using BasicManip = std::ostream& (*)(std::ostream&);

 public:
  Logger() : file_(nullptr), line_(0), level_(), ss_() {}

  Logger(const char* file, unsigned int line, unsigned int every_n,
         level_t level);

  ~Logger() noexcept(false);

  // Logger is move-only.
  Logger(const Logger&) = delete;
  Logger(Logger&&) noexcept = default;
  Logger& operator=(const Logger&) = delete;
  Logger& operator=(Logger&&) noexcept = default;

  explicit operator bool() const noexcept { return !!ss_; }

  std::string message() const { return ss_ ? ss_->str() : std::string(); }

  template <typename T>
  Logger& operator<<(const T& obj) {
    if (ss_) (*ss_) << obj;
    return *this;
  }

  Logger& operator<<(BasicManip obj) {
    if (ss_) (*ss_) << obj;
    return *this;
  }

  LogEntry entry() const {
    if (!ss_) return LogEntry();
    return LogEntry(file_, line_, level_, ss_->str());
  }

 private:
  const char* file_;
  unsigned int line_;
  level_t level_;
  std::unique_ptr<std::ostringstream> ss_;
};

// LogTarget is a destination for log entries.
// All methods are called with the logging mutex held.
class LogTarget {
 protected:
  LogTarget() noexcept = default;

 public:
  virtual ~LogTarget() noexcept = default;
  virtual bool want(const char* file, unsigned int line,
                    level_t level) const = 0;
  virtual void log(const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

// Returns true if a LogEntry with this metadata would be interesting.
bool want(const char* file, unsigned int line, unsigned int every_n,
          level_t level);

// Logs a single LogEntry.  Entries are written synchronously, in the
// calling thread, and ERROR or worse also flushes every target.
void log(const LogEntry& entry);

// Flush all log targets.
void log_flush();

// Set the threshold for logging to STDERR.  Defaults to LOG_LEVEL_INFO.
void log_stderr_set_level(level_t level);

void log_target_add(LogTarget* target);
void log_target_remove(LogTarget* target);

// Functions for mocking in tests {{{

using GetTidFunc = pid_t (*)();
using GetTimeOfDayFunc = int (*)(struct timeval*, struct timezone*);

// Passing nullptr restores the real implementation.
void log_set_gettid(GetTidFunc func);
void log_set_gettimeofday(GetTimeOfDayFunc func);

// }}}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond);

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt);

[[noreturn]] void log_check_notnull_failed(const char* file, unsigned int line,
                                           const char* expr);

#define BASE_LOGGING_OP(name, op)                                \
  struct name {                                                  \
    template <typename T, typename U>                            \
    bool operator()(const T& lhs, const U& rhs) const {          \
      return (lhs op rhs);                                       \
    }                                                            \
    const char* symbol() const noexcept { return #op; }          \
  }

BASE_LOGGING_OP(OpEQ, ==);
BASE_LOGGING_OP(OpNE, !=);
BASE_LOGGING_OP(OpLT, <);
BASE_LOGGING_OP(OpLE, <=);
BASE_LOGGING_OP(OpGT, >);
BASE_LOGGING_OP(OpGE, >=);

#undef BASE_LOGGING_OP

template <typename T, typename U, typename Op>
Logger log_check_op(const char* file, unsigned int line, Op op,
                    const char* lhsexpr, const T& lhs, const char* rhsexpr,
                    const U& rhs) {
  if (op(lhs, rhs)) return Logger();
  Logger logger(file, line, 1, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << lhsexpr << " " << op.symbol() << " "
         << rhsexpr << " [" << lhs << " " << op.symbol() << " " << rhs << "]";
  return logger;
}

template <typename T>
T* log_check_notnull(const char* file, unsigned int line, const char* expr,
                     T* ptr) {
  if (!ptr) log_check_notnull_failed(file, line, expr);
  return ptr;
}

template <typename T>
std::unique_ptr<T> log_check_notnull(const char* file, unsigned int line,
                                     const char* expr, std::unique_ptr<T> ptr) {
  if (!ptr) log_check_notnull_failed(file, line, expr);
  return ptr;
}

}  // namespace internal

inline Logger::~Logger() noexcept(false) {
  if (ss_) log(entry());
}

}  // namespace base

#endif  // BASE_LOGGING_H
