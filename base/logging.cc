// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/logging.h"

#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <map>
#include <mutex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "base/concat.h"
#include "base/debug.h"
#include "base/result.h"

namespace base {

inline namespace implementation {

static pid_t real_gettid() { return syscall(SYS_gettid); }

static int real_gettimeofday(struct timeval* tv, struct timezone* tz) {
  return ::gettimeofday(tv, tz);
}

static void write_fd2(const std::string& str) {
  const char* ptr = str.data();
  std::size_t len = str.size();
  while (len > 0) {
    ssize_t n = ::write(2, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;
    ptr += n;
    len -= n;
  }
}

struct LogState;
static LogState& state();

// Writes to file descriptor 2.
class StderrTarget : public LogTarget {
 public:
  bool want(const char*, unsigned int, level_t level) const override;
  void log(const LogEntry& entry) override { write_fd2(entry.as_string()); }
  void flush() override { ::fdatasync(2); }
};

// Orders call sites by file name, then line.
struct SiteLess {
  bool operator()(const std::pair<const char*, unsigned int>& a,
                  const std::pair<const char*, unsigned int>& b) const
      noexcept {
    int cmp = ::strcmp(a.first, b.first);
    if (cmp != 0) return cmp < 0;
    return a.second < b.second;
  }
};

// All mutable logging state.  Every field is guarded by |mu|.
struct LogState {
  std::mutex mu;
  level_t stderr_level;
  GetTidFunc gettid;
  GetTimeOfDayFunc gettimeofday;
  std::vector<LogTarget*> targets;
  std::map<std::pair<const char*, unsigned int>, unsigned int, SiteLess>
      counters;

  LogState()
      : stderr_level(LOG_LEVEL_INFO),
        gettid(real_gettid),
        gettimeofday(real_gettimeofday),
        targets{new StderrTarget} {}
};

using Lock = std::unique_lock<std::mutex>;

static LogState& state() {
  static LogState& ref = *new LogState;
  return ref;
}

// Called with LogState::mu held.
bool StderrTarget::want(const char*, unsigned int, level_t level) const {
  return level >= state().stderr_level;
}

// A throwing LogTarget is reported on fd 2 and otherwise ignored, so
// that one broken target cannot silence the others.
template <typename F>
static void call_target(F func) {
  try {
    func();
  } catch (const std::exception& e) {
    write_fd2(concat("LogTarget threw ", typeid(e).name(), ": ", e.what(),
                     '\n'));
  }
}

static void flush_locked(LogState& s) {
  for (LogTarget* target : s.targets)
    call_target([target] { target->flush(); });
}

static char severity_letter(level_t level) noexcept {
  if (level >= LOG_LEVEL_DFATAL) return 'F';
  if (level >= LOG_LEVEL_ERROR) return 'E';
  if (level >= LOG_LEVEL_WARN) return 'W';
  if (level >= LOG_LEVEL_INFO) return 'I';
  return 'D';
}

static bool is_fatal(level_t level) {
  if (level >= LOG_LEVEL_FATAL) return true;
  return level >= LOG_LEVEL_DFATAL && debug();
}

}  // inline namespace implementation

LogEntry::LogEntry(const char* file, unsigned int line, level_t level,
                   std::string message) noexcept
    : tid(0), file(file), line(line), level(level), message(std::move(message)) {
  ::bzero(&time, sizeof(time));
  auto& s = state();
  Lock lock(s.mu);
  (*s.gettimeofday)(&time, nullptr);
  tid = (*s.gettid)();
}

void LogEntry::append_to(std::string* out) const {
  struct tm tm;
  ::bzero(&tm, sizeof(tm));
  ::gmtime_r(&time.tv_sec, &tm);

  char stamp[32];
  ::snprintf(stamp, sizeof(stamp), "%c%02d%02d %02d:%02d:%02d.%06ld  ",
             severity_letter(level), tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
             tm.tm_min, tm.tm_sec, static_cast<long>(time.tv_usec));

  const char* basename = ::strrchr(file, '/');
  basename = (basename != nullptr) ? basename + 1 : file;

  concat_to(out, stamp, tid, ' ', basename, ':', line, "] ", message, '\n');
}

std::string LogEntry::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

Logger::Logger(const char* file, unsigned int line, unsigned int every_n,
               level_t level)
    : file_(file), line_(line), level_(level) {
  if (file == nullptr || line == 0 || every_n == 0) std::terminate();
  if (want(file, line, every_n, level)) ss_.reset(new std::ostringstream);
}

bool want(const char* file, unsigned int line, unsigned int every_n,
          level_t level) {
  if (level >= LOG_LEVEL_DFATAL) return true;

  auto& s = state();
  Lock lock(s.mu);
  if (every_n > 1) {
    unsigned int& count = s.counters[std::make_pair(file, line)];
    bool first = (count == 0);
    count = (count + 1) % every_n;
    if (!first) return false;
  }

  bool wanted = false;
  for (const LogTarget* target : s.targets) {
    call_target([&] { wanted = target->want(file, line, level); });
    if (wanted) break;
  }
  return wanted;
}

void log(const LogEntry& entry) {
  {
    auto& s = state();
    Lock lock(s.mu);
    if (entry) {
      for (LogTarget* target : s.targets) {
        call_target([&] {
          if (target->want(entry.file, entry.line, entry.level))
            target->log(entry);
        });
      }
    }
    if (entry.level >= LOG_LEVEL_ERROR) flush_locked(s);
  }
  if (is_fatal(entry.level)) std::terminate();
}

void log_flush() {
  auto& s = state();
  Lock lock(s.mu);
  flush_locked(s);
}

void log_stderr_set_level(level_t level) {
  auto& s = state();
  Lock lock(s.mu);
  s.stderr_level = level;
}

void log_target_add(LogTarget* target) {
  auto& s = state();
  Lock lock(s.mu);
  s.targets.push_back(target);
}

void log_target_remove(LogTarget* target) {
  auto& s = state();
  Lock lock(s.mu);
  auto it = std::find(s.targets.begin(), s.targets.end(), target);
  if (it != s.targets.end()) s.targets.erase(it);
}

void log_set_gettid(GetTidFunc func) {
  auto& s = state();
  Lock lock(s.mu);
  s.gettid = func ? func : real_gettid;
}

void log_set_gettimeofday(GetTimeOfDayFunc func) {
  auto& s = state();
  Lock lock(s.mu);
  s.gettimeofday = func ? func : real_gettimeofday;
}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond) {
  Logger logger;
  if (!cond) {
    logger = Logger(file, line, 1, LOG_LEVEL_DFATAL);
    logger << "CHECK FAILED: " << expr;
  }
  return logger;
}

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt) {
  Logger logger;
  if (!rslt) {
    logger = Logger(file, line, 1, LOG_LEVEL_DFATAL);
    logger << "CHECK FAILED: " << expr << ": " << rslt;
  }
  return logger;
}

void log_check_notnull_failed(const char* file, unsigned int line,
                              const char* expr) {
  {
    Logger logger(file, line, 1, LOG_LEVEL_FATAL);
    logger << "CHECK FAILED: " << expr << " != nullptr";
  }
  std::terminate();
}

}  // namespace internal

}  // namespace base
