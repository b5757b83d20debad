// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#include <re2/re2.h>

#include "base/debug.h"
#include "base/logging.h"
#include "base/result.h"
#include "base/result_testing.h"

// 2006-01-02 22:04:05.123456 UTC, thread 42.
static pid_t fake_gettid() { return 42; }

static int fake_gettimeofday(struct timeval* tv, struct timezone*) {
  tv->tv_sec = 1136239445;
  tv->tv_usec = 123456;
  return 0;
}

namespace {

// Collects formatted entries through a pipe, so that lines written by a
// death test child before it dies are visible to the parent.
class PipeTarget : public base::LogTarget {
 public:
  PipeTarget() {
    int fds[2];
    int rc = ::pipe(fds);
    CHECK_OK(base::Result::from_errno(rc == 0 ? 0 : errno, "pipe(2)"));
    rfd_ = fds[0];
    wfd_ = fds[1];
  }

  bool want(const char*, unsigned int, base::level_t level) const override {
    return level >= LOG_LEVEL_INFO;
  }

  void log(const base::LogEntry& entry) override {
    std::string str = entry.as_string();
    if (::write(wfd_, str.data(), str.size()) < 0)
      throw std::system_error(errno, std::system_category(), "write(2)");
  }

  void flush() override {}

  // Closes the write end and returns everything logged, with line
  // numbers masked as "XX".
  std::string drain() {
    ::close(wfd_);
    std::string out;
    std::vector<char> buf(4096);
    ssize_t n;
    while ((n = ::read(rfd_, buf.data(), buf.size())) > 0)
      out.append(buf.data(), n);
    ::close(rfd_);
    re2::RE2::GlobalReplace(&out, ":[0-9]+\\] ", ":XX] ");
    return out;
  }

 private:
  int rfd_;
  int wfd_;
};

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base::log_set_gettid(fake_gettid);
    base::log_set_gettimeofday(fake_gettimeofday);
    base::log_target_add(&target_);
  }

  void TearDown() override {
    base::log_target_remove(&target_);
    base::log_set_gettid(nullptr);
    base::log_set_gettimeofday(nullptr);
  }

  std::string captured() { return target_.drain(); }

  static std::string line(char severity, const std::string& text) {
    return std::string(1, severity) +
           "0102 22:04:05.123456  42 logging_test.cc:XX] " + text + "\n";
  }

 private:
  PipeTarget target_;
};

using LoggingDeathTest = LoggingTest;

}  // anonymous namespace

TEST_F(LoggingDeathTest, Severities) {
  VLOG(1) << "round keys";
  LOG(INFO) << "hello";
  LOG(WARN) << "uh oh";
  LOG(ERROR) << "oh no!";
  EXPECT_DEATH(LOG(FATAL) << "aaaah!", "aaaah!");

  EXPECT_EQ(line('I', "hello") + line('W', "uh oh") + line('E', "oh no!") +
                line('F', "aaaah!"),
            captured());
}

TEST_F(LoggingTest, EveryN) {
  for (int i = 0; i < 10; ++i) {
    LOG_EVERY_N(INFO, 3) << "block #" << i;
  }
  EXPECT_EQ(line('I', "block #0") + line('I', "block #3") +
                line('I', "block #6") + line('I', "block #9"),
            captured());
}

TEST(Check, Passing) {
  CHECK(true) << ": unused";
  CHECK_EQ(16, 16) << ": unused";
  CHECK_NE(16, 24) << ": unused";
  CHECK_LT(10, 11) << ": unused";
  CHECK_LE(11, 11) << ": unused";
  CHECK_GT(14, 10) << ": unused";
  CHECK_GE(14, 14) << ": unused";
  CHECK_OK(base::Result()) << ": unused";
}

TEST_F(LoggingDeathTest, FailingChecksAreFatalInDebug) {
  base::ScopedDebug debug(true);
  const int nk = 4, nb = 4, nr = 10;

  EXPECT_DEATH(CHECK(nk == nr) << " #0", "#0");
  EXPECT_DEATH(CHECK_EQ(nk, nr) << " #1", "#1");
  EXPECT_DEATH(CHECK_NE(nk, nb) << " #2", "#2");
  EXPECT_DEATH(CHECK_LT(nr, nb) << " #3", "#3");
  EXPECT_DEATH(CHECK_LE(nr, nb) << " #4", "#4");
  EXPECT_DEATH(CHECK_GT(nb, nk) << " #5", "#5");
  EXPECT_DEATH(CHECK_GE(nb, nr) << " #6", "#6");

  EXPECT_EQ(line('F', "CHECK FAILED: nk == nr #0") +
                line('F', "CHECK FAILED: nk == nr [4 == 10] #1") +
                line('F', "CHECK FAILED: nk != nb [4 != 4] #2") +
                line('F', "CHECK FAILED: nr < nb [10 < 4] #3") +
                line('F', "CHECK FAILED: nr <= nb [10 <= 4] #4") +
                line('F', "CHECK FAILED: nb > nk [4 > 4] #5") +
                line('F', "CHECK FAILED: nb >= nr [4 >= 10] #6"),
            captured());
}

TEST(Check, FailingChecksLogWithoutDebug) {
  base::ScopedDebug debug(false);
  EXPECT_FALSE(base::debug());
  const int nk = 4, nr = 10;
  EXPECT_NO_THROW(CHECK(nk == nr) << " #0");
  EXPECT_NO_THROW(CHECK_EQ(nk, nr) << " #1");
  EXPECT_NO_THROW(CHECK_GE(nk, nr) << " #2");
  EXPECT_NO_THROW(CHECK_OK(base::Result::not_found("DES")) << " #3");
}

TEST(CheckDeathTest, CheckOk) {
  base::ScopedDebug debug(true);
  EXPECT_DEATH(CHECK_OK(base::Result::not_implemented("AES-256")),
               "NOT_IMPLEMENTED\\(12\\): AES-256");
}

TEST(CheckDeathTest, NotNull) {
  int x = 7;
  int* p = &x;
  EXPECT_EQ(p, CHECK_NOTNULL(p));
  int* q = nullptr;
  EXPECT_DEATH(CHECK_NOTNULL(q), "q != nullptr");
}

TEST(LogEntry, BasenameOnly) {
  base::log_set_gettid(fake_gettid);
  base::log_set_gettimeofday(fake_gettimeofday);
  base::LogEntry entry("/src/rijndael/crypto/cipher/aes.cc", 99,
                       LOG_LEVEL_WARN, "short key");
  EXPECT_EQ("W0102 22:04:05.123456  42 aes.cc:99] short key\n",
            entry.as_string());
  base::log_set_gettid(nullptr);
  base::log_set_gettimeofday(nullptr);
}
