// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <sstream>

#include "base/logging.h"
#include "base/result_testing.h"
#include "crypto/aestool_lib.h"

using crypto::aestool::Format;

static const std::string KEY = "YELLOW SUBMARINE";
static const std::string PLAINTEXT = "SUPER TOP SECRET";

class TempFile {
 public:
  TempFile() {
    char tmpl[] = "/tmp/aestool_test.XXXXXX";
    int fd = ::mkstemp(tmpl);
    CHECK(fd >= 0) << ": mkstemp(3) failed";
    ::close(fd);
    path_ = tmpl;
  }

  ~TempFile() { ::unlink(path_.c_str()); }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const std::string& path() const noexcept { return path_; }

  void write(const std::string& data) const {
    std::ofstream o(path_, std::ios::binary | std::ios::trunc);
    o << data;
  }

  std::string read() const {
    std::ifstream i(path_, std::ios::binary);
    std::ostringstream o;
    o << i.rdbuf();
    return o.str();
  }

 private:
  std::string path_;
};

static int run(std::vector<std::string> args) {
  std::vector<const char*> argv;
  argv.push_back("aestool");
  for (const auto& arg : args) argv.push_back(arg.c_str());
  return crypto::aestool::run(argv.size(), argv.data());
}

static std::string as_string(const std::vector<uint8_t>& v) {
  return std::string(v.begin(), v.end());
}

static base::Bytes bytes(const std::string& s) {
  return base::Bytes(s.data(), s.size());
}

TEST(AESTool, DecodeKey) {
  std::vector<uint8_t> key;
  EXPECT_OK(crypto::aestool::decode_key(&key, "YELLOW SUBMARINE"));
  EXPECT_EQ(KEY, as_string(key));

  EXPECT_OK(crypto::aestool::decode_key(
      &key, "hex:59454c4c4f57205355424d4152494e45"));
  EXPECT_EQ(KEY, as_string(key));

  // Only the prefix is special.
  EXPECT_OK(crypto::aestool::decode_key(&key, "HEX:abc"));
  EXPECT_EQ("HEX:abc", as_string(key));

  key = {0x99};
  EXPECT_INVALID_ARGUMENT(crypto::aestool::decode_key(&key, "hex:59454g"));
  EXPECT_INVALID_ARGUMENT(crypto::aestool::decode_key(&key, "hex:594"));
  ASSERT_EQ(1U, key.size());
  EXPECT_EQ(0x99, key[0]);
}

TEST(AESTool, ParseFormat) {
  Format format;
  EXPECT_OK(crypto::aestool::parse_format(&format, "raw"));
  EXPECT_EQ(Format::raw, format);
  EXPECT_OK(crypto::aestool::parse_format(&format, "hex"));
  EXPECT_EQ(Format::hex, format);
  EXPECT_OK(crypto::aestool::parse_format(&format, "base64"));
  EXPECT_EQ(Format::base64, format);
  EXPECT_INVALID_ARGUMENT(crypto::aestool::parse_format(&format, "b64"));
}

TEST(AESTool, TransformHex) {
  std::string out;
  EXPECT_OK(crypto::aestool::transform(&out, "AES-128+ECB", bytes(KEY),
                                       Format::hex, true, bytes(PLAINTEXT)));
  EXPECT_EQ("4a5be2518e40a37bdb4eb52e83c14805\n", out);

  EXPECT_OK(crypto::aestool::transform(
      &out, "aes128+ecb", bytes(KEY), Format::hex, false,
      bytes("4a5be251 8e40a37b\r\n  db4eb52e\t83C14805\n")));
  EXPECT_EQ(PLAINTEXT, out);
}

TEST(AESTool, TransformBase64) {
  std::string out;
  EXPECT_OK(crypto::aestool::transform(&out, "AES-128+ECB", bytes(KEY),
                                       Format::base64, true, bytes(PLAINTEXT)));
  EXPECT_EQ("SlviUY5Ao3vbTrUug8FIBQ==\n", out);

  EXPECT_OK(crypto::aestool::transform(&out, "AES-128+ECB", bytes(KEY),
                                       Format::base64, false,
                                       bytes("SlviUY5Ao3vb\nTrUug8FIBQ==\n")));
  EXPECT_EQ(PLAINTEXT, out);
}

TEST(AESTool, TransformRaw) {
  std::string ct;
  EXPECT_OK(crypto::aestool::transform(&ct, "AES-128+ECB", bytes(KEY),
                                       Format::raw, true, bytes(PLAINTEXT)));
  EXPECT_EQ(16U, ct.size());

  std::string pt;
  EXPECT_OK(crypto::aestool::transform(&pt, "AES-128+ECB", bytes(KEY),
                                       Format::raw, false, bytes(ct)));
  EXPECT_EQ(PLAINTEXT, pt);
}

TEST(AESTool, TransformErrors) {
  std::string out = "untouched";

  auto result = crypto::aestool::transform(
      &out, "AES-128+ECB", bytes("YELLOW SUBMARIN"), Format::raw, true,
      bytes(PLAINTEXT));
  EXPECT_INVALID_ARGUMENT(result);
  EXPECT_NE(std::string::npos, result.message().find("got 15 bytes"));

  EXPECT_INVALID_ARGUMENT(crypto::aestool::transform(
      &out, "AES-128+ECB", bytes(KEY), Format::raw, true, bytes("short")));
  EXPECT_INVALID_ARGUMENT(crypto::aestool::transform(
      &out, "AES-128+ECB", bytes(KEY), Format::hex, false, bytes("4a5z")));
  EXPECT_INVALID_ARGUMENT(crypto::aestool::transform(
      &out, "AES-128+ECB", bytes(KEY), Format::base64, false, bytes("Slv")));
  EXPECT_NOT_IMPLEMENTED(crypto::aestool::transform(
      &out, "AES-256+ECB", std::vector<uint8_t>(32), Format::raw, true,
      bytes(PLAINTEXT)));
  EXPECT_EQ("untouched", out);
}

TEST(AESTool, RunRoundTrip) {
  TempFile pt, ct, back;
  pt.write(PLAINTEXT);

  EXPECT_EQ(crypto::aestool::EXIT_OK,
            run({"--cmd=encrypt", "--key=" + KEY, "--format=base64",
                 "--input=" + pt.path(), "--output=" + ct.path()}));
  EXPECT_EQ("SlviUY5Ao3vbTrUug8FIBQ==\n", ct.read());

  EXPECT_EQ(crypto::aestool::EXIT_OK,
            run({"--cmd=decrypt", "--key=hex:59454c4c4f57205355424d4152494e45",
                 "--format=base64", "--input=" + ct.path(),
                 "--output=" + back.path()}));
  EXPECT_EQ(PLAINTEXT, back.read());
}

TEST(AESTool, RunHexWithWhitespace) {
  TempFile ct, pt;
  ct.write("4a5be2518e40a37b\ndb4eb52e83c14805\n");
  EXPECT_EQ(crypto::aestool::EXIT_OK,
            run({"--cmd=decrypt", "--key=" + KEY, "--format=hex",
                 "--input=" + ct.path(), "--output=" + pt.path()}));
  EXPECT_EQ(PLAINTEXT, pt.read());
}

TEST(AESTool, RunShortKeyFails) {
  TempFile pt, ct;
  pt.write(PLAINTEXT);
  ct.write("untouched");
  EXPECT_EQ(crypto::aestool::EXIT_FAILED,
            run({"--cmd=encrypt", "--key=YELLOW SUBMARIN",
                 "--input=" + pt.path(), "--output=" + ct.path()}));
  EXPECT_EQ("untouched", ct.read());
}

TEST(AESTool, RunMissingInputFails) {
  EXPECT_EQ(crypto::aestool::EXIT_FAILED,
            run({"--cmd=encrypt", "--key=" + KEY,
                 "--input=/nonexistent/aestool_test/input"}));
}

TEST(AESToolDeathTest, UsageErrors) {
  EXPECT_EXIT(run({"--cmd=encrypt", "--key=hex:zz"}),
              ::testing::ExitedWithCode(crypto::aestool::EXIT_USAGE),
              "--key: ");
  EXPECT_EXIT(run({"--cmd=encrypt"}),
              ::testing::ExitedWithCode(crypto::aestool::EXIT_USAGE),
              "--key is required");
  EXPECT_EXIT(run({"--cmd=decrypt", "--key=" + KEY, "--format=base32"}),
              ::testing::ExitedWithCode(crypto::aestool::EXIT_USAGE), "");
  EXPECT_EXIT(run({"--cmd=list", "stray"}),
              ::testing::ExitedWithCode(crypto::aestool::EXIT_USAGE),
              "Usage: aestool --cmd=");
}
