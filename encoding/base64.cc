// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "encoding/base64.h"

#include "base/logging.h"

static constexpr uint8_t NPOS = 0xff;
static constexpr uint8_t PAD = 64;

static bool is_space(char ch) {
  return ch == ' ' || ch == '\t' || (ch >= '\n' && ch <= '\r');
}

// Returns 0..63 for a digit, PAD for the pad character, NPOS otherwise.
static uint8_t find(const char* cs, char ch) {
  for (uint8_t index = 0; cs[index] != '\0'; ++index) {
    if (cs[index] == ch) return index;
  }
  return NPOS;
}

namespace encoding {

std::size_t encoded_length(Base64, std::size_t len) noexcept {
  return ((len + 2) / 3) * 4;
}

std::string encode(Base64 b64, base::Bytes src) {
  const char* cs = b64.charset;
  std::string out;
  out.reserve(encoded_length(b64, src.size()));

  std::size_t i = 0;
  for (; i + 3 <= src.size(); i += 3) {
    uint32_t word = (uint32_t(src[i]) << 16) | (uint32_t(src[i + 1]) << 8) |
                    uint32_t(src[i + 2]);
    out.push_back(cs[(word >> 18) & 63]);
    out.push_back(cs[(word >> 12) & 63]);
    out.push_back(cs[(word >> 6) & 63]);
    out.push_back(cs[word & 63]);
  }

  std::size_t tail = src.size() - i;
  if (tail != 0) {
    uint32_t word = uint32_t(src[i]) << 16;
    if (tail == 2) word |= uint32_t(src[i + 1]) << 8;
    out.push_back(cs[(word >> 18) & 63]);
    out.push_back(cs[(word >> 12) & 63]);
    out.push_back(tail == 2 ? cs[(word >> 6) & 63] : cs[PAD]);
    out.push_back(cs[PAD]);
  }
  return out;
}

std::size_t decoded_length(Base64, std::size_t len) noexcept {
  return (len / 4) * 3;
}

base::Result decode(Base64 b64, std::vector<uint8_t>* out, base::Chars src) {
  CHECK_NOTNULL(out);
  std::vector<uint8_t> tmp;
  tmp.reserve(decoded_length(b64, src.size()));

  uint8_t group[4];
  unsigned int n = 0;      // characters in |group|
  unsigned int pads = 0;   // pad characters in |group|
  bool finished = false;   // a padded group has been consumed
  for (std::size_t i = 0; i < src.size(); ++i) {
    char ch = src[i];
    if (is_space(ch)) continue;

    uint8_t val = find(b64.charset, ch);
    if (val == NPOS || finished) {
      return base::Result::invalid_argument(
          "invalid base-64 character at offset ", i);
    }
    if (val == PAD) {
      if (n < 2) {
        return base::Result::invalid_argument(
            "misplaced base-64 padding at offset ", i);
      }
      ++pads;
      val = 0;
    } else if (pads != 0) {
      return base::Result::invalid_argument(
          "base-64 digit after padding at offset ", i);
    }
    group[n++] = val;

    if (n == 4) {
      uint32_t word = (uint32_t(group[0]) << 18) | (uint32_t(group[1]) << 12) |
                      (uint32_t(group[2]) << 6) | uint32_t(group[3]);
      tmp.push_back((word >> 16) & 0xff);
      if (pads < 2) tmp.push_back((word >> 8) & 0xff);
      if (pads < 1) tmp.push_back(word & 0xff);
      finished = (pads != 0);
      n = pads = 0;
    }
  }
  if (n != 0) {
    return base::Result::invalid_argument(
        "base-64 input is not a whole number of 4-character groups");
  }
  out->swap(tmp);
  return base::Result();
}

}  // namespace encoding
