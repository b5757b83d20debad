// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "encoding/hex.h"

#include "base/logging.h"

static constexpr uint8_t NPOS = 0xff;

static bool is_space(char ch) {
  return ch == ' ' || ch == '\t' || (ch >= '\n' && ch <= '\r');
}

static uint8_t from_hex(char ch) {
  if (ch >= '0' && ch <= '9')
    return (ch - '0');
  else if (ch >= 'a' && ch <= 'f')
    return (ch - 'a' + 10);
  else if (ch >= 'A' && ch <= 'F')
    return (ch - 'A' + 10);
  else
    return NPOS;
}

namespace encoding {

std::size_t encoded_length(Hex hex, std::size_t len) noexcept {
  return len * 2;
}

std::string encode(Hex hex, base::Bytes src) {
  const char* cs = (hex.uppercase ? HEX_UC_CHARSET : HEX_LC_CHARSET);
  std::string out;
  out.reserve(encoded_length(hex, src.size()));
  for (uint8_t byte : src) {
    out.push_back(cs[byte >> 4]);
    out.push_back(cs[byte & 15]);
  }
  return out;
}

std::size_t decoded_length(Hex hex, std::size_t len) noexcept {
  return len / 2;
}

base::Result decode(Hex hex, std::vector<uint8_t>* out, base::Chars src) {
  CHECK_NOTNULL(out);
  std::vector<uint8_t> tmp;
  tmp.reserve(decoded_length(hex, src.size()));
  uint8_t hi = 0;
  bool have_hi = false;
  for (std::size_t i = 0; i < src.size(); ++i) {
    char ch = src[i];
    auto val = from_hex(ch);
    if (val < 16) {
      if (have_hi) {
        tmp.push_back((hi << 4) | val);
        have_hi = false;
      } else {
        hi = val;
        have_hi = true;
      }
    } else if (!is_space(ch)) {
      return base::Result::invalid_argument("invalid hex character at offset ",
                                            i);
    }
  }
  if (have_hi) {
    return base::Result::invalid_argument("odd number of hex digits");
  }
  out->swap(tmp);
  return base::Result();
}

}  // namespace encoding
