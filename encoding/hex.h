// encoding/hex.h - Encode/Decode helpers for base-16 data
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef ENCODING_HEX_H
#define ENCODING_HEX_H

#include <string>
#include <vector>

#include "base/bytes.h"
#include "base/chars.h"
#include "base/result.h"

namespace encoding {

struct Hex {
  bool uppercase;

  constexpr Hex(bool uc) noexcept : uppercase(uc) {}
};

constexpr char HEX_LC_CHARSET[] = "0123456789abcdef";
constexpr char HEX_UC_CHARSET[] = "0123456789ABCDEF";

// Encoder modes {{{

constexpr Hex HEX = {false};
constexpr Hex HEX_UPPERCASE = {true};

// }}}

// Returns the buffer size needed to encode a |len|-byte input as base-16.
std::size_t encoded_length(Hex hex, std::size_t len) noexcept;

// Reads the bytes in |src|, encodes them as base-16, and returns the resulting
// characters as a std::string.
std::string encode(Hex hex, base::Bytes src);

inline std::string encode(Hex hex, base::Chars src) {
  return encode(hex, src.bytes());
}

// Returns the largest number of bytes a |len|-char base-16 input can decode to.
std::size_t decoded_length(Hex hex, std::size_t len) noexcept;

// Reads the characters in |src|, decodes them as base-16, and replaces the
// contents of |out| with the resulting bytes.
//
// Whitespace between digits is ignored.  Either case is accepted regardless
// of |hex|.  Any other character, or an odd number of digits, is an
// INVALID_ARGUMENT failure, in which case |out| is left untouched.
//
base::Result decode(Hex hex, std::vector<uint8_t>* out, base::Chars src);

}  // namespace encoding

#endif  // ENCODING_HEX_H
